#include "CommandLine.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <ql/errors.hpp>
#include <ql/utilities/dataparsers.hpp>

namespace BYC
{

    using namespace QuantLib;

    static bool startsWith(const std::string &token, const std::string &prefix)
    {
        return token.rfind(prefix, 0) == 0;
    }

    static double parseNumber(const std::string &flag, const std::string &value)
    {
        std::size_t consumed = 0;
        double parsed = 0.0;
        try
        {
            parsed = std::stod(value, &consumed);
        }
        catch (const std::exception &)
        {
            QL_FAIL("Invalid value for " << flag << ": '" << value << "'");
        }
        QL_REQUIRE(consumed == value.size(), "Invalid value for " << flag << ": '" << value << "'");
        return parsed;
    }

    static int parseInteger(const std::string &flag, const std::string &value)
    {
        const bool allDigits = !value.empty() && std::all_of(value.begin(), value.end(), [](char c)
                                                             { return std::isdigit(static_cast<unsigned char>(c)); });
        QL_REQUIRE(allDigits, "Invalid value for " << flag << ": '" << value << "'");
        return std::stoi(value);
    }

    BondInput defaultBondInput()
    {
        BondInput input;
        input.faceValue = 1000.0;
        input.annualCouponRate = 5.0;
        input.marketPrice = 950.0;
        input.yearsToMaturity = 10.0;
        input.couponFrequency = CouponFrequency::SemiAnnual;
        return input;
    }

    Date parseReferenceDate(const std::string &token)
    {
        const bool allDigits = !token.empty() && std::all_of(token.begin(), token.end(), [](char c)
                                                             { return std::isdigit(static_cast<unsigned char>(c)); });
        if (allDigits)
        {
            return Date(std::stol(token));
        }

        return DateParser::parseISO(token);
    }

    CommandLineOptions parseCommandLine(const std::vector<std::string> &args)
    {
        CommandLineOptions options;
        options.input = defaultBondInput();
        options.showHelp = false;

        for (const auto &token : args)
        {
            const std::size_t eq = token.find('=');
            const std::string flag = token.substr(0, eq);
            const std::string value = eq == std::string::npos ? std::string() : token.substr(eq + 1);

            if (token == "--help" || token == "-h")
            {
                options.showHelp = true;
            }
            else if (!startsWith(token, "--") || eq == std::string::npos)
            {
                QL_FAIL("Unrecognised argument '" << token << "'");
            }
            else if (flag == "--face")
            {
                options.input.faceValue = parseNumber(flag, value);
            }
            else if (flag == "--coupon")
            {
                options.input.annualCouponRate = parseNumber(flag, value);
            }
            else if (flag == "--price")
            {
                options.input.marketPrice = parseNumber(flag, value);
            }
            else if (flag == "--years")
            {
                options.input.yearsToMaturity = parseNumber(flag, value);
            }
            else if (flag == "--frequency")
            {
                options.input.couponFrequency = couponFrequencyFromInteger(parseInteger(flag, value));
            }
            else if (flag == "--date")
            {
                QL_REQUIRE(!value.empty(), "Missing value for --date");
                options.referenceDate = parseReferenceDate(value);
            }
            else if (flag == "--debug-log")
            {
                QL_REQUIRE(!value.empty(), "Missing value for --debug-log");
                options.debugLogPath = value;
            }
            else
            {
                QL_FAIL("Unrecognised argument '" << token << "'");
            }
        }

        return options;
    }

    CommandLineOptions parseCommandLine(int argc, char **argv)
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return parseCommandLine(args);
    }

    std::string usage(const std::string &programName)
    {
        std::ostringstream out;
        out << "Usage: " << programName
            << " [--face=VALUE] [--coupon=PERCENT] [--price=VALUE] [--years=VALUE]"
            << " [--frequency=1|2] [--date=YYYY-MM-DD|SERIAL] [--debug-log=PATH]\n"
            << "Computes current yield, yield to maturity, premium/discount and the\n"
            << "cash flow schedule of a fixed-coupon bond. Dates default to today.\n"
            << "Example: " << programName
            << " --face=1000 --coupon=5 --price=950 --years=10 --frequency=2\n";
        return out.str();
    }
}
