// BondCli.cpp
//
// Command-line front end for BondCalculator: validates the request the way
// the HTTP layer did, runs the engine and prints the report.

#include <iostream>
#include <string>

#include "BondSpec.hpp"
#include "Calculator.hpp"
#include "CommandLine.hpp"
#include "DebugLog.hpp"
#include "Report.hpp"
#include "Validation.hpp"
#include <ql/settings.hpp>

using namespace BYC;
using namespace QuantLib;

int main(int argc, char **argv)
{
    try
    {
        CommandLineOptions options = parseCommandLine(argc, argv);

        if (options.showHelp)
        {
            std::cout << usage(argv[0]);
            return 0;
        }

        if (!options.debugLogPath.empty())
        {
            setDebugLogPath(options.debugLogPath);
            setDebugMode(true);
        }

        std::string error;
        if (!validateBondInput(options.input, error))
        {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }

        if (options.referenceDate != Date())
        {
            Settings::instance().evaluationDate() = options.referenceDate;
        }

        BondCalculator calculator;
        BondCalculationResult result = calculator.calculate(options.input);

        writeReport(std::cout, options.input, result);

        return 0;
    }
    catch (std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
