#include "Report.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <ql/utilities/dataformatters.hpp>

namespace BYC
{

    using namespace QuantLib;

    static std::string toUpper(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return s;
    }

    std::string formatPercent(double value)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << value * 100.0 << "%";
        return out.str();
    }

    std::string formatCurrency(double value)
    {
        std::ostringstream fixed;
        fixed << std::fixed << std::setprecision(2) << std::fabs(value);
        const std::string digits = fixed.str();

        const std::size_t dot = digits.find('.');
        const std::string whole = digits.substr(0, dot);
        const std::string cents = digits.substr(dot);

        std::string grouped;
        grouped.reserve(whole.size() + whole.size() / 3);
        for (std::size_t i = 0; i < whole.size(); ++i)
        {
            if (i > 0 && (whole.size() - i) % 3 == 0)
            {
                grouped.push_back(',');
            }
            grouped.push_back(whole[i]);
        }

        // "-0.00" is printed as "$0.00"
        const bool negative = value < 0.0 && digits != "0.00";
        return (negative ? "-$" : "$") + grouped + cents;
    }

    void writeSummary(std::ostream &out, const BondInput &input, const BondCalculationResult &result)
    {
        out << "Bond: face " << formatCurrency(input.faceValue)
            << ", coupon " << formatPercent(input.annualCouponRate / 100.0)
            << ", price " << formatCurrency(input.marketPrice)
            << ", " << input.yearsToMaturity << " years, "
            << (input.couponFrequency == CouponFrequency::Annual ? "annual" : "semi-annual")
            << " coupons\n\n";

        out << "Current Yield:         " << formatPercent(result.currentYield) << "\n";
        out << "Yield to Maturity:     " << formatPercent(result.yieldToMaturity);
        if (!result.ytmConverged)
        {
            out << " (not converged after " << result.ytmIterations << " iterations)";
        }
        out << "\n";
        out << "Total Interest Earned: " << formatCurrency(result.totalInterestEarned) << "\n";
        out << "Bond Status:           " << toUpper(premiumDiscountLabel(result.premiumDiscount));
        if (result.premiumDiscountAmount > 0.0)
        {
            out << " (" << (result.premiumDiscount == PremiumDiscount::Premium ? "+" : "-")
                << formatCurrency(result.premiumDiscountAmount) << " from face value)";
        }
        out << "\n";
    }

    void writeSchedule(std::ostream &out, const std::vector<CashFlowEntry> &schedule)
    {
        out << std::left
            << std::setw(8) << "Period"
            << std::setw(14) << "Payment Date"
            << std::right
            << std::setw(18) << "Coupon Payment"
            << std::setw(22) << "Cumulative Interest"
            << std::setw(22) << "Remaining Principal" << "\n";

        for (const auto &entry : schedule)
        {
            std::ostringstream date;
            date << io::iso_date(entry.paymentDate);

            out << std::left
                << std::setw(8) << entry.period
                << std::setw(14) << date.str()
                << std::right
                << std::setw(18) << formatCurrency(entry.couponPayment)
                << std::setw(22) << formatCurrency(entry.cumulativeInterest)
                << std::setw(22)
                << (entry.remainingPrincipal == 0.0 ? std::string("Maturity") : formatCurrency(entry.remainingPrincipal))
                << "\n";
        }

        const double totalInterest = schedule.empty() ? 0.0 : schedule.back().cumulativeInterest;
        out << "\nTotal Periods: " << schedule.size()
            << " | Total Interest: " << formatCurrency(totalInterest) << "\n";
    }

    void writeReport(std::ostream &out, const BondInput &input, const BondCalculationResult &result)
    {
        writeSummary(out, input, result);
        out << "\nCash Flow Schedule\n";
        writeSchedule(out, result.cashFlowSchedule);
    }
}
