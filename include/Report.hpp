#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "BondSpec.hpp"
#include "Calculator.hpp"

namespace BYC {

    // 0.0523 -> "5.23%"
    std::string formatPercent(double value);

    // 1234.5 -> "$1,234.50"
    std::string formatCurrency(double value);

    void writeSummary(std::ostream& out, const BondInput& input, const BondCalculationResult& result);

    void writeSchedule(std::ostream& out, const std::vector<CashFlowEntry>& schedule);

    void writeReport(std::ostream& out, const BondInput& input, const BondCalculationResult& result);
}
