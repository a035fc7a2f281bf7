#pragma once

#include <string>
#include "BondSpec.hpp"

namespace BYC {

    // Caller-side checks; BondCalculator itself assumes valid input.
    // On failure returns false and sets error to the first broken rule.
    bool validateFinite(const char* label, double value, std::string& error);

    bool validateBondInput(const BondInput& input, std::string& error);

    bool validateCouponFrequency(int paymentsPerYear, std::string& error);
}
