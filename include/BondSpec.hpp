#pragma once
#include "BondTypes.hpp"

namespace BYC {

    // Validated by the caller before it reaches BondCalculator.
    struct BondInput {
        double faceValue;
        double annualCouponRate; // percent, e.g. 5 for 5%
        double marketPrice;
        double yearsToMaturity;

        CouponFrequency couponFrequency;
    };
}
