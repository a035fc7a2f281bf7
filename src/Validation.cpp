#include "Validation.hpp"

#include <cmath>

namespace BYC
{

    static const char *frequencyMessage = "Coupon frequency must be 1 (annual) or 2 (semi-annual)";

    static bool validatePositive(const char *label, double value, std::string &error)
    {
        if (!validateFinite(label, value, error))
        {
            return false;
        }
        if (value <= 0.0)
        {
            error = std::string(label) + " must be positive";
            return false;
        }
        return true;
    }

    bool validateFinite(const char *label, double value, std::string &error)
    {
        if (!std::isfinite(value))
        {
            error = std::string(label) + " must be a number";
            return false;
        }
        return true;
    }

    bool validateCouponFrequency(int paymentsPerYear, std::string &error)
    {
        if (paymentsPerYear != 1 && paymentsPerYear != 2)
        {
            error = frequencyMessage;
            return false;
        }
        return true;
    }

    bool validateBondInput(const BondInput &input, std::string &error)
    {
        if (!validatePositive("Face value", input.faceValue, error))
        {
            return false;
        }

        if (!validateFinite("Coupon rate", input.annualCouponRate, error))
        {
            return false;
        }
        if (input.annualCouponRate < 0.0)
        {
            error = "Coupon rate cannot be negative";
            return false;
        }
        if (input.annualCouponRate > 100.0)
        {
            error = "Coupon rate cannot exceed 100%";
            return false;
        }

        if (!validatePositive("Market price", input.marketPrice, error))
        {
            return false;
        }

        if (!validatePositive("Years to maturity", input.yearsToMaturity, error))
        {
            return false;
        }
        if (input.yearsToMaturity > 100.0)
        {
            error = "Years to maturity cannot exceed 100";
            return false;
        }

        if (input.couponFrequency != CouponFrequency::Annual &&
            input.couponFrequency != CouponFrequency::SemiAnnual)
        {
            error = frequencyMessage;
            return false;
        }

        return true;
    }
}
