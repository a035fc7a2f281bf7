#include "BondTypes.hpp"

#include <ql/errors.hpp>

namespace BYC
{

    CouponFrequency couponFrequencyFromInteger(int paymentsPerYear)
    {
        switch (paymentsPerYear)
        {
        case 1:
            return CouponFrequency::Annual;
        case 2:
            return CouponFrequency::SemiAnnual;
        }
        QL_FAIL("Coupon frequency must be 1 (annual) or 2 (semi-annual), got " << paymentsPerYear);
    }

    std::string premiumDiscountLabel(PremiumDiscount status)
    {
        switch (status)
        {
        case PremiumDiscount::Premium:
            return "premium";
        case PremiumDiscount::Discount:
            return "discount";
        case PremiumDiscount::Par:
            return "par";
        }
        QL_FAIL("Unsupported PremiumDiscount");
    }
}
