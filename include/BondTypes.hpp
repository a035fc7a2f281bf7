#pragma once

#include <string>
#include <ql/time/date.hpp>

namespace BYC {

    enum class CouponFrequency {
        Annual,
        SemiAnnual
    };

    enum class PremiumDiscount {
        Premium,
        Discount,
        Par
    };

    struct CashFlowEntry {
        int period;
        QuantLib::Date paymentDate;
        double couponPayment;
        double cumulativeInterest;
        double remainingPrincipal;
    };

    CouponFrequency couponFrequencyFromInteger(int paymentsPerYear);

    std::string premiumDiscountLabel(PremiumDiscount status);

}
