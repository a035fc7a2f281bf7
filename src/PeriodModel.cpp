#include "PeriodModel.hpp"

#include <cmath>
#include <ql/errors.hpp>
#include <ql/time/calendars/nullcalendar.hpp>
#include <ql/time/period.hpp>

namespace BYC
{

    using namespace QuantLib;

    QuantLib::Frequency mapFrequency(CouponFrequency f)
    {
        switch (f)
        {
        case CouponFrequency::Annual:
            return Annual;
        case CouponFrequency::SemiAnnual:
            return Semiannual;
        }
        QL_FAIL("Unsupported CouponFrequency");
    }

    PeriodModel buildPeriodModel(const BondInput &input)
    {
        PeriodModel model;
        model.frequency = mapFrequency(input.couponFrequency);
        model.periodsPerYear = static_cast<int>(model.frequency);
        model.monthsPerPeriod = 12 / model.periodsPerYear;

        model.totalPeriods = static_cast<int>(std::lround(input.yearsToMaturity * model.periodsPerYear));
        model.couponPerPeriod = input.faceValue * (input.annualCouponRate / 100.0) / model.periodsPerYear;
        model.faceValue = input.faceValue;

        return model;
    }

    Schedule paymentSchedule(const PeriodModel &model, const Date &referenceDate)
    {
        QL_REQUIRE(model.totalPeriods > 0, "Cannot build a payment schedule without periods");
        QL_REQUIRE(referenceDate != Date(), "Reference date is not set");

        const Period tenor(model.monthsPerPeriod, Months);
        const Date maturity = referenceDate + Period(model.totalPeriods * model.monthsPerPeriod, Months);

        // No calendar adjustment: dates are plain month offsets from the reference date.
        return Schedule(referenceDate, maturity, tenor, NullCalendar(),
                        Unadjusted, Unadjusted, DateGeneration::Forward, false);
    }

    std::vector<Date> paymentDates(const PeriodModel &model, const Date &referenceDate)
    {
        std::vector<Date> dates;
        if (model.totalPeriods <= 0)
        {
            return dates;
        }

        Schedule schedule = paymentSchedule(model, referenceDate);
        QL_REQUIRE(schedule.size() == static_cast<Size>(model.totalPeriods) + 1,
                   "Payment schedule has " << schedule.size() << " dates, expected "
                                           << model.totalPeriods + 1);

        // First date is the reference date itself.
        dates.assign(schedule.dates().begin() + 1, schedule.dates().end());
        return dates;
    }
}
