#pragma once

#include <vector>
#include <ql/time/date.hpp>
#include <ql/time/frequency.hpp>
#include <ql/time/schedule.hpp>

#include "BondSpec.hpp"

namespace BYC {

    // Derived once per calculation and discarded afterwards.
    struct PeriodModel {
        QuantLib::Frequency frequency;
        int periodsPerYear;
        int monthsPerPeriod;

        int totalPeriods;
        double couponPerPeriod;
        double faceValue;
    };

    QuantLib::Frequency mapFrequency(CouponFrequency f);

    PeriodModel buildPeriodModel(const BondInput& input);

    QuantLib::Schedule paymentSchedule(const PeriodModel& model, const QuantLib::Date& referenceDate);

    // Payment dates for periods 1..totalPeriods; empty when there are no periods.
    std::vector<QuantLib::Date> paymentDates(const PeriodModel& model, const QuantLib::Date& referenceDate);
}
