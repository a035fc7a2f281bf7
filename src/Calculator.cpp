#include "Calculator.hpp"
#include "DebugLog.hpp"

#include <cmath>
#include <sstream>
#include <ql/errors.hpp>
#include <ql/math/rounding.hpp>
#include <ql/settings.hpp>
#include <ql/utilities/dataformatters.hpp>

namespace BYC
{

    using namespace QuantLib;

    namespace
    {
        const double parTolerance = 0.01;
    }

    Date BondCalculator::resolveReferenceDate(const Date &referenceDate) const
    {
        if (referenceDate != Date())
        {
            return referenceDate;
        }

        Date evaluationDate = Settings::instance().evaluationDate();
        return evaluationDate;
    }

    double BondCalculator::currentYield(const BondInput &input) const
    {
        const double annualCoupon = input.faceValue * (input.annualCouponRate / 100.0);
        return annualCoupon / input.marketPrice;
    }

    YieldSolution BondCalculator::solveYield(const BondInput &input, const PeriodModel &model) const
    {
        // Current yield per period is close to the YTM unless the premium/discount is large.
        const double initialGuess = currentYield(input) / model.periodsPerYear;
        YieldSolution solution = solver_.solve(model, input.marketPrice, initialGuess);

        if (!solution.converged)
        {
            std::ostringstream message;
            message << "WARN ytm solver did not converge after " << solution.iterations
                    << " iterations: face=" << input.faceValue
                    << " coupon=" << input.annualCouponRate
                    << " price=" << input.marketPrice
                    << " periods=" << model.totalPeriods
                    << " lastGuess=" << solution.periodRate;
            logDebugLine(message.str());
        }

        return solution;
    }

    double BondCalculator::yieldToMaturity(const BondInput &input) const
    {
        const PeriodModel model = buildPeriodModel(input);
        return solveYield(input, model).periodRate * model.periodsPerYear;
    }

    double BondCalculator::totalInterest(const BondInput &input) const
    {
        // Straight-line: ignores period rounding of fractional maturities.
        const double annualCoupon = input.faceValue * (input.annualCouponRate / 100.0);
        return annualCoupon * input.yearsToMaturity;
    }

    PremiumDiscountResult BondCalculator::premiumDiscount(const BondInput &input) const
    {
        const double difference = input.marketPrice - input.faceValue;

        if (std::fabs(difference) < parTolerance)
        {
            return {PremiumDiscount::Par, 0.0};
        }
        if (difference > 0.0)
        {
            return {PremiumDiscount::Premium, difference};
        }
        return {PremiumDiscount::Discount, std::fabs(difference)};
    }

    std::vector<CashFlowEntry> BondCalculator::buildSchedule(const PeriodModel &model, const Date &referenceDate) const
    {
        const std::vector<Date> dates = paymentDates(model, referenceDate);

        std::vector<CashFlowEntry> schedule;
        schedule.reserve(dates.size());

        const ClosestRounding round2(2);
        const double coupon = round2(model.couponPerPeriod);

        // Rounded coupons are summed, then the running total is rounded again.
        double runningTotal = 0.0;

        for (std::size_t i = 0; i < dates.size(); ++i)
        {
            const int period = static_cast<int>(i) + 1;
            runningTotal += coupon;

            CashFlowEntry entry;
            entry.period = period;
            entry.paymentDate = dates[i];
            entry.couponPayment = coupon;
            entry.cumulativeInterest = round2(runningTotal);
            // Bullet repayment: principal is returned with the last coupon.
            entry.remainingPrincipal = period == model.totalPeriods ? 0.0 : model.faceValue;

            schedule.push_back(entry);
        }

        return schedule;
    }

    std::vector<CashFlowEntry> BondCalculator::cashFlowSchedule(const BondInput &input, const Date &referenceDate) const
    {
        return buildSchedule(buildPeriodModel(input), resolveReferenceDate(referenceDate));
    }

    BondCalculationResult BondCalculator::calculate(const BondInput &input, const Date &referenceDate) const
    {
        const PeriodModel model = buildPeriodModel(input);
        const Date refDate = resolveReferenceDate(referenceDate);

        BondCalculationResult result;
        result.currentYield = currentYield(input);

        const YieldSolution ytm = solveYield(input, model);
        result.yieldToMaturity = ytm.periodRate * model.periodsPerYear;
        result.ytmIterations = ytm.iterations;
        result.ytmConverged = ytm.converged;

        result.totalInterestEarned = totalInterest(input);

        const PremiumDiscountResult pd = premiumDiscount(input);
        result.premiumDiscount = pd.status;
        result.premiumDiscountAmount = pd.amount;

        result.cashFlowSchedule = buildSchedule(model, refDate);

        std::ostringstream message;
        message << "calculate ref=" << io::iso_date(refDate)
                << " face=" << input.faceValue
                << " coupon=" << input.annualCouponRate
                << " price=" << input.marketPrice
                << " years=" << input.yearsToMaturity
                << " frequency=" << model.periodsPerYear
                << " periods=" << model.totalPeriods
                << " ytm=" << result.yieldToMaturity
                << " iterations=" << ytm.iterations;
        logDebugLine(message.str());

        return result;
    }

    std::vector<BondCalculationResult> BondCalculator::calculateBatch(const std::vector<BondInput> &inputs,
                                                                      const Date &referenceDate) const
    {
        std::vector<BondCalculationResult> results;
        results.reserve(inputs.size());

        const Date refDate = resolveReferenceDate(referenceDate);
        for (const auto &input : inputs)
        {
            results.push_back(calculate(input, refDate));
        }

        return results;
    }

}
