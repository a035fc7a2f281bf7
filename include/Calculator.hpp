#pragma once

#include <vector>
#include <ql/time/date.hpp>

#include "BondSpec.hpp"
#include "PeriodModel.hpp"
#include "YieldSolver.hpp"

namespace BYC {
    struct PremiumDiscountResult {
        PremiumDiscount status;
        double amount; // non-negative, 0 at par
    };

    struct BondCalculationResult {
        double currentYield;     // decimal, 0.0585 == 5.85%
        double yieldToMaturity;  // annualised decimal
        double totalInterestEarned;
        PremiumDiscount premiumDiscount;
        double premiumDiscountAmount;
        std::vector<CashFlowEntry> cashFlowSchedule;

        int ytmIterations;
        bool ytmConverged;
    };

    class BondCalculator {
    public:
        BondCalculator() = default;
        explicit BondCalculator(const YieldSolverConfig& solverConfig) : solver_(solverConfig) {}

        // A null referenceDate means Settings::instance().evaluationDate().
        BondCalculationResult calculate(const BondInput& input,
                                        const QuantLib::Date& referenceDate = QuantLib::Date()) const;

        std::vector<BondCalculationResult> calculateBatch(const std::vector<BondInput>& inputs,
                                                          const QuantLib::Date& referenceDate = QuantLib::Date()) const;

        double currentYield(const BondInput& input) const;
        double yieldToMaturity(const BondInput& input) const;
        double totalInterest(const BondInput& input) const;
        PremiumDiscountResult premiumDiscount(const BondInput& input) const;
        std::vector<CashFlowEntry> cashFlowSchedule(const BondInput& input,
                                                    const QuantLib::Date& referenceDate = QuantLib::Date()) const;

    private:
        YieldSolution solveYield(const BondInput& input, const PeriodModel& model) const;

        std::vector<CashFlowEntry> buildSchedule(const PeriodModel& model,
                                                 const QuantLib::Date& referenceDate) const;

        QuantLib::Date resolveReferenceDate(const QuantLib::Date& referenceDate) const;

        YieldSolver solver_;
    };
}
