#pragma once

#include "PeriodModel.hpp"

namespace BYC {

    struct PriceAndDerivative {
        double price;
        double derivative; // dP/dr, negative for positive cash flows
    };

    // P(r) = sum C/(1+r)^t + FV/(1+r)^n and its derivative, r per period.
    PriceAndDerivative bondPriceAndDerivative(double periodRate, const PeriodModel& model);

    struct YieldSolverConfig {
        int maxIterations = 100;
        double tolerance = 1e-10; // absolute, in price units
        double floor = 0.0001;    // reset value for a negative guess
    };

    struct YieldSolution {
        double periodRate; // last guess when not converged
        int iterations;
        bool converged;
    };

    // Newton-Raphson on P(r) - marketPrice. Never throws; a guess that turns
    // negative is reset to the floor, and the last guess is returned when
    // the iteration budget runs out.
    class YieldSolver {
    public:
        YieldSolver() = default;
        explicit YieldSolver(const YieldSolverConfig& config) : config_(config) {}

        YieldSolution solve(const PeriodModel& model, double marketPrice, double initialGuess) const;

        const YieldSolverConfig& config() const { return config_; }

    private:
        YieldSolverConfig config_;
    };
}
