#include "YieldSolver.hpp"

#include <cmath>

namespace BYC
{

    PriceAndDerivative bondPriceAndDerivative(double periodRate, const PeriodModel &model)
    {
        PriceAndDerivative out{0.0, 0.0};
        const double growth = 1.0 + periodRate;
        const int n = model.totalPeriods;

        for (int t = 1; t <= n; ++t)
        {
            const double discountFactor = std::pow(growth, t);
            out.price += model.couponPerPeriod / discountFactor;
            out.derivative -= (t * model.couponPerPeriod) / (discountFactor * growth);
        }

        const double finalDiscountFactor = std::pow(growth, n);
        out.price += model.faceValue / finalDiscountFactor;
        out.derivative -= (n * model.faceValue) / (finalDiscountFactor * growth);

        return out;
    }

    YieldSolution YieldSolver::solve(const PeriodModel &model, double marketPrice, double initialGuess) const
    {
        YieldSolution solution{initialGuess, 0, false};
        double guess = initialGuess;

        for (int i = 0; i < config_.maxIterations; ++i)
        {
            const PriceAndDerivative pd = bondPriceAndDerivative(guess, model);
            const double diff = pd.price - marketPrice;
            solution.iterations = i + 1;

            if (std::fabs(diff) < config_.tolerance)
            {
                solution.converged = true;
                break;
            }

            // Only a model without periods has a flat price function.
            if (pd.derivative == 0.0)
            {
                break;
            }

            guess = guess - diff / pd.derivative;

            if (guess < 0.0)
            {
                guess = config_.floor;
            }
        }

        solution.periodRate = guess;
        return solution;
    }
}
