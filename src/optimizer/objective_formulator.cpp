/**
 * @file objective_formulator.cpp
 * @brief Implementation of the rebalancing objectives
 */

#include "optimizer/objective_formulator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace capm
{
    namespace optimizer
    {

        std::string to_string(ObjectiveType objective)
        {
            switch (objective)
            {
            case ObjectiveType::MAX_SHARPE:
                return "max_sharpe";
            case ObjectiveType::MIN_BETA:
                return "min_beta";
            }
            return "unknown";
        }

        ObjectiveType parse_objective(const std::string &name)
        {
            std::string normalized = name;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch)
                           { return std::tolower(ch); });

            if (normalized == "max_sharpe" || normalized == "sharpe")
            {
                return ObjectiveType::MAX_SHARPE;
            }
            if (normalized == "min_beta" || normalized == "beta")
            {
                return ObjectiveType::MIN_BETA;
            }

            throw std::invalid_argument(
                "Unknown objective: '" + name + "'. Valid options: max_sharpe, min_beta");
        }

        Eigen::VectorXd ObjectiveFormulator::build(
            const Portfolio &equities,
            ObjectiveType objective,
            const MarketParameters &market)
        {
            switch (objective)
            {
            case ObjectiveType::MAX_SHARPE:
                return sharpe_objective(equities, market);
            case ObjectiveType::MIN_BETA:
                return min_beta_objective(equities);
            }
            throw std::invalid_argument("Unknown objective type");
        }

        Eigen::VectorXd ObjectiveFormulator::sharpe_objective(
            const Portfolio &equities,
            const MarketParameters &market)
        {
            validate_portfolio(equities, true);

            const double market_excess = market.market_excess_return();
            if (market_excess == 0.0)
            {
                throw DomainError(
                    "Sharpe objective undefined: benchmark return equals risk-free rate (" +
                    std::to_string(market.risk_free_rate) + ")");
            }

            const int n = static_cast<int>(equities.size());
            Eigen::VectorXd c(n);

            for (int i = 0; i < n; ++i)
            {
                const Equity &equity = equities[i];
                if (equity.beta() == 0.0)
                {
                    throw DomainError(
                        "Sharpe objective undefined: equity " + equity.label(i) + " has zero beta");
                }

                // Negated so that the minimizing solver maximizes the ratio
                c(i) = -((*equity.expected_return() - market.risk_free_rate) /
                         (equity.beta() * market_excess));
            }

            if (!c.allFinite())
            {
                throw DomainError("Sharpe objective produced a non-finite coefficient");
            }

            return c;
        }

        Eigen::VectorXd ObjectiveFormulator::min_beta_objective(const Portfolio &equities)
        {
            validate_portfolio(equities, false);

            const int n = static_cast<int>(equities.size());
            Eigen::VectorXd c(n);
            for (int i = 0; i < n; ++i)
            {
                c(i) = equities[i].beta();
            }
            return c;
        }

    } // namespace optimizer
} // namespace capm
