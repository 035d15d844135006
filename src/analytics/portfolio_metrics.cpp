/**
 * @file portfolio_metrics.cpp
 * @brief Implementation of the CAPM portfolio metrics.
 */

#include "analytics/portfolio_metrics.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <vector>

namespace capm
{
    namespace analytics
    {

        // ===================================================================
        // PortfolioMetrics
        // ===================================================================

        nlohmann::json PortfolioMetrics::to_json() const
        {
            std::vector<double> w(weights.data(), weights.data() + weights.size());
            return nlohmann::json{
                {"beta", beta},
                {"alpha", alpha},
                {"sharpe_ratio", sharpe_ratio},
                {"portfolio_return", portfolio_return},
                {"std_dev_proxy", std_dev_proxy},
                {"total_investment", total_investment},
                {"weights", w}};
        }

        void PortfolioMetrics::print_summary() const
        {
            std::cout << std::fixed << std::setprecision(4);
            std::cout << "  Total Investment: " << std::setprecision(2) << total_investment << "\n";
            std::cout << std::setprecision(4);
            std::cout << "  Portfolio Return: " << portfolio_return << "\n";
            std::cout << "  Portfolio Beta:   " << beta << "\n";
            std::cout << "  Portfolio Alpha:  " << alpha << "\n";
            std::cout << "  Sharpe Ratio:     " << sharpe_ratio << "\n";
        }

        // ===================================================================
        // Weights
        // ===================================================================

        Eigen::VectorXd portfolio_weights(const Portfolio &equities)
        {
            validate_portfolio(equities, false);

            const double total_investment = total_market_value(equities);
            if (total_investment == 0.0)
            {
                throw DomainError("Total investment is zero; portfolio weights are undefined");
            }

            const int n = static_cast<int>(equities.size());
            Eigen::VectorXd weights(n);
            for (int i = 0; i < n; ++i)
            {
                weights(i) = equities[i].market_value() / total_investment;
            }
            return weights;
        }

        // ===================================================================
        // Metrics
        // ===================================================================

        PortfolioMetrics compute_portfolio_metrics(const Portfolio &equities,
                                                   double benchmark_return,
                                                   double risk_free_rate)
        {
            validate_portfolio(equities, true);

            PortfolioMetrics metrics;
            metrics.total_investment = total_market_value(equities);
            metrics.weights = portfolio_weights(equities);

            const double market_excess = benchmark_return - risk_free_rate;
            const int n = static_cast<int>(equities.size());

            for (int i = 0; i < n; ++i)
            {
                const double w = metrics.weights(i);
                metrics.beta += w * equities[i].beta();
                metrics.portfolio_return += w * (*equities[i].expected_return());
                metrics.std_dev_proxy += w * equities[i].beta() * market_excess;
            }

            metrics.alpha = metrics.portfolio_return - risk_free_rate - metrics.beta * market_excess;

            if (metrics.beta == 0.0)
            {
                throw DomainError("Sharpe ratio undefined: portfolio beta is zero");
            }
            if (market_excess == 0.0)
            {
                throw DomainError("Sharpe ratio undefined: benchmark return equals risk-free rate");
            }

            metrics.sharpe_ratio = (metrics.portfolio_return - risk_free_rate) / metrics.std_dev_proxy;

            if (!std::isfinite(metrics.beta) || !std::isfinite(metrics.alpha) ||
                !std::isfinite(metrics.sharpe_ratio))
            {
                throw DomainError("Portfolio metrics produced a non-finite value");
            }

            return metrics;
        }

        PortfolioMetrics compute_portfolio_metrics(const Portfolio &equities,
                                                   const MarketParameters &market)
        {
            return compute_portfolio_metrics(equities, market.benchmark_return, market.risk_free_rate);
        }

        double capm_expected_return(double risk_free_rate, double beta, double market_return)
        {
            return risk_free_rate + beta * (market_return - risk_free_rate);
        }

    } // namespace analytics
} // namespace capm
