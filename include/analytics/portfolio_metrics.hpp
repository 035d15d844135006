/**
 * @file portfolio_metrics.hpp
 * @brief Single-factor (CAPM) summary metrics for a set of holdings.
 *
 * Weights are market-value weights, w_i = qty_i * p_i / sum(qty * p).
 *
 *   beta_p   = sum(w_i * beta_i)
 *   R_p      = sum(w_i * r_i)
 *   alpha_p  = R_p - R_f - beta_p * (R_b - R_f)
 *   sigma*   = sum(w_i * beta_i * (R_b - R_f))
 *   Sharpe   = (R_p - R_f) / sigma*
 *
 * sigma* is the systematic-risk proxy beta_p * (R_b - R_f), not a
 * standard deviation of returns, so the Sharpe figure here is the
 * Treynor-style ratio scaled by the market excess return.
 */

#ifndef CAPM_ANALYTICS_PORTFOLIO_METRICS_HPP
#define CAPM_ANALYTICS_PORTFOLIO_METRICS_HPP

#include "core/equity.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace capm
{
    namespace analytics
    {

        /**
         * @struct PortfolioMetrics
         * @brief Value-weighted beta, alpha and approximate Sharpe ratio.
         */
        struct PortfolioMetrics
        {
            double beta = 0.0;             ///< Value-weighted portfolio beta
            double alpha = 0.0;            ///< Return not explained by beta
            double sharpe_ratio = 0.0;     ///< Excess return over the beta risk proxy
            double portfolio_return = 0.0; ///< Value-weighted return
            double std_dev_proxy = 0.0;    ///< beta_p * (R_b - R_f)
            double total_investment = 0.0; ///< sum(qty * avg_price)
            Eigen::VectorXd weights;       ///< Market-value weights, sum to 1

            nlohmann::json to_json() const;

            /**
             * @brief Print a short human-readable report to stdout.
             */
            void print_summary() const;
        };

        /**
         * @brief Market-value weights of each position.
         * @throws ValidationError If the portfolio is empty.
         * @throws DomainError If total investment is zero.
         */
        Eigen::VectorXd portfolio_weights(const Portfolio &equities);

        /**
         * @brief Compute beta, alpha and the approximate Sharpe ratio.
         * @param equities Holdings; every position needs a return.
         * @param benchmark_return Benchmark (market) return.
         * @param risk_free_rate Risk-free rate.
         * @throws ValidationError If the portfolio is empty or a return is missing.
         * @throws DomainError If total investment is zero, portfolio beta is zero,
         *         the benchmark return equals the risk-free rate, or any result
         *         is not finite.
         */
        PortfolioMetrics compute_portfolio_metrics(const Portfolio &equities,
                                                   double benchmark_return,
                                                   double risk_free_rate);

        PortfolioMetrics compute_portfolio_metrics(const Portfolio &equities,
                                                   const MarketParameters &market);

        /**
         * @brief CAPM expected return: R_f + beta * (R_m - R_f).
         */
        double capm_expected_return(double risk_free_rate, double beta, double market_return);

    } // namespace analytics
} // namespace capm

#endif // CAPM_ANALYTICS_PORTFOLIO_METRICS_HPP
