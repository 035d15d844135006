/**
 * @file objective_formulator.hpp
 * @brief Linear objective vectors for the rebalancing goals
 *
 * The solver always minimizes c^T q over position quantities q.
 *
 * MAX_SHARPE:
 *   c_i = -(r_i - r_f) / (beta_i * (r_b - r_f))
 *   Each position's excess-return-to-systematic-risk ratio is used as a
 *   linear stand-in for its contribution to the portfolio Sharpe ratio.
 *   This is not the true (nonlinear) Sharpe ratio of the portfolio.
 *
 * MIN_BETA:
 *   c_i = beta_i
 */

#pragma once

#include "core/equity.hpp"
#include <Eigen/Dense>
#include <string>

namespace capm
{
    namespace optimizer
    {

        /**
         * @enum ObjectiveType
         * @brief Rebalancing goal
         */
        enum class ObjectiveType
        {
            MAX_SHARPE, ///< Maximize the linear Sharpe proxy
            MIN_BETA    ///< Minimize beta-weighted quantity
        };

        /**
         * @brief "max_sharpe" / "min_beta"
         */
        std::string to_string(ObjectiveType objective);

        /**
         * @brief Parse "max_sharpe" / "min_beta" (case-insensitive)
         * @throws std::invalid_argument for any other name
         */
        ObjectiveType parse_objective(const std::string &name);

        /**
         * @class ObjectiveFormulator
         * @brief Builds the objective vector c for a given goal
         *
         * Stateless; all methods are pure functions of their inputs.
         */
        class ObjectiveFormulator
        {
        public:
            /**
             * @brief Objective for the requested goal
             * @param equities Portfolio (validated here)
             * @param objective Goal
             * @param market Benchmark and risk-free rates (MAX_SHARPE only)
             * @return c (N x 1)
             * @throws ValidationError if the portfolio is empty, or a return is
             *         missing for MAX_SHARPE
             * @throws DomainError if a coefficient is undefined
             */
            static Eigen::VectorXd build(
                const Portfolio &equities,
                ObjectiveType objective,
                const MarketParameters &market);

            /**
             * @brief c_i = -(r_i - r_f) / (beta_i * (r_b - r_f))
             * @throws DomainError if beta_i == 0 or r_b == r_f
             */
            static Eigen::VectorXd sharpe_objective(
                const Portfolio &equities,
                const MarketParameters &market);

            /**
             * @brief c_i = beta_i
             */
            static Eigen::VectorXd min_beta_objective(const Portfolio &equities);
        };

    } // namespace optimizer
} // namespace capm
