/**
 * @file constraint_builder.hpp
 * @brief Budget constraint and bounds shared by every rebalancing objective
 *
 *   sum_i avg_price_i * q_i = sum_i avg_price_i * qty_i   (value preserved)
 *   0 <= q_i < +inf                                       (long only)
 *
 * The single equality row lets value move freely between positions; no
 * position is capped.
 */

#pragma once

#include "core/equity.hpp"
#include "optimizer/linear_solver.hpp"
#include <Eigen/Dense>

namespace capm
{
    namespace optimizer
    {

        /**
         * @struct BudgetConstraint
         * @brief Equality row and bounds for the quantity vector
         */
        struct BudgetConstraint
        {
            Eigen::MatrixXd A_eq;         ///< 1 x N, avg_price per position
            Eigen::VectorXd b_eq;         ///< 1 x 1, current portfolio value
            Eigen::VectorXd lower_bounds; ///< All zero
            Eigen::VectorXd upper_bounds; ///< All +inf
        };

        /**
         * @class ConstraintBuilder
         * @brief Builds BudgetConstraint and assembles the full LinearProblem
         */
        class ConstraintBuilder
        {
        public:
            /**
             * @brief Value-preserving equality row plus non-negativity bounds
             * @param equities Portfolio before rebalancing
             * @return Constraint data
             * @throws ValidationError if the portfolio is empty
             * @throws DomainError if any avg_price is zero (degenerate row)
             */
            static BudgetConstraint build(const Portfolio &equities);

            /**
             * @brief Combine an objective vector with the budget constraint
             * @throws std::invalid_argument if c has the wrong length
             */
            static LinearProblem make_problem(
                const Eigen::VectorXd &c,
                const BudgetConstraint &constraint);
        };

    } // namespace optimizer
} // namespace capm
