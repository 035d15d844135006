/**
 * @file rebalancer.hpp
 * @brief Value-preserving portfolio rebalancer
 *
 * Formulates the chosen objective together with the budget constraint,
 * hands the LP to a LinearSolver and maps the continuous solution back onto
 * whole-unit quantities.
 *
 * Mathematical Formulation:
 *
 * Minimize:     c^T * q
 * Subject to:   sum(p_i * q_i) = sum(p_i * qty_i)
 *               q_i >= 0
 *
 * Rounding: q_i is snapped to a 1e-9 grid, then rounded to the nearest
 * integer (ties to even) per position with no redistribution, so portfolio
 * value may drift by up to 0.5 * p_i per position.
 */

#pragma once

#include "core/equity.hpp"
#include "optimizer/linear_solver.hpp"
#include "optimizer/objective_formulator.hpp"
#include <Eigen/Dense>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace capm
{
    namespace optimizer
    {

        /**
         * @struct RebalanceResult
         * @brief Rebalanced portfolio and solver diagnostics
         */
        struct RebalanceResult
        {
            Portfolio equities;                  ///< Positions with rounded quantities
            Eigen::VectorXd continuous_solution; ///< LP solution before rounding
            Eigen::VectorXd quantities;          ///< Rounded quantities (same order)
            ObjectiveType objective;             ///< Goal that was optimized
            double value_before;                 ///< sum(p_i * qty_i) before
            double value_continuous;             ///< sum(p_i * x_i), LP solution
            double value_after;                  ///< sum(p_i * q_i), rounded
            double objective_value;              ///< c^T x of the LP solution
            int iterations;                      ///< Solver iterations
            std::string solver_name;             ///< Backend that produced it
            std::string message;                 ///< Solver status message

            RebalanceResult();

            /**
             * @brief value_after - value_before
             */
            double rounding_drift() const { return value_after - value_before; }

            nlohmann::json to_json() const;

            /**
             * @brief Print summary statistics
             */
            void print_summary() const;
        };

        /**
         * @class Rebalancer
         * @brief Solves the rebalancing LP and maps the solution onto positions
         *
         * Usage Example:
         * @code
         * Rebalancer rebalancer(LinearSolverFactory::create("simplex"));
         * MarketParameters market{0.07, 0.02};
         * auto result = rebalancer.rebalance(equities, ObjectiveType::MAX_SHARPE, market);
         * result.print_summary();
         * @endcode
         *
         * The input portfolio is never modified; on failure nothing is returned.
         */
        class Rebalancer
        {
        public:
            /**
             * @brief Construct with a solver backend
             * @param solver Backend to use; nullptr selects SimplexSolver
             */
            explicit Rebalancer(std::unique_ptr<LinearSolver> solver = nullptr);

            /**
             * @brief Rebalance a portfolio
             * @param equities Current positions
             * @param objective Goal to optimize
             * @param market Benchmark and risk-free rates (MAX_SHARPE only)
             * @return Rebalanced positions and diagnostics
             * @throws ValidationError if the portfolio is malformed
             * @throws DomainError if the objective or constraint is undefined
             * @throws OptimizationError if the solver does not reach an optimum
             */
            RebalanceResult rebalance(
                const Portfolio &equities,
                ObjectiveType objective,
                const MarketParameters &market = MarketParameters()) const;

            const LinearSolver &solver() const { return *solver_; }

            /**
             * @brief Get rebalancer parameters as JSON
             */
            nlohmann::json get_parameters() const;

        private:
            std::unique_ptr<LinearSolver> solver_; ///< LP backend

            /**
             * @brief Reject an "optimal" solution that is materially negative
             *        or does not hold the budget
             * @throws OptimizationError with status SOLVER_ERROR
             */
            void verify_solution(
                const LinearProblem &problem,
                const Eigen::VectorXd &solution) const;

            /**
             * @brief Round the LP solution onto copies of the positions
             */
            static Portfolio map_solution(
                const Portfolio &equities,
                const Eigen::VectorXd &solution,
                Eigen::VectorXd &quantities);
        };

        /**
         * @brief Rebalance to maximize the linear Sharpe proxy
         * @return New positions, same order as the input
         */
        Portfolio optimize_for_sharpe(
            const Portfolio &equities,
            double benchmark_return,
            double risk_free_rate);

        /**
         * @brief Rebalance to minimize the beta-weighted quantity
         * @return New positions, same order as the input
         */
        Portfolio optimize_for_min_beta(const Portfolio &equities);

    } // namespace optimizer
} // namespace capm
