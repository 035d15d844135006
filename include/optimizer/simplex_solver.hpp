/**
 * @file simplex_solver.hpp
 * @brief Dense two-phase simplex solver
 *
 * Solves problems of the form:
 *
 * Minimize:     c^T * x
 * Subject to:   A_eq * x = b_eq
 *               l <= x <= u
 *
 * Algorithm: bounds are shifted to x = l + y with y >= 0, finite upper
 * bounds become extra equality rows with slack columns, and the resulting
 * standard-form problem is solved on a dense Eigen tableau. Phase one
 * minimizes the sum of artificial variables to find a feasible basis; phase
 * two minimizes c^T x from that basis. Bland's rule is used for both the
 * entering and the leaving variable, so the method cannot cycle.
 *
 * Performance: intended for portfolio-sized problems (N < 500, few rows).
 * Returns vertex solutions, which is what the rounding step expects.
 */

#pragma once

#include "optimizer/linear_solver.hpp"
#include <Eigen/Dense>
#include <vector>

namespace capm
{
    namespace optimizer
    {

        /**
         * @class SimplexSolver
         * @brief Exact LP solver using the tableau simplex method
         *
         * Usage Example:
         * @code
         * LinearProblem problem;
         * problem.c = betas;
         * problem.A_eq = prices.transpose();
         * problem.b_eq = Eigen::VectorXd::Constant(1, total_value);
         * problem.lower_bounds = Eigen::VectorXd::Zero(n);
         * problem.upper_bounds = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::infinity());
         *
         * SimplexSolver solver;
         * auto result = solver.solve(problem);
         * @endcode
         */
        class SimplexSolver : public LinearSolver
        {
        public:
            SimplexSolver() = default;

            /**
             * @brief Constructor
             * @param options Solver options
             */
            explicit SimplexSolver(const SolverOptions &options);

            ~SimplexSolver() override = default;

            /**
             * @brief Solve linear program
             * @param problem Problem specification
             * @return OPTIMAL, INFEASIBLE, UNBOUNDED or ITERATION_LIMIT
             * @throws std::invalid_argument if problem is invalid
             */
            SolverResult solve(const LinearProblem &problem) const override;

            /**
             * @brief Returns "simplex"
             */
            std::string get_name() const override;

        private:
            /**
             * @struct Tableau
             * @brief Dense simplex tableau
             *
             * Layout: rows [0, m) are constraints, row m is the objective
             * (reduced costs, with -objective in the last column). Columns
             * [0, num_structural) are shifted variables and slacks, the next
             * m columns are artificials, the last column is the right-hand side.
             */
            struct Tableau
            {
                Eigen::MatrixXd T;
                std::vector<int> basis;
                int num_rows = 0;
                int num_structural = 0;
                double rhs_scale = 1.0;

                int rhs_col() const { return static_cast<int>(T.cols()) - 1; }
            };

            /**
             * @brief Convert to standard form and load the phase-one objective
             */
            Tableau build_phase_one(const LinearProblem &problem) const;

            /**
             * @brief Replace the objective row with reduced costs of cost
             */
            void load_phase_two_objective(Tableau &tableau, const Eigen::VectorXd &cost) const;

            /**
             * @brief Pivot remaining zero-level artificials out of the basis
             */
            void drive_out_artificials(Tableau &tableau) const;

            /**
             * @brief Run simplex iterations on columns [0, num_columns)
             */
            SolverStatus iterate(Tableau &tableau, int num_columns, int &iterations) const;

            /**
             * @brief Gauss-Jordan pivot on (row, col)
             */
            void pivot(Tableau &tableau, int row, int col) const;
        };

    } // namespace optimizer
} // namespace capm
