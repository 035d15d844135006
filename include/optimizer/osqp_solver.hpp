/**
 * @file osqp_solver.hpp
 * @brief OSQP-based linear programming solver
 *
 * Wraps the OSQP library behind the LinearSolver interface. OSQP solves
 *
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   l <= A x <= u
 *
 * and an LP is the special case P = 0, q = c. Equality rows are encoded as
 * l = u = b_eq and variable bounds as identity rows.
 *
 * OSQP is a first-order (ADMM) method: with polishing enabled the returned
 * vertex is accurate to roughly 1e-6 relative, which is enough for the
 * integer rounding applied by the rebalancer.
 */

#pragma once

#include "optimizer/linear_solver.hpp"
#include <Eigen/Dense>
#include <osqp/osqp.h>
#include <vector>

namespace capm
{
    namespace optimizer
    {

        /**
         * @class OSQPSolver
         * @brief Linear programming solver using the OSQP library
         *
         * Usage Example:
         * @code
         * OSQPSolver solver;
         * SolverOptions options;
         * options.max_iterations = 20000;
         * options.tolerance = 1e-7;
         * solver.set_options(options);
         *
         * SolverResult result = solver.solve(problem);
         * @endcode
         */
        class OSQPSolver : public LinearSolver
        {
        public:
            /**
             * @brief Default constructor
             */
            OSQPSolver();

            ~OSQPSolver() override = default;

            /**
             * @brief Solve linear program
             * @param problem LP specification
             * @return Solution with status, iterations, and objective value
             */
            SolverResult solve(const LinearProblem &problem) const override;

            /**
             * @brief Returns "osqp"
             */
            std::string get_name() const override;

        private:
            /**
             * @brief Build the stacked constraint matrix [A_eq; I] in CSC format
             * @param problem LP problem
             * @param A_data Output: constraint matrix values
             * @param A_indices Output: row indices
             * @param A_indptr Output: column pointers
             * @param l Output: lower bounds for constraints
             * @param u Output: upper bounds for constraints
             * @return Number of constraint rows (m)
             *
             *   A = [A_eq; I]
             *   l = [b_eq; lb]
             *   u = [b_eq; ub]   (inf mapped to OSQP_INFTY)
             */
            OSQPInt build_constraint_matrix(
                const LinearProblem &problem,
                std::vector<OSQPFloat> &A_data,
                std::vector<OSQPInt> &A_indices,
                std::vector<OSQPInt> &A_indptr,
                std::vector<OSQPFloat> &l,
                std::vector<OSQPFloat> &u) const;

            /**
             * @brief Map an OSQP status code onto SolverStatus
             */
            static SolverStatus map_status(OSQPInt status_val);
        };

    } // namespace optimizer
} // namespace capm
