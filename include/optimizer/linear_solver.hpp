/**
 * @file linear_solver.hpp
 * @brief Linear programming problem/result structures and solver interface
 *
 * Every rebalancing objective in this project reduces to the same LP shape:
 *
 * Minimize:     c^T * x
 * Subject to:   A_eq * x = b_eq       (equality constraints)
 *               l <= x <= u           (box constraints, u may be +inf)
 *
 * Concrete solvers (SimplexSolver, OSQPSolver) implement LinearSolver so the
 * formulation code never depends on a particular library.
 */

#pragma once

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace capm
{
    namespace optimizer
    {

        /**
         * @struct LinearProblem
         * @brief Linear programming problem specification
         */
        struct LinearProblem
        {
            Eigen::VectorXd c; ///< Objective coefficients (N x 1)

            Eigen::MatrixXd A_eq; ///< Equality constraint matrix (M x N)
            Eigen::VectorXd b_eq; ///< Equality constraint values (M x 1)

            Eigen::VectorXd lower_bounds; ///< Lower bounds (finite)
            Eigen::VectorXd upper_bounds; ///< Upper bounds (+inf for none)

            /**
             * @brief Number of decision variables
             */
            int num_variables() const { return static_cast<int>(c.size()); }

            /**
             * @brief Validate problem specification
             * @throws std::invalid_argument if problem is ill-formed
             */
            void validate() const;
        };

        /**
         * @enum SolverStatus
         * @brief Termination status reported by a solver
         */
        enum class SolverStatus
        {
            OPTIMAL,         ///< Optimal solution found
            INFEASIBLE,      ///< No point satisfies the constraints
            UNBOUNDED,       ///< Objective decreases without limit
            ITERATION_LIMIT, ///< Stopped before proving optimality
            SOLVER_ERROR     ///< Setup or numerical failure
        };

        /**
         * @brief Upper-case name of a status ("OPTIMAL", "INFEASIBLE", ...)
         */
        std::string to_string(SolverStatus status);

        /**
         * @struct SolverOptions
         * @brief Options shared by all linear solvers
         */
        struct SolverOptions
        {
            int max_iterations = 10000; ///< Maximum pivots / ADMM iterations
            double tolerance = 1e-9;    ///< Feasibility / optimality tolerance
            bool verbose = false;       ///< Print progress

            SolverOptions() = default;
        };

        /**
         * @struct SolverResult
         * @brief Result from a linear solver
         */
        struct SolverResult
        {
            Eigen::VectorXd solution; ///< Optimal solution (valid when OPTIMAL)
            double objective_value;   ///< c^T * solution
            SolverStatus status;      ///< Termination status
            int iterations;           ///< Number of iterations
            std::string message;      ///< Status message

            SolverResult();

            bool success() const { return status == SolverStatus::OPTIMAL; }
        };

        /**
         * @class LinearSolver
         * @brief Abstract base class for LP backends
         *
         * Usage Example:
         * @code
         * auto solver = LinearSolverFactory::create("simplex");
         * SolverResult result = solver->solve(problem);
         * if (result.success()) { ... }
         * @endcode
         *
         * Thread Safety: one instance per thread; solve() keeps no state
         * between calls beyond the options.
         */
        class LinearSolver
        {
        public:
            virtual ~LinearSolver() = default;

            /**
             * @brief Solve a linear program
             * @param problem Problem specification
             * @return Result; failures are reported through status, not thrown
             * @throws std::invalid_argument if the problem is malformed
             */
            virtual SolverResult solve(const LinearProblem &problem) const = 0;

            /**
             * @brief Backend identifier ("simplex", "osqp")
             */
            virtual std::string get_name() const = 0;

            void set_options(const SolverOptions &options) { options_ = options; }
            const SolverOptions &get_options() const { return options_; }

        protected:
            SolverOptions options_; ///< Solver configuration
        };

        /**
         * @class LinearSolverFactory
         * @brief Creates LinearSolver instances by name
         */
        class LinearSolverFactory
        {
        public:
            /**
             * @brief Create a solver backend
             * @param type "simplex" or "osqp" (case-insensitive)
             * @param options Options applied to the new solver
             * @throws std::invalid_argument if type is unknown
             */
            static std::unique_ptr<LinearSolver> create(
                const std::string &type,
                const SolverOptions &options = SolverOptions());

            /**
             * @brief Names accepted by create()
             */
            static std::vector<std::string> get_supported_types();
        };

    } // namespace optimizer
} // namespace capm
