/**
 * @file linear_solver.cpp
 * @brief Implementation of LP structures and solver factory
 */

#include "optimizer/linear_solver.hpp"
#include "optimizer/simplex_solver.hpp"
#include "optimizer/osqp_solver.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace capm
{
    namespace optimizer
    {

        // ============================================================================
        // LinearProblem Implementation
        // ============================================================================

        void LinearProblem::validate() const
        {
            const int n = num_variables();

            if (n == 0)
            {
                throw std::invalid_argument("Problem dimension is zero");
            }

            if (!c.allFinite())
            {
                throw std::invalid_argument("c vector contains NaN or Inf");
            }

            // Check equality constraints
            if (A_eq.rows() > 0)
            {
                if (A_eq.cols() != n)
                {
                    throw std::invalid_argument("A_eq columns do not match problem dimension");
                }
                if (b_eq.size() != A_eq.rows())
                {
                    throw std::invalid_argument("b_eq size does not match A_eq rows");
                }
                if (!A_eq.allFinite() || !b_eq.allFinite())
                {
                    throw std::invalid_argument("Equality constraints contain NaN or Inf");
                }
            }
            else if (b_eq.size() > 0)
            {
                throw std::invalid_argument("b_eq given without A_eq");
            }

            // Check bounds
            if (lower_bounds.size() != n)
            {
                throw std::invalid_argument("Lower bounds size does not match problem dimension");
            }
            if (upper_bounds.size() != n)
            {
                throw std::invalid_argument("Upper bounds size does not match problem dimension");
            }

            if (!lower_bounds.allFinite())
            {
                throw std::invalid_argument("Lower bounds contain NaN or Inf");
            }
            if (upper_bounds.hasNaN())
            {
                throw std::invalid_argument("Upper bounds contain NaN");
            }

            for (int i = 0; i < n; ++i)
            {
                if (lower_bounds(i) > upper_bounds(i))
                {
                    throw std::invalid_argument(
                        "Lower bound exceeds upper bound for variable " + std::to_string(i));
                }
            }
        }

        std::string to_string(SolverStatus status)
        {
            switch (status)
            {
            case SolverStatus::OPTIMAL:
                return "OPTIMAL";
            case SolverStatus::INFEASIBLE:
                return "INFEASIBLE";
            case SolverStatus::UNBOUNDED:
                return "UNBOUNDED";
            case SolverStatus::ITERATION_LIMIT:
                return "ITERATION_LIMIT";
            case SolverStatus::SOLVER_ERROR:
                return "SOLVER_ERROR";
            }
            return "UNKNOWN";
        }

        // ============================================================================
        // SolverResult Implementation
        // ============================================================================

        SolverResult::SolverResult()
            : objective_value(0.0),
              status(SolverStatus::SOLVER_ERROR),
              iterations(0)
        {
        }

        // ============================================================================
        // LinearSolverFactory Implementation
        // ============================================================================

        std::unique_ptr<LinearSolver> LinearSolverFactory::create(
            const std::string &type,
            const SolverOptions &options)
        {
            std::string normalized = type;
            std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch)
                           { return std::tolower(ch); });

            std::unique_ptr<LinearSolver> solver;
            if (normalized == "simplex")
            {
                solver = std::make_unique<SimplexSolver>();
            }
            else if (normalized == "osqp")
            {
                solver = std::make_unique<OSQPSolver>();
            }
            else
            {
                throw std::invalid_argument(
                    "Unknown solver type: '" + type + "'. Valid options: simplex, osqp");
            }

            solver->set_options(options);
            return solver;
        }

        std::vector<std::string> LinearSolverFactory::get_supported_types()
        {
            return {"simplex", "osqp"};
        }

    } // namespace optimizer
} // namespace capm
