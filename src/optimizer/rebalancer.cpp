/**
 * @file rebalancer.cpp
 * @brief Implementation of the value-preserving rebalancer
 */

#include "optimizer/rebalancer.hpp"
#include "optimizer/constraint_builder.hpp"
#include "optimizer/simplex_solver.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <utility>

namespace capm
{
    namespace optimizer
    {

        namespace
        {
            // Grid the LP solution is snapped to before integer rounding
            constexpr double kSnapScale = 1e9;

            // Feasibility checks never get tighter than first-order solvers reach
            constexpr double kMinFeasibilityTolerance = 1e-6;
        }

        // ============================================================================
        // RebalanceResult Implementation
        // ============================================================================

        RebalanceResult::RebalanceResult()
            : objective(ObjectiveType::MAX_SHARPE),
              value_before(0.0),
              value_continuous(0.0),
              value_after(0.0),
              objective_value(0.0),
              iterations(0)
        {
        }

        nlohmann::json RebalanceResult::to_json() const
        {
            nlohmann::json positions = nlohmann::json::array();
            for (const auto &equity : equities)
            {
                positions.push_back(equity.to_json());
            }

            return nlohmann::json{
                {"objective", to_string(objective)},
                {"solver", solver_name},
                {"message", message},
                {"iterations", iterations},
                {"objective_value", objective_value},
                {"value_before", value_before},
                {"value_continuous", value_continuous},
                {"value_after", value_after},
                {"rounding_drift", rounding_drift()},
                {"portfolio", positions}};
        }

        void RebalanceResult::print_summary() const
        {
            std::cout << "\n=== Rebalance Result ===\n";
            std::cout << "Objective: " << to_string(objective) << "\n";
            std::cout << "Solver:    " << solver_name << " (" << message << ")\n";
            std::cout << "Iterations: " << iterations << "\n";
            std::cout << std::string(50, '-') << "\n";

            std::cout << std::fixed << std::setprecision(2);
            std::cout << "  Value before:     " << value_before << "\n";
            std::cout << "  Value (LP):       " << value_continuous << "\n";
            std::cout << "  Value after:      " << value_after << "\n";
            std::cout << "  Rounding drift:   " << rounding_drift() << "\n";

            std::cout << "\nQuantities:\n";
            for (size_t i = 0; i < equities.size(); ++i)
            {
                std::cout << "  " << std::setw(8) << std::left << equities[i].label(i)
                          << std::right << std::setw(12) << std::setprecision(4)
                          << continuous_solution(static_cast<Eigen::Index>(i))
                          << " -> " << std::setprecision(0)
                          << quantities(static_cast<Eigen::Index>(i)) << "\n";
            }

            std::cout << "========================\n"
                      << std::endl;
        }

        // ============================================================================
        // Rebalancer Implementation
        // ============================================================================

        Rebalancer::Rebalancer(std::unique_ptr<LinearSolver> solver)
            : solver_(std::move(solver))
        {
            if (!solver_)
            {
                solver_ = std::make_unique<SimplexSolver>();
            }
        }

        nlohmann::json Rebalancer::get_parameters() const
        {
            const SolverOptions &options = solver_->get_options();
            return nlohmann::json{
                {"solver", solver_->get_name()},
                {"max_iterations", options.max_iterations},
                {"tolerance", options.tolerance}};
        }

        RebalanceResult Rebalancer::rebalance(
            const Portfolio &equities,
            ObjectiveType objective,
            const MarketParameters &market) const
        {
            // Formulate; both steps validate and throw before the solver runs
            Eigen::VectorXd c = ObjectiveFormulator::build(equities, objective, market);
            BudgetConstraint constraint = ConstraintBuilder::build(equities);
            LinearProblem problem = ConstraintBuilder::make_problem(c, constraint);

            SolverResult solver_result = solver_->solve(problem);

            if (!solver_result.success())
            {
                throw OptimizationError(
                    "Rebalancing LP failed (" + solver_->get_name() + ", " +
                        to_string(solver_result.status) + "): " + solver_result.message,
                    to_string(solver_result.status));
            }

            if (solver_result.solution.size() != c.size() || !solver_result.solution.allFinite())
            {
                throw DomainError("Solver returned a non-finite or mis-sized solution");
            }

            verify_solution(problem, solver_result.solution);

            RebalanceResult result;
            result.objective = objective;
            result.solver_name = solver_->get_name();
            result.message = solver_result.message;
            result.iterations = solver_result.iterations;
            result.objective_value = solver_result.objective_value;
            result.continuous_solution = solver_result.solution;
            result.value_before = constraint.b_eq(0);
            result.value_continuous = constraint.A_eq.row(0).dot(solver_result.solution);

            result.equities = map_solution(equities, solver_result.solution, result.quantities);
            result.value_after = total_market_value(result.equities);

            return result;
        }

        void Rebalancer::verify_solution(
            const LinearProblem &problem,
            const Eigen::VectorXd &solution) const
        {
            const double tolerance = std::max(solver_->get_options().tolerance, kMinFeasibilityTolerance);
            const std::string status = to_string(SolverStatus::SOLVER_ERROR);

            const double scale = 1.0 + solution.cwiseAbs().maxCoeff();
            for (Eigen::Index i = 0; i < solution.size(); ++i)
            {
                if (solution(i) < -tolerance * scale)
                {
                    throw OptimizationError(
                        "Solver " + solver_->get_name() + " returned a negative quantity (" +
                            std::to_string(solution(i)) + ") for position " + std::to_string(i),
                        status);
                }
            }

            const Eigen::VectorXd residual = problem.A_eq * solution - problem.b_eq;
            for (Eigen::Index r = 0; r < residual.size(); ++r)
            {
                if (std::abs(residual(r)) > tolerance * (1.0 + std::abs(problem.b_eq(r))))
                {
                    throw OptimizationError(
                        "Solver " + solver_->get_name() + " solution breaks the budget constraint (residual " +
                            std::to_string(residual(r)) + ")",
                        status);
                }
            }
        }

        Portfolio Rebalancer::map_solution(
            const Portfolio &equities,
            const Eigen::VectorXd &solution,
            Eigen::VectorXd &quantities)
        {
            const int n = static_cast<int>(equities.size());
            quantities = Eigen::VectorXd::Zero(n);

            Portfolio rebalanced;
            rebalanced.reserve(equities.size());

            for (int i = 0; i < n; ++i)
            {
                // Snapping makes (p * q) / p land back on q before ties-to-even rounding
                const double snapped = std::round(solution(i) * kSnapScale) / kSnapScale;
                quantities(i) = std::nearbyint(std::max(0.0, snapped));
                rebalanced.push_back(equities[i].with_quantity(quantities(i)));
            }

            return rebalanced;
        }

        // ============================================================================
        // Free functions
        // ============================================================================

        Portfolio optimize_for_sharpe(
            const Portfolio &equities,
            double benchmark_return,
            double risk_free_rate)
        {
            MarketParameters market;
            market.benchmark_return = benchmark_return;
            market.risk_free_rate = risk_free_rate;

            Rebalancer rebalancer;
            return rebalancer.rebalance(equities, ObjectiveType::MAX_SHARPE, market).equities;
        }

        Portfolio optimize_for_min_beta(const Portfolio &equities)
        {
            Rebalancer rebalancer;
            return rebalancer.rebalance(equities, ObjectiveType::MIN_BETA).equities;
        }

    } // namespace optimizer
} // namespace capm
