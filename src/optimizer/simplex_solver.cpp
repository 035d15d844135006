/**
 * @file simplex_solver.cpp
 * @brief Implementation of the two-phase tableau simplex solver
 */

#include "optimizer/simplex_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace capm
{
    namespace optimizer
    {

        SimplexSolver::SimplexSolver(const SolverOptions &options)
        {
            options_ = options;
        }

        std::string SimplexSolver::get_name() const
        {
            return "simplex";
        }

        SolverResult SimplexSolver::solve(const LinearProblem &problem) const
        {
            // Validate problem
            problem.validate();

            SolverResult result;
            const int n = problem.num_variables();

            Tableau tableau = build_phase_one(problem);

            if (options_.verbose)
            {
                std::cout << "Starting simplex with " << n << " variables, "
                          << tableau.num_rows << " constraint rows\n";
            }

            // Phase one: minimize the sum of artificials
            int iterations = 0;
            const int total_columns = tableau.num_structural + tableau.num_rows;
            SolverStatus status = iterate(tableau, total_columns, iterations);

            if (status == SolverStatus::ITERATION_LIMIT)
            {
                result.status = status;
                result.iterations = iterations;
                result.message = "Maximum iterations reached in phase one";
                return result;
            }

            const double infeasibility = -tableau.T(tableau.num_rows, tableau.rhs_col());
            if (infeasibility > options_.tolerance * tableau.rhs_scale)
            {
                result.status = SolverStatus::INFEASIBLE;
                result.iterations = iterations;
                result.message = "Problem is infeasible (phase one residual " +
                                 std::to_string(infeasibility) + ")";
                return result;
            }

            drive_out_artificials(tableau);

            // Phase two: original objective over structural columns only
            Eigen::VectorXd cost = Eigen::VectorXd::Zero(tableau.num_structural);
            cost.head(n) = problem.c;
            load_phase_two_objective(tableau, cost);

            status = iterate(tableau, tableau.num_structural, iterations);
            result.iterations = iterations;

            if (status == SolverStatus::UNBOUNDED)
            {
                result.status = status;
                result.message = "Problem is unbounded";
                return result;
            }

            if (status == SolverStatus::ITERATION_LIMIT)
            {
                result.status = status;
                result.message = "Maximum iterations reached in phase two";
                return result;
            }

            // Read basic variables back and undo the bound shift
            Eigen::VectorXd y = Eigen::VectorXd::Zero(tableau.num_structural);
            for (int i = 0; i < tableau.num_rows; ++i)
            {
                const int var = tableau.basis[i];
                if (var < tableau.num_structural)
                {
                    y(var) = std::max(0.0, tableau.T(i, tableau.rhs_col()));
                }
            }

            result.solution = problem.lower_bounds + y.head(n);
            result.objective_value = problem.c.dot(result.solution);
            result.status = SolverStatus::OPTIMAL;
            result.message = "Optimal";

            if (options_.verbose)
            {
                std::cout << "Simplex finished after " << iterations
                          << " pivots, objective = " << result.objective_value << "\n";
            }

            return result;
        }

        SimplexSolver::Tableau SimplexSolver::build_phase_one(const LinearProblem &problem) const
        {
            const int n = problem.num_variables();
            const int m_eq = static_cast<int>(problem.A_eq.rows());

            // Variables with a finite upper bound get a slack column and a row
            std::vector<int> bounded;
            for (int j = 0; j < n; ++j)
            {
                if (std::isfinite(problem.upper_bounds(j)))
                {
                    bounded.push_back(j);
                }
            }

            const int k = static_cast<int>(bounded.size());
            const int m = m_eq + k;
            const int num_structural = n + k;

            Tableau tableau;
            tableau.num_rows = m;
            tableau.num_structural = num_structural;
            tableau.T = Eigen::MatrixXd::Zero(m + 1, num_structural + m + 1);
            tableau.basis.resize(m);

            const int rhs = tableau.rhs_col();

            // Equality rows, shifted by the lower bounds
            for (int i = 0; i < m_eq; ++i)
            {
                tableau.T.row(i).head(n) = problem.A_eq.row(i);
                tableau.T(i, rhs) = problem.b_eq(i) - problem.A_eq.row(i).dot(problem.lower_bounds);
            }

            // Upper bound rows: y_j + s_j = u_j - l_j
            for (int t = 0; t < k; ++t)
            {
                const int j = bounded[t];
                const int row = m_eq + t;
                tableau.T(row, j) = 1.0;
                tableau.T(row, n + t) = 1.0;
                tableau.T(row, rhs) = problem.upper_bounds(j) - problem.lower_bounds(j);
            }

            // Non-negative right-hand side, then one artificial per row
            double max_rhs = 0.0;
            for (int i = 0; i < m; ++i)
            {
                if (tableau.T(i, rhs) < 0.0)
                {
                    tableau.T.row(i) *= -1.0;
                }
                max_rhs = std::max(max_rhs, tableau.T(i, rhs));

                tableau.T(i, num_structural + i) = 1.0;
                tableau.basis[i] = num_structural + i;
            }
            tableau.rhs_scale = 1.0 + max_rhs;

            // Phase one reduced costs: d_j = -sum_i a_ij for non-artificial columns
            for (int i = 0; i < m; ++i)
            {
                tableau.T.row(m).head(num_structural) -= tableau.T.row(i).head(num_structural);
                tableau.T(m, rhs) -= tableau.T(i, rhs);
            }

            return tableau;
        }

        void SimplexSolver::load_phase_two_objective(Tableau &tableau, const Eigen::VectorXd &cost) const
        {
            const int m = tableau.num_rows;

            tableau.T.row(m).setZero();
            tableau.T.row(m).head(tableau.num_structural) = cost.transpose();

            for (int i = 0; i < m; ++i)
            {
                const int var = tableau.basis[i];
                if (var >= tableau.num_structural)
                {
                    continue;
                }

                const double cb = cost(var);
                if (cb != 0.0)
                {
                    tableau.T.row(m) -= cb * tableau.T.row(i);
                }
            }
        }

        void SimplexSolver::drive_out_artificials(Tableau &tableau) const
        {
            const int rhs = tableau.rhs_col();

            for (int i = 0; i < tableau.num_rows; ++i)
            {
                if (tableau.basis[i] < tableau.num_structural)
                {
                    continue;
                }

                for (int j = 0; j < tableau.num_structural; ++j)
                {
                    if (std::abs(tableau.T(i, j)) > options_.tolerance)
                    {
                        // Artificial sits at zero level after a feasible phase one
                        tableau.T(i, rhs) = 0.0;
                        pivot(tableau, i, j);
                        break;
                    }
                }
                // A row with no structural entry is redundant and keeps its artificial
            }
        }

        SolverStatus SimplexSolver::iterate(Tableau &tableau, int num_columns, int &iterations) const
        {
            const int m = tableau.num_rows;
            const int rhs = tableau.rhs_col();

            while (true)
            {
                if (iterations >= options_.max_iterations)
                {
                    return SolverStatus::ITERATION_LIMIT;
                }

                // Entering column: lowest index with negative reduced cost
                int col = -1;
                for (int j = 0; j < num_columns; ++j)
                {
                    if (tableau.T(m, j) < -options_.tolerance)
                    {
                        col = j;
                        break;
                    }
                }

                if (col < 0)
                {
                    return SolverStatus::OPTIMAL;
                }

                // Ratio test, ties broken by lowest basic variable index
                int row = -1;
                double best_ratio = std::numeric_limits<double>::infinity();
                for (int i = 0; i < m; ++i)
                {
                    const double a = tableau.T(i, col);
                    if (a <= options_.tolerance)
                    {
                        continue;
                    }

                    const double ratio = tableau.T(i, rhs) / a;
                    if (ratio < best_ratio - options_.tolerance ||
                        (std::abs(ratio - best_ratio) <= options_.tolerance &&
                         row >= 0 && tableau.basis[i] < tableau.basis[row]))
                    {
                        best_ratio = ratio;
                        row = i;
                    }
                }

                if (row < 0)
                {
                    return SolverStatus::UNBOUNDED;
                }

                pivot(tableau, row, col);
                ++iterations;

                if (options_.verbose && iterations % 100 == 0)
                {
                    std::cout << "Pivot " << iterations << ": obj = "
                              << -tableau.T(m, rhs) << "\n";
                }
            }
        }

        void SimplexSolver::pivot(Tableau &tableau, int row, int col) const
        {
            const double pivot_value = tableau.T(row, col);
            tableau.T.row(row) /= pivot_value;

            for (int i = 0; i < tableau.T.rows(); ++i)
            {
                if (i == row)
                {
                    continue;
                }

                const double factor = tableau.T(i, col);
                if (factor != 0.0)
                {
                    tableau.T.row(i) -= factor * tableau.T.row(row);
                }
            }

            tableau.basis[row] = col;
        }

    } // namespace optimizer
} // namespace capm
