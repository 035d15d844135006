/**
 * @file osqp_solver.cpp
 * @brief Implementation of OSQP solver wrapper
 */

#include "optimizer/osqp_solver.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace capm
{
    namespace optimizer
    {

        namespace
        {
            // ADMM does not converge to simplex-level tolerances
            constexpr double kMinTolerance = 1e-7;
        }

        OSQPSolver::OSQPSolver()
        {
            options_.max_iterations = 20000;
            options_.tolerance = 1e-7;
        }

        std::string OSQPSolver::get_name() const
        {
            return "osqp";
        }

        OSQPInt OSQPSolver::build_constraint_matrix(
            const LinearProblem &problem,
            std::vector<OSQPFloat> &A_data,
            std::vector<OSQPInt> &A_indices,
            std::vector<OSQPInt> &A_indptr,
            std::vector<OSQPFloat> &l,
            std::vector<OSQPFloat> &u) const
        {
            const int n = problem.num_variables();
            const int n_eq = static_cast<int>(problem.A_eq.rows());

            // Total constraints: n_eq equality + n bound rows
            const int m = n_eq + n;

            A_data.clear();
            A_indices.clear();
            A_indptr.clear();
            l.resize(m);
            u.resize(m);

            A_indptr.push_back(0);

            // Build constraint matrix column by column (CSC format)
            for (int j = 0; j < n; ++j)
            {
                // 1. Equality constraints: A_eq * x = b_eq
                for (int i = 0; i < n_eq; ++i)
                {
                    double val = problem.A_eq(i, j);
                    if (std::abs(val) > 1e-14)
                    {
                        A_data.push_back(val);
                        A_indices.push_back(i);
                    }
                }

                // 2. Bound row for x_j: lb_j <= x_j <= ub_j
                A_data.push_back(1.0);
                A_indices.push_back(n_eq + j);

                A_indptr.push_back(static_cast<OSQPInt>(A_data.size()));
            }

            // Equality constraints: l = u = b_eq
            for (int i = 0; i < n_eq; ++i)
            {
                l[i] = problem.b_eq(i);
                u[i] = problem.b_eq(i);
            }

            for (int j = 0; j < n; ++j)
            {
                l[n_eq + j] = problem.lower_bounds(j);
                u[n_eq + j] = std::isfinite(problem.upper_bounds(j))
                                  ? problem.upper_bounds(j)
                                  : OSQP_INFTY;
            }

            return m;
        }

        SolverStatus OSQPSolver::map_status(OSQPInt status_val)
        {
            switch (status_val)
            {
            case OSQP_SOLVED:
            case OSQP_SOLVED_INACCURATE:
                return SolverStatus::OPTIMAL;
            case OSQP_PRIMAL_INFEASIBLE:
            case OSQP_PRIMAL_INFEASIBLE_INACCURATE:
                return SolverStatus::INFEASIBLE;
            case OSQP_DUAL_INFEASIBLE:
            case OSQP_DUAL_INFEASIBLE_INACCURATE:
                return SolverStatus::UNBOUNDED;
            case OSQP_MAX_ITER_REACHED:
            case OSQP_TIME_LIMIT_REACHED:
                return SolverStatus::ITERATION_LIMIT;
            default:
                return SolverStatus::SOLVER_ERROR;
            }
        }

        SolverResult OSQPSolver::solve(const LinearProblem &problem) const
        {
            problem.validate();

            SolverResult result;
            const int n = problem.num_variables();

            // Zero quadratic term: explicit zero diagonal keeps P a valid
            // upper-triangular CSC matrix
            std::vector<OSQPFloat> P_data(n, 0.0);
            std::vector<OSQPInt> P_indices(n);
            std::vector<OSQPInt> P_indptr(n + 1);
            for (int j = 0; j < n; ++j)
            {
                P_indices[j] = j;
                P_indptr[j] = j;
            }
            P_indptr[n] = n;

            // Linear term q = c
            std::vector<OSQPFloat> q(n);
            for (int i = 0; i < n; ++i)
            {
                q[i] = problem.c(i);
            }

            // Build constraint matrix A and bounds l, u
            std::vector<OSQPFloat> A_data;
            std::vector<OSQPInt> A_indices;
            std::vector<OSQPInt> A_indptr;
            std::vector<OSQPFloat> l;
            std::vector<OSQPFloat> u;

            OSQPInt m = build_constraint_matrix(problem, A_data, A_indices, A_indptr, l, u);

            OSQPCscMatrix P_csc;
            P_csc.m = static_cast<OSQPInt>(n);
            P_csc.n = static_cast<OSQPInt>(n);
            P_csc.p = P_indptr.data();
            P_csc.i = P_indices.data();
            P_csc.x = P_data.data();
            P_csc.nzmax = static_cast<OSQPInt>(P_data.size());
            P_csc.nz = -1; // -1 means CSC format (not triplet)

            OSQPCscMatrix A_csc;
            A_csc.m = m;
            A_csc.n = static_cast<OSQPInt>(n);
            A_csc.p = A_indptr.data();
            A_csc.i = A_indices.data();
            A_csc.x = A_data.data();
            A_csc.nzmax = static_cast<OSQPInt>(A_data.size());
            A_csc.nz = -1;

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options_.verbose ? 1 : 0;
            settings.eps_abs = std::max(options_.tolerance, kMinTolerance);
            settings.eps_rel = std::max(options_.tolerance, kMinTolerance);
            settings.max_iter = options_.max_iterations;
            settings.polishing = 1;

            // :: selects the library's workspace type, not this class
            ::OSQPSolver *osqp_work = nullptr;
            OSQPInt exit_flag = osqp_setup(&osqp_work, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m, static_cast<OSQPInt>(n), &settings);

            if (exit_flag != 0)
            {
                if (osqp_work != nullptr)
                {
                    osqp_cleanup(osqp_work);
                }
                result.status = SolverStatus::SOLVER_ERROR;
                result.message = "OSQP setup failed (exit flag " + std::to_string(exit_flag) + ")";
                return result;
            }

            osqp_solve(osqp_work);

            result.iterations = static_cast<int>(osqp_work->info->iter);
            result.status = map_status(osqp_work->info->status_val);
            result.message = std::string(osqp_work->info->status);

            if (result.status == SolverStatus::OPTIMAL)
            {
                result.solution = Eigen::VectorXd::Zero(n);
                for (int i = 0; i < n; ++i)
                {
                    result.solution(i) = osqp_work->solution->x[i];
                }
                result.objective_value = problem.c.dot(result.solution);
            }

            if (options_.verbose)
            {
                std::cout << "OSQP finished: " << result.message << " after "
                          << result.iterations << " iterations\n";
            }

            osqp_cleanup(osqp_work);

            return result;
        }

    } // namespace optimizer
} // namespace capm
