/**
 * @file constraint_builder.cpp
 * @brief Implementation of the budget constraint builder
 */

#include "optimizer/constraint_builder.hpp"
#include "core/errors.hpp"
#include <limits>
#include <stdexcept>

namespace capm
{
    namespace optimizer
    {

        BudgetConstraint ConstraintBuilder::build(const Portfolio &equities)
        {
            validate_portfolio(equities, false);

            const int n = static_cast<int>(equities.size());

            BudgetConstraint constraint;
            constraint.A_eq = Eigen::MatrixXd::Zero(1, n);
            constraint.b_eq = Eigen::VectorXd::Zero(1);

            for (int i = 0; i < n; ++i)
            {
                const Equity &equity = equities[i];
                if (equity.avg_price() == 0.0)
                {
                    throw DomainError(
                        "Budget constraint is degenerate: equity " + equity.label(i) +
                        " has zero avg_price");
                }

                constraint.A_eq(0, i) = equity.avg_price();
                constraint.b_eq(0) += equity.market_value();
            }

            constraint.lower_bounds = Eigen::VectorXd::Zero(n);
            constraint.upper_bounds = Eigen::VectorXd::Constant(
                n, std::numeric_limits<double>::infinity());

            return constraint;
        }

        LinearProblem ConstraintBuilder::make_problem(
            const Eigen::VectorXd &c,
            const BudgetConstraint &constraint)
        {
            if (c.size() != constraint.A_eq.cols())
            {
                throw std::invalid_argument(
                    "Objective size (" + std::to_string(c.size()) +
                    ") does not match number of positions (" +
                    std::to_string(constraint.A_eq.cols()) + ")");
            }

            LinearProblem problem;
            problem.c = c;
            problem.A_eq = constraint.A_eq;
            problem.b_eq = constraint.b_eq;
            problem.lower_bounds = constraint.lower_bounds;
            problem.upper_bounds = constraint.upper_bounds;
            return problem;
        }

    } // namespace optimizer
} // namespace capm
