/**
 * @file test_constraint_builder.cpp
 * @brief Unit tests for the budget constraint
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "optimizer/constraint_builder.hpp"
#include "core/errors.hpp"
#include <cmath>

using namespace capm;
using namespace capm::optimizer;

TEST_CASE("Budget constraint", "[Constraint]") {
    SECTION("Happy path: price row and current value") {
        Portfolio equities = {
            Equity(1.2, 100.0, 50.0),
            Equity(0.9, 150.0, 30.0)};

        BudgetConstraint constraint = ConstraintBuilder::build(equities);

        REQUIRE(constraint.A_eq.rows() == 1);
        REQUIRE(constraint.A_eq.cols() == 2);
        REQUIRE(constraint.A_eq(0, 0) == Catch::Approx(50.0));
        REQUIRE(constraint.A_eq(0, 1) == Catch::Approx(30.0));
        REQUIRE(constraint.b_eq.size() == 1);
        REQUIRE(constraint.b_eq(0) == Catch::Approx(9500.0));
    }

    SECTION("Bounds are [0, +inf)") {
        Portfolio equities = {Equity(1.0, 1.0, 1.0), Equity(1.0, 1.0, 2.0), Equity(1.0, 1.0, 3.0)};
        BudgetConstraint constraint = ConstraintBuilder::build(equities);

        REQUIRE(constraint.lower_bounds.size() == 3);
        REQUIRE(constraint.upper_bounds.size() == 3);
        for (int i = 0; i < 3; ++i) {
            REQUIRE(constraint.lower_bounds(i) == 0.0);
            REQUIRE(std::isinf(constraint.upper_bounds(i)));
        }
    }

    SECTION("Edge case: zero quantities give a zero budget") {
        Portfolio equities = {Equity(1.0, 0.0, 10.0), Equity(1.0, 0.0, 20.0)};
        BudgetConstraint constraint = ConstraintBuilder::build(equities);
        REQUIRE(constraint.b_eq(0) == 0.0);
    }

    SECTION("Error: zero price makes the row degenerate") {
        Portfolio equities = {Equity(1.0, 10.0, 0.0), Equity(1.0, 10.0, 5.0)};
        REQUIRE_THROWS_AS(ConstraintBuilder::build(equities), DomainError);
    }

    SECTION("Error: empty portfolio") {
        REQUIRE_THROWS_AS(ConstraintBuilder::build(Portfolio{}), ValidationError);
    }
}

TEST_CASE("Problem assembly", "[Constraint]") {
    Portfolio equities = {Equity(1.2, 100.0, 50.0), Equity(0.9, 150.0, 30.0)};
    BudgetConstraint constraint = ConstraintBuilder::build(equities);

    SECTION("Happy path") {
        LinearProblem problem = ConstraintBuilder::make_problem(Eigen::Vector2d(1.2, 0.9), constraint);
        REQUIRE(problem.num_variables() == 2);
        REQUIRE_NOTHROW(problem.validate());
    }

    SECTION("Error: objective length mismatch") {
        REQUIRE_THROWS_AS(ConstraintBuilder::make_problem(Eigen::Vector3d(1.0, 1.0, 1.0), constraint),
                          std::invalid_argument);
    }
}
