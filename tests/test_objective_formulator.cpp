/**
 * @file test_objective_formulator.cpp
 * @brief Unit tests for the rebalancing objectives
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "optimizer/objective_formulator.hpp"
#include "core/errors.hpp"

using namespace capm;
using namespace capm::optimizer;
using Catch::Matchers::WithinAbs;

namespace
{
    Portfolio sample_portfolio()
    {
        return {
            Equity(1.2, 100.0, 50.0, 0.08, "AAA"),
            Equity(0.9, 150.0, 30.0, 0.06, "BBB")};
    }

    MarketParameters sample_market()
    {
        MarketParameters market;
        market.benchmark_return = 0.07;
        market.risk_free_rate = 0.02;
        return market;
    }
}

TEST_CASE("Sharpe objective coefficients", "[Objective]") {
    SECTION("Happy path: negated excess return over systematic risk") {
        Eigen::VectorXd c = ObjectiveFormulator::sharpe_objective(sample_portfolio(), sample_market());
        REQUIRE(c.size() == 2);
        // -(0.08 - 0.02) / (1.2 * 0.05) = -1.0
        REQUIRE_THAT(c(0), WithinAbs(-1.0, 1e-12));
        // -(0.06 - 0.02) / (0.9 * 0.05) = -0.8889
        REQUIRE_THAT(c(1), WithinAbs(-0.04 / 0.045, 1e-12));
    }

    SECTION("Return below the risk-free rate gives a positive coefficient") {
        Portfolio equities = {Equity(1.0, 10.0, 10.0, 0.01)};
        Eigen::VectorXd c = ObjectiveFormulator::sharpe_objective(equities, sample_market());
        REQUIRE(c(0) > 0.0);
    }

    SECTION("Dispatch through build") {
        Eigen::VectorXd c = ObjectiveFormulator::build(sample_portfolio(), ObjectiveType::MAX_SHARPE, sample_market());
        REQUIRE_THAT(c(0), WithinAbs(-1.0, 1e-12));
    }

    SECTION("Error: zero beta") {
        Portfolio equities = {Equity(0.0, 10.0, 10.0, 0.05), Equity(1.0, 10.0, 10.0, 0.05)};
        REQUIRE_THROWS_AS(ObjectiveFormulator::sharpe_objective(equities, sample_market()), DomainError);
    }

    SECTION("Error: benchmark return equals risk-free rate") {
        MarketParameters flat;
        flat.benchmark_return = 0.03;
        flat.risk_free_rate = 0.03;
        REQUIRE_THROWS_AS(ObjectiveFormulator::sharpe_objective(sample_portfolio(), flat), DomainError);
    }

    SECTION("Error: missing return") {
        Portfolio equities = {Equity(1.0, 10.0, 10.0, 0.05), Equity(1.0, 10.0, 10.0)};
        REQUIRE_THROWS_AS(ObjectiveFormulator::sharpe_objective(equities, sample_market()), ValidationError);
    }

    SECTION("Error: empty portfolio") {
        REQUIRE_THROWS_AS(ObjectiveFormulator::sharpe_objective(Portfolio{}, sample_market()), ValidationError);
    }
}

TEST_CASE("Min-beta objective coefficients", "[Objective]") {
    SECTION("Coefficients are the betas") {
        Eigen::VectorXd c = ObjectiveFormulator::min_beta_objective(sample_portfolio());
        REQUIRE_THAT(c(0), WithinAbs(1.2, 1e-12));
        REQUIRE_THAT(c(1), WithinAbs(0.9, 1e-12));
    }

    SECTION("Returns are not required") {
        Portfolio equities = {Equity(1.5, 10.0, 10.0), Equity(-0.2, 5.0, 20.0)};
        Eigen::VectorXd c = ObjectiveFormulator::build(equities, ObjectiveType::MIN_BETA, MarketParameters());
        REQUIRE_THAT(c(1), WithinAbs(-0.2, 1e-12));
    }

    SECTION("Zero beta is allowed") {
        Portfolio equities = {Equity(0.0, 10.0, 10.0)};
        REQUIRE_NOTHROW(ObjectiveFormulator::min_beta_objective(equities));
    }

    SECTION("Error: empty portfolio") {
        REQUIRE_THROWS_AS(ObjectiveFormulator::min_beta_objective(Portfolio{}), ValidationError);
    }
}

TEST_CASE("Objective names", "[Objective]") {
    REQUIRE(parse_objective("max_sharpe") == ObjectiveType::MAX_SHARPE);
    REQUIRE(parse_objective("MIN_BETA") == ObjectiveType::MIN_BETA);
    REQUIRE(to_string(ObjectiveType::MIN_BETA) == "min_beta");
    REQUIRE_THROWS_AS(parse_objective("max_return"), std::invalid_argument);
}
