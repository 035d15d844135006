/**
 * @file test_equity.cpp
 * @brief Unit tests for Equity, MarketParameters and portfolio checks
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/equity.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <limits>

using namespace capm;

TEST_CASE("Equity construction", "[Equity]") {
    SECTION("Happy path: all fields") {
        Equity e(1.2, 100.0, 50.0, 0.08, "AAA");
        REQUIRE(e.ticker() == "AAA");
        REQUIRE(e.beta() == Catch::Approx(1.2));
        REQUIRE(e.qty() == Catch::Approx(100.0));
        REQUIRE(e.avg_price() == Catch::Approx(50.0));
        REQUIRE(e.has_expected_return());
        REQUIRE(*e.expected_return() == Catch::Approx(0.08));
        REQUIRE(e.market_value() == Catch::Approx(5000.0));
    }

    SECTION("Return is optional") {
        Equity e(0.9, 150.0, 30.0);
        REQUIRE_FALSE(e.has_expected_return());
        REQUIRE(e.ticker().empty());
        REQUIRE(e.label(3) == "#3");
    }

    SECTION("Zero price and zero quantity are representable") {
        REQUIRE_NOTHROW(Equity(1.0, 0.0, 0.0));
    }

    SECTION("Error: negative avg_price") {
        REQUIRE_THROWS_AS(Equity(1.0, 10.0, -5.0), ValidationError);
    }

    SECTION("Error: negative qty") {
        REQUIRE_THROWS_AS(Equity(1.0, -1.0, 5.0), ValidationError);
    }

    SECTION("Error: non-finite fields") {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        const double inf = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(Equity(nan, 1.0, 5.0), ValidationError);
        REQUIRE_THROWS_AS(Equity(1.0, inf, 5.0), ValidationError);
        REQUIRE_THROWS_AS(Equity(1.0, 1.0, 5.0, nan), ValidationError);
    }

    SECTION("ValidationError is a std::invalid_argument") {
        REQUIRE_THROWS_AS(Equity(1.0, 10.0, -5.0), std::invalid_argument);
    }
}

TEST_CASE("Equity with_quantity", "[Equity]") {
    Equity original(1.2, 100.0, 50.0, 0.08, "AAA");
    Equity changed = original.with_quantity(42.0);

    REQUIRE(changed.qty() == Catch::Approx(42.0));
    REQUIRE(changed.beta() == Catch::Approx(1.2));
    REQUIRE(changed.avg_price() == Catch::Approx(50.0));
    REQUIRE(*changed.expected_return() == Catch::Approx(0.08));
    REQUIRE(changed.ticker() == "AAA");

    // The source record is untouched
    REQUIRE(original.qty() == Catch::Approx(100.0));

    REQUIRE_THROWS_AS(original.with_quantity(-3.0), ValidationError);
}

TEST_CASE("Equity JSON parsing", "[Equity]") {
    SECTION("Happy path") {
        nlohmann::json j = {{"ticker", "XYZ"}, {"beta", 0.7}, {"qty", 12}, {"avg_price", 9.5}, {"return", 0.05}};
        Equity e = Equity::from_json(j);
        REQUIRE(e.ticker() == "XYZ");
        REQUIRE(e.beta() == Catch::Approx(0.7));
        REQUIRE(e.qty() == Catch::Approx(12.0));
        REQUIRE(e.avg_price() == Catch::Approx(9.5));
        REQUIRE(*e.expected_return() == Catch::Approx(0.05));

        nlohmann::json out = e.to_json();
        REQUIRE(out["ticker"] == "XYZ");
        REQUIRE(out["return"].get<double>() == Catch::Approx(0.05));
    }

    SECTION("Missing return stays empty") {
        nlohmann::json j = {{"beta", 0.7}, {"qty", 12}, {"avg_price", 9.5}};
        Equity e = Equity::from_json(j);
        REQUIRE_FALSE(e.has_expected_return());
        REQUIRE_FALSE(e.to_json().contains("return"));
    }

    SECTION("Error: missing required field") {
        nlohmann::json j = {{"beta", 0.7}, {"qty", 12}};
        REQUIRE_THROWS_AS(Equity::from_json(j), ValidationError);
    }

    SECTION("Error: non-numeric field") {
        nlohmann::json j = {{"beta", "high"}, {"qty", 12}, {"avg_price", 9.5}};
        REQUIRE_THROWS_AS(Equity::from_json(j), ValidationError);
    }

    SECTION("Error: non-string ticker") {
        nlohmann::json j = {{"ticker", 42}, {"beta", 0.7}, {"qty", 12}, {"avg_price", 9.5}};
        REQUIRE_THROWS_AS(Equity::from_json(j), ValidationError);
    }

    SECTION("Error: not an object") {
        REQUIRE_THROWS_AS(Equity::from_json(nlohmann::json::array()), ValidationError);
    }
}

TEST_CASE("Portfolio helpers", "[Equity]") {
    Portfolio equities = {
        Equity(1.2, 100.0, 50.0, 0.08),
        Equity(0.9, 150.0, 30.0)};

    SECTION("Total market value") {
        REQUIRE(total_market_value(equities) == Catch::Approx(9500.0));
    }

    SECTION("Validation without returns") {
        REQUIRE_NOTHROW(validate_portfolio(equities, false));
    }

    SECTION("Error: missing return when required") {
        REQUIRE_THROWS_AS(validate_portfolio(equities, true), ValidationError);
    }

    SECTION("Error: empty portfolio") {
        REQUIRE_THROWS_AS(validate_portfolio(Portfolio{}, false), ValidationError);
    }
}

TEST_CASE("MarketParameters", "[Equity]") {
    SECTION("Defaults") {
        MarketParameters m = MarketParameters::from_json(nlohmann::json::object());
        REQUIRE(m.benchmark_return == Catch::Approx(0.07));
        REQUIRE(m.risk_free_rate == Catch::Approx(0.02));
        REQUIRE(m.market_excess_return() == Catch::Approx(0.05));
    }

    SECTION("Explicit values") {
        nlohmann::json j = {{"benchmark_return", 0.10}, {"risk_free_rate", 0.03}};
        MarketParameters m = MarketParameters::from_json(j);
        REQUIRE(m.benchmark_return == Catch::Approx(0.10));
        REQUIRE(m.risk_free_rate == Catch::Approx(0.03));
        REQUIRE(m.to_json()["risk_free_rate"].get<double>() == Catch::Approx(0.03));
    }
}
