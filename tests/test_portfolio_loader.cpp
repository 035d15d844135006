/**
 * @file test_portfolio_loader.cpp
 * @brief Unit tests for configuration loading and JSON export
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "data/portfolio_loader.hpp"
#include "core/errors.hpp"
#include <filesystem>
#include <fstream>
#include <string>

using namespace capm;

namespace
{
    std::string write_temp(const std::string &name, const std::string &content)
    {
        std::filesystem::path path = std::filesystem::temp_directory_path() / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }
}

TEST_CASE("Load run configuration", "[Loader]") {
    SECTION("Happy path: bundled sample config") {
        RebalanceConfig config = PortfolioLoader::load_config(
            std::string(CAPM_TEST_DATA_DIR) + "/config/portfolio_config.json");

        REQUIRE(config.portfolio.size() == 2);
        REQUIRE(config.portfolio[0].ticker() == "AAA");
        REQUIRE(config.portfolio[0].beta() == Catch::Approx(1.2));
        REQUIRE(config.portfolio[1].avg_price() == Catch::Approx(30.0));
        REQUIRE(config.market.benchmark_return == Catch::Approx(0.07));
        REQUIRE(config.market.risk_free_rate == Catch::Approx(0.02));
    }

    SECTION("Optional sections fall back to defaults") {
        std::string path = write_temp("capm_loader_defaults.json",
            R"({"portfolio": [{"beta": 1.0, "qty": 10, "avg_price": 5}]})");

        RebalanceConfig config = PortfolioLoader::load_config(path);
        REQUIRE(config.market.benchmark_return == Catch::Approx(0.07));
        REQUIRE(config.market.risk_free_rate == Catch::Approx(0.02));
        REQUIRE(config.optimizer.objective == "max_sharpe");
        REQUIRE(config.optimizer.solver == "simplex");
        REQUIRE(config.optimizer.max_iterations == 10000);
        REQUIRE_FALSE(config.portfolio[0].has_expected_return());
        REQUIRE(config.portfolio[0].ticker().empty());

        std::filesystem::remove(path);
    }

    SECTION("Optimizer settings are read") {
        std::string path = write_temp("capm_loader_optimizer.json", R"({
            "optimizer": {"objective": "min_beta", "solver": "osqp", "max_iterations": 500,
                          "tolerance": 1e-6, "verbose": true},
            "portfolio": [{"beta": 1.0, "qty": 10, "avg_price": 5, "return": 0.05}]
        })");

        RebalanceConfig config = PortfolioLoader::load_config(path);
        REQUIRE(config.optimizer.objective_type() == optimizer::ObjectiveType::MIN_BETA);
        REQUIRE(config.optimizer.solver == "osqp");

        optimizer::SolverOptions options = config.optimizer.solver_options();
        REQUIRE(options.max_iterations == 500);
        REQUIRE(options.tolerance == Catch::Approx(1e-6));
        REQUIRE(options.verbose);

        std::filesystem::remove(path);
    }

    SECTION("Error: missing portfolio") {
        std::string path = write_temp("capm_loader_missing.json", R"({"market": {}})");
        REQUIRE_THROWS_AS(PortfolioLoader::load_config(path), ValidationError);
        std::filesystem::remove(path);
    }

    SECTION("Error: negative quantity") {
        std::string path = write_temp("capm_loader_negative.json",
            R"({"portfolio": [{"beta": 1.0, "qty": -3, "avg_price": 5}]})");
        REQUIRE_THROWS_AS(PortfolioLoader::load_config(path), ValidationError);
        std::filesystem::remove(path);
    }

    SECTION("Error: unknown objective") {
        std::string path = write_temp("capm_loader_objective.json",
            R"({"optimizer": {"objective": "max_return"},
                "portfolio": [{"beta": 1.0, "qty": 10, "avg_price": 5}]})");
        REQUIRE_THROWS_AS(PortfolioLoader::load_config(path), std::invalid_argument);
        std::filesystem::remove(path);
    }

    SECTION("Error: malformed JSON") {
        std::string path = write_temp("capm_loader_malformed.json", "{ \"portfolio\": [ ");
        REQUIRE_THROWS_AS(PortfolioLoader::load_json(path), std::runtime_error);
        std::filesystem::remove(path);
    }

    SECTION("Error: file does not exist") {
        REQUIRE_THROWS_AS(PortfolioLoader::load_json("/nonexistent/capm_config.json"), std::runtime_error);
    }
}

TEST_CASE("Parse portfolio entries", "[Loader]") {
    SECTION("Error: not an array") {
        REQUIRE_THROWS_AS(PortfolioLoader::parse_portfolio(nlohmann::json::object()), ValidationError);
    }

    SECTION("Error: empty array") {
        REQUIRE_THROWS_AS(PortfolioLoader::parse_portfolio(nlohmann::json::array()), ValidationError);
    }

    SECTION("Error: missing field") {
        nlohmann::json j = nlohmann::json::array({{{"beta", 1.0}, {"qty", 2.0}}});
        REQUIRE_THROWS_AS(PortfolioLoader::parse_portfolio(j), ValidationError);
    }
}

TEST_CASE("Write JSON report", "[Loader]") {
    Portfolio equities = {Equity(1.2, 100.0, 50.0, 0.08, "AAA"), Equity(0.9, 150.0, 30.0)};
    std::filesystem::path path = std::filesystem::temp_directory_path() / "capm_loader_report.json";

    nlohmann::json document{{"portfolio", PortfolioLoader::portfolio_to_json(equities)}};
    PortfolioLoader::save_json(document, path.string());

    nlohmann::json loaded = PortfolioLoader::load_json(path.string());
    REQUIRE(loaded["portfolio"].size() == 2);
    REQUIRE(loaded["portfolio"][0]["return"].get<double>() == Catch::Approx(0.08));
    REQUIRE_FALSE(loaded["portfolio"][1].contains("return"));

    std::filesystem::remove(path);
}
