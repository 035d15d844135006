/**
 * @file portfolio_loader.cpp
 * @brief Implementation of PortfolioLoader and configuration structures
 */

#include "data/portfolio_loader.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <iomanip>

namespace capm
{

    // =============================================
    // Configuration Structures - from_json Methods
    // =============================================

    OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
    {
        OptimizerConfig config;
        config.objective = j.value("objective", "max_sharpe");
        config.solver = j.value("solver", "simplex");
        config.max_iterations = j.value("max_iterations", 10000);
        config.tolerance = j.value("tolerance", 1e-9);
        config.verbose = j.value("verbose", false);

        if (config.max_iterations <= 0)
        {
            throw std::invalid_argument(
                "max_iterations must be positive, got: " + std::to_string(config.max_iterations));
        }
        if (config.tolerance <= 0.0)
        {
            throw std::invalid_argument(
                "tolerance must be positive, got: " + std::to_string(config.tolerance));
        }

        // Reject unknown objective names at load time
        config.objective_type();
        return config;
    }

    optimizer::ObjectiveType OptimizerConfig::objective_type() const
    {
        return optimizer::parse_objective(objective);
    }

    optimizer::SolverOptions OptimizerConfig::solver_options() const
    {
        optimizer::SolverOptions options;
        options.max_iterations = max_iterations;
        options.tolerance = tolerance;
        options.verbose = verbose;
        return options;
    }

    nlohmann::json OptimizerConfig::to_json() const
    {
        return nlohmann::json{
            {"objective", objective},
            {"solver", solver},
            {"max_iterations", max_iterations},
            {"tolerance", tolerance},
            {"verbose", verbose}};
    }

    RebalanceConfig RebalanceConfig::from_json(const nlohmann::json &j)
    {
        RebalanceConfig config;

        if (j.contains("market"))
        {
            config.market = MarketParameters::from_json(j["market"]);
        }

        if (j.contains("optimizer"))
        {
            config.optimizer = OptimizerConfig::from_json(j["optimizer"]);
        }

        if (!j.contains("portfolio"))
        {
            throw ValidationError("Configuration must contain a 'portfolio' array");
        }
        config.portfolio = PortfolioLoader::parse_portfolio(j["portfolio"]);

        return config;
    }

    // ================
    // JSON Loading
    // ================

    nlohmann::json PortfolioLoader::load_json(const std::string &filepath)
    {
        std::ifstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open JSON file: " + filepath);
        }

        nlohmann::json j;
        try
        {
            file >> j;
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
        }

        file.close();
        return j;
    }

    RebalanceConfig PortfolioLoader::load_config(const std::string &config_path)
    {
        auto j = load_json(config_path);

        try
        {
            return RebalanceConfig::from_json(j);
        }
        catch (const nlohmann::json::exception &e)
        {
            throw std::runtime_error(
                "Invalid configuration in " + config_path + ": " + std::string(e.what()));
        }
    }

    Portfolio PortfolioLoader::parse_portfolio(const nlohmann::json &j)
    {
        if (!j.is_array())
        {
            throw ValidationError("'portfolio' must be a JSON array");
        }

        Portfolio equities;
        equities.reserve(j.size());
        for (const auto &entry : j)
        {
            equities.push_back(Equity::from_json(entry));
        }

        validate_portfolio(equities, false);
        return equities;
    }

    nlohmann::json PortfolioLoader::portfolio_to_json(const Portfolio &equities)
    {
        nlohmann::json array = nlohmann::json::array();
        for (const auto &equity : equities)
        {
            array.push_back(equity.to_json());
        }
        return array;
    }

    // ================
    // Export
    // ================

    void PortfolioLoader::save_json(const nlohmann::json &document, const std::string &filepath)
    {
        std::ofstream file(filepath);
        if (!file.is_open())
        {
            throw std::runtime_error("Could not open file for writing: " + filepath);
        }

        file << std::setw(2) << document << "\n";
        if (!file)
        {
            throw std::runtime_error("Failed writing JSON file: " + filepath);
        }
    }

} // namespace capm
