/**
 * @file portfolio_loader.hpp
 * @brief Configuration and portfolio loading
 * 
 * Reads a rebalancing run (market parameters, optimizer settings, holdings)
 * from a JSON file and writes result documents back out.
 *
 * Expected format:
 * {
 *   "market":    { "benchmark_return": 0.07, "risk_free_rate": 0.02 },
 *   "optimizer": { "objective": "max_sharpe", "solver": "simplex" },
 *   "portfolio": [ { "ticker": "AAA", "beta": 1.2, "qty": 100,
 *                    "avg_price": 50, "return": 0.08 } ]
 * }
 */

#ifndef CAPM_DATA_PORTFOLIO_LOADER_HPP
#define CAPM_DATA_PORTFOLIO_LOADER_HPP

#include "core/equity.hpp"
#include "optimizer/linear_solver.hpp"
#include "optimizer/objective_formulator.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace capm {

/**
 * @struct OptimizerConfig
 * @brief Configuration for optimizer parameters
 */
struct OptimizerConfig {
    std::string objective = "max_sharpe";      ///< max_sharpe or min_beta
    std::string solver = "simplex";            ///< simplex or osqp
    int max_iterations = 10000;                ///< Solver iteration cap
    double tolerance = 1e-9;                   ///< Solver tolerance
    bool verbose = false;                      ///< Solver progress output
    
    static OptimizerConfig from_json(const nlohmann::json& j);

    /**
     * @brief Parsed objective
     * @throws std::invalid_argument if the name is unknown
     */
    optimizer::ObjectiveType objective_type() const;

    optimizer::SolverOptions solver_options() const;

    nlohmann::json to_json() const;
};

/**
 * @struct RebalanceConfig
 * @brief Complete run configuration
 */
struct RebalanceConfig {
    MarketParameters market;
    OptimizerConfig optimizer;
    Portfolio portfolio;
    
    /**
     * @brief Build from a parsed JSON document
     * @throws ValidationError if the portfolio section is missing or invalid
     */
    static RebalanceConfig from_json(const nlohmann::json& j);
};

/**
 * @class PortfolioLoader
 * @brief Loads run configuration and writes JSON reports
 */
class PortfolioLoader {
public:
    PortfolioLoader() = default;
    ~PortfolioLoader() = default;
    
    /**
     * @brief Load JSON file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);
    
    /**
     * @brief Load complete run configuration
     * @param config_path Path to config JSON file
     * @return RebalanceConfig struct
     */
    static RebalanceConfig load_config(const std::string& config_path);

    /**
     * @brief Parse a JSON array of positions
     * @throws ValidationError if not a non-empty array of valid positions
     */
    static Portfolio parse_portfolio(const nlohmann::json& j);

    /**
     * @brief Serialize positions as a JSON array
     */
    static nlohmann::json portfolio_to_json(const Portfolio& equities);
    
    /**
     * @brief Write JSON document (pretty-printed)
     * @param document Content to write
     * @param filepath Output file path
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_json(const nlohmann::json& document, const std::string& filepath);
};

} // namespace capm

#endif // CAPM_DATA_PORTFOLIO_LOADER_HPP
