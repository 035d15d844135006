/**
 * @file main.cpp
 * @brief Main entry point for the CAPM rebalancer
 *
 * Command-line application that loads a portfolio configuration, reports
 * its current CAPM metrics, rebalances it under a fixed portfolio value and
 * reports the result.
 */

#include "data/portfolio_loader.hpp"
#include "analytics/portfolio_metrics.hpp"
#include "optimizer/rebalancer.hpp"
#include "core/errors.hpp"
#include <iostream>
#include <string>
#include <exception>
#include <iomanip>
#include <chrono>

using namespace capm;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "CAPM Rebalancer v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --objective NAME      max_sharpe or min_beta (overrides config)\n"
              << "  --solver NAME         simplex or osqp (overrides config)\n"
              << "  --output PATH         Write rebalanced portfolio and metrics as JSON\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/portfolio_config.json --verbose\n"
              << "  " << program_name << " --config data/config/portfolio_config.json --objective min_beta\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       CAPM Rebalancer v1.0.0                                  \n"
              << "       Value-preserving LP rebalancing                         \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string objective;
    std::string solver;
    std::string output_path;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--objective" && i + 1 < argc)
            {
                args.objective = argv[++i];
            }
            else if (arg == "--solver" && i + 1 < argc)
            {
                args.solver = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Print holdings table
 */
void print_holdings(const std::string &title, const Portfolio &equities)
{
    std::cout << "\n"
              << title << "\n";
    std::cout << std::string(60, '-') << "\n";
    std::cout << "  " << std::setw(8) << std::left << "Ticker" << std::right
              << std::setw(8) << "Beta"
              << std::setw(10) << "Return"
              << std::setw(10) << "Qty"
              << std::setw(12) << "Avg Price" << "\n";

    for (size_t i = 0; i < equities.size(); ++i)
    {
        const Equity &equity = equities[i];
        std::cout << "  " << std::setw(8) << std::left << equity.label(i) << std::right
                  << std::fixed << std::setprecision(2)
                  << std::setw(8) << equity.beta();

        if (equity.has_expected_return())
        {
            std::cout << std::setw(9) << *equity.expected_return() * 100 << "%";
        }
        else
        {
            std::cout << std::setw(10) << "n/a";
        }

        std::cout << std::setw(10) << std::setprecision(0) << equity.qty()
                  << std::setw(12) << std::setprecision(2) << equity.avg_price() << "\n";
    }
    std::cout << std::string(60, '-') << "\n";
}

/**
 * @brief Print metrics, or the reason they are unavailable
 */
void print_metrics(const std::string &title, const Portfolio &equities, const MarketParameters &market)
{
    std::cout << "\n"
              << title << "\n";

    try
    {
        auto metrics = analytics::compute_portfolio_metrics(equities, market);
        metrics.print_summary();
    }
    catch (const DomainError &e)
    {
        std::cout << "  Metrics unavailable: " << e.what() << "\n";
    }
    catch (const ValidationError &e)
    {
        std::cout << "  Metrics unavailable: " << e.what() << "\n";
    }
}

/**
 * @brief Metrics as JSON, null when they are undefined for these holdings
 */
nlohmann::json metrics_json(const Portfolio &equities, const MarketParameters &market)
{
    try
    {
        return analytics::compute_portfolio_metrics(equities, market).to_json();
    }
    catch (const DomainError &)
    {
        return nullptr;
    }
    catch (const ValidationError &)
    {
        return nullptr;
    }
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = PortfolioLoader::load_config(args.config_path);

        if (!args.objective.empty())
        {
            config.optimizer.objective = args.objective;
        }
        if (!args.solver.empty())
        {
            config.optimizer.solver = args.solver;
        }
        if (args.verbose)
        {
            config.optimizer.verbose = true;
        }

        const auto objective = config.optimizer.objective_type();

        std::cout << "  - Positions: " << config.portfolio.size() << "\n";
        if (args.verbose)
        {
            std::cout << "  - Benchmark return: " << config.market.benchmark_return << "\n"
                      << "  - Risk-free rate: " << config.market.risk_free_rate << "\n"
                      << "  - Objective: " << optimizer::to_string(objective) << "\n"
                      << "  - Solver: " << config.optimizer.solver << "\n";
        }

        // ====================================================================
        // 2. Current Portfolio
        // ====================================================================
        std::cout << "[2/4] Evaluating current portfolio..." << std::endl;

        print_holdings("CURRENT HOLDINGS", config.portfolio);
        print_metrics("CURRENT METRICS", config.portfolio, config.market);

        // ====================================================================
        // 3. Rebalance
        // ====================================================================
        std::cout << "\n[3/4] Rebalancing (" << optimizer::to_string(objective) << ")..." << std::endl;

        optimizer::Rebalancer rebalancer(optimizer::LinearSolverFactory::create(
            config.optimizer.solver, config.optimizer.solver_options()));

        auto result = rebalancer.rebalance(config.portfolio, objective, config.market);

        if (args.verbose)
        {
            result.print_summary();
        }

        for (const auto &equity : result.equities)
        {
            if (objective == optimizer::ObjectiveType::MAX_SHARPE)
            {
                std::cout << "  Equity with Return " << std::fixed << std::setprecision(2)
                          << *equity.expected_return();
            }
            else
            {
                std::cout << "  Equity with Beta " << std::fixed << std::setprecision(2)
                          << equity.beta();
            }
            std::cout << " has an adjusted quantity of " << std::setprecision(0)
                      << equity.qty() << "\n";
        }

        print_holdings("REBALANCED HOLDINGS", result.equities);
        print_metrics("REBALANCED METRICS", result.equities, config.market);

        // ====================================================================
        // 4. Export (Optional)
        // ====================================================================
        if (!args.output_path.empty())
        {
            std::cout << "\n[4/4] Exporting results..." << std::endl;

            nlohmann::json document;
            document["market"] = config.market.to_json();
            document["optimizer"] = config.optimizer.to_json();
            document["original_portfolio"] = PortfolioLoader::portfolio_to_json(config.portfolio);
            document["rebalance"] = result.to_json();
            document["metrics_before"] = metrics_json(config.portfolio, config.market);
            document["metrics_after"] = metrics_json(result.equities, config.market);

            PortfolioLoader::save_json(document, args.output_path);
            std::cout << "  Results exported to: " << args.output_path << "\n";
        }
        else
        {
            std::cout << "\n[4/4] Skipping export (use --output to enable)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Rebalancing completed successfully in "
                  << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    // Parse command-line arguments
    auto args = CommandLineArgs::parse(argc, argv);

    // Show help if requested or invalid args
    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
