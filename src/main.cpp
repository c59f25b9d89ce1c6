/**
 * @file main.cpp
 * @brief Command-line entry point for the portfolio simulator
 *
 * Loads a configuration and a price file, runs one allocation policy (or
 * every policy with --compare) through the simulation engine and writes
 * NAV, trade and report files.
 */

#include "portsim/analytics/performance_evaluator.hpp"
#include "portsim/backtest/portfolio.hpp"
#include "portsim/core/errors.hpp"
#include "portsim/data/data_loader.hpp"
#include "portsim/data/market_data.hpp"
#include "portsim/policy/policy_factory.hpp"
#include "portsim/risk/risk_model_factory.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace portsim;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Portfolio Simulator v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --data PATH           Price CSV, overrides data_file from the config\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --compare             Run every allocation policy and rank them\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/simulation.json --verbose\n"
              << "  " << program_name << " --config config/simulation.json --data prices.csv --compare\n"
              << std::endl;
}

void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       Portfolio Simulator v1.0.0                              \n"
              << "       Allocation policy backtesting in C++17                  \n"
              << "================================================================\n"
              << std::endl;
}

struct CommandLineArgs
{
    std::string config_path;
    std::string data_path;
    std::string output_dir = "results";
    bool compare = false;
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
            else if (arg == "--data" && i + 1 < argc)
            {
                args.data_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--compare")
            {
                args.compare = true;
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
 * @brief Run one policy on its own Portfolio
 */
backtest::SimulationResult run_policy(const SimulationConfig &config,
                                      const policy::PolicyConfig &policy_config,
                                      std::shared_ptr<const risk::RiskModel> risk_model,
                                      const MarketData &data)
{
    std::shared_ptr<const policy::AllocationPolicy> policy =
        policy::PolicyFactory::create(policy_config, std::move(risk_model));
    backtest::Portfolio portfolio(policy, backtest::SimulationParams::from_config(config));
    return portfolio.simulate(data, config.start_date, config.end_date);
}

void write_outputs(const backtest::SimulationResult &result, const std::string &output_dir)
{
    const std::string prefix = output_dir + "/" + result.policy_name;
    result.export_nav_to_csv(prefix + "_nav.csv");

    backtest::SimulationLog log;
    for (const auto &trade : result.trades)
    {
        log.log_trade(trade);
    }
    log.export_trades_to_csv(prefix + "_trades.csv");

    std::ofstream report(prefix + "_report.json");
    if (!report)
    {
        throw std::runtime_error("Could not open file for writing: " + prefix + "_report.json");
    }
    report << result.to_json().dump(2) << "\n";
}

int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        if (!args.data_path.empty())
        {
            config.data_file = args.data_path;
        }
        config.verbose = config.verbose || args.verbose;
        if (config.data_file.empty())
        {
            throw ConfigurationError("no price file: set data_file in the config or pass --data");
        }

        if (config.verbose)
        {
            std::cout << "  - Policy: " << config.policy.type << "\n"
                      << "  - Risk model: " << config.risk_model.type << "\n"
                      << "  - Rebalance: " << config.rebalance_frequency << "\n"
                      << "  - Initial cash: " << std::fixed << std::setprecision(2)
                      << config.initial_cash << "\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/4] Loading market data..." << std::endl;

        auto data = DataLoader::load_csv(config.data_file, config.universe);
        if (config.start_date.empty())
        {
            config.start_date = data.get_dates().front();
        }
        if (config.end_date.empty())
        {
            config.end_date = data.get_dates().back();
        }

        std::cout << "  - Loaded " << data.num_dates() << " dates, "
                  << data.num_assets() << " assets" << std::endl;
        if (config.verbose)
        {
            data.print_summary();
        }

        std::shared_ptr<const risk::RiskModel> risk_model = risk::RiskModelFactory::create(config.risk_model);
        std::filesystem::create_directories(args.output_dir);

        // ====================================================================
        // 3. Simulate
        // ====================================================================
        if (!args.compare)
        {
            std::cout << "[3/4] Simulating " << config.policy.type << " from "
                      << config.start_date << " to " << config.end_date << "..." << std::endl;

            auto result = run_policy(config, config.policy, risk_model, data);
            result.print_summary();

            std::cout << "[4/4] Writing results to " << args.output_dir << "/" << std::endl;
            write_outputs(result, args.output_dir);
        }
        else
        {
            std::cout << "[3/4] Simulating every policy from "
                      << config.start_date << " to " << config.end_date << "..." << std::endl;

            // One Portfolio per task; the data and risk model are read-only
            std::map<std::string, std::future<backtest::SimulationResult>> runs;
            for (const auto &type : policy::PolicyFactory::get_supported_types())
            {
                policy::PolicyConfig policy_config = config.policy;
                policy_config.type = type;
                runs.emplace(type, std::async(std::launch::async, run_policy,
                                              std::cref(config), policy_config, risk_model, std::cref(data)));
            }

            std::map<std::string, backtest::StateHistory> histories;
            std::vector<backtest::SimulationResult> results;
            int failures = 0;
            for (auto &[type, future] : runs)
            {
                try
                {
                    results.push_back(future.get());
                    histories[results.back().policy_name] = results.back().history;
                }
                catch (const SimulationError &e)
                {
                    ++failures;
                    std::cerr << "  - " << type << " failed: " << e.what() << "\n";
                }
            }
            if (results.empty())
            {
                throw std::runtime_error("every policy failed");
            }

            analytics::PerformanceEvaluator evaluator(config.risk_free_rate, config.periods_per_year);
            auto ranking = evaluator.compare_portfolio_performance(histories);
            std::cout << "\n" << analytics::PerformanceEvaluator::format_comparison(ranking);

            std::cout << "[4/4] Writing results to " << args.output_dir << "/" << std::endl;
            nlohmann::json table = nlohmann::json::array();
            for (const auto &row : ranking)
            {
                nlohmann::json entry = row.report.to_json();
                entry["rank"] = row.rank;
                table.push_back(entry);
            }
            std::ofstream out(args.output_dir + "/comparison.json");
            if (!out)
            {
                throw std::runtime_error("Could not open file for writing: " + args.output_dir + "/comparison.json");
            }
            out << table.dump(2) << "\n";
            for (const auto &result : results)
            {
                write_outputs(result, args.output_dir);
            }
            if (failures > 0)
            {
                std::cerr << failures << " policies failed, see messages above\n";
            }
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Simulation completed in " << duration << " ms\n";
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

int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();
    return run(args);
}
