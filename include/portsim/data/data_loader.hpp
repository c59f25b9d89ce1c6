/**
 * @file data_loader.hpp
 * @brief Data loading and parsing utilities
 *
 * Provides functionality to load market data from CSV files and
 * simulation configuration from JSON files.
 */

#ifndef PORTSIM_DATA_LOADER_HPP
#define PORTSIM_DATA_LOADER_HPP

#include "portsim/data/market_data.hpp"
#include "portsim/risk/risk_model_factory.hpp"
#include "portsim/policy/policy_factory.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace portsim {

/**
 * @struct SimulationConfig
 * @brief Complete configuration of one simulation run
 *
 * Keys are read from a flat JSON object; data keys may also be nested
 * under "data" and cost keys under "transaction_costs".
 */
struct SimulationConfig {
    // Data
    std::string data_file;                     ///< Path to price CSV
    std::string start_date;                    ///< First simulated date (inclusive)
    std::string end_date;                      ///< Last simulated date (inclusive)
    std::vector<std::string> universe;         ///< Tickers to load, all if empty

    // Run
    double initial_cash = 100000.0;
    std::string rebalance_frequency = "monthly";
    double transaction_cost_rate = 0.0;        ///< Commission as a fraction of notional
    double slippage_bps = 0.0;
    double risk_free_rate = 0.02;              ///< Annualised
    bool allow_short = false;
    int lookback_window = 252;                 ///< Trailing return rows passed to the policy
    int min_history = 30;                      ///< Fewer rows fall back to equal weight
    std::string fallback = "equal_weight";     ///< equal_weight | none
    std::string cost_timing = "on_top";        ///< on_top | included
    int periods_per_year = 252;
    int momentum_lookback = 0;                 ///< Hold only symbols up over this many rows, 0 = all
    bool verbose = false;

    risk::RiskModelConfig risk_model;
    policy::PolicyConfig policy;

    /**
     * @brief Parse and validate
     * @throws ConfigurationError on wrongly typed or invalid values
     */
    static SimulationConfig from_json(const nlohmann::json& j);

    /**
     * @throws ConfigurationError describing the first invalid value
     */
    void validate() const;

    nlohmann::json to_json() const;
};

/**
 * @class DataLoader
 * @brief Loads and parses market data from various sources
 *
 * Supports CSV files with standard formats:
 * - Wide: date, ticker1, ticker2, ... (close prices)
 * - Long: date, ticker, price
 * - Long OHLCV: date, ticker, open, high, low, close, volume
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load close prices from a wide CSV file
     *
     * Expected format:
     * date,AAPL,MSFT,JPM,...
     * 2020-01-01,150.0,200.0,120.0,...
     *
     * Empty cells are missing observations (NaN).
     *
     * @param filepath Path to CSV file
     * @param tickers Optional list of tickers to load (loads all if empty)
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_wide(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Load market data from a long CSV file
     *
     * Either three columns (date,ticker,price) or OHLCV columns located by
     * header name (date,ticker,open,high,low,close,volume).
     *
     * @throws std::runtime_error if file cannot be loaded
     */
    static MarketData load_csv_long(const std::string& filepath,
                                    const std::vector<std::string>& tickers = {});

    /**
     * @brief Auto-detect CSV format and load
     */
    static MarketData load_csv(const std::string& filepath,
                               const std::vector<std::string>& tickers = {});

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @throws std::runtime_error if file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @throws std::runtime_error if the file cannot be read
     * @throws ConfigurationError if its content is invalid
     */
    static SimulationConfig load_config(const std::string& config_path);

    // ========================================================================
    // Data Generation (for testing)
    // ========================================================================

    /**
     * @brief Generate geometric Brownian motion prices on weekdays
     * @param tickers List of ticker symbols
     * @param num_days Number of trading days
     * @param start_date First date, moved forward to a weekday
     * @param volatility Daily volatility (default 0.02)
     * @param drift Daily drift (default 0.0005)
     * @param seed Random seed; equal seeds give equal data
     */
    static MarketData generate_synthetic_data(
        const std::vector<std::string>& tickers,
        size_t num_days,
        const std::string& start_date = "2020-01-01",
        double volatility = 0.02,
        double drift = 0.0005,
        std::uint32_t seed = 42
    );

    /**
     * @brief Save close prices to CSV (wide format)
     */
    static void save_csv_wide(const MarketData& data, const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);

    /**
     * @return Parsed value, or NaN for empty / non-numeric fields
     */
    static double safe_stod(const std::string& str);
};

} // namespace portsim

#endif // PORTSIM_DATA_LOADER_HPP
