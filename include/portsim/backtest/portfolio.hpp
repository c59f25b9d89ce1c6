// SPDX-License-Identifier: MIT
#ifndef PORTSIM_BACKTEST_PORTFOLIO_HPP
#define PORTSIM_BACKTEST_PORTFOLIO_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "portsim/analytics/performance_evaluator.hpp"
#include "portsim/backtest/rebalance_scheduler.hpp"
#include "portsim/backtest/simulation_log.hpp"
#include "portsim/backtest/state_snapshot.hpp"
#include "portsim/backtest/transaction_cost_model.hpp"
#include "portsim/core/errors.hpp"
#include "portsim/data/market_data.hpp"
#include "portsim/policy/allocation_policy.hpp"

namespace portsim {

struct SimulationConfig;

namespace backtest {

/**
 * @struct Position
 * @brief One held asset
 */
struct Position {
    std::string symbol;         ///< Asset identifier
    double quantity = 0.0;      ///< Signed share count, negative only when shorting is allowed
    double average_cost = 0.0;  ///< Average entry price per share
    double last_price = 0.0;    ///< Latest known price (carried forward when stale)

    double market_value() const { return quantity * last_price; }
    double unrealized_pnl() const { return quantity * (last_price - average_cost); }
};

enum class PortfolioState { UNINITIALIZED, RUNNING, COMPLETED };

std::string to_string(PortfolioState state);

/// What to do when the policy raises OptimizationError at a rebalance step.
enum class FallbackMode {
    EQUAL_WEIGHT,  // log and hold equal weights for that step
    NONE           // abort the run with the error
};

/// Whether transaction costs are paid on top of the target value or out of it.
enum class CostTiming {
    ON_TOP,    // buy floor(target / price) shares, costs extra
    INCLUDED   // shares plus costs fit inside the target value
};

/// Whether symbol may be held after the rebalance at date_idx.
using EligibilityRule =
    std::function<bool(const MarketDataFeed& market_data, size_t date_idx, const std::string& symbol)>;

/**
 * @brief Admit a symbol when its close is above the close lookback rows earlier
 *
 * Missing closes are read as the last known one. A symbol without a close
 * lookback rows back is admitted.
 *
 * @throws std::invalid_argument if lookback < 1
 */
EligibilityRule positive_momentum(int lookback);

struct SimulationParams {
    double initial_cash = 100000.0;
    RebalanceConfig rebalance;
    TransactionCostConfig transaction_costs;
    double risk_free_rate = 0.02;
    bool allow_short = false;
    int lookback_window = 252;
    int min_history = 30;
    FallbackMode fallback = FallbackMode::EQUAL_WEIGHT;
    CostTiming cost_timing = CostTiming::ON_TOP;
    int periods_per_year = 252;
    bool verbose = false;
    EligibilityRule eligibility;  ///< Empty admits every priced symbol

    /// @throws ConfigurationError on invalid values
    void validate() const;

    static SimulationParams from_config(const portsim::SimulationConfig& config);
    static FallbackMode parse_fallback(const std::string& s);
    static CostTiming parse_cost_timing(const std::string& s);
};

/**
 * @struct SimulationResult
 * @brief Everything a completed run produced
 */
struct SimulationResult {
    std::string policy_name;
    analytics::PerformanceReport performance;
    StateHistory history;
    std::vector<TradeRecord> trades;
    std::vector<LogEntry> log;
    TradeSummary trade_summary;
    int rebalance_count = 0;

    void print_summary() const;

    /// date,cash,positions_value,total_value,daily_return,cumulative_return,rebalanced
    void export_nav_to_csv(const std::string& filepath) const;

    /// Performance report plus final weights and trade summary.
    nlohmann::json to_json() const;
};

/**
 * @class Portfolio
 * @brief Simulation engine: owns cash, positions and the snapshot history
 *
 * Lifecycle UNINITIALIZED -> RUNNING -> COMPLETED. One Portfolio serves
 * one simulate() call; after completion every mutating call throws
 * InvalidStateError. Separate instances share nothing mutable and may run
 * on separate threads, even with the same policy object.
 *
 * Usage:
 * @code
 *   auto policy = std::make_shared<policy::MinVariancePolicy>();
 *   Portfolio portfolio(policy, params);
 *   SimulationResult result = portfolio.simulate(data, "2021-01-01", "2021-12-31");
 * @endcode
 */
class Portfolio {
public:
    /// @throws ConfigurationError on a null policy or invalid params
    explicit Portfolio(std::shared_ptr<const policy::AllocationPolicy> policy,
                       const SimulationParams& params = SimulationParams());

    ~Portfolio() = default;

    /**
     * @brief Walk the feed from start_date to end_date (inclusive) once
     *
     * Data before start_date is used only as trailing history for the policy.
     *
     * @throws InvalidDateRangeError if start_date >= end_date or the window holds no data
     * @throws InvalidStateError if the portfolio already ran
     * @throws OptimizationError if the policy fails and no fallback is configured
     */
    SimulationResult simulate(const MarketDataFeed& market_data,
                              const std::string& start_date,
                              const std::string& end_date,
                              RebalanceFrequency rebalance_frequency);

    /// Same, with the frequency from SimulationParams.
    SimulationResult simulate(const MarketDataFeed& market_data,
                              const std::string& start_date,
                              const std::string& end_date);

    // -- Trading primitives

    /**
     * @brief Raise exposure in symbol toward target_value
     *
     * Buys floor(target_value / price) - held shares. When cash cannot cover
     * shares plus costs the order is scaled down and a PARTIAL_FILL warning
     * is logged instead of failing.
     *
     * @return Shares bought
     * @throws InvalidStateError after completion
     * @throws std::invalid_argument if price is not positive
     */
    double buy_stock(const std::string& symbol, double price, double target_value);

    /**
     * @brief Lower exposure in symbol toward target_value
     *
     * Without shorting the sale is clamped to the held quantity; the
     * position is removed when it reaches zero.
     *
     * @return Shares sold
     * @throws InvalidStateError after completion
     * @throws std::invalid_argument if price is not positive
     */
    double sell_stock(const std::string& symbol, double price, double target_value);

    // -- State queries
    PortfolioState state() const { return state_; }
    double cash() const { return cash_; }
    double initial_cash() const { return params_.initial_cash; }
    double positions_value() const;
    double total_value() const;
    std::map<std::string, double> current_weights() const;

    const std::map<std::string, Position>& positions() const { return positions_; }
    bool has_position(const std::string& symbol) const;

    /// @throws std::invalid_argument if symbol is not held
    const Position& get_position(const std::string& symbol) const;

    const StateHistory& history() const { return history_; }
    const SimulationLog& log() const { return log_; }
    const policy::AllocationPolicy& allocation_policy() const { return *policy_; }
    const SimulationParams& params() const { return params_; }

private:
    std::shared_ptr<const policy::AllocationPolicy> policy_;
    SimulationParams params_;
    TransactionCostModel cost_model_;
    SimulationLog log_;
    PortfolioState state_ = PortfolioState::UNINITIALIZED;

    double cash_;
    std::map<std::string, Position> positions_;
    std::map<std::string, double> last_prices_;  // latest known price per symbol
    std::vector<std::string> stale_symbols_;     // carried forward on the current step
    StateHistory history_;
    std::string current_date_;

    void update_positions_value(const MarketDataFeed& market_data, size_t date_idx);
    bool execute_rebalance(const MarketDataFeed& market_data, size_t date_idx);
    void record_state(bool rebalanced);
    analytics::PerformanceReport calculate_performance() const;

    policy::AllocationResult target_allocation(const MarketDataFeed& market_data,
                                               size_t date_idx,
                                               const std::vector<std::string>& symbols);
    policy::ReturnsHistory trailing_returns(const MarketDataFeed& market_data,
                                            size_t date_idx,
                                            const std::vector<std::string>& symbols) const;
    policy::AllocationResult equal_weight_result(const policy::ReturnsHistory& history,
                                                 const std::string& reason) const;

    void debit_cash(double amount, const std::string& symbol);
    void record_fill(const std::string& symbol, double shares, double price,
                     const TradeCost& cost, bool partial);
    void require_mutable(const std::string& operation) const;
    double held_quantity(const std::string& symbol) const;
    ErrorContext context(const std::string& symbol = "") const;
};

} // namespace backtest
} // namespace portsim

#endif // PORTSIM_BACKTEST_PORTFOLIO_HPP
