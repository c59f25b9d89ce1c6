#pragma once

#include <string>
#include <vector>
#include "portsim/backtest/transaction_cost_model.hpp"

namespace portsim {
namespace backtest {

struct TradeRecord {
    int trade_id = 0;
    std::string date;
    std::string ticker;
    double shares = 0.0;        // signed, negative for sells
    double price = 0.0;
    double notional = 0.0;
    double commission = 0.0;
    double slippage = 0.0;
    double total_cost = 0.0;
    bool partial_fill = false;  // buy scaled down for lack of cash
};

enum class LogLevel { INFO, WARNING };

enum class LogKind {
    REBALANCE,
    STALE_PRICE,
    PARTIAL_FILL,
    OPTIMIZER_FALLBACK,
    NON_CONVERGENCE,
    INSUFFICIENT_HISTORY,
    INELIGIBLE
};

std::string to_string(LogLevel level);
std::string to_string(LogKind kind);

struct LogEntry {
    LogLevel level = LogLevel::INFO;
    std::string date;
    std::string symbol;
    LogKind kind = LogKind::REBALANCE;
    std::string message;
};

struct TradeSummary {
    int total_trades = 0;
    int buy_trades = 0;
    int sell_trades = 0;
    int partial_fills = 0;
    double total_notional = 0.0;
    double total_costs = 0.0;
    double avg_cost_per_trade = 0.0;
    int rebalance_count = 0;
    double turnover = 0.0;
};

/**
 * @brief Per-run record of fills and diagnostic events.
 *
 * Owned by a single Portfolio; not shared between threads. When verbose,
 * warnings are echoed to std::cerr as they are logged.
 */
class SimulationLog {
public:
    explicit SimulationLog(bool verbose = false) : verbose_(verbose) {}
    ~SimulationLog() = default;

    void log_trade(const TradeRecord& record);

    /// Count a rebalance event and its one-way turnover, sum|w_post - w_pre| / 2.
    void log_rebalance(const std::string& date, double turnover);

    void info(LogKind kind, const std::string& date, const std::string& symbol,
              const std::string& message);
    void warn(LogKind kind, const std::string& date, const std::string& symbol,
              const std::string& message);

    const std::vector<TradeRecord>& trades() const { return trades_; }
    const std::vector<LogEntry>& entries() const { return entries_; }
    std::vector<TradeRecord> trades_for_date(const std::string& date) const;
    std::vector<TradeRecord> trades_for_ticker(const std::string& ticker) const;
    std::vector<LogEntry> entries_of(LogKind kind) const;
    int count(LogKind kind) const;
    int num_warnings() const;
    int num_trades() const { return static_cast<int>(trades_.size()); }

    TradeSummary get_summary() const;

    void export_trades_to_csv(const std::string& filepath) const;
    void export_log_to_csv(const std::string& filepath) const;
    void print_summary() const;

    void set_verbose(bool verbose) { verbose_ = verbose; }
    void clear();

private:
    std::vector<TradeRecord> trades_;
    std::vector<LogEntry> entries_;
    int next_trade_id_ = 0;
    int rebalance_count_ = 0;
    double turnover_ = 0.0;
    bool verbose_;

    void append(LogLevel level, LogKind kind, const std::string& date,
                const std::string& symbol, const std::string& message);
};

} // namespace backtest
} // namespace portsim
