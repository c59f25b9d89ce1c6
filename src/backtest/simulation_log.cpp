/**
 * @file simulation_log.cpp
 * @brief Implementation of SimulationLog
 */

#include "portsim/backtest/simulation_log.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace portsim {
namespace backtest {

std::string to_string(LogLevel level)
{
    return level == LogLevel::WARNING ? "WARNING" : "INFO";
}

std::string to_string(LogKind kind)
{
    switch (kind)
    {
    case LogKind::REBALANCE: return "REBALANCE";
    case LogKind::STALE_PRICE: return "STALE_PRICE";
    case LogKind::PARTIAL_FILL: return "PARTIAL_FILL";
    case LogKind::OPTIMIZER_FALLBACK: return "OPTIMIZER_FALLBACK";
    case LogKind::NON_CONVERGENCE: return "NON_CONVERGENCE";
    case LogKind::INSUFFICIENT_HISTORY: return "INSUFFICIENT_HISTORY";
    case LogKind::INELIGIBLE: return "INELIGIBLE";
    }
    return "UNKNOWN";
}

static void open_for_writing(std::ofstream &file, const std::string &filepath)
{
    std::filesystem::path path(filepath);
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path());
    }
    file.open(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }
}

// Quote a CSV field when it contains a separator or quote.
static std::string csv_field(const std::string &s)
{
    if (s.find_first_of(",\"\n") == std::string::npos)
        return s;
    std::string out = "\"";
    for (char c : s)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void SimulationLog::log_trade(const TradeRecord &record)
{
    TradeRecord r = record;
    r.trade_id = next_trade_id_++;
    trades_.push_back(r);
}

void SimulationLog::log_rebalance(const std::string &date, double turnover)
{
    ++rebalance_count_;
    turnover_ += turnover;
    info(LogKind::REBALANCE, date, "", "rebalanced, turnover " + std::to_string(turnover));
}

void SimulationLog::info(LogKind kind, const std::string &date, const std::string &symbol,
                         const std::string &message)
{
    append(LogLevel::INFO, kind, date, symbol, message);
}

void SimulationLog::warn(LogKind kind, const std::string &date, const std::string &symbol,
                         const std::string &message)
{
    append(LogLevel::WARNING, kind, date, symbol, message);
}

void SimulationLog::append(LogLevel level, LogKind kind, const std::string &date,
                           const std::string &symbol, const std::string &message)
{
    entries_.push_back(LogEntry{level, date, symbol, kind, message});
    if (verbose_ && level == LogLevel::WARNING)
    {
        std::cerr << "[" << to_string(level) << "] " << date << " " << to_string(kind);
        if (!symbol.empty())
            std::cerr << " " << symbol;
        std::cerr << ": " << message << "\n";
    }
}

std::vector<TradeRecord> SimulationLog::trades_for_date(const std::string &date) const
{
    std::vector<TradeRecord> out;
    std::copy_if(trades_.begin(), trades_.end(), std::back_inserter(out),
                 [&](const TradeRecord &t) { return t.date == date; });
    return out;
}

std::vector<TradeRecord> SimulationLog::trades_for_ticker(const std::string &ticker) const
{
    std::vector<TradeRecord> out;
    std::copy_if(trades_.begin(), trades_.end(), std::back_inserter(out),
                 [&](const TradeRecord &t) { return t.ticker == ticker; });
    return out;
}

std::vector<LogEntry> SimulationLog::entries_of(LogKind kind) const
{
    std::vector<LogEntry> out;
    std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(out),
                 [kind](const LogEntry &e) { return e.kind == kind; });
    return out;
}

int SimulationLog::count(LogKind kind) const
{
    return static_cast<int>(std::count_if(entries_.begin(), entries_.end(),
                                          [kind](const LogEntry &e) { return e.kind == kind; }));
}

int SimulationLog::num_warnings() const
{
    return static_cast<int>(std::count_if(entries_.begin(), entries_.end(),
                                          [](const LogEntry &e) { return e.level == LogLevel::WARNING; }));
}

TradeSummary SimulationLog::get_summary() const
{
    TradeSummary s;
    s.total_trades = static_cast<int>(trades_.size());
    s.rebalance_count = rebalance_count_;
    s.turnover = turnover_;

    for (const auto &t : trades_)
    {
        if (t.shares > 0)
            ++s.buy_trades;
        else if (t.shares < 0)
            ++s.sell_trades;
        if (t.partial_fill)
            ++s.partial_fills;

        s.total_notional += std::abs(t.notional);
        s.total_costs += t.total_cost;
    }

    if (s.total_trades > 0)
        s.avg_cost_per_trade = s.total_costs / s.total_trades;

    return s;
}

void SimulationLog::export_trades_to_csv(const std::string &filepath) const
{
    std::ofstream file;
    open_for_writing(file, filepath);

    file << "trade_id,date,ticker,shares,price,notional,commission,slippage,total_cost,partial_fill\n";
    file << std::fixed << std::setprecision(8);

    for (const auto &t : trades_)
    {
        file << t.trade_id << ","
             << t.date << ","
             << csv_field(t.ticker) << ","
             << t.shares << ","
             << t.price << ","
             << t.notional << ","
             << t.commission << ","
             << t.slippage << ","
             << t.total_cost << ","
             << (t.partial_fill ? 1 : 0) << "\n";
    }
}

void SimulationLog::export_log_to_csv(const std::string &filepath) const
{
    std::ofstream file;
    open_for_writing(file, filepath);

    file << "level,date,kind,symbol,message\n";
    for (const auto &e : entries_)
    {
        file << to_string(e.level) << ","
             << e.date << ","
             << to_string(e.kind) << ","
             << csv_field(e.symbol) << ","
             << csv_field(e.message) << "\n";
    }
}

void SimulationLog::print_summary() const
{
    auto s = get_summary();
    std::cout << "\n=== Trade Log Summary ===\n";
    std::cout << "Total trades: " << s.total_trades << "\n";
    std::cout << "Buys: " << s.buy_trades << "  Sells: " << s.sell_trades
              << "  Partial fills: " << s.partial_fills << "\n";
    std::cout << "Total notional: " << s.total_notional << "\n";
    std::cout << "Total costs: " << s.total_costs << "\n";
    std::cout << "Average cost/trade: " << s.avg_cost_per_trade << "\n";
    std::cout << "Rebalance events: " << s.rebalance_count << "\n";
    std::cout << "Turnover: " << s.turnover << "\n";
    std::cout << "Warnings: " << num_warnings() << "\n";
    std::cout << "==========================\n";
}

void SimulationLog::clear()
{
    trades_.clear();
    entries_.clear();
    next_trade_id_ = 0;
    rebalance_count_ = 0;
    turnover_ = 0.0;
}

} // namespace backtest
} // namespace portsim
