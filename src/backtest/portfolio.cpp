// SPDX-License-Identifier: MIT
// ============================================================================
// Implementation of Portfolio
// ============================================================================

#include "portsim/backtest/portfolio.hpp"
#include "portsim/core/dates.hpp"
#include "portsim/core/errors.hpp"
#include "portsim/data/data_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <iostream>
#include <limits>
#include <set>
#include <sstream>

namespace portsim {
namespace backtest {

namespace {

constexpr double kShareEpsilon = 1e-9;   // absorbs floating error in floor()
constexpr double kWeightSumTolerance = 1e-6;

std::string normalize(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (c == '_' || c == '-' || std::isspace(c)) continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string format_amount(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v;
    return ss.str();
}

} // namespace

std::string to_string(PortfolioState state) {
    switch (state) {
        case PortfolioState::UNINITIALIZED: return "UNINITIALIZED";
        case PortfolioState::RUNNING: return "RUNNING";
        case PortfolioState::COMPLETED: return "COMPLETED";
    }
    return "UNKNOWN";
}

// ============================================================================
// SimulationParams
// ============================================================================

EligibilityRule positive_momentum(int lookback) {
    if (lookback < 1) {
        throw std::invalid_argument("momentum lookback must be at least 1, got: " + std::to_string(lookback));
    }
    return [lookback](const MarketDataFeed& market_data, size_t date_idx, const std::string& symbol) {
        const auto& tickers = market_data.get_tickers();
        const auto col = static_cast<Eigen::Index>(
            std::distance(tickers.begin(), std::find(tickers.begin(), tickers.end(), symbol)));
        const Eigen::MatrixXd& closes = market_data.close_prices();
        if (col >= closes.cols()) return false;

        // last known close at or before row
        auto close_at = [&](Eigen::Index row) {
            for (; row >= 0; --row) {
                const double p = closes(row, col);
                if (std::isfinite(p) && p > 0.0) return p;
            }
            return std::numeric_limits<double>::quiet_NaN();
        };

        const auto now = static_cast<Eigen::Index>(date_idx);
        const double then = close_at(now - lookback);
        if (std::isnan(then)) return true;
        return close_at(now) > then;
    };
}

void SimulationParams::validate() const {
    if (!(initial_cash > 0.0) || !std::isfinite(initial_cash)) {
        throw ConfigurationError("initial_cash must be positive, got: " + std::to_string(initial_cash));
    }
    if (lookback_window < 2) {
        throw ConfigurationError("lookback_window must be at least 2, got: " + std::to_string(lookback_window));
    }
    if (min_history < 0) {
        throw ConfigurationError("min_history must be non-negative, got: " + std::to_string(min_history));
    }
    if (periods_per_year < 1) {
        throw ConfigurationError("periods_per_year must be at least 1, got: " + std::to_string(periods_per_year));
    }
    if (!std::isfinite(risk_free_rate)) {
        throw ConfigurationError("risk_free_rate must be finite");
    }
}

SimulationParams SimulationParams::from_config(const portsim::SimulationConfig& config) {
    SimulationParams p;
    p.initial_cash = config.initial_cash;
    p.rebalance = RebalanceConfig::from_string(config.rebalance_frequency);
    p.transaction_costs.commission_rate = config.transaction_cost_rate;
    p.transaction_costs.slippage_bps = config.slippage_bps;
    p.risk_free_rate = config.risk_free_rate;
    p.allow_short = config.allow_short;
    p.lookback_window = config.lookback_window;
    p.min_history = config.min_history;
    p.fallback = parse_fallback(config.fallback);
    p.cost_timing = parse_cost_timing(config.cost_timing);
    p.periods_per_year = config.periods_per_year;
    p.verbose = config.verbose;
    if (config.momentum_lookback > 0) {
        p.eligibility = positive_momentum(config.momentum_lookback);
    }
    p.validate();
    return p;
}

FallbackMode SimulationParams::parse_fallback(const std::string& s) {
    const std::string n = normalize(s);
    if (n == "equalweight" || n == "equal") return FallbackMode::EQUAL_WEIGHT;
    if (n == "none" || n == "abort") return FallbackMode::NONE;
    throw ConfigurationError("Invalid fallback mode: '" + s + "'. Valid options: equal_weight, none");
}

CostTiming SimulationParams::parse_cost_timing(const std::string& s) {
    const std::string n = normalize(s);
    if (n == "ontop") return CostTiming::ON_TOP;
    if (n == "included") return CostTiming::INCLUDED;
    throw ConfigurationError("Invalid cost timing: '" + s + "'. Valid options: on_top, included");
}

// ============================================================================
// SimulationResult
// ============================================================================

void SimulationResult::print_summary() const {
    std::cout << performance.summary();
    std::cout << "\nTrading:\n";
    std::cout << "  Rebalances:          " << rebalance_count << "\n";
    std::cout << "  Trades:              " << trade_summary.total_trades
              << " (" << trade_summary.buy_trades << " buys, "
              << trade_summary.sell_trades << " sells, "
              << trade_summary.partial_fills << " partial)\n";
    std::cout << "  Total costs:         " << format_amount(trade_summary.total_costs) << "\n";
    std::cout << "  Turnover:            " << trade_summary.turnover << "\n";
}

void SimulationResult::export_nav_to_csv(const std::string& filepath) const {
    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(filepath);
    if (!out)
        throw std::runtime_error("unable to open file for writing: " + filepath);

    out << "date,cash,positions_value,total_value,daily_return,cumulative_return,rebalanced\n";
    out << std::fixed << std::setprecision(8);
    for (const auto& s : history) {
        out << s.date << "," << s.cash << "," << s.positions_value << "," << s.total_value << ","
            << s.daily_return << "," << s.cumulative_return << "," << (s.rebalanced ? 1 : 0) << "\n";
    }
}

nlohmann::json SimulationResult::to_json() const {
    nlohmann::json j;
    j["policy"] = policy_name;
    j["performance"] = performance.to_json();
    j["rebalance_count"] = rebalance_count;
    j["final_weights"] = history.empty() ? nlohmann::json::object() : nlohmann::json(history.back().weights);
    j["trade_summary"] = {
        {"total_trades", trade_summary.total_trades},
        {"buy_trades", trade_summary.buy_trades},
        {"sell_trades", trade_summary.sell_trades},
        {"partial_fills", trade_summary.partial_fills},
        {"total_notional", trade_summary.total_notional},
        {"total_costs", trade_summary.total_costs},
        {"turnover", trade_summary.turnover}};
    j["warnings"] = static_cast<int>(std::count_if(log.begin(), log.end(), [](const LogEntry& e) {
        return e.level == LogLevel::WARNING;
    }));
    return j;
}

// ============================================================================
// Portfolio - lifecycle
// ============================================================================

Portfolio::Portfolio(std::shared_ptr<const policy::AllocationPolicy> policy,
                     const SimulationParams& params)
    : policy_(std::move(policy)),
      params_(params),
      cost_model_(params.transaction_costs),
      log_(params.verbose),
      cash_(params.initial_cash) {
    if (!policy_) {
        throw ConfigurationError("Portfolio requires an allocation policy");
    }
    params_.validate();
}

SimulationResult Portfolio::simulate(const MarketDataFeed& market_data,
                                     const std::string& start_date,
                                     const std::string& end_date) {
    return simulate(market_data, start_date, end_date, params_.rebalance.frequency);
}

SimulationResult Portfolio::simulate(const MarketDataFeed& market_data,
                                     const std::string& start_date,
                                     const std::string& end_date,
                                     RebalanceFrequency rebalance_frequency) {
    if (state_ != PortfolioState::UNINITIALIZED) {
        throw InvalidStateError("simulate() called on a " + to_string(state_) + " portfolio",
                                ErrorContext{"", "", policy_->get_name()});
    }
    const ErrorContext range_context{start_date, "", policy_->get_name()};
    if (!dates::is_valid(start_date) || !dates::is_valid(end_date)) {
        throw InvalidDateRangeError("dates must be YYYY-MM-DD, got '" + start_date + "' and '" + end_date + "'",
                                    range_context);
    }
    if (start_date >= end_date) {
        throw InvalidDateRangeError("start_date " + start_date + " must be before end_date " + end_date,
                                    range_context);
    }

    const auto& all_dates = market_data.get_dates();
    const auto& tickers = market_data.get_tickers();
    const Eigen::MatrixXd& closes = market_data.close_prices();
    if (tickers.empty()) {
        throw ConfigurationError("empty asset universe", range_context);
    }
    if (closes.rows() != static_cast<Eigen::Index>(all_dates.size()) ||
        closes.cols() != static_cast<Eigen::Index>(tickers.size())) {
        throw std::invalid_argument("market data price matrix does not match its dates and tickers");
    }

    auto first = std::lower_bound(all_dates.begin(), all_dates.end(), start_date);
    auto last = std::upper_bound(all_dates.begin(), all_dates.end(), end_date);
    if (first >= last) {
        throw InvalidDateRangeError("no market data between " + start_date + " and " + end_date, range_context);
    }
    const auto first_idx = static_cast<size_t>(std::distance(all_dates.begin(), first));
    const auto last_idx = static_cast<size_t>(std::distance(all_dates.begin(), last));

    const Eigen::MatrixXd window = closes.middleRows(static_cast<Eigen::Index>(first_idx),
                                                     static_cast<Eigen::Index>(last_idx - first_idx));
    if (window.array().isNaN().all()) {
        throw InvalidDateRangeError("no prices between " + start_date + " and " + end_date, range_context);
    }

    state_ = PortfolioState::RUNNING;
    RebalanceConfig schedule_config = params_.rebalance;
    schedule_config.frequency = rebalance_frequency;
    RebalanceScheduler scheduler(schedule_config);

    for (size_t idx = first_idx; idx < last_idx; ++idx) {
        current_date_ = all_dates[idx];
        update_positions_value(market_data, idx);

        bool rebalanced = false;
        if (scheduler.should_rebalance(current_date_) && execute_rebalance(market_data, idx)) {
            scheduler.record_rebalance(current_date_);
            rebalanced = true;
        }

        record_state(rebalanced);
    }

    SimulationResult result;
    result.policy_name = policy_->get_name();
    result.performance = calculate_performance();
    state_ = PortfolioState::COMPLETED;

    result.history = history_;
    result.trades = log_.trades();
    result.log = log_.entries();
    result.trade_summary = log_.get_summary();
    result.rebalance_count = scheduler.rebalance_count();
    return result;
}

// ============================================================================
// Portfolio - simulation steps
// ============================================================================

void Portfolio::update_positions_value(const MarketDataFeed& market_data, size_t date_idx) {
    stale_symbols_.clear();
    const auto& tickers = market_data.get_tickers();
    const Eigen::MatrixXd& closes = market_data.close_prices();

    for (size_t j = 0; j < tickers.size(); ++j) {
        const double price = closes(static_cast<Eigen::Index>(date_idx), static_cast<Eigen::Index>(j));
        if (std::isfinite(price) && price > 0.0) {
            last_prices_[tickers[j]] = price;
            continue;
        }
        auto known = last_prices_.find(tickers[j]);
        if (known != last_prices_.end()) {
            stale_symbols_.push_back(tickers[j]);
            log_.warn(LogKind::STALE_PRICE, current_date_, tickers[j],
                      "price missing, carrying forward " + format_amount(known->second));
        }
    }

    for (auto& [symbol, position] : positions_) {
        auto known = last_prices_.find(symbol);
        if (known != last_prices_.end()) {
            position.last_price = known->second;
        }
    }
}

bool Portfolio::execute_rebalance(const MarketDataFeed& market_data, size_t date_idx) {
    std::vector<std::string> symbols;
    for (const auto& ticker : market_data.get_tickers()) {
        if (last_prices_.count(ticker)) symbols.push_back(ticker);
    }
    if (symbols.empty()) {
        return false;  // nothing priced yet, retry on the next step
    }

    policy::AllocationResult target = target_allocation(market_data, date_idx, symbols);
    const std::map<std::string, double> pre_weights = current_weights();
    const double total = total_value();

    // Sells first so their proceeds fund the buys
    for (size_t i = 0; i < target.symbols.size(); ++i) {
        const std::string& symbol = target.symbols[i];
        sell_stock(symbol, last_prices_.at(symbol), target.weights[static_cast<Eigen::Index>(i)] * total);
    }
    for (size_t i = 0; i < target.symbols.size(); ++i) {
        const std::string& symbol = target.symbols[i];
        buy_stock(symbol, last_prices_.at(symbol), target.weights[static_cast<Eigen::Index>(i)] * total);
    }

    const std::map<std::string, double> post_weights = current_weights();
    std::set<std::string> keys;
    for (const auto& kv : pre_weights) keys.insert(kv.first);
    for (const auto& kv : post_weights) keys.insert(kv.first);
    double abs_sum = 0.0;
    for (const auto& key : keys) {
        auto pre = pre_weights.find(key);
        auto post = post_weights.find(key);
        abs_sum += std::abs((post == post_weights.end() ? 0.0 : post->second) -
                            (pre == pre_weights.end() ? 0.0 : pre->second));
    }
    log_.log_rebalance(current_date_, abs_sum / 2.0);
    return true;
}

policy::AllocationResult Portfolio::target_allocation(const MarketDataFeed& market_data,
                                                      size_t date_idx,
                                                      const std::vector<std::string>& symbols) {
    policy::ReturnsHistory history = trailing_returns(market_data, date_idx, symbols);

    if (params_.eligibility) {
        std::string excluded;
        for (const auto& symbol : symbols) {
            const bool admitted = params_.eligibility(market_data, date_idx, symbol);
            history.eligible.push_back(admitted);
            if (!admitted) excluded += (excluded.empty() ? "" : ", ") + symbol;
        }
        if (!excluded.empty()) {
            log_.info(LogKind::INELIGIBLE, current_date_, "", "not eligible this step: " + excluded);
        }
        if (history.num_eligible() == 0) {
            policy::AllocationResult cash_only = equal_weight_result(history, "no eligible symbols");
            cash_only.fallback_used = false;
            return cash_only;
        }
    }

    if (policy_->uses_history() && history.num_observations() < params_.min_history) {
        const std::string reason = std::to_string(history.num_observations()) + " return rows, " +
                                   std::to_string(params_.min_history) + " required; holding equal weights";
        log_.warn(LogKind::INSUFFICIENT_HISTORY, current_date_, "", reason);
        return equal_weight_result(history, reason);
    }

    // Bounds valid for the whole universe may not fit the symbols priced and eligible so far
    try {
        policy_->constraints().check_feasible(history.num_eligible());
    } catch (const ConfigurationError& e) {
        const std::string reason = e.detail() + " (" + std::to_string(history.num_eligible()) + " of " +
                                   std::to_string(market_data.get_tickers().size()) + " symbols usable)";
        if (params_.fallback == FallbackMode::NONE) {
            throw OptimizationError(reason, context());
        }
        log_.warn(LogKind::OPTIMIZER_FALLBACK, current_date_, "", reason + "; using capped equal weights");
        return equal_weight_result(history, reason);
    }

    Eigen::VectorXd current(static_cast<Eigen::Index>(symbols.size()));
    const auto weights_now = current_weights();
    for (size_t i = 0; i < symbols.size(); ++i) {
        auto it = weights_now.find(symbols[i]);
        current[static_cast<Eigen::Index>(i)] = it == weights_now.end() ? 0.0 : it->second;
    }

    policy::AllocationResult result;
    try {
        result = policy_->allocate(history, current);
        if (result.symbols.size() != symbols.size() ||
            result.weights.size() != static_cast<Eigen::Index>(symbols.size()) ||
            !result.weights.allFinite() ||
            std::abs(result.weights.sum() - 1.0) > kWeightSumTolerance) {
            throw OptimizationError("policy returned invalid target weights (sum " +
                                    std::to_string(result.weights.sum()) + ")");
        }
    } catch (const OptimizationError& e) {
        ErrorContext ctx = context(e.context().symbol);
        if (params_.fallback == FallbackMode::NONE) {
            throw OptimizationError(e.detail(), ctx);
        }
        log_.warn(LogKind::OPTIMIZER_FALLBACK, current_date_, ctx.symbol,
                  e.detail() + "; using equal weights");
        return equal_weight_result(history, e.detail());
    }

    if (!result.converged) {
        log_.warn(LogKind::NON_CONVERGENCE, current_date_, "",
                  "policy did not converge after " + std::to_string(result.iterations) +
                  " iterations, using last iterate: " + result.message);
    }
    if (result.fallback_used) {
        log_.warn(LogKind::OPTIMIZER_FALLBACK, current_date_, "", result.message);
    }
    return result;
}

policy::ReturnsHistory Portfolio::trailing_returns(const MarketDataFeed& market_data,
                                                   size_t date_idx,
                                                   const std::vector<std::string>& symbols) const {
    const auto& tickers = market_data.get_tickers();
    const Eigen::MatrixXd& closes = market_data.close_prices();

    std::vector<Eigen::Index> columns;
    columns.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        auto it = std::find(tickers.begin(), tickers.end(), symbol);
        columns.push_back(static_cast<Eigen::Index>(std::distance(tickers.begin(), it)));
    }

    const auto end_row = static_cast<Eigen::Index>(date_idx);
    const Eigen::Index start_row = std::max<Eigen::Index>(0, end_row - params_.lookback_window);
    const Eigen::Index num_rows = end_row - start_row + 1;
    const auto n = static_cast<Eigen::Index>(symbols.size());
    const double nan = std::numeric_limits<double>::quiet_NaN();

    // Forward-filled closes of the window
    Eigen::MatrixXd prices(num_rows, n);
    for (Eigen::Index c = 0; c < n; ++c) {
        double last_valid = nan;
        for (Eigen::Index r = 0; r < num_rows; ++r) {
            const double p = closes(start_row + r, columns[static_cast<size_t>(c)]);
            if (std::isfinite(p) && p > 0.0) last_valid = p;
            prices(r, c) = last_valid;
        }
    }

    // Keep only rows where every asset has a return
    std::vector<Eigen::Index> complete_rows;
    Eigen::MatrixXd returns(std::max<Eigen::Index>(0, num_rows - 1), n);
    for (Eigen::Index r = 1; r < num_rows; ++r) {
        Eigen::RowVectorXd row = (prices.row(r).array() / prices.row(r - 1).array() - 1.0).matrix();
        if (row.allFinite()) {
            returns.row(static_cast<Eigen::Index>(complete_rows.size())) = row;
            complete_rows.push_back(r);
        }
    }

    policy::ReturnsHistory history;
    history.symbols = symbols;
    history.returns = returns.topRows(static_cast<Eigen::Index>(complete_rows.size()));
    return history;
}

policy::AllocationResult Portfolio::equal_weight_result(const policy::ReturnsHistory& history,
                                                        const std::string& reason) const {
    policy::AllocationResult result;
    result.symbols = history.symbols;
    result.weights = Eigen::VectorXd::Zero(history.num_assets());

    const Eigen::Index eligible = history.num_eligible();
    if (eligible > 0) {
        // Never above max_weight; whatever the cap leaves over stays in cash
        const double weight = std::min(1.0 / static_cast<double>(eligible),
                                       policy_->constraints().upper_bound());
        for (size_t i = 0; i < history.symbols.size(); ++i) {
            if (history.is_eligible(i)) result.weights[static_cast<Eigen::Index>(i)] = weight;
        }
    }
    result.fallback_used = true;
    result.message = reason;
    return result;
}

void Portfolio::record_state(bool rebalanced) {
    StateSnapshot snap;
    snap.date = current_date_;
    snap.cash = cash_;
    snap.positions_value = positions_value();
    snap.total_value = snap.cash + snap.positions_value;
    if (snap.total_value != 0.0) {
        for (const auto& [symbol, position] : positions_) {
            snap.weights[symbol] = position.market_value() / snap.total_value;
        }
    }
    const double previous = history_.empty() ? params_.initial_cash : history_.back().total_value;
    snap.daily_return = previous != 0.0 ? snap.total_value / previous - 1.0 : 0.0;
    snap.cumulative_return = snap.total_value / params_.initial_cash - 1.0;
    snap.rebalanced = rebalanced;
    snap.stale_symbols = stale_symbols_;
    history_.push_back(std::move(snap));
}

analytics::PerformanceReport Portfolio::calculate_performance() const {
    analytics::PerformanceEvaluator evaluator(params_.risk_free_rate, params_.periods_per_year);
    return evaluator.evaluate_portfolio(history_, policy_->get_name());
}

// ============================================================================
// Portfolio - trading
// ============================================================================

double Portfolio::buy_stock(const std::string& symbol, double price, double target_value) {
    require_mutable("buy_stock");
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw std::invalid_argument("buy_stock: price for " + symbol + " must be positive, got " +
                                    std::to_string(price));
    }
    if (!std::isfinite(target_value)) {
        throw std::invalid_argument("buy_stock: target value for " + symbol + " must be finite");
    }

    const double held = held_quantity(symbol);
    const double rate = cost_model_.cost_rate();
    double shares = 0.0;
    if (params_.cost_timing == CostTiming::ON_TOP) {
        shares = std::floor(target_value / price + kShareEpsilon) - held;
    } else {
        shares = std::floor((target_value - held * price) / (price * (1.0 + rate)) + kShareEpsilon);
    }
    if (shares <= 0.0) return 0.0;

    TradeCost cost = cost_model_.calculate_cost(TradeOrder{symbol, shares, price});
    bool partial = false;
    if (shares * price + cost.total() > cash_) {
        double affordable = std::floor(cash_ / (price * (1.0 + rate)));
        while (affordable > 0.0 && affordable * price * (1.0 + rate) > cash_) {
            affordable -= 1.0;
        }
        log_.warn(LogKind::PARTIAL_FILL, current_date_, symbol,
                  "wanted " + std::to_string(static_cast<long long>(shares)) + " shares, cash " +
                  format_amount(cash_) + " covers " + std::to_string(static_cast<long long>(affordable)));
        if (affordable <= 0.0) return 0.0;
        shares = affordable;
        cost = cost_model_.calculate_cost(TradeOrder{symbol, shares, price});
        partial = true;
    }

    debit_cash(shares * price + cost.total(), symbol);

    Position& position = positions_[symbol];
    position.symbol = symbol;
    const double new_quantity = position.quantity + shares;
    if (position.quantity >= 0.0) {
        position.average_cost = (position.quantity * position.average_cost + shares * price) / new_quantity;
    } else if (new_quantity > 0.0) {
        position.average_cost = price;  // short covered and flipped long
    }
    position.quantity = new_quantity;
    position.last_price = price;
    if (std::abs(position.quantity) < kShareEpsilon) {
        positions_.erase(symbol);
    }

    record_fill(symbol, shares, price, cost, partial);
    return shares;
}

double Portfolio::sell_stock(const std::string& symbol, double price, double target_value) {
    require_mutable("sell_stock");
    if (!(price > 0.0) || !std::isfinite(price)) {
        throw std::invalid_argument("sell_stock: price for " + symbol + " must be positive, got " +
                                    std::to_string(price));
    }
    if (!std::isfinite(target_value)) {
        throw std::invalid_argument("sell_stock: target value for " + symbol + " must be finite");
    }

    const double held = held_quantity(symbol);
    double desired = target_value >= 0.0 ? std::floor(target_value / price + kShareEpsilon)
                                         : -std::floor(-target_value / price + kShareEpsilon);
    if (!params_.allow_short) {
        desired = std::max(desired, 0.0);
    }
    double shares = held - desired;
    if (!params_.allow_short) {
        shares = std::min(shares, held);  // never below a flat position
    }
    if (shares <= 0.0) return 0.0;

    const TradeCost cost = cost_model_.calculate_cost(TradeOrder{symbol, -shares, price});
    cash_ += shares * price;
    debit_cash(cost.total(), symbol);

    const double new_quantity = held - shares;
    if (std::abs(new_quantity) < kShareEpsilon) {
        positions_.erase(symbol);
    } else {
        Position& position = positions_[symbol];
        position.symbol = symbol;
        if (held <= 0.0) {
            const double short_before = -held;
            position.average_cost = (short_before * position.average_cost + shares * price) /
                                    (short_before + shares);
        } else if (new_quantity < 0.0) {
            position.average_cost = price;  // long sold through to short
        }
        position.quantity = new_quantity;
        position.last_price = price;
    }

    record_fill(symbol, -shares, price, cost, false);
    return shares;
}

void Portfolio::debit_cash(double amount, const std::string& symbol) {
    if (amount > cash_ + kShareEpsilon) {
        throw InsufficientCashError("debit of " + format_amount(amount) + " exceeds cash " +
                                        format_amount(cash_),
                                    amount, cash_, context(symbol));
    }
    cash_ = std::max(0.0, cash_ - amount);
}

void Portfolio::record_fill(const std::string& symbol, double shares, double price,
                            const TradeCost& cost, bool partial) {
    TradeRecord record;
    record.date = current_date_;
    record.ticker = symbol;
    record.shares = shares;
    record.price = price;
    record.notional = shares * price;
    record.commission = cost.commission;
    record.slippage = cost.slippage;
    record.total_cost = cost.total();
    record.partial_fill = partial;
    log_.log_trade(record);
}

// ============================================================================
// Portfolio - queries
// ============================================================================

double Portfolio::positions_value() const {
    double value = 0.0;
    for (const auto& kv : positions_) {
        value += kv.second.market_value();
    }
    return value;
}

double Portfolio::total_value() const {
    return cash_ + positions_value();
}

std::map<std::string, double> Portfolio::current_weights() const {
    std::map<std::string, double> weights;
    const double total = total_value();
    if (total == 0.0) return weights;
    for (const auto& [symbol, position] : positions_) {
        weights[symbol] = position.market_value() / total;
    }
    return weights;
}

bool Portfolio::has_position(const std::string& symbol) const {
    return positions_.count(symbol) > 0;
}

const Position& Portfolio::get_position(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    if (it == positions_.end()) {
        throw std::invalid_argument("no position in " + symbol);
    }
    return it->second;
}

double Portfolio::held_quantity(const std::string& symbol) const {
    auto it = positions_.find(symbol);
    return it == positions_.end() ? 0.0 : it->second.quantity;
}

void Portfolio::require_mutable(const std::string& operation) const {
    if (state_ == PortfolioState::COMPLETED) {
        throw InvalidStateError(operation + " called on a completed portfolio", context());
    }
}

ErrorContext Portfolio::context(const std::string& symbol) const {
    return ErrorContext{current_date_, symbol, policy_->get_name()};
}

} // namespace backtest
} // namespace portsim
