// SPDX-License-Identifier: MIT
#ifndef PORTSIM_BACKTEST_STATE_SNAPSHOT_HPP
#define PORTSIM_BACKTEST_STATE_SNAPSHOT_HPP

#include <map>
#include <string>
#include <vector>

namespace portsim {
namespace backtest {

/**
 * @struct StateSnapshot
 * @brief Immutable record of the portfolio at the close of one step
 *
 * cash + positions_value == total_value for every snapshot the engine writes.
 */
struct StateSnapshot {
    std::string date;                        ///< Step date (YYYY-MM-DD)
    double cash = 0.0;                       ///< Cash balance
    double positions_value = 0.0;            ///< Market value of all positions
    double total_value = 0.0;                ///< cash + positions_value
    std::map<std::string, double> weights;   ///< Position value / total value, held symbols only
    double daily_return = 0.0;               ///< Return since the previous step
    double cumulative_return = 0.0;          ///< Return since the initial endowment
    bool rebalanced = false;                 ///< A rebalance was executed on this step
    std::vector<std::string> stale_symbols;  ///< Symbols valued at a carried-forward price

    double weight_of(const std::string& symbol) const {
        auto it = weights.find(symbol);
        return it == weights.end() ? 0.0 : it->second;
    }
};

using StateHistory = std::vector<StateSnapshot>;

} // namespace backtest
} // namespace portsim

#endif // PORTSIM_BACKTEST_STATE_SNAPSHOT_HPP
