// transaction_cost_model.hpp
#pragma once

#include <cmath>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace portsim {
namespace backtest {

struct TradeOrder {
    std::string ticker;
    double shares{0.0};   // signed, negative for sells
    double price{0.0};
    double notional() const { return std::abs(shares * price); }
};

struct TradeCost {
    double commission{0.0};
    double slippage{0.0};
    double total() const { return commission + slippage; }
};

struct TransactionCostConfig {
    double commission_rate{0.0};  // fraction of notional
    double slippage_bps{0.0};

    static TransactionCostConfig from_json(const nlohmann::json& j);
    static TransactionCostConfig default_config();
};

/**
 * @brief Proportional trading costs: commission rate plus slippage in bps.
 */
class TransactionCostModel {
public:
    /// @throws ConfigurationError on negative rates
    explicit TransactionCostModel(const TransactionCostConfig& config);
    TransactionCostModel();
    ~TransactionCostModel() = default;

    /// @throws std::invalid_argument if the price is not positive
    TradeCost calculate_cost(const TradeOrder& order) const;
    double calculate_total_cost(const std::vector<TradeOrder>& orders) const;

    /// Combined cost per unit of notional.
    double cost_rate() const;

    const TransactionCostConfig& config() const { return config_; }

    double commission_cost(double notional) const;
    double slippage_cost(double notional) const;

private:
    TransactionCostConfig config_;
    void validate_config() const;
};

} // namespace backtest
} // namespace portsim
