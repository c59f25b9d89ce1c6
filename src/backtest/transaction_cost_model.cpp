#include "portsim/backtest/transaction_cost_model.hpp"
#include "portsim/core/errors.hpp"

#include <sstream>
#include <stdexcept>

namespace portsim {
namespace backtest {

TransactionCostConfig TransactionCostConfig::default_config() {
    return TransactionCostConfig{};
}

TransactionCostConfig TransactionCostConfig::from_json(const nlohmann::json& j) {
    TransactionCostConfig cfg = default_config();
    if (j.is_object()) {
        try {
            cfg.commission_rate = j.value("commission_rate", cfg.commission_rate);
            cfg.commission_rate = j.value("transaction_cost_rate", cfg.commission_rate);
            cfg.slippage_bps = j.value("slippage_bps", cfg.slippage_bps);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigurationError(std::string("invalid transaction cost field: ") + e.what());
        }
    }
    return cfg;
}

TransactionCostModel::TransactionCostModel(const TransactionCostConfig& config)
    : config_(config) {
    validate_config();
}

TransactionCostModel::TransactionCostModel()
    : config_(TransactionCostConfig::default_config()) {
}

void TransactionCostModel::validate_config() const {
    if (!(config_.commission_rate >= 0.0)) {
        std::ostringstream ss; ss << config_.commission_rate;
        throw ConfigurationError("Expected non-negative value for parameter 'transaction_cost_rate', got: " + ss.str());
    }
    if (!(config_.slippage_bps >= 0.0)) {
        std::ostringstream ss; ss << config_.slippage_bps;
        throw ConfigurationError("Expected non-negative value for parameter 'slippage_bps', got: " + ss.str());
    }
}

TradeCost TransactionCostModel::calculate_cost(const TradeOrder& order) const {
    if (!(order.price > 0.0)) {
        std::ostringstream ss; ss << order.price;
        throw std::invalid_argument("Expected positive value for parameter 'price', got: " + ss.str());
    }
    double notional = order.notional();
    return TradeCost{commission_cost(notional), slippage_cost(notional)};
}

double TransactionCostModel::calculate_total_cost(const std::vector<TradeOrder>& orders) const {
    double sum = 0.0;
    for (const auto& o : orders) {
        sum += calculate_cost(o).total();
    }
    return sum;
}

double TransactionCostModel::cost_rate() const {
    return config_.commission_rate + config_.slippage_bps / 10000.0;
}

double TransactionCostModel::commission_cost(double notional) const {
    return std::abs(notional) * config_.commission_rate;
}

double TransactionCostModel::slippage_cost(double notional) const {
    return std::abs(notional) * (config_.slippage_bps / 10000.0);
}

} // namespace backtest
} // namespace portsim
