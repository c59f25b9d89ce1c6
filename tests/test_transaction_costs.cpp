// Unit tests for TransactionCostModel

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "portsim/backtest/transaction_cost_model.hpp"
#include "portsim/core/errors.hpp"

using namespace portsim::backtest;
using Catch::Matchers::WithinAbs;

TEST_CASE("TransactionCostModel construction", "[TransactionCostModel]") {
    SECTION("Default config") {
        TransactionCostModel m;
        REQUIRE(m.config().commission_rate == 0.0);
        REQUIRE(m.config().slippage_bps == 0.0);
        REQUIRE(m.cost_rate() == 0.0);
    }

    SECTION("Custom config") {
        TransactionCostConfig cfg;
        cfg.commission_rate = 0.001;
        cfg.slippage_bps = 5.0;
        TransactionCostModel m(cfg);
        REQUIRE(m.config().commission_rate == 0.001);
        REQUIRE_THAT(m.cost_rate(), WithinAbs(0.0015, 1e-15));
    }

    SECTION("Error: negative commission rate") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.commission_rate = -0.1;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), portsim::ConfigurationError);
    }

    SECTION("Error: negative slippage") {
        TransactionCostConfig cfg = TransactionCostConfig::default_config();
        cfg.slippage_bps = -1.0;
        REQUIRE_THROWS_AS(TransactionCostModel(cfg), portsim::ConfigurationError);
    }
}

TEST_CASE("TransactionCostConfig from json", "[TransactionCostModel][Config]") {
    SECTION("Happy path: both field names") {
        auto a = TransactionCostConfig::from_json(nlohmann::json{{"commission_rate", 0.002}, {"slippage_bps", 3.0}});
        REQUIRE(a.commission_rate == 0.002);
        REQUIRE(a.slippage_bps == 3.0);

        auto b = TransactionCostConfig::from_json(nlohmann::json{{"transaction_cost_rate", 0.004}});
        REQUIRE(b.commission_rate == 0.004);
    }

    SECTION("Error: wrong field type") {
        REQUIRE_THROWS_AS(TransactionCostConfig::from_json(nlohmann::json{{"slippage_bps", "five"}}),
                          portsim::ConfigurationError);
    }
}

TEST_CASE("Commission calculation", "[TransactionCostModel]") {
    TransactionCostConfig cfg = TransactionCostConfig::default_config();
    cfg.commission_rate = 0.001; // 10 bps
    TransactionCostModel m(cfg);

    TradeOrder buy{"ABC", 100.0, 100.0}; // $10,000
    TradeCost c = m.calculate_cost(buy);
    REQUIRE_THAT(c.commission, WithinAbs(10000.0 * 0.001, 1e-12));

    TradeOrder zero{"ABC", 0.0, 100.0};
    REQUIRE_THAT(m.calculate_cost(zero).commission, WithinAbs(0.0, 1e-12));

    TradeOrder sell{"ABC", -100.0, 100.0};
    REQUIRE_THAT(m.calculate_cost(sell).commission, WithinAbs(c.commission, 1e-12));

    TradeOrder bad{"ABC", 10.0, 0.0};
    REQUIRE_THROWS_AS(m.calculate_cost(bad), std::invalid_argument);
}

TEST_CASE("Slippage calculation", "[TransactionCostModel]") {
    TransactionCostConfig cfg = TransactionCostConfig::default_config();
    cfg.slippage_bps = 5.0; // 5 bps
    TransactionCostModel m(cfg);

    TradeOrder o{"XYZ", 100.0, 100.0}; // $10,000
    TradeCost tc = m.calculate_cost(o);
    REQUIRE_THAT(tc.slippage, WithinAbs(10000.0 * (5.0 / 10000.0), 1e-12));
    REQUIRE_THAT(tc.total(), WithinAbs(tc.slippage, 1e-12));

    cfg.slippage_bps = 0.0;
    TransactionCostModel m2(cfg);
    REQUIRE_THAT(m2.calculate_cost(o).slippage, WithinAbs(0.0, 1e-12));
}

TEST_CASE("Total cost calculation", "[TransactionCostModel]") {
    TransactionCostConfig cfg;
    cfg.commission_rate = 0.001;
    cfg.slippage_bps = 5.0;
    TransactionCostModel m(cfg);

    std::vector<TradeOrder> orders{
        {"A", 100.0, 100.0},
        {"B", -50.0, 200.0}
    };
    double sum_components = 0.0;
    for (const auto& o : orders) sum_components += m.calculate_cost(o).total();
    REQUIRE_THAT(m.calculate_total_cost(orders), WithinAbs(sum_components, 1e-12));
    REQUIRE_THAT(sum_components, WithinAbs(20000.0 * 0.0015, 1e-9));

    // Empty vector returns 0
    std::vector<TradeOrder> empty;
    REQUIRE_THAT(m.calculate_total_cost(empty), WithinAbs(0.0, 1e-12));
}
