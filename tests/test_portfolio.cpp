#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "portsim/backtest/portfolio.hpp"
#include "portsim/core/dates.hpp"
#include "portsim/data/data_loader.hpp"
#include "portsim/policy/equal_weight_policy.hpp"
#include "portsim/policy/mean_variance_policy.hpp"
#include "portsim/policy/min_variance_policy.hpp"
#include "portsim/policy/risk_parity_policy.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <memory>

using namespace portsim;
using namespace portsim::backtest;

namespace {

const std::vector<std::string> kWeek = {
    "2021-01-04", "2021-01-05", "2021-01-06", "2021-01-07", "2021-01-08"};

// A at 100 and B at 50 on every day of kWeek
MarketData flat_market() {
    Eigen::MatrixXd prices(5, 2);
    for (int i = 0; i < 5; ++i) {
        prices(i, 0) = 100.0;
        prices(i, 1) = 50.0;
    }
    return MarketData(prices, kWeek, {"A", "B"});
}

// B is exactly twice A, so the two return series are collinear
MarketData collinear_market(int days) {
    Eigen::MatrixXd prices(days, 2);
    std::vector<std::string> dates;
    std::string date = "2021-01-04";
    for (int i = 0; i < days; ++i) {
        while (dates::day_of_week(date) >= 5) date = dates::add_days(date, 1);
        dates.push_back(date);
        date = dates::add_days(date, 1);
        prices(i, 0) = 100.0 * (1.0 + 0.02 * std::sin(0.7 * i));
        prices(i, 1) = 2.0 * prices(i, 0);
    }
    return MarketData(prices, dates, {"A", "B"});
}

// 100 weekdays of A, B and C; B and C have no prices before row 70
MarketData staggered_market() {
    const int days = 100;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    Eigen::MatrixXd prices(days, 3);
    std::vector<std::string> dates;
    std::string date = "2021-01-04";
    for (int i = 0; i < days; ++i) {
        while (dates::day_of_week(date) >= 5) date = dates::add_days(date, 1);
        dates.push_back(date);
        date = dates::add_days(date, 1);
        prices(i, 0) = 100.0 * (1.0 + 0.02 * std::sin(0.7 * i));
        prices(i, 1) = i < 70 ? nan : 50.0 * (1.0 + 0.03 * std::cos(0.5 * i));
        prices(i, 2) = i < 70 ? nan : 80.0 * (1.0 + 0.015 * std::sin(1.3 * i + 1.0));
    }
    return MarketData(prices, dates, {"A", "B", "C"});
}

std::shared_ptr<const policy::AllocationPolicy> equal_weight() {
    return std::make_shared<policy::EqualWeightPolicy>();
}

} // namespace

TEST_CASE("Portfolio construction", "[Portfolio]") {
    SECTION("Happy path: starts uninitialized with all cash") {
        Portfolio p(equal_weight());
        REQUIRE(p.state() == PortfolioState::UNINITIALIZED);
        REQUIRE(p.cash() == Catch::Approx(100000.0));
        REQUIRE(p.total_value() == Catch::Approx(100000.0));
        REQUIRE(p.positions().empty());
        REQUIRE(p.history().empty());
    }

    SECTION("Error: null policy") {
        REQUIRE_THROWS_AS(Portfolio(nullptr), ConfigurationError);
    }

    SECTION("Error: non-positive initial cash") {
        SimulationParams params;
        params.initial_cash = 0.0;
        REQUIRE_THROWS_AS(Portfolio(equal_weight(), params), ConfigurationError);
    }

    SECTION("Error: negative transaction cost rate") {
        SimulationParams params;
        params.transaction_costs.commission_rate = -0.01;
        REQUIRE_THROWS_AS(Portfolio(equal_weight(), params), ConfigurationError);
    }

    SECTION("Error: unknown fallback and cost timing names") {
        REQUIRE_THROWS_AS(SimulationParams::parse_fallback("retry"), ConfigurationError);
        REQUIRE_THROWS_AS(SimulationParams::parse_cost_timing("later"), ConfigurationError);
        REQUIRE(SimulationParams::parse_fallback("equal_weight") == FallbackMode::EQUAL_WEIGHT);
        REQUIRE(SimulationParams::parse_fallback("none") == FallbackMode::NONE);
        REQUIRE(SimulationParams::parse_cost_timing("included") == CostTiming::INCLUDED);
    }
}

TEST_CASE("Portfolio trading primitives", "[Portfolio]") {
    Portfolio p(equal_weight());

    SECTION("Happy path: buy floors to whole shares") {
        double bought = p.buy_stock("A", 30.0, 1000.0);
        REQUIRE(bought == Catch::Approx(33.0));
        REQUIRE(p.get_position("A").quantity == Catch::Approx(33.0));
        REQUIRE(p.cash() == Catch::Approx(100000.0 - 990.0));
        REQUIRE(p.total_value() == Catch::Approx(100000.0));
    }

    SECTION("Happy path: buy toward a target already reached does nothing") {
        p.buy_stock("A", 100.0, 10000.0);
        REQUIRE(p.buy_stock("A", 100.0, 10000.0) == Catch::Approx(0.0));
        REQUIRE(p.get_position("A").quantity == Catch::Approx(100.0));
    }

    SECTION("Happy path: partial sell keeps the position") {
        p.buy_stock("A", 100.0, 10000.0);
        double sold = p.sell_stock("A", 100.0, 4000.0);
        REQUIRE(sold == Catch::Approx(60.0));
        REQUIRE(p.get_position("A").quantity == Catch::Approx(40.0));
        REQUIRE(p.cash() == Catch::Approx(96000.0));
    }

    SECTION("Edge case: negative target without shorting clamps to a flat position") {
        p.buy_stock("A", 100.0, 10000.0);
        double sold = p.sell_stock("A", 100.0, -5000.0);
        REQUIRE(sold == Catch::Approx(100.0));
        REQUIRE_FALSE(p.has_position("A"));
        REQUIRE(p.cash() == Catch::Approx(100000.0));
    }

    SECTION("Edge case: selling an asset that is not held does nothing") {
        REQUIRE(p.sell_stock("B", 50.0, 0.0) == Catch::Approx(0.0));
        REQUIRE(p.log().num_trades() == 0);
    }

    SECTION("Edge case: buy larger than cash is scaled down") {
        double bought = p.buy_stock("A", 100.0, 250000.0);
        REQUIRE(bought == Catch::Approx(1000.0));
        REQUIRE(p.cash() == Catch::Approx(0.0));
        REQUIRE(p.log().count(LogKind::PARTIAL_FILL) == 1);
        REQUIRE(p.log().trades().back().partial_fill);
    }

    SECTION("Error: non-positive price") {
        REQUIRE_THROWS_AS(p.buy_stock("A", 0.0, 1000.0), std::invalid_argument);
        REQUIRE_THROWS_AS(p.sell_stock("A", -1.0, 0.0), std::invalid_argument);
    }

    SECTION("Error: unknown position") {
        REQUIRE_THROWS_AS(p.get_position("ZZZ"), std::invalid_argument);
    }
}

TEST_CASE("Portfolio short selling", "[Portfolio]") {
    SimulationParams params;
    params.allow_short = true;
    Portfolio p(equal_weight(), params);

    SECTION("Happy path: negative target opens a short") {
        double sold = p.sell_stock("A", 100.0, -5000.0);
        REQUIRE(sold == Catch::Approx(50.0));
        REQUIRE(p.get_position("A").quantity == Catch::Approx(-50.0));
        REQUIRE(p.cash() == Catch::Approx(105000.0));
        REQUIRE(p.total_value() == Catch::Approx(100000.0));
    }
}

TEST_CASE("Portfolio equal-weight buy and hold", "[Portfolio][Simulation]") {
    MarketData data = flat_market();
    Portfolio p(equal_weight());

    SimulationResult result = p.simulate(data, "2021-01-04", "2021-01-08", RebalanceFrequency::NONE);

    SECTION("Happy path: whole-share allocation of the endowment") {
        REQUIRE(p.state() == PortfolioState::COMPLETED);
        REQUIRE(p.get_position("A").quantity == Catch::Approx(500.0));
        REQUIRE(p.get_position("B").quantity == Catch::Approx(1000.0));
        REQUIRE(p.cash() == Catch::Approx(0.0).margin(1e-9));
        REQUIRE(result.rebalance_count == 1);
        REQUIRE(result.trades.size() == 2);
    }

    SECTION("Happy path: one snapshot per trading day") {
        REQUIRE(result.history.size() == 5);
        REQUIRE(result.history.front().date == "2021-01-04");
        REQUIRE(result.history.front().rebalanced);
        REQUIRE_FALSE(result.history.back().rebalanced);
        REQUIRE(result.history.back().weight_of("A") == Catch::Approx(0.5));
        REQUIRE(result.history.back().weight_of("B") == Catch::Approx(0.5));
    }

    SECTION("Happy path: flat prices leave performance at zero") {
        REQUIRE(result.performance.total_return == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(result.performance.max_drawdown == Catch::Approx(0.0).margin(1e-12));
        REQUIRE(result.performance.policy_name == "EqualWeight");
    }

    SECTION("Happy path: cash plus positions equals total at every step") {
        for (const auto& snap : result.history) {
            REQUIRE(snap.cash + snap.positions_value == Catch::Approx(snap.total_value));
            REQUIRE(snap.cash >= 0.0);
        }
    }

    SECTION("Error: mutation after completion") {
        REQUIRE_THROWS_AS(p.buy_stock("A", 100.0, 1000.0), InvalidStateError);
        REQUIRE_THROWS_AS(p.sell_stock("A", 100.0, 0.0), InvalidStateError);
    }

    SECTION("Error: second simulate on the same portfolio") {
        REQUIRE_THROWS_AS(p.simulate(data, "2021-01-04", "2021-01-08"), InvalidStateError);
    }
}

TEST_CASE("Portfolio date range validation", "[Portfolio][Simulation]") {
    MarketData data = flat_market();

    SECTION("Error: start equal to end") {
        Portfolio p(equal_weight());
        REQUIRE_THROWS_AS(p.simulate(data, "2021-01-05", "2021-01-05"), InvalidDateRangeError);
        REQUIRE(p.state() == PortfolioState::UNINITIALIZED);
    }

    SECTION("Error: start after end") {
        Portfolio p(equal_weight());
        REQUIRE_THROWS_AS(p.simulate(data, "2021-01-08", "2021-01-04"), InvalidDateRangeError);
    }

    SECTION("Error: window outside the data") {
        Portfolio p(equal_weight());
        REQUIRE_THROWS_AS(p.simulate(data, "2030-01-01", "2030-12-31"), InvalidDateRangeError);
    }

    SECTION("Error: malformed date") {
        Portfolio p(equal_weight());
        REQUIRE_THROWS_AS(p.simulate(data, "2021/01/04", "2021-01-08"), InvalidDateRangeError);
    }

    SECTION("Edge case: window dates need not be trading days") {
        Portfolio p(equal_weight());
        auto result = p.simulate(data, "2021-01-02", "2021-01-06");
        REQUIRE(result.history.size() == 3);
        REQUIRE(result.history.front().date == "2021-01-04");
    }
}

TEST_CASE("Portfolio stale prices", "[Portfolio][Simulation]") {
    MarketData data = flat_market();
    data.set_price("B", "2021-01-06", std::numeric_limits<double>::quiet_NaN());

    Portfolio p(equal_weight());
    auto result = p.simulate(data, "2021-01-04", "2021-01-08", RebalanceFrequency::NONE);

    SECTION("Happy path: last price is carried forward and flagged") {
        REQUIRE(p.log().count(LogKind::STALE_PRICE) == 1);
        const auto& snap = result.history[2];
        REQUIRE(snap.stale_symbols.size() == 1);
        REQUIRE(snap.stale_symbols.front() == "B");
        REQUIRE(snap.total_value == Catch::Approx(100000.0));
        REQUIRE(result.history[3].stale_symbols.empty());
    }
}

TEST_CASE("Portfolio transaction cost timing", "[Portfolio][Costs]") {
    MarketData data = flat_market();

    SECTION("Happy path: costs on top scale the last buy down") {
        SimulationParams params;
        params.transaction_costs.commission_rate = 0.01;
        params.cost_timing = CostTiming::ON_TOP;
        Portfolio p(equal_weight(), params);
        auto result = p.simulate(data, "2021-01-04", "2021-01-08", RebalanceFrequency::NONE);

        REQUIRE(p.get_position("A").quantity == Catch::Approx(500.0));
        REQUIRE(p.get_position("B").quantity == Catch::Approx(980.0));
        REQUIRE(p.cash() == Catch::Approx(10.0));
        REQUIRE(p.log().count(LogKind::PARTIAL_FILL) == 1);
        REQUIRE(result.trade_summary.partial_fills == 1);
        REQUIRE(result.trade_summary.total_costs == Catch::Approx(500.0 + 490.0));
    }

    SECTION("Happy path: costs included fit inside each target") {
        SimulationParams params;
        params.transaction_costs.commission_rate = 0.01;
        params.cost_timing = CostTiming::INCLUDED;
        Portfolio p(equal_weight(), params);
        p.simulate(data, "2021-01-04", "2021-01-08", RebalanceFrequency::NONE);

        REQUIRE(p.get_position("A").quantity == Catch::Approx(495.0));
        REQUIRE(p.get_position("B").quantity == Catch::Approx(990.0));
        REQUIRE(p.cash() == Catch::Approx(10.0));
        REQUIRE(p.log().count(LogKind::PARTIAL_FILL) == 0);
    }
}

TEST_CASE("Portfolio optimizer fallback", "[Portfolio][Simulation]") {
    MarketData data = collinear_market(40);
    const std::string start = data.get_dates()[20];
    const std::string end = data.get_dates().back();

    SimulationParams params;
    params.min_history = 5;
    params.lookback_window = 20;

    auto mean_variance = std::make_shared<policy::MeanVariancePolicy>(2.0);

    SECTION("Happy path: singular covariance falls back to equal weights") {
        params.fallback = FallbackMode::EQUAL_WEIGHT;
        Portfolio p(mean_variance, params);
        auto result = p.simulate(data, start, end, RebalanceFrequency::NONE);

        REQUIRE(p.state() == PortfolioState::COMPLETED);
        REQUIRE(p.log().count(LogKind::OPTIMIZER_FALLBACK) >= 1);
        REQUIRE(result.history.front().weight_of("A") ==
                Catch::Approx(result.history.front().weight_of("B")).margin(0.01));
    }

    SECTION("Error: no fallback aborts with context") {
        params.fallback = FallbackMode::NONE;
        Portfolio p(mean_variance, params);
        try {
            p.simulate(data, start, end, RebalanceFrequency::NONE);
            FAIL("expected OptimizationError");
        } catch (const OptimizationError& e) {
            REQUIRE(e.context().date == start);
            REQUIRE(e.context().policy == "MeanVariance");
        }
        REQUIRE(p.state() == PortfolioState::RUNNING);
        REQUIRE(p.history().empty());
    }
}

TEST_CASE("Portfolio assets listed on different dates", "[Portfolio][Simulation]") {
    MarketData data = staggered_market();
    const auto& dates = data.get_dates();

    SimulationParams params;
    params.min_history = 5;
    params.lookback_window = 20;
    params.rebalance.frequency = RebalanceFrequency::MONTHLY;

    policy::PolicyConstraints capped;
    capped.max_weight = 0.5;
    auto min_variance = std::make_shared<policy::MinVariancePolicy>(capped);

    SECTION("Happy path: cap holds while only one asset is priced") {
        Portfolio p(min_variance, params);
        auto result = p.simulate(data, dates.front(), dates.back());

        REQUIRE(p.state() == PortfolioState::COMPLETED);
        REQUIRE(result.history.front().weight_of("A") == Catch::Approx(0.5).margin(1e-9));
        REQUIRE(result.history.front().cash == Catch::Approx(50000.0));
        REQUIRE(p.log().count(LogKind::OPTIMIZER_FALLBACK) >= 1);

        for (const auto& snap : result.history) {
            REQUIRE(snap.cash + snap.positions_value == Catch::Approx(snap.total_value));
            if (!snap.rebalanced) continue;
            for (const auto& kv : snap.weights) {
                REQUIRE(kv.second <= 0.5 + 1e-3);
            }
        }
        // the May rebalance sees all three assets
        REQUIRE(result.history.back().weights.size() >= 2);
    }

    SECTION("Error: no fallback aborts when the bounds cannot be met") {
        params.fallback = FallbackMode::NONE;
        Portfolio p(min_variance, params);
        try {
            p.simulate(data, dates[30], dates.back());
            FAIL("expected OptimizationError");
        } catch (const OptimizationError& e) {
            REQUIRE(e.context().date == dates[30]);
            REQUIRE(e.context().policy == "MinVariance");
        }
        REQUIRE(p.state() == PortfolioState::RUNNING);
    }
}

TEST_CASE("Portfolio eligibility rule", "[Portfolio][Simulation][Eligibility]") {
    MarketData data = DataLoader::generate_synthetic_data({"AAA", "BBB", "CCC"}, 120,
                                                          "2020-01-01", 0.02, 0.0005, 3);
    const auto& dates = data.get_dates();
    SimulationParams params;
    params.min_history = 5;
    params.lookback_window = 40;
    params.rebalance.frequency = RebalanceFrequency::WEEKLY;

    SECTION("Happy path: an excluded symbol is never bought") {
        params.eligibility = [](const MarketDataFeed&, size_t, const std::string& symbol) {
            return symbol != "BBB";
        };
        Portfolio p(equal_weight(), params);
        auto result = p.simulate(data, dates[50], dates.back());

        REQUIRE(p.state() == PortfolioState::COMPLETED);
        REQUIRE(result.history.front().weight_of("AAA") == Catch::Approx(0.5).margin(0.01));
        REQUIRE(result.history.front().weight_of("CCC") == Catch::Approx(0.5).margin(0.01));
        for (const auto& snap : result.history) {
            REQUIRE(snap.weights.count("BBB") == 0);
        }
        REQUIRE(p.log().trades_for_ticker("BBB").empty());
        REQUIRE(p.log().count(LogKind::INELIGIBLE) >= 1);
    }

    SECTION("Happy path: a symbol dropped later is sold") {
        const std::string cutoff = dates[80];
        params.eligibility = [cutoff](const MarketDataFeed& feed, size_t idx, const std::string& symbol) {
            return symbol != "AAA" || feed.get_dates()[idx] < cutoff;
        };
        Portfolio p(equal_weight(), params);
        auto result = p.simulate(data, dates[50], dates.back());

        REQUIRE(result.history.front().weight_of("AAA") > 0.3);
        REQUIRE(result.history.back().weight_of("AAA") == 0.0);
        REQUIRE(result.history.back().weight_of("BBB") == Catch::Approx(0.5).margin(0.05));
    }

    SECTION("Edge case: nothing eligible keeps the account in cash") {
        params.eligibility = [](const MarketDataFeed&, size_t, const std::string&) { return false; };
        Portfolio p(equal_weight(), params);
        auto result = p.simulate(data, dates[50], dates.back());

        REQUIRE(p.state() == PortfolioState::COMPLETED);
        REQUIRE(p.log().num_trades() == 0);
        REQUIRE(result.history.back().cash == Catch::Approx(params.initial_cash));
        REQUIRE(p.log().count(LogKind::OPTIMIZER_FALLBACK) == 0);
    }

    SECTION("Happy path: positive momentum admits risers only") {
        Eigen::MatrixXd prices(6, 2);
        const double nan = std::numeric_limits<double>::quiet_NaN();
        prices << 10.0, 20.0,
                  11.0, 19.0,
                  12.0, nan,
                  13.0, 17.0,
                  14.0, 16.0,
                  15.0, 21.0;
        MarketData trend(prices, {"2021-01-04", "2021-01-05", "2021-01-06",
                                  "2021-01-07", "2021-01-08", "2021-01-11"}, {"UP", "DOWN"});
        EligibilityRule rule = positive_momentum(3);

        REQUIRE(rule(trend, 4, "UP"));
        REQUIRE_FALSE(rule(trend, 4, "DOWN"));
        // gap at row 2 reads as the close of row 1
        REQUIRE(rule(trend, 5, "DOWN"));
        // not enough rows yet
        REQUIRE(rule(trend, 1, "DOWN"));
        REQUIRE_THROWS_AS(positive_momentum(0), std::invalid_argument);
    }

    SECTION("Happy path: enabled from the run configuration") {
        SimulationConfig config;
        config.momentum_lookback = 10;
        REQUIRE(SimulationParams::from_config(config).eligibility);
        config.momentum_lookback = 0;
        REQUIRE_FALSE(SimulationParams::from_config(config).eligibility);
    }
}

TEST_CASE("Portfolio insufficient history", "[Portfolio][Simulation]") {
    MarketData data = collinear_market(10);
    SimulationParams params;
    params.min_history = 30;

    auto risk_parity = std::make_shared<policy::RiskParityPolicy>();
    Portfolio p(risk_parity, params);
    auto result = p.simulate(data, data.get_dates().front(), data.get_dates().back(),
                             RebalanceFrequency::NONE);

    SECTION("Edge case: holds equal weights and logs the shortfall") {
        REQUIRE(p.log().count(LogKind::INSUFFICIENT_HISTORY) == 1);
        REQUIRE(result.history.front().weight_of("A") ==
                Catch::Approx(result.history.front().weight_of("B")).margin(0.01));
    }
}

TEST_CASE("Portfolio determinism", "[Portfolio][Simulation]") {
    MarketData data = DataLoader::generate_synthetic_data({"AAA", "BBB", "CCC"}, 300,
                                                          "2020-01-01", 0.02, 0.0005, 7);
    SimulationParams params;
    params.lookback_window = 60;
    params.rebalance.frequency = RebalanceFrequency::MONTHLY;
    auto policy = std::make_shared<policy::RiskParityPolicy>();

    Portfolio first(policy, params);
    Portfolio second(policy, params);
    auto a = first.simulate(data, "2020-06-01", "2020-12-31");
    auto b = second.simulate(data, "2020-06-01", "2020-12-31");

    SECTION("Happy path: identical inputs give identical histories") {
        REQUIRE(a.history.size() == b.history.size());
        for (size_t i = 0; i < a.history.size(); ++i) {
            REQUIRE(a.history[i].total_value == b.history[i].total_value);
            REQUIRE(a.history[i].cash == b.history[i].cash);
        }
        REQUIRE(a.trades.size() == b.trades.size());
        REQUIRE(a.rebalance_count == b.rebalance_count);
    }

    SECTION("Happy path: monthly schedule rebalances once per month") {
        REQUIRE(a.rebalance_count == 7);
        for (const auto& snap : a.history) {
            REQUIRE(snap.cash >= 0.0);
            REQUIRE(snap.cash + snap.positions_value == Catch::Approx(snap.total_value));
        }
    }
}
