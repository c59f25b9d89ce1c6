#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "portsim/backtest/simulation_log.hpp"
#include <cmath>
#include <fstream>
#include <filesystem>

using namespace portsim::backtest;

namespace {

TradeRecord make_trade(const std::string& date, const std::string& ticker, double shares, double price,
                       double cost, bool partial = false) {
    TradeRecord r;
    r.date = date;
    r.ticker = ticker;
    r.shares = shares;
    r.price = price;
    r.notional = shares * price;
    r.commission = cost;
    r.total_cost = cost;
    r.partial_fill = partial;
    return r;
}

} // namespace

TEST_CASE("SimulationLog trade logging", "[SimulationLog]") {
    SimulationLog log;

    SECTION("Happy path: trade ids auto-increment") {
        TradeRecord r = make_trade("2020-01-01", "AAA", 5.0, 10.0, 0.5);
        r.trade_id = -1;
        log.log_trade(r);
        log.log_trade(make_trade("2020-01-02", "BBB", -2.0, 20.0, 0.2));
        log.log_trade(make_trade("2020-01-02", "AAA", 1.0, 11.0, 0.1));

        REQUIRE(log.num_trades() == 3);
        REQUIRE(log.trades()[0].trade_id == 0);
        REQUIRE(log.trades()[1].trade_id == 1);
        REQUIRE(log.trades()[2].trade_id == 2);
    }

    SECTION("Happy path: queries by date and ticker") {
        log.log_trade(make_trade("2020-01-01", "AAA", 5.0, 10.0, 0.5));
        log.log_trade(make_trade("2020-01-02", "BBB", -2.0, 20.0, 0.2));

        auto d1 = log.trades_for_date("2020-01-01");
        REQUIRE(d1.size() == 1);
        REQUIRE(d1.front().ticker == "AAA");

        auto tbb = log.trades_for_ticker("BBB");
        REQUIRE(tbb.size() == 1);
        REQUIRE(tbb.front().date == "2020-01-02");

        REQUIRE(log.trades_for_date("1999-01-01").empty());
    }

    SECTION("Edge case: clear resets ids and events") {
        log.log_trade(make_trade("2020-01-01", "AAA", 5.0, 10.0, 0.5));
        log.log_rebalance("2020-01-01", 0.5);
        log.clear();
        REQUIRE(log.num_trades() == 0);
        REQUIRE(log.entries().empty());
        log.log_trade(make_trade("2020-01-03", "AAA", 1.0, 10.0, 0.0));
        REQUIRE(log.trades().front().trade_id == 0);
        REQUIRE(log.get_summary().rebalance_count == 0);
    }
}

TEST_CASE("SimulationLog events", "[SimulationLog]") {
    SimulationLog log;
    log.warn(LogKind::STALE_PRICE, "2020-01-02", "AAA", "price missing");
    log.warn(LogKind::STALE_PRICE, "2020-01-03", "AAA", "price missing");
    log.warn(LogKind::OPTIMIZER_FALLBACK, "2020-01-03", "", "singular covariance");
    log.log_rebalance("2020-01-03", 0.25);

    SECTION("Happy path: counts by kind and level") {
        REQUIRE(log.count(LogKind::STALE_PRICE) == 2);
        REQUIRE(log.count(LogKind::OPTIMIZER_FALLBACK) == 1);
        REQUIRE(log.count(LogKind::PARTIAL_FILL) == 0);
        REQUIRE(log.count(LogKind::REBALANCE) == 1);
        REQUIRE(log.num_warnings() == 3);
        REQUIRE(log.entries().size() == 4);
    }

    SECTION("Happy path: entries keep date, symbol and level") {
        auto stale = log.entries_of(LogKind::STALE_PRICE);
        REQUIRE(stale.size() == 2);
        REQUIRE(stale.back().date == "2020-01-03");
        REQUIRE(stale.back().symbol == "AAA");
        REQUIRE(stale.back().level == LogLevel::WARNING);
        REQUIRE(log.entries_of(LogKind::REBALANCE).front().level == LogLevel::INFO);
    }

    SECTION("Happy path: names") {
        REQUIRE(to_string(LogKind::INSUFFICIENT_HISTORY) == "INSUFFICIENT_HISTORY");
        REQUIRE(to_string(LogKind::INELIGIBLE) == "INELIGIBLE");
        REQUIRE(to_string(LogKind::NON_CONVERGENCE) == "NON_CONVERGENCE");
        REQUIRE(to_string(LogLevel::WARNING) == "WARNING");
    }
}

TEST_CASE("SimulationLog summary", "[SimulationLog]") {
    SimulationLog log;
    TradeRecord r1 = make_trade("2020-01-01", "AAA", 5.0, 10.0, 0.8);
    TradeRecord r2 = make_trade("2020-01-02", "BBB", -2.0, 20.0, 0.2);
    TradeRecord r3 = make_trade("2020-01-02", "AAA", 3.0, 10.0, 0.1, true);
    log.log_trade(r1);
    log.log_trade(r2);
    log.log_trade(r3);
    log.log_rebalance("2020-01-01", 0.1);
    log.log_rebalance("2020-01-02", 0.3);

    auto s = log.get_summary();
    REQUIRE(s.total_trades == 3);
    REQUIRE(s.buy_trades == 2);
    REQUIRE(s.sell_trades == 1);
    REQUIRE(s.partial_fills == 1);
    REQUIRE(s.total_notional == Catch::Approx(50.0 + 40.0 + 30.0));
    REQUIRE(s.total_costs == Catch::Approx(1.1));
    REQUIRE(s.avg_cost_per_trade == Catch::Approx(1.1 / 3.0));
    REQUIRE(s.rebalance_count == 2);
    REQUIRE(s.turnover == Catch::Approx(0.4));
}

TEST_CASE("SimulationLog export", "[SimulationLog]") {
    SimulationLog log;
    log.log_trade(make_trade("2020-01-01", "AAA", 5.0, 10.0, 0.5));
    log.warn(LogKind::PARTIAL_FILL, "2020-01-01", "AAA", "wanted 10, cash covers 5");

    const std::string dir = "build/tmp/simulation_log_test";
    std::filesystem::remove_all(dir);

    SECTION("Happy path: trades csv") {
        const std::string out = dir + "/trades.csv";
        REQUIRE_NOTHROW(log.export_trades_to_csv(out));
        REQUIRE(std::filesystem::exists(out));

        std::ifstream f(out);
        REQUIRE(f.is_open());
        std::string header;
        std::getline(f, header);
        REQUIRE(header == "trade_id,date,ticker,shares,price,notional,commission,slippage,total_cost,partial_fill");

        std::string row;
        std::getline(f, row);
        REQUIRE(row.rfind("0,2020-01-01,AAA,", 0) == 0);
    }

    SECTION("Happy path: event csv quotes fields with commas") {
        const std::string out = dir + "/log.csv";
        REQUIRE_NOTHROW(log.export_log_to_csv(out));

        std::ifstream f(out);
        std::string header;
        std::getline(f, header);
        REQUIRE(header == "level,date,kind,symbol,message");

        std::string row;
        std::getline(f, row);
        REQUIRE(row == "WARNING,2020-01-01,PARTIAL_FILL,AAA,\"wanted 10, cash covers 5\"");
    }
}
