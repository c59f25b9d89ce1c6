#include <catch2/catch_test_macros.hpp>
#include "portsim/backtest/rebalance_scheduler.hpp"
#include "portsim/core/dates.hpp"
#include "portsim/core/errors.hpp"
#include <nlohmann/json.hpp>

using namespace portsim;
using namespace portsim::backtest;

namespace {

RebalanceScheduler scheduler_for(RebalanceFrequency frequency) {
    RebalanceConfig cfg;
    cfg.frequency = frequency;
    return RebalanceScheduler(cfg);
}

} // namespace

TEST_CASE("RebalanceScheduler calendar triggers", "[RebalanceScheduler]") {
    SECTION("Happy path: first step always rebalances") {
        for (auto f : {RebalanceFrequency::NONE, RebalanceFrequency::DAILY, RebalanceFrequency::WEEKLY,
                       RebalanceFrequency::MONTHLY, RebalanceFrequency::QUARTERLY,
                       RebalanceFrequency::ANNUALLY}) {
            auto s = scheduler_for(f);
            REQUIRE(s.should_rebalance("2021-11-03"));
        }
    }

    SECTION("Happy path: none never rebalances again") {
        auto s = scheduler_for(RebalanceFrequency::NONE);
        s.record_rebalance("2021-01-04");
        REQUIRE_FALSE(s.should_rebalance("2021-01-05"));
        REQUIRE_FALSE(s.should_rebalance("2025-06-30"));
    }

    SECTION("Happy path: daily") {
        auto s = scheduler_for(RebalanceFrequency::DAILY);
        s.record_rebalance("2022-02-02");
        REQUIRE_FALSE(s.should_rebalance("2022-02-02"));
        REQUIRE(s.should_rebalance("2022-02-03"));
    }

    SECTION("Happy path: weekly triggers on the first day of a new week") {
        auto s = scheduler_for(RebalanceFrequency::WEEKLY);
        s.record_rebalance("2021-11-03");               // Wednesday
        REQUIRE_FALSE(s.should_rebalance("2021-11-05")); // Friday, same week
        REQUIRE(s.should_rebalance("2021-11-08"));       // Monday
        REQUIRE(s.should_rebalance("2021-11-09"));       // Monday was a holiday
    }

    SECTION("Happy path: weekly across a year boundary") {
        auto s = scheduler_for(RebalanceFrequency::WEEKLY);
        s.record_rebalance("2020-12-28");               // Monday
        REQUIRE_FALSE(s.should_rebalance("2021-01-01")); // Friday of the same week
        REQUIRE(s.should_rebalance("2021-01-04"));
    }

    SECTION("Happy path: monthly") {
        auto s = scheduler_for(RebalanceFrequency::MONTHLY);
        s.record_rebalance("2021-10-29");
        REQUIRE(s.should_rebalance("2021-11-01"));
        s.record_rebalance("2021-11-01");
        REQUIRE_FALSE(s.should_rebalance("2021-11-15"));
        REQUIRE(s.rebalance_count() == 2);
    }

    SECTION("Happy path: quarterly") {
        auto s = scheduler_for(RebalanceFrequency::QUARTERLY);
        s.record_rebalance("2021-10-01");
        REQUIRE_FALSE(s.should_rebalance("2021-12-31"));
        REQUIRE(s.should_rebalance("2022-01-03"));
    }

    SECTION("Happy path: annually") {
        auto s = scheduler_for(RebalanceFrequency::ANNUALLY);
        s.record_rebalance("2021-01-04");
        REQUIRE_FALSE(s.should_rebalance("2021-12-31"));
        REQUIRE(s.should_rebalance("2022-01-03"));
    }

    SECTION("Edge case: reset forgets the last rebalance") {
        auto s = scheduler_for(RebalanceFrequency::ANNUALLY);
        s.record_rebalance("2021-01-04");
        s.reset();
        REQUIRE(s.last_rebalance_date().empty());
        REQUIRE(s.rebalance_count() == 0);
        REQUIRE(s.should_rebalance("2021-06-01"));
    }

    SECTION("Error: malformed date") {
        auto s = scheduler_for(RebalanceFrequency::MONTHLY);
        REQUIRE_THROWS_AS(s.should_rebalance("2021-13-01"), std::invalid_argument);
        REQUIRE_THROWS_AS(s.should_rebalance("01/02/2021"), std::invalid_argument);
    }
}

TEST_CASE("RebalanceConfig parsing", "[RebalanceScheduler][Config]") {
    SECTION("Happy path: names and aliases") {
        REQUIRE(RebalanceConfig::parse_frequency("Monthly") == RebalanceFrequency::MONTHLY);
        REQUIRE(RebalanceConfig::parse_frequency("q") == RebalanceFrequency::QUARTERLY);
        REQUIRE(RebalanceConfig::parse_frequency("buy_and_hold") == RebalanceFrequency::NONE);
        REQUIRE(RebalanceConfig::parse_frequency("yearly") == RebalanceFrequency::ANNUALLY);
        REQUIRE(RebalanceConfig::to_string(RebalanceFrequency::WEEKLY) == "weekly");
    }

    SECTION("Happy path: from json string or object") {
        REQUIRE(RebalanceConfig::from_json("daily").frequency == RebalanceFrequency::DAILY);
        REQUIRE(RebalanceConfig::from_json(nlohmann::json{{"frequency", "weekly"}}).frequency ==
                RebalanceFrequency::WEEKLY);
        REQUIRE(RebalanceConfig::from_json(nlohmann::json::object()).frequency == RebalanceFrequency::MONTHLY);
    }

    SECTION("Error: unknown frequency") {
        REQUIRE_THROWS_AS(RebalanceConfig::from_string("fortnightly"), ConfigurationError);
    }
}

TEST_CASE("Calendar date helpers", "[Dates]") {
    SECTION("Happy path: day arithmetic") {
        REQUIRE(dates::add_days("2020-02-28", 1) == "2020-02-29");
        REQUIRE(dates::add_days("2021-02-28", 1) == "2021-03-01");
        REQUIRE(dates::add_days("2021-01-01", -1) == "2020-12-31");
        REQUIRE(dates::days_since_epoch("1970-01-01") == 0);
    }

    SECTION("Happy path: weekday, Monday is 0") {
        REQUIRE(dates::day_of_week("2021-11-01") == 0);
        REQUIRE(dates::day_of_week("2021-11-06") == 5);
        REQUIRE(dates::day_of_week("1970-01-01") == 3);
    }

    SECTION("Error: invalid calendar dates") {
        REQUIRE_FALSE(dates::is_valid("2021-02-30"));
        REQUIRE_FALSE(dates::is_valid("2021-1-01"));
        REQUIRE(dates::is_valid("2024-02-29"));
        REQUIRE_THROWS_AS(dates::parse("not-a-date"), std::invalid_argument);
    }
}
