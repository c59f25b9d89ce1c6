#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "portsim/analytics/performance_evaluator.hpp"
#include <cmath>
#include <string>
#include <vector>

using namespace portsim::analytics;
using portsim::backtest::StateHistory;
using portsim::backtest::StateSnapshot;

namespace
{
    // Snapshot history of a cash-only account with the given step totals
    StateHistory make_history(const std::vector<double> &totals, double initial = 100.0)
    {
        StateHistory history;
        double previous = initial;
        for (size_t i = 0; i < totals.size(); ++i)
        {
            StateSnapshot s;
            s.date = "2021-01-" + std::string(i + 4 < 10 ? "0" : "") + std::to_string(i + 4);
            s.cash = totals[i];
            s.total_value = totals[i];
            s.daily_return = totals[i] / previous - 1.0;
            s.cumulative_return = totals[i] / initial - 1.0;
            previous = totals[i];
            history.push_back(s);
        }
        return history;
    }
} // namespace

TEST_CASE("PerformanceEvaluator single run metrics", "[PerformanceEvaluator]")
{
    // one step per "year" keeps the annualisation readable
    PerformanceEvaluator evaluator(0.0, 4);
    StateHistory history = make_history({100.0, 110.0, 99.0, 121.0});
    PerformanceReport report = evaluator.evaluate_portfolio(history, "Test");

    SECTION("Happy path: return metrics")
    {
        REQUIRE(report.policy_name == "Test");
        REQUIRE(report.num_periods == 4);
        REQUIRE(report.initial_value == Catch::Approx(100.0));
        REQUIRE(report.final_value == Catch::Approx(121.0));
        REQUIRE(report.total_return == Catch::Approx(0.21));
        REQUIRE(report.annualized_return == Catch::Approx(0.21));
        REQUIRE(report.start_date == "2021-01-04");
        REQUIRE(report.end_date == "2021-01-07");
    }

    SECTION("Happy path: volatility is the annualised sample deviation")
    {
        const std::vector<double> r = {0.0, 0.1, -0.1, 121.0 / 99.0 - 1.0};
        double mean = 0.0;
        for (double x : r)
            mean += x / 4.0;
        double ss = 0.0;
        for (double x : r)
            ss += (x - mean) * (x - mean);
        const double expected = std::sqrt(ss / 3.0) * 2.0;

        REQUIRE(report.annualized_volatility == Catch::Approx(expected));
        REQUIRE(report.sharpe_ratio == Catch::Approx(0.21 / expected));
        REQUIRE(report.downside_deviation == Catch::Approx(std::sqrt(0.01 / 3.0) * 2.0));
    }

    SECTION("Happy path: drawdown from the running peak")
    {
        REQUIRE(report.max_drawdown == Catch::Approx(0.1));
        REQUIRE(report.drawdown_peak_date == "2021-01-05");
        REQUIRE(report.drawdown_trough_date == "2021-01-06");
        REQUIRE(report.calmar_ratio == Catch::Approx(2.1));
    }

    SECTION("Happy path: json layout")
    {
        auto j = report.to_json();
        REQUIRE(j["policy"] == "Test");
        REQUIRE(j["return_metrics"]["total_return"].get<double>() == Catch::Approx(0.21));
        REQUIRE(j["risk_metrics"]["max_drawdown"].get<double>() == Catch::Approx(0.1));
        REQUIRE(j["max_drawdown_detail"]["peak_date"] == "2021-01-05");
        REQUIRE(j["settings"]["periods_per_year"] == 4);
        REQUIRE(report.summary().find("Test") != std::string::npos);
    }
}

TEST_CASE("PerformanceEvaluator edge cases", "[PerformanceEvaluator]")
{
    PerformanceEvaluator evaluator;

    SECTION("Edge case: drawdown counts a loss on the first step")
    {
        auto report = evaluator.evaluate_portfolio(make_history({95.0, 96.0}));
        REQUIRE(report.initial_value == Catch::Approx(100.0));
        REQUIRE(report.max_drawdown == Catch::Approx(0.05));
    }

    SECTION("Edge case: single snapshot has no dispersion")
    {
        auto report = evaluator.evaluate_portfolio(make_history({101.0}));
        REQUIRE(report.annualized_volatility == 0.0);
        REQUIRE(report.sharpe_ratio == 0.0);
        REQUIRE(report.total_return == Catch::Approx(0.01));
    }

    SECTION("Edge case: flat history")
    {
        auto report = evaluator.evaluate_portfolio(make_history({100.0, 100.0, 100.0}));
        REQUIRE(report.total_return == 0.0);
        REQUIRE(report.max_drawdown == 0.0);
        REQUIRE(report.sharpe_ratio == 0.0);
        REQUIRE(report.calmar_ratio == 0.0);
    }

    SECTION("Edge case: total loss")
    {
        auto report = evaluator.evaluate_portfolio(make_history({50.0, 0.0}));
        REQUIRE(report.annualized_return == -1.0);
        REQUIRE(report.max_drawdown == Catch::Approx(1.0));
    }

    SECTION("Error: empty history")
    {
        REQUIRE_THROWS_AS(evaluator.evaluate_portfolio(StateHistory()), std::invalid_argument);
    }

    SECTION("Error: non-positive periods per year")
    {
        REQUIRE_THROWS_AS(PerformanceEvaluator(0.02, 0), std::invalid_argument);
    }
}

TEST_CASE("PerformanceEvaluator ranking", "[PerformanceEvaluator][Ranking]")
{
    PerformanceEvaluator evaluator(0.02, 252);

    SECTION("Happy path: higher return ranks first, ties go to lower volatility")
    {
        std::map<std::string, StateHistory> runs;
        runs["Alpha"] = make_history({100.0, 105.0, 110.0}); // 10%, smooth
        runs["Beta"] = make_history({100.0, 90.0, 110.0});   // 10%, volatile
        runs["Gamma"] = make_history({100.0, 120.0});         // 20%

        auto ranking = evaluator.compare_portfolio_performance(runs);
        REQUIRE(ranking.size() == 3);
        REQUIRE(ranking[0].policy_name == "Gamma");
        REQUIRE(ranking[1].policy_name == "Alpha");
        REQUIRE(ranking[2].policy_name == "Beta");
        REQUIRE(ranking[0].rank == 1);
        REQUIRE(ranking[2].rank == 3);
    }

    SECTION("Edge case: identical runs are ordered by name")
    {
        std::map<std::string, StateHistory> runs;
        runs["Delta"] = make_history({100.0, 103.0, 104.0});
        runs["Charlie"] = make_history({100.0, 103.0, 104.0});

        auto ranking = evaluator.compare_portfolio_performance(runs);
        REQUIRE(ranking[0].policy_name == "Charlie");
        REQUIRE(ranking[1].policy_name == "Delta");
    }

    SECTION("Happy path: ranking reports directly")
    {
        std::vector<PerformanceReport> reports;
        reports.push_back(evaluator.evaluate_portfolio(make_history({100.0, 99.0}), "Loser"));
        reports.push_back(evaluator.evaluate_portfolio(make_history({100.0, 102.0}), "Winner"));

        auto ranking = PerformanceEvaluator::rank(reports);
        REQUIRE(ranking.front().policy_name == "Winner");

        std::string table = PerformanceEvaluator::format_comparison(ranking);
        REQUIRE(table.find("Winner") < table.find("Loser"));
    }

    SECTION("Edge case: nothing to compare")
    {
        REQUIRE(evaluator.compare_portfolio_performance({}).empty());
    }
}
