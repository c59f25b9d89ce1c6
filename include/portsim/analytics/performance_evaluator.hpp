/**
 * @file performance_evaluator.hpp
 * @brief Summary statistics over a recorded snapshot history.
 *
 * The evaluator is a pure function of the snapshot sequence: it never
 * touches the Portfolio that produced it. Returns are the per-step
 * daily_return values; annualisation uses periods_per_year (252 by
 * default) and the risk-free rate is annual, converted to a per-period
 * rate by simple division.
 */

#ifndef PORTSIM_ANALYTICS_PERFORMANCE_EVALUATOR_HPP
#define PORTSIM_ANALYTICS_PERFORMANCE_EVALUATOR_HPP

#include "portsim/backtest/state_snapshot.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace portsim
{
    namespace analytics
    {

        /**
         * @struct PerformanceReport
         * @brief Scalar metrics of one run.
         */
        struct PerformanceReport
        {
            std::string policy_name;
            std::string start_date;
            std::string end_date;
            int num_periods = 0;

            double initial_value = 0.0;
            double final_value = 0.0;
            double total_return = 0.0;          ///< Cumulative return since the endowment
            double annualized_return = 0.0;     ///< CAGR
            double annualized_volatility = 0.0; ///< Sample std of period returns x sqrt(periods_per_year)
            double downside_deviation = 0.0;
            double sharpe_ratio = 0.0;
            double sortino_ratio = 0.0;
            double calmar_ratio = 0.0;

            double max_drawdown = 0.0;          ///< Positive fraction, 0.15 = 15%
            std::string drawdown_peak_date;
            std::string drawdown_trough_date;

            double risk_free_rate = 0.02;
            int periods_per_year = 252;

            nlohmann::json to_json() const;
            std::string summary() const;
        };

        /**
         * @struct RankedPerformance
         * @brief One row of a policy comparison table.
         */
        struct RankedPerformance
        {
            int rank = 0; ///< 1-based
            std::string policy_name;
            PerformanceReport report;
        };

        /**
         * @class PerformanceEvaluator
         * @brief Computes PerformanceReport values and ranks competing runs.
         *
         * Usage:
         * @code
         *   PerformanceEvaluator evaluator(0.02);
         *   auto report = evaluator.evaluate_portfolio(result.history, "MinVariance");
         *   auto table = evaluator.compare_portfolio_performance(histories);
         * @endcode
         *
         * Instances hold only settings and are safe to share between threads.
         */
        class PerformanceEvaluator
        {
        public:
            /**
             * @param risk_free_rate Annualised risk-free rate.
             * @param periods_per_year Steps per year used to annualise.
             * @throws std::invalid_argument If periods_per_year is not positive.
             */
            explicit PerformanceEvaluator(double risk_free_rate = 0.02,
                                          int periods_per_year = 252);

            /**
             * @brief Evaluate one history.
             * @throws std::invalid_argument If history is empty.
             */
            PerformanceReport evaluate_portfolio(const backtest::StateHistory &history,
                                                 const std::string &policy_name = "") const;

            /**
             * @brief Rank several histories.
             *
             * Higher cumulative return ranks first; returns within 1e-9 of each
             * other tie and are ordered by lower volatility, then by policy name.
             */
            std::vector<RankedPerformance> compare_portfolio_performance(
                const std::map<std::string, backtest::StateHistory> &histories) const;

            /// Rank already evaluated reports with the same ordering.
            static std::vector<RankedPerformance> rank(std::vector<PerformanceReport> reports);

            /// Fixed-width text table of a ranking.
            static std::string format_comparison(const std::vector<RankedPerformance> &ranking);

            double risk_free_rate() const { return risk_free_rate_; }
            int periods_per_year() const { return periods_per_year_; }

        private:
            double risk_free_rate_;
            int periods_per_year_;

            double to_period_rate(double annual_rate) const;
        };

    } // namespace analytics
} // namespace portsim

#endif // PORTSIM_ANALYTICS_PERFORMANCE_EVALUATOR_HPP
