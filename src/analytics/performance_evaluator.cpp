/**
 * @file performance_evaluator.cpp
 * @brief Implementation of PerformanceEvaluator.
 */

#include "portsim/analytics/performance_evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace portsim
{
    namespace analytics
    {

        namespace
        {
            constexpr double kReturnTieTolerance = 1e-9;

            bool ranks_before(const PerformanceReport &a, const PerformanceReport &b)
            {
                if (std::abs(a.total_return - b.total_return) > kReturnTieTolerance)
                {
                    return a.total_return > b.total_return;
                }
                if (a.annualized_volatility != b.annualized_volatility)
                {
                    return a.annualized_volatility < b.annualized_volatility;
                }
                return a.policy_name < b.policy_name;
            }
        } // namespace

        // ===================================================================
        // PerformanceReport
        // ===================================================================

        nlohmann::json PerformanceReport::to_json() const
        {
            nlohmann::json j;
            j["policy"] = policy_name;
            j["period"]["start_date"] = start_date;
            j["period"]["end_date"] = end_date;
            j["period"]["num_periods"] = num_periods;

            j["return_metrics"]["initial_value"] = initial_value;
            j["return_metrics"]["final_value"] = final_value;
            j["return_metrics"]["total_return"] = total_return;
            j["return_metrics"]["annualized_return"] = annualized_return;

            j["risk_metrics"]["annualized_volatility"] = annualized_volatility;
            j["risk_metrics"]["downside_deviation"] = downside_deviation;
            j["risk_metrics"]["max_drawdown"] = max_drawdown;

            j["risk_adjusted"]["sharpe_ratio"] = sharpe_ratio;
            j["risk_adjusted"]["sortino_ratio"] = sortino_ratio;
            j["risk_adjusted"]["calmar_ratio"] = calmar_ratio;

            j["max_drawdown_detail"]["depth"] = max_drawdown;
            j["max_drawdown_detail"]["peak_date"] = drawdown_peak_date;
            j["max_drawdown_detail"]["trough_date"] = drawdown_trough_date;

            j["settings"]["risk_free_rate"] = risk_free_rate;
            j["settings"]["periods_per_year"] = periods_per_year;
            return j;
        }

        std::string PerformanceReport::summary() const
        {
            std::ostringstream oss;
            oss << std::fixed;

            oss << "Performance Summary";
            if (!policy_name.empty())
            {
                oss << " (" << policy_name << ")";
            }
            oss << "\n===================\n";
            oss << "  Period:              " << start_date << " to " << end_date
                << " (" << num_periods << " steps)\n";
            oss << "  Final Value:         " << std::setprecision(2) << final_value << "\n";
            oss << "\n";

            oss << "Return Metrics:\n";
            oss << "  Total Return:        " << std::setprecision(4)
                << total_return * 100.0 << "%\n";
            oss << "  Annualized Return:   " << std::setprecision(4)
                << annualized_return * 100.0 << "%\n";
            oss << "\n";

            oss << "Risk Metrics:\n";
            oss << "  Annualized Vol:      " << std::setprecision(4)
                << annualized_volatility * 100.0 << "%\n";
            oss << "  Downside Deviation:  " << std::setprecision(4)
                << downside_deviation * 100.0 << "%\n";
            oss << "  Max Drawdown:        " << std::setprecision(4)
                << max_drawdown * 100.0 << "%";
            if (max_drawdown > 0.0)
            {
                oss << " (" << drawdown_peak_date << " -> " << drawdown_trough_date << ")";
            }
            oss << "\n\n";

            oss << "Risk-Adjusted Metrics:\n";
            oss << "  Sharpe Ratio:        " << std::setprecision(4) << sharpe_ratio << "\n";
            oss << "  Sortino Ratio:       " << std::setprecision(4) << sortino_ratio << "\n";
            oss << "  Calmar Ratio:        " << std::setprecision(4) << calmar_ratio << "\n";

            return oss.str();
        }

        // ===================================================================
        // PerformanceEvaluator
        // ===================================================================

        PerformanceEvaluator::PerformanceEvaluator(double risk_free_rate, int periods_per_year)
            : risk_free_rate_(risk_free_rate), periods_per_year_(periods_per_year)
        {
            if (periods_per_year <= 0)
            {
                throw std::invalid_argument(
                    "periods_per_year must be positive, got: " + std::to_string(periods_per_year));
            }
        }

        double PerformanceEvaluator::to_period_rate(double annual_rate) const
        {
            return annual_rate / static_cast<double>(periods_per_year_);
        }

        PerformanceReport PerformanceEvaluator::evaluate_portfolio(
            const backtest::StateHistory &history,
            const std::string &policy_name) const
        {
            if (history.empty())
            {
                throw std::invalid_argument("Cannot evaluate an empty snapshot history");
            }

            PerformanceReport report;
            report.policy_name = policy_name;
            report.start_date = history.front().date;
            report.end_date = history.back().date;
            report.num_periods = static_cast<int>(history.size());
            report.risk_free_rate = risk_free_rate_;
            report.periods_per_year = periods_per_year_;

            const double first_growth = 1.0 + history.front().daily_return;
            report.initial_value = first_growth != 0.0 ? history.front().total_value / first_growth
                                                       : history.front().total_value;
            report.final_value = history.back().total_value;
            report.total_return = history.back().cumulative_return;

            // Return metrics
            const double years = static_cast<double>(history.size()) / static_cast<double>(periods_per_year_);
            if (report.total_return <= -1.0)
            {
                report.annualized_return = -1.0;
            }
            else
            {
                report.annualized_return = std::pow(1.0 + report.total_return, 1.0 / years) - 1.0;
            }

            // Risk metrics
            std::vector<double> returns;
            returns.reserve(history.size());
            for (const auto &s : history)
            {
                returns.push_back(s.daily_return);
            }

            const int n = static_cast<int>(returns.size());
            if (n >= 2)
            {
                const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(n);
                const double target = to_period_rate(risk_free_rate_);
                double sum_sq = 0.0;
                double down_sq = 0.0;
                for (double r : returns)
                {
                    sum_sq += (r - mean) * (r - mean);
                    if (r < target)
                    {
                        down_sq += (r - target) * (r - target);
                    }
                }
                const double scale = std::sqrt(static_cast<double>(periods_per_year_));
                report.annualized_volatility = std::sqrt(sum_sq / static_cast<double>(n - 1)) * scale;
                report.downside_deviation = std::sqrt(down_sq / static_cast<double>(n - 1)) * scale;
            }

            // Drawdown, measured from the initial endowment
            double peak = report.initial_value;
            std::string peak_date = history.front().date;
            for (const auto &s : history)
            {
                if (s.total_value > peak)
                {
                    peak = s.total_value;
                    peak_date = s.date;
                }
                if (peak > 0.0)
                {
                    const double dd = (peak - s.total_value) / peak;
                    if (dd > report.max_drawdown)
                    {
                        report.max_drawdown = dd;
                        report.drawdown_peak_date = peak_date;
                        report.drawdown_trough_date = s.date;
                    }
                }
            }

            // Risk-adjusted metrics
            if (report.annualized_volatility >= 1e-18)
            {
                report.sharpe_ratio = (report.annualized_return - risk_free_rate_) / report.annualized_volatility;
            }
            if (report.downside_deviation >= 1e-18)
            {
                report.sortino_ratio = (report.annualized_return - risk_free_rate_) / report.downside_deviation;
            }
            if (report.max_drawdown >= 1e-18)
            {
                report.calmar_ratio = report.annualized_return / report.max_drawdown;
            }

            return report;
        }

        std::vector<RankedPerformance> PerformanceEvaluator::compare_portfolio_performance(
            const std::map<std::string, backtest::StateHistory> &histories) const
        {
            std::vector<PerformanceReport> reports;
            reports.reserve(histories.size());
            for (const auto &[name, history] : histories)
            {
                reports.push_back(evaluate_portfolio(history, name));
            }
            return rank(std::move(reports));
        }

        std::vector<RankedPerformance> PerformanceEvaluator::rank(std::vector<PerformanceReport> reports)
        {
            std::stable_sort(reports.begin(), reports.end(), ranks_before);

            std::vector<RankedPerformance> ranking;
            ranking.reserve(reports.size());
            int position = 1;
            for (auto &report : reports)
            {
                RankedPerformance row;
                row.rank = position++;
                row.policy_name = report.policy_name;
                row.report = std::move(report);
                ranking.push_back(std::move(row));
            }
            return ranking;
        }

        std::string PerformanceEvaluator::format_comparison(const std::vector<RankedPerformance> &ranking)
        {
            std::ostringstream oss;
            oss << std::fixed;
            oss << std::left << std::setw(6) << "Rank" << std::setw(16) << "Policy"
                << std::right << std::setw(12) << "Return %" << std::setw(12) << "Vol %"
                << std::setw(10) << "Sharpe" << std::setw(12) << "MaxDD %" << "\n";
            oss << std::string(68, '-') << "\n";
            for (const auto &row : ranking)
            {
                const auto &r = row.report;
                oss << std::left << std::setw(6) << row.rank << std::setw(16) << row.policy_name
                    << std::right << std::setprecision(2)
                    << std::setw(12) << r.total_return * 100.0
                    << std::setw(12) << r.annualized_volatility * 100.0
                    << std::setprecision(3) << std::setw(10) << r.sharpe_ratio
                    << std::setprecision(2) << std::setw(12) << r.max_drawdown * 100.0 << "\n";
            }
            return oss.str();
        }

    } // namespace analytics
} // namespace portsim
