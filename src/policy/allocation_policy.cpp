/**
 * @file allocation_policy.cpp
 * @brief Shared helpers for allocation policies
 */

#include "portsim/policy/allocation_policy.hpp"
#include "portsim/risk/sample_covariance.hpp"
#include "portsim/core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace portsim
{
    namespace policy
    {

        namespace
        {
            // eigenvalue ratio below which a covariance is treated as singular
            constexpr double kSingularityRatio = 1e-10;
        }

        // ============================================================================
        // PolicyConstraints
        // ============================================================================

        void PolicyConstraints::validate() const
        {
            if (!(max_weight > 0.0))
            {
                throw ConfigurationError("max_weight must be positive, got: " + std::to_string(max_weight));
            }
            if (!allow_short && min_weight < 0.0)
            {
                throw ConfigurationError(
                    "min_weight must be non-negative without allow_short, got: " + std::to_string(min_weight));
            }
            if (min_weight > max_weight)
            {
                throw ConfigurationError(
                    "min_weight (" + std::to_string(min_weight) +
                    ") cannot exceed max_weight (" + std::to_string(max_weight) + ")");
            }
        }

        void PolicyConstraints::check_feasible(Eigen::Index n) const
        {
            const double count = static_cast<double>(n);
            if (count * upper_bound() < 1.0 - 1e-12)
            {
                throw ConfigurationError(
                    "max_weight " + std::to_string(max_weight) + " cannot fully invest " +
                    std::to_string(n) + " assets");
            }
            if (count * lower_bound() > 1.0 + 1e-12)
            {
                throw ConfigurationError(
                    "min_weight " + std::to_string(min_weight) + " over-invests " +
                    std::to_string(n) + " assets");
            }
        }

        PolicyConstraints PolicyConstraints::from_json(const nlohmann::json &j)
        {
            PolicyConstraints c;
            if (j.is_object())
            {
                try
                {
                    c.min_weight = j.value("min_weight", c.min_weight);
                    c.max_weight = j.value("max_weight", c.max_weight);
                    c.allow_short = j.value("allow_short", c.allow_short);
                }
                catch (const nlohmann::json::exception &e)
                {
                    throw ConfigurationError(std::string("invalid constraint field: ") + e.what());
                }
            }
            c.validate();
            return c;
        }

        nlohmann::json PolicyConstraints::to_json() const
        {
            return nlohmann::json{
                {"min_weight", min_weight},
                {"max_weight", max_weight},
                {"allow_short", allow_short}};
        }

        // ============================================================================
        // ReturnsHistory
        // ============================================================================

        Eigen::Index ReturnsHistory::num_eligible() const
        {
            if (eligible.empty())
            {
                return num_assets();
            }
            return static_cast<Eigen::Index>(std::count(eligible.begin(), eligible.end(), true));
        }

        // ============================================================================
        // AllocationResult
        // ============================================================================

        std::map<std::string, double> AllocationResult::as_map() const
        {
            std::map<std::string, double> out;
            for (size_t i = 0; i < symbols.size() && static_cast<Eigen::Index>(i) < weights.size(); ++i)
            {
                out[symbols[i]] = weights(static_cast<Eigen::Index>(i));
            }
            return out;
        }

        double AllocationResult::weight_of(const std::string &symbol) const
        {
            auto it = std::find(symbols.begin(), symbols.end(), symbol);
            if (it == symbols.end())
            {
                throw std::invalid_argument("Symbol not in allocation: " + symbol);
            }
            return weights(static_cast<Eigen::Index>(std::distance(symbols.begin(), it)));
        }

        // ============================================================================
        // AllocationPolicy
        // ============================================================================

        AllocationPolicy::AllocationPolicy(const PolicyConstraints &constraints,
                                           std::shared_ptr<const risk::RiskModel> risk_model,
                                           int periods_per_year)
            : constraints_(constraints),
              risk_model_(risk_model ? std::move(risk_model)
                                     : std::make_shared<risk::SampleCovariance>(true)),
              periods_per_year_(periods_per_year)
        {
            constraints_.validate();
            if (periods_per_year_ < 1)
            {
                throw ConfigurationError(
                    "periods_per_year must be positive, got: " + std::to_string(periods_per_year_));
            }
        }

        AllocationResult AllocationPolicy::allocate(const ReturnsHistory &history,
                                                    const Eigen::VectorXd &current_weights) const
        {
            if (history.eligible.empty())
            {
                return optimize(history, current_weights);
            }

            validate_history(history, current_weights);
            if (history.eligible.size() != history.symbols.size())
            {
                throw ConfigurationError("eligibility mask has " + std::to_string(history.eligible.size()) +
                                         " entries for " + std::to_string(history.symbols.size()) + " symbols");
            }

            std::vector<Eigen::Index> keep;
            for (size_t i = 0; i < history.symbols.size(); ++i)
            {
                if (history.eligible[i])
                    keep.push_back(static_cast<Eigen::Index>(i));
            }
            if (keep.empty())
            {
                throw ConfigurationError("no eligible symbols to allocate");
            }
            if (keep.size() == history.symbols.size())
            {
                ReturnsHistory all = history;
                all.eligible.clear();
                return optimize(all, current_weights);
            }

            const auto k = static_cast<Eigen::Index>(keep.size());
            const bool has_returns = history.returns.cols() == history.num_assets();
            ReturnsHistory subset;
            subset.returns.resize(has_returns ? history.returns.rows() : 0, has_returns ? k : 0);
            Eigen::VectorXd subset_current(current_weights.size() > 0 ? k : 0);
            for (Eigen::Index j = 0; j < k; ++j)
            {
                subset.symbols.push_back(history.symbols[static_cast<size_t>(keep[j])]);
                if (has_returns)
                    subset.returns.col(j) = history.returns.col(keep[j]);
                if (subset_current.size() > 0)
                    subset_current(j) = current_weights(keep[j]);
            }

            AllocationResult inner = optimize(subset, subset_current);

            AllocationResult result = inner;
            result.symbols = history.symbols;
            result.weights = Eigen::VectorXd::Zero(history.num_assets());
            for (Eigen::Index j = 0; j < k; ++j)
            {
                result.weights(keep[j]) = inner.weights(j);
            }
            return result;
        }

        void AllocationPolicy::validate_history(const ReturnsHistory &history,
                                                const Eigen::VectorXd &current_weights)
        {
            if (history.symbols.empty())
            {
                throw ConfigurationError("Asset universe is empty");
            }
            if (history.returns.size() > 0 && history.returns.cols() != history.num_assets())
            {
                throw std::invalid_argument(
                    "Returns matrix has " + std::to_string(history.returns.cols()) +
                    " columns for " + std::to_string(history.symbols.size()) + " symbols");
            }
            if (current_weights.size() > 0 && current_weights.size() != history.num_assets())
            {
                throw std::invalid_argument(
                    "current_weights size (" + std::to_string(current_weights.size()) +
                    ") does not match number of assets (" + std::to_string(history.symbols.size()) + ")");
            }
        }

        MomentEstimate AllocationPolicy::estimate_moments(const ReturnsHistory &history) const
        {
            ErrorContext ctx;
            ctx.policy = get_name();

            if (history.num_observations() < 2)
            {
                throw OptimizationError(
                    "need at least 2 return observations, got " +
                        std::to_string(history.num_observations()),
                    ctx);
            }

            MomentEstimate m;
            try
            {
                m.covariance = risk_model_->estimate_covariance(history.returns) *
                               static_cast<double>(periods_per_year_);
            }
            catch (const std::invalid_argument &e)
            {
                throw OptimizationError(std::string("covariance estimation failed: ") + e.what(), ctx);
            }
            m.expected_returns = history.returns.colwise().mean().transpose() *
                                 static_cast<double>(periods_per_year_);
            return m;
        }

        void AllocationPolicy::require_non_singular(const Eigen::MatrixXd &covariance) const
        {
            Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance, Eigen::EigenvaluesOnly);
            if (solver.info() != Eigen::Success)
            {
                throw OptimizationError("eigen decomposition of covariance failed", ErrorContext{"", "", get_name()});
            }

            const double max_eigenvalue = solver.eigenvalues().maxCoeff();
            const double min_eigenvalue = solver.eigenvalues().minCoeff();
            if (!(max_eigenvalue > 0.0) || min_eigenvalue <= kSingularityRatio * max_eigenvalue)
            {
                throw OptimizationError(
                    "covariance matrix is singular (min eigenvalue " + std::to_string(min_eigenvalue) +
                        ", max eigenvalue " + std::to_string(max_eigenvalue) + ")",
                    ErrorContext{"", "", get_name()});
            }
        }

        Eigen::VectorXd AllocationPolicy::clean_weights(const Eigen::VectorXd &raw) const
        {
            Eigen::VectorXd w = raw.cwiseMax(constraints_.lower_bound()).cwiseMin(constraints_.upper_bound());
            const double total = w.sum();
            if (!std::isfinite(total) || std::abs(total) < 1e-12)
            {
                throw OptimizationError("solution weights do not sum to a usable total",
                                        ErrorContext{"", "", get_name()});
            }
            return w / total;
        }

        AllocationResult AllocationPolicy::make_result(const ReturnsHistory &history,
                                                       const Eigen::VectorXd &weights,
                                                       const MomentEstimate *moments) const
        {
            AllocationResult result;
            result.symbols = history.symbols;
            result.weights = weights;
            if (moments != nullptr)
            {
                result.expected_return = weights.dot(moments->expected_returns);
                double variance = weights.transpose() * moments->covariance * weights;
                result.volatility = std::sqrt(std::max(0.0, variance));
            }
            return result;
        }

        nlohmann::json AllocationPolicy::base_parameters() const
        {
            nlohmann::json params;
            params["policy"] = get_name();
            params["constraints"] = constraints_.to_json();
            params["risk_model"] = risk_model_->get_name();
            params["periods_per_year"] = periods_per_year_;
            return params;
        }

        Eigen::VectorXd AllocationPolicy::equal_weights(Eigen::Index n)
        {
            return Eigen::VectorXd::Constant(n, 1.0 / static_cast<double>(n));
        }

    } // namespace policy
} // namespace portsim
