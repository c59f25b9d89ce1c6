#include "portsim/policy/kelly_policy.hpp"
#include "portsim/core/errors.hpp"
#include <algorithm>

namespace portsim
{
    namespace policy
    {

        KellyPolicy::KellyPolicy(double fraction,
                                 std::shared_ptr<const risk::RiskModel> risk_model,
                                 int periods_per_year)
            : AllocationPolicy(PolicyConstraints(), std::move(risk_model), periods_per_year),
              fraction_(fraction)
        {
            if (!(fraction > 0.0) || fraction > 1.0)
            {
                throw ConfigurationError("Kelly fraction must be in (0, 1], got: " + std::to_string(fraction),
                                         ErrorContext{"", "", "Kelly"});
            }
        }

        AllocationResult KellyPolicy::optimize(
            const ReturnsHistory &history,
            const Eigen::VectorXd &current_weights) const
        {
            validate_history(history, current_weights);
            const Eigen::Index n = history.num_assets();

            MomentEstimate moments = estimate_moments(history);

            Eigen::VectorXd raw = Eigen::VectorXd::Zero(n);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                const double variance = moments.covariance(i, i);
                if (variance > 0.0)
                {
                    raw(i) = std::clamp(fraction_ * moments.expected_returns(i) / variance, 0.0, 1.0);
                }
            }

            const double total = raw.sum();
            if (!(total > 0.0))
            {
                AllocationResult result = make_result(history, equal_weights(n), &moments);
                result.fallback_used = true;
                result.message = "no positive Kelly fraction, using equal weight";
                return result;
            }

            AllocationResult result = make_result(history, raw / total, &moments);
            result.message = "kelly";
            return result;
        }

        nlohmann::json KellyPolicy::get_parameters() const
        {
            nlohmann::json params = base_parameters();
            params["fraction"] = fraction_;
            return params;
        }

    } // namespace policy
} // namespace portsim
