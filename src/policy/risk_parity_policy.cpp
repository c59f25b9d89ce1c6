/**
 * @file risk_parity_policy.cpp
 * @brief Implementation of risk budgeting allocation
 */

#include "portsim/policy/risk_parity_policy.hpp"
#include "portsim/core/errors.hpp"
#include <cmath>

namespace portsim
{
    namespace policy
    {

        RiskParityPolicy::RiskParityPolicy(double tolerance,
                                           int max_iterations,
                                           const std::vector<double> &risk_budget,
                                           std::shared_ptr<const risk::RiskModel> risk_model,
                                           int periods_per_year)
            : AllocationPolicy(PolicyConstraints(), std::move(risk_model), periods_per_year),
              tolerance_(tolerance),
              max_iterations_(max_iterations),
              risk_budget_(risk_budget)
        {
            const ErrorContext ctx{"", "", "RiskParity"};
            if (!(tolerance > 0.0))
            {
                throw ConfigurationError("tolerance must be positive, got: " + std::to_string(tolerance), ctx);
            }
            if (max_iterations < 1)
            {
                throw ConfigurationError(
                    "max_iterations must be at least 1, got: " + std::to_string(max_iterations), ctx);
            }
            for (double b : risk_budget_)
            {
                if (!(b > 0.0))
                {
                    throw ConfigurationError("risk_budget entries must be positive", ctx);
                }
            }
        }

        Eigen::VectorXd RiskParityPolicy::budget_for(Eigen::Index n) const
        {
            if (risk_budget_.empty())
            {
                return equal_weights(n);
            }
            if (static_cast<Eigen::Index>(risk_budget_.size()) != n)
            {
                throw ConfigurationError(
                    "risk_budget has " + std::to_string(risk_budget_.size()) + " entries for " +
                        std::to_string(n) + " assets",
                    ErrorContext{"", "", get_name()});
            }
            Eigen::VectorXd b = Eigen::Map<const Eigen::VectorXd>(risk_budget_.data(), n);
            return b / b.sum();
        }

        Eigen::VectorXd RiskParityPolicy::risk_contributions(const Eigen::VectorXd &weights,
                                                             const Eigen::MatrixXd &covariance)
        {
            Eigen::VectorXd marginal = covariance * weights;
            const double variance = weights.dot(marginal);
            if (!(variance > 0.0))
            {
                return Eigen::VectorXd::Zero(weights.size());
            }
            return weights.cwiseProduct(marginal) / variance;
        }

        AllocationResult RiskParityPolicy::optimize(
            const ReturnsHistory &history,
            const Eigen::VectorXd &current_weights) const
        {
            validate_history(history, current_weights);
            const Eigen::Index n = history.num_assets();
            const Eigen::VectorXd budget = budget_for(n);

            MomentEstimate moments = estimate_moments(history);
            const Eigen::MatrixXd &cov = moments.covariance;

            for (Eigen::Index i = 0; i < n; ++i)
            {
                if (!(cov(i, i) > 0.0))
                {
                    throw OptimizationError("asset has zero variance, no risk contribution is possible",
                                            ErrorContext{"", history.symbols[static_cast<size_t>(i)], get_name()});
                }
            }

            // inverse-volatility start
            Eigen::VectorXd x = budget.cwiseQuotient(cov.diagonal().cwiseSqrt());

            Eigen::VectorXd w = x / x.sum();
            double error = (risk_contributions(w, cov) - budget).cwiseAbs().maxCoeff();
            int iteration = 0;

            while (error >= tolerance_ && iteration < max_iterations_)
            {
                for (Eigen::Index i = 0; i < n; ++i)
                {
                    const double a = cov(i, i);
                    const double c = cov.row(i).dot(x) - a * x(i);
                    x(i) = (-c + std::sqrt(c * c + 4.0 * a * budget(i))) / (2.0 * a);
                }
                ++iteration;
                w = x / x.sum();
                error = (risk_contributions(w, cov) - budget).cwiseAbs().maxCoeff();
            }

            if (!w.allFinite())
            {
                throw OptimizationError("risk parity iteration diverged", ErrorContext{"", "", get_name()});
            }

            AllocationResult result = make_result(history, w, &moments);
            result.iterations = iteration;
            result.converged = error < tolerance_;
            result.message = result.converged
                                 ? "converged (max contribution error " + std::to_string(error) + ")"
                                 : "iteration cap reached (max contribution error " + std::to_string(error) + ")";
            return result;
        }

        nlohmann::json RiskParityPolicy::get_parameters() const
        {
            nlohmann::json params = base_parameters();
            params["tolerance"] = tolerance_;
            params["max_iterations"] = max_iterations_;
            params["risk_budget"] = risk_budget_;
            return params;
        }

    } // namespace policy
} // namespace portsim
