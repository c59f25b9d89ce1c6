/**
 * @file min_variance_policy.cpp
 * @brief Implementation of minimum-variance allocation
 */

#include "portsim/policy/min_variance_policy.hpp"
#include "portsim/core/errors.hpp"

namespace portsim
{
    namespace policy
    {

        MinVariancePolicy::MinVariancePolicy(const PolicyConstraints &constraints,
                                             std::shared_ptr<const risk::RiskModel> risk_model,
                                             int periods_per_year,
                                             double cleanup_threshold,
                                             const SolverOptions &solver_options)
            : AllocationPolicy(constraints, std::move(risk_model), periods_per_year),
              cleanup_threshold_(cleanup_threshold),
              solver_(solver_options)
        {
            if (cleanup_threshold < 0.0 || cleanup_threshold >= 1.0)
            {
                throw ConfigurationError(
                    "cleanup_threshold must be in [0, 1), got: " + std::to_string(cleanup_threshold),
                    ErrorContext{"", "", "MinVariance"});
            }
        }

        Eigen::VectorXd MinVariancePolicy::solve(const Eigen::MatrixXd &covariance, int &iterations) const
        {
            const Eigen::Index n = covariance.rows();
            constraints().check_feasible(n);

            QuadraticProblem problem;
            problem.P = 2.0 * covariance;
            problem.q = Eigen::VectorXd::Zero(n);
            problem.A_eq = Eigen::MatrixXd::Ones(1, n);
            problem.b_eq = Eigen::VectorXd::Ones(1);
            problem.lower_bounds = Eigen::VectorXd::Constant(n, constraints().lower_bound());
            problem.upper_bounds = Eigen::VectorXd::Constant(n, constraints().upper_bound());

            SolverResult solved = solver_.solve(problem);
            if (!solved.success)
            {
                throw OptimizationError("solver did not converge: " + solved.message,
                                        ErrorContext{"", "", get_name()});
            }
            iterations = solved.iterations;
            return drop_small_weights(clean_weights(solved.solution));
        }

        Eigen::VectorXd MinVariancePolicy::drop_small_weights(const Eigen::VectorXd &weights) const
        {
            if (constraints().allow_short || cleanup_threshold_ <= 0.0)
            {
                return weights;
            }

            Eigen::VectorXd kept = (weights.array() < cleanup_threshold_).select(0.0, weights);
            const double total = kept.sum();
            if (total <= 0.0)
            {
                return weights;
            }
            kept /= total;
            if (kept.maxCoeff() > constraints().upper_bound() + 1e-9)
            {
                return weights;
            }
            return kept;
        }

        AllocationResult MinVariancePolicy::optimize(
            const ReturnsHistory &history,
            const Eigen::VectorXd &current_weights) const
        {
            validate_history(history, current_weights);

            MomentEstimate moments = estimate_moments(history);

            int iterations = 0;
            Eigen::VectorXd weights = solve(moments.covariance, iterations);

            AllocationResult result = make_result(history, weights, &moments);
            result.iterations = iterations;
            result.message = "minimum variance";
            return result;
        }

        nlohmann::json MinVariancePolicy::get_parameters() const
        {
            nlohmann::json params = base_parameters();
            params["cleanup_threshold"] = cleanup_threshold_;
            return params;
        }

    } // namespace policy
} // namespace portsim
