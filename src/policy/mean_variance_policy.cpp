/**
 * @file mean_variance_policy.cpp
 * @brief Implementation of mean-variance allocation
 */

#include "portsim/policy/mean_variance_policy.hpp"
#include "portsim/core/errors.hpp"

namespace portsim
{
    namespace policy
    {

        MeanVariancePolicy::MeanVariancePolicy(double risk_aversion,
                                               const PolicyConstraints &constraints,
                                               std::shared_ptr<const risk::RiskModel> risk_model,
                                               int periods_per_year,
                                               const SolverOptions &solver_options)
            : AllocationPolicy(constraints, std::move(risk_model), periods_per_year),
              risk_aversion_(risk_aversion),
              solver_(solver_options)
        {
            if (!(risk_aversion > 0.0))
            {
                throw ConfigurationError(
                    "Risk aversion must be positive, got: " + std::to_string(risk_aversion),
                    ErrorContext{"", "", "MeanVariance"});
            }
        }

        AllocationResult MeanVariancePolicy::optimize(
            const ReturnsHistory &history,
            const Eigen::VectorXd &current_weights) const
        {
            validate_history(history, current_weights);
            const Eigen::Index n = history.num_assets();
            constraints().check_feasible(n);

            MomentEstimate moments = estimate_moments(history);
            require_non_singular(moments.covariance);

            QuadraticProblem problem;
            problem.P = 2.0 * risk_aversion_ * moments.covariance;
            problem.q = -moments.expected_returns;
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

            AllocationResult result = make_result(history, clean_weights(solved.solution), &moments);
            result.iterations = solved.iterations;
            result.message = solved.message;
            return result;
        }

        nlohmann::json MeanVariancePolicy::get_parameters() const
        {
            nlohmann::json params = base_parameters();
            params["risk_aversion"] = risk_aversion_;
            params["solver_tolerance"] = solver_.options().tolerance;
            params["solver_max_iterations"] = solver_.options().max_iterations;
            return params;
        }

    } // namespace policy
} // namespace portsim
