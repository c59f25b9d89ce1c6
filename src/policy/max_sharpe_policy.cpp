/**
 * @file max_sharpe_policy.cpp
 * @brief Implementation of maximum Sharpe ratio allocation
 */

#include "portsim/policy/max_sharpe_policy.hpp"
#include "portsim/core/errors.hpp"
#include <cmath>
#include <limits>

namespace portsim
{
    namespace policy
    {

        MaxSharpePolicy::MaxSharpePolicy(double risk_free_rate,
                                         const PolicyConstraints &constraints,
                                         std::shared_ptr<const risk::RiskModel> risk_model,
                                         int periods_per_year,
                                         const SolverOptions &solver_options)
            : AllocationPolicy(constraints, risk_model, periods_per_year),
              risk_free_rate_(risk_free_rate),
              solver_(solver_options),
              fallback_(constraints, risk_model, periods_per_year, 0.0, solver_options)
        {
            if (risk_free_rate < 0.0)
            {
                throw ConfigurationError(
                    "Risk-free rate must be non-negative, got: " + std::to_string(risk_free_rate),
                    ErrorContext{"", "", "MaxSharpe"});
            }
        }

        AllocationResult MaxSharpePolicy::optimize(
            const ReturnsHistory &history,
            const Eigen::VectorXd &current_weights) const
        {
            validate_history(history, current_weights);
            const Eigen::Index n = history.num_assets();
            constraints().check_feasible(n);

            MomentEstimate moments = estimate_moments(history);
            Eigen::VectorXd excess = moments.expected_returns.array() - risk_free_rate_;

            if (excess.maxCoeff() <= 0.0)
            {
                int iterations = 0;
                Eigen::VectorXd weights = fallback_.solve(moments.covariance, iterations);
                AllocationResult result = make_result(history, weights, &moments);
                result.iterations = iterations;
                result.fallback_used = true;
                result.message = "no asset has positive excess return, using minimum variance";
                return result;
            }

            const double inf = std::numeric_limits<double>::infinity();
            const double lb = constraints().lower_bound();
            const double ub = constraints().upper_bound();

            QuadraticProblem problem;
            problem.P = 2.0 * moments.covariance;
            problem.q = Eigen::VectorXd::Zero(n);
            problem.A_eq = excess.transpose();
            problem.b_eq = Eigen::VectorXd::Ones(1);

            // rows [0, n): y_i - ub * sum(y) <= 0, rows [n, 2n): y_i - lb * sum(y) >= 0
            problem.A_ineq = Eigen::MatrixXd::Zero(2 * n, n);
            problem.b_ineq_lower = Eigen::VectorXd::Constant(2 * n, -inf);
            problem.b_ineq_upper = Eigen::VectorXd::Constant(2 * n, inf);
            for (Eigen::Index i = 0; i < n; ++i)
            {
                problem.A_ineq.row(i).setConstant(-ub);
                problem.A_ineq(i, i) += 1.0;
                problem.b_ineq_upper(i) = 0.0;

                problem.A_ineq.row(n + i).setConstant(-lb);
                problem.A_ineq(n + i, i) += 1.0;
                problem.b_ineq_lower(n + i) = 0.0;
            }

            SolverResult solved = solver_.solve(problem);
            if (!solved.success)
            {
                throw OptimizationError("solver did not converge: " + solved.message,
                                        ErrorContext{"", "", get_name()});
            }

            const double kappa = solved.solution.sum();
            if (!(kappa > 1e-12))
            {
                throw OptimizationError("degenerate tangency scaling (sum of y = " + std::to_string(kappa) + ")",
                                        ErrorContext{"", "", get_name()});
            }

            AllocationResult result = make_result(history, clean_weights(solved.solution / kappa), &moments);
            result.iterations = solved.iterations;
            result.message = solved.message;
            return result;
        }

        nlohmann::json MaxSharpePolicy::get_parameters() const
        {
            nlohmann::json params = base_parameters();
            params["risk_free_rate"] = risk_free_rate_;
            params["fallback"] = fallback_.get_name();
            return params;
        }

    } // namespace policy
} // namespace portsim
