/**
 * @file max_sharpe_policy.hpp
 * @brief Maximum Sharpe ratio (tangency) allocation
 *
 * Uses the Charnes-Cooper / Schaible transform: with excess returns
 * e = mu - r_f and y = kappa * w,
 *
 *     minimize   y^T Sigma y
 *     subject to e^T y = 1
 *                lb * sum(y) <= y_i <= ub * sum(y)
 *
 * and w = y / sum(y). This is a single convex QP solved by OSQP.
 *
 * When no asset has a positive expected excess return the ratio has no
 * meaningful maximum and the policy returns minimum-variance weights.
 */

#pragma once

#include "portsim/policy/allocation_policy.hpp"
#include "portsim/policy/min_variance_policy.hpp"
#include "portsim/policy/osqp_solver.hpp"

namespace portsim
{
    namespace policy
    {

        class MaxSharpePolicy : public AllocationPolicy
        {
        public:
            /**
             * @param risk_free_rate Annualised rate, non-negative
             * @throws ConfigurationError if risk_free_rate is negative
             */
            explicit MaxSharpePolicy(double risk_free_rate = 0.02,
                                     const PolicyConstraints &constraints = PolicyConstraints(),
                                     std::shared_ptr<const risk::RiskModel> risk_model = nullptr,
                                     int periods_per_year = 252,
                                     const SolverOptions &solver_options = SolverOptions());

            AllocationResult optimize(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const override;

            std::string get_name() const override { return "MaxSharpe"; }
            nlohmann::json get_parameters() const override;

            double risk_free_rate() const { return risk_free_rate_; }

        private:
            double risk_free_rate_;
            OSQPSolver solver_;
            MinVariancePolicy fallback_;
        };

    } // namespace policy
} // namespace portsim
