/**
 * @file min_variance_policy.hpp
 * @brief Global minimum-variance allocation
 */

#pragma once

#include "portsim/policy/allocation_policy.hpp"
#include "portsim/policy/osqp_solver.hpp"

namespace portsim
{
    namespace policy
    {

        /**
         * @class MinVariancePolicy
         * @brief min w^T Sigma w subject to sum(w) = 1 and the weight bounds.
         *
         * Long-only solutions have weights below cleanup_threshold zeroed and
         * the rest rescaled, unless that would break max_weight.
         */
        class MinVariancePolicy : public AllocationPolicy
        {
        public:
            explicit MinVariancePolicy(const PolicyConstraints &constraints = PolicyConstraints(),
                                       std::shared_ptr<const risk::RiskModel> risk_model = nullptr,
                                       int periods_per_year = 252,
                                       double cleanup_threshold = 0.01,
                                       const SolverOptions &solver_options = SolverOptions());

            AllocationResult optimize(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const override;

            std::string get_name() const override { return "MinVariance"; }
            nlohmann::json get_parameters() const override;

            /**
             * @brief Solve for an already annualised covariance
             * @throws OptimizationError if the solver fails
             */
            Eigen::VectorXd solve(const Eigen::MatrixXd &covariance, int &iterations) const;

            double cleanup_threshold() const { return cleanup_threshold_; }

        private:
            double cleanup_threshold_;
            OSQPSolver solver_;

            Eigen::VectorXd drop_small_weights(const Eigen::VectorXd &weights) const;
        };

    } // namespace policy
} // namespace portsim
