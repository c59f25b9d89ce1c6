/**
 * @file risk_parity_policy.hpp
 * @brief Risk budgeting / equal risk contribution allocation
 *
 * Risk contribution of asset i for weights w:
 *
 *     RC_i = w_i (Sigma w)_i / (w^T Sigma w)
 *
 * The target is RC_i = b_i for a budget b (1/N by default). Weights are
 * found by cyclical coordinate descent on
 *
 *     min (1/2) x^T Sigma x - sum_i b_i ln x_i,   x > 0
 *
 * whose optimum satisfies x_i (Sigma x)_i = b_i; w = x / sum(x).
 * Each coordinate update has the closed form
 *
 *     x_i = (-c_i + sqrt(c_i^2 + 4 Sigma_ii b_i)) / (2 Sigma_ii),
 *     c_i = sum_{j != i} Sigma_ij x_j
 *
 * Iteration stops once max_i |RC_i - b_i| < tolerance or after
 * max_iterations sweeps; in the latter case the last iterate is returned
 * with converged = false.
 */

#pragma once

#include "portsim/policy/allocation_policy.hpp"
#include <vector>

namespace portsim
{
    namespace policy
    {

        class RiskParityPolicy : public AllocationPolicy
        {
        public:
            /**
             * @param tolerance Convergence threshold on risk contributions, > 0
             * @param max_iterations Sweep cap, >= 1
             * @param risk_budget Target contributions; empty means equal
             * @throws ConfigurationError on invalid parameters
             */
            explicit RiskParityPolicy(double tolerance = 1e-8,
                                      int max_iterations = 1000,
                                      const std::vector<double> &risk_budget = {},
                                      std::shared_ptr<const risk::RiskModel> risk_model = nullptr,
                                      int periods_per_year = 252);

            AllocationResult optimize(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const override;

            std::string get_name() const override { return "RiskParity"; }
            nlohmann::json get_parameters() const override;

            /**
             * @brief Risk contribution of each asset, summing to one
             */
            static Eigen::VectorXd risk_contributions(const Eigen::VectorXd &weights,
                                                      const Eigen::MatrixXd &covariance);

            double tolerance() const { return tolerance_; }
            int max_iterations() const { return max_iterations_; }

        private:
            double tolerance_;
            int max_iterations_;
            std::vector<double> risk_budget_;

            Eigen::VectorXd budget_for(Eigen::Index n) const;
        };

    } // namespace policy
} // namespace portsim
