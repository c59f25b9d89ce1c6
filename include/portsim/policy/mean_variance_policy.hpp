/**
 * @file mean_variance_policy.hpp
 * @brief Mean-variance (risk-aversion) allocation
 *
 * Solves
 *
 *     maximize   mu^T w - lambda * w^T Sigma w
 *     subject to sum(w) = 1, lb <= w <= ub
 *
 * as the OSQP problem min (1/2) w^T (2 lambda Sigma) w - mu^T w.
 */

#pragma once

#include "portsim/policy/allocation_policy.hpp"
#include "portsim/policy/osqp_solver.hpp"

namespace portsim
{
    namespace policy
    {

        /**
         * @class MeanVariancePolicy
         *
         * A singular covariance estimate (for example two perfectly correlated
         * assets) is rejected with OptimizationError rather than handed to
         * the solver, as is any solver status other than solved.
         */
        class MeanVariancePolicy : public AllocationPolicy
        {
        public:
            /**
             * @param risk_aversion lambda > 0
             * @throws ConfigurationError if risk_aversion is not positive
             */
            explicit MeanVariancePolicy(double risk_aversion = 1.0,
                                        const PolicyConstraints &constraints = PolicyConstraints(),
                                        std::shared_ptr<const risk::RiskModel> risk_model = nullptr,
                                        int periods_per_year = 252,
                                        const SolverOptions &solver_options = SolverOptions());

            AllocationResult optimize(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const override;

            std::string get_name() const override { return "MeanVariance"; }
            nlohmann::json get_parameters() const override;

            double risk_aversion() const { return risk_aversion_; }

        private:
            double risk_aversion_;
            OSQPSolver solver_;
        };

    } // namespace policy
} // namespace portsim
