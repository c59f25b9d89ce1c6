/**
 * @file ewma_covariance.hpp
 * @brief Exponentially weighted covariance (RiskMetrics style)
 *
 * Equivalent to seeding with the oldest demeaned period and folding in each
 * later one as Cov = lambda * Cov + (1 - lambda) * r r^T. Unrolled, period t
 * of a T-period window weighs (1 - lambda) * lambda^(T-1-t) and the oldest
 * period carries the remaining lambda^(T-1), so the weights sum to one.
 */

#pragma once

#include "portsim/risk/risk_model.hpp"

namespace portsim
{
    namespace risk
    {

        class EWMACovariance : public RiskModel
        {
        public:
            /**
             * @param lambda Decay in (0, 1); 0.94 is the usual daily setting
             * @throws std::invalid_argument if lambda is out of range
             */
            explicit EWMACovariance(double lambda = 0.94);

            Eigen::VectorXd observation_weights(Eigen::Index periods) const override;

            std::string get_name() const override { return "EWMACovariance"; }

            double get_lambda() const { return lambda_; }

            /// Weight of the period i steps back from the newest: (1 - lambda) * lambda^i
            double get_weight(int i) const;

        private:
            double lambda_;
        };

    } // namespace risk
} // namespace portsim
