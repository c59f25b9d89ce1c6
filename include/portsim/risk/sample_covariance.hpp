/**
 * @file sample_covariance.hpp
 * @brief Equally weighted covariance of the lookback window
 */

#pragma once

#include "portsim/risk/risk_model.hpp"

namespace portsim
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Every period weighs 1/(T-1), or 1/T without Bessel's correction
         *
         * Singular when the window is shorter than the number of assets; the
         * QP policies still solve, min-variance then has no unique answer.
         */
        class SampleCovariance : public RiskModel
        {
        public:
            explicit SampleCovariance(bool bias_correction = true);

            Eigen::VectorXd observation_weights(Eigen::Index periods) const override;

            std::string get_name() const override { return "SampleCovariance"; }

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_;
        };

    } // namespace risk
} // namespace portsim
