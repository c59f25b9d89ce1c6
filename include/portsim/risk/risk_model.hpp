/**
 * @file risk_model.hpp
 * @brief Covariance estimators used by the allocation policies
 *
 * Every estimator here is a weighted sum of outer products of the demeaned
 * lookback window:
 *
 *     Cov = sum_t w_t * (r_t - mean)(r_t - mean)^T
 *
 * and differs only in the observation weights w_t. The policies hold the
 * estimator through a shared pointer, so one instance may serve every
 * portfolio of a comparison run; estimators keep no state between calls.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace portsim
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Base class for covariance estimation over a returns window
         *
         * @code
         * auto model = std::make_shared<EWMACovariance>(0.94);
         * MinVariancePolicy policy(PolicyConstraints(), model);
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Per-period covariance of a returns window
             * @param returns Rows are periods (oldest first), columns are assets
             * @return Symmetric n_assets x n_assets matrix
             * @throws std::invalid_argument for fewer than 2 periods, no assets or missing values
             */
            Eigen::MatrixXd estimate_covariance(const Eigen::MatrixXd &returns) const;

            /// Correlation of the same window; values clamped to [-1, 1]
            Eigen::MatrixXd estimate_correlation(const Eigen::MatrixXd &returns) const;

            /**
             * @brief Weight applied to each demeaned period, oldest first
             * @param periods Window length, at least 2
             */
            virtual Eigen::VectorXd observation_weights(Eigen::Index periods) const = 0;

            virtual std::string get_name() const = 0;

            /**
             * @brief Scale a covariance matrix into correlations
             * @throws std::invalid_argument if an asset has zero variance
             */
            static Eigen::MatrixXd to_correlation(const Eigen::MatrixXd &covariance);
        };

    } // namespace risk
} // namespace portsim
