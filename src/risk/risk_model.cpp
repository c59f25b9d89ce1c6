/**
 * @file risk_model.cpp
 * @brief Weighted outer-product kernel shared by the covariance estimators
 */

#include "portsim/risk/risk_model.hpp"
#include <stdexcept>

namespace portsim
{
    namespace risk
    {
        namespace
        {
            void check_window(const Eigen::MatrixXd &returns)
            {
                if (returns.cols() == 0)
                {
                    throw std::invalid_argument("returns window has no assets");
                }
                if (returns.rows() < 2)
                {
                    throw std::invalid_argument("covariance needs at least 2 periods of returns, got " +
                                                std::to_string(returns.rows()));
                }
                if (!returns.allFinite())
                {
                    throw std::invalid_argument("returns window has missing or infinite values; "
                                                "trim it to fully priced periods first");
                }
            }
        } // namespace

        Eigen::MatrixXd RiskModel::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            check_window(returns);

            const Eigen::VectorXd w = observation_weights(returns.rows());
            if (w.size() != returns.rows())
            {
                throw std::logic_error(get_name() + " returned " + std::to_string(w.size()) +
                                       " weights for " + std::to_string(returns.rows()) + " periods");
            }

            const Eigen::MatrixXd centered = returns.rowwise() - returns.colwise().mean();
            Eigen::MatrixXd covariance = centered.transpose() * w.asDiagonal() * centered;

            // the product is symmetric only up to rounding; the QP solvers want it exact
            covariance = 0.5 * (covariance + covariance.transpose()).eval();
            return covariance;
        }

        Eigen::MatrixXd RiskModel::estimate_correlation(const Eigen::MatrixXd &returns) const
        {
            return to_correlation(estimate_covariance(returns));
        }

        Eigen::MatrixXd RiskModel::to_correlation(const Eigen::MatrixXd &covariance)
        {
            if (covariance.rows() == 0 || covariance.rows() != covariance.cols())
            {
                throw std::invalid_argument("covariance must be a non-empty square matrix");
            }

            const Eigen::ArrayXd variance = covariance.diagonal().array();
            for (Eigen::Index i = 0; i < variance.size(); ++i)
            {
                if (!(variance(i) > 0.0))
                {
                    throw std::invalid_argument("asset " + std::to_string(i) +
                                                " has no variance, correlation is undefined");
                }
            }

            const Eigen::VectorXd inv_sd = variance.rsqrt().matrix();
            Eigen::MatrixXd correlation = inv_sd.asDiagonal() * covariance * inv_sd.asDiagonal();
            correlation = correlation.cwiseMax(-1.0).cwiseMin(1.0);
            correlation.diagonal().setOnes();
            return correlation;
        }

    } // namespace risk
} // namespace portsim
