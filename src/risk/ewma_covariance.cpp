#include "portsim/risk/ewma_covariance.hpp"
#include <cmath>
#include <stdexcept>

namespace portsim
{
    namespace risk
    {

        EWMACovariance::EWMACovariance(double lambda)
            : lambda_(lambda)
        {
            if (!(lambda > 0.0 && lambda < 1.0))
            {
                throw std::invalid_argument("EWMA decay must lie strictly between 0 and 1, got " +
                                            std::to_string(lambda));
            }
        }

        Eigen::VectorXd EWMACovariance::observation_weights(Eigen::Index periods) const
        {
            Eigen::VectorXd w(periods);
            for (Eigen::Index t = 1; t < periods; ++t)
            {
                w(t) = get_weight(static_cast<int>(periods - 1 - t));
            }
            // seed period
            w(0) = std::pow(lambda_, static_cast<double>(periods - 1));
            return w;
        }

        double EWMACovariance::get_weight(int i) const
        {
            if (i < 0)
            {
                throw std::invalid_argument("lag must be non-negative, got " + std::to_string(i));
            }
            return (1.0 - lambda_) * std::pow(lambda_, static_cast<double>(i));
        }

    } // namespace risk
} // namespace portsim
