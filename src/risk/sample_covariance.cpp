#include "portsim/risk/sample_covariance.hpp"

namespace portsim
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction)
            : bias_correction_(bias_correction)
        {
        }

        Eigen::VectorXd SampleCovariance::observation_weights(Eigen::Index periods) const
        {
            const double divisor = static_cast<double>(bias_correction_ ? periods - 1 : periods);
            return Eigen::VectorXd::Constant(periods, 1.0 / divisor);
        }

    } // namespace risk
} // namespace portsim
