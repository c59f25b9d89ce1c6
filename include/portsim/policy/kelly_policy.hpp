#pragma once

#include "portsim/policy/allocation_policy.hpp"

namespace portsim
{
    namespace policy
    {

        /**
         * @class KellyPolicy
         * @brief Per-asset Kelly fractions, renormalised to a fully invested book.
         *
         * raw_i = clamp(fraction * mu_i / sigma_i^2, 0, 1); weights are raw / sum(raw).
         * Equal weight is used when every raw fraction is zero.
         */
        class KellyPolicy : public AllocationPolicy
        {
        public:
            /**
             * @param fraction Kelly multiplier in (0, 1]
             * @throws ConfigurationError if fraction is out of range
             */
            explicit KellyPolicy(double fraction = 1.0,
                                 std::shared_ptr<const risk::RiskModel> risk_model = nullptr,
                                 int periods_per_year = 252);

            AllocationResult optimize(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const override;

            std::string get_name() const override { return "Kelly"; }
            nlohmann::json get_parameters() const override;

        private:
            double fraction_;
        };

    } // namespace policy
} // namespace portsim
