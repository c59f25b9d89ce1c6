#pragma once

#include "portsim/policy/allocation_policy.hpp"

namespace portsim
{
    namespace policy
    {

        /**
         * @class EqualWeightPolicy
         * @brief 1/N across every tracked asset; ignores returns and constraints.
         */
        class EqualWeightPolicy : public AllocationPolicy
        {
        public:
            EqualWeightPolicy() = default;

            AllocationResult optimize(
                const ReturnsHistory &history,
                const Eigen::VectorXd &current_weights = Eigen::VectorXd()) const override;

            std::string get_name() const override { return "EqualWeight"; }
            nlohmann::json get_parameters() const override;
            bool uses_history() const override { return false; }
        };

    } // namespace policy
} // namespace portsim
