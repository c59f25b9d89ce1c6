#include "portsim/policy/equal_weight_policy.hpp"

namespace portsim
{
    namespace policy
    {

        AllocationResult EqualWeightPolicy::optimize(
            const ReturnsHistory &history,
            const Eigen::VectorXd &current_weights) const
        {
            validate_history(history, current_weights);

            AllocationResult result = make_result(history, equal_weights(history.num_assets()), nullptr);
            result.message = "equal weight";
            return result;
        }

        nlohmann::json EqualWeightPolicy::get_parameters() const
        {
            nlohmann::json params;
            params["policy"] = get_name();
            return params;
        }

    } // namespace policy
} // namespace portsim
