/**
 * @file risk_model_factory.hpp
 * @brief Builds the covariance estimator named in the run configuration
 *
 * @code{.json}
 * "risk_model": { "type": "ewma", "lambda": 0.97 }
 * @endcode
 */

#pragma once

#include "portsim/risk/risk_model.hpp"
#include "portsim/risk/sample_covariance.hpp"
#include "portsim/risk/ewma_covariance.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace portsim
{
    namespace risk
    {

        struct RiskModelConfig
        {
            /// "sample" or "ewma"; case, '_' and '-' are ignored
            std::string type = "sample";

            bool bias_correction = true; ///< sample only
            double ewma_lambda = 0.94;   ///< ewma only, also read from "lambda"

            /// @throws ConfigurationError if j is not an object or a field has the wrong type
            static RiskModelConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        class RiskModelFactory
        {
        public:
            /// @throws ConfigurationError for an unknown type or an out-of-range parameter
            static std::unique_ptr<RiskModel> create(const RiskModelConfig &config);

            /// Same as create(config) with the parameters given as a json object
            static std::unique_ptr<RiskModel> create(const std::string &type, const nlohmann::json &params);
        };

    } // namespace risk
} // namespace portsim
