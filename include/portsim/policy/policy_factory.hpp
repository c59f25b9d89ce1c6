/**
 * @file policy_factory.hpp
 * @brief Factory for creating allocation policies from configuration
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "policy": {
 *     "type": "risk_parity",
 *     "tolerance": 1e-8,
 *     "max_iterations": 500
 *   }
 * }
 * @endcode
 */

#pragma once

#include "portsim/policy/allocation_policy.hpp"
#include "portsim/policy/osqp_solver.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace portsim
{
    namespace policy
    {

        /**
         * @struct PolicyConfig
         * @brief Parameters for every supported policy; unused ones are ignored
         */
        struct PolicyConfig
        {
            /// equal_weight, mean_variance, risk_parity, max_sharpe, min_variance, kelly
            std::string type = "equal_weight";

            double risk_aversion = 1.0;      ///< MeanVariance
            double risk_free_rate = 0.02;    ///< MaxSharpe
            double tolerance = 1e-8;         ///< RiskParity
            int max_iterations = 1000;       ///< RiskParity
            std::vector<double> risk_budget; ///< RiskParity, empty means equal
            double cleanup_threshold = 0.01; ///< MinVariance
            double kelly_fraction = 1.0;     ///< Kelly
            int periods_per_year = 252;

            PolicyConstraints constraints;
            SolverOptions solver;

            /**
             * @throws ConfigurationError on missing type or wrongly typed fields
             */
            static PolicyConfig from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
        };

        class PolicyFactory
        {
        public:
            /**
             * @brief Create a policy from configuration
             * @param risk_model Shared covariance estimator, sample covariance when null
             * @throws ConfigurationError if type is unknown or parameters are invalid
             */
            static std::unique_ptr<AllocationPolicy> create(
                const PolicyConfig &config,
                std::shared_ptr<const risk::RiskModel> risk_model = nullptr);

            static std::unique_ptr<AllocationPolicy> create(const std::string &type);

            /// Canonical type names of the supported policies.
            static std::vector<std::string> get_supported_types();

            /**
             * @brief Lowercase and drop '_' / '-', so "MaxSharpe" == "max_sharpe"
             */
            static std::string normalize_type(const std::string &type);
        };

    } // namespace policy
} // namespace portsim
