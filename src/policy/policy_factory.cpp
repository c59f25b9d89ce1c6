/**
 * @file policy_factory.cpp
 * @brief Implementation of allocation policy factory
 */

#include "portsim/policy/policy_factory.hpp"
#include "portsim/policy/equal_weight_policy.hpp"
#include "portsim/policy/mean_variance_policy.hpp"
#include "portsim/policy/min_variance_policy.hpp"
#include "portsim/policy/max_sharpe_policy.hpp"
#include "portsim/policy/risk_parity_policy.hpp"
#include "portsim/policy/kelly_policy.hpp"
#include "portsim/core/errors.hpp"
#include <cctype>

namespace portsim
{
    namespace policy
    {

        PolicyConfig PolicyConfig::from_json(const nlohmann::json &j)
        {
            if (j.is_string())
            {
                PolicyConfig config;
                config.type = j.get<std::string>();
                return config;
            }
            if (!j.is_object())
            {
                throw ConfigurationError("policy configuration must be an object or a type name");
            }
            if (!j.contains("type") || !j["type"].is_string())
            {
                throw ConfigurationError("policy configuration must specify 'type'");
            }

            PolicyConfig config;
            try
            {
                config.type = j["type"].get<std::string>();
                config.risk_aversion = j.value("risk_aversion", config.risk_aversion);
                config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);
                config.tolerance = j.value("tolerance", config.tolerance);
                config.max_iterations = j.value("max_iterations", config.max_iterations);
                config.risk_budget = j.value("risk_budget", config.risk_budget);
                config.cleanup_threshold = j.value("cleanup_threshold", config.cleanup_threshold);
                config.kelly_fraction = j.value("kelly_fraction", config.kelly_fraction);
                config.periods_per_year = j.value("periods_per_year", config.periods_per_year);

                if (j.contains("solver"))
                {
                    const auto &s = j["solver"];
                    config.solver.max_iterations = s.value("max_iterations", config.solver.max_iterations);
                    config.solver.tolerance = s.value("tolerance", config.solver.tolerance);
                    config.solver.polish = s.value("polish", config.solver.polish);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigurationError(std::string("invalid policy field: ") + e.what());
            }

            config.constraints = PolicyConstraints::from_json(j.value("constraints", nlohmann::json::object()));
            try
            {
                config.constraints.allow_short = j.value("allow_short", config.constraints.allow_short);
                config.constraints.min_weight = j.value("min_weight", config.constraints.min_weight);
                config.constraints.max_weight = j.value("max_weight", config.constraints.max_weight);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigurationError(std::string("invalid policy field: ") + e.what());
            }
            config.constraints.validate();

            if (!(config.tolerance > 0.0))
            {
                throw ConfigurationError("policy tolerance must be positive, got: " + std::to_string(config.tolerance));
            }
            if (config.max_iterations < 1)
            {
                throw ConfigurationError("policy max_iterations must be at least 1, got: " +
                                         std::to_string(config.max_iterations));
            }
            if (config.periods_per_year < 1)
            {
                throw ConfigurationError("periods_per_year must be at least 1, got: " +
                                         std::to_string(config.periods_per_year));
            }
            return config;
        }

        nlohmann::json PolicyConfig::to_json() const
        {
            return nlohmann::json{
                {"type", type},
                {"risk_aversion", risk_aversion},
                {"risk_free_rate", risk_free_rate},
                {"tolerance", tolerance},
                {"max_iterations", max_iterations},
                {"risk_budget", risk_budget},
                {"cleanup_threshold", cleanup_threshold},
                {"kelly_fraction", kelly_fraction},
                {"periods_per_year", periods_per_year},
                {"constraints", constraints.to_json()}};
        }

        std::string PolicyFactory::normalize_type(const std::string &type)
        {
            std::string normalized;
            normalized.reserve(type.size());
            for (unsigned char c : type)
            {
                if (c == '_' || c == '-' || std::isspace(c))
                    continue;
                normalized.push_back(static_cast<char>(std::tolower(c)));
            }
            return normalized;
        }

        std::unique_ptr<AllocationPolicy> PolicyFactory::create(
            const PolicyConfig &config,
            std::shared_ptr<const risk::RiskModel> risk_model)
        {
            const std::string type = normalize_type(config.type);

            if (type == "equalweight" || type == "equal")
            {
                return std::make_unique<EqualWeightPolicy>();
            }
            if (type == "meanvariance" || type == "mv")
            {
                return std::make_unique<MeanVariancePolicy>(config.risk_aversion, config.constraints,
                                                            risk_model, config.periods_per_year, config.solver);
            }
            if (type == "minvariance" || type == "minimumvariance")
            {
                return std::make_unique<MinVariancePolicy>(config.constraints, risk_model,
                                                           config.periods_per_year, config.cleanup_threshold,
                                                           config.solver);
            }
            if (type == "maxsharpe" || type == "tangency")
            {
                return std::make_unique<MaxSharpePolicy>(config.risk_free_rate, config.constraints,
                                                         risk_model, config.periods_per_year, config.solver);
            }
            if (type == "riskparity" || type == "erc")
            {
                return std::make_unique<RiskParityPolicy>(config.tolerance, config.max_iterations,
                                                          config.risk_budget, risk_model,
                                                          config.periods_per_year);
            }
            if (type == "kelly")
            {
                return std::make_unique<KellyPolicy>(config.kelly_fraction, risk_model, config.periods_per_year);
            }

            throw ConfigurationError(
                "Unknown policy type: '" + config.type +
                "'. Valid options: equal_weight, mean_variance, risk_parity, max_sharpe, min_variance, kelly");
        }

        std::unique_ptr<AllocationPolicy> PolicyFactory::create(const std::string &type)
        {
            PolicyConfig config;
            config.type = type;
            return create(config);
        }

        std::vector<std::string> PolicyFactory::get_supported_types()
        {
            return {"equal_weight", "mean_variance", "risk_parity", "max_sharpe", "min_variance", "kelly"};
        }

    } // namespace policy
} // namespace portsim
