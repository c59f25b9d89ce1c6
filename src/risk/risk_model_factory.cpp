#include "portsim/risk/risk_model_factory.hpp"
#include "portsim/core/errors.hpp"
#include <cctype>

namespace portsim
{
    namespace risk
    {
        namespace
        {
            std::string canonical(const std::string &type)
            {
                std::string out;
                for (unsigned char c : type)
                {
                    if (c == '_' || c == '-' || std::isspace(c))
                        continue;
                    out.push_back(static_cast<char>(std::tolower(c)));
                }
                return out;
            }
        } // namespace

        RiskModelConfig RiskModelConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ConfigurationError("risk_model must be a json object, got " + std::string(j.type_name()));
            }

            RiskModelConfig config;
            try
            {
                config.type = j.value("type", config.type);
                config.bias_correction = j.value("bias_correction", config.bias_correction);
                config.ewma_lambda = j.value("lambda", config.ewma_lambda);
                config.ewma_lambda = j.value("ewma_lambda", config.ewma_lambda);
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ConfigurationError(std::string("risk_model: ") + e.what());
            }
            return config;
        }

        nlohmann::json RiskModelConfig::to_json() const
        {
            return {{"type", type}, {"bias_correction", bias_correction}, {"ewma_lambda", ewma_lambda}};
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create(const RiskModelConfig &config)
        {
            const std::string type = canonical(config.type);

            if (type == "sample" || type == "samplecovariance")
            {
                return std::make_unique<SampleCovariance>(config.bias_correction);
            }
            if (type == "ewma" || type == "ewmacovariance")
            {
                if (!(config.ewma_lambda > 0.0 && config.ewma_lambda < 1.0))
                {
                    throw ConfigurationError("risk_model.ewma_lambda must be in (0, 1), got " +
                                             std::to_string(config.ewma_lambda));
                }
                return std::make_unique<EWMACovariance>(config.ewma_lambda);
            }

            throw ConfigurationError("Unknown risk model type: '" + config.type + "'. Valid options: sample, ewma");
        }

        std::unique_ptr<RiskModel> RiskModelFactory::create(const std::string &type, const nlohmann::json &params)
        {
            nlohmann::json doc = params.is_null() ? nlohmann::json::object() : params;
            RiskModelConfig config = RiskModelConfig::from_json(doc);
            config.type = type;
            return create(config);
        }

    } // namespace risk
} // namespace portsim
