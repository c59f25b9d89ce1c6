#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace portsim {
namespace backtest {

enum class RebalanceFrequency {
    NONE,       // only the initial allocation
    DAILY,
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    ANNUALLY
};

struct RebalanceConfig {
    RebalanceFrequency frequency = RebalanceFrequency::MONTHLY;

    static RebalanceConfig from_json(const nlohmann::json& j);
    static RebalanceConfig from_string(const std::string& freq_str);

    /// @throws ConfigurationError for an unrecognised name
    static RebalanceFrequency parse_frequency(const std::string& freq_str);
    static std::string to_string(RebalanceFrequency frequency);
};

/**
 * @brief Decides which simulation steps are rebalance points.
 *
 * The first step seen is always a rebalance point. Afterwards a calendar
 * frequency triggers on the first trading day whose period (ISO week,
 * month, quarter, year) differs from the last rebalance.
 */
class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    /// @throws std::invalid_argument if date is not YYYY-MM-DD
    bool should_rebalance(const std::string& date) const;

    void record_rebalance(const std::string& date);
    void reset();

    const RebalanceConfig& config() const { return config_; }
    const std::string& last_rebalance_date() const { return last_rebalance_date_; }
    int rebalance_count() const { return rebalance_count_; }

private:
    RebalanceConfig config_;
    std::string last_rebalance_date_;
    int rebalance_count_;
};

} // namespace backtest
} // namespace portsim
