#include "portsim/backtest/rebalance_scheduler.hpp"
#include "portsim/core/dates.hpp"
#include "portsim/core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace portsim {
namespace backtest {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

RebalanceConfig RebalanceConfig::from_json(const nlohmann::json& j) {
    RebalanceConfig cfg;
    if (j.is_string()) {
        cfg.frequency = parse_frequency(j.get<std::string>());
    } else if (j.is_object() && j.contains("frequency")) {
        cfg.frequency = parse_frequency(j.at("frequency").get<std::string>());
    }
    return cfg;
}

RebalanceConfig RebalanceConfig::from_string(const std::string& freq_str) {
    RebalanceConfig cfg;
    cfg.frequency = parse_frequency(freq_str);
    return cfg;
}

RebalanceFrequency RebalanceConfig::parse_frequency(const std::string& freq_str) {
    auto s = to_lower(freq_str);
    if (s == "none" || s == "never" || s == "buy_and_hold") return RebalanceFrequency::NONE;
    if (s == "daily" || s == "d") return RebalanceFrequency::DAILY;
    if (s == "weekly" || s == "w") return RebalanceFrequency::WEEKLY;
    if (s == "monthly" || s == "m") return RebalanceFrequency::MONTHLY;
    if (s == "quarterly" || s == "q") return RebalanceFrequency::QUARTERLY;
    if (s == "annually" || s == "annual" || s == "y" || s == "yearly") return RebalanceFrequency::ANNUALLY;
    throw ConfigurationError("Invalid rebalance frequency: " + freq_str);
}

std::string RebalanceConfig::to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::NONE: return "none";
        case RebalanceFrequency::DAILY: return "daily";
        case RebalanceFrequency::WEEKLY: return "weekly";
        case RebalanceFrequency::MONTHLY: return "monthly";
        case RebalanceFrequency::QUARTERLY: return "quarterly";
        case RebalanceFrequency::ANNUALLY: return "annually";
    }
    return "unknown";
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config), last_rebalance_date_(), rebalance_count_(0) {}

bool RebalanceScheduler::should_rebalance(const std::string& date) const {
    const dates::CivilDate d = dates::parse(date);
    if (last_rebalance_date_.empty()) return true;
    const dates::CivilDate last = dates::parse(last_rebalance_date_);

    switch (config_.frequency) {
        case RebalanceFrequency::NONE:
            return false;
        case RebalanceFrequency::DAILY:
            return date != last_rebalance_date_;
        case RebalanceFrequency::WEEKLY:
            return dates::week_index(date) != dates::week_index(last_rebalance_date_);
        case RebalanceFrequency::MONTHLY:
            return d.year != last.year || d.month != last.month;
        case RebalanceFrequency::QUARTERLY:
            return d.year != last.year || (d.month - 1) / 3 != (last.month - 1) / 3;
        case RebalanceFrequency::ANNUALLY:
            return d.year != last.year;
    }
    return false;
}

void RebalanceScheduler::record_rebalance(const std::string& date) {
    last_rebalance_date_ = date;
    ++rebalance_count_;
}

void RebalanceScheduler::reset() {
    last_rebalance_date_.clear();
    rebalance_count_ = 0;
}

} // namespace backtest
} // namespace portsim
