#pragma once

#include "SettingsUtils.hpp"
#include "domain/Decimal.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <stdexcept>

namespace memtrade::settings {

/**
 * @brief Настройки монитора устаревших ордеров (секция "stale_order_monitor")
 */
class MonitorSettings {
public:
    MonitorSettings() : MonitorSettings(nlohmann::json::object()) {}

    explicit MonitorSettings(const nlohmann::json& section) {
        enabled_ = valueOr<bool>(section, "enabled", true);
        maxAgeMinutes_ = valueOr<int>(section, "max_age_minutes", 15);
        maxPriceDeviationPercent_ = decimalOr(section, "max_price_deviation_percent", domain::Decimal::fromInt(3));
        checkIntervalSeconds_ = valueOr<int>(section, "check_interval_seconds", 60);
        minRecreationCooldownSeconds_ = valueOr<int>(section, "min_recreation_cooldown_seconds", 0);
        priceOffsetPercent_ = decimalOr(section, "price_offset_percent", domain::Decimal::parse("0.1"));
        statusQueryAttempts_ = valueOr<int>(section, "status_query_attempts", 2);
        summaryIntervalSeconds_ = valueOr<int>(section, "summary_interval_seconds", 300);

        if (maxPriceDeviationPercent_.isNegative() || priceOffsetPercent_.isNegative()) {
            throw std::invalid_argument("stale_order_monitor percentages must be non-negative");
        }
        if (maxAgeMinutes_ <= 0 || checkIntervalSeconds_ <= 0) {
            throw std::invalid_argument("stale_order_monitor intervals must be positive");
        }
        if (statusQueryAttempts_ < 1) {
            statusQueryAttempts_ = 1;
        }
    }

    bool isEnabled() const { return enabled_; }
    std::chrono::minutes getMaxAge() const { return std::chrono::minutes(maxAgeMinutes_); }
    domain::Decimal getMaxPriceDeviationPercent() const { return maxPriceDeviationPercent_; }
    std::chrono::seconds getCheckInterval() const { return std::chrono::seconds(checkIntervalSeconds_); }
    std::chrono::seconds getMinRecreationCooldown() const {
        return std::chrono::seconds(minRecreationCooldownSeconds_);
    }
    /// Насколько ниже рынка выставляется замещающий ордер, в процентах
    domain::Decimal getPriceOffsetPercent() const { return priceOffsetPercent_; }
    int getStatusQueryAttempts() const { return statusQueryAttempts_; }
    std::chrono::seconds getSummaryInterval() const { return std::chrono::seconds(summaryIntervalSeconds_); }

private:
    bool enabled_ = true;
    int maxAgeMinutes_ = 15;
    domain::Decimal maxPriceDeviationPercent_;
    int checkIntervalSeconds_ = 60;
    int minRecreationCooldownSeconds_ = 0;
    domain::Decimal priceOffsetPercent_;
    int statusQueryAttempts_ = 2;
    int summaryIntervalSeconds_ = 300;
};

} // namespace memtrade::settings
