#pragma once

#include "domain/Order.hpp"
#include "settings/MonitorSettings.hpp"

#include <optional>
#include <sstream>
#include <string>

namespace memtrade::application {

/**
 * @brief Правило "устаревшего" ордера
 *
 * Ордер устарел, если выполняется хотя бы одно условие:
 * - now - createdAt > maxAge;
 * - |market - price| / price * 100 > maxPriceDeviationPercent.
 */
class StalenessPolicy {
public:
    /**
     * @return Причина, если ордер устарел, иначе nullopt
     */
    static std::optional<std::string> evaluate(
        const domain::Order& order,
        const std::optional<domain::Decimal>& marketPrice,
        const domain::Timestamp& now,
        const settings::MonitorSettings& settings)
    {
        const auto age = now - order.createdAt;
        if (age > settings.getMaxAge()) {
            std::ostringstream reason;
            reason << "age " << std::chrono::duration_cast<std::chrono::seconds>(age).count()
                   << "s exceeds " << settings.getMaxAge().count() << "m";
            return reason.str();
        }

        if (marketPrice && order.price.isPositive()) {
            const auto deviation = deviationPercent(order.price, *marketPrice);
            if (deviation > settings.getMaxPriceDeviationPercent()) {
                std::ostringstream reason;
                reason << "price " << order.price << " deviates " << deviation.floorToScale(2)
                       << "% from market " << *marketPrice;
                return reason.str();
            }
        }

        return std::nullopt;
    }

    /// |market - price| / price * 100
    static domain::Decimal deviationPercent(const domain::Decimal& price, const domain::Decimal& market) {
        return (market - price).abs() / price * domain::Decimal::fromInt(100);
    }
};

} // namespace memtrade::application
