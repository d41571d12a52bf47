#pragma once

#include <stdexcept>
#include <string>

namespace memtrade::domain {

/**
 * @brief Тип ордера
 */
enum class OrderType {
    LIMIT,
    MARKET,
    STOP,
    STOP_LIMIT
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::LIMIT:      return "LIMIT";
        case OrderType::MARKET:     return "MARKET";
        case OrderType::STOP:       return "STOP";
        case OrderType::STOP_LIMIT: return "STOP_LIMIT";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderType orderTypeFromString(const std::string& str) {
    if (str == "LIMIT")      return OrderType::LIMIT;
    if (str == "MARKET")     return OrderType::MARKET;
    if (str == "STOP")       return OrderType::STOP;
    if (str == "STOP_LIMIT") return OrderType::STOP_LIMIT;
    throw std::invalid_argument("Unknown OrderType: " + str);
}

} // namespace memtrade::domain
