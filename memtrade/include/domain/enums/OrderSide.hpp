#pragma once

#include <stdexcept>
#include <string>

namespace memtrade::domain {

/**
 * @brief Направление ордера
 */
enum class OrderSide {
    BUY,
    SELL
};

inline std::string toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderSide orderSideFromString(const std::string& str) {
    if (str == "BUY")  return OrderSide::BUY;
    if (str == "SELL") return OrderSide::SELL;
    throw std::invalid_argument("Unknown OrderSide: " + str);
}

} // namespace memtrade::domain
