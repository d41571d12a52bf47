#pragma once

#include "Decimal.hpp"

#include <cstdint>
#include <string>

namespace memtrade::domain {

/**
 * @brief Значение технического индикатора в момент времени
 */
struct IndicatorPoint {
    std::string symbol;
    int64_t timestamp = 0;  ///< Миллисекунды с эпохи
    std::string name;       ///< "rsi_14", "ema_50", ...
    Decimal value;

    bool operator==(const IndicatorPoint& other) const {
        return symbol == other.symbol && timestamp == other.timestamp &&
               name == other.name && value == other.value;
    }
};

} // namespace memtrade::domain
