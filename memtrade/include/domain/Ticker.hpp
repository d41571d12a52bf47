#pragma once

#include "Decimal.hpp"

#include <cstdint>
#include <string>

namespace memtrade::domain {

/**
 * @brief Снимок котировки инструмента
 *
 * Неизменяемое наблюдение, идентифицируется парой (symbol, timestamp).
 */
struct Ticker {
    std::string symbol;
    int64_t timestamp = 0;  ///< Миллисекунды с эпохи
    Decimal last;
    Decimal bid;
    Decimal ask;
    Decimal high;
    Decimal low;
    Decimal baseVolume;

    bool operator==(const Ticker& other) const {
        return symbol == other.symbol && timestamp == other.timestamp &&
               last == other.last && bid == other.bid && ask == other.ask &&
               high == other.high && low == other.low && baseVolume == other.baseVolume;
    }
};

} // namespace memtrade::domain
