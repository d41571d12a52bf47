#pragma once

#include "Decimal.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace memtrade::domain {

struct PriceLevel {
    Decimal price;
    Decimal amount;

    bool operator==(const PriceLevel& other) const {
        return price == other.price && amount == other.amount;
    }
};

/**
 * @brief Снимок верхних уровней стакана
 *
 * bids отсортированы по убыванию цены, asks по возрастанию.
 */
struct OrderBookSnapshot {
    static constexpr size_t DEPTH = 10;

    std::string symbol;
    int64_t timestamp = 0;  ///< Миллисекунды с эпохи
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;

    Decimal bestBid() const { return bids.empty() ? Decimal() : bids.front().price; }
    Decimal bestAsk() const { return asks.empty() ? Decimal() : asks.front().price; }

    Decimal spread() const {
        return (bids.empty() || asks.empty()) ? Decimal() : bestAsk() - bestBid();
    }

    Decimal bidVolume() const { return volumeOf(bids); }
    Decimal askVolume() const { return volumeOf(asks); }

    bool operator==(const OrderBookSnapshot& other) const {
        return symbol == other.symbol && timestamp == other.timestamp &&
               bids == other.bids && asks == other.asks;
    }

private:
    static Decimal volumeOf(const std::vector<PriceLevel>& levels) {
        Decimal total;
        for (const auto& level : levels) {
            total += level.amount;
        }
        return total;
    }
};

} // namespace memtrade::domain
