#pragma once

#include "domain/IndicatorPoint.hpp"
#include "domain/OrderBookSnapshot.hpp"
#include "domain/Ticker.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Преобразование наблюдений в столбцы и обратно
 *
 * Каждая специализация задаёт имя схемы, её версию, набор столбцов
 * (encode/decode) и оценку занимаемой записью памяти. Десятичные
 * значения кодируются строками, чтобы файл воспроизводил их без потерь.
 */
template <typename Observation>
struct ColumnarCodec;

template <>
struct ColumnarCodec<domain::Ticker> {
    static constexpr const char* SCHEMA = "ticker";
    static constexpr int VERSION = 1;

    static nlohmann::json encode(const std::vector<domain::Ticker>& rows);
    static std::vector<domain::Ticker> decode(const nlohmann::json& columns, size_t rowCount);
    static size_t estimateBytes(const domain::Ticker& row);
};

template <>
struct ColumnarCodec<domain::OrderBookSnapshot> {
    static constexpr const char* SCHEMA = "order_book";
    static constexpr int VERSION = 1;

    static nlohmann::json encode(const std::vector<domain::OrderBookSnapshot>& rows);
    static std::vector<domain::OrderBookSnapshot> decode(const nlohmann::json& columns, size_t rowCount);
    static size_t estimateBytes(const domain::OrderBookSnapshot& row);
};

template <>
struct ColumnarCodec<domain::IndicatorPoint> {
    static constexpr const char* SCHEMA = "indicator";
    static constexpr int VERSION = 1;

    static nlohmann::json encode(const std::vector<domain::IndicatorPoint>& rows);
    static std::vector<domain::IndicatorPoint> decode(const nlohmann::json& columns, size_t rowCount);
    static size_t estimateBytes(const domain::IndicatorPoint& row);
};

} // namespace memtrade::adapters::secondary
