#include "adapters/secondary/stream/ColumnarCodec.hpp"

#include <stdexcept>
#include <string>

namespace memtrade::adapters::secondary {

namespace {

using nlohmann::json;

const json& column(const json& columns, const char* name, size_t rowCount) {
    if (!columns.contains(name) || !columns.at(name).is_array() ||
        columns.at(name).size() != rowCount) {
        throw std::runtime_error(std::string("Batch file: missing or short column '") + name + "'");
    }
    return columns.at(name);
}

domain::Decimal decimalAt(const json& col, size_t i) {
    return domain::Decimal::parse(col.at(i).get<std::string>());
}

json levelsToJson(const std::vector<domain::PriceLevel>& levels) {
    json out = json::array();
    for (const auto& level : levels) {
        out.push_back(json::array({level.price.toString(), level.amount.toString()}));
    }
    return out;
}

std::vector<domain::PriceLevel> levelsFromJson(const json& in) {
    std::vector<domain::PriceLevel> levels;
    levels.reserve(in.size());
    for (const auto& pair : in) {
        levels.push_back({domain::Decimal::parse(pair.at(0).get<std::string>()),
                          domain::Decimal::parse(pair.at(1).get<std::string>())});
    }
    return levels;
}

} // namespace

// ============================================================================
// Ticker
// ============================================================================

json ColumnarCodec<domain::Ticker>::encode(const std::vector<domain::Ticker>& rows) {
    json symbol = json::array(), timestamp = json::array(), last = json::array(),
         bid = json::array(), ask = json::array(), high = json::array(),
         low = json::array(), volume = json::array();

    for (const auto& t : rows) {
        symbol.push_back(t.symbol);
        timestamp.push_back(t.timestamp);
        last.push_back(t.last.toString());
        bid.push_back(t.bid.toString());
        ask.push_back(t.ask.toString());
        high.push_back(t.high.toString());
        low.push_back(t.low.toString());
        volume.push_back(t.baseVolume.toString());
    }

    return json{{"symbol", symbol}, {"timestamp", timestamp}, {"last", last},
                {"bid", bid}, {"ask", ask}, {"high", high}, {"low", low},
                {"base_volume", volume}};
}

std::vector<domain::Ticker> ColumnarCodec<domain::Ticker>::decode(const json& columns, size_t rowCount) {
    const auto& symbol = column(columns, "symbol", rowCount);
    const auto& timestamp = column(columns, "timestamp", rowCount);
    const auto& last = column(columns, "last", rowCount);
    const auto& bid = column(columns, "bid", rowCount);
    const auto& ask = column(columns, "ask", rowCount);
    const auto& high = column(columns, "high", rowCount);
    const auto& low = column(columns, "low", rowCount);
    const auto& volume = column(columns, "base_volume", rowCount);

    std::vector<domain::Ticker> rows(rowCount);
    for (size_t i = 0; i < rowCount; ++i) {
        auto& t = rows[i];
        t.symbol = symbol.at(i).get<std::string>();
        t.timestamp = timestamp.at(i).get<int64_t>();
        t.last = decimalAt(last, i);
        t.bid = decimalAt(bid, i);
        t.ask = decimalAt(ask, i);
        t.high = decimalAt(high, i);
        t.low = decimalAt(low, i);
        t.baseVolume = decimalAt(volume, i);
    }
    return rows;
}

size_t ColumnarCodec<domain::Ticker>::estimateBytes(const domain::Ticker& row) {
    return sizeof(domain::Ticker) + row.symbol.capacity();
}

// ============================================================================
// OrderBookSnapshot
// ============================================================================

json ColumnarCodec<domain::OrderBookSnapshot>::encode(const std::vector<domain::OrderBookSnapshot>& rows) {
    json symbol = json::array(), timestamp = json::array(), bestBid = json::array(),
         bestAsk = json::array(), spread = json::array(), bidVolume = json::array(),
         askVolume = json::array(), bids = json::array(), asks = json::array();

    for (const auto& book : rows) {
        symbol.push_back(book.symbol);
        timestamp.push_back(book.timestamp);
        bestBid.push_back(book.bestBid().toString());
        bestAsk.push_back(book.bestAsk().toString());
        spread.push_back(book.spread().toString());
        bidVolume.push_back(book.bidVolume().toString());
        askVolume.push_back(book.askVolume().toString());
        bids.push_back(levelsToJson(book.bids));
        asks.push_back(levelsToJson(book.asks));
    }

    return json{{"symbol", symbol}, {"timestamp", timestamp}, {"best_bid", bestBid},
                {"best_ask", bestAsk}, {"spread", spread}, {"bid_volume", bidVolume},
                {"ask_volume", askVolume}, {"bids", bids}, {"asks", asks}};
}

std::vector<domain::OrderBookSnapshot> ColumnarCodec<domain::OrderBookSnapshot>::decode(
    const json& columns, size_t rowCount)
{
    const auto& symbol = column(columns, "symbol", rowCount);
    const auto& timestamp = column(columns, "timestamp", rowCount);
    const auto& bids = column(columns, "bids", rowCount);
    const auto& asks = column(columns, "asks", rowCount);

    std::vector<domain::OrderBookSnapshot> rows(rowCount);
    for (size_t i = 0; i < rowCount; ++i) {
        auto& book = rows[i];
        book.symbol = symbol.at(i).get<std::string>();
        book.timestamp = timestamp.at(i).get<int64_t>();
        book.bids = levelsFromJson(bids.at(i));
        book.asks = levelsFromJson(asks.at(i));
    }
    return rows;
}

size_t ColumnarCodec<domain::OrderBookSnapshot>::estimateBytes(const domain::OrderBookSnapshot& row) {
    return sizeof(domain::OrderBookSnapshot) + row.symbol.capacity() +
           (row.bids.capacity() + row.asks.capacity()) * sizeof(domain::PriceLevel);
}

// ============================================================================
// IndicatorPoint
// ============================================================================

json ColumnarCodec<domain::IndicatorPoint>::encode(const std::vector<domain::IndicatorPoint>& rows) {
    json symbol = json::array(), timestamp = json::array(), name = json::array(), value = json::array();

    for (const auto& p : rows) {
        symbol.push_back(p.symbol);
        timestamp.push_back(p.timestamp);
        name.push_back(p.name);
        value.push_back(p.value.toString());
    }

    return json{{"symbol", symbol}, {"timestamp", timestamp}, {"name", name}, {"value", value}};
}

std::vector<domain::IndicatorPoint> ColumnarCodec<domain::IndicatorPoint>::decode(
    const json& columns, size_t rowCount)
{
    const auto& symbol = column(columns, "symbol", rowCount);
    const auto& timestamp = column(columns, "timestamp", rowCount);
    const auto& name = column(columns, "name", rowCount);
    const auto& value = column(columns, "value", rowCount);

    std::vector<domain::IndicatorPoint> rows(rowCount);
    for (size_t i = 0; i < rowCount; ++i) {
        rows[i].symbol = symbol.at(i).get<std::string>();
        rows[i].timestamp = timestamp.at(i).get<int64_t>();
        rows[i].name = name.at(i).get<std::string>();
        rows[i].value = decimalAt(value, i);
    }
    return rows;
}

size_t ColumnarCodec<domain::IndicatorPoint>::estimateBytes(const domain::IndicatorPoint& row) {
    return sizeof(domain::IndicatorPoint) + row.symbol.capacity() + row.name.capacity();
}

} // namespace memtrade::adapters::secondary
