#pragma once

#include "IBatchDumpStore.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memtrade::ports::output {

/**
 * @brief Хранилище потоковых наблюдений (только добавление)
 *
 * Записи живут в памяти до выгрузки в пакетный файл; после выгрузки
 * процесс их больше не читает.
 *
 * @tparam Observation domain::Ticker, domain::OrderBookSnapshot, domain::IndicatorPoint
 */
template <typename Observation>
class IStreamRepository : public IBatchDumpStore {
public:
    /**
     * @return false, если приём данных закрыт (остановка процесса)
     */
    virtual bool append(const Observation& observation) = 0;
    virtual bool appendBatch(const std::vector<Observation>& observations) = 0;

    /**
     * @brief Последние n записей, от старых к новым
     */
    virtual std::vector<Observation> lastN(size_t n) const = 0;

    virtual std::vector<Observation> lastNBySymbol(const std::string& symbol, size_t n) const = 0;

    virtual std::optional<Observation> latest(const std::string& symbol) const = 0;

    /**
     * @brief Записи инструмента с fromMillis <= timestamp <= toMillis
     */
    virtual std::vector<Observation> rangeBySymbolAndTime(
        const std::string& symbol, int64_t fromMillis, int64_t toMillis) const = 0;
};

} // namespace memtrade::ports::output
