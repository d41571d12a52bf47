#pragma once

#include "ports/input/IDealService.hpp"
#include "ports/output/IExchangeConnector.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "settings/MonitorSettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace memtrade::application {

/**
 * @brief Счётчики монитора
 */
struct MonitorStatistics {
    uint64_t checksPerformed = 0;
    uint64_t staleOrdersFound = 0;
    uint64_t cancellations = 0;
    uint64_t recreations = 0;          ///< Замещающий ордер принят биржей
    uint64_t recreationFailures = 0;
    uint64_t skippedByCooldown = 0;
    uint64_t ambiguousOutcomes = 0;    ///< Ответ биржи не получен (UNKNOWN)
};

/**
 * @brief Монитор устаревших ордеров на покупку
 *
 * Раз в checkInterval проверяет открытые BUY-ордера. Для устаревшего ордера:
 * 1. отмена на бирже (при неясном исходе статус перепроверяется запросом);
 * 2. ордер переводится в CANCELED и сохраняется;
 * 3. цена замены: market * (1 - priceOffsetPercent / 100), не выше market;
 * 4. проверка ограничений инструмента (min notional, min amount, точность);
 * 5. выставление; при успехе ордер привязывается к сделке, при отказе
 *    причина записывается в отменённый ордер, а сделка остаётся без
 *    ордера на покупку.
 *
 * Если ответ на выставление потерян, замена ищется на бирже по
 * clientOrderId (id ордера) сразу и в каждом следующем цикле, пока биржа
 * не ответит: найденная становится PLACED, отсутствующая REJECTED.
 *
 * Ордера на продажу и ордера сделок в WAITING_SELL не затрагиваются.
 * Выставление и отмена никогда не повторяются автоматически.
 *
 * @example
 * ```cpp
 * StaleOrderMonitor monitor(orders, dealService, connector, settings.monitor());
 * monitor.start();
 * // ...
 * monitor.stop();
 * ```
 */
class StaleOrderMonitor {
public:
    StaleOrderMonitor(
        std::shared_ptr<ports::output::IOrderRepository> orders,
        std::shared_ptr<ports::input::IDealService> deals,
        std::shared_ptr<ports::output::IExchangeConnector> exchange,
        const settings::MonitorSettings& settings);

    ~StaleOrderMonitor();

    StaleOrderMonitor(const StaleOrderMonitor&) = delete;
    StaleOrderMonitor& operator=(const StaleOrderMonitor&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Один цикл проверки
     * @return Количество найденных устаревших ордеров
     */
    size_t runOnce(const domain::Timestamp& now);

    MonitorStatistics statistics() const;

private:
    void runLoop();

    /// Сверить ордер с биржей; false, если ордер больше не открыт
    bool syncWithExchange(domain::Order& order);

    bool inCooldown(const domain::Order& order, const domain::Timestamp& now) const;

    void recreate(domain::Order order, const std::optional<domain::Decimal>& market,
                  const std::string& reason, const domain::Timestamp& now);

    /// Отменить на бирже; true, если отмена подтверждена
    bool cancelOnExchange(domain::Order& order, const std::string& reason);

    void placeReplacement(const domain::Order& canceled, const domain::Decimal& market);

    void failRecreation(domain::Order canceled, const std::string& reason);

    enum class PlacementResolution { PLACED, ABSENT, UNRESOLVED };

    /// Найти замену с неясным исходом выставления по clientOrderId
    PlacementResolution resolvePlacement(domain::Order& replacement);
    void resolvePendingPlacements();

    /// Привязать замену к сделке; при ошибке причина пишется в ордер
    bool attachReplacement(domain::Order& replacement);
    void releaseDeal(const domain::Order& replacement, const std::string& reason);

    std::optional<domain::OrderStatusReport> queryStatus(const domain::Order& order);
    std::optional<domain::ClientOrderLookup> queryByClientId(const domain::Order& order);
    std::optional<domain::Decimal> queryMarketPrice(const std::string& symbol);

    void logSummaryIfDue(const domain::Timestamp& now);

    std::shared_ptr<ports::output::IOrderRepository> orders_;
    std::shared_ptr<ports::input::IDealService> deals_;
    std::shared_ptr<ports::output::IExchangeConnector> exchange_;
    settings::MonitorSettings settings_;

    std::atomic<uint64_t> checksPerformed_{0};
    std::atomic<uint64_t> staleOrdersFound_{0};
    std::atomic<uint64_t> cancellations_{0};
    std::atomic<uint64_t> recreations_{0};
    std::atomic<uint64_t> recreationFailures_{0};
    std::atomic<uint64_t> skippedByCooldown_{0};
    std::atomic<uint64_t> ambiguousOutcomes_{0};

    std::mutex cycleMutex_;  ///< Один цикл за раз (фоновый поток и ручной runOnce)
    std::unordered_map<int64_t, domain::Timestamp> lastRecreationByDeal_;
    domain::Timestamp lastSummaryAt_;
    uint64_t quietCycles_ = 0;

    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    std::thread workerThread_;
};

} // namespace memtrade::application
