#pragma once

#include "Decimal.hpp"
#include "DomainErrors.hpp"
#include "Timestamp.hpp"
#include "enums/DealStatus.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace memtrade::domain {

/**
 * @brief Сделка: покупка и последующая продажа одного инструмента
 *
 * buyOrderId / sellOrderId: слабые ссылки на ордера (ключи поиска).
 * В финальном статусе к сделке нельзя привязывать ордера.
 */
struct Deal {
    int64_t id = 0;
    std::string symbol;
    DealStatus status = DealStatus::ACTIVE;
    std::optional<int64_t> buyOrderId;
    std::optional<int64_t> sellOrderId;
    Decimal targetProfitPercent;
    Decimal realizedProfit;
    Timestamp createdAt;
    std::optional<Timestamp> completedAt;
    std::string lastError;

    Deal() = default;

    static Deal open(const std::string& symbol, const Decimal& targetProfitPercent) {
        Deal deal;
        deal.symbol = symbol;
        deal.targetProfitPercent = targetProfitPercent;
        deal.createdAt = Timestamp::now();
        return deal;
    }

    bool isFinal() const { return isFinalStatus(status); }

    /**
     * @brief Привязать ордер на покупку
     * @throws StateTransitionError если сделка не в ACTIVE
     */
    void attachBuyOrder(int64_t orderId) {
        requireStatus(DealStatus::ACTIVE, "attach buy order");
        buyOrderId = orderId;
    }

    /**
     * @brief Отвязать ордер на покупку (после неудачной перевыставки)
     */
    void clearBuyOrder(const std::string& reason) {
        requireNotFinal("clear buy order");
        buyOrderId.reset();
        lastError = reason;
    }

    /**
     * @brief Покупка исполнена, выставлен ордер на продажу
     */
    void startWaitingSell(int64_t sellId) {
        requireStatus(DealStatus::ACTIVE, "start waiting sell");
        sellOrderId = sellId;
        status = DealStatus::WAITING_SELL;
    }

    void complete(const Decimal& profit) {
        requireStatus(DealStatus::WAITING_SELL, "complete");
        realizedProfit = profit;
        status = DealStatus::COMPLETED;
        completedAt = Timestamp::now();
    }

    void cancel() {
        requireNotFinal("cancel");
        status = DealStatus::CANCELED;
        completedAt = Timestamp::now();
    }

    void fail(const std::string& reason) {
        requireNotFinal("fail");
        status = DealStatus::FAILED;
        lastError = reason;
        completedAt = Timestamp::now();
    }

private:
    void requireNotFinal(const char* action) const {
        if (isFinal()) {
            throw StateTransitionError(
                "Deal " + std::to_string(id) + ": cannot " + action + " in " + toString(status));
        }
    }

    void requireStatus(DealStatus expected, const char* action) const {
        if (status != expected) {
            throw StateTransitionError(
                "Deal " + std::to_string(id) + ": cannot " + action + " in " + toString(status));
        }
    }
};

} // namespace memtrade::domain
