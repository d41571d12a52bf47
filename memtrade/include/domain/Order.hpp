#pragma once

#include "Decimal.hpp"
#include "DomainErrors.hpp"
#include "ExchangeTypes.hpp"
#include "Timestamp.hpp"
#include "enums/OrderSide.hpp"
#include "enums/OrderStatus.hpp"
#include "enums/OrderType.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace memtrade::domain {

/**
 * @brief Ордер на бирже
 *
 * Инварианты:
 * - 0 <= filledAmount <= requestedAmount, filledAmount не убывает;
 * - status == FILLED ⇒ filledAmount == requestedAmount;
 * - переходы статуса только через методы ниже (см. canTransition).
 *
 * dealId: слабая ссылка (ключ для поиска сделки), а не владение.
 */
struct Order {
    int64_t id = 0;                         ///< Локальный id (0, если ещё не назначен)
    std::optional<std::string> exchangeId;  ///< Id на бирже, появляется после выставления
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::LIMIT;
    Decimal price;
    Decimal requestedAmount;
    Decimal filledAmount;
    Decimal averageFillPrice;
    Decimal fees;
    OrderStatus status = OrderStatus::PENDING;
    std::optional<int64_t> dealId;
    Timestamp createdAt;
    Timestamp lastUpdatedAt;
    int32_t retryCount = 0;
    std::string lastError;

    Order() = default;

    /**
     * @brief Новый лимитный ордер в статусе PENDING
     */
    static Order limit(
        const std::string& symbol,
        OrderSide side,
        const Decimal& price,
        const Decimal& amount,
        std::optional<int64_t> dealId = std::nullopt)
    {
        Order order;
        order.symbol = symbol;
        order.side = side;
        order.type = OrderType::LIMIT;
        order.price = price;
        order.requestedAmount = amount;
        order.dealId = dealId;
        order.createdAt = Timestamp::now();
        order.lastUpdatedAt = order.createdAt;
        return order;
    }

    bool isOpen() const { return isOpenStatus(status); }
    bool isFinal() const { return isFinalStatus(status); }
    bool isBuy() const { return side == OrderSide::BUY; }

    Decimal remainingAmount() const { return requestedAmount - filledAmount; }

    /// Процент исполнения, 0..100
    Decimal fillPercent() const {
        return requestedAmount.isZero()
            ? Decimal()
            : filledAmount * Decimal::fromInt(100) / requestedAmount;
    }

    /// price * requestedAmount
    Decimal notional() const { return price * requestedAmount; }

    /**
     * @brief Биржа приняла ордер
     * @throws StateTransitionError если ордер не в PENDING
     */
    void markPlaced(const std::string& exchangeOrderId);

    /**
     * @brief Применить отчёт об исполнении (накопленный объём)
     * @param filledTotal Суммарно исполненный объём, а не приращение
     * @throws StateTransitionError если ордер не открыт
     * @throws InvariantViolation если объём уменьшается или превышает запрошенный
     */
    void applyFill(const Decimal& filledTotal, const Decimal& averagePrice);

    /**
     * @brief Синхронизировать с отчётом биржи
     * @return true, если ордер изменился
     */
    bool applyExchangeStatus(const OrderStatusReport& report);

    /**
     * @brief Подтверждённая отмена
     * @throws StateTransitionError если ордер не открыт или уже исполнен полностью
     */
    void cancel(const std::string& reason = "");

    /**
     * @brief Отказ биржи
     */
    void reject(const std::string& reason);

    void recordError(const std::string& error);

private:
    void transitionTo(OrderStatus next);
};

} // namespace memtrade::domain
