#pragma once

#include "Decimal.hpp"
#include "enums/OrderSide.hpp"
#include "enums/OrderStatus.hpp"
#include "enums/OrderType.hpp"

#include <string>

namespace memtrade::domain {

/**
 * @brief Итог обращения к бирже
 *
 * UNKNOWN означает, что запрос мог дойти до биржи, но подтверждение
 * не получено (таймаут, обрыв соединения). Такой результат нельзя
 * трактовать ни как успех, ни как отказ: состояние нужно перепроверить.
 */
enum class ExchangeCallStatus {
    OK,
    REJECTED,
    UNKNOWN
};

inline std::string toString(ExchangeCallStatus status) {
    switch (status) {
        case ExchangeCallStatus::OK:       return "OK";
        case ExchangeCallStatus::REJECTED: return "REJECTED";
        case ExchangeCallStatus::UNKNOWN:  return "UNKNOWN";
    }
    return "UNKNOWN";
}

/**
 * @brief Параметры нового ордера для отправки на биржу
 */
struct OrderSpec {
    std::string clientOrderId;  ///< Локальный id, передаётся бирже для сверки
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::LIMIT;
    Decimal price;
    Decimal amount;
};

/**
 * @brief Ответ биржи на выставление ордера
 */
struct OrderAck {
    ExchangeCallStatus status = ExchangeCallStatus::UNKNOWN;
    std::string exchangeId;
    std::string message;

    bool isSuccess() const { return status == ExchangeCallStatus::OK && !exchangeId.empty(); }
};

/**
 * @brief Ответ биржи на отмену ордера
 */
struct CancelAck {
    ExchangeCallStatus status = ExchangeCallStatus::UNKNOWN;
    std::string message;

    bool isSuccess() const { return status == ExchangeCallStatus::OK; }
};

/**
 * @brief Состояние ордера по данным биржи
 */
struct OrderStatusReport {
    OrderStatus status = OrderStatus::PLACED;
    Decimal filledAmount;
    Decimal averagePrice;
};

/**
 * @brief Результат поиска ордера по clientOrderId
 *
 * found == false: биржа подтвердила, что ордера с таким id нет.
 */
struct ClientOrderLookup {
    bool found = false;
    std::string exchangeId;
    OrderStatusReport report;
};

/**
 * @brief Торговые ограничения инструмента
 */
struct SymbolRules {
    std::string symbol;
    Decimal minNotional;   ///< Минимальная стоимость ордера (price * amount)
    Decimal minAmount;
    int priceScale = 8;    ///< Знаков после точки в цене
    int amountScale = 8;   ///< Знаков после точки в объёме
};

} // namespace memtrade::domain
