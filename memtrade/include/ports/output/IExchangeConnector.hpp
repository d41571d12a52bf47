#pragma once

#include "domain/Decimal.hpp"
#include "domain/ExchangeTypes.hpp"

#include <optional>
#include <string>

namespace memtrade::ports::output {

/**
 * @brief Порт для обращения к бирже
 *
 * Каждый вызов ограничен таймаутом реализации. placeOrder и cancelOrder
 * возвращают ExchangeCallStatus::UNKNOWN, если ответ не получен; их нельзя
 * повторять вслепую. fetch* методы безопасно повторять, nullopt означает
 * неудачный запрос.
 */
class IExchangeConnector {
public:
    virtual ~IExchangeConnector() = default;

    virtual domain::OrderAck placeOrder(const domain::OrderSpec& spec) = 0;

    virtual domain::CancelAck cancelOrder(const std::string& exchangeId, const std::string& symbol) = 0;

    virtual std::optional<domain::OrderStatusReport> fetchOrderStatus(
        const std::string& exchangeId, const std::string& symbol) = 0;

    /**
     * @brief Найти ордер по clientOrderId, переданному в placeOrder
     *
     * Позволяет разрешить UNKNOWN после выставления, когда exchangeId
     * неизвестен. nullopt означает неудачный запрос.
     */
    virtual std::optional<domain::ClientOrderLookup> fetchOrderByClientId(
        const std::string& clientOrderId, const std::string& symbol) = 0;

    /**
     * @brief Текущая рыночная цена (лучший bid, либо последняя сделка)
     */
    virtual std::optional<domain::Decimal> fetchMarketPrice(const std::string& symbol) = 0;

    virtual std::optional<domain::SymbolRules> fetchSymbolRules(const std::string& symbol) = 0;
};

} // namespace memtrade::ports::output
