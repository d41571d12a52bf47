#pragma once

#include "ports/output/IExchangeConnector.hpp"

#include <ThreadSafeMap.hpp>

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>

namespace memtrade::adapters::secondary {

/**
 * @brief Биржа-симулятор внутри процесса
 *
 * Лимитные ордера ждут в книге и исполняются целиком, когда рыночная
 * цена пересекает цену ордера (setMarketPrice). Рыночные исполняются сразу.
 * Используется в main без реального коннектора и в интеграционных тестах.
 */
class PaperExchangeConnector : public ports::output::IExchangeConnector {
public:
    PaperExchangeConnector();
    ~PaperExchangeConnector() override = default;

    domain::OrderAck placeOrder(const domain::OrderSpec& spec) override;
    domain::CancelAck cancelOrder(const std::string& exchangeId, const std::string& symbol) override;
    std::optional<domain::OrderStatusReport> fetchOrderStatus(
        const std::string& exchangeId, const std::string& symbol) override;
    std::optional<domain::ClientOrderLookup> fetchOrderByClientId(
        const std::string& clientOrderId, const std::string& symbol) override;
    std::optional<domain::Decimal> fetchMarketPrice(const std::string& symbol) override;
    std::optional<domain::SymbolRules> fetchSymbolRules(const std::string& symbol) override;

    // Методы для тестов

    /**
     * @brief Установить рыночную цену и исполнить пересечённые лимитные ордера
     */
    void setMarketPrice(const std::string& symbol, const domain::Decimal& price);
    void setSymbolRules(const domain::SymbolRules& rules);

    /**
     * @brief Действие выполняется, но ответ "теряется" (UNKNOWN)
     */
    void setLoseResponses(bool lose) { loseResponses_ = lose; }

    size_t restingOrders() const;

private:
    struct PaperOrder {
        std::string exchangeId;
        domain::OrderSpec spec;
        domain::OrderStatusReport report;
    };

    void initInstruments();
    std::string nextExchangeId();
    void fillAt(const std::string& exchangeId, const domain::Decimal& price);

    ThreadSafeMap<std::string, PaperOrder> orders_;

    mutable std::mutex marketMutex_;
    std::unordered_map<std::string, domain::Decimal> prices_;
    std::unordered_map<std::string, domain::SymbolRules> rules_;

    std::atomic<uint64_t> sequence_{0};
    std::atomic<bool> loseResponses_{false};
};

} // namespace memtrade::adapters::secondary
