#include "adapters/secondary/exchange/PaperExchangeConnector.hpp"

#include <iostream>
#include <memory>
#include <vector>

namespace memtrade::adapters::secondary {

using domain::Decimal;
using domain::ExchangeCallStatus;
using domain::OrderStatus;

PaperExchangeConnector::PaperExchangeConnector() {
    initInstruments();
}

void PaperExchangeConnector::initInstruments() {
    auto add = [this](const std::string& symbol, const char* price, const char* minNotional,
                      const char* minAmount, int priceScale, int amountScale) {
        domain::SymbolRules rules;
        rules.symbol = symbol;
        rules.minNotional = Decimal::parse(minNotional);
        rules.minAmount = Decimal::parse(minAmount);
        rules.priceScale = priceScale;
        rules.amountScale = amountScale;
        rules_[symbol] = rules;
        prices_[symbol] = Decimal::parse(price);
    };

    add("BTC/USDT", "65000", "5", "0.00001", 2, 5);
    add("ETH/USDT", "3200", "5", "0.0001", 2, 4);
    add("SOL/USDT", "150", "5", "0.01", 2, 2);
    add("XRP/USDT", "0.52", "5", "1", 4, 0);

    std::cout << "[PaperExchange] Initialized " << rules_.size() << " instruments" << std::endl;
}

std::string PaperExchangeConnector::nextExchangeId() {
    return "paper-" + std::to_string(++sequence_);
}

// ============================================================================
// Ордера
// ============================================================================

domain::OrderAck PaperExchangeConnector::placeOrder(const domain::OrderSpec& spec) {
    domain::OrderAck ack;

    std::optional<Decimal> market;
    std::optional<domain::SymbolRules> rules;
    {
        std::lock_guard<std::mutex> lock(marketMutex_);
        auto price = prices_.find(spec.symbol);
        if (price != prices_.end()) market = price->second;
        auto rule = rules_.find(spec.symbol);
        if (rule != rules_.end()) rules = rule->second;
    }

    if (!market || !rules) {
        ack.status = ExchangeCallStatus::REJECTED;
        ack.message = "Unknown symbol: " + spec.symbol;
        return ack;
    }
    if (!spec.amount.isPositive() || spec.amount < rules->minAmount) {
        ack.status = ExchangeCallStatus::REJECTED;
        ack.message = "Amount below minimum";
        return ack;
    }

    const Decimal execPrice = spec.type == domain::OrderType::MARKET ? *market : spec.price;
    if (!execPrice.isPositive() || execPrice * spec.amount < rules->minNotional) {
        ack.status = ExchangeCallStatus::REJECTED;
        ack.message = "Notional below minimum";
        return ack;
    }

    PaperOrder order;
    order.exchangeId = nextExchangeId();
    order.spec = spec;
    order.report.status = OrderStatus::PLACED;
    orders_.insert(order.exchangeId, std::make_shared<PaperOrder>(order));

    const bool crosses = spec.type == domain::OrderType::MARKET ||
        (spec.side == domain::OrderSide::BUY ? *market <= spec.price : *market >= spec.price);
    if (crosses) {
        fillAt(order.exchangeId, execPrice);
    }

    if (loseResponses_.load()) {
        ack.status = ExchangeCallStatus::UNKNOWN;
        ack.message = "Response lost";
        return ack;
    }

    ack.status = ExchangeCallStatus::OK;
    ack.exchangeId = order.exchangeId;
    return ack;
}

domain::CancelAck PaperExchangeConnector::cancelOrder(const std::string& exchangeId, const std::string& symbol) {
    domain::CancelAck ack;

    auto existing = orders_.find(exchangeId);
    if (!existing || existing->spec.symbol != symbol) {
        ack.status = ExchangeCallStatus::REJECTED;
        ack.message = "Order not found: " + exchangeId;
        return ack;
    }
    if (domain::isFinalStatus(existing->report.status)) {
        ack.status = ExchangeCallStatus::REJECTED;
        ack.message = "Order already " + domain::toString(existing->report.status);
        return ack;
    }

    auto updated = std::make_shared<PaperOrder>(*existing);
    updated->report.status = OrderStatus::CANCELED;
    orders_.insert(exchangeId, updated);

    if (loseResponses_.load()) {
        ack.status = ExchangeCallStatus::UNKNOWN;
        ack.message = "Response lost";
        return ack;
    }

    ack.status = ExchangeCallStatus::OK;
    return ack;
}

std::optional<domain::OrderStatusReport> PaperExchangeConnector::fetchOrderStatus(
    const std::string& exchangeId, const std::string& symbol)
{
    auto existing = orders_.find(exchangeId);
    if (!existing || existing->spec.symbol != symbol) {
        return std::nullopt;
    }
    return existing->report;
}

std::optional<domain::ClientOrderLookup> PaperExchangeConnector::fetchOrderByClientId(
    const std::string& clientOrderId, const std::string& symbol)
{
    domain::ClientOrderLookup lookup;
    if (clientOrderId.empty()) {
        return lookup;
    }

    auto matches = orders_.getIf([&](const PaperOrder& o) {
        return o.spec.clientOrderId == clientOrderId && o.spec.symbol == symbol;
    });
    if (matches.empty()) {
        return lookup;
    }

    lookup.found = true;
    lookup.exchangeId = matches.front()->exchangeId;
    lookup.report = matches.front()->report;
    return lookup;
}

// ============================================================================
// Рыночные данные
// ============================================================================

std::optional<Decimal> PaperExchangeConnector::fetchMarketPrice(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(marketMutex_);
    auto it = prices_.find(symbol);
    return it != prices_.end() ? std::optional<Decimal>(it->second) : std::nullopt;
}

std::optional<domain::SymbolRules> PaperExchangeConnector::fetchSymbolRules(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(marketMutex_);
    auto it = rules_.find(symbol);
    return it != rules_.end() ? std::optional<domain::SymbolRules>(it->second) : std::nullopt;
}

void PaperExchangeConnector::setMarketPrice(const std::string& symbol, const Decimal& price) {
    {
        std::lock_guard<std::mutex> lock(marketMutex_);
        prices_[symbol] = price;
    }

    auto crossed = orders_.getIf([&](const PaperOrder& o) {
        if (o.spec.symbol != symbol || domain::isFinalStatus(o.report.status)) {
            return false;
        }
        return o.spec.side == domain::OrderSide::BUY ? price <= o.spec.price : price >= o.spec.price;
    });

    for (const auto& order : crossed) {
        fillAt(order->exchangeId, order->spec.price);
    }
}

void PaperExchangeConnector::setSymbolRules(const domain::SymbolRules& rules) {
    std::lock_guard<std::mutex> lock(marketMutex_);
    rules_[rules.symbol] = rules;
}

size_t PaperExchangeConnector::restingOrders() const {
    return orders_.getIf([](const PaperOrder& o) { return !domain::isFinalStatus(o.report.status); }).size();
}

void PaperExchangeConnector::fillAt(const std::string& exchangeId, const Decimal& price) {
    auto existing = orders_.find(exchangeId);
    if (!existing) {
        return;
    }

    auto updated = std::make_shared<PaperOrder>(*existing);
    updated->report.status = OrderStatus::FILLED;
    updated->report.filledAmount = updated->spec.amount;
    updated->report.averagePrice = price;
    orders_.insert(exchangeId, updated);
}

} // namespace memtrade::adapters::secondary
