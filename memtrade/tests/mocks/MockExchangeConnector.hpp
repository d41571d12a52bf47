#pragma once

#include "ports/output/IExchangeConnector.hpp"

#include <gmock/gmock.h>

namespace memtrade::tests {

/**
 * @brief GMock реализация IExchangeConnector
 */
class MockExchangeConnector : public ports::output::IExchangeConnector {
public:
    MOCK_METHOD(domain::OrderAck, placeOrder, (const domain::OrderSpec&), (override));
    MOCK_METHOD(domain::CancelAck, cancelOrder, (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::optional<domain::OrderStatusReport>, fetchOrderStatus,
                (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::optional<domain::ClientOrderLookup>, fetchOrderByClientId,
                (const std::string&, const std::string&), (override));
    MOCK_METHOD(std::optional<domain::Decimal>, fetchMarketPrice, (const std::string&), (override));
    MOCK_METHOD(std::optional<domain::SymbolRules>, fetchSymbolRules, (const std::string&), (override));
};

} // namespace memtrade::tests
