/**
 * @file DealServiceTest.cpp
 * @brief Тесты связей сделка-ордер
 */

#include <gtest/gtest.h>

#include "application/DealService.hpp"
#include "adapters/secondary/persistence/InMemoryDealRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"

using namespace memtrade;
using domain::Decimal;
using domain::DealStatus;
using domain::InvariantViolation;
using domain::OrderSide;

class DealServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        orders_ = std::make_shared<adapters::secondary::InMemoryOrderRepository>();
        deals_ = std::make_shared<adapters::secondary::InMemoryDealRepository>();
        service_ = std::make_unique<application::DealService>(deals_, orders_);
    }

    domain::Order saveOrder(OrderSide side = OrderSide::BUY, const std::string& symbol = "SOL/USDT") {
        auto order = domain::Order::limit(symbol, side, Decimal::fromInt(150), Decimal::fromInt(1));
        return orders_->save(order);
    }

    domain::Order cancelOrder(domain::Order order) {
        order.cancel("test");
        return orders_->save(order);
    }

    std::shared_ptr<adapters::secondary::InMemoryOrderRepository> orders_;
    std::shared_ptr<adapters::secondary::InMemoryDealRepository> deals_;
    std::unique_ptr<application::DealService> service_;
};

TEST_F(DealServiceTest, OpenDeal_RequiresSymbol) {
    EXPECT_THROW(service_->openDeal("", Decimal::fromInt(1)), InvariantViolation);

    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    EXPECT_GT(deal.id, 0);
    EXPECT_EQ(deal.status, DealStatus::ACTIVE);
}

TEST_F(DealServiceTest, AttachBuyOrder_LinksBothSides) {
    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    auto order = saveOrder();

    auto updated = service_->attachBuyOrder(deal.id, order.id);

    EXPECT_EQ(updated.buyOrderId, order.id);
    EXPECT_EQ(orders_->findById(order.id)->dealId, deal.id);
    EXPECT_EQ(deals_->findById(deal.id)->buyOrderId, order.id);
}

TEST_F(DealServiceTest, AttachBuyOrder_SecondOpenOrderRejected) {
    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    auto first = saveOrder();
    auto second = saveOrder();
    service_->attachBuyOrder(deal.id, first.id);

    EXPECT_THROW(service_->attachBuyOrder(deal.id, second.id), InvariantViolation);

    cancelOrder(*orders_->findById(first.id));
    EXPECT_EQ(service_->attachBuyOrder(deal.id, second.id).buyOrderId, second.id);
}

TEST_F(DealServiceTest, AttachBuyOrder_ChecksOrder) {
    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));

    EXPECT_THROW(service_->attachBuyOrder(deal.id, 999), InvariantViolation);
    EXPECT_THROW(service_->attachBuyOrder(deal.id, saveOrder(OrderSide::SELL).id), InvariantViolation);
    EXPECT_THROW(service_->attachBuyOrder(deal.id, saveOrder(OrderSide::BUY, "BTC/USDT").id), InvariantViolation);

    auto other = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    auto foreign = saveOrder();
    service_->attachBuyOrder(other.id, foreign.id);
    EXPECT_THROW(service_->attachBuyOrder(deal.id, foreign.id), InvariantViolation);
}

TEST_F(DealServiceTest, FinalDeal_AcceptsNoOrders) {
    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    service_->cancelDeal(deal.id);

    EXPECT_THROW(service_->attachBuyOrder(deal.id, saveOrder().id), InvariantViolation);
    EXPECT_THROW(service_->replaceBuyOrder(deal.id, saveOrder().id), InvariantViolation);
}

TEST_F(DealServiceTest, ReplaceBuyOrder_RequiresClosedPrevious) {
    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    auto first = saveOrder();
    service_->attachBuyOrder(deal.id, first.id);
    auto replacement = saveOrder();

    EXPECT_THROW(service_->replaceBuyOrder(deal.id, replacement.id), InvariantViolation);

    cancelOrder(*orders_->findById(first.id));
    auto updated = service_->replaceBuyOrder(deal.id, replacement.id);

    EXPECT_EQ(updated.buyOrderId, replacement.id);
    EXPECT_TRUE(updated.lastError.empty());
    EXPECT_EQ(orders_->findById(replacement.id)->dealId, deal.id);
}

TEST_F(DealServiceTest, DetachBuyOrder_KeepsDealActive) {
    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    service_->attachBuyOrder(deal.id, saveOrder().id);

    auto updated = service_->detachBuyOrder(deal.id, "replacement rejected");

    EXPECT_FALSE(updated.buyOrderId.has_value());
    EXPECT_EQ(updated.status, DealStatus::ACTIVE);
    EXPECT_EQ(updated.lastError, "replacement rejected");
}

TEST_F(DealServiceTest, SellLeg_ThenComplete) {
    auto deal = service_->openDeal("SOL/USDT", Decimal::fromInt(1));
    auto sell = saveOrder(OrderSide::SELL);

    EXPECT_THROW(service_->completeDeal(deal.id, Decimal::fromInt(1)), domain::StateTransitionError);

    service_->startWaitingSell(deal.id, sell.id);
    auto done = service_->completeDeal(deal.id, Decimal::parse("1.5"));

    EXPECT_EQ(done.status, DealStatus::COMPLETED);
    EXPECT_EQ(done.realizedProfit, Decimal::parse("1.5"));
    EXPECT_TRUE(done.completedAt.has_value());
}

TEST_F(DealServiceTest, MissingDeal_Throws) {
    EXPECT_THROW(service_->detachBuyOrder(42, "x"), InvariantViolation);
    EXPECT_THROW(service_->failDeal(42, "x"), InvariantViolation);
    EXPECT_FALSE(service_->findDeal(42).has_value());
}
