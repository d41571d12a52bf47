#pragma once

#include "ports/input/IDealService.hpp"
#include "ports/output/IDealRepository.hpp"
#include "ports/output/IOrderRepository.hpp"

#include <iostream>
#include <memory>

namespace memtrade::application {

/**
 * @brief Сервис сделок
 *
 * Следит за связью Deal ↔ Order:
 * - у сделки не более одного незакрытого ордера на покупку;
 * - к финальной сделке ордера не привязываются;
 * - ордер принадлежит той же сделке и тому же инструменту.
 */
class DealService : public ports::input::IDealService {
public:
    DealService(
        std::shared_ptr<ports::output::IDealRepository> deals,
        std::shared_ptr<ports::output::IOrderRepository> orders)
        : deals_(std::move(deals))
        , orders_(std::move(orders))
    {}

    domain::Deal openDeal(const std::string& symbol, const domain::Decimal& targetProfitPercent) override {
        if (symbol.empty()) {
            throw domain::InvariantViolation("Deal symbol must not be empty");
        }
        auto deal = deals_->save(domain::Deal::open(symbol, targetProfitPercent));
        std::cout << "[DealService] Opened deal " << deal.id << " " << symbol << std::endl;
        return deal;
    }

    domain::Deal attachBuyOrder(int64_t dealId, int64_t orderId) override {
        auto deal = loadDeal(dealId);
        requireNotFinal(deal, "attach buy order");

        if (deal.buyOrderId && *deal.buyOrderId != orderId && hasUnclosedOrder(*deal.buyOrderId)) {
            throw domain::InvariantViolation(
                "Deal " + std::to_string(dealId) + " already has open buy order " +
                std::to_string(*deal.buyOrderId));
        }

        bindOrder(deal, orderId, domain::OrderSide::BUY);
        deal.attachBuyOrder(orderId);
        return deals_->save(deal);
    }

    domain::Deal replaceBuyOrder(int64_t dealId, int64_t newOrderId) override {
        auto deal = loadDeal(dealId);
        requireNotFinal(deal, "replace buy order");

        if (deal.buyOrderId && hasUnclosedOrder(*deal.buyOrderId)) {
            throw domain::InvariantViolation(
                "Deal " + std::to_string(dealId) + ": buy order " +
                std::to_string(*deal.buyOrderId) + " must be closed before replacement");
        }

        const auto previous = deal.buyOrderId;
        bindOrder(deal, newOrderId, domain::OrderSide::BUY);
        deal.attachBuyOrder(newOrderId);
        deal.lastError.clear();
        auto saved = deals_->save(deal);

        std::cout << "[DealService] Deal " << dealId << " buy order "
                  << (previous ? std::to_string(*previous) : "-") << " -> " << newOrderId << std::endl;
        return saved;
    }

    domain::Deal detachBuyOrder(int64_t dealId, const std::string& reason) override {
        auto deal = loadDeal(dealId);
        deal.clearBuyOrder(reason);
        std::cerr << "[DealService] Deal " << dealId << " left without buy order: " << reason << std::endl;
        return deals_->save(deal);
    }

    domain::Deal startWaitingSell(int64_t dealId, int64_t sellOrderId) override {
        auto deal = loadDeal(dealId);
        requireNotFinal(deal, "attach sell order");

        if (deal.sellOrderId && *deal.sellOrderId != sellOrderId && hasUnclosedOrder(*deal.sellOrderId)) {
            throw domain::InvariantViolation(
                "Deal " + std::to_string(dealId) + " already has open sell order " +
                std::to_string(*deal.sellOrderId));
        }

        bindOrder(deal, sellOrderId, domain::OrderSide::SELL);
        deal.startWaitingSell(sellOrderId);
        return deals_->save(deal);
    }

    domain::Deal completeDeal(int64_t dealId, const domain::Decimal& realizedProfit) override {
        auto deal = loadDeal(dealId);
        deal.complete(realizedProfit);
        std::cout << "[DealService] Deal " << dealId << " completed, profit " << realizedProfit << std::endl;
        return deals_->save(deal);
    }

    domain::Deal cancelDeal(int64_t dealId) override {
        auto deal = loadDeal(dealId);
        deal.cancel();
        return deals_->save(deal);
    }

    domain::Deal failDeal(int64_t dealId, const std::string& reason) override {
        auto deal = loadDeal(dealId);
        deal.fail(reason);
        std::cerr << "[DealService] Deal " << dealId << " failed: " << reason << std::endl;
        return deals_->save(deal);
    }

    std::optional<domain::Deal> findDeal(int64_t dealId) const override {
        return deals_->findById(dealId);
    }

private:
    domain::Deal loadDeal(int64_t dealId) const {
        auto deal = deals_->findById(dealId);
        if (!deal) {
            throw domain::InvariantViolation("Deal not found: " + std::to_string(dealId));
        }
        return *deal;
    }

    static void requireNotFinal(const domain::Deal& deal, const char* action) {
        if (deal.isFinal()) {
            throw domain::InvariantViolation(
                "Deal " + std::to_string(deal.id) + " is " + domain::toString(deal.status) +
                ", cannot " + action);
        }
    }

    /// PENDING тоже считается незакрытым: ордер мог уже попасть на биржу
    bool hasUnclosedOrder(int64_t orderId) const {
        auto order = orders_->findById(orderId);
        return order && !order->isFinal();
    }

    /**
     * @brief Проверить ордер и записать в него обратную ссылку на сделку
     */
    void bindOrder(const domain::Deal& deal, int64_t orderId, domain::OrderSide side) {
        auto order = orders_->findById(orderId);
        if (!order) {
            throw domain::InvariantViolation("Order not found: " + std::to_string(orderId));
        }
        if (order->side != side) {
            throw domain::InvariantViolation(
                "Order " + std::to_string(orderId) + " is not a " + domain::toString(side) + " order");
        }
        if (order->symbol != deal.symbol) {
            throw domain::InvariantViolation(
                "Order " + std::to_string(orderId) + " symbol " + order->symbol +
                " does not match deal symbol " + deal.symbol);
        }
        if (order->dealId && *order->dealId != deal.id) {
            throw domain::InvariantViolation(
                "Order " + std::to_string(orderId) + " belongs to deal " + std::to_string(*order->dealId));
        }

        if (!order->dealId) {
            order->dealId = deal.id;
            orders_->save(*order);
        }
    }

    std::shared_ptr<ports::output::IDealRepository> deals_;
    std::shared_ptr<ports::output::IOrderRepository> orders_;
};

} // namespace memtrade::application
