#include "domain/Order.hpp"

namespace memtrade::domain {

void Order::transitionTo(OrderStatus next) {
    if (status == next) {
        return;
    }
    if (!canTransition(status, next)) {
        throw StateTransitionError(
            "Order " + std::to_string(id) + ": " + toString(status) + " -> " + toString(next));
    }
    status = next;
    lastUpdatedAt = Timestamp::now();
}

void Order::markPlaced(const std::string& exchangeOrderId) {
    if (status != OrderStatus::PENDING) {
        throw StateTransitionError(
            "Order " + std::to_string(id) + " cannot be placed from " + toString(status));
    }
    if (exchangeOrderId.empty()) {
        throw InvariantViolation("Order " + std::to_string(id) + ": empty exchange id");
    }
    exchangeId = exchangeOrderId;
    transitionTo(OrderStatus::PLACED);
}

void Order::applyFill(const Decimal& filledTotal, const Decimal& averagePrice) {
    if (!isOpen()) {
        throw StateTransitionError(
            "Order " + std::to_string(id) + " cannot be filled in " + toString(status));
    }
    if (filledTotal < filledAmount) {
        throw InvariantViolation(
            "Order " + std::to_string(id) + ": filled amount decreased from " +
            filledAmount.toString() + " to " + filledTotal.toString());
    }
    if (filledTotal > requestedAmount) {
        throw InvariantViolation(
            "Order " + std::to_string(id) + ": filled " + filledTotal.toString() +
            " exceeds requested " + requestedAmount.toString());
    }

    filledAmount = filledTotal;
    if (!averagePrice.isZero()) {
        averageFillPrice = averagePrice;
    }

    if (filledAmount == requestedAmount) {
        transitionTo(OrderStatus::FILLED);
    } else if (filledAmount.isPositive()) {
        transitionTo(OrderStatus::PARTIALLY_FILLED);
    }
    lastUpdatedAt = Timestamp::now();
}

bool Order::applyExchangeStatus(const OrderStatusReport& report) {
    if (isFinal()) {
        return false;
    }

    const OrderStatus before = status;
    const Decimal filledBefore = filledAmount;

    if (isOpen()) {
        Decimal reported = report.status == OrderStatus::FILLED
            ? requestedAmount
            : min(report.filledAmount, requestedAmount);
        if (reported > filledAmount) {
            applyFill(reported, report.averagePrice);
        }
    }

    switch (report.status) {
        case OrderStatus::CANCELED:
            if (isOpen()) {
                cancel("canceled on exchange");
            }
            break;
        case OrderStatus::REJECTED:
            if (canTransition(status, OrderStatus::REJECTED)) {
                reject("rejected by exchange");
            }
            break;
        default:
            break;
    }

    return status != before || filledAmount != filledBefore;
}

void Order::cancel(const std::string& reason) {
    if (!isOpen()) {
        throw StateTransitionError(
            "Order " + std::to_string(id) + " cannot be canceled in " + toString(status));
    }
    if (filledAmount >= requestedAmount) {
        throw StateTransitionError(
            "Order " + std::to_string(id) + " is fully filled and cannot be canceled");
    }
    transitionTo(OrderStatus::CANCELED);
    if (!reason.empty()) {
        lastError = reason;
    }
}

void Order::reject(const std::string& reason) {
    transitionTo(OrderStatus::REJECTED);
    lastError = reason;
}

void Order::recordError(const std::string& error) {
    lastError = error;
    lastUpdatedAt = Timestamp::now();
}

} // namespace memtrade::domain
