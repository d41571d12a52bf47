#include "application/StaleOrderMonitor.hpp"

#include "application/StalenessPolicy.hpp"

#include <iostream>

namespace memtrade::application {

using domain::Decimal;
using domain::ExchangeCallStatus;
using domain::Order;
using domain::OrderStatus;

namespace {

const std::string kUnknownPlacement = "placement outcome unknown: ";

} // namespace

StaleOrderMonitor::StaleOrderMonitor(
    std::shared_ptr<ports::output::IOrderRepository> orders,
    std::shared_ptr<ports::input::IDealService> deals,
    std::shared_ptr<ports::output::IExchangeConnector> exchange,
    const settings::MonitorSettings& settings)
    : orders_(std::move(orders))
    , deals_(std::move(deals))
    , exchange_(std::move(exchange))
    , settings_(settings)
    , lastSummaryAt_(domain::Timestamp::now())
{}

StaleOrderMonitor::~StaleOrderMonitor() {
    stop();
}

// ============================================================================
// Жизненный цикл
// ============================================================================

void StaleOrderMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }

    std::cout << "[StaleOrderMonitor] Started: interval=" << settings_.getCheckInterval().count()
              << "s maxAge=" << settings_.getMaxAge().count()
              << "m maxDeviation=" << settings_.getMaxPriceDeviationPercent()
              << "% offset=" << settings_.getPriceOffsetPercent() << "%" << std::endl;

    workerThread_ = std::thread([this]() {
        runLoop();
    });
}

void StaleOrderMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    wakeCv_.notify_all();
    if (workerThread_.joinable()) {
        workerThread_.join();
    }
    std::cout << "[StaleOrderMonitor] Stopped" << std::endl;
}

void StaleOrderMonitor::runLoop() {
    while (running_.load()) {
        try {
            runOnce(domain::Timestamp::now());
        } catch (const std::exception& e) {
            std::cerr << "[StaleOrderMonitor] Cycle failed: " << e.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(wakeMutex_);
        wakeCv_.wait_for(lock, settings_.getCheckInterval(), [this]() { return !running_.load(); });
    }
}

MonitorStatistics StaleOrderMonitor::statistics() const {
    MonitorStatistics s;
    s.checksPerformed = checksPerformed_.load();
    s.staleOrdersFound = staleOrdersFound_.load();
    s.cancellations = cancellations_.load();
    s.recreations = recreations_.load();
    s.recreationFailures = recreationFailures_.load();
    s.skippedByCooldown = skippedByCooldown_.load();
    s.ambiguousOutcomes = ambiguousOutcomes_.load();
    return s;
}

// ============================================================================
// Цикл проверки
// ============================================================================

size_t StaleOrderMonitor::runOnce(const domain::Timestamp& now) {
    std::lock_guard<std::mutex> cycle(cycleMutex_);
    ++checksPerformed_;

    resolvePendingPlacements();

    auto candidates = orders_->findOpenBySide(domain::OrderSide::BUY);
    if (candidates.empty()) {
        ++quietCycles_;
        logSummaryIfDue(now);
        return 0;
    }

    std::cout << "[StaleOrderMonitor] Checking " << candidates.size() << " open buy orders" << std::endl;

    size_t staleFound = 0;
    for (auto& order : candidates) {
        if (!order.exchangeId) {
            continue;
        }

        try {
            if (!syncWithExchange(order)) {
                continue;
            }

            auto market = queryMarketPrice(order.symbol);
            auto reason = StalenessPolicy::evaluate(order, market, now, settings_);
            if (!reason) {
                continue;
            }

            ++staleOrdersFound_;
            ++staleFound;
            std::cout << "[StaleOrderMonitor] Order " << order.id << " (" << order.symbol
                      << " @ " << order.price << ") is stale: " << *reason << std::endl;

            if (inCooldown(order, now)) {
                ++skippedByCooldown_;
                std::cout << "[StaleOrderMonitor] Deal " << *order.dealId
                          << " recreated recently, skipping" << std::endl;
                continue;
            }

            recreate(order, market, *reason, now);
        } catch (const std::exception& e) {
            std::cerr << "[StaleOrderMonitor] Order " << order.id << " processing failed: "
                      << e.what() << std::endl;
        }
    }

    logSummaryIfDue(now);
    return staleFound;
}

bool StaleOrderMonitor::syncWithExchange(Order& order) {
    auto report = queryStatus(order);
    if (!report) {
        return order.isOpen();
    }

    if (order.applyExchangeStatus(*report)) {
        order = orders_->save(order);
        std::cout << "[StaleOrderMonitor] Order " << order.id << " synced: "
                  << domain::toString(order.status) << " filled " << order.filledAmount << std::endl;
    }
    return order.isOpen();
}

bool StaleOrderMonitor::inCooldown(const Order& order, const domain::Timestamp& now) const {
    if (!order.dealId || settings_.getMinRecreationCooldown().count() <= 0) {
        return false;
    }
    auto it = lastRecreationByDeal_.find(*order.dealId);
    return it != lastRecreationByDeal_.end() && now - it->second < settings_.getMinRecreationCooldown();
}

// ============================================================================
// Отмена и замена
// ============================================================================

void StaleOrderMonitor::recreate(
    Order order, const std::optional<Decimal>& market, const std::string& reason, const domain::Timestamp& now)
{
    // Сделка уже перешла к продаже: ордер на покупку не трогаем
    if (order.dealId) {
        auto deal = deals_->findDeal(*order.dealId);
        if (deal && !deal->isFinal() && deal->status != domain::DealStatus::ACTIVE) {
            std::cout << "[StaleOrderMonitor] Deal " << deal->id << " is "
                      << domain::toString(deal->status) << ", order " << order.id << " left as is" << std::endl;
            return;
        }
    }

    if (!cancelOnExchange(order, reason)) {
        return;
    }

    ++cancellations_;
    if (order.dealId) {
        lastRecreationByDeal_[*order.dealId] = now;
    }

    if (order.dealId) {
        auto deal = deals_->findDeal(*order.dealId);
        if (!deal || deal->status != domain::DealStatus::ACTIVE) {
            std::cout << "[StaleOrderMonitor] Deal " << *order.dealId << " is "
                      << (deal ? domain::toString(deal->status) : std::string("missing"))
                      << ", no replacement for order " << order.id << std::endl;
            return;
        }
    }

    auto currentMarket = market ? market : queryMarketPrice(order.symbol);
    if (!currentMarket || !currentMarket->isPositive()) {
        failRecreation(order, "market price unavailable");
        return;
    }

    placeReplacement(order, *currentMarket);
}

bool StaleOrderMonitor::cancelOnExchange(Order& order, const std::string& reason) {
    domain::CancelAck ack;
    try {
        ack = exchange_->cancelOrder(*order.exchangeId, order.symbol);
    } catch (const std::exception& e) {
        ack.status = ExchangeCallStatus::UNKNOWN;
        ack.message = e.what();
    }

    const std::string cancelReason = "stale: " + reason;

    if (ack.isSuccess()) {
        order.cancel(cancelReason);
        order = orders_->save(order);
        std::cout << "[StaleOrderMonitor] Order " << order.id << " canceled" << std::endl;
        return true;
    }

    // Отмена не подтверждена: решение принимается только по статусу с биржи
    ++ambiguousOutcomes_;
    std::cerr << "[StaleOrderMonitor] Cancel of order " << order.id << " returned "
              << domain::toString(ack.status) << ": " << ack.message << ", verifying" << std::endl;

    auto report = queryStatus(order);
    if (!report) {
        order.recordError("cancel outcome unknown: " + ack.message);
        orders_->save(order);
        std::cerr << "[StaleOrderMonitor] Order " << order.id
                  << " state unknown after cancel, will retry next cycle" << std::endl;
        return false;
    }

    order.applyExchangeStatus(*report);
    if (order.status != OrderStatus::CANCELED) {
        if (order.isOpen()) {
            order.recordError("cancel not confirmed: " + ack.message);
        }
        orders_->save(order);
        std::cout << "[StaleOrderMonitor] Order " << order.id << " is "
                  << domain::toString(order.status) << " on exchange, recreation aborted" << std::endl;
        return false;
    }

    order.recordError(cancelReason);
    order = orders_->save(order);
    std::cout << "[StaleOrderMonitor] Order " << order.id << " cancel confirmed by status query" << std::endl;
    return true;
}

void StaleOrderMonitor::placeReplacement(const Order& canceled, const Decimal& market) {
    std::optional<domain::SymbolRules> rules;
    try {
        rules = exchange_->fetchSymbolRules(canceled.symbol);
    } catch (const std::exception& e) {
        std::cerr << "[StaleOrderMonitor] fetchSymbolRules failed: " << e.what() << std::endl;
    }
    if (!rules) {
        failRecreation(canceled, "symbol rules unavailable");
        return;
    }

    const Decimal hundred = Decimal::fromInt(100);
    Decimal price = (market * (hundred - settings_.getPriceOffsetPercent()) / hundred)
        .floorToScale(rules->priceScale);
    price = domain::min(price, market);
    const Decimal amount = canceled.remainingAmount().floorToScale(rules->amountScale);

    if (!price.isPositive()) {
        failRecreation(canceled, "replacement price " + price.toString() + " is not positive");
        return;
    }
    if (!amount.isPositive() || amount < rules->minAmount) {
        failRecreation(canceled, "replacement amount " + amount.toString() +
                                 " below minimum " + rules->minAmount.toString());
        return;
    }
    if (price * amount < rules->minNotional) {
        failRecreation(canceled, "replacement notional " + (price * amount).toString() +
                                 " below minimum " + rules->minNotional.toString());
        return;
    }

    auto replacement = Order::limit(canceled.symbol, domain::OrderSide::BUY, price, amount, canceled.dealId);
    replacement.retryCount = canceled.retryCount + 1;
    replacement = orders_->save(replacement);

    domain::OrderSpec spec;
    spec.clientOrderId = std::to_string(replacement.id);
    spec.symbol = replacement.symbol;
    spec.side = replacement.side;
    spec.type = replacement.type;
    spec.price = replacement.price;
    spec.amount = replacement.requestedAmount;

    domain::OrderAck ack;
    try {
        ack = exchange_->placeOrder(spec);
    } catch (const std::exception& e) {
        ack.status = ExchangeCallStatus::UNKNOWN;
        ack.message = e.what();
    }

    if (ack.isSuccess()) {
        replacement.markPlaced(ack.exchangeId);
        replacement = orders_->save(replacement);
        ++recreations_;
        attachReplacement(replacement);
        std::cout << "[StaleOrderMonitor] Order " << canceled.id << " replaced by " << replacement.id
                  << " @ " << price << " x " << amount << " (market " << market << ")" << std::endl;
        return;
    }

    if (ack.status == ExchangeCallStatus::REJECTED) {
        replacement.reject(ack.message);
        orders_->save(replacement);
        failRecreation(canceled, "replacement rejected: " + ack.message);
        return;
    }

    ++ambiguousOutcomes_;
    replacement.recordError(kUnknownPlacement + ack.message);
    replacement = orders_->save(replacement);
    std::cerr << "[StaleOrderMonitor] Replacement " << replacement.id << " for order " << canceled.id
              << " has unknown placement outcome, looking up by client id" << std::endl;

    switch (resolvePlacement(replacement)) {
        case PlacementResolution::PLACED:
            ++recreations_;
            attachReplacement(replacement);
            std::cout << "[StaleOrderMonitor] Order " << canceled.id << " replaced by " << replacement.id
                      << " (found on exchange as " << *replacement.exchangeId << ")" << std::endl;
            break;
        case PlacementResolution::ABSENT:
            failRecreation(canceled, "replacement " + std::to_string(replacement.id) + " not found on exchange");
            break;
        case PlacementResolution::UNRESOLVED:
            // Ордер мог попасть на биржу: сделка держит его, пока поиск
            // по clientOrderId не даст ответ в следующих циклах
            attachReplacement(replacement);
            std::cerr << "[StaleOrderMonitor] Replacement " << replacement.id
                      << " left PENDING until the exchange answers" << std::endl;
            break;
    }
}

StaleOrderMonitor::PlacementResolution StaleOrderMonitor::resolvePlacement(Order& replacement) {
    auto lookup = queryByClientId(replacement);
    if (!lookup) {
        return PlacementResolution::UNRESOLVED;
    }

    if (!lookup->found) {
        replacement.reject("placement not found on exchange");
        replacement = orders_->save(replacement);
        return PlacementResolution::ABSENT;
    }

    replacement.markPlaced(lookup->exchangeId);
    replacement.applyExchangeStatus(lookup->report);
    replacement.lastError.clear();
    replacement = orders_->save(replacement);
    return PlacementResolution::PLACED;
}

void StaleOrderMonitor::resolvePendingPlacements() {
    auto pending = orders_->scan([](const Order& o) {
        return o.side == domain::OrderSide::BUY && o.status == OrderStatus::PENDING &&
               o.lastError.compare(0, kUnknownPlacement.size(), kUnknownPlacement) == 0;
    });

    for (auto& order : pending) {
        try {
            switch (resolvePlacement(order)) {
                case PlacementResolution::PLACED:
                    ++recreations_;
                    attachReplacement(order);
                    std::cout << "[StaleOrderMonitor] Replacement " << order.id << " found on exchange as "
                              << *order.exchangeId << ", now " << domain::toString(order.status) << std::endl;
                    break;
                case PlacementResolution::ABSENT:
                    ++recreationFailures_;
                    releaseDeal(order, "replacement " + std::to_string(order.id) + " not found on exchange");
                    std::cerr << "[StaleOrderMonitor] Replacement " << order.id
                              << " never reached the exchange, rejected" << std::endl;
                    break;
                case PlacementResolution::UNRESOLVED:
                    break;
            }
        } catch (const std::exception& e) {
            std::cerr << "[StaleOrderMonitor] Resolving replacement " << order.id << " failed: "
                      << e.what() << std::endl;
        }
    }
}

bool StaleOrderMonitor::attachReplacement(Order& replacement) {
    if (!replacement.dealId) {
        return true;
    }

    try {
        auto deal = deals_->findDeal(*replacement.dealId);
        if (deal && deal->buyOrderId == replacement.id) {
            return true;
        }
        deals_->replaceBuyOrder(*replacement.dealId, replacement.id);
        return true;
    } catch (const std::exception& e) {
        ++recreationFailures_;
        const std::string error = "deal " + std::to_string(*replacement.dealId) + " not updated: " + e.what();
        replacement.recordError(replacement.lastError.empty() ? error : replacement.lastError + "; " + error);
        replacement = orders_->save(replacement);
        std::cerr << "[StaleOrderMonitor] Replacement " << replacement.id << ": " << error << std::endl;
        return false;
    }
}

void StaleOrderMonitor::releaseDeal(const Order& replacement, const std::string& reason) {
    if (!replacement.dealId) {
        return;
    }
    auto deal = deals_->findDeal(*replacement.dealId);
    if (deal && !deal->isFinal() && deal->buyOrderId == replacement.id) {
        deals_->detachBuyOrder(deal->id, reason);
    }
}

void StaleOrderMonitor::failRecreation(Order canceled, const std::string& reason) {
    ++recreationFailures_;

    canceled.recordError(reason);
    orders_->save(canceled);

    if (canceled.dealId) {
        deals_->detachBuyOrder(*canceled.dealId, "recreation of order " + std::to_string(canceled.id) +
                                                 " failed: " + reason);
    }
    std::cerr << "[StaleOrderMonitor] Recreation of order " << canceled.id << " failed: " << reason << std::endl;
}

// ============================================================================
// Запросы к бирже (безопасно повторять)
// ============================================================================

std::optional<domain::OrderStatusReport> StaleOrderMonitor::queryStatus(const Order& order) {
    for (int attempt = 1; attempt <= settings_.getStatusQueryAttempts(); ++attempt) {
        try {
            auto report = exchange_->fetchOrderStatus(*order.exchangeId, order.symbol);
            if (report) {
                return report;
            }
        } catch (const std::exception& e) {
            std::cerr << "[StaleOrderMonitor] fetchOrderStatus(" << *order.exchangeId << ") attempt "
                      << attempt << " failed: " << e.what() << std::endl;
        }
    }
    return std::nullopt;
}

std::optional<domain::ClientOrderLookup> StaleOrderMonitor::queryByClientId(const Order& order) {
    const std::string clientOrderId = std::to_string(order.id);
    for (int attempt = 1; attempt <= settings_.getStatusQueryAttempts(); ++attempt) {
        try {
            auto lookup = exchange_->fetchOrderByClientId(clientOrderId, order.symbol);
            if (lookup) {
                return lookup;
            }
        } catch (const std::exception& e) {
            std::cerr << "[StaleOrderMonitor] fetchOrderByClientId(" << clientOrderId << ") attempt "
                      << attempt << " failed: " << e.what() << std::endl;
        }
    }
    return std::nullopt;
}

std::optional<Decimal> StaleOrderMonitor::queryMarketPrice(const std::string& symbol) {
    try {
        return exchange_->fetchMarketPrice(symbol);
    } catch (const std::exception& e) {
        std::cerr << "[StaleOrderMonitor] fetchMarketPrice(" << symbol << ") failed: " << e.what() << std::endl;
        return std::nullopt;
    }
}

void StaleOrderMonitor::logSummaryIfDue(const domain::Timestamp& now) {
    if (now - lastSummaryAt_ < settings_.getSummaryInterval()) {
        return;
    }

    const auto s = statistics();
    std::cout << "[StaleOrderMonitor] Summary: checks=" << s.checksPerformed
              << " quiet=" << quietCycles_
              << " stale=" << s.staleOrdersFound
              << " canceled=" << s.cancellations
              << " recreated=" << s.recreations
              << " failed=" << s.recreationFailures
              << " cooldown=" << s.skippedByCooldown
              << " ambiguous=" << s.ambiguousOutcomes << std::endl;

    lastSummaryAt_ = now;
    quietCycles_ = 0;
}

} // namespace memtrade::application
