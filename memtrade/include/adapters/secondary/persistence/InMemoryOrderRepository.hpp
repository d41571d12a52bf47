#pragma once

#include "ports/output/IOrderRepository.hpp"
#include "adapters/secondary/memory/InMemoryTable.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>

namespace memtrade::adapters::secondary {

/**
 * @brief In-memory реализация репозитория ордеров
 *
 * Используется как самостоятельный бэкенд pure_memory_legacy и как
 * таблица в памяти внутри MemoryFirstOrderRepository.
 * При maxOrders > 0 и переполнении вытесняются самые старые финальные
 * ордера; открытые ордера не вытесняются никогда.
 */
class InMemoryOrderRepository : public ports::output::IOrderRepository {
public:
    explicit InMemoryOrderRepository(size_t maxOrders = 0)
        : maxOrders_(maxOrders)
    {}

    /**
     * @throws domain::InvariantViolation если exchangeId уже занят другим
     *         не отклонённым ордером
     */
    domain::Order save(const domain::Order& order) override {
        domain::Order saved;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            const bool ownsIndex = !order.exchangeId || claimExchangeIdLocked(order);
            saved = table_.upsert(order);
            if (saved.exchangeId && ownsIndex) {
                exchangeIndex_[*saved.exchangeId] = saved.id;
            }
        }

        if (maxOrders_ > 0 && table_.size() > maxOrders_) {
            evictFinalOrders();
        }
        return saved;
    }

    std::optional<domain::Order> findById(int64_t id) const override {
        return table_.get(id);
    }

    std::optional<domain::Order> findByExchangeId(const std::string& exchangeId) const override {
        int64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = exchangeIndex_.find(exchangeId);
            if (it == exchangeIndex_.end()) {
                return std::nullopt;
            }
            id = it->second;
        }
        return table_.get(id);
    }

    std::vector<domain::Order> findOpen() const override {
        return table_.scan([](const domain::Order& o) { return o.isOpen(); });
    }

    std::vector<domain::Order> findOpenBySide(domain::OrderSide side) const override {
        return table_.scan([side](const domain::Order& o) { return o.isOpen() && o.side == side; });
    }

    std::vector<domain::Order> findByDeal(int64_t dealId) const override {
        return table_.scan([dealId](const domain::Order& o) { return o.dealId && *o.dealId == dealId; });
    }

    std::vector<domain::Order> findByStatus(domain::OrderStatus status) const override {
        return table_.scan([status](const domain::Order& o) { return o.status == status; });
    }

    std::vector<domain::Order> scan(const Predicate& predicate) const override {
        return table_.scan(predicate);
    }

    std::vector<domain::Order> findAll() const override {
        return table_.all();
    }

    bool deleteById(int64_t id) override {
        auto order = table_.get(id);
        if (!order) {
            return false;
        }
        if (order->exchangeId) {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = exchangeIndex_.find(*order->exchangeId);
            if (it != exchangeIndex_.end() && it->second == id) {
                exchangeIndex_.erase(it);
            }
        }
        return table_.remove(id);
    }

    size_t count() const override {
        return table_.size();
    }

    /**
     * @brief Заменить содержимое (загрузка из БД при старте)
     */
    void loadSnapshot(const std::vector<domain::Order>& orders) {
        table_.replaceAll(orders);

        std::lock_guard<std::mutex> lock(indexMutex_);
        exchangeIndex_.clear();
        for (const auto& order : orders) {
            if (order.exchangeId && order.status != domain::OrderStatus::REJECTED) {
                exchangeIndex_[*order.exchangeId] = order.id;
            }
        }
        for (const auto& order : orders) {
            if (order.exchangeId && order.status == domain::OrderStatus::REJECTED) {
                exchangeIndex_.emplace(*order.exchangeId, order.id);
            }
        }
    }

private:
    /**
     * @brief Проверить уникальность exchangeId среди не отклонённых ордеров
     * @return true, если индекс должен указывать на этот ордер
     */
    bool claimExchangeIdLocked(const domain::Order& order) const {
        auto it = exchangeIndex_.find(*order.exchangeId);
        if (it == exchangeIndex_.end() || it->second == order.id) {
            return true;
        }

        auto holder = table_.get(it->second);
        if (!holder || holder->status == domain::OrderStatus::REJECTED) {
            return true;
        }
        if (order.status == domain::OrderStatus::REJECTED) {
            return false;
        }
        throw domain::InvariantViolation(
            "Exchange id " + *order.exchangeId + " already belongs to order " + std::to_string(holder->id));
    }

    void evictFinalOrders() {
        auto finals = table_.scan([](const domain::Order& o) { return o.isFinal(); });
        std::sort(finals.begin(), finals.end(),
            [](const domain::Order& a, const domain::Order& b) {
                return a.lastUpdatedAt < b.lastUpdatedAt;
            });

        const size_t current = table_.size();
        if (current <= maxOrders_) {
            return;
        }
        size_t excess = current - maxOrders_;
        size_t evicted = 0;
        for (const auto& order : finals) {
            if (evicted >= excess) {
                break;
            }
            if (deleteById(order.id)) {
                ++evicted;
            }
        }

        if (evicted > 0) {
            std::cout << "[OrdersRepo] Evicted " << evicted << " final orders (capacity "
                      << maxOrders_ << ")" << std::endl;
        }
    }

    InMemoryTable<domain::Order> table_;
    size_t maxOrders_;

    mutable std::mutex indexMutex_;
    std::unordered_map<std::string, int64_t> exchangeIndex_;  // exchangeId -> id
};

} // namespace memtrade::adapters::secondary
