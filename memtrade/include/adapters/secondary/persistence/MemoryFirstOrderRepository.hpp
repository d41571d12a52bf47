#pragma once

#include "InMemoryOrderRepository.hpp"
#include "WriteThroughSync.hpp"
#include "ports/output/IDurableStoreProvider.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/ISyncableRepository.hpp"

#include <iostream>
#include <memory>

namespace memtrade::adapters::secondary {

/**
 * @brief Репозиторий ордеров: источник истины в памяти, копия в PostgreSQL
 *
 * Декоратор над InMemoryOrderRepository. Каждый save()/deleteById()
 * ровно один раз ставит фоновую задачу записи в хранилище; чтение
 * обслуживается только из памяти.
 *
 * При создании загружает все ордера из хранилища. Если хранилище
 * недоступно, работает с пустой таблицей (degraded mode).
 */
class MemoryFirstOrderRepository
    : public ports::output::IOrderRepository
    , public ports::output::ISyncableRepository {
public:
    MemoryFirstOrderRepository(
        std::shared_ptr<ports::output::IOrderStore> store,
        size_t syncQueueCapacity,
        size_t syncWorkers)
        : memory_(std::make_shared<InMemoryOrderRepository>())
        , sync_("orders", std::move(store), syncQueueCapacity, syncWorkers)
    {
        if (auto rows = sync_.loadAll()) {
            memory_->loadSnapshot(*rows);
        }
        std::cout << "[OrdersRepo] Memory-first repository ready, "
                  << memory_->count() << " orders in memory" << std::endl;
    }

    domain::Order save(const domain::Order& order) override {
        auto saved = memory_->save(order);
        sync_.scheduleUpsert(saved);
        return saved;
    }

    std::optional<domain::Order> findById(int64_t id) const override {
        return memory_->findById(id);
    }

    std::optional<domain::Order> findByExchangeId(const std::string& exchangeId) const override {
        return memory_->findByExchangeId(exchangeId);
    }

    std::vector<domain::Order> findOpen() const override {
        return memory_->findOpen();
    }

    std::vector<domain::Order> findOpenBySide(domain::OrderSide side) const override {
        return memory_->findOpenBySide(side);
    }

    std::vector<domain::Order> findByDeal(int64_t dealId) const override {
        return memory_->findByDeal(dealId);
    }

    std::vector<domain::Order> findByStatus(domain::OrderStatus status) const override {
        return memory_->findByStatus(status);
    }

    std::vector<domain::Order> scan(const Predicate& predicate) const override {
        return memory_->scan(predicate);
    }

    std::vector<domain::Order> findAll() const override {
        return memory_->findAll();
    }

    bool deleteById(int64_t id) override {
        if (!memory_->deleteById(id)) {
            return false;
        }
        sync_.scheduleRemove(id);
        return true;
    }

    size_t count() const override {
        return memory_->count();
    }

    // ========================================================================
    // ISyncableRepository
    // ========================================================================

    domain::SyncResult forceFullResync() override {
        return sync_.fullResync([this]() { return memory_->findAll(); });
    }

    bool awaitPendingSyncs(std::chrono::milliseconds timeout) override {
        return sync_.awaitPending(timeout);
    }

    domain::SyncStats syncStats() const override {
        return sync_.stats();
    }

private:
    std::shared_ptr<InMemoryOrderRepository> memory_;
    WriteThroughSync<domain::Order> sync_;
};

} // namespace memtrade::adapters::secondary
