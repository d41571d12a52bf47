#pragma once

#include "InMemoryDealRepository.hpp"
#include "WriteThroughSync.hpp"
#include "ports/output/IDealRepository.hpp"
#include "ports/output/IDurableStoreProvider.hpp"
#include "ports/output/ISyncableRepository.hpp"

#include <iostream>
#include <memory>

namespace memtrade::adapters::secondary {

/**
 * @brief Репозиторий сделок с фоновой записью в PostgreSQL
 *
 * См. MemoryFirstOrderRepository.
 */
class MemoryFirstDealRepository
    : public ports::output::IDealRepository
    , public ports::output::ISyncableRepository {
public:
    MemoryFirstDealRepository(
        std::shared_ptr<ports::output::IDealStore> store,
        size_t syncQueueCapacity,
        size_t syncWorkers)
        : memory_(std::make_shared<InMemoryDealRepository>())
        , sync_("deals", std::move(store), syncQueueCapacity, syncWorkers)
    {
        if (auto rows = sync_.loadAll()) {
            memory_->loadSnapshot(*rows);
        }
        std::cout << "[DealsRepo] Memory-first repository ready, "
                  << memory_->count() << " deals in memory" << std::endl;
    }

    domain::Deal save(const domain::Deal& deal) override {
        auto saved = memory_->save(deal);
        sync_.scheduleUpsert(saved);
        return saved;
    }

    std::optional<domain::Deal> findById(int64_t id) const override {
        return memory_->findById(id);
    }

    std::vector<domain::Deal> findActive() const override {
        return memory_->findActive();
    }

    std::vector<domain::Deal> findBySymbol(const std::string& symbol) const override {
        return memory_->findBySymbol(symbol);
    }

    std::vector<domain::Deal> scan(const Predicate& predicate) const override {
        return memory_->scan(predicate);
    }

    std::vector<domain::Deal> findAll() const override {
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
    std::shared_ptr<InMemoryDealRepository> memory_;
    WriteThroughSync<domain::Deal> sync_;
};

} // namespace memtrade::adapters::secondary
