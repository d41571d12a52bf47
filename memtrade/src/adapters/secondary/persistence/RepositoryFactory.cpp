#include "adapters/secondary/persistence/RepositoryFactory.hpp"

#include "adapters/secondary/persistence/InMemoryDealRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "adapters/secondary/persistence/MemoryFirstDealRepository.hpp"
#include "adapters/secondary/persistence/MemoryFirstOrderRepository.hpp"
#include "adapters/secondary/stream/StreamBatchRepository.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace memtrade::adapters::secondary {

using domain::RepositoryKind;
using domain::StorageBackend;

RepositoryFactory::RepositoryFactory(
    std::shared_ptr<settings::EngineSettings> settings,
    std::shared_ptr<ports::output::IDurableStoreProvider> stores)
    : settings_(std::move(settings))
    , stores_(std::move(stores))
{
    if (!settings_) {
        throw std::invalid_argument("RepositoryFactory: settings are required");
    }
}

RepositoryFactory::~RepositoryFactory() = default;

// ============================================================================
// ORDERS / DEALS
// ============================================================================

std::shared_ptr<ports::output::IOrderRepository> RepositoryFactory::orders() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (orders_) {
        return orders_;
    }

    const auto& storage = settings_->storage();
    if (storage.getOrdersBackend() == StorageBackend::MEMORY_WITH_DURABLE_SYNC) {
        try {
            if (!stores_) {
                throw std::runtime_error("no durable store provider configured");
            }
            auto repo = std::make_shared<MemoryFirstOrderRepository>(
                stores_->createOrderStore(),
                storage.getSyncQueueCapacity(),
                storage.getSyncWorkers());
            syncables_[RepositoryKind::ORDERS] = repo;
            backends_[RepositoryKind::ORDERS] = StorageBackend::MEMORY_WITH_DURABLE_SYNC;
            orders_ = repo;
            return orders_;
        } catch (const std::exception& e) {
            std::cerr << "[RepositoryFactory] orders: memory_with_durable_sync unavailable, "
                      << "falling back to pure_memory_legacy: " << e.what() << std::endl;
        }
    }

    orders_ = std::make_shared<InMemoryOrderRepository>(storage.getLegacyMaxOrders());
    backends_[RepositoryKind::ORDERS] = StorageBackend::PURE_MEMORY_LEGACY;
    std::cout << "[RepositoryFactory] orders: pure_memory_legacy" << std::endl;
    return orders_;
}

std::shared_ptr<ports::output::IDealRepository> RepositoryFactory::deals() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deals_) {
        return deals_;
    }

    const auto& storage = settings_->storage();
    if (storage.getDealsBackend() == StorageBackend::MEMORY_WITH_DURABLE_SYNC) {
        try {
            if (!stores_) {
                throw std::runtime_error("no durable store provider configured");
            }
            auto repo = std::make_shared<MemoryFirstDealRepository>(
                stores_->createDealStore(),
                storage.getSyncQueueCapacity(),
                storage.getSyncWorkers());
            syncables_[RepositoryKind::DEALS] = repo;
            backends_[RepositoryKind::DEALS] = StorageBackend::MEMORY_WITH_DURABLE_SYNC;
            deals_ = repo;
            return deals_;
        } catch (const std::exception& e) {
            std::cerr << "[RepositoryFactory] deals: memory_with_durable_sync unavailable, "
                      << "falling back to pure_memory_legacy: " << e.what() << std::endl;
        }
    }

    deals_ = std::make_shared<InMemoryDealRepository>(storage.getLegacyMaxDeals());
    backends_[RepositoryKind::DEALS] = StorageBackend::PURE_MEMORY_LEGACY;
    std::cout << "[RepositoryFactory] deals: pure_memory_legacy" << std::endl;
    return deals_;
}

// ============================================================================
// STREAMS
// ============================================================================

template <typename Observation>
std::shared_ptr<ports::output::IStreamRepository<Observation>> RepositoryFactory::stream(
    RepositoryKind kind,
    std::shared_ptr<ports::output::IStreamRepository<Observation>>& slot)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot) {
        return slot;
    }

    const auto& storage = settings_->storage();
    auto repo = std::make_shared<StreamBatchRepository<Observation>>(
        kind, storage.getStream(kind), storage.getDumpDir(), storage.getRetentionDays());
    streams_[kind] = repo;
    slot = repo;
    return slot;
}

std::shared_ptr<ports::output::IStreamRepository<domain::Ticker>> RepositoryFactory::tickers() {
    return stream(RepositoryKind::TICKERS, tickers_);
}

std::shared_ptr<ports::output::IStreamRepository<domain::OrderBookSnapshot>> RepositoryFactory::orderBooks() {
    return stream(RepositoryKind::ORDER_BOOKS, orderBooks_);
}

std::shared_ptr<ports::output::IStreamRepository<domain::IndicatorPoint>> RepositoryFactory::indicators() {
    return stream(RepositoryKind::INDICATORS, indicators_);
}

// ============================================================================
// Массовые операции
// ============================================================================

std::optional<StorageBackend> RepositoryFactory::backendOf(RepositoryKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = backends_.find(kind);
    if (it == backends_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<RepositoryKind, domain::SyncResult> RepositoryFactory::forceSyncAll() {
    std::map<RepositoryKind, std::shared_ptr<ports::output::ISyncableRepository>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = syncables_;
    }

    std::map<RepositoryKind, domain::SyncResult> results;
    for (const auto& [kind, repo] : targets) {
        try {
            results[kind] = repo->forceFullResync();
        } catch (const std::exception& e) {
            domain::SyncResult failed;
            failed.error = e.what();
            results[kind] = failed;
        }

        const auto& result = results[kind];
        if (result.ok) {
            std::cout << "[RepositoryFactory] " << domain::toString(kind) << ": resynced "
                      << result.rows << " rows" << std::endl;
        } else {
            std::cerr << "[RepositoryFactory] " << domain::toString(kind) << ": resync failed: "
                      << result.error << std::endl;
        }
    }
    return results;
}

std::map<RepositoryKind, domain::DumpResult> RepositoryFactory::forceDumpAll() {
    std::map<RepositoryKind, std::shared_ptr<ports::output::IBatchDumpStore>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = streams_;
    }

    std::map<RepositoryKind, domain::DumpResult> results;
    for (const auto& [kind, repo] : targets) {
        try {
            results[kind] = repo->forceDump();
        } catch (const std::exception& e) {
            domain::DumpResult failed;
            failed.error = e.what();
            results[kind] = failed;
        }

        if (!results[kind].ok) {
            std::cerr << "[RepositoryFactory] " << domain::toString(kind) << ": dump failed: "
                      << results[kind].error << std::endl;
        }
    }
    return results;
}

bool RepositoryFactory::awaitPendingSyncs(std::chrono::milliseconds timeout) {
    std::map<RepositoryKind, std::shared_ptr<ports::output::ISyncableRepository>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = syncables_;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool drained = true;
    for (const auto& [kind, repo] : targets) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (!repo->awaitPendingSyncs(std::max(left, std::chrono::milliseconds(0)))) {
            std::cerr << "[RepositoryFactory] " << domain::toString(kind)
                      << ": sync queue not drained within timeout" << std::endl;
            drained = false;
        }
    }
    return drained;
}

void RepositoryFactory::closeIngestion() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [kind, repo] : streams_) {
        repo->closeIngestion();
    }
}

std::vector<ports::output::StreamHandle> RepositoryFactory::streamingRepositories() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ports::output::StreamHandle> handles;
    for (const auto& [kind, repo] : streams_) {
        handles.push_back(ports::output::StreamHandle{
            kind,
            repo,
            std::chrono::seconds(settings_->storage().getStream(kind).getDumpIntervalSeconds())});
    }
    return handles;
}

std::map<RepositoryKind, domain::SyncStats> RepositoryFactory::syncStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<RepositoryKind, domain::SyncStats> result;
    for (const auto& [kind, repo] : syncables_) {
        result[kind] = repo->syncStats();
    }
    return result;
}

nlohmann::json RepositoryFactory::storageInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json info = nlohmann::json::object();

    for (const auto& [kind, backend] : backends_) {
        nlohmann::json entry;
        entry["backend"] = domain::toString(backend);

        auto syncable = syncables_.find(kind);
        if (syncable != syncables_.end()) {
            const auto stats = syncable->second->syncStats();
            entry["sync"] = {
                {"scheduled", stats.scheduled},
                {"succeeded", stats.succeeded},
                {"failed", stats.failed},
                {"dropped", stats.dropped},
                {"superseded", stats.superseded},
                {"resyncs", stats.resyncs},
                {"resync_failures", stats.resyncFailures},
                {"last_error", stats.lastError}
            };
        }
        info[domain::toString(kind)] = entry;
    }

    for (const auto& [kind, repo] : streams_) {
        const auto usage = repo->memoryUsage();
        const auto stats = repo->stats();
        info[domain::toString(kind)] = {
            {"backend", "stream_batch"},
            {"records", usage.recordCount},
            {"estimated_bytes", usage.estimatedBytes},
            {"percent_of_limit", usage.percentOfLimit},
            {"appended", stats.appended},
            {"dumps", stats.dumps},
            {"dumped_records", stats.dumpedRecords},
            {"dump_failures", stats.dumpFailures},
            {"evicted", stats.evicted},
            {"rejected_after_close", stats.rejectedAfterClose},
            {"files_deleted", stats.filesDeleted}
        };
    }
    return info;
}

} // namespace memtrade::adapters::secondary
