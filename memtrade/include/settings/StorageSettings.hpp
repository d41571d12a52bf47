#pragma once

#include "SettingsUtils.hpp"
#include "domain/enums/RepositoryKind.hpp"
#include "domain/enums/StorageBackend.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace memtrade::settings {

/**
 * @brief Лимиты потокового репозитория
 */
class StreamSettings {
public:
    StreamSettings() = default;

    StreamSettings(const nlohmann::json& section, const StreamSettings& defaults) {
        memoryLimitBytes_ = valueOr<size_t>(section, "memory_limit_bytes", defaults.memoryLimitBytes_);
        dumpThresholdBytes_ = valueOr<size_t>(section, "dump_threshold_bytes", defaults.dumpThresholdBytes_);
        dumpIntervalSeconds_ = valueOr<int>(section, "dump_interval_seconds", defaults.dumpIntervalSeconds_);

        if (dumpThresholdBytes_ > memoryLimitBytes_) {
            throw std::invalid_argument("dump_threshold_bytes must not exceed memory_limit_bytes");
        }
    }

    static StreamSettings of(size_t memoryLimitBytes, size_t dumpThresholdBytes, int dumpIntervalSeconds) {
        StreamSettings s;
        s.memoryLimitBytes_ = memoryLimitBytes;
        s.dumpThresholdBytes_ = dumpThresholdBytes;
        s.dumpIntervalSeconds_ = dumpIntervalSeconds;
        return s;
    }

    size_t getMemoryLimitBytes() const { return memoryLimitBytes_; }
    size_t getDumpThresholdBytes() const { return dumpThresholdBytes_; }
    int getDumpIntervalSeconds() const { return dumpIntervalSeconds_; }

private:
    size_t memoryLimitBytes_ = 256 * 1024 * 1024;
    size_t dumpThresholdBytes_ = 192 * 1024 * 1024;
    int dumpIntervalSeconds_ = 300;
};

/**
 * @brief Настройки хранилищ (секция "storage")
 *
 * ENV: MEMTRADE_ORDERS_BACKEND, MEMTRADE_DEALS_BACKEND, MEMTRADE_DUMP_DIR
 */
class StorageSettings {
public:
    StorageSettings() : StorageSettings(nlohmann::json::object()) {}

    explicit StorageSettings(const nlohmann::json& section) {
        ordersBackend_ = domain::storageBackendFromString(getEnvOrDefault(
            "MEMTRADE_ORDERS_BACKEND",
            valueOr<std::string>(section, "orders_backend", "memory_with_durable_sync")));
        dealsBackend_ = domain::storageBackendFromString(getEnvOrDefault(
            "MEMTRADE_DEALS_BACKEND",
            valueOr<std::string>(section, "deals_backend", "memory_with_durable_sync")));

        legacyMaxOrders_ = valueOr<size_t>(section, "legacy_max_orders", 50000);
        legacyMaxDeals_ = valueOr<size_t>(section, "legacy_max_deals", 10000);
        syncQueueCapacity_ = valueOr<size_t>(section, "sync_queue_capacity", 10000);
        syncWorkers_ = valueOr<size_t>(section, "sync_workers", 2);
        shutdownSyncWaitMs_ = valueOr<int>(section, "shutdown_sync_wait_ms", 5000);

        dumpDir_ = getEnvOrDefault("MEMTRADE_DUMP_DIR", valueOr<std::string>(section, "dump_dir", "data/dumps"));
        retentionDays_ = valueOr<int>(section, "retention_days", 7);
        retentionSweepIntervalSeconds_ = valueOr<int>(section, "retention_sweep_interval_seconds", 3600);

        tickers_ = StreamSettings(sectionOf(section, "tickers"),
                                  StreamSettings::of(256u << 20, 192u << 20, 300));
        orderBooks_ = StreamSettings(sectionOf(section, "order_books"),
                                     StreamSettings::of(256u << 20, 192u << 20, 180));
        indicators_ = StreamSettings(sectionOf(section, "indicators"),
                                     StreamSettings::of(64u << 20, 48u << 20, 300));

        if (retentionDays_ < 0) {
            throw std::invalid_argument("retention_days must be non-negative");
        }
    }

    domain::StorageBackend getOrdersBackend() const { return ordersBackend_; }
    domain::StorageBackend getDealsBackend() const { return dealsBackend_; }
    size_t getLegacyMaxOrders() const { return legacyMaxOrders_; }
    size_t getLegacyMaxDeals() const { return legacyMaxDeals_; }
    size_t getSyncQueueCapacity() const { return syncQueueCapacity_; }
    size_t getSyncWorkers() const { return syncWorkers_; }
    int getShutdownSyncWaitMs() const { return shutdownSyncWaitMs_; }
    std::string getDumpDir() const { return dumpDir_; }
    int getRetentionDays() const { return retentionDays_; }
    int getRetentionSweepIntervalSeconds() const { return retentionSweepIntervalSeconds_; }

    /**
     * @brief Лимиты для потокового вида репозитория
     * @throws std::invalid_argument для ORDERS/DEALS
     */
    const StreamSettings& getStream(domain::RepositoryKind kind) const {
        switch (kind) {
            case domain::RepositoryKind::TICKERS:     return tickers_;
            case domain::RepositoryKind::ORDER_BOOKS: return orderBooks_;
            case domain::RepositoryKind::INDICATORS:  return indicators_;
            default:
                throw std::invalid_argument("Not a streaming repository: " + domain::toString(kind));
        }
    }

private:
    domain::StorageBackend ordersBackend_ = domain::StorageBackend::MEMORY_WITH_DURABLE_SYNC;
    domain::StorageBackend dealsBackend_ = domain::StorageBackend::MEMORY_WITH_DURABLE_SYNC;
    size_t legacyMaxOrders_ = 50000;
    size_t legacyMaxDeals_ = 10000;
    size_t syncQueueCapacity_ = 10000;
    size_t syncWorkers_ = 2;
    int shutdownSyncWaitMs_ = 5000;
    std::string dumpDir_;
    int retentionDays_ = 7;
    int retentionSweepIntervalSeconds_ = 3600;
    StreamSettings tickers_;
    StreamSettings orderBooks_;
    StreamSettings indicators_;
};

} // namespace memtrade::settings
