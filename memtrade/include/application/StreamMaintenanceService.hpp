#pragma once

#include "ports/output/IStorageControl.hpp"
#include "settings/StorageSettings.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace memtrade::application {

/**
 * @brief Итог одного прохода обслуживания
 */
struct MaintenanceResult {
    size_t dumpsRequested = 0;
    size_t filesDeleted = 0;
    bool sweepPerformed = false;
};

/**
 * @brief Фоновое обслуживание потоковых репозиториев
 *
 * - выгрузка по времени: если с последней выгрузки прошло больше
 *   dump_interval_seconds и буфер не пуст, запрашивается requestDump();
 * - очистка файлов старше retention_days раз в
 *   retention_sweep_interval_seconds (данные в памяти не затрагиваются).
 */
class StreamMaintenanceService {
public:
    StreamMaintenanceService(
        std::shared_ptr<ports::output::IStorageControl> storage,
        const settings::StorageSettings& settings,
        std::chrono::milliseconds tickInterval = std::chrono::seconds(1))
        : storage_(std::move(storage))
        , sweepInterval_(settings.getRetentionSweepIntervalSeconds())
        , tickInterval_(tickInterval)
        , lastSweepAt_(domain::Timestamp::fromMillis(0))
    {}

    ~StreamMaintenanceService() {
        stop();
    }

    StreamMaintenanceService(const StreamMaintenanceService&) = delete;
    StreamMaintenanceService& operator=(const StreamMaintenanceService&) = delete;

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        workerThread_ = std::thread([this]() {
            runLoop();
        });
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        wakeCv_.notify_all();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }
    }

    bool isRunning() const { return running_.load(); }

    MaintenanceResult runOnce(const domain::Timestamp& now) {
        std::lock_guard<std::mutex> lock(cycleMutex_);
        MaintenanceResult result;

        const auto streams = storage_->streamingRepositories();
        for (const auto& handle : streams) {
            if (handle.store->memoryUsage().recordCount == 0) {
                continue;
            }
            if (now - handle.store->lastDumpAt() >= handle.dumpInterval && handle.store->requestDump()) {
                ++result.dumpsRequested;
                std::cout << "[StreamMaintenance] Time-based dump requested for "
                          << domain::toString(handle.kind) << std::endl;
            }
        }

        if (now - lastSweepAt_ >= sweepInterval_) {
            for (const auto& handle : streams) {
                result.filesDeleted += handle.store->cleanupExpiredDumps(now);
            }
            result.sweepPerformed = true;
            lastSweepAt_ = now;
        }

        return result;
    }

private:
    void runLoop() {
        while (running_.load()) {
            try {
                runOnce(domain::Timestamp::now());
            } catch (const std::exception& e) {
                std::cerr << "[StreamMaintenance] Cycle failed: " << e.what() << std::endl;
            }

            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeCv_.wait_for(lock, tickInterval_, [this]() { return !running_.load(); });
        }
    }

    std::shared_ptr<ports::output::IStorageControl> storage_;
    std::chrono::seconds sweepInterval_;
    std::chrono::milliseconds tickInterval_;

    std::mutex cycleMutex_;
    domain::Timestamp lastSweepAt_;

    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    std::thread workerThread_;
};

} // namespace memtrade::application
