#pragma once

#include "domain/StorageStats.hpp"
#include "domain/Timestamp.hpp"

#include <chrono>
#include <cstddef>

namespace memtrade::ports::output {

/**
 * @brief Обслуживание потокового репозитория без привязки к типу записей
 *
 * Через этот интерфейс RepositoryFactory, StreamMaintenanceService и
 * ShutdownCoordinator управляют выгрузками всех потоковых видов.
 */
class IBatchDumpStore {
public:
    virtual ~IBatchDumpStore() = default;

    /**
     * @brief Синхронно выгрузить весь буфер в один файл и очистить его
     */
    virtual domain::DumpResult forceDump() = 0;

    /**
     * @brief Запросить асинхронную выгрузку
     * @return false, если выгрузка уже выполняется или буфер пуст
     */
    virtual bool requestDump() = 0;

    virtual bool awaitPendingDumps(std::chrono::milliseconds timeout) = 0;

    virtual domain::MemoryUsage memoryUsage() const = 0;

    /**
     * @brief Удалить файлы выгрузки старше срока хранения
     * @return Количество удалённых файлов
     */
    virtual size_t cleanupExpiredDumps(const domain::Timestamp& now) = 0;

    /**
     * @brief Прекратить приём новых записей
     */
    virtual void closeIngestion() = 0;

    /**
     * @brief Время последней выгрузки (или создания репозитория)
     */
    virtual domain::Timestamp lastDumpAt() const = 0;

    virtual domain::StreamStats stats() const = 0;
};

} // namespace memtrade::ports::output
