#pragma once

#include "IBatchDumpStore.hpp"
#include "domain/StorageStats.hpp"
#include "domain/enums/RepositoryKind.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <vector>

namespace memtrade::ports::output {

/**
 * @brief Потоковый репозиторий вместе с его интервалом выгрузки
 */
struct StreamHandle {
    domain::RepositoryKind kind;
    std::shared_ptr<IBatchDumpStore> store;
    std::chrono::seconds dumpInterval;
};

/**
 * @brief Групповые операции над всеми репозиториями процесса
 *
 * Используется при обслуживании и остановке. Результаты возвращаются
 * по каждому виду репозитория: ошибка одного не прерывает остальные.
 */
class IStorageControl {
public:
    virtual ~IStorageControl() = default;

    virtual std::map<domain::RepositoryKind, domain::SyncResult> forceSyncAll() = 0;
    virtual std::map<domain::RepositoryKind, domain::DumpResult> forceDumpAll() = 0;

    /**
     * @return true, если все очереди синхронизации опустели до таймаута
     */
    virtual bool awaitPendingSyncs(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Закрыть приём данных во всех потоковых репозиториях
     */
    virtual void closeIngestion() = 0;

    virtual std::vector<StreamHandle> streamingRepositories() const = 0;

    /**
     * @brief Сводка по всем репозиториям (для логов)
     */
    virtual nlohmann::json storageInfo() const = 0;
};

} // namespace memtrade::ports::output
