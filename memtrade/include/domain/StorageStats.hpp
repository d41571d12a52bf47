#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace memtrade::domain {

/**
 * @brief Счётчики фоновой синхронизации с PostgreSQL
 */
struct SyncStats {
    uint64_t scheduled = 0;       ///< Задачи, поставленные в очередь
    uint64_t succeeded = 0;
    uint64_t failed = 0;          ///< Ошибки записи в БД
    uint64_t dropped = 0;         ///< Очередь была заполнена
    uint64_t superseded = 0;      ///< Отброшены: уже покрыты полной пересинхронизацией
    uint64_t resyncs = 0;
    uint64_t resyncFailures = 0;
    std::string lastError;
};

/**
 * @brief Результат полной пересинхронизации таблицы
 */
struct SyncResult {
    bool ok = false;
    size_t rows = 0;
    std::string error;
};

/**
 * @brief Результат выгрузки буфера в файл
 */
struct DumpResult {
    bool ok = false;
    std::string path;     ///< Пусто, если буфер был пуст
    size_t records = 0;
    std::string error;
};

/**
 * @brief Использование памяти потоковым репозиторием
 */
struct MemoryUsage {
    size_t recordCount = 0;
    size_t estimatedBytes = 0;
    double percentOfLimit = 0.0;
};

/**
 * @brief Счётчики потокового репозитория
 */
struct StreamStats {
    uint64_t appended = 0;
    uint64_t dumps = 0;
    uint64_t dumpedRecords = 0;
    uint64_t dumpFailures = 0;
    uint64_t evicted = 0;          ///< Удалены из памяти при достижении жёсткого лимита
    uint64_t rejectedAfterClose = 0;
    uint64_t filesDeleted = 0;     ///< Удалены политикой хранения
};

} // namespace memtrade::domain
