#pragma once

#include <string>
#include <stdexcept>

namespace memtrade::domain {

/**
 * @brief Бэкенд хранения для сущностей Order/Deal
 *
 * Выбирается один раз при создании репозитория.
 */
enum class StorageBackend {
    MEMORY_WITH_DURABLE_SYNC,  ///< Память + асинхронная запись в PostgreSQL
    PURE_MEMORY_LEGACY         ///< Только память
};

inline std::string toString(StorageBackend backend) {
    return backend == StorageBackend::MEMORY_WITH_DURABLE_SYNC
        ? "memory_with_durable_sync"
        : "pure_memory_legacy";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline StorageBackend storageBackendFromString(const std::string& str) {
    if (str == "memory_with_durable_sync") return StorageBackend::MEMORY_WITH_DURABLE_SYNC;
    if (str == "pure_memory_legacy")       return StorageBackend::PURE_MEMORY_LEGACY;
    throw std::invalid_argument("Unknown StorageBackend: " + str);
}

} // namespace memtrade::domain
