#pragma once

#include "domain/StorageStats.hpp"

#include <chrono>

namespace memtrade::ports::output {

/**
 * @brief Репозиторий с фоновой синхронизацией в долговременное хранилище
 */
class ISyncableRepository {
public:
    virtual ~ISyncableRepository() = default;

    /**
     * @brief Перезаписать таблицу в хранилище текущим содержимым памяти
     */
    virtual domain::SyncResult forceFullResync() = 0;

    /**
     * @brief Дождаться завершения поставленных задач синхронизации
     * @return true, если очередь опустела до истечения таймаута
     */
    virtual bool awaitPendingSyncs(std::chrono::milliseconds timeout) = 0;

    virtual domain::SyncStats syncStats() const = 0;
};

} // namespace memtrade::ports::output
