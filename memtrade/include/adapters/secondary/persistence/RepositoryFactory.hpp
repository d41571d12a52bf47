#pragma once

#include "domain/IndicatorPoint.hpp"
#include "domain/OrderBookSnapshot.hpp"
#include "domain/StorageStats.hpp"
#include "domain/Ticker.hpp"
#include "domain/enums/RepositoryKind.hpp"
#include "domain/enums/StorageBackend.hpp"
#include "ports/output/IDealRepository.hpp"
#include "ports/output/IDurableStoreProvider.hpp"
#include "ports/output/IOrderRepository.hpp"
#include "ports/output/IStorageControl.hpp"
#include "ports/output/IStreamRepository.hpp"
#include "ports/output/ISyncableRepository.hpp"
#include "settings/EngineSettings.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace memtrade::adapters::secondary {

/**
 * @brief Владелец всех репозиториев процесса
 *
 * Создаётся один раз в EngineApp и передаётся компонентам. Каждый
 * репозиторий создаётся при первом обращении и кэшируется.
 *
 * Для ORDERS/DEALS бэкенд берётся из StorageSettings. Если
 * MEMORY_WITH_DURABLE_SYNC создать не удалось (хранилище недоступно),
 * для этого вида используется PURE_MEMORY_LEGACY; остальные виды
 * не затрагиваются.
 */
class RepositoryFactory : public ports::output::IStorageControl {
public:
    RepositoryFactory(
        std::shared_ptr<settings::EngineSettings> settings,
        std::shared_ptr<ports::output::IDurableStoreProvider> stores);

    ~RepositoryFactory() override;

    RepositoryFactory(const RepositoryFactory&) = delete;
    RepositoryFactory& operator=(const RepositoryFactory&) = delete;

    std::shared_ptr<ports::output::IOrderRepository> orders();
    std::shared_ptr<ports::output::IDealRepository> deals();
    std::shared_ptr<ports::output::IStreamRepository<domain::Ticker>> tickers();
    std::shared_ptr<ports::output::IStreamRepository<domain::OrderBookSnapshot>> orderBooks();
    std::shared_ptr<ports::output::IStreamRepository<domain::IndicatorPoint>> indicators();

    /**
     * @brief Фактически используемый бэкенд
     * @return nullopt для потоковых видов и ещё не созданных репозиториев
     */
    std::optional<domain::StorageBackend> backendOf(domain::RepositoryKind kind) const;

    /**
     * @brief forceFullResync() для каждого созданного репозитория с синхронизацией
     *
     * Ошибка одного репозитория не мешает остальным.
     */
    std::map<domain::RepositoryKind, domain::SyncResult> forceSyncAll() override;

    /**
     * @brief forceDump() для каждого созданного потокового репозитория
     */
    std::map<domain::RepositoryKind, domain::DumpResult> forceDumpAll() override;

    /**
     * @return true, если все очереди синхронизации опустели до таймаута
     */
    bool awaitPendingSyncs(std::chrono::milliseconds timeout) override;

    /**
     * @brief Закрыть приём данных во всех потоковых репозиториях
     */
    void closeIngestion() override;

    std::vector<ports::output::StreamHandle> streamingRepositories() const override;

    std::map<domain::RepositoryKind, domain::SyncStats> syncStats() const;

    /**
     * @brief Сводка по всем созданным репозиториям (для логов)
     */
    nlohmann::json storageInfo() const override;

    const settings::EngineSettings& settings() const { return *settings_; }

private:
    template <typename Observation>
    std::shared_ptr<ports::output::IStreamRepository<Observation>> stream(
        domain::RepositoryKind kind,
        std::shared_ptr<ports::output::IStreamRepository<Observation>>& slot);

    std::shared_ptr<settings::EngineSettings> settings_;
    std::shared_ptr<ports::output::IDurableStoreProvider> stores_;

    mutable std::mutex mutex_;

    std::shared_ptr<ports::output::IOrderRepository> orders_;
    std::shared_ptr<ports::output::IDealRepository> deals_;
    std::shared_ptr<ports::output::IStreamRepository<domain::Ticker>> tickers_;
    std::shared_ptr<ports::output::IStreamRepository<domain::OrderBookSnapshot>> orderBooks_;
    std::shared_ptr<ports::output::IStreamRepository<domain::IndicatorPoint>> indicators_;

    std::map<domain::RepositoryKind, domain::StorageBackend> backends_;
    std::map<domain::RepositoryKind, std::shared_ptr<ports::output::ISyncableRepository>> syncables_;
    std::map<domain::RepositoryKind, std::shared_ptr<ports::output::IBatchDumpStore>> streams_;
};

} // namespace memtrade::adapters::secondary
