#pragma once

#include "application/ShutdownCoordinator.hpp"
#include "settings/EngineSettings.hpp"

#include <atomic>
#include <memory>

// Forward declarations - Ports
namespace memtrade::ports::input {
    class IDealService;
}

namespace memtrade::ports::output {
    class IDurableStoreProvider;
    class IExchangeConnector;
}

namespace memtrade::adapters::secondary {
    class RepositoryFactory;
}

/**
 * @class EngineApp
 * @brief Корень приложения memtrade
 *
 * Собирает граф объектов через Boost.DI:
 * - Secondary Adapters: PostgresStoreProvider, RepositoryFactory, PaperExchangeConnector
 * - Application Services: DealService, StaleOrderMonitor, StreamMaintenanceService
 *
 * start() запускает фоновые сервисы, stop() выполняет ShutdownCoordinator.
 */
class EngineApp
{
public:
    explicit EngineApp(std::shared_ptr<memtrade::settings::EngineSettings> settings);

    /**
     * @brief Конструктор с подменой внешних систем (тесты, симуляция)
     * @param stores nullptr: PostgresStoreProvider из настроек
     * @param exchange nullptr: PaperExchangeConnector
     */
    EngineApp(
        std::shared_ptr<memtrade::settings::EngineSettings> settings,
        std::shared_ptr<memtrade::ports::output::IDurableStoreProvider> stores,
        std::shared_ptr<memtrade::ports::output::IExchangeConnector> exchange);

    ~EngineApp();

    EngineApp(const EngineApp&) = delete;
    EngineApp& operator=(const EngineApp&) = delete;

    void start();

    /**
     * @brief Упорядоченная остановка; повторный вызов возвращает тот же отчёт
     */
    memtrade::application::ShutdownReport stop();

    bool isRunning() const { return running_.load(); }

    memtrade::adapters::secondary::RepositoryFactory& repositories() { return *factory_; }
    memtrade::ports::input::IDealService& deals() { return *dealService_; }
    memtrade::ports::output::IExchangeConnector& exchange() { return *exchange_; }
    memtrade::application::StaleOrderMonitor& monitor() { return *monitor_; }

private:
    void configureInjection();
    void printStartupBanner();

    std::shared_ptr<memtrade::settings::EngineSettings> settings_;
    std::shared_ptr<memtrade::ports::output::IDurableStoreProvider> stores_;
    std::shared_ptr<memtrade::ports::output::IExchangeConnector> exchange_;

    std::shared_ptr<memtrade::adapters::secondary::RepositoryFactory> factory_;
    std::shared_ptr<memtrade::ports::input::IDealService> dealService_;
    std::shared_ptr<memtrade::application::StaleOrderMonitor> monitor_;
    std::shared_ptr<memtrade::application::StreamMaintenanceService> maintenance_;
    std::unique_ptr<memtrade::application::ShutdownCoordinator> shutdown_;

    std::atomic<bool> running_{false};
};
