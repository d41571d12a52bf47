#include "EngineApp.hpp"

// Application Services
#include "application/DealService.hpp"
#include "application/StaleOrderMonitor.hpp"
#include "application/StreamMaintenanceService.hpp"

// Secondary Adapters
#include "adapters/secondary/exchange/PaperExchangeConnector.hpp"
#include "adapters/secondary/persistence/PostgresStoreProvider.hpp"
#include "adapters/secondary/persistence/RepositoryFactory.hpp"

#include <boost/di.hpp>

#include <iostream>

namespace di = boost::di;

using namespace memtrade;

// ============================================================================
// EngineApp Implementation
// ============================================================================

EngineApp::EngineApp(std::shared_ptr<settings::EngineSettings> settings)
    : EngineApp(std::move(settings), nullptr, nullptr)
{}

EngineApp::EngineApp(
    std::shared_ptr<settings::EngineSettings> settings,
    std::shared_ptr<ports::output::IDurableStoreProvider> stores,
    std::shared_ptr<ports::output::IExchangeConnector> exchange)
    : settings_(std::move(settings))
    , stores_(std::move(stores))
    , exchange_(std::move(exchange))
{
    if (!settings_) {
        throw std::invalid_argument("EngineApp: settings are required");
    }
    configureInjection();
    std::cout << "[EngineApp] Application created" << std::endl;
}

EngineApp::~EngineApp()
{
    stop();
    std::cout << "[EngineApp] Application destroyed" << std::endl;
}

void EngineApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[EngineApp] Configuring Boost.DI injection..." << std::endl;

    if (!stores_) {
        stores_ = std::make_shared<adapters::secondary::PostgresStoreProvider>(settings_->db());
    }

    // Фабрика создаётся до инжектора: репозитории ORDERS/DEALS нужны
    // как готовые экземпляры, выбранные с учётом fallback
    factory_ = std::make_shared<adapters::secondary::RepositoryFactory>(settings_, stores_);
    auto orders = factory_->orders();
    auto deals = factory_->deals();

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<ports::output::IOrderRepository>().to(orders),
        di::bind<ports::output::IDealRepository>().to(deals),

        // Exchange connector - симулятор, если реальный не передан
        di::bind<ports::output::IExchangeConnector>()
            .to<adapters::secondary::PaperExchangeConnector>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::IDealService>()
            .to<application::DealService>()
            .in(di::singleton));

    if (!exchange_) {
        exchange_ = injector.create<std::shared_ptr<ports::output::IExchangeConnector>>();
    }
    dealService_ = injector.create<std::shared_ptr<ports::input::IDealService>>();

    monitor_ = std::make_shared<application::StaleOrderMonitor>(
        orders, dealService_, exchange_, settings_->monitor());

    maintenance_ = std::make_shared<application::StreamMaintenanceService>(
        factory_, settings_->storage());

    shutdown_ = std::make_unique<application::ShutdownCoordinator>(
        factory_, monitor_, maintenance_,
        std::chrono::milliseconds(settings_->storage().getShutdownSyncWaitMs()));

    std::cout << "[EngineApp] Storage: " << factory_->storageInfo().dump() << std::endl;
    std::cout << "[EngineApp] DI configuration completed" << std::endl;
}

void EngineApp::start()
{
    if (running_.exchange(true)) {
        return;
    }

    // Потоковые репозитории создаются сразу, чтобы обслуживание их видело
    factory_->tickers();
    factory_->orderBooks();
    factory_->indicators();

    maintenance_->start();
    if (settings_->monitor().isEnabled()) {
        monitor_->start();
    } else {
        std::cout << "[EngineApp] Stale order monitor disabled" << std::endl;
    }

    std::cout << "[EngineApp] Started" << std::endl;
}

application::ShutdownReport EngineApp::stop()
{
    running_ = false;
    return shutdown_->shutdown();
}

void EngineApp::printStartupBanner()
{
    const auto& storage = settings_->storage();
    std::cout << "========================================" << std::endl;
    std::cout << "  memtrade engine" << std::endl;
    std::cout << "  orders backend: " << memtrade::domain::toString(storage.getOrdersBackend()) << std::endl;
    std::cout << "  deals backend:  " << memtrade::domain::toString(storage.getDealsBackend()) << std::endl;
    std::cout << "  dump dir:       " << storage.getDumpDir() << std::endl;
    std::cout << "========================================" << std::endl;
}
