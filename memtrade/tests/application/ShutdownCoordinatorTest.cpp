/**
 * @file ShutdownCoordinatorTest.cpp
 * @brief Тесты порядка остановки
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/DealService.hpp"
#include "application/ShutdownCoordinator.hpp"
#include "adapters/secondary/persistence/InMemoryDealRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"
#include "mocks/FakeStorageControl.hpp"
#include "mocks/MockExchangeConnector.hpp"

using namespace memtrade;
using namespace memtrade::application;
using namespace std::chrono_literals;
using memtrade::tests::FakeBatchDumpStore;
using memtrade::tests::FakeStorageControl;
using ::testing::ElementsAre;

class ShutdownCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_shared<FakeStorageControl>();
        tickers_ = std::make_shared<FakeBatchDumpStore>();
        tickers_->records = 7;
        storage_->handles.push_back({domain::RepositoryKind::TICKERS, tickers_, std::chrono::seconds(300)});

        domain::SyncResult ok;
        ok.ok = true;
        ok.rows = 3;
        storage_->syncResults[domain::RepositoryKind::ORDERS] = ok;
        storage_->syncResults[domain::RepositoryKind::DEALS] = ok;
    }

    static std::vector<std::string> stepNames(const ShutdownReport& report) {
        std::vector<std::string> names;
        for (const auto& step : report.steps) {
            names.push_back(step.name);
        }
        return names;
    }

    static const ShutdownStep& step(const ShutdownReport& report, const std::string& name) {
        for (const auto& s : report.steps) {
            if (s.name == name) return s;
        }
        throw std::out_of_range(name);
    }

    std::shared_ptr<FakeStorageControl> storage_;
    std::shared_ptr<FakeBatchDumpStore> tickers_;
};

TEST_F(ShutdownCoordinatorTest, RunsStepsInOrder) {
    ShutdownCoordinator coordinator(storage_, nullptr, nullptr, 100ms);

    auto report = coordinator.shutdown();

    EXPECT_THAT(stepNames(report), ElementsAre("stop_monitor", "stop_maintenance", "close_ingestion",
                                               "await_pending_syncs", "force_sync_all", "force_dump_all",
                                               "final_stats"));
    EXPECT_THAT(storage_->callLog(), ElementsAre("closeIngestion", "awaitPendingSyncs", "forceSyncAll",
                                                 "forceDumpAll", "storageInfo"));
    EXPECT_TRUE(report.allOk());
    EXPECT_EQ(step(report, "stop_monitor").detail, "not configured");
    EXPECT_TRUE(tickers_->closed.load());
    EXPECT_EQ(report.syncResults.size(), 2u);
    EXPECT_EQ(report.dumpResults[domain::RepositoryKind::TICKERS].records, 7u);
}

TEST_F(ShutdownCoordinatorTest, SecondCall_ReturnsFirstReport) {
    ShutdownCoordinator coordinator(storage_, nullptr, nullptr, 100ms);
    EXPECT_FALSE(coordinator.isDone());

    auto first = coordinator.shutdown();
    auto second = coordinator.shutdown();

    EXPECT_TRUE(coordinator.isDone());
    EXPECT_EQ(stepNames(first), stepNames(second));
    EXPECT_EQ(storage_->callCount("forceSyncAll"), 1);
    EXPECT_EQ(tickers_->forceDumps.load(), 1);
}

TEST_F(ShutdownCoordinatorTest, FailingStep_DoesNotStopSequence) {
    storage_->failSync = true;
    ShutdownCoordinator coordinator(storage_, nullptr, nullptr, 100ms);

    auto report = coordinator.shutdown();

    EXPECT_FALSE(report.allOk());
    EXPECT_FALSE(step(report, "force_sync_all").ok);
    EXPECT_EQ(step(report, "force_sync_all").detail, "resync exploded");
    EXPECT_TRUE(step(report, "force_dump_all").ok);
    EXPECT_EQ(tickers_->forceDumps.load(), 1);
}

TEST_F(ShutdownCoordinatorTest, PartialSyncFailure_MarksStepFailed) {
    domain::SyncResult failed;
    failed.error = "connection refused";
    storage_->syncResults[domain::RepositoryKind::DEALS] = failed;
    ShutdownCoordinator coordinator(storage_, nullptr, nullptr, 100ms);

    auto report = coordinator.shutdown();

    EXPECT_FALSE(step(report, "force_sync_all").ok);
    EXPECT_EQ(step(report, "force_sync_all").detail, "2 repositories, 1 failed");
    EXPECT_TRUE(report.syncResults[domain::RepositoryKind::ORDERS].ok);
}

TEST_F(ShutdownCoordinatorTest, SyncWaitTimeout_Reported) {
    storage_->syncsDrain = false;
    ShutdownCoordinator coordinator(storage_, nullptr, nullptr, 250ms);

    auto report = coordinator.shutdown();

    EXPECT_FALSE(step(report, "await_pending_syncs").ok);
    EXPECT_EQ(step(report, "await_pending_syncs").detail, "timed out after 250ms");
    EXPECT_EQ(storage_->callCount("forceSyncAll"), 1);
}

TEST_F(ShutdownCoordinatorTest, StopsBackgroundServices) {
    auto orders = std::make_shared<adapters::secondary::InMemoryOrderRepository>();
    auto deals = std::make_shared<adapters::secondary::InMemoryDealRepository>();
    auto monitor = std::make_shared<StaleOrderMonitor>(
        orders, std::make_shared<DealService>(deals, orders),
        std::make_shared<::testing::NiceMock<memtrade::tests::MockExchangeConnector>>(),
        settings::MonitorSettings());
    auto maintenance = std::make_shared<StreamMaintenanceService>(storage_, settings::StorageSettings(), 10ms);
    monitor->start();
    maintenance->start();

    ShutdownCoordinator coordinator(storage_, monitor, maintenance, 100ms);
    auto report = coordinator.shutdown();

    EXPECT_TRUE(report.allOk());
    EXPECT_FALSE(monitor->isRunning());
    EXPECT_FALSE(maintenance->isRunning());
    EXPECT_TRUE(step(report, "stop_monitor").detail.empty());
}
