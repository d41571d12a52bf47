/**
 * @file RepositoryFactoryTest.cpp
 * @brief Тесты выбора бэкенда и групповых операций RepositoryFactory
 */

#include <gtest/gtest.h>

#include "adapters/secondary/persistence/RepositoryFactory.hpp"
#include "mocks/FakeDurableStore.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>

using namespace memtrade;
using namespace memtrade::adapters::secondary;
using namespace std::chrono_literals;
using domain::RepositoryKind;
using domain::StorageBackend;
using memtrade::tests::FakeStoreProvider;

namespace fs = std::filesystem;

class RepositoryFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        dumpDir_ = fs::temp_directory_path() /
                   ("memtrade_factory_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dumpDir_);
        provider_ = std::make_shared<FakeStoreProvider>();
        config_["storage"]["dump_dir"] = dumpDir_.string();
        config_["storage"]["tickers"]["dump_interval_seconds"] = 42;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dumpDir_, ec);
    }

    std::unique_ptr<RepositoryFactory> createFactory(
        std::shared_ptr<ports::output::IDurableStoreProvider> stores)
    {
        auto settings = std::make_shared<settings::EngineSettings>(config_);
        return std::make_unique<RepositoryFactory>(settings, std::move(stores));
    }

    std::unique_ptr<RepositoryFactory> createFactory() {
        return createFactory(provider_);
    }

    static domain::Ticker ticker(int64_t timestamp) {
        domain::Ticker t;
        t.symbol = "BTC/USDT";
        t.timestamp = timestamp;
        t.last = domain::Decimal::fromInt(65000);
        return t;
    }

    fs::path dumpDir_;
    nlohmann::json config_ = nlohmann::json::object();
    std::shared_ptr<FakeStoreProvider> provider_;
};

TEST_F(RepositoryFactoryTest, RequiresSettings) {
    EXPECT_THROW(RepositoryFactory(nullptr, provider_), std::invalid_argument);
}

TEST_F(RepositoryFactoryTest, DurableBackend_WhenStoreReachable) {
    auto factory = createFactory();

    auto orders = factory->orders();
    auto deals = factory->deals();

    EXPECT_EQ(factory->backendOf(RepositoryKind::ORDERS), StorageBackend::MEMORY_WITH_DURABLE_SYNC);
    EXPECT_EQ(factory->backendOf(RepositoryKind::DEALS), StorageBackend::MEMORY_WITH_DURABLE_SYNC);
    EXPECT_NE(std::dynamic_pointer_cast<ports::output::ISyncableRepository>(orders), nullptr);
    EXPECT_EQ(provider_->orderStore->schemaCalls(), 1);
}

TEST_F(RepositoryFactoryTest, Repositories_AreCreatedOnceAndCached) {
    auto factory = createFactory();

    EXPECT_EQ(factory->orders(), factory->orders());
    EXPECT_EQ(factory->deals(), factory->deals());
    EXPECT_EQ(factory->tickers(), factory->tickers());
    EXPECT_FALSE(factory->backendOf(RepositoryKind::TICKERS).has_value());
}

TEST_F(RepositoryFactoryTest, StoreUnavailable_FallsBackToPureMemory) {
    provider_->failOnCreate = true;
    auto factory = createFactory();

    auto orders = factory->orders();
    auto deals = factory->deals();

    EXPECT_EQ(factory->backendOf(RepositoryKind::ORDERS), StorageBackend::PURE_MEMORY_LEGACY);
    EXPECT_EQ(factory->backendOf(RepositoryKind::DEALS), StorageBackend::PURE_MEMORY_LEGACY);
    EXPECT_EQ(std::dynamic_pointer_cast<ports::output::ISyncableRepository>(orders), nullptr);

    // Репозиторий работает, потоковые виды не затронуты
    auto saved = orders->save(domain::Order::limit(
        "BTC/USDT", domain::OrderSide::BUY, domain::Decimal::fromInt(1), domain::Decimal::fromInt(1)));
    EXPECT_TRUE(orders->findById(saved.id).has_value());
    EXPECT_TRUE(factory->tickers()->append(ticker(1)));
}

TEST_F(RepositoryFactoryTest, NoProvider_FallsBackToPureMemory) {
    auto factory = createFactory(nullptr);

    factory->orders();

    EXPECT_EQ(factory->backendOf(RepositoryKind::ORDERS), StorageBackend::PURE_MEMORY_LEGACY);
}

TEST_F(RepositoryFactoryTest, ConfiguredLegacyBackend_IsUsedPerKind) {
    config_["storage"]["deals_backend"] = "pure_memory_legacy";
    auto factory = createFactory();

    factory->orders();
    factory->deals();

    EXPECT_EQ(factory->backendOf(RepositoryKind::ORDERS), StorageBackend::MEMORY_WITH_DURABLE_SYNC);
    EXPECT_EQ(factory->backendOf(RepositoryKind::DEALS), StorageBackend::PURE_MEMORY_LEGACY);

    auto results = factory->forceSyncAll();
    EXPECT_EQ(results.size(), 1u);
    EXPECT_EQ(results.count(RepositoryKind::ORDERS), 1u);
}

TEST_F(RepositoryFactoryTest, ForceSyncAll_FailureIsolatedPerKind) {
    auto factory = createFactory();
    factory->orders()->save(domain::Order::limit(
        "BTC/USDT", domain::OrderSide::BUY, domain::Decimal::fromInt(1), domain::Decimal::fromInt(1)));
    factory->deals()->save(domain::Deal::open("BTC/USDT", domain::Decimal()));
    ASSERT_TRUE(factory->awaitPendingSyncs(2s));

    provider_->orderStore->setUnreachable(true);
    auto results = factory->forceSyncAll();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[RepositoryKind::ORDERS].ok);
    EXPECT_FALSE(results[RepositoryKind::ORDERS].error.empty());
    EXPECT_TRUE(results[RepositoryKind::DEALS].ok);
    EXPECT_EQ(results[RepositoryKind::DEALS].rows, 1u);
}

TEST_F(RepositoryFactoryTest, ForceDumpAll_CoversCreatedStreamsOnly) {
    auto factory = createFactory();
    factory->tickers()->append(ticker(1));
    factory->tickers()->append(ticker(2));
    factory->indicators();

    auto results = factory->forceDumpAll();

    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[RepositoryKind::TICKERS].ok);
    EXPECT_EQ(results[RepositoryKind::TICKERS].records, 2u);
    EXPECT_TRUE(fs::exists(results[RepositoryKind::TICKERS].path));
    EXPECT_TRUE(results[RepositoryKind::INDICATORS].ok);
    EXPECT_EQ(results[RepositoryKind::INDICATORS].records, 0u);
    EXPECT_EQ(results.count(RepositoryKind::ORDER_BOOKS), 0u);
}

TEST_F(RepositoryFactoryTest, CloseIngestion_ClosesAllStreams) {
    auto factory = createFactory();
    auto tickers = factory->tickers();

    factory->closeIngestion();

    EXPECT_FALSE(tickers->append(ticker(1)));
}

TEST_F(RepositoryFactoryTest, StreamingRepositories_CarryDumpInterval) {
    auto factory = createFactory();
    factory->tickers();
    factory->orderBooks();

    auto handles = factory->streamingRepositories();

    ASSERT_EQ(handles.size(), 2u);
    for (const auto& handle : handles) {
        if (handle.kind == RepositoryKind::TICKERS) {
            EXPECT_EQ(handle.dumpInterval, std::chrono::seconds(42));
        } else {
            EXPECT_EQ(handle.kind, RepositoryKind::ORDER_BOOKS);
            EXPECT_EQ(handle.dumpInterval, std::chrono::seconds(180));
        }
    }
}

TEST_F(RepositoryFactoryTest, StorageInfo_DescribesEveryCreatedRepository) {
    provider_->failOnCreate = true;
    auto factory = createFactory();
    factory->orders();
    factory->tickers()->append(ticker(1));

    auto info = factory->storageInfo();

    EXPECT_EQ(info["orders"]["backend"], "pure_memory_legacy");
    EXPECT_EQ(info["tickers"]["backend"], "stream_batch");
    EXPECT_EQ(info["tickers"]["records"], 1);
    EXPECT_FALSE(info.contains("deals"));
}
