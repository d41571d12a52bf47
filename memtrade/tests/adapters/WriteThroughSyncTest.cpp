/**
 * @file WriteThroughSyncTest.cpp
 * @brief Unit-тесты фоновой синхронизации с хранилищем
 */

#include <gtest/gtest.h>

#include "adapters/secondary/persistence/WriteThroughSync.hpp"
#include "domain/Order.hpp"
#include "mocks/FakeDurableStore.hpp"

#include <chrono>
#include <future>
#include <thread>

using namespace memtrade;
using namespace memtrade::adapters::secondary;
using namespace std::chrono_literals;
using memtrade::tests::FakeDurableStore;

class WriteThroughSyncTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<FakeDurableStore<domain::Order>>();
    }

    static domain::Order order(int64_t id, const std::string& note = "") {
        auto o = domain::Order::limit("BTC/USDT", domain::OrderSide::BUY,
                                      domain::Decimal::fromInt(100), domain::Decimal::fromInt(1));
        o.id = id;
        o.lastError = note;
        return o;
    }

    void waitForBlockedWriter() {
        for (int i = 0; i < 2000 && store_->waitingWriters() == 0; ++i) {
            std::this_thread::sleep_for(1ms);
        }
        ASSERT_EQ(store_->waitingWriters(), 1);
    }

    std::shared_ptr<FakeDurableStore<domain::Order>> store_;
};

TEST_F(WriteThroughSyncTest, Upsert_ReachesStore) {
    WriteThroughSync<domain::Order> sync("orders", store_, 100, 2);

    sync.scheduleUpsert(order(1));
    sync.scheduleUpsert(order(2));

    ASSERT_TRUE(sync.awaitPending(2s));
    EXPECT_EQ(store_->size(), 2u);
    EXPECT_EQ(sync.stats().scheduled, 2u);
    EXPECT_EQ(sync.stats().succeeded, 2u);
}

TEST_F(WriteThroughSyncTest, Remove_ReachesStore) {
    store_->seed(order(7));
    WriteThroughSync<domain::Order> sync("orders", store_, 100, 1);

    sync.scheduleRemove(7);

    ASSERT_TRUE(sync.awaitPending(2s));
    EXPECT_FALSE(store_->row(7).has_value());
    EXPECT_EQ(store_->removes(), 1);
}

TEST_F(WriteThroughSyncTest, StoreFailure_CountedNotThrown) {
    WriteThroughSync<domain::Order> sync("orders", store_, 100, 1);
    store_->setUnreachable(true);

    EXPECT_NO_THROW(sync.scheduleUpsert(order(1)));
    ASSERT_TRUE(sync.awaitPending(2s));

    auto stats = sync.stats();
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.succeeded, 0u);
    EXPECT_EQ(stats.lastError, "connection refused");
}

TEST_F(WriteThroughSyncTest, FullQueue_DropsWriteAndResyncRepairs) {
    WriteThroughSync<domain::Order> sync("orders", store_, 1, 1);
    store_->holdWrites();

    sync.scheduleUpsert(order(1));
    waitForBlockedWriter();
    sync.scheduleUpsert(order(2));   // в очереди
    sync.scheduleUpsert(order(3));   // очередь заполнена

    store_->releaseWrites();
    ASSERT_TRUE(sync.awaitPending(2s));

    EXPECT_EQ(sync.stats().dropped, 1u);
    EXPECT_EQ(sync.stats().scheduled, 2u);
    EXPECT_FALSE(store_->row(3).has_value());

    auto result = sync.fullResync([]() {
        return std::vector<domain::Order>{order(1), order(2), order(3)};
    });

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.rows, 3u);
    EXPECT_TRUE(store_->row(3).has_value());
}

TEST_F(WriteThroughSyncTest, ResyncDuringQueuedWrites_StoreEndsWithLatestState) {
    WriteThroughSync<domain::Order> sync("orders", store_, 100, 1);
    store_->holdWrites();

    sync.scheduleUpsert(order(1, "v1"));
    waitForBlockedWriter();
    sync.scheduleUpsert(order(2, "old"));
    sync.scheduleUpsert(order(2, "new"));

    // Снимок памяти уже содержит последнее состояние обоих ордеров
    auto resync = std::async(std::launch::async, [&sync]() {
        return sync.fullResync([]() {
            return std::vector<domain::Order>{order(1, "v1"), order(2, "new")};
        });
    });

    std::this_thread::sleep_for(20ms);
    store_->releaseWrites();

    auto result = resync.get();
    ASSERT_TRUE(sync.awaitPending(2s));

    EXPECT_TRUE(result.ok);
    auto stats = sync.stats();
    EXPECT_EQ(stats.resyncs, 1u);
    EXPECT_EQ(stats.succeeded + stats.superseded, 3u);
    EXPECT_EQ(stats.failed, 0u);
    ASSERT_TRUE(store_->row(2).has_value());
    EXPECT_EQ(store_->row(2)->lastError, "new");
    EXPECT_EQ(store_->size(), 2u);
}

TEST_F(WriteThroughSyncTest, WritesAfterResync_AreNotSuperseded) {
    WriteThroughSync<domain::Order> sync("orders", store_, 100, 1);

    sync.fullResync([]() { return std::vector<domain::Order>{order(1)}; });
    sync.scheduleUpsert(order(2));
    ASSERT_TRUE(sync.awaitPending(2s));

    EXPECT_EQ(sync.stats().superseded, 0u);
    EXPECT_EQ(sync.stats().succeeded, 1u);
    EXPECT_EQ(store_->size(), 2u);
}

TEST_F(WriteThroughSyncTest, ResyncFailure_ReportedInResult) {
    WriteThroughSync<domain::Order> sync("orders", store_, 100, 1);
    store_->setUnreachable(true);

    auto result = sync.fullResync([]() { return std::vector<domain::Order>{order(1)}; });

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "connection refused");
    EXPECT_EQ(sync.stats().resyncFailures, 1u);
    EXPECT_EQ(sync.stats().resyncs, 0u);
}

TEST_F(WriteThroughSyncTest, LoadAll_UnreachableStore_ReturnsNullopt) {
    WriteThroughSync<domain::Order> sync("orders", store_, 100, 1);
    store_->setUnreachable(true);

    EXPECT_FALSE(sync.loadAll().has_value());
}
