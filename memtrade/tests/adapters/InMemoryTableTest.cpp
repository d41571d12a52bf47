/**
 * @file InMemoryTableTest.cpp
 * @brief Unit-тесты для InMemoryTable и InMemory*Repository
 */

#include <gtest/gtest.h>

#include "adapters/secondary/memory/InMemoryTable.hpp"
#include "adapters/secondary/persistence/InMemoryDealRepository.hpp"
#include "adapters/secondary/persistence/InMemoryOrderRepository.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace memtrade;
using namespace memtrade::adapters::secondary;

namespace {

struct Row {
    int64_t id = 0;
    std::string name;
    int value = 0;
};

domain::Order makeOrder(const std::string& symbol, domain::OrderSide side = domain::OrderSide::BUY) {
    return domain::Order::limit(symbol, side, domain::Decimal::fromInt(100), domain::Decimal::fromInt(1));
}

} // namespace

// ============================================================================
// InMemoryTable
// ============================================================================

TEST(InMemoryTableTest, Upsert_AssignsSequentialIds) {
    InMemoryTable<Row> table;

    auto a = table.upsert({0, "a", 1});
    auto b = table.upsert({0, "b", 2});

    EXPECT_EQ(a.id, 1);
    EXPECT_EQ(b.id, 2);
    EXPECT_EQ(table.size(), 2u);
}

TEST(InMemoryTableTest, Upsert_ExistingIdReplacesRow) {
    InMemoryTable<Row> table;
    auto row = table.upsert({0, "a", 1});

    row.value = 42;
    table.upsert(row);

    EXPECT_EQ(table.size(), 1u);
    EXPECT_EQ(table.get(row.id)->value, 42);
}

TEST(InMemoryTableTest, Get_ReturnsCopy) {
    InMemoryTable<Row> table;
    auto row = table.upsert({0, "a", 1});

    auto copy = table.get(row.id);
    copy->value = 99;

    EXPECT_EQ(table.get(row.id)->value, 1);
}

TEST(InMemoryTableTest, ExplicitId_AdvancesSequence) {
    InMemoryTable<Row> table;
    table.upsert({123, "explicit", 0});

    auto next = table.upsert({0, "next", 0});

    EXPECT_EQ(next.id, 124);
}

TEST(InMemoryTableTest, ReplaceAll_ContinuesAfterMaxLoadedId) {
    InMemoryTable<Row> table;
    table.upsert({0, "old", 0});

    table.replaceAll({{5, "five", 5}, {9, "nine", 9}});

    EXPECT_EQ(table.size(), 2u);
    EXPECT_FALSE(table.contains(1));
    EXPECT_EQ(table.nextId(), 10);
}

TEST(InMemoryTableTest, Scan_IsOrderedById) {
    InMemoryTable<Row> table;
    for (int i = 0; i < 20; ++i) {
        table.upsert({0, "row", i});
    }

    auto even = table.scan([](const Row& r) { return r.value % 2 == 0; });

    ASSERT_EQ(even.size(), 10u);
    for (size_t i = 1; i < even.size(); ++i) {
        EXPECT_LT(even[i - 1].id, even[i].id);
    }
}

TEST(InMemoryTableTest, Remove_MissingId_ReturnsFalse) {
    InMemoryTable<Row> table;
    auto row = table.upsert({0, "a", 1});

    EXPECT_TRUE(table.remove(row.id));
    EXPECT_FALSE(table.remove(row.id));
}

TEST(InMemoryTableTest, ConcurrentUpserts_AssignUniqueIds) {
    InMemoryTable<Row> table;
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&table]() {
            for (int i = 0; i < 250; ++i) {
                table.upsert({0, "row", i});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(table.size(), 1000u);
    EXPECT_EQ(table.nextId(), 1001);
}

// ============================================================================
// InMemoryOrderRepository
// ============================================================================

TEST(InMemoryOrderRepositoryTest, FindByExchangeId) {
    InMemoryOrderRepository repo;
    auto order = makeOrder("BTC/USDT");
    order.markPlaced("ex-77");
    auto saved = repo.save(order);

    auto found = repo.findByExchangeId("ex-77");

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->id, saved.id);
    EXPECT_FALSE(repo.findByExchangeId("ex-78").has_value());
}

TEST(InMemoryOrderRepositoryTest, FindOpenBySide_SkipsPendingAndSells) {
    InMemoryOrderRepository repo;

    auto openBuy = makeOrder("BTC/USDT");
    openBuy.markPlaced("ex-1");
    repo.save(openBuy);

    auto openSell = makeOrder("BTC/USDT", domain::OrderSide::SELL);
    openSell.markPlaced("ex-2");
    repo.save(openSell);

    repo.save(makeOrder("BTC/USDT"));  // PENDING

    auto result = repo.findOpenBySide(domain::OrderSide::BUY);

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].exchangeId.value_or(""), "ex-1");
    EXPECT_EQ(repo.findOpen().size(), 2u);
}

TEST(InMemoryOrderRepositoryTest, Capacity_EvictsOnlyFinalOrders) {
    InMemoryOrderRepository repo(3);

    for (int i = 0; i < 3; ++i) {
        auto order = makeOrder("BTC/USDT");
        order.markPlaced("open-" + std::to_string(i));
        repo.save(order);
    }

    auto finished = makeOrder("BTC/USDT");
    finished.reject("no funds");
    auto rejected = repo.save(finished);

    EXPECT_EQ(repo.count(), 3u);
    EXPECT_FALSE(repo.findById(rejected.id).has_value());
    EXPECT_EQ(repo.findOpen().size(), 3u);
}

TEST(InMemoryOrderRepositoryTest, DeleteById_RemovesExchangeIndex) {
    InMemoryOrderRepository repo;
    auto order = makeOrder("BTC/USDT");
    order.markPlaced("ex-9");
    auto saved = repo.save(order);

    EXPECT_TRUE(repo.deleteById(saved.id));
    EXPECT_FALSE(repo.findByExchangeId("ex-9").has_value());
}

TEST(InMemoryOrderRepositoryTest, DuplicateExchangeId_ThrowsAndKeepsIndex) {
    InMemoryOrderRepository repo;
    auto first = makeOrder("BTC/USDT");
    first.markPlaced("ex-1");
    auto saved = repo.save(first);

    auto second = makeOrder("BTC/USDT");
    second.markPlaced("ex-1");

    EXPECT_THROW(repo.save(second), domain::InvariantViolation);
    EXPECT_EQ(repo.count(), 1u);
    ASSERT_TRUE(repo.findByExchangeId("ex-1").has_value());
    EXPECT_EQ(repo.findByExchangeId("ex-1")->id, saved.id);
}

TEST(InMemoryOrderRepositoryTest, RejectedHolder_ReleasesExchangeId) {
    InMemoryOrderRepository repo;
    auto first = makeOrder("BTC/USDT");
    first.markPlaced("ex-1");
    first = repo.save(first);
    first.reject("rejected by exchange");
    repo.save(first);

    auto second = makeOrder("BTC/USDT");
    second.markPlaced("ex-1");
    auto saved = repo.save(second);

    ASSERT_TRUE(repo.findByExchangeId("ex-1").has_value());
    EXPECT_EQ(repo.findByExchangeId("ex-1")->id, saved.id);

    // Повторное сохранение отклонённого ордера не перехватывает индекс
    repo.save(first);
    EXPECT_EQ(repo.findByExchangeId("ex-1")->id, saved.id);
}

// ============================================================================
// InMemoryDealRepository
// ============================================================================

TEST(InMemoryDealRepositoryTest, FindActive_ExcludesFinalDeals) {
    InMemoryDealRepository repo;
    repo.save(domain::Deal::open("BTC/USDT", domain::Decimal()));

    auto closed = domain::Deal::open("ETH/USDT", domain::Decimal());
    closed.cancel();
    repo.save(closed);

    EXPECT_EQ(repo.findActive().size(), 1u);
    EXPECT_EQ(repo.findBySymbol("ETH/USDT").size(), 1u);
    EXPECT_EQ(repo.count(), 2u);
}
