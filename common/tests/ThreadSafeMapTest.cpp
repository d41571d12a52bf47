#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include <thread>
#include <vector>
#include <atomic>

struct TestRow {
    int value;
    std::string name;

    TestRow(int v = 0, const std::string& n = "") : value(v), name(n) {}
};

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<int64_t, TestRow> map;
};

// ============================================================================
// BASIC OPERATIONS
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert(1, std::make_shared<TestRow>(42, "test"));

    auto found = map.find(1);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->value, 42);
    EXPECT_EQ(found->name, "test");
}

TEST_F(ThreadSafeMapTest, FindNonExistent) {
    EXPECT_EQ(map.find(404), nullptr);
    EXPECT_FALSE(map.contains(404));
}

TEST_F(ThreadSafeMapTest, Overwrite_KeepsOldSnapshotIntact) {
    map.insert(7, std::make_shared<TestRow>(1, "first"));
    auto before = map.find(7);

    map.insert(7, std::make_shared<TestRow>(2, "second"));

    auto after = map.find(7);
    ASSERT_NE(after, nullptr);
    EXPECT_EQ(after->value, 2);
    // Выданный ранее снимок не меняется
    EXPECT_EQ(before->value, 1);
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, Remove) {
    map.insert(1, std::make_shared<TestRow>(1));

    EXPECT_TRUE(map.remove(1));
    EXPECT_FALSE(map.remove(1));
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, GetIf_FiltersByPredicate) {
    for (int i = 0; i < 10; ++i) {
        map.insert(i, std::make_shared<TestRow>(i, i % 2 ? "odd" : "even"));
    }

    auto odd = map.getIf([](const TestRow& r) { return r.name == "odd"; });
    EXPECT_EQ(odd.size(), 5u);
    EXPECT_EQ(map.getAll().size(), 10u);
}

TEST_F(ThreadSafeMapTest, ReplaceAll_SwapsContent) {
    map.insert(1, std::make_shared<TestRow>(1));

    std::unordered_map<int64_t, ThreadSafeMap<int64_t, TestRow>::ValuePtr> content;
    content[10] = std::make_shared<TestRow>(10);
    content[11] = std::make_shared<TestRow>(11);
    map.replaceAll(std::move(content));

    EXPECT_FALSE(map.contains(1));
    EXPECT_TRUE(map.contains(10));
    EXPECT_EQ(map.size(), 2u);

    map.clear();
    EXPECT_EQ(map.size(), 0u);
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(ThreadSafeMapTest, MultipleWriters_AllValuesVisible) {
    const int NUM_WRITERS = 5;
    const int VALUES_PER_WRITER = 100;

    std::vector<std::thread> threads;

    // Каждый писатель пишет в свой диапазон ключей
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < VALUES_PER_WRITER; ++i) {
                int64_t key = writer * 1000 + i;
                map.insert(key, std::make_shared<TestRow>(static_cast<int>(key)));
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.size(), static_cast<size_t>(NUM_WRITERS * VALUES_PER_WRITER));
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        for (int i = 0; i < VALUES_PER_WRITER; ++i) {
            auto found = map.find(writer * 1000 + i);
            ASSERT_NE(found, nullptr);
            EXPECT_EQ(found->value, writer * 1000 + i);
        }
    }
}

TEST_F(ThreadSafeMapTest, ConcurrentReadWrite_ReadersAlwaysSeeValidRow) {
    map.insert(1, std::make_shared<TestRow>(0, "initial"));

    std::vector<std::thread> threads;
    std::atomic<int> readCount(0);

    for (int writer = 0; writer < 4; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < 50; ++i) {
                map.insert(1, std::make_shared<TestRow>(writer * 100 + i, "data"));
            }
        });
    }

    for (int reader = 0; reader < 4; ++reader) {
        threads.emplace_back([this, &readCount]() {
            for (int i = 0; i < 100; ++i) {
                auto found = map.find(1);
                ASSERT_NE(found, nullptr);
                auto scanned = map.getAll();
                ASSERT_EQ(scanned.size(), 1u);
                readCount++;
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(readCount, 400);
}
