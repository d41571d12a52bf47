#include <gtest/gtest.h>
#include <TaskPool.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

class TaskPoolTest : public ::testing::Test {
protected:
    std::atomic<int> executed{0};
};

TEST_F(TaskPoolTest, ExecutesSubmittedTasks) {
    TaskPool pool("test", 2, 100);

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(pool.submit([this]() { ++executed; }));
    }

    EXPECT_TRUE(pool.waitIdle(2s));
    EXPECT_EQ(executed.load(), 50);
    EXPECT_EQ(pool.completedTasks(), 50u);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST_F(TaskPoolTest, FullQueue_SubmitReturnsFalse) {
    TaskPool pool("test", 1, 1);
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    // Первая задача занимает единственный поток
    ASSERT_TRUE(pool.submit([&]() {
        started = true;
        while (!release.load()) std::this_thread::sleep_for(1ms);
    }));
    while (!started.load()) {
        std::this_thread::sleep_for(1ms);
    }

    EXPECT_TRUE(pool.submit([this]() { ++executed; }));   // в очереди
    EXPECT_FALSE(pool.submit([this]() { ++executed; }));  // очередь полна

    release = true;
    EXPECT_TRUE(pool.waitIdle(2s));
    EXPECT_EQ(executed.load(), 1);
}

TEST_F(TaskPoolTest, FailingTask_CountedAndWorkerSurvives) {
    TaskPool pool("test", 1, 10);

    pool.submit([]() { throw std::runtime_error("boom"); });
    pool.submit([this]() { ++executed; });

    EXPECT_TRUE(pool.waitIdle(2s));
    EXPECT_EQ(pool.failedTasks(), 1u);
    EXPECT_EQ(executed.load(), 1);
}

TEST_F(TaskPoolTest, WaitIdle_TimesOutWhileTaskRuns) {
    TaskPool pool("test", 1, 10);
    std::atomic<bool> release{false};

    pool.submit([&]() {
        while (!release.load()) std::this_thread::sleep_for(1ms);
    });

    EXPECT_FALSE(pool.waitIdle(30ms));
    release = true;
    EXPECT_TRUE(pool.waitIdle(2s));
}

TEST_F(TaskPoolTest, Shutdown_RunsQueuedTasksAndRejectsNewOnes) {
    auto pool = std::make_unique<TaskPool>("test", 1, 100);
    for (int i = 0; i < 10; ++i) {
        pool->submit([this]() {
            std::this_thread::sleep_for(1ms);
            ++executed;
        });
    }

    pool->shutdown();
    EXPECT_EQ(executed.load(), 10);
    EXPECT_FALSE(pool->submit([this]() { ++executed; }));
    pool->shutdown();  // повторный вызов игнорируется
}
