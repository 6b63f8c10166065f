#include "chunkup/core/task_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using chunkup::core::TaskPool;

TEST(TaskPoolTest, RunsEverySubmittedTask) {
    std::atomic<int> sum{0};
    {
        TaskPool pool(4, 1);
        for (int i = 1; i <= 100; ++i) {
            ASSERT_TRUE(pool.submit([&sum, i]() { sum += i; }));
        }
        pool.shutdown();
    }
    EXPECT_EQ(sum.load(), 5050);
}

TEST(TaskPoolTest, WaitIdleWaitsForRunningTasks) {
    TaskPool pool(2, 1);
    std::atomic<int> done{0};
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(pool.submit([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            ++done;
        }));
    }

    pool.wait_idle();
    EXPECT_EQ(done.load(), 4);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(TaskPoolTest, SubmitFailsAfterShutdown) {
    TaskPool pool(1, 1);
    pool.shutdown();
    pool.shutdown();  // Idempotent

    bool ran = false;
    EXPECT_FALSE(pool.submit([&ran]() { ran = true; }));
    EXPECT_FALSE(ran);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(TaskPoolTest, BoundsConcurrencyToWorkerCount) {
    TaskPool pool(3, 1);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 12; ++i) {
        ASSERT_TRUE(pool.submit([&]() {
            const int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --active;
        }));
    }
    pool.shutdown();

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(TaskPoolTest, SubmitBlocksWhenWorkersAndQueueAreFull) {
    TaskPool pool(1, 1);
    std::atomic<bool> release{false};
    auto blocker = [&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    };

    ASSERT_TRUE(pool.submit(blocker));  // Running
    ASSERT_TRUE(pool.submit(blocker));  // Queued

    std::atomic<bool> third_submitted{false};
    std::thread producer([&]() {
        EXPECT_TRUE(pool.submit([]() {}));
        third_submitted = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(third_submitted.load());

    release = true;
    producer.join();
    pool.shutdown();
    EXPECT_TRUE(third_submitted.load());
}

TEST(TaskPoolTest, ThrowingTaskDoesNotStopWorker) {
    TaskPool pool(1, 1);
    std::atomic<int> ran{0};

    ASSERT_TRUE(pool.submit([]() { throw std::runtime_error("boom"); }));
    ASSERT_TRUE(pool.submit([&ran]() { ++ran; }));
    pool.shutdown();

    EXPECT_EQ(ran.load(), 1);
    EXPECT_EQ(pool.pending(), 0u);
}
