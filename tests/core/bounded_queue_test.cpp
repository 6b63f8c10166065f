#include <gtest/gtest.h>
#include "chunkup/core/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace chunkup::core;

TEST(BoundedQueue, PushAndPop) {
    BoundedQueue<int> queue(4);

    ASSERT_TRUE(queue.push(42));
    ASSERT_TRUE(queue.push(100));

    auto val1 = queue.pop();
    ASSERT_TRUE(val1.has_value());
    EXPECT_EQ(val1.value(), 42);

    auto val2 = queue.pop();
    ASSERT_TRUE(val2.has_value());
    EXPECT_EQ(val2.value(), 100);
}

TEST(BoundedQueue, ZeroCapacityBecomesOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
}

TEST(BoundedQueue, PopTimeout) {
    BoundedQueue<int> queue(1);

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto end = std::chrono::steady_clock::now();

    EXPECT_FALSE(val.has_value());
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    EXPECT_GE(duration.count(), 90);
}

TEST(BoundedQueue, PushBlocksWhileFull) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        EXPECT_TRUE(queue.push(2));
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(pushed.load());  // Still waiting for a free slot

    auto first = queue.pop();
    producer.join();

    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 1);
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.size(), 1u);
}

TEST(BoundedQueue, ShutdownDrainsThenStops) {
    BoundedQueue<int> queue(2);
    ASSERT_TRUE(queue.push(7));

    queue.shutdown();
    EXPECT_FALSE(queue.push(8));  // Refused after shutdown

    auto remaining = queue.pop();
    ASSERT_TRUE(remaining.has_value());
    EXPECT_EQ(remaining.value(), 7);

    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueue, ShutdownWakesBlockedProducer) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> result{true};
    std::thread producer([&]() { result = queue.push(2); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    queue.shutdown();
    producer.join();

    EXPECT_FALSE(result.load());
}

TEST(BoundedQueue, ProducerConsumer) {
    BoundedQueue<int> queue(1);
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.shutdown();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += val.value();
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
