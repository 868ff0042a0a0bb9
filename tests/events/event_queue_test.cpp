#include <gtest/gtest.h>
#include "ingest/events/event_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace ingest::events;

TEST(ThreadSafeQueue, PushAndPop) {
    ThreadSafeQueue<std::size_t> queue;

    queue.push(4);
    queue.push(9);

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 4u);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 9u);
}

TEST(ThreadSafeQueue, TryPopOnEmpty) {
    ThreadSafeQueue<int> queue;

    EXPECT_FALSE(queue.try_pop().has_value());

    queue.push(123);
    auto val = queue.try_pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 123);
}

TEST(ThreadSafeQueue, PopForTimesOut) {
    ThreadSafeQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(90));
}

TEST(ThreadSafeQueue, ShutdownDrainsThenEnds) {
    ThreadSafeQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.shutdown();

    // Work queued before shutdown is still handed out
    EXPECT_EQ(queue.pop().value(), 1);
    EXPECT_EQ(queue.pop().value(), 2);
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_TRUE(queue.empty());
}

TEST(ThreadSafeQueue, ShutdownWakesBlockedConsumer) {
    ThreadSafeQueue<int> queue;

    std::thread consumer([&queue]() {
        EXPECT_FALSE(queue.pop().has_value());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    consumer.join();
}

TEST(ThreadSafeQueue, WorkersShareTheQueue) {
    ThreadSafeQueue<int> queue;
    for (int i = 1; i <= 100; ++i) {
        queue.push(i);
    }
    queue.shutdown();

    std::atomic<int> sum{0};
    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([&]() {
            while (auto item = queue.pop()) {
                sum += *item;
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(queue.size(), 0u);
}
