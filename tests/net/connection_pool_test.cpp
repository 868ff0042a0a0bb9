#include "ingest/net/connection_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using ingest::CancellationToken;
using ingest::ErrorCode;
using ingest::net::ConnectionLease;
using ingest::net::ConnectionPool;

namespace {

bool wait_for_queued(const ConnectionPool& pool, std::size_t queued) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pool.stats().queued == queued) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return false;
}

} // namespace

TEST(ConnectionPool, SaturatesThenQueues) {
    ConnectionPool pool(2);
    CancellationToken token;

    auto first = pool.acquire(token);
    auto second = pool.acquire(token);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value().connection().id, second.value().connection().id);

    auto third = std::async(std::launch::async, [&]() { return pool.acquire(token); });
    ASSERT_TRUE(wait_for_queued(pool, 1));

    auto stats = pool.stats();
    EXPECT_EQ(stats.active, 2u);
    EXPECT_EQ(stats.total, 2u);
    EXPECT_EQ(stats.available, 0u);

    const auto handed = first.value().connection().id;
    first.value().release();

    auto lease = third.get();
    ASSERT_TRUE(lease.is_ok());
    EXPECT_EQ(lease.value().connection().id, handed);
    EXPECT_EQ(pool.stats().active, 2u);
    EXPECT_EQ(pool.stats().queued, 0u);
}

TEST(ConnectionPool, ReleasedConnectionIsReused) {
    ConnectionPool pool(3);
    CancellationToken token;

    std::uint64_t id = 0;
    {
        auto lease = pool.acquire(token);
        ASSERT_TRUE(lease.is_ok());
        id = lease.value().connection().id;
    }

    auto stats = pool.stats();
    EXPECT_EQ(stats.active, 0u);
    EXPECT_EQ(stats.available, 1u);

    auto again = pool.acquire(token);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().connection().id, id);
    EXPECT_EQ(pool.stats().total, 1u);
    EXPECT_EQ(pool.stats().total_requests, 2u);
}

TEST(ConnectionPool, WaitersAreServedInArrivalOrder) {
    ConnectionPool pool(1);
    CancellationToken token;

    auto holder = pool.acquire(token);
    ASSERT_TRUE(holder.is_ok());

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&, i]() {
            auto lease = pool.acquire(token);
            ASSERT_TRUE(lease.is_ok());
            std::lock_guard lock(order_mutex);
            order.push_back(i);
        });
        // Each waiter is queued before the next one starts
        ASSERT_TRUE(wait_for_queued(pool, static_cast<std::size_t>(i + 1)));
    }

    holder.value().release();
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(pool.stats().active, 0u);
}

TEST(ConnectionPool, CancelWhileWaiting) {
    ConnectionPool pool(1);
    CancellationToken holder_token;
    CancellationToken waiter_token;

    auto holder = pool.acquire(holder_token);
    ASSERT_TRUE(holder.is_ok());

    auto waiter = std::async(std::launch::async, [&]() { return pool.acquire(waiter_token); });
    ASSERT_TRUE(wait_for_queued(pool, 1));
    waiter_token.cancel("stop");

    auto result = waiter.get();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(pool.stats().queued, 0u);

    // The held connection is unaffected and still returns to the pool
    holder.value().release();
    EXPECT_EQ(pool.stats().available, 1u);
}

TEST(ConnectionPool, DestroyFailsWaitersAndLaterAcquires) {
    ConnectionPool pool(1);
    CancellationToken token;

    auto holder = pool.acquire(token);
    ASSERT_TRUE(holder.is_ok());
    auto waiter = std::async(std::launch::async, [&]() { return pool.acquire(token); });
    ASSERT_TRUE(wait_for_queued(pool, 1));

    pool.destroy();

    auto result = waiter.get();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Shutdown);

    auto late = pool.acquire(token);
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().code, ErrorCode::Shutdown);

    holder.value().release();
    EXPECT_EQ(pool.stats().total, 0u);
}

TEST(ConnectionPool, TracksAverageResponseTime) {
    ConnectionPool pool(2);
    CancellationToken token;

    for (int ms : {10, 30}) {
        auto lease = pool.acquire(token);
        ASSERT_TRUE(lease.is_ok());
        lease.value().record_response_time(std::chrono::milliseconds(ms));
    }

    EXPECT_DOUBLE_EQ(pool.stats().average_response_ms, 20.0);
}

TEST(ConnectionPool, ConcurrentUseNeverExceedsLimit) {
    ConnectionPool pool(3);
    CancellationToken token;
    std::atomic<int> in_use{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 20; ++i) {
                auto lease = pool.acquire(token);
                ASSERT_TRUE(lease.is_ok());
                const int now = ++in_use;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                --in_use;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(peak.load(), 3);
    EXPECT_EQ(pool.stats().active, 0u);
    EXPECT_EQ(pool.stats().total_requests, 160u);
}
