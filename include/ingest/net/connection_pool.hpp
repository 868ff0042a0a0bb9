/**
 * @file connection_pool.hpp
 * @brief Bounded set of outbound connection slots
 *
 * WHY THIS FILE EXISTS:
 * Chunk delivery runs on many threads at once. Without a bound, a large
 * workspace opens as many concurrent requests as there are chunks in flight.
 *
 * WHAT IT DOES:
 * - acquire(): reuse a free connection, else create one below the limit,
 *   else wait in FIFO order
 * - release(): hand the connection straight to the oldest waiter, or back
 *   to the free list when nobody waits
 * - destroy(): fail every waiter and every later acquire
 * - stats(): active / queued / total / available / average response time
 *
 * THREAD SAFETY:
 * Every state transition happens under one mutex, so the counters always
 * agree with the lists they describe.
 *
 * EXAMPLE:
 * ConnectionPool pool(5);
 * auto lease = pool.acquire(token);
 * if (lease.is_ok()) {
 *     send(...);
 *     lease.value().record_response_time(elapsed);
 * }   // released here
 */

#pragma once

#include "ingest/core/cancellation.hpp"
#include "ingest/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

namespace ingest::net {

/**
 * @brief Identity of one pooled connection
 */
struct PooledConnection {
    std::uint64_t id = 0;
    std::chrono::steady_clock::time_point created_at{};
    std::chrono::steady_clock::time_point last_used_at{};
};

struct PoolStats {
    std::size_t active = 0;
    std::size_t queued = 0;
    std::size_t total = 0;           ///< Connections currently alive
    std::size_t available = 0;       ///< Idle on the free list
    std::uint64_t total_requests = 0;
    double average_response_ms = 0.0;
};

class ConnectionPool;

/**
 * @brief Borrowed connection, returned to the pool on destruction
 *
 * A lease must not outlive the pool that issued it.
 */
class ConnectionLease {
public:
    ConnectionLease() = default;
    ConnectionLease(ConnectionPool* pool, PooledConnection connection);
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    const PooledConnection& connection() const { return connection_; }

    /// Feed the pool's running response-time average
    void record_response_time(std::chrono::milliseconds elapsed);

    /// Return the connection early
    void release();

private:
    ConnectionPool* pool_ = nullptr;
    PooledConnection connection_;
    std::chrono::milliseconds response_time_{-1};
};

class ConnectionPool {
public:
    explicit ConnectionPool(std::size_t max_connections);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Borrow a connection
     *
     * BLOCKS: While the pool is saturated
     * ERRORS: Cancelled if the token fires while waiting; Shutdown after destroy()
     */
    Result<ConnectionLease> acquire(const CancellationToken& token);

    PoolStats stats() const;

    /**
     * @brief Tear down; queued and future acquires fail with Shutdown
     */
    void destroy();

    std::size_t max_connections() const noexcept { return max_connections_; }

private:
    friend class ConnectionLease;

    struct Waiter {
        std::promise<Result<PooledConnection>> promise;
    };

    void release(PooledConnection connection, std::chrono::milliseconds response_time);
    void record_response_time_locked(std::chrono::milliseconds elapsed);

    const std::size_t max_connections_;

    mutable std::mutex mutex_;
    std::vector<PooledConnection> free_;
    std::deque<std::shared_ptr<Waiter>> waiters_;
    std::size_t active_ = 0;
    std::size_t total_ = 0;
    std::uint64_t total_requests_ = 0;
    std::uint64_t next_id_ = 1;
    bool destroyed_ = false;

    double average_response_ms_ = 0.0;
    std::uint64_t response_samples_ = 0;
};

} // namespace ingest::net
