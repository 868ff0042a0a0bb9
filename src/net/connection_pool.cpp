#include "ingest/net/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ingest::net {
namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(20);

} // namespace

// ──────────────────────────────────────────────────────────
// ConnectionLease
// ──────────────────────────────────────────────────────────

ConnectionLease::ConnectionLease(ConnectionPool* pool, PooledConnection connection)
    : pool_(pool), connection_(connection) {}

ConnectionLease::~ConnectionLease() {
    release();
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(other.pool_), connection_(other.connection_), response_time_(other.response_time_) {
    other.pool_ = nullptr;
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        connection_ = other.connection_;
        response_time_ = other.response_time_;
        other.pool_ = nullptr;
    }
    return *this;
}

void ConnectionLease::record_response_time(std::chrono::milliseconds elapsed) {
    response_time_ = elapsed;
}

void ConnectionLease::release() {
    if (pool_ != nullptr) {
        ConnectionPool* pool = pool_;
        pool_ = nullptr;
        pool->release(connection_, response_time_);
    }
}

// ──────────────────────────────────────────────────────────
// ConnectionPool
// ──────────────────────────────────────────────────────────

ConnectionPool::ConnectionPool(std::size_t max_connections)
    : max_connections_(std::max<std::size_t>(max_connections, 1)) {}

ConnectionPool::~ConnectionPool() {
    destroy();
}

Result<ConnectionLease> ConnectionPool::acquire(const CancellationToken& token) {
    std::shared_ptr<Waiter> waiter;
    std::future<Result<PooledConnection>> handoff;
    {
        std::lock_guard lock(mutex_);
        if (destroyed_) {
            return Err<ConnectionLease>(ErrorCode::Shutdown, "Connection pool destroyed");
        }
        if (token.is_cancelled()) {
            return Err<ConnectionLease>(ErrorCode::Cancelled, "Operation cancelled");
        }
        ++total_requests_;

        const auto now = std::chrono::steady_clock::now();
        if (!free_.empty()) {
            PooledConnection connection = free_.back();
            free_.pop_back();
            connection.last_used_at = now;
            ++active_;
            spdlog::trace("[Pool] reused connection {} active={}", connection.id, active_);
            return Ok(ConnectionLease(this, connection));
        }

        if (total_ < max_connections_) {
            PooledConnection connection{next_id_++, now, now};
            ++total_;
            ++active_;
            spdlog::trace("[Pool] created connection {} active={}", connection.id, active_);
            return Ok(ConnectionLease(this, connection));
        }

        waiter = std::make_shared<Waiter>();
        handoff = waiter->promise.get_future();
        waiters_.push_back(waiter);
        spdlog::trace("[Pool] saturated, queued={}", waiters_.size());
    }

    while (handoff.wait_for(kWaitSlice) != std::future_status::ready) {
        if (!token.is_cancelled()) {
            continue;
        }
        std::lock_guard lock(mutex_);
        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end()) {
            waiters_.erase(it);
            return Err<ConnectionLease>(ErrorCode::Cancelled, "Operation cancelled");
        }
        // Already handed a connection or failed; fall through to collect it
        break;
    }

    auto result = handoff.get();
    if (result.is_error()) {
        return Err<ConnectionLease>(result.error());
    }
    return Ok(ConnectionLease(this, result.value()));
}

void ConnectionPool::record_response_time_locked(std::chrono::milliseconds elapsed) {
    ++response_samples_;
    average_response_ms_ += (static_cast<double>(elapsed.count()) - average_response_ms_)
                            / static_cast<double>(response_samples_);
}

void ConnectionPool::release(PooledConnection connection, std::chrono::milliseconds response_time) {
    std::lock_guard lock(mutex_);
    if (response_time.count() >= 0) {
        record_response_time_locked(response_time);
    }

    if (destroyed_) {
        if (active_ > 0) --active_;
        if (total_ > 0) --total_;
        return;
    }

    connection.last_used_at = std::chrono::steady_clock::now();
    if (!waiters_.empty()) {
        // Direct handoff: the connection stays active for the oldest waiter
        auto waiter = waiters_.front();
        waiters_.pop_front();
        waiter->promise.set_value(Ok(connection));
        return;
    }

    --active_;
    free_.push_back(connection);
}

PoolStats ConnectionPool::stats() const {
    std::lock_guard lock(mutex_);
    PoolStats stats;
    stats.active = active_;
    stats.queued = waiters_.size();
    stats.total = total_;
    stats.available = free_.size();
    stats.total_requests = total_requests_;
    stats.average_response_ms = average_response_ms_;
    return stats;
}

void ConnectionPool::destroy() {
    std::deque<std::shared_ptr<Waiter>> rejected;
    {
        std::lock_guard lock(mutex_);
        if (destroyed_) {
            return;
        }
        destroyed_ = true;
        rejected.swap(waiters_);
        total_ -= free_.size();
        free_.clear();
    }

    for (auto& waiter : rejected) {
        waiter->promise.set_value(Err<PooledConnection>(ErrorCode::Shutdown, "Connection pool destroyed"));
    }
    if (!rejected.empty()) {
        spdlog::warn("[Pool] destroyed with {} queued acquires", rejected.size());
    }
}

} // namespace ingest::net
