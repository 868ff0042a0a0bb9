#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace ingest {

/**
 * @brief Shared cancellation signal threaded through every pipeline layer
 *
 * Copies share one state. cancel() is idempotent and wakes every thread parked
 * in wait_for(), so backoff sleeps and coalescing waits end immediately.
 *
 * EXAMPLE:
 * CancellationToken token;
 * std::thread worker([token] { while (!token.is_cancelled()) { ... } });
 * token.cancel("user stop");
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel(std::string reason = "cancelled") {
        {
            std::lock_guard lock(state_->mutex);
            if (state_->cancelled.load()) {
                return;
            }
            state_->reason = std::move(reason);
            state_->cancelled.store(true);
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const noexcept { return state_->cancelled.load(); }

    std::string reason() const {
        std::lock_guard lock(state_->mutex);
        return state_->reason;
    }

    /**
     * @brief Sleep for up to timeout, returning early on cancellation
     *
     * RETURNS: true if the token was cancelled before or during the wait
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this]() {
            return state_->cancelled.load();
        });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::string reason;
        mutable std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

} // namespace ingest
