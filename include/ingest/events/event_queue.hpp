/**
 * @file event_queue.hpp
 * @brief Closable FIFO that feeds the file workers
 *
 * The orchestrator loads every file slot, closes the queue with shutdown(),
 * and lets its workers pop until pop() reports the queue drained.
 *
 * EXAMPLE:
 * ThreadSafeQueue<std::size_t> queue;
 * queue.push(0);
 * queue.shutdown();
 * while (auto slot = queue.pop()) { ... }
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace ingest::events {

/**
 * @brief Multi-producer, multi-consumer FIFO with a closed state
 *
 * Items pushed before shutdown() are still handed out; blocking pops return
 * nullopt only when the queue is both closed and empty.
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_front();
    }

    /// Blocks until an item arrives or the queue is closed and drained
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return has_work_or_closed(); });
        return take_front();
    }

    /// Like pop(), giving up after `timeout`
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        ready_.wait_for(lock, timeout, [this]() { return has_work_or_closed(); });
        return take_front();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    void shutdown() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

private:
    bool has_work_or_closed() const {
        return closed_ || !items_.empty();
    }

    // Caller holds mutex_
    std::optional<T> take_front() {
        if (items_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(items_.front()));
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    bool closed_ = false;
};

} // namespace ingest::events
