/**
 * @file debounced_writer.hpp
 * @brief Single-owner write-behind flush loop for the persistent stores
 *
 * WHY THIS FILE EXISTS:
 * Both persistent stores rewrite a whole JSON file. Writing on every mutation
 * is wasteful, and a cancel-and-reschedule timer per mutation lets two writes
 * race when mutations arrive in bursts from several threads.
 *
 * WHAT IT DOES:
 * - One background thread owns every flush for one store
 * - mark_dirty() pushes the flush deadline out by the configured delay
 * - When the deadline passes with no further mutation, the flush callback runs
 *   once and covers every mutation since the previous run
 * - flush_now() and stop() flush synchronously and never overlap the loop
 *
 * EXAMPLE:
 * DebouncedWriter writer("cache", 5s, [this] { save(); });
 * writer.mark_dirty();   // many times, from any thread
 * writer.stop();         // final flush if anything is pending
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ingest::store {

class DebouncedWriter {
public:
    using FlushFn = std::function<void()>;

    DebouncedWriter(std::string name, std::chrono::milliseconds delay, FlushFn flush);
    ~DebouncedWriter();

    DebouncedWriter(const DebouncedWriter&) = delete;
    DebouncedWriter& operator=(const DebouncedWriter&) = delete;

    /**
     * @brief Record a mutation; the flush happens `delay` after the last one
     *
     * THREAD SAFE: Yes
     * BLOCKS: No
     */
    void mark_dirty();

    /**
     * @brief Flush immediately if anything is pending
     */
    void flush_now();

    /**
     * @brief Stop the loop, flushing pending mutations first
     *
     * Idempotent. mark_dirty() after stop() is ignored.
     */
    void stop();

    bool is_dirty() const;

    /// Number of flush callbacks executed so far
    std::uint64_t flush_count() const noexcept { return flush_count_.load(); }

private:
    void run();
    void do_flush();

    std::string name_;
    std::chrono::milliseconds delay_;
    FlushFn flush_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool dirty_ = false;
    bool stopping_ = false;
    std::chrono::steady_clock::time_point deadline_{};

    std::mutex flush_mutex_;
    std::atomic<std::uint64_t> flush_count_{0};
    std::thread thread_;
};

} // namespace ingest::store
