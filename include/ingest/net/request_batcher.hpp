#pragma once

#include "ingest/core/result.hpp"
#include "ingest/net/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ingest::net {

struct BatcherOptions {
    std::chrono::milliseconds coalescing_window{100};
    std::size_t max_batch_size = 10;
};

/**
 * @brief Coalesces chunk requests and dispatches them per file group
 *
 * HOW IT WORKS:
 * 1. add_request() queues a request and returns a future
 * 2. The flush thread wakes `coalescing_window` after the first request
 *    lands in an empty queue, or at once when the queue reaches
 *    max_batch_size
 * 3. A flush takes up to max_batch_size requests, groups them by file path
 *    and owner, orders each group by descending priority and calls the
 *    dispatcher once per group
 * 4. A group's failure only fails that group's futures
 *
 * Only one flush runs at a time; requests arriving mid-flush wait for the
 * next cycle. shutdown() fails everything still queued.
 */
class RequestBatcher {
public:
    using ChunkRefs = std::vector<const chunking::Chunk*>;

    /// Returns one DeliveryResult per chunk, in the order given
    using Dispatcher = std::function<Result<std::vector<DeliveryResult>>(const std::string& file_path,
                                                                          const std::string& owner,
                                                                          const ChunkRefs& chunks)>;

    using ResultFuture = std::future<Result<std::vector<DeliveryResult>>>;

    RequestBatcher(BatcherOptions options, Dispatcher dispatcher);
    ~RequestBatcher();

    RequestBatcher(const RequestBatcher&) = delete;
    RequestBatcher& operator=(const RequestBatcher&) = delete;

    /**
     * @brief Queue a request
     *
     * RETURNS: Future of per-chunk results in the request's chunk order
     */
    ResultFuture add_request(BatchRequest request);

    /// Drain the queue on the calling thread
    void flush();

    std::size_t queue_size() const;

    void shutdown();

    std::uint64_t flush_count() const;

private:
    struct Pending {
        BatchRequest request;
        std::promise<Result<std::vector<DeliveryResult>>> promise;
    };

    void run();
    bool flush_cycle();
    void dispatch_group(std::vector<Pending*>& members);

    BatcherOptions options_;
    Dispatcher dispatcher_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Pending> queue_;
    std::chrono::steady_clock::time_point window_start_{};
    bool stopping_ = false;
    std::uint64_t flush_count_ = 0;

    std::mutex flush_mutex_;
    std::thread thread_;
};

} // namespace ingest::net
