/**
 * @file orchestrator.hpp
 * @brief End-to-end per-file indexing pipeline
 *
 * WHY THIS FILE EXISTS:
 * Ties the leaves together. A file goes through:
 *
 *   delta gate -> health check -> read -> split -> per chunk:
 *     claim fingerprint (skip if cached) -> compress -> deliver -> record
 *
 * and the change index is updated once every chunk of the file succeeded.
 *
 * CONCURRENCY:
 * - index_files() runs `effective_batch_size()` file workers fed from a queue
 * - Inside a file, chunks go out in windows of `effective_chunk_concurrency()`
 * - Every network call borrows a ConnectionPool slot when pooling is enabled
 * - With request coalescing, windows are handed to the RequestBatcher instead
 *   of being sent directly
 * - Results are always reported in chunk index order
 *
 * CANCELLATION:
 * One token is checked at the top of every file, window and retry loop and
 * before every network call. A cancelled file reports `cancelled = true` and
 * carries the "Operation cancelled" marker in its errors.
 *
 * EXAMPLE:
 * events::EventBus bus;
 * DeliveryOrchestrator orchestrator(config, bus);
 * CancellationToken token;
 * auto summary = orchestrator.index_files(files, callbacks, token);
 */

#pragma once

#include "ingest/core/cancellation.hpp"
#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"
#include "ingest/chunking/splitter.hpp"
#include "ingest/codec/compression.hpp"
#include "ingest/delivery/chunk_sender.hpp"
#include "ingest/delivery/destination.hpp"
#include "ingest/delivery/payload.hpp"
#include "ingest/delivery/types.hpp"
#include "ingest/events/event_bus.hpp"
#include "ingest/net/connection_pool.hpp"
#include "ingest/net/http_transport.hpp"
#include "ingest/net/request_batcher.hpp"
#include "ingest/store/change_index.hpp"
#include "ingest/store/dedup_cache.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ingest::delivery {

class DeliveryOrchestrator {
public:
    using TransportFactory = std::function<std::shared_ptr<net::HttpTransport>(const net::Endpoint&)>;

    struct Options {
        /// Empty = AsioHttpTransport per destination
        TransportFactory transport_factory;

        /// Null = StaticDestinationResolver over config.url / config.api_key
        std::shared_ptr<DestinationResolver> resolver;

        /// Payload file paths are made relative to this; empty = file name only
        std::filesystem::path workspace_root;

        RetryPolicy retry;

        /// Pause between chunk windows
        std::chrono::milliseconds window_delay{50};
    };

    DeliveryOrchestrator(core::PipelineConfig config, events::EventBus& bus);
    DeliveryOrchestrator(core::PipelineConfig config, events::EventBus& bus, Options options);
    ~DeliveryOrchestrator();

    DeliveryOrchestrator(const DeliveryOrchestrator&) = delete;
    DeliveryOrchestrator& operator=(const DeliveryOrchestrator&) = delete;

    /**
     * @brief Index one file
     *
     * PARAMETERS:
     * job_id - Stamped into every payload; generated when empty
     *
     * RETURNS:
     * - Ok(stats), including partial chunk failures and cancellation
     * - FileAborted when the health check fails or the file cannot be read
     */
    Result<FileIndexingStats> index_file(const std::filesystem::path& path,
                                         const CancellationToken& token,
                                         std::string job_id = {});

    /**
     * @brief Index many files with bounded file concurrency
     *
     * A file that aborts counts as an error and does not stop the others.
     */
    IndexingSummary index_files(const std::vector<std::filesystem::path>& files,
                                const JobCallbacks& callbacks,
                                const CancellationToken& token);

    /// Fail queued work, release the pool and write both stores
    void shutdown();

    store::DedupCache* cache() noexcept { return cache_.get(); }
    store::ChangeIndex* change_index() noexcept { return index_.get(); }
    std::optional<net::PoolStats> pool_stats() const;
    const std::string& user_id() const noexcept { return user_id_; }

private:
    struct FileContext {
        std::string id;    ///< Unique per index_file call
        std::string key;
        PayloadContext payload;
        std::unique_ptr<ChunkSender> sender;
        CancellationToken token;
    };

    using Window = std::vector<chunking::Chunk>;

    std::vector<net::DeliveryResult> process_window(FileContext& context, const Window& window);
    std::vector<net::DeliveryResult> send_direct(FileContext& context, const std::vector<const chunking::Chunk*>& chunks);
    std::vector<net::DeliveryResult> send_batched(FileContext& context, const std::vector<const chunking::Chunk*>& chunks);
    net::DeliveryResult send_chunk(FileContext& context, const chunking::Chunk& chunk);

    Result<std::vector<net::DeliveryResult>> dispatch_group(const std::string& owner,
                                                            const net::RequestBatcher::ChunkRefs& chunks);

    std::string payload_path(const std::filesystem::path& path) const;
    void record(FileIndexingStats& stats, const chunking::Chunk& chunk, const net::DeliveryResult& result);

    core::PipelineConfig config_;
    events::EventBus& bus_;
    Options options_;
    std::string user_id_;

    chunking::ChunkSplitter splitter_;
    std::optional<codec::CompressionCodec> codec_;
    std::unique_ptr<store::DedupCache> cache_;
    std::unique_ptr<store::ChangeIndex> index_;
    std::unique_ptr<net::ConnectionPool> pool_;

    std::mutex contexts_mutex_;
    std::unordered_map<std::string, FileContext*> contexts_;   ///< By FileContext::id
    std::atomic<std::uint64_t> next_context_id_{0};

    // Declared last so its flush thread stops before the members it calls into
    std::unique_ptr<net::RequestBatcher> batcher_;
};

} // namespace ingest::delivery
