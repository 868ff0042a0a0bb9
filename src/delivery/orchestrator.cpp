#include "ingest/delivery/orchestrator.hpp"

#include "ingest/chunking/line_splitter.hpp"
#include "ingest/delivery/progress_tracker.hpp"
#include "ingest/events/event_queue.hpp"
#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <future>
#include <iterator>
#include <thread>
#include <unordered_set>

namespace ingest::delivery {

namespace fs = std::filesystem;

namespace {

using Clock = std::chrono::steady_clock;

std::int64_t elapsed_ms(Clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

net::DeliveryResult cancelled_result() {
    net::DeliveryResult result;
    result.cancelled = true;
    result.error = kCancelledMarker;
    return result;
}

net::DeliveryResult failed_result(const Error& error) {
    net::DeliveryResult result;
    result.cancelled = error.is_cancelled();
    result.error = error.message;
    return result;
}

std::chrono::milliseconds hours_to_ms(double hours) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double, std::ratio<3600>>(hours));
}

/// Claims taken in one window; any still open on scope exit are released as failed
class ClaimSet {
public:
    explicit ClaimSet(store::DedupCache* cache) : cache_(cache) {}

    ~ClaimSet() {
        for (const auto* fingerprint : open_) {
            if (fingerprint != nullptr) {
                cache_->finish_claim(*fingerprint, std::nullopt);
            }
        }
    }

    ClaimSet(const ClaimSet&) = delete;
    ClaimSet& operator=(const ClaimSet&) = delete;

    void add(const std::string& fingerprint) { open_.push_back(&fingerprint); }

    void finish(std::size_t k, std::optional<std::string> external_id) {
        const std::string* fingerprint = open_[k];
        open_[k] = nullptr;
        cache_->finish_claim(*fingerprint, std::move(external_id));
    }

private:
    store::DedupCache* cache_;
    std::vector<const std::string*> open_;
};

/// Runs a callable on scope exit
class ScopeExit {
public:
    explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    std::function<void()> fn_;
};

} // namespace

// ──────────────────────────────────────────────────────────
// Construction
// ──────────────────────────────────────────────────────────

DeliveryOrchestrator::DeliveryOrchestrator(core::PipelineConfig config, events::EventBus& bus)
    : DeliveryOrchestrator(std::move(config), bus, Options{}) {}

DeliveryOrchestrator::DeliveryOrchestrator(core::PipelineConfig config, events::EventBus& bus, Options options)
    : config_(std::move(config)),
      bus_(bus),
      options_(std::move(options)),
      user_id_(make_user_id(config_.workspace_id)),
      splitter_(chunking::SplitOptions{config_.max_chunk_size, config_.performance.enable_semantic_chunking}) {
    const auto& perf = config_.performance;

    if (!options_.transport_factory) {
        options_.transport_factory = [](const net::Endpoint& endpoint) {
            return std::make_shared<net::AsioHttpTransport>(endpoint);
        };
    }
    if (!options_.resolver) {
        options_.resolver = std::make_shared<StaticDestinationResolver>(
            Destination{config_.base_url(), config_.api_key, "default"});
    }

    if (perf.enable_compression) {
        codec_.emplace(perf.compression_threshold);
    }

    if (perf.enable_chunk_deduplication) {
        store::DedupCacheOptions cache_options;
        cache_options.directory = config_.cache_dir;
        cache_options.max_entries = perf.max_cache_size;
        cache_options.expiry = hours_to_ms(perf.cache_expiry_hours);
        cache_options.flush_delay = perf.cache_flush_delay;
        cache_ = std::make_unique<store::DedupCache>(cache_options);
    }

    if (perf.enable_delta_indexing) {
        store::ChangeIndexOptions index_options;
        index_options.directory = config_.cache_dir;
        index_options.flush_delay = perf.index_flush_delay;
        index_ = std::make_unique<store::ChangeIndex>(index_options);
    }

    if (perf.enable_connection_pooling) {
        pool_ = std::make_unique<net::ConnectionPool>(perf.max_connection_pool_size);
    }

    if (perf.enable_request_coalescing) {
        net::BatcherOptions batcher_options;
        batcher_options.coalescing_window = perf.coalescing_window;
        batcher_options.max_batch_size = perf.max_batch_size;
        batcher_ = std::make_unique<net::RequestBatcher>(
            batcher_options,
            [this](const std::string&, const std::string& owner, const net::RequestBatcher::ChunkRefs& chunks) {
                return dispatch_group(owner, chunks);
            });
    }

    spdlog::info("[Orchestrator] endpoint={} files={} chunks/file={} dedup={} delta={} pool={} coalescing={}",
                 config_.base_url(), config_.effective_batch_size(), config_.effective_chunk_concurrency(),
                 cache_ != nullptr, index_ != nullptr, pool_ != nullptr, batcher_ != nullptr);
}

DeliveryOrchestrator::~DeliveryOrchestrator() {
    shutdown();
}

void DeliveryOrchestrator::shutdown() {
    if (batcher_) {
        batcher_->shutdown();
    }
    if (pool_) {
        pool_->destroy();
    }
    if (cache_) {
        cache_->flush();
    }
    if (index_) {
        index_->flush();
    }
}

std::optional<net::PoolStats> DeliveryOrchestrator::pool_stats() const {
    if (!pool_) {
        return std::nullopt;
    }
    return pool_->stats();
}

std::string DeliveryOrchestrator::payload_path(const fs::path& path) const {
    if (options_.workspace_root.empty()) {
        return path.filename().generic_string();
    }

    std::error_code ec;
    const fs::path absolute_file = fs::absolute(path, ec).lexically_normal();
    const fs::path absolute_root = fs::absolute(options_.workspace_root, ec).lexically_normal();
    if (ec) {
        return path.filename().generic_string();
    }

    const fs::path relative = absolute_file.lexically_relative(absolute_root);
    if (relative.empty() || *relative.begin() == "..") {
        return path.filename().generic_string();
    }
    return relative.generic_string();
}

// ──────────────────────────────────────────────────────────
// Single file
// ──────────────────────────────────────────────────────────

Result<FileIndexingStats> DeliveryOrchestrator::index_file(const fs::path& path,
                                                           const CancellationToken& token,
                                                           std::string job_id) {
    const auto started = Clock::now();
    const auto& perf = config_.performance;

    FileIndexingStats stats;
    stats.file_path = path.string();
    stats.job_id = job_id.empty() ? make_job_id() : std::move(job_id);

    auto abort_file = [&](std::string message) {
        bus_.emit(events::FileIndexingFailedEvent{stats.file_path, message});
        return Err<FileIndexingStats>(ErrorCode::FileAborted, std::move(message));
    };

    if (token.is_cancelled()) {
        stats.cancelled = true;
        stats.errors.emplace_back(kCancelledMarker);
        return Ok(std::move(stats));
    }

    if (index_ && !index_->is_file_modified(path)) {
        stats.unchanged = true;
        bus_.emit(events::FileUnchangedEvent{stats.file_path});
        stats.processing_time_ms = elapsed_ms(started);
        return Ok(std::move(stats));
    }

    const Destination destination = options_.resolver->resolve(path);
    auto endpoint = net::parse_endpoint(destination.url);
    if (endpoint.is_error()) {
        return abort_file("Invalid endpoint " + destination.url + ": " + endpoint.error().message);
    }

    FileContext context;
    context.id = std::to_string(++next_context_id_);
    context.key = path.lexically_normal().generic_string();
    context.token = token;
    context.payload = PayloadContext{user_id_, config_.workspace_id, stats.job_id,
                                     payload_path(path), config_.webhook_url()};
    context.sender = std::make_unique<ChunkSender>(options_.transport_factory(endpoint.value()),
                                                   endpoint.value(), destination.api_key,
                                                   options_.retry, pool_.get());

    auto health = context.sender->health_check(token);
    if (health.is_error()) {
        if (health.error().is_cancelled()) {
            stats.cancelled = true;
            stats.errors.emplace_back(kCancelledMarker);
            stats.processing_time_ms = elapsed_ms(started);
            return Ok(std::move(stats));
        }
        return abort_file(health.error().message);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return abort_file("Cannot read file " + stats.file_path + ": " + std::strerror(errno));
    }
    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return abort_file("Cannot read file " + stats.file_path + ": read error");
    }
    stats.total_bytes = content.size();

    if (chunking::is_blank(content)) {
        if (index_ && !index_->update_file_info(path, 0)) {
            spdlog::warn("[Orchestrator] could not record {} in the change index", stats.file_path);
        }
        stats.processing_time_ms = elapsed_ms(started);
        return Ok(std::move(stats));
    }

    stats.streamed = perf.enable_progressive_streaming && content.size() > perf.streaming_threshold_bytes;
    bus_.emit(events::FileIndexingStartedEvent{stats.file_path, stats.job_id, stats.total_bytes, stats.streamed});
    spdlog::debug("[Orchestrator] path={} job={} store={} endpoint={}",
                  context.payload.file_path, stats.job_id, destination.store_id, endpoint.value().to_string());

    {
        std::lock_guard lock(contexts_mutex_);
        contexts_[context.id] = &context;
    }
    ScopeExit unregister([&]() {
        std::lock_guard lock(contexts_mutex_);
        contexts_.erase(context.id);
    });

    const std::uint64_t file_bytes = stats.total_bytes;
    auto sequence = splitter_.split(std::move(content), stats.file_path);
    const std::size_t concurrency = std::max<std::size_t>(config_.effective_chunk_concurrency(), 1);

    std::vector<chunking::Chunk> all_chunks;
    std::size_t cursor = 0;
    std::optional<ProgressTracker> progress;
    if (stats.streamed) {
        progress.emplace(file_bytes, static_cast<std::size_t>(file_bytes / std::max<std::size_t>(config_.max_chunk_size, 1)) + 1);
    } else {
        all_chunks = chunking::collect(*sequence);
        stats.total_chunks = all_chunks.size();
    }

    std::uint64_t bytes_done = 0;
    std::size_t chunks_done = 0;

    while (true) {
        if (token.is_cancelled()) {
            stats.cancelled = true;
            break;
        }

        Window window;
        if (stats.streamed) {
            while (window.size() < concurrency) {
                auto next = sequence->next();
                if (!next) {
                    break;
                }
                window.push_back(std::move(*next));
                ++stats.total_chunks;
            }
        } else {
            while (window.size() < concurrency && cursor < all_chunks.size()) {
                window.push_back(std::move(all_chunks[cursor++]));
            }
        }
        if (window.empty()) {
            break;
        }

        const auto results = process_window(context, window);
        for (std::size_t i = 0; i < window.size(); ++i) {
            record(stats, window[i], results[i]);
            if (results[i].cancelled) {
                stats.cancelled = true;
            }
            if (progress) {
                bytes_done += window[i].content.size();
                ++chunks_done;
                progress->update(bytes_done, chunks_done, window[i].content.size(),
                                 static_cast<double>(results[i].processing_time_ms));
                // Cooperative backpressure between streamed chunks
                std::this_thread::yield();
            }
        }
        if (progress) {
            spdlog::debug("[Progress] path={} {}", context.payload.file_path, progress->detailed_status());
        }
        if (stats.cancelled) {
            break;
        }

        const bool more = !stats.streamed && cursor < all_chunks.size();
        if (more && options_.window_delay.count() > 0 && token.wait_for(options_.window_delay)) {
            stats.cancelled = true;
            break;
        }
    }

    if (stats.cancelled &&
        std::find(stats.errors.begin(), stats.errors.end(), kCancelledMarker) == stats.errors.end()) {
        stats.errors.emplace_back(kCancelledMarker);
    }
    stats.processing_time_ms = elapsed_ms(started);

    if (stats.cancelled) {
        return Ok(std::move(stats));
    }

    if (index_ && stats.failed_chunks == 0 && !index_->update_file_info(path, stats.total_chunks)) {
        spdlog::warn("[Orchestrator] could not record {} in the change index", stats.file_path);
    }

    events::FileIndexingCompletedEvent completed;
    completed.file_path = stats.file_path;
    completed.job_id = stats.job_id;
    completed.total_chunks = stats.total_chunks;
    completed.successful_chunks = stats.successful_chunks;
    completed.failed_chunks = stats.failed_chunks;
    completed.skipped_chunks = stats.skipped_chunks;
    completed.total_bytes = stats.total_bytes;
    completed.duration = std::chrono::milliseconds(stats.processing_time_ms);
    bus_.emit(completed);

    return Ok(std::move(stats));
}

void DeliveryOrchestrator::record(FileIndexingStats& stats,
                                  const chunking::Chunk& chunk,
                                  const net::DeliveryResult& result) {
    if (result.skipped) {
        ++stats.skipped_chunks;
        bus_.emit(events::ChunkSkippedEvent{stats.file_path, chunk.index, chunk.fingerprint});
        return;
    }
    if (result.success) {
        ++stats.successful_chunks;
        events::ChunkDeliveredEvent delivered;
        delivered.file_path = stats.file_path;
        delivered.chunk_index = chunk.index;
        delivered.fingerprint = chunk.fingerprint;
        delivered.external_id = result.external_id.value_or("");
        delivered.retry_count = result.retry_count;
        delivered.compressed = result.compressed;
        delivered.processing_time_ms = result.processing_time_ms;
        bus_.emit(delivered);
        return;
    }
    if (result.cancelled) {
        return;
    }

    ++stats.failed_chunks;
    const std::string error = result.error.value_or("Unknown send error");
    stats.errors.push_back("Chunk " + std::to_string(chunk.index) + ": " + error);
    bus_.emit(events::ChunkFailedEvent{stats.file_path, chunk.index, error, result.retry_count});
}

// ──────────────────────────────────────────────────────────
// Chunk windows
// ──────────────────────────────────────────────────────────

std::vector<net::DeliveryResult> DeliveryOrchestrator::process_window(FileContext& context, const Window& window) {
    std::vector<net::DeliveryResult> results(window.size());
    std::vector<const chunking::Chunk*> to_send;
    std::vector<std::size_t> slots;
    std::optional<ClaimSet> claims;
    if (cache_) {
        claims.emplace(cache_.get());
    }

    for (std::size_t i = 0; i < window.size(); ++i) {
        if (context.token.is_cancelled()) {
            results[i] = cancelled_result();
            continue;
        }
        if (cache_) {
            switch (cache_->claim(window[i].fingerprint, context.token)) {
                case store::ClaimStatus::AlreadyDelivered:
                    results[i].success = true;
                    results[i].skipped = true;
                    if (auto entry = cache_->get(window[i].fingerprint); entry && !entry->external_id.empty()) {
                        results[i].external_id = entry->external_id;
                    }
                    continue;
                case store::ClaimStatus::Cancelled:
                    results[i] = cancelled_result();
                    continue;
                case store::ClaimStatus::Acquired:
                    claims->add(window[i].fingerprint);
                    break;
            }
        }
        to_send.push_back(&window[i]);
        slots.push_back(i);
    }

    if (to_send.empty()) {
        return results;
    }

    auto sent = batcher_ ? send_batched(context, to_send) : send_direct(context, to_send);
    for (std::size_t k = 0; k < slots.size(); ++k) {
        if (claims) {
            std::optional<std::string> external_id;
            if (sent[k].success) {
                external_id = sent[k].external_id.value_or("");
            }
            claims->finish(k, std::move(external_id));
        }
        results[slots[k]] = std::move(sent[k]);
    }
    return results;
}

std::vector<net::DeliveryResult> DeliveryOrchestrator::send_direct(FileContext& context,
                                                                   const std::vector<const chunking::Chunk*>& chunks) {
    std::vector<net::DeliveryResult> results;
    results.reserve(chunks.size());

    if (chunks.size() == 1) {
        results.push_back(send_chunk(context, *chunks.front()));
        return results;
    }

    std::vector<std::future<net::DeliveryResult>> pending;
    pending.reserve(chunks.size());
    for (const auto* chunk : chunks) {
        pending.push_back(std::async(std::launch::async, [this, &context, chunk]() {
            return send_chunk(context, *chunk);
        }));
    }
    for (auto& future : pending) {
        results.push_back(future.get());
    }
    return results;
}

std::vector<net::DeliveryResult> DeliveryOrchestrator::send_batched(FileContext& context,
                                                                    const std::vector<const chunking::Chunk*>& chunks) {
    net::BatchRequest request;
    request.file_path = context.key;
    request.owner = context.id;
    request.chunks.reserve(chunks.size());
    for (const auto* chunk : chunks) {
        request.chunks.push_back(*chunk);
    }

    auto outcome = batcher_->add_request(std::move(request)).get();
    if (outcome.is_error()) {
        return std::vector<net::DeliveryResult>(chunks.size(), failed_result(outcome.error()));
    }
    return std::move(outcome.value());
}

Result<std::vector<net::DeliveryResult>> DeliveryOrchestrator::dispatch_group(
        const std::string& owner, const net::RequestBatcher::ChunkRefs& chunks) {
    FileContext* context = nullptr;
    {
        std::lock_guard lock(contexts_mutex_);
        auto it = contexts_.find(owner);
        if (it != contexts_.end()) {
            context = it->second;
        }
    }
    if (context == nullptr) {
        return Err<std::vector<net::DeliveryResult>>(ErrorCode::InvalidArgument,
                                                     "No file in progress for request " + owner);
    }
    return Ok(send_direct(*context, chunks));
}

net::DeliveryResult DeliveryOrchestrator::send_chunk(FileContext& context, const chunking::Chunk& chunk) {
    if (context.token.is_cancelled()) {
        return cancelled_result();
    }

    std::optional<codec::CompressionResult> compression;
    if (codec_) {
        compression = codec_->compress_if_beneficial(chunk.content);
    }

    const std::string body = serialize_payload(build_chunk_payload(chunk, context.payload, compression));
    auto result = context.sender->send(body, context.token);
    result.compressed = compression.has_value();
    return result;
}

// ──────────────────────────────────────────────────────────
// Many files
// ──────────────────────────────────────────────────────────

IndexingSummary DeliveryOrchestrator::index_files(const std::vector<fs::path>& files,
                                                  const JobCallbacks& callbacks,
                                                  const CancellationToken& token) {
    IndexingSummary summary;

    if (cache_) {
        cache_->cleanup();
    }
    if (index_) {
        index_->cleanup();
    }

    std::vector<fs::path> unique_files;
    std::unordered_set<std::string> seen;
    for (const auto& file : files) {
        if (seen.insert(file.lexically_normal().generic_string()).second) {
            unique_files.push_back(file);
        }
    }

    const std::size_t total = unique_files.size();
    std::vector<std::optional<FileIndexingStats>> slots(total);
    std::mutex summary_mutex;
    std::atomic<std::size_t> completed{0};

    events::ThreadSafeQueue<std::size_t> queue;
    for (std::size_t i = 0; i < total; ++i) {
        queue.push(i);
    }
    queue.shutdown();

    auto run_one = [&](std::size_t slot) {
        const std::string name = unique_files[slot].string();
        const std::string job_id = make_job_id();
        if (callbacks.on_job_start) {
            callbacks.on_job_start(job_id, name);
        }

        auto result = index_file(unique_files[slot], token, job_id);
        bool success = false;
        std::size_t processed = 0;
        std::uint64_t tokens_estimate = 0;
        {
            std::lock_guard lock(summary_mutex);
            if (result.is_error()) {
                ++summary.error_count;
                summary.errors.push_back(name + ": " + result.error().message);
            } else {
                auto& stats = result.value();
                success = !stats.cancelled;
                processed = stats.successful_chunks;
                tokens_estimate = stats.total_bytes / 4;
                if (stats.unchanged) {
                    ++summary.skipped_unchanged;
                } else if (success) {
                    ++summary.success_count;
                }
                slots[slot] = std::move(stats);
            }
        }

        if (callbacks.on_job_complete) {
            callbacks.on_job_complete(job_id, success, processed, tokens_estimate);
        }
        const std::size_t current = ++completed;
        if (callbacks.on_progress) {
            callbacks.on_progress(current, total, name);
        }
    };

    auto worker = [&]() {
        while (auto slot = queue.pop()) {
            if (token.is_cancelled()) {
                break;
            }
            try {
                run_one(*slot);
            } catch (const std::exception& e) {
                spdlog::error("[Orchestrator] {} failed: {}", unique_files[*slot].string(), e.what());
                std::lock_guard lock(summary_mutex);
                ++summary.error_count;
                summary.errors.push_back(unique_files[*slot].string() + ": " + e.what());
            }
        }
    };

    const std::size_t worker_count = std::min(config_.effective_batch_size(), total);
    if (worker_count <= 1) {
        worker();
    } else {
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(worker);
        }
        for (auto& thread : workers) {
            thread.join();
        }
    }

    for (auto& slot : slots) {
        if (slot) {
            if (slot->cancelled) {
                summary.cancelled = true;
            }
            summary.files.push_back(std::move(*slot));
        }
    }
    if (token.is_cancelled()) {
        summary.cancelled = true;
        bus_.emit(events::IndexingCancelledEvent{token.reason(), completed.load(), total});
    }

    if (cache_) {
        cache_->flush();
    }
    if (index_) {
        index_->flush();
    }

    spdlog::info("[Orchestrator] run finished ok={} failed={} unchanged={} cancelled={}",
                 summary.success_count, summary.error_count, summary.skipped_unchanged, summary.cancelled);
    return summary;
}

} // namespace ingest::delivery
