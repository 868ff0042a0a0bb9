/**
 * @file components.hpp
 * @brief Ready-made subscribers for pipeline events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * orchestrator.index_files(...);
 * metrics.print_stats();
 */

#pragma once

#include "ingest/events/event_bus.hpp"
#include "ingest/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace ingest::events {

/**
 * @brief Logs every pipeline event with spdlog
 *
 * Per-chunk events go to debug, file-level events to info, failures to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileIndexingStartedEvent>([](const FileIndexingStartedEvent& e) {
            spdlog::info("[IndexingStarted] path={} job={} bytes={} streaming={}",
                         e.file_path, e.job_id, e.file_size, e.streaming);
        });

        bus_.subscribe<FileUnchangedEvent>([](const FileUnchangedEvent& e) {
            spdlog::info("[FileUnchanged] path={}", e.file_path);
        });

        bus_.subscribe<FileIndexingCompletedEvent>([](const FileIndexingCompletedEvent& e) {
            spdlog::info("[IndexingCompleted] path={} job={} chunks={} ok={} failed={} skipped={} bytes={} duration={}ms",
                         e.file_path, e.job_id, e.total_chunks, e.successful_chunks,
                         e.failed_chunks, e.skipped_chunks, e.total_bytes, e.duration.count());
        });

        bus_.subscribe<FileIndexingFailedEvent>([](const FileIndexingFailedEvent& e) {
            spdlog::warn("[IndexingFailed] path={} error={}", e.file_path, e.error);
        });

        bus_.subscribe<ChunkDeliveredEvent>([](const ChunkDeliveredEvent& e) {
            spdlog::debug("[ChunkDelivered] path={} index={} id={} retries={} compressed={} time={}ms",
                          e.file_path, e.chunk_index, e.external_id, e.retry_count,
                          e.compressed, e.processing_time_ms);
        });

        bus_.subscribe<ChunkSkippedEvent>([](const ChunkSkippedEvent& e) {
            spdlog::debug("[ChunkSkipped] path={} index={} hash={}",
                          e.file_path, e.chunk_index, e.fingerprint.substr(0, 16));
        });

        bus_.subscribe<ChunkFailedEvent>([](const ChunkFailedEvent& e) {
            spdlog::warn("[ChunkFailed] path={} index={} retries={} error={}",
                         e.file_path, e.chunk_index, e.retry_count, e.error);
        });

        bus_.subscribe<IndexingCancelledEvent>([](const IndexingCancelledEvent& e) {
            spdlog::warn("[IndexingCancelled] reason={} files={}/{}",
                         e.reason, e.files_completed, e.files_total);
        });
    }

private:
    EventBus& bus_;
};

/**
 * @brief Counts pipeline events
 *
 * THREAD SAFETY: Counters are atomics; handlers run on worker threads.
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_started{0};
        std::atomic<uint64_t> files_completed{0};
        std::atomic<uint64_t> files_failed{0};
        std::atomic<uint64_t> files_unchanged{0};
        std::atomic<uint64_t> chunks_delivered{0};
        std::atomic<uint64_t> chunks_skipped{0};
        std::atomic<uint64_t> chunks_failed{0};
        std::atomic<uint64_t> chunks_compressed{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> bytes_indexed{0};
        std::atomic<uint64_t> cancellations{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<FileIndexingStartedEvent>([this](const FileIndexingStartedEvent&) {
            stats_.files_started++;
        });

        bus_.subscribe<FileIndexingCompletedEvent>([this](const FileIndexingCompletedEvent& e) {
            stats_.files_completed++;
            stats_.bytes_indexed += e.total_bytes;
        });

        bus_.subscribe<FileIndexingFailedEvent>([this](const FileIndexingFailedEvent&) {
            stats_.files_failed++;
        });

        bus_.subscribe<FileUnchangedEvent>([this](const FileUnchangedEvent&) {
            stats_.files_unchanged++;
        });

        bus_.subscribe<ChunkDeliveredEvent>([this](const ChunkDeliveredEvent& e) {
            stats_.chunks_delivered++;
            stats_.retries += e.retry_count;
            if (e.compressed) {
                stats_.chunks_compressed++;
            }
        });

        bus_.subscribe<ChunkSkippedEvent>([this](const ChunkSkippedEvent&) {
            stats_.chunks_skipped++;
        });

        bus_.subscribe<ChunkFailedEvent>([this](const ChunkFailedEvent& e) {
            stats_.chunks_failed++;
            stats_.retries += e.retry_count;
        });

        bus_.subscribe<IndexingCancelledEvent>([this](const IndexingCancelledEvent&) {
            stats_.cancellations++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Indexing Statistics:");
        spdlog::info("  Files started:    {}", stats_.files_started.load());
        spdlog::info("  Files completed:  {}", stats_.files_completed.load());
        spdlog::info("  Files failed:     {}", stats_.files_failed.load());
        spdlog::info("  Files unchanged:  {}", stats_.files_unchanged.load());
        spdlog::info("  Chunks delivered: {}", stats_.chunks_delivered.load());
        spdlog::info("  Chunks skipped:   {}", stats_.chunks_skipped.load());
        spdlog::info("  Chunks failed:    {}", stats_.chunks_failed.load());
        spdlog::info("  Compressed:       {}", stats_.chunks_compressed.load());
        spdlog::info("  Retries:          {}", stats_.retries.load());
        spdlog::info("  Bytes indexed:    {}", stats_.bytes_indexed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace ingest::events
