/**
 * @file events.hpp
 * @brief Event types emitted by the delivery orchestrator
 *
 * NAMING CONVENTION:
 * Events are past-tense: ChunkDeliveredEvent, FileIndexingFailedEvent
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ingest::events {

// ════════════════════════════════════════════════════════
// File Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when a file passes the health check and starts splitting
 */
struct FileIndexingStartedEvent {
    std::string file_path;
    std::string job_id;
    std::uint64_t file_size = 0;
    bool streaming = false;
};

/**
 * @brief Emitted when the change index reports the file as unchanged
 */
struct FileUnchangedEvent {
    std::string file_path;
};

/**
 * @brief Emitted once per file that reached the end of its chunk sequence
 *
 * `failed_chunks > 0` still counts as completed; the file was walked
 * end-to-end.
 */
struct FileIndexingCompletedEvent {
    std::string file_path;
    std::string job_id;
    std::size_t total_chunks = 0;
    std::size_t successful_chunks = 0;
    std::size_t failed_chunks = 0;
    std::size_t skipped_chunks = 0;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Emitted when a file is abandoned (health check, read failure)
 */
struct FileIndexingFailedEvent {
    std::string file_path;
    std::string error;
};

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════

struct ChunkDeliveredEvent {
    std::string file_path;
    std::size_t chunk_index = 0;
    std::string fingerprint;
    std::string external_id;
    std::uint32_t retry_count = 0;
    bool compressed = false;
    std::int64_t processing_time_ms = 0;
};

/**
 * @brief Emitted when the dedup cache already holds the chunk
 */
struct ChunkSkippedEvent {
    std::string file_path;
    std::size_t chunk_index = 0;
    std::string fingerprint;
};

struct ChunkFailedEvent {
    std::string file_path;
    std::size_t chunk_index = 0;
    std::string error;
    std::uint32_t retry_count = 0;
};

// ════════════════════════════════════════════════════════
// Run Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once when a run observes its cancellation token
 */
struct IndexingCancelledEvent {
    std::string reason;
    std::size_t files_completed = 0;
    std::size_t files_total = 0;
};

} // namespace ingest::events
