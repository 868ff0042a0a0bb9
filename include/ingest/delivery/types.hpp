#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ingest::delivery {

/// Marker appended to FileIndexingStats::errors when a run stops early
inline constexpr const char* kCancelledMarker = "Operation cancelled";

/**
 * @brief Per-file outcome of index_file()
 */
struct FileIndexingStats {
    std::string file_path;
    std::string job_id;
    std::size_t total_chunks = 0;
    std::size_t successful_chunks = 0;
    std::size_t failed_chunks = 0;
    std::size_t skipped_chunks = 0;   ///< Served from the dedup cache
    std::uint64_t total_bytes = 0;
    std::int64_t processing_time_ms = 0;
    std::vector<std::string> errors;
    bool cancelled = false;
    bool unchanged = false;           ///< Change index said nothing to do
    bool streamed = false;
};

/**
 * @brief Aggregate of a multi-file run
 */
struct IndexingSummary {
    std::size_t success_count = 0;
    std::size_t error_count = 0;
    std::size_t skipped_unchanged = 0;
    bool cancelled = false;
    std::vector<FileIndexingStats> files;   ///< In input order, for files that ran
    std::vector<std::string> errors;        ///< "<path>: <message>" per aborted file
};

/**
 * @brief Job lifecycle hooks for index_files()
 *
 * Called from worker threads; implementations must be thread-safe.
 */
struct JobCallbacks {
    std::function<void(const std::string& job_id, const std::string& file_path)> on_job_start;

    /// tokens_estimate is total_bytes / 4
    std::function<void(const std::string& job_id, bool success,
                       std::size_t chunks_processed, std::uint64_t tokens_estimate)> on_job_complete;

    std::function<void(std::size_t current, std::size_t total, const std::string& file_path)> on_progress;
};

} // namespace ingest::delivery
