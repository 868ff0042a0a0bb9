#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace ingest::delivery {

struct ProgressMetrics {
    double throughput_bytes_per_second = 0.0;
    double throughput_chunks_per_second = 0.0;
    double estimated_seconds_remaining = 0.0;
    double average_chunk_size = 0.0;       ///< Over the last 100 chunks
    double average_latency_ms = 0.0;       ///< Over the last 50 network calls
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Throughput and ETA for one streamed file
 *
 * Not thread-safe; owned by the thread walking the file.
 *
 * EXAMPLE:
 * ProgressTracker tracker(file_size, estimated_chunks);
 * tracker.update(bytes_done, chunks_done, chunk.content.size(), latency_ms);
 * spdlog::debug("{}", tracker.detailed_status());
 */
class ProgressTracker {
public:
    static constexpr std::size_t kChunkSizeWindow = 100;
    static constexpr std::size_t kLatencyWindow = 50;

    ProgressTracker(std::uint64_t total_bytes, std::size_t total_chunks);

    /**
     * PARAMETERS:
     * chunk_size - Bytes of the chunk just finished, 0 to skip the sample
     * latency_ms - Network time of that chunk, negative to skip the sample
     */
    void update(std::uint64_t bytes_processed, std::size_t chunks_processed,
                std::size_t chunk_size = 0, double latency_ms = -1.0);

    ProgressMetrics metrics() const;

    /// 0..100 by bytes
    double percentage() const;

    /// "Progress: 42.0% | ETA: 1m 5s | Speed: 12 KB/s | Chunks/s: 3.1 | Avg chunk: 1 KB | Latency: 40ms"
    std::string detailed_status() const;

    void reset(std::uint64_t total_bytes, std::size_t total_chunks);

    static std::string format_duration(double seconds);
    static std::string format_bytes(double bytes);

private:
    std::chrono::steady_clock::time_point started_;
    std::uint64_t total_bytes_;
    std::size_t total_chunks_;
    std::uint64_t bytes_processed_ = 0;
    std::size_t chunks_processed_ = 0;
    std::deque<std::size_t> chunk_sizes_;
    std::deque<double> latencies_;
};

} // namespace ingest::delivery
