#include "ingest/delivery/progress_tracker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#include <spdlog/fmt/fmt.h>

namespace ingest::delivery {

ProgressTracker::ProgressTracker(std::uint64_t total_bytes, std::size_t total_chunks)
    : started_(std::chrono::steady_clock::now()),
      total_bytes_(total_bytes),
      total_chunks_(total_chunks) {}

void ProgressTracker::update(std::uint64_t bytes_processed, std::size_t chunks_processed,
                             std::size_t chunk_size, double latency_ms) {
    bytes_processed_ = bytes_processed;
    chunks_processed_ = chunks_processed;

    if (chunk_size > 0) {
        chunk_sizes_.push_back(chunk_size);
        if (chunk_sizes_.size() > kChunkSizeWindow) {
            chunk_sizes_.pop_front();
        }
    }
    if (latency_ms >= 0.0) {
        latencies_.push_back(latency_ms);
        if (latencies_.size() > kLatencyWindow) {
            latencies_.pop_front();
        }
    }
}

ProgressMetrics ProgressTracker::metrics() const {
    ProgressMetrics m;
    m.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    const double seconds = static_cast<double>(m.elapsed.count()) / 1000.0;

    if (seconds > 0.0) {
        m.throughput_bytes_per_second = static_cast<double>(bytes_processed_) / seconds;
        m.throughput_chunks_per_second = static_cast<double>(chunks_processed_) / seconds;
    }

    if (m.throughput_bytes_per_second > 0.0 && total_bytes_ > bytes_processed_) {
        const double by_bytes = static_cast<double>(total_bytes_ - bytes_processed_)
                                / m.throughput_bytes_per_second;
        double by_chunks = std::numeric_limits<double>::infinity();
        if (m.throughput_chunks_per_second > 0.0 && total_chunks_ > chunks_processed_) {
            by_chunks = static_cast<double>(total_chunks_ - chunks_processed_)
                        / m.throughput_chunks_per_second;
        }
        m.estimated_seconds_remaining = std::min(by_bytes, by_chunks);
    }

    if (!chunk_sizes_.empty()) {
        m.average_chunk_size = static_cast<double>(
            std::accumulate(chunk_sizes_.begin(), chunk_sizes_.end(), std::uint64_t{0}))
            / static_cast<double>(chunk_sizes_.size());
    }
    if (!latencies_.empty()) {
        m.average_latency_ms = std::accumulate(latencies_.begin(), latencies_.end(), 0.0)
                               / static_cast<double>(latencies_.size());
    }
    return m;
}

double ProgressTracker::percentage() const {
    if (total_bytes_ == 0) {
        return 0.0;
    }
    return std::min(100.0, static_cast<double>(bytes_processed_) * 100.0 / static_cast<double>(total_bytes_));
}

std::string ProgressTracker::format_duration(double seconds) {
    const auto total = static_cast<long long>(std::llround(seconds));
    if (total < 60) {
        return fmt::format("{}s", total);
    }
    if (total < 3600) {
        return fmt::format("{}m {}s", total / 60, total % 60);
    }
    return fmt::format("{}h {}m", total / 3600, (total % 3600) / 60);
}

std::string ProgressTracker::format_bytes(double bytes) {
    if (bytes < 1024.0) {
        return fmt::format("{} B", std::llround(bytes));
    }
    if (bytes < 1024.0 * 1024.0) {
        return fmt::format("{} KB", std::llround(bytes / 1024.0));
    }
    return fmt::format("{} MB", std::llround(bytes / (1024.0 * 1024.0)));
}

std::string ProgressTracker::detailed_status() const {
    const auto m = metrics();
    return fmt::format("Progress: {:.1f}% | ETA: {} | Speed: {}/s | Chunks/s: {:.1f} | Avg chunk: {} | Latency: {:.0f}ms",
                       percentage(),
                       format_duration(m.estimated_seconds_remaining),
                       format_bytes(m.throughput_bytes_per_second),
                       m.throughput_chunks_per_second,
                       format_bytes(m.average_chunk_size),
                       m.average_latency_ms);
}

void ProgressTracker::reset(std::uint64_t total_bytes, std::size_t total_chunks) {
    started_ = std::chrono::steady_clock::now();
    total_bytes_ = total_bytes;
    total_chunks_ = total_chunks;
    bytes_processed_ = 0;
    chunks_processed_ = 0;
    chunk_sizes_.clear();
    latencies_.clear();
}

} // namespace ingest::delivery
