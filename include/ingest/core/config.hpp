#pragma once

#include "ingest/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ingest::core {

/**
 * @brief Tuning knobs for chunking, caching, pooling and batching
 */
struct PerformanceConfig {
    bool enable_chunk_deduplication = true;
    bool enable_compression = true;
    std::size_t compression_threshold = 1024;
    bool enable_semantic_chunking = true;
    bool enable_delta_indexing = true;
    bool enable_connection_pooling = true;
    std::size_t max_connection_pool_size = 5;
    bool enable_request_coalescing = true;
    std::chrono::milliseconds coalescing_window{100};
    std::size_t max_batch_size = 10;
    bool enable_progressive_streaming = true;
    std::size_t streaming_threshold_bytes = 1024 * 1024;
    double cache_expiry_hours = 24.0;
    std::size_t max_cache_size = 10000;
    std::chrono::milliseconds cache_flush_delay{5000};
    std::chrono::milliseconds index_flush_delay{1000};
};

/**
 * @brief Everything the pipeline needs to run against one endpoint
 */
struct PipelineConfig {
    std::string url = "http://localhost:8000";
    std::string api_key;
    std::size_t max_chunk_size = 1000;
    std::size_t batch_size = 5;
    std::size_t chunk_concurrency = 0; ///< 0 = derive from batch_size
    std::string workspace_id = "default";
    bool enable_webhooks = false;
    std::uint16_t webhook_port = 3001;
    std::filesystem::path cache_dir = ".ingest-cache";
    std::string log_level = "info";
    PerformanceConfig performance;

    /// File-level worker count, clamped to [1, 10]
    std::size_t effective_batch_size() const;

    /// Chunk-level concurrency inside one file
    std::size_t effective_chunk_concurrency() const;

    /// Endpoint with any trailing slash removed
    std::string base_url() const;

    /// Completion callback URL, empty when webhooks are disabled
    std::string webhook_url() const;
};

Result<PipelineConfig> config_from_json(const nlohmann::json& document);

Result<PipelineConfig> load_config(const std::filesystem::path& path);

nlohmann::json config_to_json(const PipelineConfig& config);

/**
 * @brief Range checks; an empty vector means the config is usable
 */
std::vector<std::string> validate_config(const PipelineConfig& config);

} // namespace ingest::core
