#include "ingest/core/config.hpp"

#include "ingest/chunking/types.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace ingest::core {
namespace {

using chunking::kServerMaxChunkSize;

constexpr std::size_t kMaxConcurrency = 10;

void read_performance(const nlohmann::json& j, PerformanceConfig& perf) {
    perf.enable_chunk_deduplication = j.value("enable_chunk_deduplication", perf.enable_chunk_deduplication);
    perf.enable_compression = j.value("enable_compression", perf.enable_compression);
    perf.compression_threshold = j.value("compression_threshold", perf.compression_threshold);
    perf.enable_semantic_chunking = j.value("enable_semantic_chunking", perf.enable_semantic_chunking);
    perf.enable_delta_indexing = j.value("enable_delta_indexing", perf.enable_delta_indexing);
    perf.enable_connection_pooling = j.value("enable_connection_pooling", perf.enable_connection_pooling);
    perf.max_connection_pool_size = j.value("max_connection_pool_size", perf.max_connection_pool_size);
    perf.enable_request_coalescing = j.value("enable_request_coalescing", perf.enable_request_coalescing);
    perf.coalescing_window = std::chrono::milliseconds(
        j.value("coalescing_window_ms", static_cast<long long>(perf.coalescing_window.count())));
    perf.max_batch_size = j.value("max_batch_size", perf.max_batch_size);
    perf.enable_progressive_streaming = j.value("enable_progressive_streaming", perf.enable_progressive_streaming);
    perf.streaming_threshold_bytes = j.value("streaming_threshold_bytes", perf.streaming_threshold_bytes);
    perf.cache_expiry_hours = j.value("cache_expiry_hours", perf.cache_expiry_hours);
    perf.max_cache_size = j.value("max_cache_size", perf.max_cache_size);
    perf.cache_flush_delay = std::chrono::milliseconds(
        j.value("cache_flush_delay_ms", static_cast<long long>(perf.cache_flush_delay.count())));
    perf.index_flush_delay = std::chrono::milliseconds(
        j.value("index_flush_delay_ms", static_cast<long long>(perf.index_flush_delay.count())));
}

} // namespace

std::size_t PipelineConfig::effective_batch_size() const {
    return std::clamp<std::size_t>(batch_size, 1, kMaxConcurrency);
}

std::size_t PipelineConfig::effective_chunk_concurrency() const {
    if (chunk_concurrency > 0) {
        return std::min(chunk_concurrency, kMaxConcurrency);
    }
    return batch_size > 3 ? 2 : 1;
}

std::string PipelineConfig::base_url() const {
    std::string trimmed = url;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    return trimmed;
}

std::string PipelineConfig::webhook_url() const {
    if (!enable_webhooks) {
        return {};
    }
    return "http://localhost:" + std::to_string(webhook_port) + "/webhook/job-complete";
}

Result<PipelineConfig> config_from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        return Err<PipelineConfig>(ErrorCode::InvalidArgument, "Config root must be a JSON object");
    }

    PipelineConfig config;
    try {
        config.url = document.value("url", config.url);
        config.api_key = document.value("api_key", config.api_key);
        config.max_chunk_size = document.value("max_chunk_size", config.max_chunk_size);
        config.batch_size = document.value("batch_size", config.batch_size);
        config.chunk_concurrency = document.value("chunk_concurrency", config.chunk_concurrency);
        config.workspace_id = document.value("workspace_id", config.workspace_id);
        config.enable_webhooks = document.value("enable_webhooks", config.enable_webhooks);
        config.webhook_port = document.value("webhook_port", config.webhook_port);
        config.cache_dir = document.value("cache_dir", config.cache_dir.string());
        config.log_level = document.value("log_level", config.log_level);

        if (auto it = document.find("performance"); it != document.end()) {
            if (!it->is_object()) {
                return Err<PipelineConfig>(ErrorCode::InvalidArgument, "\"performance\" must be a JSON object");
            }
            read_performance(*it, config.performance);
        }
    } catch (const nlohmann::json::exception& e) {
        return Err<PipelineConfig>(ErrorCode::InvalidArgument, std::string("Invalid config value: ") + e.what());
    }

    auto problems = validate_config(config);
    if (!problems.empty()) {
        std::ostringstream oss;
        for (std::size_t i = 0; i < problems.size(); ++i) {
            oss << (i == 0 ? "" : "; ") << problems[i];
        }
        return Err<PipelineConfig>(ErrorCode::InvalidArgument, oss.str());
    }
    return Ok(config);
}

Result<PipelineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<PipelineConfig>(ErrorCode::InvalidArgument, "Cannot open config file: " + path.string());
    }

    nlohmann::json document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return Err<PipelineConfig>(ErrorCode::InvalidArgument, "Config file is not valid JSON: " + path.string());
    }

    spdlog::debug("Loaded config from {}", path.string());
    return config_from_json(document);
}

nlohmann::json config_to_json(const PipelineConfig& config) {
    const auto& perf = config.performance;
    return nlohmann::json{
        {"url", config.url},
        {"api_key", config.api_key},
        {"max_chunk_size", config.max_chunk_size},
        {"batch_size", config.batch_size},
        {"chunk_concurrency", config.chunk_concurrency},
        {"workspace_id", config.workspace_id},
        {"enable_webhooks", config.enable_webhooks},
        {"webhook_port", config.webhook_port},
        {"cache_dir", config.cache_dir.string()},
        {"log_level", config.log_level},
        {"performance", {
            {"enable_chunk_deduplication", perf.enable_chunk_deduplication},
            {"enable_compression", perf.enable_compression},
            {"compression_threshold", perf.compression_threshold},
            {"enable_semantic_chunking", perf.enable_semantic_chunking},
            {"enable_delta_indexing", perf.enable_delta_indexing},
            {"enable_connection_pooling", perf.enable_connection_pooling},
            {"max_connection_pool_size", perf.max_connection_pool_size},
            {"enable_request_coalescing", perf.enable_request_coalescing},
            {"coalescing_window_ms", perf.coalescing_window.count()},
            {"max_batch_size", perf.max_batch_size},
            {"enable_progressive_streaming", perf.enable_progressive_streaming},
            {"streaming_threshold_bytes", perf.streaming_threshold_bytes},
            {"cache_expiry_hours", perf.cache_expiry_hours},
            {"max_cache_size", perf.max_cache_size},
            {"cache_flush_delay_ms", perf.cache_flush_delay.count()},
            {"index_flush_delay_ms", perf.index_flush_delay.count()},
        }},
    };
}

std::vector<std::string> validate_config(const PipelineConfig& config) {
    std::vector<std::string> errors;
    const auto& perf = config.performance;

    if (config.url.rfind("http://", 0) != 0) {
        errors.push_back("url must start with http://");
    }
    if (config.max_chunk_size == 0 || config.max_chunk_size > kServerMaxChunkSize) {
        errors.push_back("max_chunk_size must be between 1 and 100000 characters");
    }
    if (config.chunk_concurrency > kMaxConcurrency) {
        errors.push_back("chunk_concurrency must be between 0 (derive) and 10");
    }
    if (perf.compression_threshold < 100) {
        errors.push_back("Compression threshold must be at least 100 bytes");
    }
    if (perf.max_connection_pool_size < 1 || perf.max_connection_pool_size > 20) {
        errors.push_back("Connection pool size must be between 1 and 20");
    }
    if (perf.coalescing_window.count() < 10 || perf.coalescing_window.count() > 5000) {
        errors.push_back("Coalescing window must be between 10ms and 5000ms");
    }
    if (perf.max_batch_size == 0) {
        errors.push_back("max_batch_size must be at least 1");
    }
    if (perf.cache_expiry_hours < 1.0 || perf.cache_expiry_hours > 168.0) {
        errors.push_back("Cache expiry must be between 1 and 168 hours (1 week)");
    }
    if (perf.max_cache_size < 100 || perf.max_cache_size > 100000) {
        errors.push_back("Max cache size must be between 100 and 100000 entries");
    }

    return errors;
}

} // namespace ingest::core
