#pragma once

#include "ingest/chunking/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ingest::net {

/**
 * @brief Terminal outcome of one chunk's attempt chain
 */
struct DeliveryResult {
    bool success = false;
    std::optional<std::string> external_id;
    std::optional<std::string> error;
    std::uint32_t retry_count = 0;
    std::int64_t processing_time_ms = 0;
    bool cancelled = false;
    bool skipped = false;   ///< Already in the dedup cache, nothing sent
    bool compressed = false;
};

/**
 * @brief Chunks from one file queued for coalesced delivery
 */
struct BatchRequest {
    std::vector<chunking::Chunk> chunks;
    std::string file_path;
    std::string owner;   ///< Submitter id; same-file requests of different owners dispatch apart
    int priority = 0;
    std::chrono::steady_clock::time_point enqueued_at = std::chrono::steady_clock::now();
};

} // namespace ingest::net
