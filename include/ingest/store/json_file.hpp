#pragma once

#include "ingest/core/result.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <chrono>
#include <filesystem>

namespace ingest::store {

/**
 * @brief Read a JSON object from disk
 *
 * A missing, unreadable or corrupt file, or one whose root is not an object,
 * yields an empty object and a warning; startup never fails on it.
 */
nlohmann::json load_json_object(const std::filesystem::path& path);

/**
 * @brief Replace the file in one step (write to "<path>.tmp", then rename)
 */
Result<void> write_json_atomic(const std::filesystem::path& path, const nlohmann::json& document);

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time);

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms);

} // namespace ingest::store
