#pragma once

#include "ingest/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace ingest::chunking {

/// Lower-case hex SHA-256 of an in-memory buffer
std::string sha256_hex(const std::string& data);

/// Lower-case hex SHA-256 of a file's full contents, streamed
Result<std::string> sha256_file(const std::filesystem::path& path);

/**
 * @brief Stable identity of a chunk at a position in a file
 *
 * Hashes "<file_path>:<index>:<content>", so the same text at another index
 * or in another file gets a different fingerprint.
 */
std::string fingerprint(const std::string& file_path, std::size_t index, const std::string& content);

} // namespace ingest::chunking
