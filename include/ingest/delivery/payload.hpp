/**
 * @file payload.hpp
 * @brief Wire format for POST /index/chunk
 *
 * WHAT IT DOES:
 * - build_chunk_payload(): JSON body for one chunk
 * - external_id_from_response(): pull chunk_id / job_id from a reply body
 * - Job and user identifiers, ISO-8601 timestamps
 *
 * EXAMPLE BODY:
 * {
 *   "job_type": "file_processing",
 *   "user_id": "ingest_default_k3j9x0aa",
 *   "metadata": {"file_path": "src/a.py", "chunk_index": 0, ...},
 *   "content": "def f():\n    pass",
 *   "chunk_metadata": {"line_count": 2, "has_code": true, ...}
 * }
 */

#pragma once

#include "ingest/chunking/types.hpp"
#include "ingest/codec/compression.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ingest::delivery {

inline constexpr const char* kPayloadSource = "vscode-extension";

/**
 * @brief Per-file values stamped into every chunk payload
 */
struct PayloadContext {
    std::string user_id;
    std::string workspace_id;
    std::string job_id;
    std::string file_path;      ///< Workspace-relative
    std::string webhook_url;    ///< Omitted from the body when empty
};

/**
 * @brief Build the JSON body for one chunk
 *
 * When `compression` is set, `content` carries the base64 of the gzip bytes
 * and `compressed` is true. `metadata.content_length` is always the
 * uncompressed length.
 */
nlohmann::json build_chunk_payload(const chunking::Chunk& chunk,
                                   const PayloadContext& context,
                                   const std::optional<codec::CompressionResult>& compression);

/// Serialize a payload; invalid UTF-8 from byte slicing is replaced, not thrown
std::string serialize_payload(const nlohmann::json& payload);

/**
 * @brief External id from a 2xx body
 *
 * RETURNS: `chunk_id`, else `job_id`, else nullopt (non-JSON bodies are fine)
 */
std::optional<std::string> external_id_from_response(const std::string& body);

/// "job_<epoch_ms>_<9 base36 chars>"
std::string make_job_id();

/// "ingest_<workspace>_<8 base36 chars>", non-alphanumerics replaced by '_'
std::string make_user_id(const std::string& workspace_id);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string iso8601_now();

} // namespace ingest::delivery
