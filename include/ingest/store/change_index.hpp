#pragma once

#include "ingest/store/debounced_writer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ingest::store {

/**
 * @brief What the index remembers about a file after it was fully indexed
 */
struct FileFingerprint {
    std::string file_path;
    std::string content_hash;              ///< SHA-256 hex of the full file
    std::int64_t last_modified_ms = 0;     ///< mtime, filesystem-clock milliseconds
    std::size_t known_chunk_count = 0;
    std::chrono::system_clock::time_point indexed_at{};
};

struct ChangeIndexStats {
    std::size_t total_files = 0;
    std::size_t total_chunks = 0;
    std::optional<std::chrono::system_clock::time_point> last_update;
};

struct ChangeIndexOptions {
    std::filesystem::path directory;          ///< Empty = memory only
    std::chrono::milliseconds flush_delay{1000};
};

/**
 * @brief Persistent path -> FileFingerprint map used to skip unchanged files
 *
 * A file is modified when it has no entry, its mtime is newer than the stored
 * one, or its SHA-256 differs. Any I/O error while checking counts as
 * modified. Persisted to delta-index.json through a DebouncedWriter; write
 * failures are logged and never surface to callers.
 */
class ChangeIndex {
public:
    static constexpr const char* kFileName = "delta-index.json";

    explicit ChangeIndex(ChangeIndexOptions options);
    ~ChangeIndex();

    ChangeIndex(const ChangeIndex&) = delete;
    ChangeIndex& operator=(const ChangeIndex&) = delete;

    bool is_file_modified(const std::filesystem::path& path) const;

    std::vector<std::filesystem::path> get_modified_files(const std::vector<std::filesystem::path>& paths) const;

    /**
     * @brief Record the file's current hash and mtime
     *
     * RETURNS: false if the file could not be read (nothing recorded)
     */
    bool update_file_info(const std::filesystem::path& path, std::size_t chunk_count);

    void remove_file_info(const std::filesystem::path& path);

    std::optional<FileFingerprint> get(const std::filesystem::path& path) const;

    /**
     * @brief Forget files that no longer exist on disk
     *
     * RETURNS: Number of entries removed
     */
    std::size_t cleanup();

    ChangeIndexStats stats() const;

    void flush();

private:
    static std::string key_for(const std::filesystem::path& path);
    void load();
    void save();

    ChangeIndexOptions options_;
    std::filesystem::path file_path_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, FileFingerprint> entries_;

    std::unique_ptr<DebouncedWriter> writer_;
};

/// mtime of a file in milliseconds on the filesystem clock
std::optional<std::int64_t> modified_time_ms(const std::filesystem::path& path);

} // namespace ingest::store
