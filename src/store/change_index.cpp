#include "ingest/store/change_index.hpp"

#include "ingest/chunking/fingerprint.hpp"
#include "ingest/store/json_file.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace ingest::store {

std::optional<std::int64_t> modified_time_ms(const fs::path& path) {
    std::error_code ec;
    const auto file_time = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    // Measured against the filesystem clock's own epoch so repeated reads agree
    return std::chrono::duration_cast<std::chrono::milliseconds>(file_time.time_since_epoch()).count();
}

ChangeIndex::ChangeIndex(ChangeIndexOptions options)
    : options_(std::move(options)) {
    if (!options_.directory.empty()) {
        file_path_ = options_.directory / kFileName;
        load();
        writer_ = std::make_unique<DebouncedWriter>("ChangeIndex", options_.flush_delay, [this]() { save(); });
    }
}

ChangeIndex::~ChangeIndex() {
    if (writer_) {
        writer_->stop();
    }
}

std::string ChangeIndex::key_for(const fs::path& path) {
    return path.lexically_normal().generic_string();
}

std::optional<FileFingerprint> ChangeIndex::get(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key_for(path));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ChangeIndex::is_file_modified(const fs::path& path) const {
    const auto known = get(path);
    if (!known) {
        return true;
    }

    const auto mtime = modified_time_ms(path);
    if (!mtime) {
        spdlog::debug("[ChangeIndex] cannot stat {}, treating as modified", path.string());
        return true;
    }
    if (*mtime > known->last_modified_ms) {
        return true;
    }

    auto hash = chunking::sha256_file(path);
    if (hash.is_error()) {
        spdlog::debug("[ChangeIndex] {}, treating as modified", hash.error().message);
        return true;
    }
    return hash.value() != known->content_hash;
}

std::vector<fs::path> ChangeIndex::get_modified_files(const std::vector<fs::path>& paths) const {
    std::vector<fs::path> modified;
    for (const auto& path : paths) {
        if (is_file_modified(path)) {
            modified.push_back(path);
        }
    }
    spdlog::info("[ChangeIndex] {} of {} files need indexing", modified.size(), paths.size());
    return modified;
}

bool ChangeIndex::update_file_info(const fs::path& path, std::size_t chunk_count) {
    const auto mtime = modified_time_ms(path);
    auto hash = chunking::sha256_file(path);
    if (!mtime || hash.is_error()) {
        spdlog::warn("[ChangeIndex] cannot record {}: file unreadable", path.string());
        return false;
    }

    FileFingerprint entry;
    entry.file_path = key_for(path);
    entry.content_hash = std::move(hash.value());
    entry.last_modified_ms = *mtime;
    entry.known_chunk_count = chunk_count;
    entry.indexed_at = std::chrono::system_clock::now();

    {
        std::lock_guard lock(mutex_);
        entries_[entry.file_path] = entry;
    }
    if (writer_) {
        writer_->mark_dirty();
    }
    return true;
}

void ChangeIndex::remove_file_info(const fs::path& path) {
    bool removed = false;
    {
        std::lock_guard lock(mutex_);
        removed = entries_.erase(key_for(path)) > 0;
    }
    if (removed && writer_) {
        writer_->mark_dirty();
    }
}

std::size_t ChangeIndex::cleanup() {
    std::size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            std::error_code ec;
            if (!fs::exists(it->first, ec) || ec) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        spdlog::info("[ChangeIndex] removed {} entries for deleted files", removed);
        if (writer_) {
            writer_->mark_dirty();
        }
    }
    return removed;
}

ChangeIndexStats ChangeIndex::stats() const {
    ChangeIndexStats stats;
    std::lock_guard lock(mutex_);
    stats.total_files = entries_.size();
    for (const auto& [_, entry] : entries_) {
        stats.total_chunks += entry.known_chunk_count;
        if (!stats.last_update || entry.indexed_at > *stats.last_update) {
            stats.last_update = entry.indexed_at;
        }
    }
    return stats;
}

void ChangeIndex::flush() {
    if (writer_) {
        writer_->flush_now();
    }
}

void ChangeIndex::load() {
    const auto document = load_json_object(file_path_);

    std::lock_guard lock(mutex_);
    for (const auto& [key, value] : document.items()) {
        if (!value.is_object()) {
            continue;
        }
        FileFingerprint entry;
        entry.file_path = key;
        try {
            entry.content_hash = value.value("content_hash", std::string());
            entry.last_modified_ms = value.value("last_modified", std::int64_t{0});
            entry.known_chunk_count = value.value("chunk_count", std::size_t{0});
            entry.indexed_at = from_epoch_ms(value.value("indexed_at", std::int64_t{0}));
        } catch (const nlohmann::json::exception& e) {
            // The file is then treated as modified and re-indexed
            spdlog::warn("[ChangeIndex] skipping malformed entry {}: {}", key, e.what());
            continue;
        }
        entries_.emplace(key, std::move(entry));
    }
    spdlog::info("[ChangeIndex] loaded {} entries from {}", entries_.size(), file_path_.string());
}

void ChangeIndex::save() {
    nlohmann::json document = nlohmann::json::object();
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            document[key] = {
                {"content_hash", entry.content_hash},
                {"last_modified", entry.last_modified_ms},
                {"chunk_count", entry.known_chunk_count},
                {"indexed_at", to_epoch_ms(entry.indexed_at)},
            };
        }
    }

    auto result = write_json_atomic(file_path_, document);
    if (result.is_error()) {
        spdlog::error("[ChangeIndex] save failed: {}", result.error().message);
        return;
    }
    spdlog::debug("[ChangeIndex] saved {} entries", document.size());
}

} // namespace ingest::store
