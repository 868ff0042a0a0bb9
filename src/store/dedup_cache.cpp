#include "ingest/store/dedup_cache.hpp"

#include "ingest/store/json_file.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace ingest::store {
namespace {

constexpr auto kClaimPollInterval = std::chrono::milliseconds(50);

} // namespace

DedupCache::DedupCache(DedupCacheOptions options)
    : options_(std::move(options)) {
    if (!options_.directory.empty()) {
        file_path_ = options_.directory / kFileName;
        load();
        writer_ = std::make_unique<DebouncedWriter>("DedupCache", options_.flush_delay, [this]() { save(); });
    }
}

DedupCache::~DedupCache() {
    if (writer_) {
        writer_->stop();
    }
}

bool DedupCache::is_expired(const CacheEntry& entry, std::chrono::system_clock::time_point now) const {
    return now - entry.timestamp > options_.expiry;
}

bool DedupCache::has_locked(const std::string& fingerprint, std::chrono::system_clock::time_point now) {
    auto it = entries_.find(fingerprint);
    if (it == entries_.end()) {
        return false;
    }
    if (is_expired(it->second, now)) {
        entries_.erase(it);
        if (writer_) {
            writer_->mark_dirty();
        }
        return false;
    }
    return it->second.exists;
}

bool DedupCache::has(const std::string& fingerprint) {
    std::lock_guard lock(mutex_);
    return has_locked(fingerprint, std::chrono::system_clock::now());
}

std::optional<CacheEntry> DedupCache::get(const std::string& fingerprint) {
    std::lock_guard lock(mutex_);
    if (!has_locked(fingerprint, std::chrono::system_clock::now())) {
        return std::nullopt;
    }
    return entries_.at(fingerprint);
}

void DedupCache::evict_for_insert_locked() {
    if (options_.max_entries == 0 || entries_.size() < options_.max_entries) {
        return;
    }

    const std::size_t excess = entries_.size() - options_.max_entries + 1;
    std::vector<std::pair<std::chrono::system_clock::time_point, std::string>> by_age;
    by_age.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        by_age.emplace_back(entry.timestamp, key);
    }
    std::nth_element(by_age.begin(), by_age.begin() + static_cast<std::ptrdiff_t>(excess - 1), by_age.end());
    std::sort(by_age.begin(), by_age.begin() + static_cast<std::ptrdiff_t>(excess));
    for (std::size_t i = 0; i < excess; ++i) {
        entries_.erase(by_age[i].second);
    }
    spdlog::debug("[DedupCache] evicted {} oldest entries", excess);
}

void DedupCache::set(const std::string& fingerprint, CacheEntry entry) {
    {
        std::lock_guard lock(mutex_);
        entry.fingerprint = fingerprint;
        auto it = entries_.find(fingerprint);
        if (it != entries_.end()) {
            it->second = std::move(entry);
        } else {
            evict_for_insert_locked();
            entries_.emplace(fingerprint, std::move(entry));
        }
    }
    if (writer_) {
        writer_->mark_dirty();
    }
}

void DedupCache::erase(const std::string& fingerprint) {
    bool removed = false;
    {
        std::lock_guard lock(mutex_);
        removed = entries_.erase(fingerprint) > 0;
    }
    if (removed && writer_) {
        writer_->mark_dirty();
    }
}

void DedupCache::clear() {
    {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }
    if (writer_) {
        writer_->mark_dirty();
    }
}

std::size_t DedupCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::size_t DedupCache::cleanup() {
    std::size_t removed = 0;
    {
        std::lock_guard lock(mutex_);
        const auto now = std::chrono::system_clock::now();
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_expired(it->second, now)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        spdlog::info("[DedupCache] cleaned up {} expired entries", removed);
        if (writer_) {
            writer_->mark_dirty();
        }
    }
    return removed;
}

void DedupCache::flush() {
    if (writer_) {
        writer_->flush_now();
    }
}

ClaimStatus DedupCache::claim(const std::string& fingerprint, const CancellationToken& token) {
    std::unique_lock lock(mutex_);
    while (true) {
        if (has_locked(fingerprint, std::chrono::system_clock::now())) {
            return ClaimStatus::AlreadyDelivered;
        }
        if (token.is_cancelled()) {
            return ClaimStatus::Cancelled;
        }
        if (in_flight_.insert(fingerprint).second) {
            return ClaimStatus::Acquired;
        }
        claim_cv_.wait_for(lock, kClaimPollInterval);
    }
}

void DedupCache::finish_claim(const std::string& fingerprint, std::optional<std::string> external_id) {
    if (external_id) {
        CacheEntry entry;
        entry.fingerprint = fingerprint;
        entry.exists = true;
        entry.timestamp = std::chrono::system_clock::now();
        entry.external_id = std::move(*external_id);
        set(fingerprint, std::move(entry));
    }
    {
        std::lock_guard lock(mutex_);
        in_flight_.erase(fingerprint);
    }
    claim_cv_.notify_all();
}

void DedupCache::load() {
    const auto document = load_json_object(file_path_);
    const auto now = std::chrono::system_clock::now();
    std::size_t expired = 0;
    std::size_t skipped = 0;

    std::lock_guard lock(mutex_);
    for (const auto& [key, value] : document.items()) {
        if (!value.is_object()) {
            continue;
        }
        CacheEntry entry;
        entry.fingerprint = key;
        try {
            entry.exists = value.value("exists", true);
            entry.timestamp = from_epoch_ms(value.value("timestamp", std::int64_t{0}));
            entry.external_id = value.value("external_id", std::string());
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("[DedupCache] skipping malformed entry {}: {}", key, e.what());
            ++skipped;
            continue;
        }
        if (is_expired(entry, now)) {
            ++expired;
            continue;
        }
        entries_.emplace(key, std::move(entry));
    }
    spdlog::info("[DedupCache] loaded {} entries from {} ({} expired, {} malformed)",
                 entries_.size(), file_path_.string(), expired, skipped);
}

void DedupCache::save() {
    nlohmann::json document = nlohmann::json::object();
    {
        std::lock_guard lock(mutex_);
        for (const auto& [key, entry] : entries_) {
            document[key] = {
                {"hash", entry.fingerprint},
                {"exists", entry.exists},
                {"timestamp", to_epoch_ms(entry.timestamp)},
                {"external_id", entry.external_id},
            };
        }
    }

    auto result = write_json_atomic(file_path_, document);
    if (result.is_error()) {
        spdlog::error("[DedupCache] save failed: {}", result.error().message);
        return;
    }
    spdlog::debug("[DedupCache] saved {} entries to {}", document.size(), file_path_.string());
}

} // namespace ingest::store
