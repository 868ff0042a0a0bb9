/**
 * @file dedup_cache.hpp
 * @brief Persistent record of chunk fingerprints already delivered
 *
 * WHY THIS FILE EXISTS:
 * Re-indexing a workspace resends mostly identical chunks. The cache lets the
 * orchestrator skip any chunk whose fingerprint was delivered before, with no
 * network call.
 *
 * WHAT IT DOES:
 * - has / get / set / erase / clear over fingerprint -> CacheEntry
 * - Entries older than the expiry read as absent and are purged
 * - Oldest entries are evicted before a new one is admitted at capacity
 * - Delivery claims: claim() hands one caller the right to deliver a
 *   fingerprint; concurrent callers wait and then see that caller's outcome
 * - Write-behind persistence through a DebouncedWriter to chunk-cache.json
 *
 * THREAD SAFETY:
 * Every public method is safe to call concurrently.
 *
 * EXAMPLE:
 * DedupCache cache({cache_dir});
 * if (cache.claim(fp, token) == ClaimStatus::Acquired) {
 *     auto result = deliver(chunk);
 *     cache.finish_claim(fp, result.success ? result.external_id : std::nullopt);
 * }
 */

#pragma once

#include "ingest/core/cancellation.hpp"
#include "ingest/store/debounced_writer.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace ingest::store {

struct CacheEntry {
    std::string fingerprint;
    bool exists = true;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::string external_id;
};

struct DedupCacheOptions {
    std::filesystem::path directory;             ///< Empty = memory only
    std::size_t max_entries = 10000;
    std::chrono::milliseconds expiry = std::chrono::hours(24);
    std::chrono::milliseconds flush_delay{5000};
};

enum class ClaimStatus {
    Acquired,          ///< Caller must deliver, then call finish_claim()
    AlreadyDelivered,  ///< A valid entry exists; skip the chunk
    Cancelled          ///< Token fired while waiting on another deliverer
};

class DedupCache {
public:
    static constexpr const char* kFileName = "chunk-cache.json";

    explicit DedupCache(DedupCacheOptions options);
    ~DedupCache();

    DedupCache(const DedupCache&) = delete;
    DedupCache& operator=(const DedupCache&) = delete;

    bool has(const std::string& fingerprint);

    std::optional<CacheEntry> get(const std::string& fingerprint);

    void set(const std::string& fingerprint, CacheEntry entry);

    void erase(const std::string& fingerprint);

    void clear();

    std::size_t size() const;

    /**
     * @brief Drop every expired entry
     *
     * RETURNS: Number of entries removed
     */
    std::size_t cleanup();

    /// Write the store now instead of waiting for the debounce
    void flush();

    /**
     * @brief Take exclusive delivery rights for a fingerprint
     *
     * BLOCKS: While another caller holds the claim
     */
    ClaimStatus claim(const std::string& fingerprint, const CancellationToken& token);

    /**
     * @brief Release a claim
     *
     * PARAMETERS:
     * external_id - Set on successful delivery (records the entry);
     *               std::nullopt on failure (next claimant retries)
     */
    void finish_claim(const std::string& fingerprint, std::optional<std::string> external_id);

    const std::filesystem::path& file_path() const noexcept { return file_path_; }

private:
    bool is_expired(const CacheEntry& entry, std::chrono::system_clock::time_point now) const;
    bool has_locked(const std::string& fingerprint, std::chrono::system_clock::time_point now);
    void evict_for_insert_locked();
    void load();
    void save();

    DedupCacheOptions options_;
    std::filesystem::path file_path_;

    mutable std::mutex mutex_;
    std::condition_variable claim_cv_;
    std::unordered_map<std::string, CacheEntry> entries_;
    std::unordered_set<std::string> in_flight_;

    std::unique_ptr<DebouncedWriter> writer_;
};

} // namespace ingest::store
