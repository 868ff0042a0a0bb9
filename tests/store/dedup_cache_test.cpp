#include "ingest/store/dedup_cache.hpp"

#include "support/test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <thread>

namespace fs = std::filesystem;
using ingest::CancellationToken;
using ingest::store::CacheEntry;
using ingest::store::ClaimStatus;
using ingest::store::DedupCache;
using ingest::store::DedupCacheOptions;

namespace {

CacheEntry entry_at(std::chrono::system_clock::time_point when, const std::string& id = "ext") {
    CacheEntry entry;
    entry.timestamp = when;
    entry.external_id = id;
    return entry;
}

} // namespace

class DedupCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = ingest::testing::create_temp_dir("ingest_cache_test_");
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    DedupCacheOptions options() const {
        DedupCacheOptions opts;
        opts.directory = root_;
        opts.flush_delay = std::chrono::milliseconds(20);
        return opts;
    }

    fs::path root_;
};

TEST_F(DedupCacheTest, SetHasGetErase) {
    DedupCache cache(options());

    EXPECT_FALSE(cache.has("fp1"));
    cache.set("fp1", entry_at(std::chrono::system_clock::now(), "chunk-9"));

    EXPECT_TRUE(cache.has("fp1"));
    auto entry = cache.get("fp1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->external_id, "chunk-9");
    EXPECT_EQ(entry->fingerprint, "fp1");

    cache.erase("fp1");
    EXPECT_FALSE(cache.has("fp1"));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(DedupCacheTest, ExpiredEntriesReadAsAbsent) {
    auto opts = options();
    opts.expiry = std::chrono::hours(1);
    DedupCache cache(opts);

    const auto now = std::chrono::system_clock::now();
    cache.set("old", entry_at(now - std::chrono::hours(2)));
    cache.set("fresh", entry_at(now));

    EXPECT_FALSE(cache.has("old"));
    EXPECT_TRUE(cache.has("fresh"));
    // Reading the expired entry purged it
    EXPECT_EQ(cache.size(), 1u);

    cache.set("old2", entry_at(now - std::chrono::hours(3)));
    EXPECT_EQ(cache.cleanup(), 1u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(DedupCacheTest, EvictsOldestAtCapacity) {
    auto opts = options();
    opts.max_entries = 3;
    DedupCache cache(opts);

    const auto now = std::chrono::system_clock::now();
    cache.set("a", entry_at(now - std::chrono::minutes(3)));
    cache.set("b", entry_at(now - std::chrono::minutes(2)));
    cache.set("c", entry_at(now - std::chrono::minutes(1)));
    cache.set("d", entry_at(now));

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.has("a"));
    EXPECT_TRUE(cache.has("b"));
    EXPECT_TRUE(cache.has("d"));

    // Overwriting an existing key never evicts
    cache.set("d", entry_at(now, "updated"));
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.get("d")->external_id, "updated");
}

TEST_F(DedupCacheTest, PersistsAcrossInstances) {
    {
        DedupCache cache(options());
        cache.set("fp-persist", entry_at(std::chrono::system_clock::now(), "remote-1"));
        cache.flush();
    }

    EXPECT_TRUE(fs::exists(root_ / DedupCache::kFileName));

    DedupCache reopened(options());
    auto entry = reopened.get("fp-persist");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->external_id, "remote-1");
}

TEST_F(DedupCacheTest, DestructorFlushesPendingWrites) {
    {
        auto opts = options();
        opts.flush_delay = std::chrono::hours(1);
        DedupCache cache(opts);
        cache.set("fp-late", entry_at(std::chrono::system_clock::now()));
    }

    DedupCache reopened(options());
    EXPECT_TRUE(reopened.has("fp-late"));
}

TEST_F(DedupCacheTest, CorruptFileStartsEmpty) {
    ingest::testing::write_file(root_ / DedupCache::kFileName, "{{{ definitely broken");

    DedupCache cache(options());

    EXPECT_EQ(cache.size(), 0u);
    cache.set("fp", entry_at(std::chrono::system_clock::now()));
    EXPECT_TRUE(cache.has("fp"));
}

TEST_F(DedupCacheTest, CorruptFieldTypesAreSkipped) {
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    ingest::testing::write_file(root_ / DedupCache::kFileName,
        "{\"stale\": {\"exists\": true, \"timestamp\": \"yesterday\"},"
        " \"odd\": {\"exists\": \"yes\", \"timestamp\": " + std::to_string(now_ms) + "},"
        " \"good\": {\"exists\": true, \"timestamp\": " + std::to_string(now_ms) +
        ", \"external_id\": \"ext-9\"}}");

    std::unique_ptr<DedupCache> cache;
    ASSERT_NO_THROW(cache = std::make_unique<DedupCache>(options()));

    EXPECT_EQ(cache->size(), 1u);
    EXPECT_FALSE(cache->has("stale"));
    EXPECT_FALSE(cache->has("odd"));
    ASSERT_TRUE(cache->has("good"));
    EXPECT_EQ(cache->get("good")->external_id, "ext-9");
}

TEST(DedupCacheClaims, SecondClaimantWaitsAndSeesDelivery) {
    DedupCache cache(DedupCacheOptions{});
    CancellationToken token;

    ASSERT_EQ(cache.claim("fp", token), ClaimStatus::Acquired);

    auto waiter = std::async(std::launch::async, [&]() { return cache.claim("fp", token); });
    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    cache.finish_claim("fp", std::string("ext-1"));

    EXPECT_EQ(waiter.get(), ClaimStatus::AlreadyDelivered);
    EXPECT_EQ(cache.get("fp")->external_id, "ext-1");
}

TEST(DedupCacheClaims, FailedDeliveryHandsClaimToNextCaller) {
    DedupCache cache(DedupCacheOptions{});
    CancellationToken token;

    ASSERT_EQ(cache.claim("fp", token), ClaimStatus::Acquired);
    auto waiter = std::async(std::launch::async, [&]() { return cache.claim("fp", token); });

    cache.finish_claim("fp", std::nullopt);

    EXPECT_EQ(waiter.get(), ClaimStatus::Acquired);
    EXPECT_FALSE(cache.has("fp"));
}

TEST(DedupCacheClaims, CancelledWhileWaiting) {
    DedupCache cache(DedupCacheOptions{});
    CancellationToken owner;
    CancellationToken waiter_token;

    ASSERT_EQ(cache.claim("fp", owner), ClaimStatus::Acquired);
    auto waiter = std::async(std::launch::async, [&]() { return cache.claim("fp", waiter_token); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    waiter_token.cancel("stop");

    EXPECT_EQ(waiter.get(), ClaimStatus::Cancelled);
    cache.finish_claim("fp", std::nullopt);
}
