#include "ingest/core/config.hpp"
#include "ingest/core/cancellation.hpp"

#include "support/test_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;
using ingest::CancellationToken;
using ingest::ErrorCode;
using ingest::core::PipelineConfig;
using ingest::core::config_from_json;
using ingest::core::config_to_json;
using ingest::core::load_config;
using ingest::core::validate_config;

TEST(PipelineConfig, DefaultsAreValid) {
    PipelineConfig config;

    EXPECT_TRUE(validate_config(config).empty());
    EXPECT_EQ(config.max_chunk_size, 1000u);
    EXPECT_EQ(config.effective_batch_size(), 5u);
    EXPECT_EQ(config.effective_chunk_concurrency(), 2u);
    EXPECT_TRUE(config.webhook_url().empty());
}

TEST(PipelineConfig, EffectiveValues) {
    PipelineConfig config;

    config.batch_size = 0;
    EXPECT_EQ(config.effective_batch_size(), 1u);
    config.batch_size = 50;
    EXPECT_EQ(config.effective_batch_size(), 10u);

    config.batch_size = 3;
    EXPECT_EQ(config.effective_chunk_concurrency(), 1u);
    config.chunk_concurrency = 4;
    EXPECT_EQ(config.effective_chunk_concurrency(), 4u);

    config.url = "http://localhost:8000///";
    EXPECT_EQ(config.base_url(), "http://localhost:8000");

    config.enable_webhooks = true;
    config.webhook_port = 4000;
    EXPECT_EQ(config.webhook_url(), "http://localhost:4000/webhook/job-complete");
}

TEST(PipelineConfig, ParsesJsonWithNestedPerformance) {
    nlohmann::json document = {
        {"url", "http://indexer:9000"},
        {"api_key", "secret"},
        {"max_chunk_size", 2000},
        {"batch_size", 2},
        {"workspace_id", "ws-1"},
        {"performance", {
            {"enable_compression", false},
            {"coalescing_window_ms", 250},
            {"max_cache_size", 500},
        }},
    };

    auto config = config_from_json(document);

    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().url, "http://indexer:9000");
    EXPECT_EQ(config.value().api_key, "secret");
    EXPECT_EQ(config.value().max_chunk_size, 2000u);
    EXPECT_EQ(config.value().workspace_id, "ws-1");
    EXPECT_FALSE(config.value().performance.enable_compression);
    EXPECT_EQ(config.value().performance.coalescing_window, std::chrono::milliseconds(250));
    EXPECT_EQ(config.value().performance.max_cache_size, 500u);
    // Untouched keys keep their defaults
    EXPECT_TRUE(config.value().performance.enable_chunk_deduplication);
}

TEST(PipelineConfig, JsonRoundTripPreservesValues) {
    PipelineConfig original;
    original.url = "http://example:1234";
    original.performance.max_connection_pool_size = 7;
    original.performance.cache_expiry_hours = 48.0;

    auto parsed = config_from_json(config_to_json(original));

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().url, original.url);
    EXPECT_EQ(parsed.value().performance.max_connection_pool_size, 7u);
    EXPECT_DOUBLE_EQ(parsed.value().performance.cache_expiry_hours, 48.0);
}

TEST(PipelineConfig, RejectsOutOfRangeValues) {
    PipelineConfig config;
    config.performance.compression_threshold = 50;
    config.performance.max_connection_pool_size = 21;
    config.performance.coalescing_window = std::chrono::milliseconds(5);
    config.performance.cache_expiry_hours = 200.0;
    config.performance.max_cache_size = 10;

    auto errors = validate_config(config);
    EXPECT_EQ(errors.size(), 5u);

    auto parsed = config_from_json({{"url", "ftp://nope"}});
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}

TEST(PipelineConfig, ChunkConcurrencyIsBounded) {
    PipelineConfig config;
    config.chunk_concurrency = 100000;
    EXPECT_EQ(config.effective_chunk_concurrency(), 10u);

    auto huge = config_from_json({{"chunk_concurrency", 100000}});
    ASSERT_TRUE(huge.is_error());
    EXPECT_NE(huge.error().message.find("chunk_concurrency"), std::string::npos);

    // -1 wraps to SIZE_MAX in an unsigned field
    EXPECT_TRUE(config_from_json({{"chunk_concurrency", -1}}).is_error());

    auto ok = config_from_json({{"chunk_concurrency", 10}});
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().effective_chunk_concurrency(), 10u);
}

TEST(PipelineConfig, RejectsWrongTypes) {
    EXPECT_TRUE(config_from_json(nlohmann::json::array()).is_error());
    EXPECT_TRUE(config_from_json({{"batch_size", "five"}}).is_error());
    EXPECT_TRUE(config_from_json({{"performance", 3}}).is_error());
}

class LoadConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = ingest::testing::create_temp_dir("ingest_config_test_");
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
};

TEST_F(LoadConfigTest, LoadsFile) {
    const auto path = root_ / "config.json";
    ingest::testing::write_file(path, R"({"url": "http://localhost:7000", "batch_size": 8})");

    auto config = load_config(path);

    ASSERT_TRUE(config.is_ok()) << config.error().message;
    EXPECT_EQ(config.value().base_url(), "http://localhost:7000");
    EXPECT_EQ(config.value().effective_batch_size(), 8u);
}

TEST_F(LoadConfigTest, MissingOrCorruptFileIsAnError) {
    EXPECT_TRUE(load_config(root_ / "absent.json").is_error());

    const auto path = root_ / "broken.json";
    ingest::testing::write_file(path, "{ not json");
    auto config = load_config(path);
    ASSERT_TRUE(config.is_error());
    EXPECT_NE(config.error().message.find("not valid JSON"), std::string::npos);
}

TEST(CancellationToken, CancelIsSharedAndKeepsFirstReason) {
    CancellationToken token;
    CancellationToken copy = token;

    EXPECT_FALSE(copy.is_cancelled());
    token.cancel("user pressed stop");
    token.cancel("second");

    EXPECT_TRUE(copy.is_cancelled());
    EXPECT_EQ(copy.reason(), "user pressed stop");
}

TEST(CancellationToken, WaitForWakesOnCancel) {
    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel("stop");
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.wait_for(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    canceller.join();

    CancellationToken idle;
    EXPECT_FALSE(idle.wait_for(std::chrono::milliseconds(5)));
}
