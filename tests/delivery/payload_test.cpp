#include "ingest/delivery/payload.hpp"

#include <gtest/gtest.h>

#include <regex>

using ingest::chunking::Chunk;
using ingest::codec::CompressionCodec;
using ingest::delivery::PayloadContext;
using ingest::delivery::build_chunk_payload;
using ingest::delivery::external_id_from_response;
using ingest::delivery::make_job_id;
using ingest::delivery::make_user_id;
using ingest::delivery::serialize_payload;

namespace {

Chunk sample_chunk(const std::string& content) {
    Chunk chunk;
    chunk.content = content;
    chunk.index = 3;
    chunk.line_count = 1;
    chunk.character_count = content.size();
    chunk.has_code = true;
    chunk.language = "Python";
    chunk.fingerprint = std::string(64, 'a');
    return chunk;
}

PayloadContext sample_context() {
    return PayloadContext{"ingest_ws_abc", "ws", "job_1_x", "src/main.py", ""};
}

} // namespace

TEST(ChunkPayload, CarriesMetadataAndContent) {
    auto payload = build_chunk_payload(sample_chunk("def f(): pass"), sample_context(), std::nullopt);

    EXPECT_EQ(payload["job_type"], "file_processing");
    EXPECT_EQ(payload["user_id"], "ingest_ws_abc");
    EXPECT_EQ(payload["content"], "def f(): pass");
    EXPECT_FALSE(payload.contains("compressed"));

    const auto& metadata = payload["metadata"];
    EXPECT_EQ(metadata["file_path"], "src/main.py");
    EXPECT_EQ(metadata["chunk_index"], 3);
    EXPECT_EQ(metadata["content_length"], 13);
    EXPECT_EQ(metadata["hash"], std::string(64, 'a'));
    EXPECT_EQ(metadata["source"], "vscode-extension");
    EXPECT_EQ(metadata["workspace_id"], "ws");
    EXPECT_EQ(metadata["job_id"], "job_1_x");
    EXPECT_FALSE(metadata.contains("webhook_url"));
    EXPECT_TRUE(std::regex_match(metadata["timestamp"].get<std::string>(),
                                 std::regex(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")));

    const auto& chunk_metadata = payload["chunk_metadata"];
    EXPECT_EQ(chunk_metadata["line_count"], 1);
    EXPECT_EQ(chunk_metadata["has_code"], true);
    EXPECT_EQ(chunk_metadata["language"], "Python");
    EXPECT_EQ(chunk_metadata["index"], 3);
}

TEST(ChunkPayload, WebhookUrlIncludedWhenSet) {
    auto context = sample_context();
    context.webhook_url = "http://localhost:3001/webhook/job-complete";

    auto payload = build_chunk_payload(sample_chunk("x"), context, std::nullopt);

    EXPECT_EQ(payload["metadata"]["webhook_url"], context.webhook_url);
}

TEST(ChunkPayload, CompressedContentIsBase64Gzip) {
    std::string content;
    for (int i = 0; i < 200; ++i) {
        content += "print('line')\n";
    }
    auto compression = CompressionCodec(1024).compress_if_beneficial(content);
    ASSERT_TRUE(compression.has_value());

    auto payload = build_chunk_payload(sample_chunk(content), sample_context(), compression);

    EXPECT_EQ(payload["compressed"], true);
    EXPECT_EQ(payload["metadata"]["content_length"], content.size());
    auto raw = ingest::codec::base64_decode(payload["content"].get<std::string>());
    ASSERT_TRUE(raw.is_ok());
    auto restored = ingest::codec::gzip_decompress(raw.value());
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(restored.value(), content);
}

TEST(ChunkPayload, InvalidUtf8IsReplacedOnSerialize) {
    auto payload = build_chunk_payload(sample_chunk("bad \xC3 byte"), sample_context(), std::nullopt);

    std::string body;
    ASSERT_NO_THROW(body = serialize_payload(payload));
    EXPECT_NE(body.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST(ExternalId, PrefersChunkIdThenJobId) {
    EXPECT_EQ(external_id_from_response(R"({"chunk_id": "c-1", "job_id": "j-1"})").value(), "c-1");
    EXPECT_EQ(external_id_from_response(R"({"job_id": "j-1"})").value(), "j-1");
    EXPECT_EQ(external_id_from_response(R"({"chunk_id": 17})").value(), "17");
    EXPECT_FALSE(external_id_from_response(R"({"status": "ok"})").has_value());
    EXPECT_FALSE(external_id_from_response("accepted").has_value());
    EXPECT_FALSE(external_id_from_response("").has_value());
}

TEST(Identifiers, JobAndUserIdShapes) {
    EXPECT_TRUE(std::regex_match(make_job_id(), std::regex(R"(job_\d+_[0-9a-z]{9})")));
    EXPECT_NE(make_job_id(), make_job_id());

    const auto user = make_user_id("my-workspace.v2");
    EXPECT_TRUE(std::regex_match(user, std::regex(R"(ingest_my_workspace_v2_[0-9a-z]{8})"))) << user;
}
