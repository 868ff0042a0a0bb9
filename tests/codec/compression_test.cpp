#include "ingest/codec/compression.hpp"

#include <gtest/gtest.h>

#include <random>
#include <string>

using ingest::codec::CompressionCodec;
using ingest::codec::base64_decode;
using ingest::codec::base64_encode;
using ingest::codec::gzip_compress;
using ingest::codec::gzip_decompress;

namespace {

std::string repetitive_source(std::size_t size) {
    std::string text;
    while (text.size() < size) {
        text += "export const handler = (event) => process(event.body);\n";
    }
    text.resize(size);
    return text;
}

std::string random_bytes(std::size_t size) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> byte(0, 255);
    std::string data(size, '\0');
    for (auto& c : data) {
        c = static_cast<char>(byte(rng));
    }
    return data;
}

} // namespace

TEST(CompressionCodec, SkipsContentBelowThreshold) {
    CompressionCodec codec(1024);

    EXPECT_FALSE(codec.compress_if_beneficial(repetitive_source(1023)).has_value());
    EXPECT_TRUE(codec.compress_if_beneficial(repetitive_source(1024)).has_value());
}

TEST(CompressionCodec, CompressesRepetitiveContent) {
    CompressionCodec codec(1024);
    const auto content = repetitive_source(20000);

    auto result = codec.compress_if_beneficial(content);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->original_size, content.size());
    EXPECT_EQ(result->compressed_size, result->compressed.size());
    EXPECT_LT(result->ratio, 0.9);

    auto restored = gzip_decompress(result->compressed);
    ASSERT_TRUE(restored.is_ok()) << restored.error().message;
    EXPECT_EQ(restored.value(), content);
}

TEST(CompressionCodec, LeavesIncompressibleContentAlone) {
    CompressionCodec codec(100);

    EXPECT_FALSE(codec.compress_if_beneficial(random_bytes(4096)).has_value());
}

TEST(Gzip, OutputCarriesGzipMagic) {
    auto compressed = gzip_compress("hello hello hello");

    ASSERT_TRUE(compressed.is_ok());
    ASSERT_GE(compressed.value().size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(compressed.value()[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(compressed.value()[1]), 0x8b);
}

TEST(Gzip, RejectsGarbageAndTruncatedInput) {
    EXPECT_TRUE(gzip_decompress("").is_error());
    EXPECT_TRUE(gzip_decompress("definitely not gzip").is_error());

    auto compressed = gzip_compress(repetitive_source(5000));
    ASSERT_TRUE(compressed.is_ok());
    const auto truncated = compressed.value().substr(0, compressed.value().size() / 2);
    EXPECT_TRUE(gzip_decompress(truncated).is_error());
}

TEST(Base64, KnownVectors) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("foobar"), "Zm9vYmFy");

    auto decoded = base64_decode("Zm8=");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), "fo");
}

TEST(Base64, BinaryDataSurvives) {
    const auto data = random_bytes(1000);

    auto decoded = base64_decode(base64_encode(data));

    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), data);
}

TEST(Base64, RejectsMalformedInput) {
    EXPECT_TRUE(base64_decode("abc").is_error());
    EXPECT_TRUE(base64_decode("ab!?").is_error());
}
