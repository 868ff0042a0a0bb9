#include "ingest/codec/compression.hpp"

#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include <array>
#include <vector>

namespace ingest::codec {
namespace {

constexpr std::size_t kStreamBuffer = 16 * 1024;
constexpr int kGzipWindowBits = 15 + 16;

} // namespace

CompressionCodec::CompressionCodec(std::size_t threshold) : threshold_(threshold) {}

std::optional<CompressionResult> CompressionCodec::compress_if_beneficial(const std::string& content) const {
    if (content.size() < threshold_) {
        return std::nullopt;
    }

    auto compressed = gzip_compress(content);
    if (compressed.is_error()) {
        spdlog::warn("[Codec] gzip failed, sending uncompressed: {}", compressed.error().message);
        return std::nullopt;
    }

    CompressionResult result;
    result.original_size = content.size();
    result.compressed_size = compressed.value().size();
    result.ratio = static_cast<double>(result.compressed_size) / static_cast<double>(result.original_size);
    if (result.ratio > kMaxUsefulRatio) {
        return std::nullopt;
    }
    result.compressed = std::move(compressed.value());
    return result;
}

Result<std::string> gzip_compress(const std::string& data) {
    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    int ret = deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        return Err<std::string>(ErrorCode::InvalidArgument, "deflateInit2 failed: " + std::to_string(ret));
    }

    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));

    std::string output;
    std::array<char, kStreamBuffer> buffer{};
    do {
        strm.avail_out = static_cast<uInt>(buffer.size());
        strm.next_out = reinterpret_cast<Bytef*>(buffer.data());
        ret = deflate(&strm, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            return Err<std::string>(ErrorCode::InvalidArgument, "deflate failed: Z_STREAM_ERROR");
        }
        output.append(buffer.data(), buffer.size() - strm.avail_out);
    } while (strm.avail_out == 0);

    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        return Err<std::string>(ErrorCode::InvalidArgument, "deflate did not finish: " + std::to_string(ret));
    }
    return Ok(std::move(output));
}

Result<std::string> gzip_decompress(const std::string& data) {
    if (data.empty()) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Empty compressed data");
    }

    z_stream strm{};
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;

    int ret = inflateInit2(&strm, kGzipWindowBits);
    if (ret != Z_OK) {
        return Err<std::string>(ErrorCode::InvalidArgument, "inflateInit2 failed: " + std::to_string(ret));
    }

    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));

    std::string output;
    std::array<char, kStreamBuffer> buffer{};
    do {
        strm.avail_out = static_cast<uInt>(buffer.size());
        strm.next_out = reinterpret_cast<Bytef*>(buffer.data());
        ret = inflate(&strm, Z_NO_FLUSH);
        switch (ret) {
            case Z_NEED_DICT:
            case Z_DATA_ERROR:
            case Z_MEM_ERROR:
            case Z_STREAM_ERROR:
                inflateEnd(&strm);
                return Err<std::string>(ErrorCode::InvalidArgument, "inflate failed: " + std::to_string(ret));
            default:
                break;
        }
        output.append(buffer.data(), buffer.size() - strm.avail_out);
    } while (ret != Z_STREAM_END && strm.avail_out == 0);

    inflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Truncated gzip stream");
    }
    return Ok(std::move(output));
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) {
        return {};
    }
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int written = ::EVP_EncodeBlock(out.data(),
                                          reinterpret_cast<const unsigned char*>(data.data()),
                                          static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

Result<std::string> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return Ok(std::string());
    }
    if (encoded.size() % 4 != 0) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Base64 input length is not a multiple of 4");
    }

    std::vector<unsigned char> out(3 * (encoded.size() / 4) + 1);
    const int written = ::EVP_DecodeBlock(out.data(),
                                          reinterpret_cast<const unsigned char*>(encoded.data()),
                                          static_cast<int>(encoded.size()));
    if (written < 0) {
        return Err<std::string>(ErrorCode::InvalidArgument, "Invalid base64 input");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    std::size_t length = static_cast<std::size_t>(written);
    if (encoded[encoded.size() - 1] == '=') --length;
    if (encoded[encoded.size() - 2] == '=') --length;
    return Ok(std::string(reinterpret_cast<const char*>(out.data()), length));
}

} // namespace ingest::codec
