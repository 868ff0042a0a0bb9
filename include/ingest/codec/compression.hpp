#pragma once

#include "ingest/core/result.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace ingest::codec {

struct CompressionResult {
    std::string compressed;      ///< gzip bytes
    std::size_t original_size = 0;
    std::size_t compressed_size = 0;
    double ratio = 1.0;          ///< compressed / original
};

/**
 * @brief gzip only when the payload is large enough and actually shrinks
 *
 * Content shorter than the threshold, or whose gzip output is more than 90%
 * of the input size, is left alone (std::nullopt).
 */
class CompressionCodec {
public:
    static constexpr std::size_t kDefaultThreshold = 1024;
    static constexpr double kMaxUsefulRatio = 0.9;

    explicit CompressionCodec(std::size_t threshold = kDefaultThreshold);

    std::optional<CompressionResult> compress_if_beneficial(const std::string& content) const;

    std::size_t threshold() const noexcept { return threshold_; }

private:
    std::size_t threshold_;
};

Result<std::string> gzip_compress(const std::string& data);

Result<std::string> gzip_decompress(const std::string& data);

std::string base64_encode(const std::string& data);

Result<std::string> base64_decode(const std::string& encoded);

} // namespace ingest::codec
