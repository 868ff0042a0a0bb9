#include "ingest/chunking/fingerprint.hpp"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace ingest::chunking {
namespace {

using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;

std::string to_hex(const unsigned char* digest, unsigned int length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace

std::string sha256_hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (::EVP_Digest(data.data(), data.size(), digest.data(), &length, ::EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return to_hex(digest.data(), length);
}

Result<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::Persistence, "Failed to open file for hashing: " + path.string());
    }

    DigestCtxPtr ctx(::EVP_MD_CTX_new(), ::EVP_MD_CTX_free);
    if (!ctx || ::EVP_DigestInit_ex(ctx.get(), ::EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(ErrorCode::Persistence, "Failed to initialise SHA-256 context");
    }

    char buffer[8192];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (::EVP_DigestUpdate(ctx.get(), buffer, count) != 1) {
            return Err<std::string>(ErrorCode::Persistence, "SHA-256 update failed for " + path.string());
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorCode::Persistence, "Read error while hashing " + path.string());
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (::EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        return Err<std::string>(ErrorCode::Persistence, "SHA-256 finalisation failed for " + path.string());
    }
    return Ok(to_hex(digest.data(), length));
}

std::string fingerprint(const std::string& file_path, std::size_t index, const std::string& content) {
    std::string material;
    material.reserve(file_path.size() + content.size() + 24);
    material.append(file_path).append(":").append(std::to_string(index)).append(":").append(content);
    return sha256_hex(material);
}

} // namespace ingest::chunking
