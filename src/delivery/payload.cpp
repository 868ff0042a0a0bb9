#include "ingest/delivery/payload.hpp"

#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace ingest::delivery {
namespace {

std::string random_base36(std::size_t length) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);

    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(kAlphabet[pick(rng)]);
    }
    return out;
}

} // namespace

nlohmann::json build_chunk_payload(const chunking::Chunk& chunk,
                                   const PayloadContext& context,
                                   const std::optional<codec::CompressionResult>& compression) {
    nlohmann::json metadata = {
        {"file_path", context.file_path},
        {"chunk_index", chunk.index},
        {"content_length", chunk.content.size()},
        {"hash", chunk.fingerprint},
        {"timestamp", iso8601_now()},
        {"source", kPayloadSource},
        {"workspace_id", context.workspace_id},
        {"job_id", context.job_id}
    };
    if (!context.webhook_url.empty()) {
        metadata["webhook_url"] = context.webhook_url;
    }

    nlohmann::json payload = {
        {"job_type", "file_processing"},
        {"user_id", context.user_id},
        {"metadata", std::move(metadata)},
        {"chunk_metadata", {
            {"line_count", chunk.line_count},
            {"character_count", chunk.character_count},
            {"has_code", chunk.has_code},
            {"language", chunk.language},
            {"index", chunk.index},
            {"hash", chunk.fingerprint}
        }}
    };

    if (compression) {
        payload["content"] = codec::base64_encode(compression->compressed);
        payload["compressed"] = true;
    } else {
        payload["content"] = chunk.content;
    }
    return payload;
}

std::string serialize_payload(const nlohmann::json& payload) {
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<std::string> external_id_from_response(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"chunk_id", "job_id"}) {
        auto it = parsed.find(key);
        if (it == parsed.end()) {
            continue;
        }
        if (it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
        if (it->is_number()) {
            return it->dump();
        }
    }
    return std::nullopt;
}

std::string make_job_id() {
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "job_" + std::to_string(now_ms) + "_" + random_base36(9);
}

std::string make_user_id(const std::string& workspace_id) {
    std::string id = "ingest_" + (workspace_id.empty() ? std::string("default") : workspace_id)
                     + "_" + random_base36(8);
    for (char& c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    return id;
}

std::string iso8601_now() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

} // namespace ingest::delivery
