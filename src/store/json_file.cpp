#include "ingest/store/json_file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace ingest::store {

nlohmann::json load_json_object(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return nlohmann::json::object();
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        spdlog::warn("[Store] cannot open {}, starting empty", path.string());
        return nlohmann::json::object();
    }

    auto document = nlohmann::json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::warn("[Store] {} is corrupt, starting empty", path.string());
        return nlohmann::json::object();
    }
    return document;
}

Result<void> write_json_atomic(const fs::path& path, const nlohmann::json& document) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Err<void>(ErrorCode::Persistence,
                             "Failed to create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = path;
    temp += ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::Persistence, "Failed to open " + temp.string() + " for writing");
        }
        output << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        output.flush();
        if (!output) {
            return Err<void>(ErrorCode::Persistence, "Failed to write " + temp.string());
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Err<void>(ErrorCode::Persistence, "Failed to replace " + path.string());
    }
    return Ok();
}

std::int64_t to_epoch_ms(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_epoch_ms(std::int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace ingest::store
