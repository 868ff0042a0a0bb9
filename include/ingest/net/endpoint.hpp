#pragma once

#include "ingest/core/result.hpp"

#include <cstdint>
#include <string>

namespace ingest::net {

/**
 * @brief Parsed "http://host[:port][/base]" target
 */
struct Endpoint {
    std::string host;
    std::uint16_t port = 80;
    std::string base_path;   ///< No trailing slash; empty for the root

    /// Value for the Host header
    std::string host_header() const;

    /// base_path + path, e.g. "/api" + "/health"
    std::string target(const std::string& path) const;

    std::string to_string() const;
};

Result<Endpoint> parse_endpoint(const std::string& url);

} // namespace ingest::net
