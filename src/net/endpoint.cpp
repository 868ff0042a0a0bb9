#include "ingest/net/endpoint.hpp"

#include <algorithm>
#include <cctype>

namespace ingest::net {

std::string Endpoint::host_header() const {
    return port == 80 ? host : host + ":" + std::to_string(port);
}

std::string Endpoint::target(const std::string& path) const {
    if (path.empty() || path.front() != '/') {
        return base_path + "/" + path;
    }
    return base_path + path;
}

std::string Endpoint::to_string() const {
    return "http://" + host_header() + base_path;
}

Result<Endpoint> parse_endpoint(const std::string& url) {
    const std::string scheme = "http://";
    if (url.rfind(scheme, 0) != 0) {
        return Err<Endpoint>(ErrorCode::InvalidArgument, "Only http:// endpoints are supported: " + url);
    }

    std::string rest = url.substr(scheme.size());
    Endpoint endpoint;

    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        endpoint.base_path = rest.substr(slash);
        while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
            endpoint.base_path.pop_back();
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        const std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Err<Endpoint>(ErrorCode::InvalidArgument, "Invalid port in endpoint: " + url);
        }
        const unsigned long value = std::stoul(port);
        if (value == 0 || value > 65535) {
            return Err<Endpoint>(ErrorCode::InvalidArgument, "Port out of range in endpoint: " + url);
        }
        endpoint.port = static_cast<std::uint16_t>(value);
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return Err<Endpoint>(ErrorCode::InvalidArgument, "Missing host in endpoint: " + url);
    }
    endpoint.host = authority;
    return Ok(endpoint);
}

} // namespace ingest::net
