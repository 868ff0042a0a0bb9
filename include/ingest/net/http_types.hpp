#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <cstdint>
#include <sstream>

#include <strings.h>

namespace ingest {
namespace net {

/**
 * @brief Request methods the client issues
 */
enum class HttpMethod {
    GET,
    POST,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

namespace detail {

inline std::string find_header(const std::unordered_map<std::string, std::string>& headers,
                               const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

} // namespace detail

/**
 * @brief Outbound HTTP/1.1 request
 *
 * `url` is the request target ("/index/chunk"); the host comes from the
 * transport's endpoint. Bodies are JSON text, so a string holds them.
 *
 * Wire format:
 * POST /index/chunk HTTP/1.1\r\n
 * Host: localhost:8000\r\n
 * Content-Length: 42\r\n
 * \r\n
 * {...}
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url = "/";
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /**
     * @brief Serialize for the socket; Host and Content-Length are filled in
     */
    std::string serialize(const std::string& host) const {
        std::ostringstream oss;
        oss << method_to_string(method) << " " << url << " HTTP/1.1\r\n";
        oss << "Host: " << host << "\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (method == HttpMethod::POST || !body.empty()) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";
        oss << body;
        return oss.str();
    }

    static std::string method_to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            default: return "UNKNOWN";
        }
    }
};

/**
 * @brief Response as seen by the client
 */
struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::string get_header(const std::string& name) const {
        return detail::find_header(headers, name);
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    bool is_server_error() const { return status_code >= 500 && status_code < 600; }
};

} // namespace net
} // namespace ingest
