#pragma once

#include "ingest/net/http_types.hpp"
#include "ingest/core/result.hpp"

#include <cctype>
#include <cstddef>
#include <string>

namespace ingest {
namespace net {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    CHUNK_SIZE,
    CHUNK_DATA,
    CHUNK_DATA_END,
    CHUNK_TRAILER,
    BODY_UNTIL_CLOSE,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed bytes as they arrive from the socket. parse() returns true once a full
 * response is available. For responses delimited by connection close, call
 * finish() when the peer closes.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * auto result = parser.parse(buffer.data(), n);
 * if (result.is_ok() && result.value()) {
 *     HttpResponse response = parser.get_response();
 * }
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            const char c = data[i];
            bool ok = true;

            switch (state_) {
                case ResponseParseState::VERSION: ok = parse_version(c); break;
                case ResponseParseState::STATUS_CODE: ok = parse_status_code(c); break;
                case ResponseParseState::REASON: ok = parse_reason(c); break;
                case ResponseParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ResponseParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ResponseParseState::BODY: parse_body(c); break;
                case ResponseParseState::CHUNK_SIZE: ok = parse_chunk_size(c); break;
                case ResponseParseState::CHUNK_DATA: parse_chunk_data(c); break;
                case ResponseParseState::CHUNK_DATA_END: ok = parse_chunk_data_end(c); break;
                case ResponseParseState::CHUNK_TRAILER: ok = parse_chunk_trailer(c); break;
                case ResponseParseState::BODY_UNTIL_CLOSE:
                    response_.body.push_back(static_cast<uint8_t>(c));
                    break;
                case ResponseParseState::COMPLETE:
                    return Ok(true);
                case ResponseParseState::PARSE_ERROR:
                    return Err<bool>(ErrorCode::InvalidArgument, "Parser in error state");
            }

            if (!ok) {
                state_ = ResponseParseState::PARSE_ERROR;
                return Err<bool>(ErrorCode::InvalidArgument, error_);
            }
            if (state_ == ResponseParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    /**
     * @brief Signal end of stream from the peer
     *
     * RETURNS: true if the response is now complete
     */
    bool finish() {
        if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
            state_ = ResponseParseState::COMPLETE;
        }
        return state_ == ResponseParseState::COMPLETE;
    }

    HttpResponse get_response() const { return response_; }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    void reset() {
        state_ = ResponseParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        expected_length_ = 0;
        body_bytes_read_ = 0;
        chunk_remaining_ = 0;
        last_char_was_cr_ = false;
    }

private:
    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    size_t expected_length_;
    size_t body_bytes_read_;
    size_t chunk_remaining_;
    bool last_char_was_cr_;

    bool fail(const std::string& message) {
        error_ = message;
        return false;
    }

    /// True when c completes a CRLF; the CR itself is swallowed
    bool at_line_end(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return false;
        }
        const bool end = c == '\n' && last_char_was_cr_;
        last_char_was_cr_ = false;
        return end;
    }

    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ == "HTTP/1.1") {
                response_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                response_.version = HttpVersion::HTTP_1_0;
            } else {
                return fail("Unsupported HTTP version: " + buffer_);
            }
            buffer_.clear();
            state_ = ResponseParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() > 8) {
            return fail("Malformed status line");
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return fail("Malformed status code: " + buffer_);
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            state_ = ResponseParseState::REASON;
            if (c == '\r') {
                last_char_was_cr_ = true;
            }
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("Status code must be numeric");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (at_line_end(c)) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r' || (c == '\n' && last_char_was_cr_)) {
            if (at_line_end(c)) {
                return begin_body();
            }
            return true;
        }
        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ResponseParseState::HEADER_VALUE;
            return true;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return fail("Invalid character in header name");
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }
        if (at_line_end(c)) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            response_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            state_ = ResponseParseState::HEADER_NAME;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    bool begin_body() {
        const int status = response_.status_code;
        if ((status >= 100 && status < 200) || status == 204 || status == 304) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }

        std::string encoding = response_.get_header("Transfer-Encoding");
        for (auto& ch : encoding) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (encoding.find("chunked") != std::string::npos) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            try {
                expected_length_ = std::stoull(content_length);
            } catch (const std::exception&) {
                return fail("Invalid Content-Length: " + content_length);
            }
            if (expected_length_ == 0) {
                state_ = ResponseParseState::COMPLETE;
                return true;
            }
            response_.body.reserve(expected_length_);
            state_ = ResponseParseState::BODY;
            return true;
        }

        state_ = ResponseParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    void parse_body(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (++body_bytes_read_ >= expected_length_) {
            state_ = ResponseParseState::COMPLETE;
        }
    }

    bool parse_chunk_size(char c) {
        if (at_line_end(c)) {
            const auto extension = buffer_.find(';');
            const std::string hex = buffer_.substr(0, extension);
            buffer_.clear();
            if (hex.empty()) {
                return fail("Missing chunk size");
            }
            try {
                chunk_remaining_ = std::stoull(hex, nullptr, 16);
            } catch (const std::exception&) {
                return fail("Invalid chunk size: " + hex);
            }
            state_ = chunk_remaining_ == 0 ? ResponseParseState::CHUNK_TRAILER
                                           : ResponseParseState::CHUNK_DATA;
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }

    void parse_chunk_data(char c) {
        response_.body.push_back(static_cast<uint8_t>(c));
        if (--chunk_remaining_ == 0) {
            state_ = ResponseParseState::CHUNK_DATA_END;
        }
    }

    bool parse_chunk_data_end(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (at_line_end(c)) {
            state_ = ResponseParseState::CHUNK_SIZE;
            return true;
        }
        return fail("Missing CRLF after chunk data");
    }

    bool parse_chunk_trailer(char c) {
        if (at_line_end(c)) {
            if (buffer_.empty()) {
                state_ = ResponseParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        if (c != '\r') {
            buffer_ += c;
        }
        return true;
    }
};

} // namespace net
} // namespace ingest
