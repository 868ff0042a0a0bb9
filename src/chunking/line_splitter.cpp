#include "ingest/chunking/line_splitter.hpp"

#include <algorithm>
#include <cctype>

namespace ingest::chunking {

std::string trim_end(std::string_view text) {
    auto end = text.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(0, end));
}

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

LinePacker::LinePacker(std::string_view text, std::size_t max_size)
    : text_(text), max_size_(std::max<std::size_t>(max_size, 1)) {}

void LinePacker::reset() {
    position_ = 0;
    exhausted_ = false;
    buffer_.clear();
    oversized_ = {};
    slice_offset_ = 0;
}

std::optional<std::string> LinePacker::take_buffer() {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    std::string content = trim_end(buffer_);
    buffer_.clear();
    if (content.empty()) {
        return std::nullopt;
    }
    return content;
}

std::optional<std::string> LinePacker::next() {
    while (true) {
        // Drain slices of an oversized line first
        if (slice_offset_ < oversized_.size()) {
            auto slice = oversized_.substr(slice_offset_, max_size_);
            slice_offset_ += slice.size();
            // A blank slice would be an empty chunk, which validate_chunk rejects;
            // whitespace inside a kept slice is preserved verbatim
            if (!is_blank(slice)) {
                return std::string(slice);
            }
            continue;
        }

        if (exhausted_) {
            return take_buffer();
        }

        std::string_view line;
        const auto newline = text_.find('\n', position_);
        if (newline == std::string_view::npos) {
            line = text_.substr(position_);
            position_ = text_.size();
            exhausted_ = true;
        } else {
            line = text_.substr(position_, newline - position_);
            position_ = newline + 1;
        }

        const std::size_t line_with_newline = line.size() + 1;
        if (buffer_.size() + line_with_newline <= max_size_) {
            buffer_.append(line).push_back('\n');
            continue;
        }

        auto flushed = take_buffer();
        if (line_with_newline > max_size_) {
            oversized_ = line;
            slice_offset_ = 0;
        } else {
            buffer_.assign(line).push_back('\n');
        }

        if (flushed) {
            return flushed;
        }
    }
}

} // namespace ingest::chunking
