#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ingest::chunking {

/**
 * @brief Pull-based line accumulator bounded by a byte budget
 *
 * Lines (with their newline) are packed into a buffer until the next line
 * would overflow it; the buffer is then emitted with trailing whitespace
 * trimmed. A line that cannot fit even on its own is cut into slices of
 * exactly max_size bytes (the newline is not part of any slice).
 * Whitespace-only pieces are never emitted.
 *
 * The packer views the text; the caller keeps it alive.
 */
class LinePacker {
public:
    LinePacker(std::string_view text, std::size_t max_size);

    std::optional<std::string> next();

    void reset();

private:
    std::optional<std::string> take_buffer();

    std::string_view text_;
    std::size_t max_size_;
    std::size_t position_ = 0;
    bool exhausted_ = false;
    std::string buffer_;
    std::string_view oversized_;
    std::size_t slice_offset_ = 0;
};

/// Strip trailing spaces, tabs, CR and LF
std::string trim_end(std::string_view text);

bool is_blank(std::string_view text);

} // namespace ingest::chunking
