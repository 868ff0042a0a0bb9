#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ingest::chunking {

/// Hard ceiling the remote indexer accepts for one chunk
constexpr std::size_t kServerMaxChunkSize = 100000;

/**
 * @brief One bounded slice of a source file, ready for delivery
 */
struct Chunk {
    std::string content;
    std::size_t index = 0;           ///< Position within the file, strictly increasing
    std::size_t line_count = 0;
    std::size_t character_count = 0;
    bool has_code = false;           ///< Assignment / declaration / keyword heuristic
    std::string language;            ///< Display name derived from the extension
    std::string fingerprint;         ///< SHA-256 hex of "<path>:<index>:<content>"
};

enum class BoundaryType {
    Import,
    Comment,
    Function,
    Class,
    Method,
    Block,
    None
};

/**
 * @brief A contiguous run of lines sharing one semantic role
 */
struct SemanticBoundary {
    BoundaryType type = BoundaryType::None;
    std::size_t start_line = 0;
    std::size_t end_line = 0;   ///< Inclusive
    std::string content;
    int importance = 0;
};

struct ChunkValidation {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

const char* boundary_type_name(BoundaryType type);

} // namespace ingest::chunking
