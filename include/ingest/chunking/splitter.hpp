#pragma once

#include "ingest/chunking/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ingest::chunking {

/**
 * @brief Finite, restartable, pull-based sequence of chunks for one file
 *
 * Consumers may stop pulling at any time; nothing past the last next() call
 * has been produced. reset() rewinds to the first chunk and yields the same
 * sequence again.
 */
class ChunkSequence {
public:
    virtual ~ChunkSequence() = default;

    virtual std::optional<Chunk> next() = 0;

    virtual void reset() = 0;
};

struct SplitOptions {
    std::size_t max_chunk_size = 1000;
    bool semantic = false;
};

/**
 * @brief Turns file text into a ChunkSequence
 *
 * Line mode packs whole lines up to max_chunk_size. Semantic mode groups
 * language-aware boundaries and falls back to line mode when a file has none.
 * Every chunk is at most min(max_chunk_size, kServerMaxChunkSize) bytes.
 *
 * EXAMPLE:
 * ChunkSplitter splitter({1000, true});
 * auto chunks = splitter.split(text, "src/app.ts");
 * while (auto chunk = chunks->next()) { ... }
 */
class ChunkSplitter {
public:
    explicit ChunkSplitter(SplitOptions options = {});

    std::unique_ptr<ChunkSequence> split(std::string text, const std::string& file_path) const;

    const SplitOptions& options() const noexcept { return options_; }

private:
    SplitOptions options_;
};

/// Drain a sequence into a vector
std::vector<Chunk> collect(ChunkSequence& sequence);

/**
 * @brief Size, emptiness and encoding checks for chunk content
 */
ChunkValidation validate_chunk(const std::string& content, std::size_t max_chunk_size);

} // namespace ingest::chunking
