#include "ingest/chunking/splitter.hpp"

#include "ingest/chunking/fingerprint.hpp"
#include "ingest/chunking/language.hpp"
#include "ingest/chunking/line_splitter.hpp"
#include "ingest/chunking/semantic_splitter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace ingest::chunking {
namespace {

std::size_t effective_budget(std::size_t max_chunk_size) {
    return std::clamp<std::size_t>(max_chunk_size, 1, kServerMaxChunkSize);
}

std::size_t count_lines(const std::string& content) {
    return static_cast<std::size_t>(std::count(content.begin(), content.end(), '\n')) + 1;
}

/**
 * Numbers pieces and attaches metadata; subclasses only produce raw text.
 */
class PieceSequence : public ChunkSequence {
public:
    PieceSequence(std::string text, std::string file_path)
        : text_(std::move(text))
        , file_path_(std::move(file_path))
        , language_(language_from_path(file_path_)) {}

    PieceSequence(const PieceSequence&) = delete;
    PieceSequence& operator=(const PieceSequence&) = delete;

    std::optional<Chunk> next() override {
        auto piece = next_piece();
        if (!piece) {
            return std::nullopt;
        }

        Chunk chunk;
        chunk.index = next_index_++;
        chunk.line_count = count_lines(*piece);
        chunk.character_count = piece->size();
        chunk.has_code = looks_like_code(*piece);
        chunk.language = language_;
        chunk.fingerprint = fingerprint(file_path_, chunk.index, *piece);
        chunk.content = std::move(*piece);
        return chunk;
    }

    void reset() override {
        next_index_ = 0;
        rewind();
    }

protected:
    virtual std::optional<std::string> next_piece() = 0;
    virtual void rewind() = 0;

    const std::string text_;

private:
    std::string file_path_;
    std::string language_;
    std::size_t next_index_ = 0;
};

class LineChunkSequence final : public PieceSequence {
public:
    LineChunkSequence(std::string text, std::string file_path, std::size_t budget)
        : PieceSequence(std::move(text), std::move(file_path))
        , packer_(text_, budget) {}

protected:
    std::optional<std::string> next_piece() override { return packer_.next(); }
    void rewind() override { packer_.reset(); }

private:
    LinePacker packer_;
};

class SemanticChunkSequence final : public PieceSequence {
public:
    SemanticChunkSequence(std::string text, std::string file_path,
                          std::vector<SemanticBoundary> units, std::size_t budget)
        : PieceSequence(std::move(text), std::move(file_path))
        , packer_(std::move(units), budget) {}

protected:
    std::optional<std::string> next_piece() override { return packer_.next(); }
    void rewind() override { packer_.reset(); }

private:
    BoundaryPacker packer_;
};

class EmptySequence final : public ChunkSequence {
public:
    std::optional<Chunk> next() override { return std::nullopt; }
    void reset() override {}
};

} // namespace

ChunkSplitter::ChunkSplitter(SplitOptions options) : options_(options) {}

std::unique_ptr<ChunkSequence> ChunkSplitter::split(std::string text, const std::string& file_path) const {
    if (is_blank(text)) {
        return std::make_unique<EmptySequence>();
    }

    const auto budget = effective_budget(options_.max_chunk_size);

    if (options_.semantic) {
        SemanticBoundaryDetector detector(syntax_family_from_path(file_path));
        auto boundaries = detector.find_boundaries(text);
        const bool has_structure = std::any_of(boundaries.begin(), boundaries.end(),
            [](const SemanticBoundary& b) { return b.type != BoundaryType::None; });

        if (has_structure) {
            spdlog::debug("[Splitter] path={} family={} boundaries={}",
                          file_path, detector.family(), boundaries.size());
            auto units = optimize_boundaries(std::move(boundaries));
            return std::make_unique<SemanticChunkSequence>(std::move(text), file_path,
                                                           std::move(units), budget);
        }
        spdlog::debug("[Splitter] path={} no semantic boundaries, using line mode", file_path);
    }

    return std::make_unique<LineChunkSequence>(std::move(text), file_path, budget);
}

std::vector<Chunk> collect(ChunkSequence& sequence) {
    std::vector<Chunk> chunks;
    while (auto chunk = sequence.next()) {
        chunks.push_back(std::move(*chunk));
    }
    return chunks;
}

ChunkValidation validate_chunk(const std::string& content, std::size_t max_chunk_size) {
    ChunkValidation result;

    if (is_blank(content)) {
        result.errors.push_back("Chunk content is empty");
    }
    if (content.size() > max_chunk_size) {
        result.errors.push_back("Chunk (length " + std::to_string(content.size()) +
                                ") exceeds configured max chunk size (" +
                                std::to_string(max_chunk_size) + ")");
    }
    if (content.size() > kServerMaxChunkSize) {
        result.errors.push_back("Chunk (length " + std::to_string(content.size()) +
                                ") exceeds absolute server maximum size limit (" +
                                std::to_string(kServerMaxChunkSize) + " chars)");
    }
    // U+FFFD in UTF-8
    if (content.find("\xEF\xBF\xBD") != std::string::npos) {
        result.warnings.push_back("Chunk contains replacement characters (likely encoding issues)");
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace ingest::chunking
