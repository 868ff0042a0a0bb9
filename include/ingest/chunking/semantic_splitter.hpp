#pragma once

#include "ingest/chunking/line_splitter.hpp"
#include "ingest/chunking/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ingest::chunking {

/**
 * @brief Finds import / comment / function / class / method / block regions
 *
 * HOW IT WORKS:
 * Lines are classified one at a time with the regex set of a syntax family.
 * A boundary opens on a classified line only while no boundary is open.
 * Imports and single-line comments close on the same line; the others close
 * once brace depth returns to zero (or, for indentation families, when a later
 * non-blank line sits at or left of the opening indent). Lines outside every
 * boundary are kept as BoundaryType::None filler so no text is dropped.
 */
class SemanticBoundaryDetector {
public:
    explicit SemanticBoundaryDetector(std::string family);

    std::vector<SemanticBoundary> find_boundaries(std::string_view text) const;

    std::optional<BoundaryType> classify(const std::string& trimmed_line) const;

    static int importance(BoundaryType type, const std::string& opening_line);

    const std::string& family() const noexcept { return family_; }

private:
    std::string family_;
};

/**
 * @brief Stable sort by descending importance, then merge small neighbours
 *
 * Boundaries under 200 characters are merged in runs of at most three into
 * one Block carrying the highest importance of the run.
 */
std::vector<SemanticBoundary> optimize_boundaries(std::vector<SemanticBoundary> boundaries);

/**
 * @brief Greedily packs optimized boundaries into budget-sized pieces
 *
 * A unit larger than the budget is handed to a LinePacker and emitted in
 * line-mode pieces before packing resumes.
 */
class BoundaryPacker {
public:
    BoundaryPacker(std::vector<SemanticBoundary> units, std::size_t max_size);

    std::optional<std::string> next();

    void reset();

private:
    std::optional<std::string> take_current();

    std::vector<SemanticBoundary> units_;
    std::size_t max_size_;
    std::size_t cursor_ = 0;
    std::string current_;
    std::optional<LinePacker> oversized_;
};

} // namespace ingest::chunking
