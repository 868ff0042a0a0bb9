#include "ingest/chunking/semantic_splitter.hpp"

#include "ingest/chunking/language.hpp"

#include <algorithm>
#include <regex>
#include <unordered_map>

namespace ingest::chunking {
namespace {

constexpr std::size_t kSmallBoundaryChars = 200;
constexpr std::size_t kMaxMergeRun = 3;

struct PatternSet {
    std::regex import;
    std::regex comment;
    std::regex function;
    std::regex klass;
    std::regex block;
};

PatternSet make_patterns(const char* import, const char* comment, const char* function,
                         const char* klass, const char* block) {
    return PatternSet{std::regex(import), std::regex(comment), std::regex(function),
                      std::regex(klass), std::regex(block)};
}

const PatternSet& patterns_for(const std::string& family) {
    static const std::unordered_map<std::string, PatternSet> sets = [] {
        std::unordered_map<std::string, PatternSet> m;
        m.emplace("typescript", make_patterns(
            R"(^import\s+|^export\s+(\*|\{))",
            R"(^\s*//)",
            R"(^\s*(export\s+)?(async\s+)?function\s+\w+|^\s*\w+\s*\([^)]*\)\s*[:{])",
            R"(^\s*(export\s+)?(abstract\s+)?class\s+\w+)",
            R"(^\s*(if|for|while|switch|try|catch|finally)\s*\()"));
        m.emplace("javascript", make_patterns(
            R"(^(import|require)\s+|^export\s+(\*|\{))",
            R"(^\s*//)",
            R"(^\s*(export\s+)?(async\s+)?function\s+\w+|^\s*\w+\s*\([^)]*\)\s*[:{])",
            R"(^\s*(export\s+)?class\s+\w+)",
            R"(^\s*(if|for|while|switch|try|catch|finally)\s*\()"));
        m.emplace("python", make_patterns(
            R"(^(import|from)\s+)",
            R"(^\s*#)",
            R"(^\s*(async\s+)?def\s+\w+)",
            R"(^\s*class\s+\w+)",
            R"(^\s*(if|for|while|try|except|finally|with)\s+)"));
        m.emplace("java", make_patterns(
            R"(^import\s+)",
            R"(^\s*//)",
            R"(^\s*(public|private|protected)?\s*(static\s+)?\w+\s+\w+\s*\()",
            R"(^\s*(public|private|protected)?\s*(abstract\s+)?class\s+\w+)",
            R"(^\s*(if|for|while|switch|try|catch|finally)\s*\()"));
        m.emplace("csharp", make_patterns(
            R"(^using\s+)",
            R"(^\s*//)",
            R"(^\s*(public|private|protected)?\s*(static\s+)?\w+\s+\w+\s*\()",
            R"(^\s*(public|private|protected)?\s*(abstract\s+)?class\s+\w+)",
            R"(^\s*(if|for|while|switch|try|catch|finally)\s*\()"));
        m.emplace("cpp", make_patterns(
            R"(^#include\s+)",
            R"(^\s*//)",
            R"(^\s*\w+\s+\w+\s*\([^)]*\)\s*\{)",
            R"(^\s*class\s+\w+)",
            R"(^\s*(if|for|while|switch|try|catch)\s*\()"));
        return m;
    }();

    if (auto it = sets.find(family); it != sets.end()) {
        return it->second;
    }
    return sets.at("typescript");
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true) {
        const auto newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

std::size_t indent_of(std::string_view line) {
    std::size_t width = 0;
    for (char c : line) {
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width += 4;
        } else {
            break;
        }
    }
    return width;
}

int count_braces(std::string_view line) {
    int count = 0;
    for (char c : line) {
        if (c == '{') ++count;
        if (c == '}') --count;
    }
    return count;
}

std::size_t count_occurrences(const std::string& text, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

bool ends_with(const std::string& text, char c) {
    return !text.empty() && text.back() == c;
}

struct OpenBoundary {
    BoundaryType type = BoundaryType::None;
    std::size_t start = 0;
    int importance = 0;
    std::size_t indent = 0;
    int depth = 0;
    bool seen_brace = false;
    bool comment_region = false;
};

bool braced_boundary_closes(const OpenBoundary& open, const std::string& trimmed) {
    return open.depth <= 0 && (open.seen_brace || ends_with(trimmed, ';') || ends_with(trimmed, '}'));
}

SemanticBoundary merge_run(const std::vector<SemanticBoundary>& run) {
    SemanticBoundary merged;
    merged.type = BoundaryType::Block;
    merged.start_line = run.front().start_line;
    merged.end_line = run.back().end_line;
    for (std::size_t i = 0; i < run.size(); ++i) {
        if (i > 0) {
            merged.content.push_back('\n');
        }
        merged.content += run[i].content;
        merged.importance = std::max(merged.importance, run[i].importance);
    }
    return merged;
}

} // namespace

const char* boundary_type_name(BoundaryType type) {
    switch (type) {
        case BoundaryType::Import: return "import";
        case BoundaryType::Comment: return "comment";
        case BoundaryType::Function: return "function";
        case BoundaryType::Class: return "class";
        case BoundaryType::Method: return "method";
        case BoundaryType::Block: return "block";
        case BoundaryType::None: return "none";
    }
    return "none";
}

SemanticBoundaryDetector::SemanticBoundaryDetector(std::string family)
    : family_(std::move(family)) {}

int SemanticBoundaryDetector::importance(BoundaryType type, const std::string& opening_line) {
    int score = 0;
    switch (type) {
        case BoundaryType::Class: score = 10; break;
        case BoundaryType::Function: score = 8; break;
        case BoundaryType::Method: score = 6; break;
        case BoundaryType::Block: score = 4; break;
        case BoundaryType::Import: score = 2; break;
        case BoundaryType::Comment: score = 1; break;
        case BoundaryType::None: return 0;
    }
    if (opening_line.find("export") != std::string::npos) {
        score += 2;
    }
    if (opening_line.find("public") != std::string::npos) {
        score += 1;
    }
    return score;
}

std::optional<BoundaryType> SemanticBoundaryDetector::classify(const std::string& line) const {
    const auto& patterns = patterns_for(family_);
    const std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    if (std::regex_search(trimmed, patterns.import)) {
        return BoundaryType::Import;
    }
    if (std::regex_search(trimmed, patterns.comment)) {
        return BoundaryType::Comment;
    }
    if (std::regex_search(trimmed, patterns.klass)) {
        return BoundaryType::Class;
    }
    if (std::regex_search(trimmed, patterns.block)) {
        return BoundaryType::Block;
    }
    if (std::regex_search(trimmed, patterns.function)) {
        // Indented callables live inside a class body
        const bool nested = indent_of(line) > 0 && trimmed.find('(') != std::string::npos;
        return nested ? BoundaryType::Method : BoundaryType::Function;
    }
    return std::nullopt;
}

std::vector<SemanticBoundary> SemanticBoundaryDetector::find_boundaries(std::string_view text) const {
    const auto lines = split_lines(text);
    const bool indentation = is_indentation_family(family_);
    const std::string comment_open = indentation ? "\"\"\"" : "/*";
    const std::string comment_close = indentation ? "\"\"\"" : "*/";

    std::vector<SemanticBoundary> boundaries;
    std::optional<OpenBoundary> open;
    std::optional<std::size_t> filler_start;
    bool in_comment = false;

    auto emit = [&](BoundaryType type, std::size_t start, std::size_t end, int importance) {
        std::string content;
        for (std::size_t i = start; i <= end && i < lines.size(); ++i) {
            if (i > start) {
                content.push_back('\n');
            }
            content.append(lines[i]);
        }
        if (is_blank(content)) {
            return;
        }
        boundaries.push_back(SemanticBoundary{type, start, end, std::move(content), importance});
    };

    // Trailing blank lines stay outside the boundary
    auto last_content_line = [&](std::size_t start, std::size_t end) {
        while (end > start && is_blank(lines[end])) {
            --end;
        }
        return end;
    };

    auto close_filler = [&](std::size_t before) {
        if (filler_start && before > *filler_start) {
            emit(BoundaryType::None, *filler_start, before - 1, 0);
        }
        filler_start.reset();
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string line(lines[i]);
        const std::string trimmed = trim(line);

        bool comment_line = false;
        if (in_comment) {
            comment_line = true;
            if (trimmed.find(comment_close) != std::string::npos) {
                in_comment = false;
            }
        } else if (auto pos = trimmed.find(comment_open); pos != std::string::npos) {
            if (indentation) {
                if (count_occurrences(trimmed, comment_open) % 2 == 1) {
                    comment_line = true;
                    in_comment = true;
                }
            } else if (trimmed.find(comment_close, pos + comment_open.size()) == std::string::npos) {
                comment_line = true;
                in_comment = true;
            }
        }

        if (open && indentation && !open->comment_region && !comment_line && !trimmed.empty()
            && indent_of(line) <= open->indent) {
            emit(open->type, open->start, last_content_line(open->start, i - 1), open->importance);
            open.reset();
        }

        if (open) {
            if (open->comment_region) {
                if (!in_comment) {
                    emit(open->type, open->start, i, open->importance);
                    open.reset();
                }
                continue;
            }
            if (!indentation && !comment_line) {
                open->depth += count_braces(line);
                open->seen_brace = open->seen_brace || line.find('{') != std::string::npos;
                if (braced_boundary_closes(*open, trimmed)) {
                    emit(open->type, open->start, i, open->importance);
                    open.reset();
                }
            }
            continue;
        }

        if (comment_line) {
            close_filler(i);
            const int score = importance(BoundaryType::Comment, trimmed);
            if (in_comment) {
                open = OpenBoundary{BoundaryType::Comment, i, score, indent_of(line), 0, false, true};
            } else {
                emit(BoundaryType::Comment, i, i, score);
            }
            continue;
        }

        const auto type = classify(line);
        if (!type) {
            if (!filler_start) {
                filler_start = i;
            }
            continue;
        }

        close_filler(i);
        const int score = importance(*type, trimmed);
        if (*type == BoundaryType::Import || *type == BoundaryType::Comment) {
            emit(*type, i, i, score);
            continue;
        }

        OpenBoundary boundary{*type, i, score, indent_of(line), 0, false, false};
        if (!indentation) {
            boundary.depth = count_braces(line);
            boundary.seen_brace = line.find('{') != std::string::npos;
            if (braced_boundary_closes(boundary, trimmed)) {
                emit(boundary.type, i, i, score);
                continue;
            }
        }
        open = boundary;
    }

    if (open) {
        emit(open->type, open->start, last_content_line(open->start, lines.size() - 1), open->importance);
    }
    close_filler(lines.size());

    return boundaries;
}

std::vector<SemanticBoundary> optimize_boundaries(std::vector<SemanticBoundary> boundaries) {
    std::stable_sort(boundaries.begin(), boundaries.end(),
        [](const SemanticBoundary& lhs, const SemanticBoundary& rhs) {
            return lhs.importance > rhs.importance;
        });

    std::vector<SemanticBoundary> optimized;
    std::vector<SemanticBoundary> run;

    auto flush_run = [&]() {
        if (run.empty()) {
            return;
        }
        optimized.push_back(run.size() == 1 ? run.front() : merge_run(run));
        run.clear();
    };

    for (auto& boundary : boundaries) {
        if (boundary.content.size() < kSmallBoundaryChars) {
            if (run.size() == kMaxMergeRun) {
                flush_run();
            }
            run.push_back(std::move(boundary));
        } else {
            flush_run();
            optimized.push_back(std::move(boundary));
        }
    }
    flush_run();

    return optimized;
}

BoundaryPacker::BoundaryPacker(std::vector<SemanticBoundary> units, std::size_t max_size)
    : units_(std::move(units)), max_size_(std::max<std::size_t>(max_size, 1)) {}

void BoundaryPacker::reset() {
    cursor_ = 0;
    current_.clear();
    oversized_.reset();
}

std::optional<std::string> BoundaryPacker::take_current() {
    if (current_.empty()) {
        return std::nullopt;
    }
    std::string content = trim_end(current_);
    current_.clear();
    if (is_blank(content)) {
        return std::nullopt;
    }
    return content;
}

std::optional<std::string> BoundaryPacker::next() {
    while (true) {
        if (oversized_) {
            if (auto piece = oversized_->next()) {
                return piece;
            }
            oversized_.reset();
            continue;
        }

        if (cursor_ >= units_.size()) {
            return take_current();
        }

        const auto& unit = units_[cursor_];
        if (unit.content.size() > max_size_) {
            auto flushed = take_current();
            oversized_.emplace(std::string_view(unit.content), max_size_);
            ++cursor_;
            if (flushed) {
                return flushed;
            }
            continue;
        }

        const std::size_t needed = current_.empty() ? unit.content.size()
                                                    : current_.size() + 1 + unit.content.size();
        if (needed > max_size_) {
            auto flushed = take_current();
            current_ = unit.content;
            ++cursor_;
            if (flushed) {
                return flushed;
            }
            continue;
        }

        if (!current_.empty()) {
            current_.push_back('\n');
        }
        current_ += unit.content;
        ++cursor_;
    }
}

} // namespace ingest::chunking
