#pragma once

#include <string>

namespace ingest::chunking {

/**
 * @brief Display language for a path ("Python", "C++ Header", ...)
 *
 * Unmapped extensions come back upper-cased ("TOML"); no extension gives "Unknown".
 */
std::string language_from_path(const std::string& file_path);

/**
 * @brief Regex family used by the semantic splitter
 *
 * One of "typescript", "javascript", "python", "java", "csharp", "cpp".
 * Anything unrecognised maps to "typescript".
 */
std::string syntax_family_from_path(const std::string& file_path);

/// True for families that delimit blocks by indentation rather than braces
bool is_indentation_family(const std::string& family);

/// Cheap check for assignment, declaration or keyword-led lines
bool looks_like_code(const std::string& content);

} // namespace ingest::chunking
