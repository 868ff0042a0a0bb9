#include "ingest/chunking/language.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <sstream>
#include <unordered_map>

namespace ingest::chunking {
namespace {

std::string lowercase_extension(const std::string& file_path) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

const std::unordered_map<std::string, std::string>& display_names() {
    static const std::unordered_map<std::string, std::string> names{
        {"py", "Python"},
        {"ts", "TypeScript"},
        {"tsx", "TypeScript React"},
        {"js", "JavaScript"},
        {"jsx", "JavaScript React"},
        {"java", "Java"},
        {"go", "Go"},
        {"rs", "Rust"},
        {"cpp", "C++"},
        {"c", "C"},
        {"h", "C/C++ Header"},
        {"hpp", "C++ Header"},
        {"cs", "C#"},
        {"php", "PHP"},
        {"rb", "Ruby"},
    };
    return names;
}

const std::unordered_map<std::string, std::string>& syntax_families() {
    static const std::unordered_map<std::string, std::string> families{
        {"ts", "typescript"},
        {"tsx", "typescript"},
        {"js", "javascript"},
        {"jsx", "javascript"},
        {"mjs", "javascript"},
        {"py", "python"},
        {"java", "java"},
        {"cs", "csharp"},
        {"cpp", "cpp"},
        {"cc", "cpp"},
        {"cxx", "cpp"},
        {"c", "cpp"},
        {"h", "cpp"},
        {"hpp", "cpp"},
    };
    return families;
}

} // namespace

std::string language_from_path(const std::string& file_path) {
    const auto ext = lowercase_extension(file_path);
    if (ext.empty()) {
        return "Unknown";
    }

    const auto& names = display_names();
    if (auto it = names.find(ext); it != names.end()) {
        return it->second;
    }

    std::string upper = ext;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return upper;
}

std::string syntax_family_from_path(const std::string& file_path) {
    const auto& families = syntax_families();
    if (auto it = families.find(lowercase_extension(file_path)); it != families.end()) {
        return it->second;
    }
    return "typescript";
}

bool is_indentation_family(const std::string& family) {
    return family == "python";
}

bool looks_like_code(const std::string& content) {
    static const std::regex assignment(R"(^[\s]*[a-zA-Z_$][\w$]*[\s]*[=:({])");
    static const std::regex keyword(R"(^[\s]*(import|from|class|def|function|const|let|var)[\s])");

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        if (std::regex_search(line, assignment) || std::regex_search(line, keyword)) {
            return true;
        }
    }
    return false;
}

} // namespace ingest::chunking
