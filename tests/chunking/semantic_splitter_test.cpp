#include "ingest/chunking/semantic_splitter.hpp"
#include "ingest/chunking/splitter.hpp"
#include "ingest/chunking/language.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace ingest::chunking;

namespace {

const char* kTypeScript =
    "import { readFile } from 'fs';\n"
    "\n"
    "// Loads the settings file\n"
    "export function load(path: string) {\n"
    "    const raw = readFile(path);\n"
    "    return JSON.parse(raw);\n"
    "}\n"
    "\n"
    "export class Store {\n"
    "    private items: string[] = [];\n"
    "    add(item: string) {\n"
    "        this.items.push(item);\n"
    "    }\n"
    "}\n";

const char* kPython =
    "import os\n"
    "\n"
    "class Loader:\n"
    "    def __init__(self, root):\n"
    "        self.root = root\n"
    "\n"
    "    def read(self, name):\n"
    "        return open(os.path.join(self.root, name)).read()\n"
    "\n"
    "def main():\n"
    "    print(Loader('.').read('x'))\n";

std::vector<SemanticBoundary> boundaries_of(const std::string& family, const std::string& text) {
    return SemanticBoundaryDetector(family).find_boundaries(text);
}

bool has_type(const std::vector<SemanticBoundary>& boundaries, BoundaryType type) {
    return std::any_of(boundaries.begin(), boundaries.end(),
                       [type](const SemanticBoundary& b) { return b.type == type; });
}

} // namespace

TEST(SemanticBoundaryDetector, ClassifiesTypeScriptStructure) {
    auto boundaries = boundaries_of("typescript", kTypeScript);

    EXPECT_TRUE(has_type(boundaries, BoundaryType::Import));
    EXPECT_TRUE(has_type(boundaries, BoundaryType::Comment));
    EXPECT_TRUE(has_type(boundaries, BoundaryType::Function));
    EXPECT_TRUE(has_type(boundaries, BoundaryType::Class));

    auto function = std::find_if(boundaries.begin(), boundaries.end(),
                                 [](const SemanticBoundary& b) { return b.type == BoundaryType::Function; });
    ASSERT_NE(function, boundaries.end());
    EXPECT_EQ(function->start_line, 3u);
    EXPECT_EQ(function->end_line, 6u);
    EXPECT_EQ(function->importance, 10);   // function 8 + export 2

    auto klass = std::find_if(boundaries.begin(), boundaries.end(),
                              [](const SemanticBoundary& b) { return b.type == BoundaryType::Class; });
    ASSERT_NE(klass, boundaries.end());
    EXPECT_EQ(klass->start_line, 8u);
    EXPECT_EQ(klass->end_line, 13u);
}

TEST(SemanticBoundaryDetector, PythonBoundariesCloseOnDedent) {
    auto boundaries = boundaries_of("python", kPython);

    auto klass = std::find_if(boundaries.begin(), boundaries.end(),
                              [](const SemanticBoundary& b) { return b.type == BoundaryType::Class; });
    ASSERT_NE(klass, boundaries.end());
    EXPECT_EQ(klass->start_line, 2u);
    EXPECT_EQ(klass->end_line, 7u);

    auto function = std::find_if(boundaries.begin(), boundaries.end(),
                                 [](const SemanticBoundary& b) { return b.type == BoundaryType::Function; });
    ASSERT_NE(function, boundaries.end());
    EXPECT_EQ(function->start_line, 9u);
    EXPECT_EQ(function->end_line, 10u);
}

TEST(SemanticBoundaryDetector, MultiLineCommentBecomesOneBoundary) {
    auto boundaries = boundaries_of("cpp",
        "/*\n"
        " * License text\n"
        " */\n"
        "int add(int a, int b) {\n"
        "    return a + b;\n"
        "}\n");

    ASSERT_GE(boundaries.size(), 2u);
    EXPECT_EQ(boundaries[0].type, BoundaryType::Comment);
    EXPECT_EQ(boundaries[0].start_line, 0u);
    EXPECT_EQ(boundaries[0].end_line, 2u);
    EXPECT_EQ(boundaries[1].type, BoundaryType::Function);
}

TEST(SemanticBoundaryDetector, UnclassifiedTextIsKeptAsFiller) {
    const std::string text =
        "let counter = 0;\n"
        "counter += 1;\n"
        "function bump() {\n"
        "  counter++;\n"
        "}\n";
    auto boundaries = boundaries_of("javascript", text);

    ASSERT_FALSE(boundaries.empty());
    EXPECT_EQ(boundaries.front().type, BoundaryType::None);
    EXPECT_EQ(boundaries.front().importance, 0);
    EXPECT_NE(boundaries.front().content.find("counter += 1;"), std::string::npos);
}

TEST(SemanticBoundaryDetector, ImportanceWeights) {
    EXPECT_EQ(SemanticBoundaryDetector::importance(BoundaryType::Class, "class A"), 10);
    EXPECT_EQ(SemanticBoundaryDetector::importance(BoundaryType::Method, "public void run()"), 7);
    EXPECT_EQ(SemanticBoundaryDetector::importance(BoundaryType::Block, "if (x)"), 4);
    EXPECT_EQ(SemanticBoundaryDetector::importance(BoundaryType::Import, "export * from 'x'"), 4);
    EXPECT_EQ(SemanticBoundaryDetector::importance(BoundaryType::None, "export public"), 0);
}

TEST(OptimizeBoundaries, SortsByImportanceAndMergesSmallRuns) {
    std::vector<SemanticBoundary> input = {
        {BoundaryType::Import, 0, 0, "import a", 2},
        {BoundaryType::Import, 1, 1, "import b", 2},
        {BoundaryType::Class, 2, 40, std::string(300, 'c'), 10},
        {BoundaryType::Comment, 41, 41, "// c", 1},
        {BoundaryType::Import, 42, 42, "import d", 2},
    };

    auto optimized = optimize_boundaries(input);

    ASSERT_EQ(optimized.size(), 3u);
    EXPECT_EQ(optimized[0].type, BoundaryType::Class);
    // Three small imports merged in their original relative order
    EXPECT_EQ(optimized[1].type, BoundaryType::Block);
    EXPECT_EQ(optimized[1].content, "import a\nimport b\nimport d");
    EXPECT_EQ(optimized[1].importance, 2);
    EXPECT_EQ(optimized[2].content, "// c");
}

TEST(SemanticSplitter, ChunksRespectBudget) {
    std::string text;
    for (int i = 0; i < 40; ++i) {
        text += "export function f" + std::to_string(i) + "(a: number) {\n";
        text += "    return a * " + std::to_string(i) + ";\n";
        text += "}\n\n";
    }

    ChunkSplitter splitter(SplitOptions{300, true});
    auto sequence = splitter.split(text, "src/math.ts");
    auto chunks = collect(*sequence);

    ASSERT_FALSE(chunks.empty());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].content.size(), 300u);
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(chunks[i].language, "TypeScript");
    }

    std::size_t functions = 0;
    for (const auto& chunk : chunks) {
        for (auto pos = chunk.content.find("export function"); pos != std::string::npos;
             pos = chunk.content.find("export function", pos + 1)) {
            ++functions;
        }
    }
    EXPECT_EQ(functions, 40u);
}

TEST(SemanticSplitter, OversizedBoundaryFallsBackToLines) {
    std::string body;
    for (int i = 0; i < 50; ++i) {
        body += "    total += values[" + std::to_string(i) + "];\n";
    }
    const std::string text = "function sum(values) {\n    let total = 0;\n" + body + "    return total;\n}\n";

    ChunkSplitter splitter(SplitOptions{200, true});
    auto chunks = collect(*splitter.split(text, "sum.js"));

    ASSERT_GT(chunks.size(), 1u);
    for (const auto& chunk : chunks) {
        EXPECT_LE(chunk.content.size(), 200u);
    }
}

TEST(SemanticSplitter, PlainTextFallsBackToLineMode) {
    ChunkSplitter semantic(SplitOptions{10, true});
    ChunkSplitter lines(SplitOptions{10, false});

    const std::string text = "alpha beta\ngamma delta\nepsilon\n";
    auto a = collect(*semantic.split(text, "notes.txt"));
    auto b = collect(*lines.split(text, "notes.txt"));

    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].content, b[i].content);
    }
}

TEST(Language, DisplayNamesAndFamilies) {
    EXPECT_EQ(language_from_path("a/b/c.py"), "Python");
    EXPECT_EQ(language_from_path("x.TSX"), "TypeScript React");
    EXPECT_EQ(language_from_path("x.kt"), "KT");
    EXPECT_EQ(language_from_path("Makefile"), "Unknown");

    EXPECT_EQ(syntax_family_from_path("a.mjs"), "javascript");
    EXPECT_EQ(syntax_family_from_path("a.hpp"), "cpp");
    EXPECT_EQ(syntax_family_from_path("a.rb"), "typescript");
    EXPECT_TRUE(is_indentation_family("python"));
    EXPECT_FALSE(is_indentation_family("java"));
}
