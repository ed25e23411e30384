#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "merge/region_analyzer.hpp"

namespace {

using hive::merge::CodeRegion;
using hive::merge::RegionAnalyzer;
using hive::merge::RegionType;

const CodeRegion* find_region(const std::vector<CodeRegion>& regions, const std::string& name) {
    for (const auto& region : regions) {
        if (region.name == name) {
            return &region;
        }
    }
    return nullptr;
}

const char* const kTypeScript =
    "import { x } from './x';\n"
    "import { y } from './y';\n"
    "\n"
    "export function foo(a: number): number {\n"
    "  return a + 1;\n"
    "}\n"
    "\n"
    "export class Bar {\n"
    "  run() {\n"
    "    return 2;\n"
    "  }\n"
    "}\n"
    "\n"
    "export const baz = (n: number) => n * 2;\n";

TEST(RegionAnalyzerTest, SplitsTypeScriptIntoDeclarations) {
    RegionAnalyzer analyzer;
    const auto regions = analyzer.analyze("src/a.ts", kTypeScript);
    ASSERT_EQ(regions.size(), 4u);

    EXPECT_EQ(regions[0].type, RegionType::Imports);
    EXPECT_EQ(regions[0].start_line, 1u);
    EXPECT_EQ(regions[0].end_line, 2u);

    const CodeRegion* foo = find_region(regions, "foo");
    ASSERT_NE(foo, nullptr);
    EXPECT_EQ(foo->type, RegionType::Function);
    EXPECT_EQ(foo->start_line, 4u);
    EXPECT_EQ(foo->end_line, 6u);
    EXPECT_EQ(foo->id, "src/a.ts:function:foo");

    const CodeRegion* bar = find_region(regions, "Bar");
    ASSERT_NE(bar, nullptr);
    EXPECT_EQ(bar->type, RegionType::Class);
    EXPECT_EQ(bar->start_line, 8u);
    EXPECT_EQ(bar->end_line, 12u);

    const CodeRegion* baz = find_region(regions, "baz");
    ASSERT_NE(baz, nullptr);
    EXPECT_EQ(baz->type, RegionType::Function);
    EXPECT_EQ(baz->start_line, 14u);
    EXPECT_EQ(baz->end_line, 14u);
}

TEST(RegionAnalyzerTest, RepeatedNamesAreDisambiguated) {
    RegionAnalyzer analyzer;
    const auto regions = analyzer.analyze(
        "src/b.ts", "function foo() {\n}\nfunction foo(x) {\n  return x;\n}\n");
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0].name, "foo");
    EXPECT_EQ(regions[1].name, "foo#2");
    EXPECT_NE(regions[0].id, regions[1].id);
}

TEST(RegionAnalyzerTest, SplitsPythonOnTopLevelDeclarations) {
    RegionAnalyzer analyzer;
    const std::string source =
        "import os\n"
        "from typing import List\n"
        "\n"
        "@decorator\n"
        "def foo():\n"
        "    return 1\n"
        "\n"
        "class Bar:\n"
        "    def run(self):\n"
        "        pass\n"
        "\n"
        "CONSTANT = 3\n";
    const auto regions = analyzer.analyze("tool.py", source);
    ASSERT_EQ(regions.size(), 4u);
    EXPECT_EQ(regions[0].type, RegionType::Imports);

    const CodeRegion* foo = find_region(regions, "foo");
    ASSERT_NE(foo, nullptr);
    EXPECT_EQ(foo->start_line, 4u);
    EXPECT_EQ(foo->end_line, 6u);

    const CodeRegion* bar = find_region(regions, "Bar");
    ASSERT_NE(bar, nullptr);
    EXPECT_EQ(bar->start_line, 8u);
    EXPECT_EQ(bar->end_line, 10u);

    const CodeRegion* constant = find_region(regions, "CONSTANT");
    ASSERT_NE(constant, nullptr);
    EXPECT_EQ(constant->type, RegionType::Variable);
}

TEST(RegionAnalyzerTest, UnknownLanguageFallsBackToChunks) {
    std::string text;
    for (int i = 1; i <= 120; ++i) {
        if (i > 1) {
            text += "\n";
        }
        text += "line " + std::to_string(i);
    }
    RegionAnalyzer analyzer(50);
    const auto regions = analyzer.analyze("notes.txt", text);
    ASSERT_EQ(regions.size(), 3u);
    EXPECT_EQ(regions[0].name, "lines_1_50");
    EXPECT_EQ(regions[2].start_line, 101u);
    EXPECT_EQ(regions[2].end_line, 120u);
    EXPECT_EQ(regions[2].type, RegionType::Other);
}

TEST(RegionAnalyzerTest, OverlapRequiresSameFile) {
    CodeRegion a;
    a.file_path = "a.ts";
    a.start_line = 1;
    a.end_line = 10;
    CodeRegion b = a;
    b.start_line = 10;
    b.end_line = 20;
    EXPECT_TRUE(RegionAnalyzer::regions_overlap(a, b));

    b.start_line = 11;
    EXPECT_FALSE(RegionAnalyzer::regions_overlap(a, b));

    b.start_line = 5;
    b.file_path = "b.ts";
    EXPECT_FALSE(RegionAnalyzer::regions_overlap(a, b));
}

TEST(RegionAnalyzerTest, RegionTextReturnsCoveredLines) {
    RegionAnalyzer analyzer;
    const auto regions = analyzer.analyze("src/a.ts", kTypeScript);
    const CodeRegion* foo = find_region(regions, "foo");
    ASSERT_NE(foo, nullptr);
    EXPECT_EQ(RegionAnalyzer::region_text(kTypeScript, *foo),
              "export function foo(a: number): number {\n  return a + 1;\n}");
}

TEST(RegionAnalyzerTest, VeryLongLinesAreAnalyzedWithoutExhaustingTheStack) {
    RegionAnalyzer analyzer;
    const std::string long_args(100000, 'x');

    const auto function = analyzer.analyze("src/gen.ts", "int foo(" + long_args + ") {\n}\n");
    const CodeRegion* foo = find_region(function, "foo");
    ASSERT_NE(foo, nullptr);
    EXPECT_EQ(foo->type, RegionType::Function);
    EXPECT_EQ(foo->start_line, 1u);
    EXPECT_EQ(foo->end_line, 2u);

    const auto arrow = analyzer.analyze("src/bundle.js", "const a = (" + long_args + ") => 1;\n");
    EXPECT_NE(find_region(arrow, "a"), nullptr);

    const auto spaced =
        analyzer.analyze("src/types.h", "unsigned " + std::string(100000, ' ') + "long x;\n");
    EXPECT_FALSE(spaced.empty());

    const auto python = analyzer.analyze("gen.py", "table = " + long_args + "\n");
    EXPECT_NE(find_region(python, "table"), nullptr);
}

}  // namespace
