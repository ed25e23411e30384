#include <string>
#include <gtest/gtest.h>
#include "runtime/change_parser.hpp"

namespace {

using hive::protocol::ChangeType;
using hive::runtime::parse_file_changes;

TEST(ChangeParserTest, ParsesJsonFilesBlock) {
    const std::string output =
        "Here you go.\n"
        "```json\n"
        "{\"files\": [{\"path\": \"src/a.ts\", \"content\": \"export const a = 1;\\n\", "
        "\"type\": \"create\"},\n"
        "            {\"filePath\": \"src/b.ts\", \"newContent\": \"b\"}]}\n"
        "```\n";

    const auto changes = parse_file_changes(output);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].path, "src/a.ts");
    EXPECT_EQ(changes[0].type, ChangeType::Create);
    EXPECT_EQ(changes[0].modified_content, "export const a = 1;\n");
    EXPECT_EQ(changes[1].path, "src/b.ts");
    EXPECT_EQ(changes[1].type, ChangeType::Modify);
    EXPECT_EQ(changes[1].modified_content, "b");
}

TEST(ChangeParserTest, ParsesFencesWithPathInInfoString) {
    const std::string output =
        "```ts:src/a.ts\n"
        "line one\n"
        "line two\n"
        "```\n"
        "```py tools/run.py\n"
        "print('x')\n"
        "```\n";

    const auto changes = parse_file_changes(output);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].path, "src/a.ts");
    EXPECT_EQ(changes[0].modified_content, "line one\nline two\n");
    EXPECT_EQ(changes[1].path, "tools/run.py");
    EXPECT_EQ(changes[1].modified_content, "print('x')\n");
}

TEST(ChangeParserTest, HeaderLineAboveFenceNamesTheFile) {
    const std::string output =
        "### Create: `src/new.ts`\n"
        "```typescript\n"
        "export {};\n"
        "```\n"
        "File: src/old.ts\n"
        "```\n"
        "updated\n"
        "```\n";

    const auto changes = parse_file_changes(output);
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].path, "src/new.ts");
    EXPECT_EQ(changes[0].type, ChangeType::Create);
    EXPECT_EQ(changes[1].path, "src/old.ts");
    EXPECT_EQ(changes[1].type, ChangeType::Modify);
    EXPECT_EQ(changes[1].modified_content, "updated\n");
}

TEST(ChangeParserTest, DeleteHeaderNeedsNoBlock) {
    const auto changes = parse_file_changes("### Delete: src/legacy.ts\nDone.\n");
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].path, "src/legacy.ts");
    EXPECT_EQ(changes[0].type, ChangeType::Delete);
}

TEST(ChangeParserTest, LaterChangeToSamePathWins) {
    const std::string output =
        "```ts:src/a.ts\nfirst\n```\n"
        "```ts:src/a.ts\nsecond\n```\n";

    const auto changes = parse_file_changes(output);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].modified_content, "second\n");
}

TEST(ChangeParserTest, IgnoresUnnamedAndUnclosedBlocks) {
    EXPECT_TRUE(parse_file_changes("Just prose, no code.").empty());
    EXPECT_TRUE(parse_file_changes("```\nanonymous snippet\n```\n").empty());
    EXPECT_TRUE(parse_file_changes("```ts:src/a.ts\nnever closed\n").empty());
}

TEST(ChangeParserTest, InvalidJsonFallsBackToFences) {
    const std::string output =
        "```json\n{not json\n```\n"
        "```ts:src/a.ts\nok\n```\n";

    const auto changes = parse_file_changes(output);
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].path, "src/a.ts");
}

}  // namespace
