#include <optional>
#include <string>
#include <gtest/gtest.h>
#include "merge/branch_manager.hpp"
#include "merge/merge_engine.hpp"
#include "merge/region_analyzer.hpp"
#include "runtime/scripted_model_client.hpp"
#include "test_support.hpp"

namespace {

using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::merge::BranchManager;
using hive::merge::extract_code_block;
using hive::merge::MergeEngine;
using hive::merge::MergeEngineConfig;
using hive::merge::RegionAnalyzer;
using hive::merge::ResolutionStrategy;
using hive::merge::VirtualBranch;
using hive::protocol::FileChange;
using hive::runtime::ScriptedModelClient;
using hive::testing::InMemoryFileSystem;
using hive::testing::RecordingEventSink;

const char* const kBase =
    "export function foo() {\n"
    "  const a = 1;\n"
    "  const b = 2;\n"
    "  return a + b;\n"
    "}\n"
    "\n"
    "export function bar() {\n"
    "  return 2;\n"
    "}\n";

std::string replace(std::string text, const std::string& from, const std::string& to) {
    text.replace(text.find(from), from.size(), to);
    return text;
}

class MergeEngineFixture : public ::testing::Test {
protected:
    MergeEngineFixture() : branches_(files_, events_) { files_.put("a.ts", kBase); }

    std::string branch_with(const std::string& content) {
        auto created = branches_.create_branch("", "task-" + std::to_string(++counter_));
        EXPECT_FALSE(is_error(created));
        const std::string id = get_value(created).id;
        FileChange change;
        change.path = "a.ts";
        change.modified_content = content;
        EXPECT_FALSE(is_error(branches_.record_change(id, change)));
        return id;
    }

    InMemoryFileSystem files_;
    RecordingEventSink events_;
    BranchManager branches_;
    int counter_ = 0;
};

TEST_F(MergeEngineFixture, EditsInDifferentFunctionsDoNotConflict) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    const auto a = branch_with(replace(kBase, "return a + b;", "return a - b;"));
    const auto b = branch_with(replace(kBase, "return 2;", "return 3;"));

    EXPECT_TRUE(engine.detect_conflicts({a, b}).empty());
    EXPECT_TRUE(engine.active_conflicts().empty());
}

TEST_F(MergeEngineFixture, SameFunctionEditedTwiceIsOneConflict) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    const auto a = branch_with(replace(kBase, "return a + b;", "return 10;"));
    const auto b = branch_with(replace(kBase, "return a + b;", "return 20;"));

    const auto conflicts = engine.detect_conflicts({a, b});
    ASSERT_EQ(conflicts.size(), 1u);
    const auto& conflict = conflicts[0];
    EXPECT_EQ(conflict.file_path, "a.ts");
    ASSERT_EQ(conflict.regions.size(), 1u);
    EXPECT_EQ(conflict.regions[0].name, "foo");
    EXPECT_EQ(conflict.base_content, kBase);
    EXPECT_LT(conflict.ours.branch_id, conflict.theirs.branch_id);
    EXPECT_EQ(events_.count("conflict.detected"), 1u);
    EXPECT_TRUE(engine.get_conflict(conflict.id).has_value());
}

TEST_F(MergeEngineFixture, ConflictIdsAreSymmetricAndNeverSelfReferential) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    EXPECT_EQ(MergeEngine::conflict_id("branch-a", "branch-b", "a.ts"),
              MergeEngine::conflict_id("branch-b", "branch-a", "a.ts"));
    EXPECT_NE(MergeEngine::conflict_id("branch-a", "branch-b", "a.ts"),
              MergeEngine::conflict_id("branch-a", "branch-b", "b.ts"));

    const auto a = branch_with(replace(kBase, "return a + b;", "return 10;"));
    EXPECT_TRUE(engine.detect_conflicts({a, a}).empty());
}

TEST_F(MergeEngineFixture, IdenticalEditsAreNotConflicts) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    const std::string same = replace(kBase, "return a + b;", "return 10;");
    const auto a = branch_with(same);
    const auto b = branch_with(same);
    EXPECT_TRUE(engine.detect_conflicts({a, b}).empty());
}

TEST_F(MergeEngineFixture, AutoResolvesCompatibleLineEdits) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    const auto a = branch_with(replace(kBase, "const a = 1;", "const a = 10;"));
    const auto b = branch_with(replace(kBase, "return a + b;", "return a * b;"));

    const auto conflicts = engine.detect_conflicts({a, b});
    ASSERT_EQ(conflicts.size(), 1u);

    auto resolution = engine.resolve_conflict(conflicts[0]);
    ASSERT_FALSE(is_error(resolution));
    const auto& resolved = get_value(resolution);
    EXPECT_EQ(resolved.strategy, ResolutionStrategy::Auto);
    ASSERT_TRUE(resolved.resolved_content.has_value());
    EXPECT_NE(resolved.resolved_content->find("const a = 10;"), std::string::npos);
    EXPECT_NE(resolved.resolved_content->find("return a * b;"), std::string::npos);

    ASSERT_FALSE(is_error(engine.apply_resolution(resolved)));
    EXPECT_TRUE(engine.active_conflicts().empty());
    EXPECT_EQ(events_.count("conflict.applied"), 1u);

    const auto ours = branches_.get_branch(conflicts[0].ours.branch_id);
    const auto theirs = branches_.get_branch(conflicts[0].theirs.branch_id);
    ASSERT_TRUE(ours.has_value());
    ASSERT_TRUE(theirs.has_value());
    ASSERT_EQ(ours->changes.size(), 1u);
    EXPECT_EQ(ours->changes[0].modified_content, *resolved.resolved_content);
    EXPECT_TRUE(theirs->changes.empty());
}

TEST_F(MergeEngineFixture, SideThatOnlyExtendsTheOtherWins) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    const std::string smaller = replace(kBase, "  const b = 2;\n", "  const b = 2;\n  const c = 3;\n");
    const std::string larger =
        replace(kBase, "  const b = 2;\n", "  const b = 2;\n  const c = 3;\n  const d = 4;\n");
    branch_with(smaller);
    branch_with(larger);
    const auto conflicts = engine.detect_conflicts();
    ASSERT_EQ(conflicts.size(), 1u);

    auto resolution = engine.resolve_conflict(conflicts[0]);
    ASSERT_FALSE(is_error(resolution));
    EXPECT_EQ(get_value(resolution).strategy, ResolutionStrategy::Auto);
    EXPECT_EQ(get_value(resolution).resolved_content.value_or(""), larger);
}

TEST_F(MergeEngineFixture, SupersetRuleKeepsTheOtherSidesDeletion) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    // Every line of `deleted` also appears in `extended`, but `deleted`
    // removed a base line that `extended` still carries.
    const std::string deleted = replace(kBase, "  const b = 2;\n", "");
    const std::string extended =
        replace(kBase, "  const b = 2;\n", "  const b = 2;\n  const c = 3;\n");
    branch_with(deleted);
    branch_with(extended);
    const auto conflicts = engine.detect_conflicts();
    ASSERT_EQ(conflicts.size(), 1u);

    auto automatic = engine.resolve_conflict(conflicts[0], ResolutionStrategy::Auto);
    ASSERT_TRUE(is_error(automatic));
    EXPECT_EQ(get_error(automatic).code, "auto_merge_failed");

    auto fallback = engine.resolve_conflict(conflicts[0]);
    ASSERT_FALSE(is_error(fallback));
    EXPECT_EQ(get_value(fallback).strategy, ResolutionStrategy::Manual);
}

TEST_F(MergeEngineFixture, WithoutAssistantUnresolvableConflictIsManual) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    const auto a = branch_with(replace(kBase, "return a + b;", "return 10;"));
    const auto b = branch_with(replace(kBase, "return a + b;", "return 20;"));
    const auto conflicts = engine.detect_conflicts({a, b});
    ASSERT_EQ(conflicts.size(), 1u);

    auto resolution = engine.resolve_conflict(conflicts[0]);
    ASSERT_FALSE(is_error(resolution));
    const auto& manual = get_value(resolution);
    EXPECT_EQ(manual.strategy, ResolutionStrategy::Manual);
    EXPECT_FALSE(manual.resolved_content.has_value());
    EXPECT_EQ(manual.ours_content, conflicts[0].ours.content);
    EXPECT_EQ(manual.theirs_content, conflicts[0].theirs.content);
    EXPECT_EQ(manual.base_content, kBase);

    auto applied = engine.apply_resolution(manual);
    ASSERT_TRUE(is_error(applied));
    EXPECT_EQ(get_error(applied).code, "resolution_incomplete");
    EXPECT_EQ(engine.active_conflicts().size(), 1u);
}

TEST_F(MergeEngineFixture, ExplicitStrategiesFailInsteadOfFallingBack) {
    MergeEngine engine(branches_, RegionAnalyzer(), events_);
    const auto a = branch_with(replace(kBase, "return a + b;", "return 10;"));
    const auto b = branch_with(replace(kBase, "return a + b;", "return 20;"));
    const auto conflicts = engine.detect_conflicts({a, b});
    ASSERT_EQ(conflicts.size(), 1u);

    auto automatic = engine.resolve_conflict(conflicts[0], ResolutionStrategy::Auto);
    ASSERT_TRUE(is_error(automatic));
    EXPECT_EQ(get_error(automatic).code, "auto_merge_failed");

    auto ai = engine.resolve_conflict(conflicts[0], ResolutionStrategy::AiAssisted);
    ASSERT_TRUE(is_error(ai));
    EXPECT_EQ(get_error(ai).code, "ai_merge_unavailable");
}

TEST_F(MergeEngineFixture, AssistantResolvesWhenAutoCannot) {
    ScriptedModelClient assistant;
    assistant.set_default_reply("Here it is:\n```ts\nexport function foo() { return 30; }\n```\n");
    MergeEngine engine(branches_, RegionAnalyzer(), events_, &assistant);
    EXPECT_TRUE(engine.ai_available());

    const auto a = branch_with(replace(kBase, "return a + b;", "return 10;"));
    const auto b = branch_with(replace(kBase, "return a + b;", "return 20;"));
    const auto conflicts = engine.detect_conflicts({a, b});
    ASSERT_EQ(conflicts.size(), 1u);

    auto resolution = engine.resolve_conflict(conflicts[0]);
    ASSERT_FALSE(is_error(resolution));
    EXPECT_EQ(get_value(resolution).strategy, ResolutionStrategy::AiAssisted);
    EXPECT_EQ(get_value(resolution).resolved_content.value_or(""),
              "export function foo() { return 30; }");
    ASSERT_EQ(assistant.prompts().size(), 1u);
    EXPECT_NE(assistant.prompts()[0].find("CONFLICTING REGIONS"), std::string::npos);
}

TEST_F(MergeEngineFixture, DisabledAiMergeIgnoresAssistant) {
    ScriptedModelClient assistant;
    MergeEngineConfig config;
    config.enable_ai_merge = false;
    MergeEngine engine(branches_, RegionAnalyzer(), events_, &assistant, config);
    EXPECT_FALSE(engine.ai_available());
}

TEST(MergeEngineTest, ExtractCodeBlock) {
    EXPECT_EQ(extract_code_block("```ts\nlet a;\n```").value_or(""), "let a;");
    EXPECT_EQ(extract_code_block("pre\n```\nx\ny\n```\npost").value_or(""), "x\ny");
    EXPECT_FALSE(extract_code_block("no code here").has_value());
    EXPECT_FALSE(extract_code_block("```ts\nunterminated").has_value());
}

}  // namespace
