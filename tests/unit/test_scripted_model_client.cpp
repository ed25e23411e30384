#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "runtime/scripted_model_client.hpp"

namespace {

using hive::core::concurrency::CancelToken;
using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::HiveError;
using hive::core::errors::is_error;
using hive::protocol::CompletionRequest;
using hive::runtime::ScriptedModelClient;

CompletionRequest prompt(const std::string& text) {
    CompletionRequest request;
    request.prompt = text;
    return request;
}

TEST(ScriptedModelClientTest, FirstMatchingRuleWins) {
    ScriptedModelClient model;
    model.add_reply("[task:a]", "reply a");
    model.add_reply("[task:", "generic");

    auto result = model.complete(prompt("[task:a]\ndo it"), CancelToken());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).content, "reply a");
    EXPECT_EQ(get_value(result).model, "scripted");
    EXPECT_GT(get_value(result).usage.total_tokens, 0u);

    auto other = model.complete(prompt("[task:b]\nelse"), CancelToken());
    ASSERT_FALSE(is_error(other));
    EXPECT_EQ(get_value(other).content, "generic");
    EXPECT_EQ(model.call_count(), 2u);
}

TEST(ScriptedModelClientTest, UnmatchedPromptFallsBack) {
    ScriptedModelClient model;
    auto echoed = model.complete(prompt("first line\nsecond"), CancelToken());
    ASSERT_FALSE(is_error(echoed));
    EXPECT_EQ(get_value(echoed).content, "Acknowledged: first line");

    model.set_default_reply("default");
    auto fallback = model.complete(prompt("anything"), CancelToken());
    ASSERT_FALSE(is_error(fallback));
    EXPECT_EQ(get_value(fallback).content, "default");
}

TEST(ScriptedModelClientTest, RuleFailsConfiguredNumberOfTimes) {
    ScriptedModelClient model;
    model.add_reply("flaky", "finally", 2);

    for (int i = 0; i < 2; ++i) {
        auto failed = model.complete(prompt("flaky"), CancelToken());
        ASSERT_TRUE(is_error(failed));
        EXPECT_EQ(get_error(failed).kind, ErrorKind::ExecutionFailed);
        EXPECT_EQ(get_error(failed).code, "scripted_failure");
    }
    auto ok = model.complete(prompt("flaky"), CancelToken());
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).content, "finally");
}

TEST(ScriptedModelClientTest, ForcedFailuresOverrideRules) {
    ScriptedModelClient model;
    model.add_reply("x", "ok");
    model.fail_next(1, HiveError{ErrorKind::Timeout, "slow backend", "backend_timeout"});

    auto failed = model.complete(prompt("x"), CancelToken());
    ASSERT_TRUE(is_error(failed));
    EXPECT_EQ(get_error(failed).code, "backend_timeout");
    EXPECT_FALSE(is_error(model.complete(prompt("x"), CancelToken())));
}

TEST(ScriptedModelClientTest, CancellationInterruptsLatency) {
    ScriptedModelClient model("scripted", std::chrono::seconds(5));
    CancelToken token;
    token.cancel();

    const auto started = std::chrono::steady_clock::now();
    auto result = model.complete(prompt("x"), token);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
    EXPECT_EQ(model.prompts().size(), 1u);
}

}  // namespace
