#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "app/config_loader.hpp"
#include "core/errors/hive_errors.hpp"
#include "test_support.hpp"

namespace {

using hive::app::HiveConfig;
using hive::app::load_config;
using hive::app::parse_config_text;
using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::core::logging::LogLevel;
using hive::testing::TempWorkspace;

TEST(ConfigLoaderTest, EmptyDocumentKeepsDefaults) {
    auto parsed = parse_config_text("{}");
    ASSERT_FALSE(is_error(parsed));
    const HiveConfig& config = get_value(parsed);
    EXPECT_EQ(config.scheduler.max_concurrent_tasks, 10u);
    EXPECT_EQ(config.pool.max_agents, 5u);
    EXPECT_EQ(config.quota.providers.size(), 2u);
    EXPECT_TRUE(config.merge.enable_ai_merge);
    EXPECT_FALSE(config.verification.command.has_value());
    EXPECT_TRUE(config.journal.enabled);
    EXPECT_EQ(config.journal.directory, ".hive_runs");
    EXPECT_EQ(config.logging.level, LogLevel::INFO);
}

TEST(ConfigLoaderTest, ReadsEverySection) {
    auto parsed = parse_config_text(R"({
        "scheduler": {"max_concurrent_tasks": 3, "task_timeout_ms": 1500,
                      "retry": {"max_attempts": 5, "initial_backoff_ms": 10,
                                "backoff_multiplier": 1.5, "max_backoff_ms": 100}},
        "pool": {"max_agents": 2, "min_request_interval_ms": 0, "default_temperature": 0.2},
        "quota": {"window_duration_ms": 60000, "estimated_capacity": 40,
                  "providers": ["claude"], "warning_threshold": 0.5},
        "merge": {"enable_ai_merge": false},
        "coordinator": {"max_parallel_tasks": 2, "require_approval": true,
                        "capacity_wait_timeout_ms": 2000},
        "verification": {"command": "make test", "timeout_ms": 9000},
        "preflight": {"protected_paths": ["vendor/"]},
        "rollback": {"max_points_per_mission": 7},
        "model": {"latency_ms": 25},
        "logging": {"level": "debug"},
        "journal": {"enabled": false}
    })");
    ASSERT_FALSE(is_error(parsed));
    const HiveConfig& config = get_value(parsed);

    EXPECT_EQ(config.scheduler.max_concurrent_tasks, 3u);
    EXPECT_EQ(config.scheduler.task_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.scheduler.retry_policy.max_attempts, 5u);
    EXPECT_DOUBLE_EQ(config.scheduler.retry_policy.backoff_multiplier, 1.5);
    EXPECT_EQ(config.coordinator.retry_policy.max_attempts, 5u);
    EXPECT_EQ(config.pool.max_agents, 2u);
    EXPECT_EQ(config.pool.min_request_interval, std::chrono::milliseconds(0));
    EXPECT_EQ(config.quota.window_duration, std::chrono::milliseconds(60000));
    EXPECT_DOUBLE_EQ(config.quota.estimated_capacity, 40.0);
    EXPECT_DOUBLE_EQ(config.quota.limits.warning_threshold, 0.5);
    EXPECT_FALSE(config.merge.enable_ai_merge);
    EXPECT_TRUE(config.coordinator.require_approval);
    EXPECT_EQ(config.coordinator.capacity_wait_timeout.count(), 2000);
    EXPECT_EQ(config.verification.command.value_or(""), "make test");
    EXPECT_EQ(config.preflight.protected_paths.front(), "vendor/");
    EXPECT_EQ(config.rollback.max_points_per_mission, 7u);
    EXPECT_EQ(config.model.latency, std::chrono::milliseconds(25));
    EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
    EXPECT_FALSE(config.journal.enabled);
}

TEST(ConfigLoaderTest, RejectsWrongTypesAndRanges) {
    const char* bad_documents[] = {
        R"({"scheduler": []})",
        R"({"scheduler": {"max_concurrent_tasks": 0}})",
        R"({"scheduler": {"retry": {"max_attempts": "three"}}})",
        R"({"pool": {"default_temperature": 3.5}})",
        R"({"merge": {"enable_ai_merge": "yes"}})",
        R"({"quota": {"providers": ["claude", 7]}})",
        R"({"logging": {"level": "loud"}})",
        R"({"journal": {"directory": ""}})",
        R"([1, 2])",
    };
    for (const char* text : bad_documents) {
        auto parsed = parse_config_text(text);
        ASSERT_TRUE(is_error(parsed)) << text;
        EXPECT_EQ(get_error(parsed).kind, ErrorKind::Input) << text;
        EXPECT_EQ(get_error(parsed).code, "invalid_config") << text;
    }
}

TEST(ConfigLoaderTest, NamesTheOffendingKey) {
    auto parsed = parse_config_text(R"({"scheduler": {"retry": {"max_attempts": 0}}})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_NE(get_error(parsed).message.find("scheduler.retry.max_attempts"), std::string::npos);
    EXPECT_FALSE(get_error(parsed).hint.empty());
}

TEST(ConfigLoaderTest, RejectsUnorderedQuotaThresholds) {
    auto parsed = parse_config_text(
        R"({"quota": {"warning_threshold": 0.9, "critical_threshold": 0.8}})");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_NE(get_error(parsed).message.find("warning <= critical"), std::string::npos);
}

TEST(ConfigLoaderTest, InvalidJsonIsInputError) {
    auto parsed = parse_config_text("{ not json");
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "invalid_config");
}

TEST(ConfigLoaderTest, LoadsFromFile) {
    TempWorkspace workspace("config_loader");
    workspace.write("hive.json", R"({"pool": {"max_agents": 9}})");

    auto loaded = load_config(workspace.root() / "hive.json");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).pool.max_agents, 9u);

    auto missing = load_config(workspace.root() / "absent.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "config_not_found");
}

}  // namespace
