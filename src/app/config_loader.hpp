#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/hive_errors.hpp"
#include "core/logging/logger.hpp"
#include "merge/merge_engine.hpp"
#include "pool/agent_pool.hpp"
#include "quota/quota_tracker.hpp"
#include "runtime/execution_coordinator.hpp"
#include "scheduler/task_scheduler.hpp"

namespace hive::app {

struct VerificationSettings {
    std::optional<std::string> command;  // Pass-through verification when absent
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};
};

struct PreflightSettings {
    std::vector<std::string> protected_paths = {".git", ".hive_runs"};
};

struct RollbackSettings {
    std::size_t max_points_per_mission = 50;
};

struct ModelSettings {
    std::chrono::milliseconds latency{0};  // Simulated latency of scripted replies
};

struct LoggingSettings {
    core::logging::LogLevel level = core::logging::LogLevel::INFO;
};

struct JournalSettings {
    bool enabled = true;
    std::string directory = ".hive_runs";
};

// Every section is optional in the file; missing keys keep these defaults.
struct HiveConfig {
    scheduler::SchedulerConfig scheduler;
    pool::PoolConfig pool;
    quota::QuotaConfig quota;
    merge::MergeEngineConfig merge;
    runtime::CoordinatorConfig coordinator;
    VerificationSettings verification;
    PreflightSettings preflight;
    RollbackSettings rollback;
    ModelSettings model;
    LoggingSettings logging;
    JournalSettings journal;
};

core::errors::Result<HiveConfig> parse_config(const nlohmann::json& document);
core::errors::Result<HiveConfig> parse_config_text(const std::string& text);
core::errors::Result<HiveConfig> load_config(const std::filesystem::path& path);

}  // namespace hive::app
