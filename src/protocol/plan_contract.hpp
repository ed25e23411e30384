#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/config/ids.hpp"
#include "protocol/capability_contract.hpp"
#include "protocol/change_contract.hpp"
#include "protocol/model_contract.hpp"
#include "protocol/task_contract.hpp"

namespace hive::protocol {

struct PlanDependency {
    std::string key;
    DependencyType type = DependencyType::Required;
};

// One unit of work in a mission plan; `key` is unique within the plan.
struct ExecutionTaskConfig {
    std::string key;
    std::string type = "implement";
    std::string description;
    std::optional<std::string> prompt;
    TaskPriority priority = TaskPriority::Normal;
    std::vector<PlanDependency> depends_on;
    std::vector<std::string> relevant_files;
    std::optional<std::uint32_t> max_tokens;
    std::string provider = "claude";
    HierarchyTier tier = HierarchyTier::Worker;
};

struct ExecutionPlan {
    std::string mission_id;
    std::vector<ExecutionTaskConfig> tasks;
    std::vector<FileChange> changes;  // Files the plan expects to touch
    bool require_approval = false;
};

enum class ExecutionStage {
    Planning,
    Validation,
    Execution,
    Merge,
    Verification,
    Completion
};

struct ExecutionProgress {
    std::string execution_id;
    std::string mission_id;
    ExecutionStage stage = ExecutionStage::Planning;
    std::size_t tasks_completed = 0;
    std::size_t tasks_total = 0;
    std::string message;
    core::config::SystemTime timestamp{};
};

struct MergeSummary {
    std::vector<std::string> merged_branches;
    std::vector<std::string> failed_branches;
    std::size_t conflicts_detected = 0;
    std::size_t conflicts_resolved = 0;
    std::size_t conflicts_unresolved = 0;
};

struct ExecutionResult {
    std::string execution_id;
    std::string mission_id;
    bool success = false;
    std::chrono::milliseconds duration{0};
    std::size_t tasks_completed = 0;
    std::vector<FileChange> changes;
    std::optional<VerificationReport> verification;
    MergeSummary merge;
};

// Line the coordinator puts in every task prompt; scripted replies key on it.
inline std::string task_marker(const std::string& task_key) {
    return "[task:" + task_key + "]";
}

inline std::string to_string(const ExecutionStage stage) {
    switch (stage) {
        case ExecutionStage::Planning:
            return "planning";
        case ExecutionStage::Validation:
            return "validation";
        case ExecutionStage::Execution:
            return "execution";
        case ExecutionStage::Merge:
            return "merge";
        case ExecutionStage::Verification:
            return "verification";
        case ExecutionStage::Completion:
            return "completion";
        default:
            return "unknown";
    }
}

}  // namespace hive::protocol
