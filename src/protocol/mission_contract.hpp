#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/config/ids.hpp"
#include "protocol/task_contract.hpp"

namespace hive::protocol {

enum class MissionStatus {
    Pending,
    Active,
    Paused,
    Completed,
    Failed,
    Cancelled
};

// Declaration order is the forward phase order.
enum class MissionPhase {
    Planning,
    Validation,
    Execution,
    Verification,
    Completion
};

struct MissionConfig {
    std::string title;
    std::string description;
    TaskPriority priority = TaskPriority::Normal;
    std::vector<std::string> scope;
    std::vector<std::string> constraints;
    std::map<std::string, std::string> metadata;
};

struct MissionProgress {
    MissionPhase phase = MissionPhase::Planning;
    double phase_progress = 0.0;    // 0..100 within the current phase
    double percent_complete = 0.0;  // 0..100 across all phases
    std::size_t tasks_total = 0;
    std::size_t tasks_completed = 0;
    std::optional<core::config::SystemTime> started_at;
    std::optional<core::config::SystemTime> estimated_completion;
};

struct Mission {
    std::string id;
    std::string title;
    std::string description;
    MissionStatus status = MissionStatus::Pending;
    MissionPhase phase = MissionPhase::Planning;
    TaskPriority priority = TaskPriority::Normal;
    std::vector<std::string> scope;
    std::vector<std::string> constraints;
    std::map<std::string, std::string> metadata;
    std::optional<std::string> failure_reason;
    std::optional<std::string> cancel_reason;
    core::config::SystemTime created_at{};
    std::optional<core::config::SystemTime> started_at;
    std::optional<core::config::SystemTime> completed_at;
};

inline bool is_terminal(const MissionStatus status) {
    return status == MissionStatus::Completed || status == MissionStatus::Cancelled;
}

inline std::string to_string(const MissionStatus status) {
    switch (status) {
        case MissionStatus::Pending:
            return "pending";
        case MissionStatus::Active:
            return "active";
        case MissionStatus::Paused:
            return "paused";
        case MissionStatus::Completed:
            return "completed";
        case MissionStatus::Failed:
            return "failed";
        case MissionStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline std::string to_string(const MissionPhase phase) {
    switch (phase) {
        case MissionPhase::Planning:
            return "planning";
        case MissionPhase::Validation:
            return "validation";
        case MissionPhase::Execution:
            return "execution";
        case MissionPhase::Verification:
            return "verification";
        case MissionPhase::Completion:
            return "completion";
        default:
            return "unknown";
    }
}

}  // namespace hive::protocol
