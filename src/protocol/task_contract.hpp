#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/config/ids.hpp"

namespace hive::protocol {

enum class TaskStatus {
    Pending,
    Blocked,
    Running,
    Completed,
    Failed,
    Cancelled
};

// Declaration order is scheduling order: lower value runs first.
enum class TaskPriority {
    Critical,
    High,
    Normal,
    Low
};

enum class DependencyType {
    Required,  // Target must be completed
    Soft       // Target must not be running
};

struct TaskDependency {
    std::string task_id;
    DependencyType type = DependencyType::Required;
};

struct TaskResult {
    bool success = false;
    std::string output;
    std::string error;
    std::chrono::milliseconds duration{0};
};

// Caller-supplied fields for a new task.
struct TaskSpec {
    std::string type;
    std::string description;
    TaskPriority priority = TaskPriority::Normal;
    std::vector<TaskDependency> dependencies;
    std::map<std::string, std::string> metadata;
};

struct Task {
    std::string id;
    std::string mission_id;
    std::string type;
    std::string description;
    TaskStatus status = TaskStatus::Pending;
    TaskPriority priority = TaskPriority::Normal;
    std::vector<TaskDependency> dependencies;
    std::map<std::string, std::string> metadata;

    std::uint32_t retry_attempt = 0;
    std::optional<std::string> retried_from;
    std::optional<std::string> cancel_reason;
    std::optional<TaskResult> result;

    std::uint64_t sequence = 0;
    core::config::SystemTime created_at{};
    std::optional<core::config::SystemTime> started_at;
    std::optional<core::config::SystemTime> completed_at;
};

inline bool is_terminal(const TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

inline std::string to_string(const TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending:
            return "pending";
        case TaskStatus::Blocked:
            return "blocked";
        case TaskStatus::Running:
            return "running";
        case TaskStatus::Completed:
            return "completed";
        case TaskStatus::Failed:
            return "failed";
        case TaskStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline std::string to_string(const TaskPriority priority) {
    switch (priority) {
        case TaskPriority::Critical:
            return "critical";
        case TaskPriority::High:
            return "high";
        case TaskPriority::Normal:
            return "normal";
        case TaskPriority::Low:
            return "low";
        default:
            return "unknown";
    }
}

inline std::string to_string(const DependencyType type) {
    return type == DependencyType::Required ? "required" : "soft";
}

inline std::optional<TaskPriority> parse_priority(const std::string& text) {
    if (text == "critical") return TaskPriority::Critical;
    if (text == "high") return TaskPriority::High;
    if (text == "normal") return TaskPriority::Normal;
    if (text == "low") return TaskPriority::Low;
    return std::nullopt;
}

inline std::optional<DependencyType> parse_dependency_type(const std::string& text) {
    if (text == "required") return DependencyType::Required;
    if (text == "soft") return DependencyType::Soft;
    return std::nullopt;
}

}  // namespace hive::protocol
