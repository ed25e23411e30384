#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "protocol/mission_contract.hpp"

namespace hive::protocol {

    // Lifecycle notifications, one struct per component
    enum class TaskEventKind { Created, Started, Completed, Failed, Cancelled, Unblocked, TimedOut };
    struct TaskEvent {
        TaskEventKind kind;
        std::string task_id;
        std::string mission_id;
        std::string detail;
    };

    enum class MissionEventKind { Created, Started, Paused, Resumed, PhaseChanged, ProgressUpdated, Completed, Failed, Cancelled, RolledBack };
    struct MissionEvent {
        MissionEventKind kind;
        std::string mission_id;
        std::optional<MissionPhase> from_phase;
        std::optional<MissionPhase> to_phase;
        std::string detail;
    };

    enum class AgentEventKind { Created, Retired, Responded, Failed };
    struct AgentEvent {
        AgentEventKind kind;
        std::string agent_id;
        std::string request_id;
        std::string detail;
    };

    enum class QuotaEventKind { Warning, Critical, Exceeded, Reset };
    struct QuotaEvent {
        QuotaEventKind kind;
        std::string provider;
        double usage_ratio = 0.0;
        std::chrono::milliseconds reset_in{0};
    };

    enum class BranchEventKind { Created, Merged, Abandoned, MergeFailed };
    struct BranchEvent {
        BranchEventKind kind;
        std::string branch_id;
        std::string agent_id;
        std::string task_id;
        std::string detail;
    };

    enum class ConflictEventKind { Detected, Resolved, Applied };
    struct ConflictEvent {
        ConflictEventKind kind;
        std::string conflict_id;
        std::string file_path;
        std::string branch_a;
        std::string branch_b;
        std::string detail;
    };

    enum class ExecutionEventKind { Started, StageEntered, ImpactAnalyzed, PreflightWarnings, Progress, Finished };
    struct ExecutionEvent {
        ExecutionEventKind kind;
        std::string execution_id;
        std::string mission_id;
        std::string stage;
        std::string detail;
        std::vector<std::string> items;
    };

    // A HiveEvent is exactly ONE of the event types below.
    using HiveEvent = std::variant<
        TaskEvent,
        MissionEvent,
        AgentEvent,
        QuotaEvent,
        BranchEvent,
        ConflictEvent,
        ExecutionEvent
    >;

    // Outbound notification channel. Publishing never fails and never
    // changes the caller's control flow.
    class EventSink {
    public:
        virtual ~EventSink() = default;
        virtual void publish(const HiveEvent& event) = 0;
    };

    class NullEventSink final : public EventSink {
    public:
        void publish(const HiveEvent&) override {}
    };

    // Forwards every event to each registered sink in order.
    class FanoutEventSink final : public EventSink {
    public:
        void add(EventSink& sink) { sinks_.push_back(&sink); }

        void publish(const HiveEvent& event) override {
            for (EventSink* sink : sinks_) {
                sink->publish(event);
            }
        }

    private:
        std::vector<EventSink*> sinks_;
    };

    inline std::string to_string(const TaskEventKind kind) {
        switch (kind) {
            case TaskEventKind::Created: return "created";
            case TaskEventKind::Started: return "started";
            case TaskEventKind::Completed: return "completed";
            case TaskEventKind::Failed: return "failed";
            case TaskEventKind::Cancelled: return "cancelled";
            case TaskEventKind::Unblocked: return "unblocked";
            case TaskEventKind::TimedOut: return "timed_out";
            default: return "unknown";
        }
    }

    inline std::string to_string(const MissionEventKind kind) {
        switch (kind) {
            case MissionEventKind::Created: return "created";
            case MissionEventKind::Started: return "started";
            case MissionEventKind::Paused: return "paused";
            case MissionEventKind::Resumed: return "resumed";
            case MissionEventKind::PhaseChanged: return "phase_changed";
            case MissionEventKind::ProgressUpdated: return "progress_updated";
            case MissionEventKind::Completed: return "completed";
            case MissionEventKind::Failed: return "failed";
            case MissionEventKind::Cancelled: return "cancelled";
            case MissionEventKind::RolledBack: return "rolled_back";
            default: return "unknown";
        }
    }

    inline std::string to_string(const AgentEventKind kind) {
        switch (kind) {
            case AgentEventKind::Created: return "created";
            case AgentEventKind::Retired: return "retired";
            case AgentEventKind::Responded: return "responded";
            case AgentEventKind::Failed: return "failed";
            default: return "unknown";
        }
    }

    inline std::string to_string(const QuotaEventKind kind) {
        switch (kind) {
            case QuotaEventKind::Warning: return "warning";
            case QuotaEventKind::Critical: return "critical";
            case QuotaEventKind::Exceeded: return "exceeded";
            case QuotaEventKind::Reset: return "reset";
            default: return "unknown";
        }
    }

    inline std::string to_string(const BranchEventKind kind) {
        switch (kind) {
            case BranchEventKind::Created: return "created";
            case BranchEventKind::Merged: return "merged";
            case BranchEventKind::Abandoned: return "abandoned";
            case BranchEventKind::MergeFailed: return "merge_failed";
            default: return "unknown";
        }
    }

    inline std::string to_string(const ConflictEventKind kind) {
        switch (kind) {
            case ConflictEventKind::Detected: return "detected";
            case ConflictEventKind::Resolved: return "resolved";
            case ConflictEventKind::Applied: return "applied";
            default: return "unknown";
        }
    }

    inline std::string to_string(const ExecutionEventKind kind) {
        switch (kind) {
            case ExecutionEventKind::Started: return "started";
            case ExecutionEventKind::StageEntered: return "stage_entered";
            case ExecutionEventKind::ImpactAnalyzed: return "impact_analyzed";
            case ExecutionEventKind::PreflightWarnings: return "preflight_warnings";
            case ExecutionEventKind::Progress: return "progress";
            case ExecutionEventKind::Finished: return "finished";
            default: return "unknown";
        }
    }

    // Dotted event name, e.g. "task.unblocked" or "quota.exceeded"
    inline std::string event_name(const HiveEvent& event) {
        return std::visit(
            [](const auto& e) -> std::string {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, TaskEvent>) {
                    return "task." + to_string(e.kind);
                } else if constexpr (std::is_same_v<T, MissionEvent>) {
                    return "mission." + to_string(e.kind);
                } else if constexpr (std::is_same_v<T, AgentEvent>) {
                    return "agent." + to_string(e.kind);
                } else if constexpr (std::is_same_v<T, QuotaEvent>) {
                    return "quota." + to_string(e.kind);
                } else if constexpr (std::is_same_v<T, BranchEvent>) {
                    return "branch." + to_string(e.kind);
                } else if constexpr (std::is_same_v<T, ConflictEvent>) {
                    return "conflict." + to_string(e.kind);
                } else {
                    return "execution." + to_string(e.kind);
                }
            },
            event);
    }

} // namespace hive::protocol
