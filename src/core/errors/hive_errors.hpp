#pragma once
#include <string>
#include <variant>

namespace hive::core::errors {

    // 1. Stable failure kinds every component reports
    enum class ErrorKind {
        NotFound,           // Unknown task, mission, branch, agent or conflict id
        InvalidState,       // Operation not allowed from the entity's current status
        DependenciesUnmet,  // Task start refused by the dependency rules
        InvalidTransition,  // Mission phase edge not in the phase graph
        CapacityExceeded,   // Scheduler or pool ceiling reached
        QuotaExceeded,      // Provider is past the hard-stop threshold
        Timeout,            // Task or queued request deadline fired
        Cancelled,          // Cancellation token fired
        ExecutionFailed,    // Model call, task or phase failed (retryable)
        MergeFailed,        // Branch could not be applied to the workspace
        NoRollbackPoint,    // Rollback requested with an empty history
        Input,              // Bad CLI flag, config value or plan document
        Policy,             // Workspace policy violation
        Internal            // I/O or logic failure inside hive itself
    };

    // The standardized error payload
    struct HiveError {
            ErrorKind kind;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy
    // A Result holds either a successful value of type T, OR a HiveError.
    template <typename T>
    using Result = std::variant<T, HiveError>;

    // Operations with nothing to return on success.
    using Unit = std::monostate;
    using Status = Result<Unit>;

    inline Status ok() {
        return Unit{};
    }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<HiveError>(result);
    }

    template <typename T>
    const HiveError& get_error(const Result<T>& result) {
        return std::get<HiveError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorKind kind) {
        switch (kind) {
            case ErrorKind::NotFound: return "not_found";
            case ErrorKind::InvalidState: return "invalid_state";
            case ErrorKind::DependenciesUnmet: return "dependencies_unmet";
            case ErrorKind::InvalidTransition: return "invalid_transition";
            case ErrorKind::CapacityExceeded: return "capacity_exceeded";
            case ErrorKind::QuotaExceeded: return "quota_exceeded";
            case ErrorKind::Timeout: return "timeout";
            case ErrorKind::Cancelled: return "cancelled";
            case ErrorKind::ExecutionFailed: return "execution_failed";
            case ErrorKind::MergeFailed: return "merge_failed";
            case ErrorKind::NoRollbackPoint: return "no_rollback_point";
            case ErrorKind::Input: return "input";
            case ErrorKind::Policy: return "policy";
            case ErrorKind::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace hive::core::errors
