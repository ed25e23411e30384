#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/config/ids.hpp"
#include "core/errors/hive_errors.hpp"
#include "merge/branch_manager.hpp"
#include "merge/merge_engine.hpp"
#include "mission/mission_manager.hpp"
#include "pool/agent_pool.hpp"
#include "protocol/capability_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/workspace_contract.hpp"
#include "scheduler/retry_policy.hpp"
#include "scheduler/task_scheduler.hpp"

namespace hive::runtime {

struct CoordinatorConfig {
    scheduler::RetryPolicy retry_policy;
    std::chrono::milliseconds phase_transition_delay{0};
    bool require_approval = false;  // Or-ed with the plan's own flag
    std::size_t max_parallel_tasks = 4;
    std::size_t max_context_bytes = 32 * 1024;  // Per relevant file
    // While the scheduler has no free slot for any ready task, re-check at this
    // interval and give up with CapacityExceeded after the timeout.
    std::chrono::milliseconds capacity_poll_interval{50};
    std::chrono::milliseconds capacity_wait_timeout{std::chrono::minutes(5)};
};

// Everything the coordinator drives. Owned by the caller and expected to
// outlive the coordinator.
struct Collaborators {
    mission::MissionManager& missions;
    scheduler::TaskScheduler& tasks;
    pool::AgentPool& agents;
    merge::BranchManager& branches;
    merge::MergeEngine& merges;
    protocol::PreflightChecker& preflight;
    protocol::Verifier& verifier;
    protocol::RollbackStore& rollback;
    protocol::ApprovalGate& approval;
    protocol::FileSystem& files;
    protocol::EventSink& events;
};

enum class ExecutionState {
    Idle,
    Running
};

// Outcome of one task run outside the plan machinery.
struct TaskOutput {
    std::string task_id;
    std::string agent_id;
    std::string response;
    std::vector<protocol::FileChange> changes;
    std::uint64_t tokens_used = 0;
    std::chrono::milliseconds duration{0};
};

struct CoordinatorStats {
    std::size_t active_executions = 0;
    std::size_t succeeded_executions = 0;
    std::size_t failed_executions = 0;
    std::size_t cancelled_executions = 0;
    scheduler::SchedulerStats tasks;
    pool::PoolStats agents;
    mission::MissionStats missions;
    merge::BranchStats branches;
};

// Drives one mission through planning, validation, execution, merge,
// verification and completion.
//
// Each execute() call gets its own execution id and a child of the caller's
// cancellation token. Tasks run in waves of ready tasks; every task works on
// its own virtual branch and nothing touches the workspace before the merge
// stage. Any failure after execution started abandons this execution's
// branches, rolls the mission back and fails it; cancellation cancels it.
class ExecutionCoordinator {
public:
    using ProgressHandler = std::function<void(const protocol::ExecutionProgress&)>;
    using HandlerId = std::size_t;

    ExecutionCoordinator(Collaborators collaborators, CoordinatorConfig config = {},
                         core::config::Clock clock = core::config::system_clock());

    ExecutionCoordinator(const ExecutionCoordinator&) = delete;
    ExecutionCoordinator& operator=(const ExecutionCoordinator&) = delete;

    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::ExecutionPlan& plan,
        const core::concurrency::CancelToken& cancel = core::concurrency::CancelToken());

    // Sends an existing task to the pool once and parses the reply. The task
    // record and the workspace are left untouched.
    core::errors::Result<TaskOutput> execute_task(
        const protocol::Task& task,
        const core::concurrency::CancelToken& cancel = core::concurrency::CancelToken());

    // Fires the cancellation token of the mission's running execution.
    core::errors::Status cancel(const std::string& mission_id);

    ExecutionState get_status(const std::string& mission_id) const;
    std::optional<protocol::ExecutionProgress> current_progress(
        const std::string& mission_id) const;

    HandlerId on_progress(ProgressHandler handler);
    void remove_progress_handler(HandlerId id);

    CoordinatorStats stats() const;

private:
    struct ActiveExecution {
        std::string id;
        std::string mission_id;
        core::concurrency::CancelToken token;
        protocol::ExecutionProgress progress;
        std::vector<std::string> branch_ids;
        std::chrono::steady_clock::time_point started{};
    };

    struct TaskRun {
        std::string task_id;
        std::string branch_id;
        std::vector<protocol::FileChange> changes;
    };

    using TaskRunResult = core::errors::Result<TaskRun>;

    core::errors::Result<protocol::ExecutionResult> run(ActiveExecution& execution,
                                                        const protocol::ExecutionPlan& plan);
    core::errors::Status run_planning(ActiveExecution& execution,
                                      const protocol::ExecutionPlan& plan);
    core::errors::Status run_validation(ActiveExecution& execution,
                                        const protocol::ExecutionPlan& plan);
    core::errors::Result<std::vector<TaskRun>> run_execution(
        ActiveExecution& execution, const protocol::ExecutionPlan& plan);
    core::errors::Result<protocol::MergeSummary> run_merge(
        ActiveExecution& execution, const std::vector<TaskRun>& runs,
        std::vector<protocol::FileChange>& merged_changes);
    core::errors::Result<protocol::VerificationReport> run_verification(
        ActiveExecution& execution, const std::vector<protocol::FileChange>& changes);

    TaskRunResult run_task(ActiveExecution& execution, const protocol::ExecutionTaskConfig& config,
                           const protocol::Task& task, bool require_approval);
    // Attempt loop: retryable failures back off and try again until the
    // retry policy runs out.
    core::errors::Result<protocol::AgentResponse> call_agent(
        const protocol::ExecutionTaskConfig& config, const protocol::Task& task,
        const core::concurrency::CancelToken& cancel);

    protocol::AgentRequest build_request(const protocol::ExecutionTaskConfig& config,
                                         const protocol::Task& task) const;
    std::vector<protocol::FileChange> normalize_changes(
        std::vector<protocol::FileChange> changes) const;

    core::errors::Status enter_stage(ActiveExecution& execution, protocol::ExecutionStage stage,
                                     const std::string& message);
    void report_progress(ActiveExecution& execution, const std::string& message);

    core::errors::HiveError handle_failure(ActiveExecution& execution,
                                           protocol::ExecutionStage stage,
                                           const core::errors::HiveError& cause);
    core::errors::HiveError handle_cancellation(ActiveExecution& execution);
    void abandon_branches(const ActiveExecution& execution, const std::string& reason);
    void finish(const ActiveExecution& execution, const std::string& outcome,
                const std::string& detail);

    Collaborators c_;
    CoordinatorConfig config_;
    core::config::Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ActiveExecution*> executions_;
    std::map<HandlerId, ProgressHandler> handlers_;
    HandlerId next_handler_ = 1;
    std::size_t succeeded_ = 0;
    std::size_t failed_ = 0;
    std::size_t cancelled_ = 0;
};

std::string to_string(ExecutionState state);

}  // namespace hive::runtime
