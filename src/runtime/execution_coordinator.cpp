#include "runtime/execution_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <optional>
#include <set>
#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"
#include "runtime/change_parser.hpp"

namespace hive::runtime {

using core::concurrency::CancelToken;
using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::ChangeType;
using protocol::ExecutionEvent;
using protocol::ExecutionEventKind;
using protocol::ExecutionPlan;
using protocol::ExecutionProgress;
using protocol::ExecutionResult;
using protocol::ExecutionStage;
using protocol::ExecutionTaskConfig;
using protocol::FileChange;
using protocol::Task;
using protocol::TaskResult;

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out << separator;
        }
        out << items[i];
    }
    return out.str();
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
}

HiveError cancelled(const std::string& message) {
    return HiveError{ErrorKind::Cancelled, message, "execution_cancelled"};
}

std::string system_context_for(const Task& task) {
    std::ostringstream out;
    out << "You are an agent executing one coding task of a larger mission.\n\n"
        << "Task type: " << task.type << "\n"
        << "Task description: " << task.description << "\n"
        << "Priority: " << protocol::to_string(task.priority) << "\n\n"
        << "Output format:\n"
        << "- Return every file you change as a fenced code block tagged with its path,\n"
        << "  for example ```ts:src/app.ts\n"
        << "- Each block holds the complete new content of the file, not a diff.\n"
        << "- Use a line \"### Delete: <path>\" to remove a file.";
    return out.str();
}

// Structural checks the plan loader also performs; plans built in code reach
// the coordinator without passing through it.
core::errors::Status validate_plan(const ExecutionPlan& plan) {
    if (plan.mission_id.empty()) {
        return HiveError{ErrorKind::Input, "Execution plan has no mission id.", "invalid_plan"};
    }
    std::set<std::string> keys;
    for (const auto& task : plan.tasks) {
        if (task.key.empty()) {
            return HiveError{ErrorKind::Input, "Plan task without a key.", "invalid_plan"};
        }
        if (!keys.insert(task.key).second) {
            return HiveError{ErrorKind::Input, "Duplicate task key: " + task.key,
                             "plan_duplicate_key"};
        }
    }
    for (const auto& task : plan.tasks) {
        for (const auto& dependency : task.depends_on) {
            if (keys.count(dependency.key) == 0) {
                return HiveError{ErrorKind::Input,
                                 "Task " + task.key + " depends on unknown task " + dependency.key,
                                 "plan_unknown_dependency"};
            }
        }
    }
    return core::errors::ok();
}

}  // namespace

ExecutionCoordinator::ExecutionCoordinator(Collaborators collaborators, CoordinatorConfig config,
                                           core::config::Clock clock)
    : c_(collaborators), config_(std::move(config)), clock_(std::move(clock)) {
    if (config_.max_parallel_tasks == 0) {
        config_.max_parallel_tasks = 1;
    }
}

core::errors::Result<ExecutionResult> ExecutionCoordinator::execute(const ExecutionPlan& plan,
                                                                    const CancelToken& cancel) {
    ActiveExecution execution;
    execution.mission_id = plan.mission_id;
    execution.token = cancel.child();
    execution.started = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : executions_) {
            if (entry.second->mission_id == plan.mission_id) {
                return HiveError{ErrorKind::InvalidState,
                                 "Mission already has a running execution: " + plan.mission_id,
                                 "execution_already_running"};
            }
        }

        constexpr int kMaxAttempts = 16;
        for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
            const std::string candidate = core::config::generate_id("exec");
            if (executions_.find(candidate) == executions_.end()) {
                execution.id = candidate;
                break;
            }
        }
        if (execution.id.empty()) {
            return HiveError{ErrorKind::Internal, "Unable to allocate unique execution ID.",
                             "execution_id_generation_failed"};
        }

        execution.progress.execution_id = execution.id;
        execution.progress.mission_id = plan.mission_id;
        execution.progress.stage = ExecutionStage::Planning;
        execution.progress.tasks_total = plan.tasks.size();
        execution.progress.message = "Starting execution";
        execution.progress.timestamp = clock_();
        executions_.emplace(execution.id, &execution);
    }

    auto result = run(execution, plan);

    std::lock_guard<std::mutex> lock(mutex_);
    executions_.erase(execution.id);
    if (!core::errors::is_error(result)) {
        succeeded_ += 1;
    } else if (core::errors::get_error(result).kind == ErrorKind::Cancelled) {
        cancelled_ += 1;
    } else {
        failed_ += 1;
    }
    return result;
}

core::errors::Result<ExecutionResult> ExecutionCoordinator::run(ActiveExecution& execution,
                                                                const ExecutionPlan& plan) {
    const std::string& mission_id = plan.mission_id;
    LOG_INFO("ExecutionCoordinator: execution " + execution.id + " started for mission " +
             mission_id + " (" + std::to_string(plan.tasks.size()) + " tasks)");
    c_.events.publish(ExecutionEvent{ExecutionEventKind::Started, execution.id, mission_id,
                                     protocol::to_string(ExecutionStage::Planning), "", {}});

    auto started = c_.missions.start(mission_id);
    if (core::errors::is_error(started)) {
        const HiveError& error = core::errors::get_error(started);
        LOG_ERROR("ExecutionCoordinator: execution " + execution.id +
                  " could not start mission: " + error.message);
        finish(execution, "failed", error.message);
        return error;
    }

    const auto abort = [this, &execution](const ExecutionStage stage, const HiveError& error) {
        if (error.kind == ErrorKind::Cancelled || execution.token.is_cancelled()) {
            return handle_cancellation(execution);
        }
        return handle_failure(execution, stage, error);
    };

    // 1. Planning
    auto status = enter_stage(execution, ExecutionStage::Planning, "Analyzing impact");
    if (!core::errors::is_error(status)) {
        status = run_planning(execution, plan);
    }
    if (core::errors::is_error(status)) {
        return abort(ExecutionStage::Planning, core::errors::get_error(status));
    }

    // 2. Validation
    status = enter_stage(execution, ExecutionStage::Validation, "Running preflight checks");
    if (!core::errors::is_error(status)) {
        status = run_validation(execution, plan);
    }
    if (core::errors::is_error(status)) {
        return abort(ExecutionStage::Validation, core::errors::get_error(status));
    }

    // 3. Execution
    status = enter_stage(execution, ExecutionStage::Execution, "Executing tasks");
    if (core::errors::is_error(status)) {
        return abort(ExecutionStage::Execution, core::errors::get_error(status));
    }
    auto runs = run_execution(execution, plan);
    if (core::errors::is_error(runs)) {
        return abort(ExecutionStage::Execution, core::errors::get_error(runs));
    }

    // 4. Merge
    std::vector<FileChange> merged_changes;
    status = enter_stage(execution, ExecutionStage::Merge, "Merging branches");
    if (core::errors::is_error(status)) {
        return abort(ExecutionStage::Merge, core::errors::get_error(status));
    }
    auto merge = run_merge(execution, core::errors::get_value(runs), merged_changes);
    if (core::errors::is_error(merge)) {
        return abort(ExecutionStage::Merge, core::errors::get_error(merge));
    }
    status = c_.missions.advance_phase(mission_id, protocol::MissionPhase::Verification);
    if (core::errors::is_error(status)) {
        return abort(ExecutionStage::Merge, core::errors::get_error(status));
    }

    // 5. Verification
    status = enter_stage(execution, ExecutionStage::Verification, "Verifying changes");
    if (core::errors::is_error(status)) {
        return abort(ExecutionStage::Verification, core::errors::get_error(status));
    }
    auto report = run_verification(execution, merged_changes);
    if (core::errors::is_error(report)) {
        return abort(ExecutionStage::Verification, core::errors::get_error(report));
    }

    // 6. Completion
    status = enter_stage(execution, ExecutionStage::Completion, "Completing mission");
    if (!core::errors::is_error(status)) {
        status = c_.missions.advance_phase(mission_id, protocol::MissionPhase::Completion);
    }
    if (!core::errors::is_error(status)) {
        status = c_.missions.complete(mission_id);
    }
    if (core::errors::is_error(status)) {
        return abort(ExecutionStage::Completion, core::errors::get_error(status));
    }

    ExecutionResult result;
    result.execution_id = execution.id;
    result.mission_id = mission_id;
    result.success = true;
    result.duration = elapsed_since(execution.started);
    result.tasks_completed = core::errors::get_value(runs).size();
    result.changes = std::move(merged_changes);
    result.verification = core::errors::get_value(report);
    result.merge = core::errors::get_value(merge);

    LOG_INFO("ExecutionCoordinator: execution " + execution.id + " completed in " +
             std::to_string(result.duration.count()) + "ms (" +
             std::to_string(result.changes.size()) + " file changes)");
    report_progress(execution, "Mission completed");
    finish(execution, "succeeded", "");
    return result;
}

core::errors::Status ExecutionCoordinator::run_planning(ActiveExecution& execution,
                                                        const ExecutionPlan& plan) {
    auto analysis = c_.preflight.analyze(plan.changes);
    if (core::errors::is_error(analysis)) {
        return core::errors::get_error(analysis);
    }
    const auto& impact = core::errors::get_value(analysis);
    LOG_INFO("ExecutionCoordinator: execution " + execution.id + " impact: " + impact.summary);
    c_.events.publish(ExecutionEvent{ExecutionEventKind::ImpactAnalyzed, execution.id,
                                     plan.mission_id,
                                     protocol::to_string(ExecutionStage::Planning),
                                     impact.summary, impact.directories});
    return c_.missions.advance_phase(plan.mission_id, protocol::MissionPhase::Validation);
}

core::errors::Status ExecutionCoordinator::run_validation(ActiveExecution& execution,
                                                          const ExecutionPlan& plan) {
    auto valid = validate_plan(plan);
    if (core::errors::is_error(valid)) {
        return valid;
    }

    auto checked = c_.preflight.check(plan.mission_id, plan.changes);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    const auto& report = core::errors::get_value(checked);

    if (!report.warnings.empty()) {
        LOG_WARN("ExecutionCoordinator: execution " + execution.id + " preflight warnings: " +
                 join(report.warnings, "; "));
        c_.events.publish(ExecutionEvent{ExecutionEventKind::PreflightWarnings, execution.id,
                                         plan.mission_id,
                                         protocol::to_string(ExecutionStage::Validation),
                                         std::to_string(report.warnings.size()) + " warning(s)",
                                         report.warnings});
    }
    if (!report.can_proceed || !report.errors.empty()) {
        return HiveError{ErrorKind::Policy,
                         "Preflight checks failed: " + join(report.errors, "; "),
                         "preflight_failed",
                         "Fix the reported paths in the plan and run again."};
    }
    return c_.missions.advance_phase(plan.mission_id, protocol::MissionPhase::Execution);
}

core::errors::Result<std::vector<ExecutionCoordinator::TaskRun>>
ExecutionCoordinator::run_execution(ActiveExecution& execution, const ExecutionPlan& plan) {
    const std::string& mission_id = plan.mission_id;

    if (!plan.changes.empty()) {
        std::vector<std::string> paths;
        for (const auto& change : plan.changes) {
            paths.push_back(change.path);
        }
        auto point = c_.rollback.backup(paths, mission_id);
        if (core::errors::is_error(point)) {
            return core::errors::get_error(point);
        }
    }

    // Tasks are created dependencies first so every dependency resolves to
    // an existing task id.
    std::map<std::string, std::string> id_by_key;
    std::map<std::string, const ExecutionTaskConfig*> config_by_task;
    std::vector<const ExecutionTaskConfig*> pending;
    for (const auto& config : plan.tasks) {
        pending.push_back(&config);
    }
    while (!pending.empty()) {
        std::vector<const ExecutionTaskConfig*> deferred;
        for (const auto* config : pending) {
            const bool ready = std::all_of(
                config->depends_on.begin(), config->depends_on.end(),
                [&id_by_key](const protocol::PlanDependency& d) { return id_by_key.count(d.key) > 0; });
            if (!ready) {
                deferred.push_back(config);
                continue;
            }

            protocol::TaskSpec spec;
            spec.type = config->type;
            spec.description = config->description;
            spec.priority = config->priority;
            for (const auto& dependency : config->depends_on) {
                spec.dependencies.push_back(
                    protocol::TaskDependency{id_by_key.at(dependency.key), dependency.type});
            }
            spec.metadata["task_key"] = config->key;
            spec.metadata["execution_id"] = execution.id;

            auto created = c_.missions.add_task(mission_id, spec);
            if (core::errors::is_error(created)) {
                return core::errors::get_error(created);
            }
            const auto& task = core::errors::get_value(created);
            id_by_key.emplace(config->key, task.id);
            config_by_task.emplace(task.id, config);
        }
        if (deferred.size() == pending.size()) {
            return HiveError{ErrorKind::Input,
                             "Task dependencies form a cycle through " + deferred.front()->key,
                             "plan_dependency_cycle"};
        }
        pending.swap(deferred);
    }

    const bool require_approval = config_.require_approval || plan.require_approval;
    std::vector<TaskRun> runs;
    std::size_t remaining = plan.tasks.size();

    std::optional<std::chrono::steady_clock::time_point> waiting_since;

    while (remaining > 0) {
        if (execution.token.is_cancelled()) {
            return cancelled("Execution cancelled: " + execution.id);
        }

        std::vector<Task> wave;
        bool out_of_capacity = false;
        for (const auto& task : c_.tasks.ready_tasks(mission_id)) {
            if (wave.size() >= config_.max_parallel_tasks) {
                break;
            }
            if (config_by_task.count(task.id) == 0) {
                continue;
            }
            auto started = c_.tasks.start(task.id);
            if (core::errors::is_error(started)) {
                const HiveError& error = core::errors::get_error(started);
                if (error.kind == ErrorKind::DependenciesUnmet ||
                    error.kind == ErrorKind::CapacityExceeded) {
                    LOG_DEBUG("ExecutionCoordinator: task " + task.id + " deferred: " +
                              error.message);
                    out_of_capacity = out_of_capacity || error.kind == ErrorKind::CapacityExceeded;
                    continue;
                }
                return error;
            }
            wave.push_back(c_.tasks.get(task.id).value_or(task));
        }

        if (wave.empty() && out_of_capacity) {
            // Slots are held by other work; wait for them instead of failing.
            const auto now = std::chrono::steady_clock::now();
            if (!waiting_since.has_value()) {
                waiting_since = now;
                LOG_INFO("ExecutionCoordinator: execution " + execution.id +
                         " waiting for scheduler capacity");
            } else if (now - *waiting_since >= config_.capacity_wait_timeout) {
                return HiveError{ErrorKind::CapacityExceeded,
                                 "No scheduler capacity for " + std::to_string(remaining) +
                                     " remaining task(s) after " +
                                     std::to_string(config_.capacity_wait_timeout.count()) + "ms",
                                 "task_capacity_exhausted",
                                 "Raise scheduler.max_concurrent_tasks or finish running work."};
            }
            if (execution.token.wait_for(config_.capacity_poll_interval)) {
                return cancelled("Execution cancelled: " + execution.id);
            }
            continue;
        }
        waiting_since.reset();

        if (wave.empty()) {
            return HiveError{ErrorKind::ExecutionFailed,
                             "No runnable tasks left; " + std::to_string(remaining) +
                                 " task(s) are blocked",
                             "execution_stalled"};
        }
        LOG_DEBUG("ExecutionCoordinator: execution " + execution.id + " running wave of " +
                  std::to_string(wave.size()) + " task(s)");

        std::vector<std::future<TaskRunResult>> futures;
        for (const auto& task : wave) {
            const ExecutionTaskConfig* config = config_by_task.at(task.id);
            futures.push_back(std::async(std::launch::async,
                                         [this, &execution, config, task, require_approval]() {
                                             return run_task(execution, *config, task,
                                                             require_approval);
                                         }));
        }

        std::optional<HiveError> first_error;
        for (auto& future : futures) {
            auto outcome = future.get();
            remaining -= 1;
            if (core::errors::is_error(outcome)) {
                if (!first_error.has_value()) {
                    first_error = core::errors::get_error(outcome);
                }
                continue;
            }
            runs.push_back(core::errors::get_value(outcome));
        }
        if (first_error.has_value()) {
            return first_error.value();
        }
    }
    return runs;
}

ExecutionCoordinator::TaskRunResult ExecutionCoordinator::run_task(
    ActiveExecution& execution, const ExecutionTaskConfig& config, const Task& task,
    const bool require_approval) {
    const auto started = std::chrono::steady_clock::now();

    const auto fail_task = [this, &task, started](const HiveError& error) {
        if (error.kind == ErrorKind::Cancelled) {
            auto status = c_.tasks.cancel(task.id, error.message);
            if (core::errors::is_error(status)) {
                LOG_DEBUG("ExecutionCoordinator: task " + task.id + " not cancelled: " +
                          core::errors::get_error(status).message);
            }
            return error;
        }
        TaskResult result;
        result.success = false;
        result.error = error.message;
        result.duration = elapsed_since(started);
        auto status = c_.tasks.complete(task.id, result);
        if (core::errors::is_error(status)) {
            // Already finished by the scheduler, e.g. timed out.
            LOG_DEBUG("ExecutionCoordinator: task " + task.id + " not completed: " +
                      core::errors::get_error(status).message);
        }
        return error;
    };

    auto branch = c_.branches.create_branch("", task.id);
    if (core::errors::is_error(branch)) {
        return fail_task(core::errors::get_error(branch));
    }
    const std::string branch_id = core::errors::get_value(branch).id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        execution.branch_ids.push_back(branch_id);
    }

    auto response = call_agent(config, task, execution.token);
    if (core::errors::is_error(response)) {
        return fail_task(core::errors::get_error(response));
    }
    const auto& reply = core::errors::get_value(response);

    auto assigned = c_.branches.assign_agent(branch_id, reply.agent_id);
    if (core::errors::is_error(assigned)) {
        return fail_task(core::errors::get_error(assigned));
    }

    auto changes = normalize_changes(parse_file_changes(reply.content));
    LOG_INFO("ExecutionCoordinator: task " + task.id + " (" + config.key + ") produced " +
             std::to_string(changes.size()) + " change(s)");

    if (require_approval && !changes.empty()) {
        const Task snapshot = c_.tasks.get(task.id).value_or(task);
        auto decision = c_.approval.request_approval(snapshot, changes);
        if (core::errors::is_error(decision)) {
            return fail_task(core::errors::get_error(decision));
        }
        const auto& verdict = core::errors::get_value(decision);
        if (!verdict.approved) {
            LOG_WARN("ExecutionCoordinator: changes of task " + task.id + " rejected: " +
                     verdict.comment);
            return fail_task(HiveError{ErrorKind::ExecutionFailed,
                                       "Changes of task " + config.key +
                                           " were rejected: " + verdict.comment,
                                       "approval_rejected"});
        }
        if (verdict.modifications.has_value()) {
            changes = normalize_changes(verdict.modifications.value());
        }
    }

    auto recorded = c_.branches.record_changes(branch_id, changes);
    if (core::errors::is_error(recorded)) {
        return fail_task(core::errors::get_error(recorded));
    }

    TaskResult result;
    result.success = true;
    result.output = reply.content;
    result.duration = elapsed_since(started);
    auto completed = c_.tasks.complete(task.id, result);
    if (core::errors::is_error(completed)) {
        return core::errors::get_error(completed);
    }

    auto progressed = c_.missions.task_completed(execution.mission_id, task.id);
    if (core::errors::is_error(progressed)) {
        LOG_WARN("ExecutionCoordinator: mission progress not updated: " +
                 core::errors::get_error(progressed).message);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        execution.progress.tasks_completed += 1;
    }
    report_progress(execution, "Task " + config.key + " completed");

    return TaskRun{task.id, branch_id, changes};
}

core::errors::Result<protocol::AgentResponse> ExecutionCoordinator::call_agent(
    const ExecutionTaskConfig& config, const Task& task, const CancelToken& cancel) {
    const auto& policy = config_.retry_policy;
    const auto task_token = c_.tasks.cancel_token(task.id);
    std::optional<HiveError> last_error;

    for (std::uint32_t attempt = 0; policy.allows_attempt(attempt); ++attempt) {
        if (cancel.is_cancelled()) {
            return HiveError{ErrorKind::Cancelled, "Task cancelled: " + task.id,
                             "task_cancelled"};
        }
        if (attempt > 0) {
            const auto delay = policy.backoff_for(attempt);
            LOG_WARN("ExecutionCoordinator: task " + task.id + " attempt " +
                     std::to_string(attempt) + " failed (" + last_error->message +
                     "), retrying in " + std::to_string(delay.count()) + "ms");
            if (cancel.wait_for(delay)) {
                return HiveError{ErrorKind::Cancelled, "Task cancelled: " + task.id,
                                 "task_cancelled"};
            }
        }

        auto recorded = c_.tasks.record_attempt(task.id);
        if (core::errors::is_error(recorded)) {
            return core::errors::get_error(recorded);
        }

        // The call also stops when the scheduler cancels or times out the task.
        const CancelToken call_token = cancel.child();
        std::optional<CancelToken::CallbackId> link;
        if (task_token.has_value()) {
            link = task_token->on_cancel([call_token]() { call_token.cancel(); });
        }
        auto response = c_.agents.execute(build_request(config, task), call_token);
        if (link.has_value()) {
            task_token->remove_callback(link.value());
        }

        if (!core::errors::is_error(response)) {
            return response;
        }
        const HiveError& error = core::errors::get_error(response);
        if (error.kind == ErrorKind::Cancelled) {
            if (!cancel.is_cancelled()) {
                auto status = c_.tasks.get_status(task.id);
                if (!core::errors::is_error(status) &&
                    core::errors::get_value(status) == protocol::TaskStatus::Failed) {
                    return HiveError{ErrorKind::Timeout, "Task timed out: " + task.id,
                                     "task_timed_out"};
                }
            }
            return error;
        }
        if (!policy.is_retryable(error)) {
            return error;
        }
        last_error = error;
    }

    return HiveError{ErrorKind::ExecutionFailed,
                     "Task " + config.key + " failed after " +
                         std::to_string(policy.max_attempts) + " attempt(s): " +
                         (last_error.has_value() ? last_error->message : "no attempts allowed"),
                     "task_retries_exhausted"};
}

protocol::AgentRequest ExecutionCoordinator::build_request(const ExecutionTaskConfig& config,
                                                           const Task& task) const {
    protocol::AgentRequest request;
    request.task_id = task.id;
    request.mission_id = task.mission_id;
    request.type = config.type;
    request.prompt = protocol::task_marker(config.key) + "\n" +
                     config.prompt.value_or(config.description);
    request.system_context = system_context_for(task);
    request.max_tokens = config.max_tokens;
    request.provider = config.provider;
    request.tier = config.tier;

    for (const auto& path : config.relevant_files) {
        auto content = c_.files.read_file(path);
        if (core::errors::is_error(content)) {
            LOG_DEBUG("ExecutionCoordinator: context file " + path + " skipped: " +
                      core::errors::get_error(content).message);
            continue;
        }
        std::string text = core::errors::get_value(content);
        if (text.size() > config_.max_context_bytes) {
            text.resize(config_.max_context_bytes);
            text += "\n... (truncated)";
        }
        request.context.push_back(protocol::ContextItem{"file", path, text});
    }
    return request;
}

// Creating an existing file is a modification and modifying a missing one is
// a creation; the branch snapshots originals only for modifications.
std::vector<FileChange> ExecutionCoordinator::normalize_changes(
    std::vector<FileChange> changes) const {
    for (auto& change : changes) {
        if (change.type == ChangeType::Delete) {
            continue;
        }
        auto exists = c_.files.exists(change.path);
        if (core::errors::is_error(exists)) {
            continue;
        }
        if (core::errors::get_value(exists)) {
            change.type = ChangeType::Modify;
        } else {
            change.type = ChangeType::Create;
            change.original_content.reset();
        }
    }
    return changes;
}

core::errors::Result<protocol::MergeSummary> ExecutionCoordinator::run_merge(
    ActiveExecution& execution, const std::vector<TaskRun>& runs,
    std::vector<FileChange>& merged_changes) {
    std::vector<std::string> branch_ids;
    std::set<std::string> touched;
    for (const auto& run : runs) {
        branch_ids.push_back(run.branch_id);
        for (const auto& change : run.changes) {
            touched.insert(change.path);
        }
    }

    if (!touched.empty()) {
        auto point = c_.rollback.backup(std::vector<std::string>(touched.begin(), touched.end()),
                                        execution.mission_id);
        if (core::errors::is_error(point)) {
            return core::errors::get_error(point);
        }
    }

    protocol::MergeSummary summary;
    std::set<std::string> unresolved;

    // Each applied resolution changes the branches, so conflicts are
    // re-detected after every one.
    constexpr std::size_t kMaxMergePasses = 64;
    for (std::size_t pass = 0; pass < kMaxMergePasses; ++pass) {
        if (execution.token.is_cancelled()) {
            return cancelled("Execution cancelled: " + execution.id);
        }

        std::optional<merge::MergeConflict> next;
        for (const auto& conflict : c_.merges.detect_conflicts(branch_ids)) {
            if (unresolved.count(conflict.id) == 0) {
                next = conflict;
                break;
            }
        }
        if (!next.has_value()) {
            break;
        }
        summary.conflicts_detected += 1;

        auto resolution = c_.merges.resolve_conflict(next.value(), std::nullopt, execution.token);
        if (core::errors::is_error(resolution)) {
            const HiveError& error = core::errors::get_error(resolution);
            if (error.kind == ErrorKind::Cancelled) {
                return error;
            }
            LOG_WARN("ExecutionCoordinator: conflict " + next->id + " on " + next->file_path +
                     " not resolved: " + error.message);
            unresolved.insert(next->id);
            continue;
        }
        const auto& resolved = core::errors::get_value(resolution);
        if (!resolved.resolved_content.has_value()) {
            LOG_WARN("ExecutionCoordinator: conflict " + next->id + " on " + next->file_path +
                     " needs manual resolution");
            unresolved.insert(next->id);
            continue;
        }

        auto applied = c_.merges.apply_resolution(resolved);
        if (core::errors::is_error(applied)) {
            LOG_WARN("ExecutionCoordinator: resolution of " + next->id + " not applied: " +
                     core::errors::get_error(applied).message);
            unresolved.insert(next->id);
            continue;
        }
        summary.conflicts_resolved += 1;
    }
    summary.conflicts_unresolved = unresolved.size();

    for (const auto& run : runs) {
        auto merged = c_.branches.merge_branch(run.branch_id);
        if (core::errors::is_error(merged)) {
            LOG_WARN("ExecutionCoordinator: branch " + run.branch_id + " not merged: " +
                     core::errors::get_error(merged).message);
            summary.failed_branches.push_back(run.branch_id);
            continue;
        }
        summary.merged_branches.push_back(run.branch_id);
        const auto branch = c_.branches.get_branch(run.branch_id);
        if (branch.has_value()) {
            merged_changes.insert(merged_changes.end(), branch->changes.begin(),
                                  branch->changes.end());
        }
    }
    abandon_branches(execution, "not merged");

    report_progress(execution, std::to_string(summary.merged_branches.size()) +
                                   " branch(es) merged, " +
                                   std::to_string(summary.failed_branches.size()) +
                                   " failed, " + std::to_string(summary.conflicts_resolved) +
                                   " conflict(s) resolved");

    if (!summary.failed_branches.empty() && summary.merged_branches.empty()) {
        return HiveError{ErrorKind::MergeFailed,
                         "No branch could be merged (" +
                             std::to_string(summary.failed_branches.size()) + " failed, " +
                             std::to_string(summary.conflicts_unresolved) +
                             " unresolved conflict(s))",
                         "merge_stage_failed"};
    }
    return summary;
}

core::errors::Result<protocol::VerificationReport> ExecutionCoordinator::run_verification(
    ActiveExecution& execution, const std::vector<FileChange>& changes) {
    protocol::VerificationRequest request;
    request.mission_id = execution.mission_id;
    request.changes = changes;
    for (const auto& change : changes) {
        request.file_paths.push_back(change.path);
    }

    auto verified = c_.verifier.verify(request, execution.token);
    if (core::errors::is_error(verified)) {
        return core::errors::get_error(verified);
    }
    const auto& report = core::errors::get_value(verified);
    if (!report.valid) {
        return HiveError{ErrorKind::ExecutionFailed, "Verification failed: " + report.summary,
                         "verification_failed"};
    }
    LOG_INFO("ExecutionCoordinator: execution " + execution.id + " verified: " + report.summary);
    return report;
}

core::errors::Result<TaskOutput> ExecutionCoordinator::execute_task(const Task& task,
                                                                     const CancelToken& cancel) {
    ExecutionTaskConfig config;
    const auto key = task.metadata.find("task_key");
    config.key = key != task.metadata.end() ? key->second : task.id;
    config.type = task.type;
    config.description = task.description;
    config.priority = task.priority;

    const auto started = std::chrono::steady_clock::now();
    auto response = c_.agents.execute(build_request(config, task), cancel);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    const auto& reply = core::errors::get_value(response);

    TaskOutput output;
    output.task_id = task.id;
    output.agent_id = reply.agent_id;
    output.response = reply.content;
    output.changes = normalize_changes(parse_file_changes(reply.content));
    output.tokens_used = reply.usage.total_tokens;
    output.duration = elapsed_since(started);
    return output;
}

core::errors::Status ExecutionCoordinator::enter_stage(ActiveExecution& execution,
                                                       const ExecutionStage stage,
                                                       const std::string& message) {
    if (execution.token.is_cancelled()) {
        return cancelled("Execution cancelled before " + protocol::to_string(stage));
    }
    if (stage != ExecutionStage::Planning && config_.phase_transition_delay.count() > 0 &&
        execution.token.wait_for(config_.phase_transition_delay)) {
        return cancelled("Execution cancelled before " + protocol::to_string(stage));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        execution.progress.stage = stage;
    }
    LOG_INFO("ExecutionCoordinator: execution " + execution.id + " stage -> " +
             protocol::to_string(stage));
    c_.events.publish(ExecutionEvent{ExecutionEventKind::StageEntered, execution.id,
                                     execution.mission_id, protocol::to_string(stage), message,
                                     {}});
    report_progress(execution, message);
    return core::errors::ok();
}

void ExecutionCoordinator::report_progress(ActiveExecution& execution,
                                           const std::string& message) {
    ExecutionProgress snapshot;
    std::vector<ProgressHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        execution.progress.message = message;
        execution.progress.timestamp = clock_();
        snapshot = execution.progress;
        for (const auto& entry : handlers_) {
            handlers.push_back(entry.second);
        }
    }

    c_.events.publish(ExecutionEvent{ExecutionEventKind::Progress, execution.id,
                                     execution.mission_id, protocol::to_string(snapshot.stage),
                                     message, {}});
    for (const auto& handler : handlers) {
        handler(snapshot);
    }
}

HiveError ExecutionCoordinator::handle_failure(ActiveExecution& execution,
                                               const ExecutionStage stage,
                                               const HiveError& cause) {
    const std::string reason = protocol::to_string(stage) + " failed: " + cause.message;
    LOG_ERROR("ExecutionCoordinator: execution " + execution.id + " " + reason);

    abandon_branches(execution, reason);

    auto rolled_back = c_.missions.rollback(execution.mission_id);
    if (core::errors::is_error(rolled_back)) {
        const HiveError& error = core::errors::get_error(rolled_back);
        if (error.kind == ErrorKind::NoRollbackPoint) {
            LOG_INFO("ExecutionCoordinator: nothing to roll back for mission " +
                     execution.mission_id);
        } else {
            LOG_ERROR("ExecutionCoordinator: rollback of mission " + execution.mission_id +
                      " failed: " + error.message);
        }
    }

    auto failed = c_.missions.fail(execution.mission_id, reason);
    if (core::errors::is_error(failed)) {
        LOG_WARN("ExecutionCoordinator: mission " + execution.mission_id + " not failed: " +
                 core::errors::get_error(failed).message);
    }

    finish(execution, "failed", reason);
    return cause;
}

HiveError ExecutionCoordinator::handle_cancellation(ActiveExecution& execution) {
    LOG_INFO("ExecutionCoordinator: execution " + execution.id + " cancelled");
    abandon_branches(execution, "execution cancelled");

    ExecutionStage stage = ExecutionStage::Planning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stage = execution.progress.stage;
    }
    // Merging may already have written to the workspace.
    if (stage == ExecutionStage::Merge || stage == ExecutionStage::Verification) {
        auto rolled_back = c_.missions.rollback(execution.mission_id);
        if (core::errors::is_error(rolled_back)) {
            LOG_WARN("ExecutionCoordinator: rollback after cancellation failed: " +
                     core::errors::get_error(rolled_back).message);
        }
    }

    auto status = c_.missions.cancel(execution.mission_id, "Execution cancelled");
    if (core::errors::is_error(status)) {
        LOG_DEBUG("ExecutionCoordinator: mission " + execution.mission_id + " not cancelled: " +
                  core::errors::get_error(status).message);
    }

    finish(execution, "cancelled", "");
    return cancelled("Execution cancelled: " + execution.id);
}

void ExecutionCoordinator::abandon_branches(const ActiveExecution& execution,
                                            const std::string& reason) {
    std::vector<std::string> branch_ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        branch_ids = execution.branch_ids;
    }
    for (const auto& branch_id : branch_ids) {
        const auto branch = c_.branches.get_branch(branch_id);
        if (!branch.has_value() || branch->status != merge::BranchStatus::Active) {
            continue;
        }
        auto status = c_.branches.abandon_branch(branch_id, reason);
        if (core::errors::is_error(status)) {
            LOG_WARN("ExecutionCoordinator: branch " + branch_id + " not abandoned: " +
                     core::errors::get_error(status).message);
        }
    }
}

void ExecutionCoordinator::finish(const ActiveExecution& execution, const std::string& outcome,
                                  const std::string& detail) {
    std::string stage;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stage = protocol::to_string(execution.progress.stage);
    }
    std::vector<std::string> items;
    if (!detail.empty()) {
        items.push_back(detail);
    }
    c_.events.publish(ExecutionEvent{ExecutionEventKind::Finished, execution.id,
                                     execution.mission_id, stage, outcome, items});
}

core::errors::Status ExecutionCoordinator::cancel(const std::string& mission_id) {
    std::optional<CancelToken> token;
    std::string execution_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : executions_) {
            if (entry.second->mission_id == mission_id) {
                token = entry.second->token;
                execution_id = entry.first;
                break;
            }
        }
    }
    if (!token.has_value()) {
        return HiveError{ErrorKind::NotFound, "No running execution for mission: " + mission_id,
                         "execution_not_found"};
    }
    LOG_INFO("ExecutionCoordinator: cancelling execution " + execution_id);
    token->cancel();
    return core::errors::ok();
}

ExecutionState ExecutionCoordinator::get_status(const std::string& mission_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : executions_) {
        if (entry.second->mission_id == mission_id) {
            return ExecutionState::Running;
        }
    }
    return ExecutionState::Idle;
}

std::optional<ExecutionProgress> ExecutionCoordinator::current_progress(
    const std::string& mission_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : executions_) {
        if (entry.second->mission_id == mission_id) {
            return entry.second->progress;
        }
    }
    return std::nullopt;
}

ExecutionCoordinator::HandlerId ExecutionCoordinator::on_progress(ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    const HandlerId id = next_handler_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void ExecutionCoordinator::remove_progress_handler(const HandlerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

CoordinatorStats ExecutionCoordinator::stats() const {
    CoordinatorStats stats;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.active_executions = executions_.size();
        stats.succeeded_executions = succeeded_;
        stats.failed_executions = failed_;
        stats.cancelled_executions = cancelled_;
    }
    stats.tasks = c_.tasks.stats();
    stats.agents = c_.agents.stats();
    stats.missions = c_.missions.stats();
    stats.branches = c_.branches.stats();
    return stats;
}

std::string to_string(const ExecutionState state) {
    return state == ExecutionState::Running ? "running" : "idle";
}

}  // namespace hive::runtime
