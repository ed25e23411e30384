#include "scheduler/task_scheduler.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace hive::scheduler {

using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::DependencyType;
using protocol::HiveEvent;
using protocol::Task;
using protocol::TaskEvent;
using protocol::TaskEventKind;
using protocol::TaskResult;
using protocol::TaskSpec;
using protocol::TaskStatus;

namespace {

HiveError task_not_found(const std::string& task_id) {
    return HiveError{ErrorKind::NotFound, "Task not found: " + task_id,
                     "task_not_found"};
}

}  // namespace

TaskScheduler::TaskScheduler(protocol::EventSink& events, SchedulerConfig config,
                             core::config::Clock clock)
    : events_(events), config_(std::move(config)), clock_(std::move(clock)) {}

TaskScheduler::~TaskScheduler() {
    timers_.shutdown();
}

TaskScheduler::QueueKey TaskScheduler::queue_key(const Task& task) {
    return QueueKey{static_cast<int>(task.priority), task.sequence, task.id};
}

core::errors::Result<Task> TaskScheduler::create(const std::string& mission_id,
                                                 const TaskSpec& spec) {
    if (mission_id.empty()) {
        return HiveError{ErrorKind::Input, "Task must belong to a mission.",
                         "invalid_task_spec"};
    }

    Task snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string task_id;
        constexpr int kMaxAttempts = 16;
        for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
            const std::string candidate = core::config::generate_id("task");
            if (tasks_.find(candidate) == tasks_.end()) {
                task_id = candidate;
                break;
            }
        }
        if (task_id.empty()) {
            return HiveError{ErrorKind::Internal, "Unable to allocate unique task ID.",
                             "task_id_generation_failed"};
        }

        TaskRecord record;
        record.task.id = task_id;
        record.task.mission_id = mission_id;
        record.task.type = spec.type;
        record.task.description = spec.description;
        record.task.priority = spec.priority;
        record.task.dependencies = spec.dependencies;
        record.task.metadata = spec.metadata;
        record.task.status = TaskStatus::Pending;
        record.task.sequence = next_sequence_++;
        record.task.created_at = clock_();

        queue_.insert(queue_key(record.task));
        snapshot = record.task;
        tasks_.emplace(task_id, std::move(record));
    }

    LOG_DEBUG("TaskScheduler: task " + snapshot.id + " created (" +
              protocol::to_string(snapshot.priority) + ")");
    events_.publish(TaskEvent{TaskEventKind::Created, snapshot.id, mission_id, ""});
    return snapshot;
}

bool TaskScheduler::dependencies_met(const Task& task) const {
    for (const auto& dependency : task.dependencies) {
        auto it = tasks_.find(dependency.task_id);
        if (it == tasks_.end()) {
            return false;
        }
        const TaskStatus status = it->second.task.status;
        if (dependency.type == DependencyType::Required &&
            status != TaskStatus::Completed) {
            return false;
        }
        if (dependency.type == DependencyType::Soft && status == TaskStatus::Running) {
            return false;
        }
    }
    return true;
}

std::size_t TaskScheduler::running_count_locked() const {
    return static_cast<std::size_t>(
        std::count_if(tasks_.begin(), tasks_.end(), [](const auto& entry) {
            return entry.second.task.status == TaskStatus::Running;
        }));
}

core::errors::Status TaskScheduler::start(const std::string& task_id) {
    std::vector<HiveEvent> events;
    core::errors::Status outcome = core::errors::ok();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return task_not_found(task_id);
        }

        Task& task = it->second.task;
        if (task.status != TaskStatus::Pending && task.status != TaskStatus::Blocked) {
            return HiveError{ErrorKind::InvalidState,
                             "Task cannot start from status " + protocol::to_string(task.status),
                             "invalid_task_state"};
        }

        if (!dependencies_met(task)) {
            if (task.status != TaskStatus::Blocked) {
                LOG_INFO("TaskScheduler: task " + task_id + " transition " +
                         protocol::to_string(task.status) + " -> blocked");
                task.status = TaskStatus::Blocked;
            }
            return HiveError{ErrorKind::DependenciesUnmet,
                             "Task dependencies not satisfied: " + task_id,
                             "dependencies_unmet"};
        }

        if (running_count_locked() >= config_.max_concurrent_tasks) {
            return HiveError{ErrorKind::CapacityExceeded,
                             "Maximum concurrent tasks reached (" +
                                 std::to_string(config_.max_concurrent_tasks) + ")",
                             "task_capacity_exceeded"};
        }

        LOG_INFO("TaskScheduler: task " + task_id + " transition " +
                 protocol::to_string(task.status) + " -> running");
        task.status = TaskStatus::Running;
        task.started_at = clock_();
        queue_.erase(queue_key(task));

        it->second.timeout_timer = timers_.schedule_after(
            config_.task_timeout, [this, task_id]() { handle_timeout(task_id); });
        events.push_back(TaskEvent{TaskEventKind::Started, task_id, task.mission_id, ""});
    }
    publish_all(events);
    return outcome;
}

core::errors::Status TaskScheduler::complete(const std::string& task_id,
                                             const TaskResult& result) {
    std::vector<HiveEvent> events;
    core::errors::Status outcome = core::errors::ok();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        outcome = complete_locked(task_id, result, events);
    }
    publish_all(events);
    return outcome;
}

core::errors::Status TaskScheduler::complete_locked(const std::string& task_id,
                                                    const TaskResult& result,
                                                    std::vector<HiveEvent>& events) {
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return task_not_found(task_id);
    }

    Task& task = it->second.task;
    if (task.status != TaskStatus::Running) {
        return HiveError{ErrorKind::InvalidState,
                         "Task is not running: " + protocol::to_string(task.status),
                         "invalid_task_state"};
    }

    if (it->second.timeout_timer != 0) {
        static_cast<void>(timers_.cancel(it->second.timeout_timer));
        it->second.timeout_timer = 0;
    }

    const TaskStatus next = result.success ? TaskStatus::Completed : TaskStatus::Failed;
    LOG_INFO("TaskScheduler: task " + task_id + " transition running -> " +
             protocol::to_string(next));
    task.status = next;
    task.completed_at = clock_();
    task.result = result;
    events.push_back(TaskEvent{result.success ? TaskEventKind::Completed : TaskEventKind::Failed,
                               task_id, task.mission_id,
                               result.success ? "" : result.error});

    unblock_ready_locked(events);
    return core::errors::ok();
}

void TaskScheduler::unblock_ready_locked(std::vector<HiveEvent>& events) {
    std::vector<Task*> blocked;
    for (auto& entry : tasks_) {
        if (entry.second.task.status == TaskStatus::Blocked) {
            blocked.push_back(&entry.second.task);
        }
    }
    std::sort(blocked.begin(), blocked.end(),
              [](const Task* a, const Task* b) { return a->sequence < b->sequence; });

    for (Task* task : blocked) {
        if (!dependencies_met(*task)) {
            continue;
        }
        LOG_INFO("TaskScheduler: task " + task->id + " transition blocked -> pending");
        task->status = TaskStatus::Pending;
        queue_.insert(queue_key(*task));
        events.push_back(TaskEvent{TaskEventKind::Unblocked, task->id, task->mission_id, ""});
    }
}

core::errors::Status TaskScheduler::cancel(const std::string& task_id,
                                           const std::string& reason) {
    std::vector<HiveEvent> events;
    std::optional<core::concurrency::CancelToken> to_fire;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return task_not_found(task_id);
        }

        Task& task = it->second.task;
        if (protocol::is_terminal(task.status)) {
            return HiveError{ErrorKind::InvalidState,
                             "Cannot cancel task in status " + protocol::to_string(task.status),
                             "invalid_task_state"};
        }

        if (it->second.timeout_timer != 0) {
            static_cast<void>(timers_.cancel(it->second.timeout_timer));
            it->second.timeout_timer = 0;
        }

        LOG_INFO("TaskScheduler: task " + task_id + " transition " +
                 protocol::to_string(task.status) + " -> cancelled");
        const bool was_running = task.status == TaskStatus::Running;
        task.status = TaskStatus::Cancelled;
        task.cancel_reason = reason;
        task.completed_at = clock_();
        queue_.erase(queue_key(task));
        to_fire = it->second.cancel_token;
        events.push_back(TaskEvent{TaskEventKind::Cancelled, task_id, task.mission_id, reason});

        if (was_running) {
            unblock_ready_locked(events);
        }
    }

    to_fire->cancel();
    publish_all(events);
    return core::errors::ok();
}

std::optional<Task> TaskScheduler::get_next() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& key : queue_) {
        auto it = tasks_.find(key.task_id);
        if (it == tasks_.end()) {
            continue;
        }
        const Task& task = it->second.task;
        if (task.status == TaskStatus::Pending && dependencies_met(task)) {
            return task;
        }
    }
    return std::nullopt;
}

std::vector<Task> TaskScheduler::ready_tasks(const std::string& mission_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> ready;
    for (const auto& key : queue_) {
        auto it = tasks_.find(key.task_id);
        if (it == tasks_.end()) {
            continue;
        }
        const Task& task = it->second.task;
        if (task.mission_id != mission_id) {
            continue;
        }
        if ((task.status == TaskStatus::Pending || task.status == TaskStatus::Blocked) &&
            dependencies_met(task)) {
            ready.push_back(task);
        }
    }
    return ready;
}

core::errors::Result<Task> TaskScheduler::retry(const std::string& task_id) {
    std::optional<Task> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end()) {
            return task_not_found(task_id);
        }
        if (it->second.task.status != TaskStatus::Failed) {
            return HiveError{ErrorKind::InvalidState, "Can only retry failed tasks",
                             "invalid_task_state"};
        }
        if (!config_.retry_policy.allows_attempt(it->second.task.retry_attempt + 1)) {
            return HiveError{ErrorKind::InvalidState,
                             "Retry limit reached for task " + task_id,
                             "retry_limit_reached"};
        }
        previous = it->second.task;
    }

    TaskSpec spec;
    spec.type = previous->type;
    spec.description = previous->description;
    spec.priority = previous->priority;
    spec.dependencies = previous->dependencies;
    spec.metadata = previous->metadata;

    auto created = create(previous->mission_id, spec);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }

    Task retried = core::errors::get_value(created);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(retried.id);
        if (it == tasks_.end()) {
            return task_not_found(retried.id);
        }
        it->second.task.retry_attempt = previous->retry_attempt + 1;
        it->second.task.retried_from = previous->id;
        retried = it->second.task;
    }
    LOG_INFO("TaskScheduler: task " + task_id + " retried as " + retried.id +
             " (attempt " + std::to_string(retried.retry_attempt) + ")");
    return retried;
}

core::errors::Result<std::uint32_t> TaskScheduler::record_attempt(
    const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return task_not_found(task_id);
    }
    if (it->second.task.status != TaskStatus::Running) {
        return HiveError{ErrorKind::InvalidState,
                         "Attempts are only recorded for running tasks",
                         "invalid_task_state"};
    }
    it->second.task.retry_attempt += 1;
    return it->second.task.retry_attempt;
}

void TaskScheduler::handle_timeout(const std::string& task_id) {
    std::vector<HiveEvent> events;
    std::optional<core::concurrency::CancelToken> to_fire;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        if (it == tasks_.end() || it->second.task.status != TaskStatus::Running) {
            return;
        }
        it->second.timeout_timer = 0;

        TaskResult result;
        result.success = false;
        result.error = "Task timed out";
        result.duration = config_.task_timeout;
        LOG_WARN("TaskScheduler: task " + task_id + " timed out after " +
                 std::to_string(config_.task_timeout.count()) + "ms");
        static_cast<void>(complete_locked(task_id, result, events));
        events.push_back(TaskEvent{TaskEventKind::TimedOut, task_id,
                                   it->second.task.mission_id, result.error});
        to_fire = it->second.cancel_token;
    }
    to_fire->cancel();
    publish_all(events);
}

std::optional<Task> TaskScheduler::get(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

core::errors::Result<TaskStatus> TaskScheduler::get_status(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return task_not_found(task_id);
    }
    return it->second.task.status;
}

std::optional<TaskResult> TaskScheduler::get_result(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task.result;
}

std::vector<Task> TaskScheduler::get_by_mission(const std::string& mission_id) const {
    std::vector<Task> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : tasks_) {
            if (entry.second.task.mission_id == mission_id) {
                result.push_back(entry.second.task);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Task& a, const Task& b) { return a.sequence < b.sequence; });
    return result;
}

std::optional<core::concurrency::CancelToken> TaskScheduler::cancel_token(
    const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.cancel_token;
}

SchedulerStats TaskScheduler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SchedulerStats stats;
    stats.total = tasks_.size();
    for (const auto& entry : tasks_) {
        switch (entry.second.task.status) {
            case TaskStatus::Pending:
                ++stats.pending;
                break;
            case TaskStatus::Blocked:
                ++stats.blocked;
                break;
            case TaskStatus::Running:
                ++stats.running;
                break;
            case TaskStatus::Completed:
                ++stats.completed;
                break;
            case TaskStatus::Failed:
                ++stats.failed;
                break;
            case TaskStatus::Cancelled:
                ++stats.cancelled;
                break;
        }
    }
    return stats;
}

std::size_t TaskScheduler::running_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_count_locked();
}

std::size_t TaskScheduler::clear_completed(const std::string& mission_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const Task& task = it->second.task;
        if (task.mission_id == mission_id && protocol::is_terminal(task.status)) {
            it = tasks_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

const RetryPolicy& TaskScheduler::retry_policy() const {
    return config_.retry_policy;
}

void TaskScheduler::publish_all(const std::vector<HiveEvent>& events) {
    for (const auto& event : events) {
        events_.publish(event);
    }
}

}  // namespace hive::scheduler
