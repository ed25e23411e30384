#include "mission/mission_manager.hpp"

#include <algorithm>
#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace hive::mission {

using core::errors::ErrorKind;
using core::errors::HiveError;
using nlohmann::json;
using protocol::Mission;
using protocol::MissionEvent;
using protocol::MissionEventKind;
using protocol::MissionPhase;
using protocol::MissionProgress;
using protocol::MissionStatus;

namespace {

constexpr int kPhaseCount = 5;

HiveError mission_not_found(const std::string& mission_id) {
    return HiveError{ErrorKind::NotFound, "Mission not found: " + mission_id,
                     "mission_not_found"};
}

json timestamp_or_null(const std::optional<core::config::SystemTime>& time) {
    if (!time.has_value()) {
        return nullptr;
    }
    return core::config::to_unix_ms(time.value());
}

}  // namespace

MissionManager::MissionManager(scheduler::TaskScheduler& tasks,
                               protocol::RollbackStore& rollback,
                               protocol::EventSink& events, core::config::Clock clock)
    : tasks_(tasks), rollback_(rollback), events_(events), clock_(std::move(clock)) {}

bool MissionManager::is_valid_transition(const MissionPhase from, const MissionPhase to) {
    const auto allowed = allowed_transitions(from);
    return std::find(allowed.begin(), allowed.end(), to) != allowed.end();
}

std::vector<MissionPhase> MissionManager::allowed_transitions(const MissionPhase from) {
    switch (from) {
        case MissionPhase::Planning:
            return {MissionPhase::Validation, MissionPhase::Completion};
        case MissionPhase::Validation:
            return {MissionPhase::Execution, MissionPhase::Planning};
        case MissionPhase::Execution:
            return {MissionPhase::Verification, MissionPhase::Planning};
        case MissionPhase::Verification:
            return {MissionPhase::Completion, MissionPhase::Execution};
        case MissionPhase::Completion:
        default:
            return {};
    }
}

double MissionManager::overall_progress(const MissionPhase phase) {
    return (static_cast<double>(static_cast<int>(phase)) + 1.0) / kPhaseCount * 100.0;
}

core::errors::Result<MissionManager::MissionRecord*> MissionManager::find_locked(
    const std::string& mission_id) {
    auto it = missions_.find(mission_id);
    if (it == missions_.end()) {
        return mission_not_found(mission_id);
    }
    return &it->second;
}

core::errors::Result<Mission> MissionManager::create(const protocol::MissionConfig& config) {
    if (config.title.empty()) {
        return HiveError{ErrorKind::Input, "Mission title cannot be empty.",
                         "invalid_mission_config"};
    }

    Mission snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string mission_id;
        constexpr int kMaxAttempts = 16;
        for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
            const std::string candidate = core::config::generate_id("mission");
            if (missions_.find(candidate) == missions_.end()) {
                mission_id = candidate;
                break;
            }
        }
        if (mission_id.empty()) {
            return HiveError{ErrorKind::Internal, "Unable to allocate unique mission ID.",
                             "mission_id_generation_failed"};
        }

        MissionRecord record;
        record.mission.id = mission_id;
        record.mission.title = config.title;
        record.mission.description = config.description;
        record.mission.priority = config.priority;
        record.mission.scope = config.scope;
        record.mission.constraints = config.constraints;
        record.mission.metadata = config.metadata;
        record.mission.status = MissionStatus::Pending;
        record.mission.phase = MissionPhase::Planning;
        record.mission.created_at = clock_();
        record.progress.phase = MissionPhase::Planning;

        snapshot = record.mission;
        missions_.emplace(mission_id, std::move(record));
        order_.push_back(mission_id);
    }

    LOG_INFO("MissionManager: mission " + snapshot.id + " created: " + snapshot.title);
    events_.publish(MissionEvent{MissionEventKind::Created, snapshot.id, std::nullopt,
                                 std::nullopt, snapshot.title});
    return snapshot;
}

core::errors::Status MissionManager::transition_status(const std::string& mission_id,
                                                       const MissionStatus required,
                                                       const MissionStatus next,
                                                       const MissionEventKind event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        MissionRecord* record = core::errors::get_value(found);
        if (record->mission.status != required) {
            return HiveError{ErrorKind::InvalidState,
                             "Mission " + mission_id + " is " +
                                 protocol::to_string(record->mission.status) + ", expected " +
                                 protocol::to_string(required),
                             "invalid_mission_state"};
        }

        LOG_INFO("MissionManager: mission " + mission_id + " transition " +
                 protocol::to_string(record->mission.status) + " -> " +
                 protocol::to_string(next));
        record->mission.status = next;
        if (next == MissionStatus::Active && !record->mission.started_at.has_value()) {
            record->mission.started_at = clock_();
            record->progress.started_at = record->mission.started_at;
        }
    }
    events_.publish(MissionEvent{event, mission_id, std::nullopt, std::nullopt, ""});
    return core::errors::ok();
}

core::errors::Status MissionManager::start(const std::string& mission_id) {
    return transition_status(mission_id, MissionStatus::Pending, MissionStatus::Active,
                             MissionEventKind::Started);
}

core::errors::Status MissionManager::pause(const std::string& mission_id) {
    return transition_status(mission_id, MissionStatus::Active, MissionStatus::Paused,
                             MissionEventKind::Paused);
}

core::errors::Status MissionManager::resume(const std::string& mission_id) {
    return transition_status(mission_id, MissionStatus::Paused, MissionStatus::Active,
                             MissionEventKind::Resumed);
}

core::errors::Status MissionManager::advance_phase(const std::string& mission_id) {
    MissionPhase current = MissionPhase::Planning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        current = core::errors::get_value(found)->mission.phase;
    }
    if (current == MissionPhase::Completion) {
        return HiveError{ErrorKind::InvalidTransition,
                         "Mission " + mission_id + " is already in the final phase",
                         "invalid_phase_transition"};
    }
    return advance_phase(mission_id,
                         static_cast<MissionPhase>(static_cast<int>(current) + 1));
}

core::errors::Status MissionManager::advance_phase(const std::string& mission_id,
                                                   const MissionPhase target) {
    MissionPhase from = MissionPhase::Planning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        MissionRecord* record = core::errors::get_value(found);
        if (protocol::is_terminal(record->mission.status)) {
            return HiveError{ErrorKind::InvalidState,
                             "Mission " + mission_id + " is " +
                                 protocol::to_string(record->mission.status),
                             "invalid_mission_state"};
        }

        from = record->mission.phase;
        if (!is_valid_transition(from, target)) {
            return HiveError{ErrorKind::InvalidTransition,
                             "Invalid phase transition: " + protocol::to_string(from) +
                                 " -> " + protocol::to_string(target),
                             "invalid_phase_transition"};
        }

        LOG_INFO("MissionManager: mission " + mission_id + " phase " +
                 protocol::to_string(from) + " -> " + protocol::to_string(target));
        record->mission.phase = target;
        record->progress.phase = target;
        record->progress.phase_progress = 0.0;
        record->progress.percent_complete = overall_progress(target);
    }
    events_.publish(MissionEvent{MissionEventKind::PhaseChanged, mission_id, from, target, ""});
    return core::errors::ok();
}

core::errors::Status MissionManager::complete(const std::string& mission_id) {
    MissionPhase from = MissionPhase::Planning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        MissionRecord* record = core::errors::get_value(found);
        if (record->mission.status != MissionStatus::Active) {
            return HiveError{ErrorKind::InvalidState,
                             "Can only complete active missions, mission is " +
                                 protocol::to_string(record->mission.status),
                             "invalid_mission_state"};
        }

        LOG_INFO("MissionManager: mission " + mission_id + " transition active -> completed");
        from = record->mission.phase;
        record->mission.status = MissionStatus::Completed;
        record->mission.phase = MissionPhase::Completion;
        record->mission.completed_at = clock_();
        record->progress.phase = MissionPhase::Completion;
        record->progress.phase_progress = 100.0;
        record->progress.percent_complete = 100.0;
    }
    events_.publish(MissionEvent{MissionEventKind::Completed, mission_id, from,
                                 MissionPhase::Completion, ""});
    return core::errors::ok();
}

core::errors::Status MissionManager::fail(const std::string& mission_id,
                                          const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        MissionRecord* record = core::errors::get_value(found);
        if (protocol::is_terminal(record->mission.status) ||
            record->mission.status == MissionStatus::Failed) {
            return HiveError{ErrorKind::InvalidState,
                             "Cannot fail mission in status " +
                                 protocol::to_string(record->mission.status),
                             "invalid_mission_state"};
        }

        LOG_WARN("MissionManager: mission " + mission_id + " transition " +
                 protocol::to_string(record->mission.status) + " -> failed: " + reason);
        record->mission.status = MissionStatus::Failed;
        record->mission.failure_reason = reason;
        record->mission.completed_at = clock_();
    }
    // Work of a failed mission must not be handed out again.
    cancel_open_tasks(mission_id, "Mission failed: " + reason);
    events_.publish(MissionEvent{MissionEventKind::Failed, mission_id, std::nullopt,
                                 std::nullopt, reason});
    return core::errors::ok();
}

void MissionManager::cancel_open_tasks(const std::string& mission_id, const std::string& reason) {
    for (const auto& task : tasks_.get_by_mission(mission_id)) {
        if (protocol::is_terminal(task.status)) {
            continue;
        }
        auto cancelled = tasks_.cancel(task.id, reason);
        if (core::errors::is_error(cancelled)) {
            // Finished between the snapshot and the cancel.
            LOG_DEBUG("MissionManager: task " + task.id + " not cancelled: " +
                      core::errors::get_error(cancelled).message);
        }
    }
}

core::errors::Status MissionManager::cancel(const std::string& mission_id,
                                            const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        const MissionStatus status = core::errors::get_value(found)->mission.status;
        if (protocol::is_terminal(status)) {
            return HiveError{ErrorKind::InvalidState,
                             "Cannot cancel mission in status " + protocol::to_string(status),
                             "invalid_mission_state"};
        }
    }

    cancel_open_tasks(mission_id, "Mission cancelled: " + reason);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        MissionRecord* record = core::errors::get_value(found);
        if (protocol::is_terminal(record->mission.status)) {
            return HiveError{ErrorKind::InvalidState,
                             "Cannot cancel mission in status " +
                                 protocol::to_string(record->mission.status),
                             "invalid_mission_state"};
        }
        LOG_INFO("MissionManager: mission " + mission_id + " transition " +
                 protocol::to_string(record->mission.status) + " -> cancelled");
        record->mission.status = MissionStatus::Cancelled;
        record->mission.cancel_reason = reason;
        record->mission.completed_at = clock_();
    }
    events_.publish(MissionEvent{MissionEventKind::Cancelled, mission_id, std::nullopt,
                                 std::nullopt, reason});
    return core::errors::ok();
}

core::errors::Status MissionManager::rollback(const std::string& mission_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
    }

    const auto history = rollback_.history(mission_id);
    if (history.empty()) {
        return HiveError{ErrorKind::NoRollbackPoint,
                         "No rollback points for mission " + mission_id,
                         "no_rollback_point"};
    }

    const auto& latest = history.front();
    auto restored = rollback_.rollback(latest.id);
    if (core::errors::is_error(restored)) {
        return core::errors::get_error(restored);
    }

    MissionPhase from = MissionPhase::Planning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        MissionRecord* record = core::errors::get_value(found);
        from = record->mission.phase;
        record->mission.phase = MissionPhase::Planning;
        record->progress.phase = MissionPhase::Planning;
        record->progress.phase_progress = 0.0;
        record->progress.percent_complete = overall_progress(MissionPhase::Planning);
    }

    LOG_INFO("MissionManager: mission " + mission_id + " rolled back to " + latest.id +
             " (" + std::to_string(core::errors::get_value(restored).size()) + " files)");
    events_.publish(MissionEvent{MissionEventKind::RolledBack, mission_id, from,
                                 MissionPhase::Planning, latest.id});
    return core::errors::ok();
}

core::errors::Result<protocol::Task> MissionManager::add_task(const std::string& mission_id,
                                                              const protocol::TaskSpec& spec) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        if (protocol::is_terminal(core::errors::get_value(found)->mission.status)) {
            return HiveError{ErrorKind::InvalidState,
                             "Cannot add tasks to a finished mission",
                             "invalid_mission_state"};
        }
    }

    auto created = tasks_.create(mission_id, spec);
    if (core::errors::is_error(created)) {
        return core::errors::get_error(created);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto found = find_locked(mission_id);
    if (!core::errors::is_error(found)) {
        core::errors::get_value(found)->progress.tasks_total += 1;
    }
    return created;
}

core::errors::Status MissionManager::task_completed(const std::string& mission_id,
                                                    const std::string& task_id) {
    MissionProgress progress;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        MissionRecord* record = core::errors::get_value(found);
        MissionProgress& current = record->progress;
        current.tasks_completed = std::min(current.tasks_completed + 1, current.tasks_total);
        if (current.tasks_total > 0) {
            current.phase_progress = static_cast<double>(current.tasks_completed) /
                                     static_cast<double>(current.tasks_total) * 100.0;
        }

        // Linear estimate from the completion rate so far.
        if (current.started_at.has_value() && current.tasks_completed > 0) {
            const auto now = clock_();
            const auto elapsed = now - current.started_at.value();
            const auto per_task = elapsed / static_cast<long>(current.tasks_completed);
            const auto remaining = current.tasks_total - current.tasks_completed;
            current.estimated_completion = now + per_task * static_cast<long>(remaining);
        }
        progress = current;
    }

    LOG_DEBUG("MissionManager: mission " + mission_id + " task " + task_id + " completed (" +
              std::to_string(progress.tasks_completed) + "/" +
              std::to_string(progress.tasks_total) + ")");
    events_.publish(MissionEvent{MissionEventKind::ProgressUpdated, mission_id, std::nullopt,
                                 std::nullopt, task_id});
    return core::errors::ok();
}

core::errors::Status MissionManager::update_progress(const std::string& mission_id,
                                                     const double phase_progress) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = find_locked(mission_id);
        if (core::errors::is_error(found)) {
            return core::errors::get_error(found);
        }
        core::errors::get_value(found)->progress.phase_progress =
            std::clamp(phase_progress, 0.0, 100.0);
    }
    events_.publish(MissionEvent{MissionEventKind::ProgressUpdated, mission_id, std::nullopt,
                                 std::nullopt, ""});
    return core::errors::ok();
}

std::optional<Mission> MissionManager::get(const std::string& mission_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = missions_.find(mission_id);
    if (it == missions_.end()) {
        return std::nullopt;
    }
    return it->second.mission;
}

core::errors::Result<MissionStatus> MissionManager::get_status(
    const std::string& mission_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = missions_.find(mission_id);
    if (it == missions_.end()) {
        return mission_not_found(mission_id);
    }
    return it->second.mission.status;
}

core::errors::Result<MissionProgress> MissionManager::get_progress(
    const std::string& mission_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = missions_.find(mission_id);
    if (it == missions_.end()) {
        return mission_not_found(mission_id);
    }
    return it->second.progress;
}

std::vector<Mission> MissionManager::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Mission> result;
    for (const auto& id : order_) {
        auto it = missions_.find(id);
        if (it != missions_.end()) {
            result.push_back(it->second.mission);
        }
    }
    return result;
}

std::vector<Mission> MissionManager::active() const {
    return by_status(MissionStatus::Active);
}

std::vector<Mission> MissionManager::by_status(const MissionStatus status) const {
    auto missions = all();
    missions.erase(std::remove_if(missions.begin(), missions.end(),
                                  [status](const Mission& m) { return m.status != status; }),
                   missions.end());
    return missions;
}

MissionStats MissionManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MissionStats stats;
    stats.total = missions_.size();
    for (const auto& entry : missions_) {
        switch (entry.second.mission.status) {
            case MissionStatus::Pending:
                ++stats.pending;
                break;
            case MissionStatus::Active:
                ++stats.active;
                break;
            case MissionStatus::Paused:
                ++stats.paused;
                break;
            case MissionStatus::Completed:
                ++stats.completed;
                break;
            case MissionStatus::Failed:
                ++stats.failed;
                break;
            case MissionStatus::Cancelled:
                ++stats.cancelled;
                break;
        }
    }
    return stats;
}

std::size_t MissionManager::clear_completed() {
    std::vector<std::string> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = missions_.begin(); it != missions_.end();) {
            const MissionStatus status = it->second.mission.status;
            if (status == MissionStatus::Completed || status == MissionStatus::Failed ||
                status == MissionStatus::Cancelled) {
                removed.push_back(it->first);
                it = missions_.erase(it);
            } else {
                ++it;
            }
        }
        order_.erase(std::remove_if(order_.begin(), order_.end(),
                                    [this](const std::string& id) {
                                        return missions_.find(id) == missions_.end();
                                    }),
                     order_.end());
    }
    for (const auto& id : removed) {
        static_cast<void>(tasks_.clear_completed(id));
    }
    return removed.size();
}

core::errors::Result<json> MissionManager::export_mission(const std::string& mission_id) const {
    MissionRecord record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = missions_.find(mission_id);
        if (it == missions_.end()) {
            return mission_not_found(mission_id);
        }
        record = it->second;
    }

    json mission;
    mission["id"] = record.mission.id;
    mission["title"] = record.mission.title;
    mission["description"] = record.mission.description;
    mission["status"] = protocol::to_string(record.mission.status);
    mission["phase"] = protocol::to_string(record.mission.phase);
    mission["priority"] = protocol::to_string(record.mission.priority);
    mission["scope"] = record.mission.scope;
    mission["constraints"] = record.mission.constraints;
    mission["metadata"] = record.mission.metadata;
    mission["failure_reason"] = record.mission.failure_reason.value_or("");
    mission["cancel_reason"] = record.mission.cancel_reason.value_or("");
    mission["created_at_unix_ms"] = core::config::to_unix_ms(record.mission.created_at);
    mission["started_at_unix_ms"] = timestamp_or_null(record.mission.started_at);
    mission["completed_at_unix_ms"] = timestamp_or_null(record.mission.completed_at);

    json progress;
    progress["phase"] = protocol::to_string(record.progress.phase);
    progress["phase_progress"] = record.progress.phase_progress;
    progress["percent_complete"] = record.progress.percent_complete;
    progress["tasks_total"] = record.progress.tasks_total;
    progress["tasks_completed"] = record.progress.tasks_completed;
    progress["estimated_completion_unix_ms"] =
        timestamp_or_null(record.progress.estimated_completion);

    json tasks = json::array();
    for (const auto& task : tasks_.get_by_mission(mission_id)) {
        json entry;
        entry["id"] = task.id;
        entry["type"] = task.type;
        entry["description"] = task.description;
        entry["status"] = protocol::to_string(task.status);
        entry["priority"] = protocol::to_string(task.priority);
        entry["retry_attempt"] = task.retry_attempt;
        json dependencies = json::array();
        for (const auto& dependency : task.dependencies) {
            dependencies.push_back({{"task_id", dependency.task_id},
                                    {"type", protocol::to_string(dependency.type)}});
        }
        entry["dependencies"] = dependencies;
        if (task.result.has_value()) {
            entry["result"] = {{"success", task.result->success},
                               {"output", task.result->output},
                               {"error", task.result->error},
                               {"duration_ms", task.result->duration.count()}};
        }
        tasks.push_back(entry);
    }

    json exported;
    exported["mission"] = mission;
    exported["progress"] = progress;
    exported["tasks"] = tasks;
    return exported;
}

}  // namespace hive::mission
