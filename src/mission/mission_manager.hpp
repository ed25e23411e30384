#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/errors/hive_errors.hpp"
#include "protocol/capability_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/mission_contract.hpp"
#include "scheduler/task_scheduler.hpp"

namespace hive::mission {

struct MissionStats {
    std::size_t total = 0;
    std::size_t pending = 0;
    std::size_t active = 0;
    std::size_t paused = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
};

// Mission lifecycle and the phase graph:
//   planning     -> validation | completion
//   validation   -> execution  | planning
//   execution    -> verification | planning
//   verification -> completion | execution
//   completion   -> (none)
class MissionManager {
public:
    MissionManager(scheduler::TaskScheduler& tasks, protocol::RollbackStore& rollback,
                   protocol::EventSink& events,
                   core::config::Clock clock = core::config::system_clock());

    core::errors::Result<protocol::Mission> create(const protocol::MissionConfig& config);

    core::errors::Status start(const std::string& mission_id);
    core::errors::Status pause(const std::string& mission_id);
    core::errors::Status resume(const std::string& mission_id);

    // Next phase in forward order.
    core::errors::Status advance_phase(const std::string& mission_id);
    core::errors::Status advance_phase(const std::string& mission_id,
                                       protocol::MissionPhase target);

    core::errors::Status complete(const std::string& mission_id);
    core::errors::Status fail(const std::string& mission_id, const std::string& reason);
    core::errors::Status cancel(const std::string& mission_id, const std::string& reason);

    // Restores the newest recovery point and returns to planning.
    core::errors::Status rollback(const std::string& mission_id);

    core::errors::Result<protocol::Task> add_task(const std::string& mission_id,
                                                  const protocol::TaskSpec& spec);
    core::errors::Status task_completed(const std::string& mission_id,
                                        const std::string& task_id);
    core::errors::Status update_progress(const std::string& mission_id,
                                         double phase_progress);

    std::optional<protocol::Mission> get(const std::string& mission_id) const;
    core::errors::Result<protocol::MissionStatus> get_status(const std::string& mission_id) const;
    core::errors::Result<protocol::MissionProgress> get_progress(const std::string& mission_id) const;
    std::vector<protocol::Mission> all() const;
    std::vector<protocol::Mission> active() const;
    std::vector<protocol::Mission> by_status(protocol::MissionStatus status) const;

    MissionStats stats() const;
    std::size_t clear_completed();
    core::errors::Result<nlohmann::json> export_mission(const std::string& mission_id) const;

    static bool is_valid_transition(protocol::MissionPhase from, protocol::MissionPhase to);
    static std::vector<protocol::MissionPhase> allowed_transitions(protocol::MissionPhase from);

private:
    struct MissionRecord {
        protocol::Mission mission;
        protocol::MissionProgress progress;
    };

    core::errors::Result<MissionRecord*> find_locked(const std::string& mission_id);
    core::errors::Status transition_status(const std::string& mission_id,
                                           protocol::MissionStatus required,
                                           protocol::MissionStatus next,
                                           protocol::MissionEventKind event);
    static double overall_progress(protocol::MissionPhase phase);
    // Cancels every non-terminal task of the mission; called without mutex_.
    void cancel_open_tasks(const std::string& mission_id, const std::string& reason);

    scheduler::TaskScheduler& tasks_;
    protocol::RollbackStore& rollback_;
    protocol::EventSink& events_;
    core::config::Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MissionRecord> missions_;
    std::vector<std::string> order_;
};

}  // namespace hive::mission
