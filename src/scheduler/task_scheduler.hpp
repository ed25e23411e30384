#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/concurrency/timer_queue.hpp"
#include "core/config/ids.hpp"
#include "core/errors/hive_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/task_contract.hpp"
#include "scheduler/retry_policy.hpp"

namespace hive::scheduler {

struct SchedulerConfig {
    std::size_t max_concurrent_tasks = 10;
    std::chrono::milliseconds task_timeout{std::chrono::minutes(5)};
    RetryPolicy retry_policy;
};

struct SchedulerStats {
    std::size_t total = 0;
    std::size_t pending = 0;
    std::size_t blocked = 0;
    std::size_t running = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;
};

// Owns every task record. All mutations go through this class; events are
// published after the internal lock is released.
class TaskScheduler {
public:
    explicit TaskScheduler(protocol::EventSink& events, SchedulerConfig config = {},
                           core::config::Clock clock = core::config::system_clock());
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    core::errors::Result<protocol::Task> create(const std::string& mission_id,
                                                const protocol::TaskSpec& spec);
    core::errors::Status start(const std::string& task_id);
    core::errors::Status complete(const std::string& task_id,
                                  const protocol::TaskResult& result);
    core::errors::Status cancel(const std::string& task_id, const std::string& reason);

    // Highest-priority pending task whose dependencies are met.
    std::optional<protocol::Task> get_next() const;

    // Every startable task of the mission, in scheduling order.
    std::vector<protocol::Task> ready_tasks(const std::string& mission_id) const;

    core::errors::Result<protocol::Task> retry(const std::string& task_id);

    // Bumps the attempt counter of a running task; returns the new value.
    core::errors::Result<std::uint32_t> record_attempt(const std::string& task_id);

    std::optional<protocol::Task> get(const std::string& task_id) const;
    core::errors::Result<protocol::TaskStatus> get_status(const std::string& task_id) const;
    std::optional<protocol::TaskResult> get_result(const std::string& task_id) const;
    std::vector<protocol::Task> get_by_mission(const std::string& mission_id) const;
    std::optional<core::concurrency::CancelToken> cancel_token(
        const std::string& task_id) const;

    SchedulerStats stats() const;
    std::size_t running_count() const;

    // Drops terminal tasks of the mission; returns how many were removed.
    std::size_t clear_completed(const std::string& mission_id);

    const RetryPolicy& retry_policy() const;

private:
    struct TaskRecord {
        protocol::Task task;
        core::concurrency::CancelToken cancel_token;
        core::concurrency::TimerQueue::TimerId timeout_timer = 0;
    };

    struct QueueKey {
        int priority_rank;
        std::uint64_t sequence;
        std::string task_id;

        bool operator<(const QueueKey& other) const {
            if (priority_rank != other.priority_rank) {
                return priority_rank < other.priority_rank;
            }
            return sequence < other.sequence;
        }
    };

    static QueueKey queue_key(const protocol::Task& task);

    // Caller holds mutex_.
    bool dependencies_met(const protocol::Task& task) const;
    core::errors::Status complete_locked(const std::string& task_id,
                                         const protocol::TaskResult& result,
                                         std::vector<protocol::HiveEvent>& events);
    void unblock_ready_locked(std::vector<protocol::HiveEvent>& events);
    std::size_t running_count_locked() const;

    void handle_timeout(const std::string& task_id);
    void publish_all(const std::vector<protocol::HiveEvent>& events);

    protocol::EventSink& events_;
    SchedulerConfig config_;
    core::config::Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TaskRecord> tasks_;
    std::set<QueueKey> queue_;
    std::uint64_t next_sequence_ = 1;

    // Declared last: destroyed first, so no timeout fires into a dead scheduler.
    core::concurrency::TimerQueue timers_;
};

}  // namespace hive::scheduler
