#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/concurrency/timer_queue.hpp"
#include "core/errors/hive_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/model_contract.hpp"
#include "quota/quota_tracker.hpp"

namespace hive::pool {

struct PoolConfig {
    std::size_t max_agents = 5;
    std::chrono::milliseconds idle_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds request_timeout{std::chrono::minutes(2)};
    std::chrono::milliseconds min_request_interval{100};
    std::uint32_t default_max_tokens = 4096;
    double default_temperature = 0.7;
};

enum class AgentStatus {
    Idle,
    Busy
};

struct PoolAgent {
    std::string id;
    AgentStatus status = AgentStatus::Idle;
    std::chrono::steady_clock::time_point created_at{};
    std::chrono::steady_clock::time_point last_active_at{};
    std::uint64_t request_count = 0;
    std::uint64_t token_count = 0;
    std::uint64_t error_count = 0;
};

struct PoolStats {
    std::size_t total_agents = 0;
    std::size_t idle_agents = 0;
    std::size_t busy_agents = 0;
    std::size_t queue_length = 0;
    std::uint64_t total_requests = 0;
    std::uint64_t total_tokens = 0;
    std::uint64_t total_errors = 0;
};

// Bounded set of model-backed agents behind a FIFO request queue.
//
// execute() blocks the calling thread until the request settles. A single
// dispatch thread drains the queue, honouring the agent ceiling and the
// minimum inter-dispatch interval; model calls run on worker threads.
class AgentPool {
public:
    AgentPool(protocol::ModelClient& model, quota::QuotaTracker& quota,
              protocol::EventSink& events, PoolConfig config = {});
    ~AgentPool();

    AgentPool(const AgentPool&) = delete;
    AgentPool& operator=(const AgentPool&) = delete;

    core::errors::Result<PoolAgent> acquire();
    core::errors::Status release(const std::string& agent_id);

    core::errors::Result<protocol::AgentResponse> execute(
        const protocol::AgentRequest& request,
        const core::concurrency::CancelToken& cancel = core::concurrency::CancelToken());

    std::optional<AgentStatus> get_status(const std::string& agent_id) const;
    std::vector<PoolAgent> agents() const;
    std::size_t available_count() const;
    PoolStats stats() const;

    void set_rate_limit(double requests_per_second);

    // Retires idle agents past the idle timeout, always keeping one.
    std::size_t sweep_idle_agents();

    // Fails queued requests and joins every pool thread. Idempotent.
    void shutdown();

private:
    using Outcome = core::errors::Result<protocol::AgentResponse>;

    struct PendingRequest {
        protocol::AgentRequest request;
        core::concurrency::CancelToken cancel;
        std::promise<Outcome> promise;
        core::concurrency::TimerQueue::TimerId timer = 0;
    };

    struct WorkItem {
        std::string agent_id;
        std::shared_ptr<PendingRequest> pending;
    };

    void dispatch_loop();
    void worker_loop();
    void sweeper_loop();

    void perform(const WorkItem& item);
    std::string build_prompt(const protocol::AgentRequest& request) const;

    // Caller holds mutex_.
    bool has_capacity_locked() const;
    std::optional<std::string> acquire_locked(std::vector<protocol::HiveEvent>& events);
    void release_locked(const std::string& agent_id);
    bool remove_queued_locked(const std::shared_ptr<PendingRequest>& pending);

    void expire_request(const std::shared_ptr<PendingRequest>& pending);
    void cancel_request(const std::shared_ptr<PendingRequest>& pending);
    void publish_all(const std::vector<protocol::HiveEvent>& events);

    protocol::ModelClient& model_;
    quota::QuotaTracker& quota_;
    protocol::EventSink& events_;
    PoolConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable dispatch_cv_;
    std::condition_variable work_cv_;
    std::condition_variable sweep_cv_;
    std::unordered_map<std::string, PoolAgent> agents_;
    std::deque<std::shared_ptr<PendingRequest>> queue_;
    std::deque<WorkItem> work_;
    std::chrono::milliseconds min_interval_;
    std::chrono::steady_clock::time_point last_dispatch_{};
    bool stopping_ = false;

    core::concurrency::TimerQueue timers_;
    std::thread dispatcher_;
    std::thread sweeper_;
    std::vector<std::thread> workers_;
};

std::string to_string(AgentStatus status);

}  // namespace hive::pool
