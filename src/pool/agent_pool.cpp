#include "pool/agent_pool.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace hive::pool {

using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::AgentEvent;
using protocol::AgentEventKind;
using protocol::AgentRequest;
using protocol::AgentResponse;
using protocol::HiveEvent;

std::string to_string(const AgentStatus status) {
    return status == AgentStatus::Idle ? "idle" : "busy";
}

AgentPool::AgentPool(protocol::ModelClient& model, quota::QuotaTracker& quota,
                     protocol::EventSink& events, PoolConfig config)
    : model_(model),
      quota_(quota),
      events_(events),
      config_(std::move(config)),
      min_interval_(config_.min_request_interval) {
    if (config_.max_agents == 0) {
        config_.max_agents = 1;
    }
    dispatcher_ = std::thread([this] { dispatch_loop(); });
    sweeper_ = std::thread([this] { sweeper_loop(); });
    for (std::size_t i = 0; i < config_.max_agents; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

AgentPool::~AgentPool() {
    shutdown();
}

bool AgentPool::has_capacity_locked() const {
    if (agents_.size() < config_.max_agents) {
        return true;
    }
    return std::any_of(agents_.begin(), agents_.end(), [](const auto& entry) {
        return entry.second.status == AgentStatus::Idle;
    });
}

std::optional<std::string> AgentPool::acquire_locked(std::vector<HiveEvent>& events) {
    for (auto& entry : agents_) {
        if (entry.second.status == AgentStatus::Idle) {
            entry.second.status = AgentStatus::Busy;
            entry.second.last_active_at = std::chrono::steady_clock::now();
            return entry.first;
        }
    }
    if (agents_.size() >= config_.max_agents) {
        return std::nullopt;
    }

    PoolAgent agent;
    agent.id = core::config::generate_id("agent");
    agent.status = AgentStatus::Busy;
    agent.created_at = std::chrono::steady_clock::now();
    agent.last_active_at = agent.created_at;
    const std::string id = agent.id;
    agents_.emplace(id, std::move(agent));
    LOG_INFO("AgentPool: agent " + id + " created (" + std::to_string(agents_.size()) +
             "/" + std::to_string(config_.max_agents) + ")");
    events.push_back(AgentEvent{AgentEventKind::Created, id, "", ""});
    return id;
}

void AgentPool::release_locked(const std::string& agent_id) {
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return;
    }
    it->second.status = AgentStatus::Idle;
    it->second.last_active_at = std::chrono::steady_clock::now();
}

core::errors::Result<PoolAgent> AgentPool::acquire() {
    std::vector<HiveEvent> events;
    PoolAgent snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return HiveError{ErrorKind::InvalidState, "Agent pool is shut down",
                             "pool_shutdown"};
        }
        auto agent_id = acquire_locked(events);
        if (!agent_id.has_value()) {
            return HiveError{ErrorKind::CapacityExceeded, "No agents available",
                             "no_agents_available"};
        }
        snapshot = agents_.at(agent_id.value());
    }
    publish_all(events);
    return snapshot;
}

core::errors::Status AgentPool::release(const std::string& agent_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (agents_.find(agent_id) == agents_.end()) {
            return HiveError{ErrorKind::NotFound, "Agent not found: " + agent_id,
                             "agent_not_found"};
        }
        release_locked(agent_id);
    }
    dispatch_cv_.notify_one();
    return core::errors::ok();
}

core::errors::Result<AgentResponse> AgentPool::execute(
    const AgentRequest& request, const core::concurrency::CancelToken& cancel) {
    if (!quota_.can_execute(request.provider)) {
        LOG_WARN("AgentPool: quota exceeded for provider " + request.provider);
        return HiveError{ErrorKind::QuotaExceeded,
                         "Quota exceeded for provider " + request.provider,
                         "quota_exceeded",
                         "Wait for the usage window to reset."};
    }
    if (cancel.is_cancelled()) {
        return HiveError{ErrorKind::Cancelled, "Request cancelled before queueing",
                         "request_cancelled"};
    }

    auto pending = std::make_shared<PendingRequest>();
    pending->request = request;
    if (pending->request.id.empty()) {
        pending->request.id = core::config::generate_id("req");
    }
    pending->cancel = cancel;
    auto future = pending->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return HiveError{ErrorKind::InvalidState, "Agent pool is shut down",
                             "pool_shutdown"};
        }
        queue_.push_back(pending);
        pending->timer = timers_.schedule_after(
            config_.request_timeout, [this, pending]() { expire_request(pending); });
        LOG_DEBUG("AgentPool: request " + pending->request.id + " queued (depth " +
                  std::to_string(queue_.size()) + ")");
    }
    const auto callback_id = cancel.on_cancel([this, pending]() { cancel_request(pending); });
    dispatch_cv_.notify_one();

    Outcome outcome = future.get();
    cancel.remove_callback(callback_id);
    return outcome;
}

bool AgentPool::remove_queued_locked(const std::shared_ptr<PendingRequest>& pending) {
    auto it = std::find(queue_.begin(), queue_.end(), pending);
    if (it == queue_.end()) {
        return false;
    }
    queue_.erase(it);
    return true;
}

void AgentPool::expire_request(const std::shared_ptr<PendingRequest>& pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!remove_queued_locked(pending)) {
        return;
    }
    LOG_WARN("AgentPool: request " + pending->request.id + " timed out in queue");
    pending->promise.set_value(HiveError{
        ErrorKind::Timeout,
        "Request timed out after " + std::to_string(config_.request_timeout.count()) + "ms",
        "request_timeout"});
}

void AgentPool::cancel_request(const std::shared_ptr<PendingRequest>& pending) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!remove_queued_locked(pending)) {
        return;
    }
    static_cast<void>(timers_.cancel(pending->timer));
    LOG_INFO("AgentPool: request " + pending->request.id + " cancelled while queued");
    pending->promise.set_value(HiveError{ErrorKind::Cancelled,
                                         "Request cancelled: " + pending->request.id,
                                         "request_cancelled"});
}

void AgentPool::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        dispatch_cv_.wait(lock, [this] {
            return stopping_ || (!queue_.empty() && has_capacity_locked());
        });
        if (stopping_) {
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        const auto next_allowed = last_dispatch_ + min_interval_;
        if (now < next_allowed) {
            dispatch_cv_.wait_until(lock, next_allowed, [this] { return stopping_; });
            continue;
        }

        std::vector<HiveEvent> events;
        auto agent_id = acquire_locked(events);
        if (!agent_id.has_value()) {
            continue;
        }

        auto pending = queue_.front();
        queue_.pop_front();
        static_cast<void>(timers_.cancel(pending->timer));

        if (pending->cancel.is_cancelled()) {
            release_locked(agent_id.value());
            pending->promise.set_value(HiveError{ErrorKind::Cancelled,
                                                 "Request cancelled: " + pending->request.id,
                                                 "request_cancelled"});
        } else {
            last_dispatch_ = now;
            work_.push_back(WorkItem{agent_id.value(), pending});
            work_cv_.notify_one();
        }

        if (!events.empty()) {
            lock.unlock();
            publish_all(events);
            lock.lock();
        }
    }
}

void AgentPool::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this] { return stopping_ || !work_.empty(); });
        if (work_.empty()) {
            return;
        }
        WorkItem item = std::move(work_.front());
        work_.pop_front();

        lock.unlock();
        perform(item);
        lock.lock();
    }
}

void AgentPool::perform(const WorkItem& item) {
    const AgentRequest& request = item.pending->request;
    const auto started = std::chrono::steady_clock::now();

    protocol::CompletionRequest completion;
    completion.prompt = build_prompt(request);
    completion.system_prompt = request.system_context;
    completion.max_tokens = request.max_tokens.value_or(config_.default_max_tokens);
    completion.temperature = request.temperature.value_or(config_.default_temperature);
    completion.stop_sequences = request.stop_sequences;

    auto result = model_.complete(completion, item.pending->cancel);
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    std::vector<HiveEvent> events;
    Outcome outcome = HiveError{ErrorKind::Internal, "Request not processed", "internal"};

    if (core::errors::is_error(result)) {
        const HiveError& error = core::errors::get_error(result);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = agents_.find(item.agent_id);
            if (it != agents_.end()) {
                it->second.error_count += 1;
            }
            release_locked(item.agent_id);
        }

        if (item.pending->cancel.is_cancelled() || error.kind == ErrorKind::Cancelled) {
            outcome = HiveError{ErrorKind::Cancelled, "Request cancelled: " + request.id,
                                "request_cancelled"};
        } else if (error.kind == ErrorKind::Timeout || error.kind == ErrorKind::QuotaExceeded) {
            outcome = error;
        } else {
            outcome = HiveError{ErrorKind::ExecutionFailed,
                                "Model call failed: " + error.message, "model_call_failed",
                                error.hint};
        }
        LOG_WARN("AgentPool: agent " + item.agent_id + " request " + request.id +
                 " failed: " + error.message);
        events.push_back(AgentEvent{AgentEventKind::Failed, item.agent_id, request.id,
                                    error.message});
    } else {
        const protocol::CompletionResponse& completion_response = core::errors::get_value(result);
        protocol::TokenUsage usage = completion_response.usage;
        if (usage.total_tokens == 0) {
            usage.prompt_tokens = protocol::estimate_tokens(completion.prompt);
            usage.completion_tokens = protocol::estimate_tokens(completion_response.content);
            usage.total_tokens = usage.prompt_tokens + usage.completion_tokens;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = agents_.find(item.agent_id);
            if (it != agents_.end()) {
                it->second.request_count += 1;
                it->second.token_count += usage.total_tokens;
            }
            release_locked(item.agent_id);
        }
        quota_.record_usage(request.provider, request.tier, usage.prompt_tokens,
                            usage.completion_tokens);

        AgentResponse response;
        response.agent_id = item.agent_id;
        response.request_id = request.id;
        response.task_id = request.task_id;
        response.content = completion_response.content;
        response.usage = usage;
        response.duration = duration;
        response.provider = request.provider;
        response.model = completion_response.model;
        response.finish_reason = completion_response.finish_reason;
        outcome = response;

        LOG_DEBUG("AgentPool: agent " + item.agent_id + " completed request " + request.id +
                  " in " + std::to_string(duration.count()) + "ms");
        events.push_back(AgentEvent{AgentEventKind::Responded, item.agent_id, request.id, ""});
    }

    dispatch_cv_.notify_one();
    publish_all(events);
    item.pending->promise.set_value(std::move(outcome));
}

std::string AgentPool::build_prompt(const AgentRequest& request) const {
    std::ostringstream prompt;
    if (!request.system_context.empty()) {
        prompt << "<system>\n" << request.system_context << "\n</system>\n\n";
    }
    if (!request.context.empty()) {
        prompt << "<context>\n";
        for (const auto& item : request.context) {
            prompt << "--- " << (item.path.empty() ? item.type : item.path) << " ---\n"
                   << item.content << "\n";
        }
        prompt << "</context>\n\n";
    }
    prompt << "<task>\n" << request.prompt << "\n</task>";
    return prompt.str();
}

void AgentPool::sweeper_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        sweep_cv_.wait_for(lock, config_.idle_timeout, [this] { return stopping_; });
        if (stopping_) {
            return;
        }
        lock.unlock();
        static_cast<void>(sweep_idle_agents());
        lock.lock();
    }
}

std::size_t AgentPool::sweep_idle_agents() {
    std::vector<HiveEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        std::vector<std::pair<std::chrono::steady_clock::time_point, std::string>> idle;
        for (const auto& entry : agents_) {
            const PoolAgent& agent = entry.second;
            if (agent.status == AgentStatus::Idle &&
                now - agent.last_active_at > config_.idle_timeout) {
                idle.emplace_back(agent.last_active_at, agent.id);
            }
        }
        std::sort(idle.begin(), idle.end());

        for (const auto& candidate : idle) {
            if (agents_.size() <= 1) {
                break;
            }
            agents_.erase(candidate.second);
            LOG_INFO("AgentPool: agent " + candidate.second + " retired after idle timeout");
            events.push_back(AgentEvent{AgentEventKind::Retired, candidate.second, "", ""});
        }
    }
    publish_all(events);
    return events.size();
}

void AgentPool::set_rate_limit(const double requests_per_second) {
    if (requests_per_second <= 0.0) {
        LOG_WARN("AgentPool: ignoring non-positive rate limit");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        min_interval_ = std::chrono::milliseconds(
            static_cast<std::int64_t>(1000.0 / requests_per_second));
    }
    dispatch_cv_.notify_one();
}

std::optional<AgentStatus> AgentPool::get_status(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::vector<PoolAgent> AgentPool::agents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PoolAgent> result;
    result.reserve(agents_.size());
    for (const auto& entry : agents_) {
        result.push_back(entry.second);
    }
    return result;
}

std::size_t AgentPool::available_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto idle = static_cast<std::size_t>(
        std::count_if(agents_.begin(), agents_.end(), [](const auto& entry) {
            return entry.second.status == AgentStatus::Idle;
        }));
    return idle + (config_.max_agents - agents_.size());
}

PoolStats AgentPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats stats;
    stats.total_agents = agents_.size();
    stats.queue_length = queue_.size();
    for (const auto& entry : agents_) {
        if (entry.second.status == AgentStatus::Idle) {
            ++stats.idle_agents;
        } else {
            ++stats.busy_agents;
        }
        stats.total_requests += entry.second.request_count;
        stats.total_tokens += entry.second.token_count;
        stats.total_errors += entry.second.error_count;
    }
    return stats;
}

void AgentPool::shutdown() {
    std::deque<std::shared_ptr<PendingRequest>> queued;
    std::deque<WorkItem> undispatched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        queued.swap(queue_);
        undispatched.swap(work_);
        for (const auto& item : undispatched) {
            release_locked(item.agent_id);
        }
    }
    dispatch_cv_.notify_all();
    work_cv_.notify_all();
    sweep_cv_.notify_all();

    const HiveError shutdown_error{ErrorKind::InvalidState, "Agent pool is shut down",
                                   "pool_shutdown"};
    for (const auto& pending : queued) {
        static_cast<void>(timers_.cancel(pending->timer));
        pending->promise.set_value(shutdown_error);
    }
    for (const auto& item : undispatched) {
        item.pending->promise.set_value(shutdown_error);
    }
    if (!queued.empty() || !undispatched.empty()) {
        LOG_WARN("AgentPool: shutdown rejected " +
                 std::to_string(queued.size() + undispatched.size()) + " queued requests");
    }

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    timers_.shutdown();
}

void AgentPool::publish_all(const std::vector<HiveEvent>& events) {
    for (const auto& event : events) {
        events_.publish(event);
    }
}

}  // namespace hive::pool
