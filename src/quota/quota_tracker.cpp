#include "quota/quota_tracker.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>
#include "core/logging/logger.hpp"

namespace hive::quota {

using protocol::HiveEvent;
using protocol::QuotaEvent;
using protocol::QuotaEventKind;

namespace {

QuotaEventKind event_kind_for(const QuotaState state) {
    switch (state) {
        case QuotaState::Warning:
            return QuotaEventKind::Warning;
        case QuotaState::Critical:
            return QuotaEventKind::Critical;
        default:
            return QuotaEventKind::Exceeded;
    }
}

}  // namespace

std::string to_string(const QuotaState state) {
    switch (state) {
        case QuotaState::Ok:
            return "ok";
        case QuotaState::Warning:
            return "warning";
        case QuotaState::Critical:
            return "critical";
        case QuotaState::Exceeded:
            return "exceeded";
        default:
            return "unknown";
    }
}

FixedCapacityEstimator::FixedCapacityEstimator(const double default_capacity,
                                               std::map<std::string, double> per_provider)
    : default_capacity_(default_capacity), per_provider_(std::move(per_provider)) {}

double FixedCapacityEstimator::estimate(const std::string& provider) const {
    auto it = per_provider_.find(provider);
    if (it != per_provider_.end()) {
        return it->second;
    }
    return default_capacity_;
}

QuotaTracker::QuotaTracker(protocol::EventSink& events, QuotaConfig config,
                           std::shared_ptr<const CapacityEstimator> estimator,
                           core::config::Clock clock)
    : events_(events),
      config_(std::move(config)),
      estimator_(std::move(estimator)),
      clock_(std::move(clock)) {
    if (!estimator_) {
        estimator_ = std::make_shared<FixedCapacityEstimator>(config_.estimated_capacity);
    }
    const auto now = clock_();
    for (const auto& provider : config_.providers) {
        ProviderState state;
        state.window = open_window(provider, now);
        providers_.emplace(provider, std::move(state));
    }
}

const QuotaConfig& QuotaTracker::config() const {
    return config_;
}

QuotaWindow QuotaTracker::open_window(const std::string& provider,
                                      const core::config::SystemTime start) const {
    QuotaWindow window;
    window.id = core::config::generate_id("window");
    window.provider = provider;
    window.start = start;
    window.end = start + config_.window_duration;
    window.limits = config_.limits;
    return window;
}

QuotaTracker::ProviderState& QuotaTracker::current_locked(
    const std::string& provider, std::vector<HiveEvent>& events) {
    const auto now = clock_();
    auto it = providers_.find(provider);
    if (it == providers_.end()) {
        ProviderState state;
        state.window = open_window(provider, now);
        it = providers_.emplace(provider, std::move(state)).first;
        return it->second;
    }

    ProviderState& state = it->second;
    if (now >= state.window.end) {
        LOG_INFO("QuotaTracker: window " + state.window.id + " for " + provider +
                 " expired, opening a new one");
        state.window = open_window(provider, now);
        state.last_notified = QuotaState::Ok;
        events.push_back(QuotaEvent{QuotaEventKind::Reset, provider, 0.0,
                                    config_.window_duration});
    }
    return state;
}

double QuotaTracker::ratio_locked(const QuotaWindow& window) const {
    const double capacity = estimator_->estimate(window.provider);
    if (capacity <= 0.0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(window.usage.call_count) / capacity);
}

QuotaState QuotaTracker::classify(const double ratio, const UsageLimits& limits) const {
    if (ratio >= limits.hard_stop_threshold) {
        return QuotaState::Exceeded;
    }
    if (ratio >= limits.warning_threshold && ratio >= limits.critical_threshold) {
        return QuotaState::Critical;
    }
    if (ratio >= limits.warning_threshold) {
        return QuotaState::Warning;
    }
    return QuotaState::Ok;
}

QuotaStatus QuotaTracker::status_locked(const ProviderState& state) const {
    QuotaStatus status;
    status.provider = state.window.provider;
    status.usage_ratio = ratio_locked(state.window);
    status.state = classify(status.usage_ratio, state.window.limits);
    const auto remaining = state.window.end - clock_();
    status.reset_in = std::max(std::chrono::milliseconds(0),
                               std::chrono::duration_cast<std::chrono::milliseconds>(remaining));
    status.window = state.window;
    return status;
}

void QuotaTracker::sample_history_locked(ProviderState& state) {
    const auto now = clock_();
    if (!state.history.empty() &&
        now - state.history.back().timestamp < config_.history_interval) {
        return;
    }
    UsageHistoryEntry entry;
    entry.timestamp = now;
    entry.call_count = state.window.usage.call_count;
    entry.usage_ratio = ratio_locked(state.window);
    state.history.push_back(entry);
    if (state.history.size() > config_.max_history) {
        state.history.erase(state.history.begin(),
                            state.history.begin() +
                                static_cast<std::ptrdiff_t>(state.history.size() -
                                                            config_.max_history));
    }
}

void QuotaTracker::record_usage(const std::string& provider,
                                const protocol::HierarchyTier tier,
                                const std::uint64_t tokens_sent,
                                const std::uint64_t tokens_received) {
    std::vector<HiveEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ProviderState& state = current_locked(provider, events);

        UsageMetrics& usage = state.window.usage;
        usage.call_count += 1;
        usage.tokens_sent += tokens_sent;
        usage.tokens_received += tokens_received;
        TierUsage& tier_usage = usage.by_tier[tier];
        tier_usage.call_count += 1;
        tier_usage.tokens_sent += tokens_sent;
        tier_usage.tokens_received += tokens_received;

        sample_history_locked(state);

        const QuotaStatus status = status_locked(state);
        if (static_cast<int>(status.state) > static_cast<int>(state.last_notified)) {
            LOG_WARN("QuotaTracker: provider " + provider + " transition " +
                     to_string(state.last_notified) + " -> " + to_string(status.state) +
                     " (ratio " + std::to_string(status.usage_ratio) + ")");
            state.last_notified = status.state;
            events.push_back(QuotaEvent{event_kind_for(status.state), provider,
                                        status.usage_ratio, status.reset_in});
        }
    }
    publish_all(events);
}

bool QuotaTracker::can_execute(const std::string& provider) {
    return get_status(provider).state != QuotaState::Exceeded;
}

QuotaStatus QuotaTracker::get_status(const std::string& provider) {
    std::vector<HiveEvent> events;
    QuotaStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        status = status_locked(current_locked(provider, events));
    }
    publish_all(events);
    return status;
}

std::chrono::milliseconds QuotaTracker::time_until_reset(const std::string& provider) {
    return get_status(provider).reset_in;
}

std::map<std::string, QuotaStatus> QuotaTracker::all_statuses() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : providers_) {
            names.push_back(entry.first);
        }
    }
    std::map<std::string, QuotaStatus> statuses;
    for (const auto& name : names) {
        statuses.emplace(name, get_status(name));
    }
    return statuses;
}

std::vector<UsageHistoryEntry> QuotaTracker::usage_history(const std::string& provider) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(provider);
    if (it == providers_.end()) {
        return {};
    }
    return it->second.history;
}

void QuotaTracker::publish_all(const std::vector<HiveEvent>& events) {
    for (const auto& event : events) {
        events_.publish(event);
    }
}

}  // namespace hive::quota
