#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config/ids.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/model_contract.hpp"

namespace hive::quota {

enum class QuotaState {
    Ok,
    Warning,
    Critical,
    Exceeded
};

// Expected number of calls a provider accepts per window.
class CapacityEstimator {
public:
    virtual ~CapacityEstimator() = default;
    virtual double estimate(const std::string& provider) const = 0;
};

class FixedCapacityEstimator final : public CapacityEstimator {
public:
    explicit FixedCapacityEstimator(double default_capacity,
                                    std::map<std::string, double> per_provider = {});

    double estimate(const std::string& provider) const override;

private:
    double default_capacity_;
    std::map<std::string, double> per_provider_;
};

struct TierUsage {
    std::uint64_t call_count = 0;
    std::uint64_t tokens_sent = 0;
    std::uint64_t tokens_received = 0;
};

struct UsageMetrics {
    std::uint64_t call_count = 0;
    std::uint64_t tokens_sent = 0;
    std::uint64_t tokens_received = 0;
    std::map<protocol::HierarchyTier, TierUsage> by_tier;
};

struct UsageLimits {
    double warning_threshold = 0.8;
    double critical_threshold = 0.9;
    double hard_stop_threshold = 0.95;
};

struct QuotaWindow {
    std::string id;
    std::string provider;
    core::config::SystemTime start{};
    core::config::SystemTime end{};
    UsageMetrics usage;
    UsageLimits limits;
};

struct QuotaStatus {
    std::string provider;
    double usage_ratio = 0.0;
    QuotaState state = QuotaState::Ok;
    std::chrono::milliseconds reset_in{0};
    QuotaWindow window;
};

struct UsageHistoryEntry {
    core::config::SystemTime timestamp{};
    std::uint64_t call_count = 0;
    double usage_ratio = 0.0;
};

struct QuotaConfig {
    std::chrono::milliseconds window_duration{std::chrono::hours(5)};
    UsageLimits limits;
    double estimated_capacity = 100.0;
    std::vector<std::string> providers = {"claude", "glm"};
    std::size_t max_history = 12;
    std::chrono::milliseconds history_interval{std::chrono::minutes(5)};
};

class QuotaTracker {
public:
    // A null estimator means FixedCapacityEstimator(config.estimated_capacity).
    explicit QuotaTracker(protocol::EventSink& events, QuotaConfig config = {},
                          std::shared_ptr<const CapacityEstimator> estimator = nullptr,
                          core::config::Clock clock = core::config::system_clock());

    void record_usage(const std::string& provider, protocol::HierarchyTier tier,
                      std::uint64_t tokens_sent, std::uint64_t tokens_received);

    bool can_execute(const std::string& provider);
    QuotaStatus get_status(const std::string& provider);
    std::chrono::milliseconds time_until_reset(const std::string& provider);
    std::map<std::string, QuotaStatus> all_statuses();
    std::vector<UsageHistoryEntry> usage_history(const std::string& provider) const;

    const QuotaConfig& config() const;

private:
    struct ProviderState {
        QuotaWindow window;
        QuotaState last_notified = QuotaState::Ok;
        std::vector<UsageHistoryEntry> history;
    };

    // Caller holds mutex_.
    ProviderState& current_locked(const std::string& provider,
                                  std::vector<protocol::HiveEvent>& events);
    QuotaStatus status_locked(const ProviderState& state) const;
    double ratio_locked(const QuotaWindow& window) const;
    QuotaState classify(double ratio, const UsageLimits& limits) const;
    void sample_history_locked(ProviderState& state);
    QuotaWindow open_window(const std::string& provider, core::config::SystemTime start) const;

    void publish_all(const std::vector<protocol::HiveEvent>& events);

    protocol::EventSink& events_;
    QuotaConfig config_;
    std::shared_ptr<const CapacityEstimator> estimator_;
    core::config::Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderState> providers_;
};

std::string to_string(QuotaState state);

}  // namespace hive::quota
