#include "app/config_loader.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace hive::app {

using core::errors::ErrorKind;
using core::errors::HiveError;
using core::errors::Status;
using nlohmann::json;

namespace {

HiveError config_error(const std::string& message) {
    return HiveError{ErrorKind::Input, message, "invalid_config",
                     "Fix the value in the config file or remove it to use the default."};
}

// Typed reads from one top-level section. The first bad value is kept and
// later reads become no-ops.
class Section {
public:
    Section(const json& document, std::string name) : name_(std::move(name)) {
        if (!document.contains(name_)) {
            return;
        }
        if (!document[name_].is_object()) {
            error_ = config_error(name_ + " must be an object.");
            return;
        }
        object_ = &document[name_];
    }

    void flag(const char* key, bool& out) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_boolean()) {
            fail(key, "must be true or false");
            return;
        }
        out = value->get<bool>();
    }

    template <typename T>
    void count(const char* key, T& out, const std::uint64_t min,
               const std::uint64_t max = std::numeric_limits<T>::max()) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_number_unsigned()) {
            fail(key, "must be a non-negative integer");
            return;
        }
        const auto number = value->get<std::uint64_t>();
        if (number < min || number > max) {
            fail(key, "must be between " + std::to_string(min) + " and " + std::to_string(max));
            return;
        }
        out = static_cast<T>(number);
    }

    void number(const char* key, double& out, const double min, const double max) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_number()) {
            fail(key, "must be a number");
            return;
        }
        const auto number = value->get<double>();
        if (number < min || number > max) {
            std::ostringstream range;
            range << "must be between " << min << " and " << max;
            fail(key, range.str());
            return;
        }
        out = number;
    }

    void millis(const char* key, std::chrono::milliseconds& out, const std::uint64_t min) {
        std::uint64_t ms = static_cast<std::uint64_t>(out.count());
        count(key, ms, min, std::numeric_limits<std::uint32_t>::max());
        out = std::chrono::milliseconds(static_cast<std::int64_t>(ms));
    }

    void text(const char* key, std::string& out) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_string()) {
            fail(key, "must be a string");
            return;
        }
        out = value->get<std::string>();
    }

    void texts(const char* key, std::vector<std::string>& out) {
        const json* value = find(key);
        if (value == nullptr) {
            return;
        }
        if (!value->is_array()) {
            fail(key, "must be an array of strings");
            return;
        }
        std::vector<std::string> items;
        for (const auto& item : *value) {
            if (!item.is_string()) {
                fail(key, "must be an array of strings");
                return;
            }
            items.push_back(item.get<std::string>());
        }
        out = std::move(items);
    }

    // Nested object, e.g. scheduler.retry.
    Section child(const char* key) {
        if (object_ == nullptr || error_.has_value()) {
            return Section(name_ + "." + key);
        }
        Section nested(*object_, key);
        nested.name_ = name_ + "." + key;
        if (nested.error_.has_value()) {
            nested.error_ = config_error(nested.name_ + " must be an object.");
        }
        return nested;
    }

    void absorb(const Section& other) {
        if (!error_.has_value() && other.error_.has_value()) {
            error_ = other.error_;
        }
    }

    void fail(const std::string& key, const std::string& problem) {
        if (!error_.has_value()) {
            error_ = config_error(name_ + "." + key + " " + problem + ".");
        }
    }

    Status status() const {
        if (error_.has_value()) {
            return error_.value();
        }
        return core::errors::ok();
    }

private:
    explicit Section(std::string name) : name_(std::move(name)) {}

    const json* find(const char* key) const {
        if (object_ == nullptr || error_.has_value() || !object_->contains(key)) {
            return nullptr;
        }
        return &(*object_)[key];
    }

    std::string name_;
    const json* object_ = nullptr;
    std::optional<HiveError> error_;
};

Status read_scheduler(const json& document, HiveConfig& config) {
    Section section(document, "scheduler");
    section.count("max_concurrent_tasks", config.scheduler.max_concurrent_tasks, 1);
    section.millis("task_timeout_ms", config.scheduler.task_timeout, 1);

    auto& retry = config.scheduler.retry_policy;
    Section nested = section.child("retry");
    nested.count("max_attempts", retry.max_attempts, 1, 100);
    nested.millis("initial_backoff_ms", retry.initial_backoff, 0);
    nested.number("backoff_multiplier", retry.backoff_multiplier, 1.0, 10.0);
    nested.millis("max_backoff_ms", retry.max_backoff, 0);
    section.absorb(nested);

    // One retry policy for the scheduler and the coordinator.
    config.coordinator.retry_policy = retry;
    return section.status();
}

Status read_pool(const json& document, HiveConfig& config) {
    Section section(document, "pool");
    auto& pool = config.pool;
    section.count("max_agents", pool.max_agents, 1, 256);
    section.millis("idle_timeout_ms", pool.idle_timeout, 1);
    section.millis("request_timeout_ms", pool.request_timeout, 1);
    section.millis("min_request_interval_ms", pool.min_request_interval, 0);
    section.count("default_max_tokens", pool.default_max_tokens, 1);
    section.number("default_temperature", pool.default_temperature, 0.0, 2.0);
    return section.status();
}

Status read_quota(const json& document, HiveConfig& config) {
    Section section(document, "quota");
    auto& quota = config.quota;
    section.millis("window_duration_ms", quota.window_duration, 1);
    section.number("estimated_capacity", quota.estimated_capacity, 1.0,
                   std::numeric_limits<double>::max());
    section.number("warning_threshold", quota.limits.warning_threshold, 0.0, 1.0);
    section.number("critical_threshold", quota.limits.critical_threshold, 0.0, 1.0);
    section.number("hard_stop_threshold", quota.limits.hard_stop_threshold, 0.0, 1.0);
    section.texts("providers", quota.providers);
    section.count("max_history", quota.max_history, 0);
    section.millis("history_interval_ms", quota.history_interval, 1);

    if (core::errors::is_error(section.status())) {
        return section.status();
    }
    const auto& limits = quota.limits;
    if (!(limits.warning_threshold <= limits.critical_threshold &&
          limits.critical_threshold <= limits.hard_stop_threshold)) {
        return config_error(
            "quota thresholds must satisfy warning <= critical <= hard_stop.");
    }
    return core::errors::ok();
}

Status read_merge(const json& document, HiveConfig& config) {
    Section section(document, "merge");
    section.flag("enable_ai_merge", config.merge.enable_ai_merge);
    section.count("ai_max_tokens", config.merge.ai_max_tokens, 1);
    section.number("ai_temperature", config.merge.ai_temperature, 0.0, 2.0);
    return section.status();
}

Status read_coordinator(const json& document, HiveConfig& config) {
    Section section(document, "coordinator");
    auto& coordinator = config.coordinator;
    section.count("max_parallel_tasks", coordinator.max_parallel_tasks, 1, 64);
    section.millis("phase_transition_delay_ms", coordinator.phase_transition_delay, 0);
    section.flag("require_approval", coordinator.require_approval);
    section.count("max_context_bytes", coordinator.max_context_bytes, 1);
    section.millis("capacity_poll_interval_ms", coordinator.capacity_poll_interval, 1);
    section.millis("capacity_wait_timeout_ms", coordinator.capacity_wait_timeout, 0);
    return section.status();
}

Status read_verification(const json& document, HiveConfig& config) {
    Section section(document, "verification");
    std::string command;
    section.text("command", command);
    if (!command.empty()) {
        config.verification.command = command;
    }
    section.millis("timeout_ms", config.verification.timeout, 0);
    return section.status();
}

Status read_misc(const json& document, HiveConfig& config) {
    Section preflight(document, "preflight");
    preflight.texts("protected_paths", config.preflight.protected_paths);
    if (core::errors::is_error(preflight.status())) {
        return preflight.status();
    }

    Section rollback(document, "rollback");
    rollback.count("max_points_per_mission", config.rollback.max_points_per_mission, 1);
    if (core::errors::is_error(rollback.status())) {
        return rollback.status();
    }

    Section model(document, "model");
    model.millis("latency_ms", config.model.latency, 0);
    if (core::errors::is_error(model.status())) {
        return model.status();
    }

    Section logging(document, "logging");
    std::string level;
    logging.text("level", level);
    if (core::errors::is_error(logging.status())) {
        return logging.status();
    }
    if (!level.empty()) {
        auto parsed = core::logging::Logger::parse_level(level);
        if (!parsed.has_value()) {
            return config_error("logging.level must be one of debug, info, warn, error.");
        }
        config.logging.level = *parsed;
    }

    Section journal(document, "journal");
    journal.flag("enabled", config.journal.enabled);
    journal.text("directory", config.journal.directory);
    if (core::errors::is_error(journal.status())) {
        return journal.status();
    }
    if (config.journal.enabled && config.journal.directory.empty()) {
        return config_error("journal.directory cannot be empty.");
    }
    return core::errors::ok();
}

}  // namespace

core::errors::Result<HiveConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return config_error("Config document must be a JSON object.");
    }

    HiveConfig config;
    for (auto reader : {read_scheduler, read_pool, read_quota, read_merge, read_coordinator,
                        read_verification, read_misc}) {
        auto status = reader(document, config);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
    return config;
}

core::errors::Result<HiveConfig> parse_config_text(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return config_error(std::string("Config is not valid JSON: ") + e.what());
    }
    return parse_config(document);
}

core::errors::Result<HiveConfig> load_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return HiveError{ErrorKind::Input, "Config file does not exist: " + path.string(),
                         "config_not_found"};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return HiveError{ErrorKind::Input, "Unable to open config file: " + path.string(),
                         "config_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_config_text(buffer.str());
}

}  // namespace hive::app
