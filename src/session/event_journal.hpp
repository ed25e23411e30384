#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "core/errors/hive_errors.hpp"
#include "protocol/event_contract.hpp"

namespace hive::session {

// EventSink that appends one JSON object per event to
// <workspace>/<subdir>/<run-id>.jsonl. Write failures never reach the
// publisher; the first one is kept for the caller to inspect.
class EventJournal final : public protocol::EventSink {
public:
    EventJournal(std::filesystem::path workspace_root, std::string run_id,
                 std::filesystem::path journal_subdir = ".hive_runs",
                 core::config::Clock clock = core::config::system_clock());

    void publish(const protocol::HiveEvent& event) override;

    // Arbitrary record, e.g. the plan at start-up.
    core::errors::Result<std::filesystem::path> write_record(const std::string& event_name,
                                                             const nlohmann::json& payload);

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& status, const std::string& summary,
        const std::optional<std::string>& error_message = std::nullopt);

    core::errors::Result<std::filesystem::path> journal_path() const;

    std::optional<core::errors::HiveError> first_error() const;
    std::size_t records_written() const;
    const std::string& run_id() const { return run_id_; }

private:
    core::errors::Result<std::filesystem::path> append(const nlohmann::json& record);

    std::filesystem::path workspace_root_;
    std::string run_id_;
    std::filesystem::path journal_subdir_;
    core::config::Clock clock_;

    mutable std::mutex mutex_;
    std::optional<core::errors::HiveError> first_error_;
    std::size_t records_written_ = 0;
};

// Payload object of one event (without the envelope).
nlohmann::json event_to_json(const protocol::HiveEvent& event);

}  // namespace hive::session
