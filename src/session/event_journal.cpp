#include "session/event_journal.hpp"

#include <fstream>
#include <type_traits>
#include <utility>

namespace hive::session {

using core::errors::ErrorKind;
using core::errors::HiveError;
using nlohmann::json;

nlohmann::json event_to_json(const protocol::HiveEvent& event) {
    return std::visit(
        [](const auto& e) -> json {
            using T = std::decay_t<decltype(e)>;
            json payload;
            if constexpr (std::is_same_v<T, protocol::TaskEvent>) {
                payload["task_id"] = e.task_id;
                payload["mission_id"] = e.mission_id;
                payload["detail"] = e.detail;
            } else if constexpr (std::is_same_v<T, protocol::MissionEvent>) {
                payload["mission_id"] = e.mission_id;
                if (e.from_phase.has_value()) {
                    payload["from_phase"] = protocol::to_string(*e.from_phase);
                }
                if (e.to_phase.has_value()) {
                    payload["to_phase"] = protocol::to_string(*e.to_phase);
                }
                payload["detail"] = e.detail;
            } else if constexpr (std::is_same_v<T, protocol::AgentEvent>) {
                payload["agent_id"] = e.agent_id;
                payload["request_id"] = e.request_id;
                payload["detail"] = e.detail;
            } else if constexpr (std::is_same_v<T, protocol::QuotaEvent>) {
                payload["provider"] = e.provider;
                payload["usage_ratio"] = e.usage_ratio;
                payload["reset_in_ms"] = e.reset_in.count();
            } else if constexpr (std::is_same_v<T, protocol::BranchEvent>) {
                payload["branch_id"] = e.branch_id;
                payload["agent_id"] = e.agent_id;
                payload["task_id"] = e.task_id;
                payload["detail"] = e.detail;
            } else if constexpr (std::is_same_v<T, protocol::ConflictEvent>) {
                payload["conflict_id"] = e.conflict_id;
                payload["file_path"] = e.file_path;
                payload["branch_a"] = e.branch_a;
                payload["branch_b"] = e.branch_b;
                payload["detail"] = e.detail;
            } else {
                payload["execution_id"] = e.execution_id;
                payload["mission_id"] = e.mission_id;
                payload["stage"] = e.stage;
                payload["detail"] = e.detail;
                payload["items"] = e.items;
            }
            return payload;
        },
        event);
}

EventJournal::EventJournal(std::filesystem::path workspace_root, std::string run_id,
                           std::filesystem::path journal_subdir, core::config::Clock clock)
    : workspace_root_(std::move(workspace_root)),
      run_id_(std::move(run_id)),
      journal_subdir_(std::move(journal_subdir)),
      clock_(std::move(clock)) {}

core::errors::Result<std::filesystem::path> EventJournal::journal_path() const {
    if (run_id_.empty()) {
        return HiveError{ErrorKind::Input, "Run ID cannot be empty.", "invalid_run_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return HiveError{ErrorKind::Input,
                         "Workspace root is not a directory: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return HiveError{ErrorKind::Input,
                         "Unable to resolve workspace root: " + workspace_root_.string(),
                         "invalid_workspace_root"};
    }

    const auto journal_dir = canonical_root / journal_subdir_;
    std::filesystem::create_directories(journal_dir, ec);
    if (ec) {
        return HiveError{ErrorKind::Internal,
                         "Unable to create journal directory: " + journal_dir.string(),
                         "journal_dir_create_failed"};
    }
    return journal_dir / (run_id_ + ".jsonl");
}

core::errors::Result<std::filesystem::path> EventJournal::append(const json& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto path_result = journal_path();
    if (core::errors::is_error(path_result)) {
        if (!first_error_.has_value()) {
            first_error_ = core::errors::get_error(path_result);
        }
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        HiveError error{ErrorKind::Internal, "Unable to open journal file: " + path.string(),
                        "journal_open_failed"};
        if (!first_error_.has_value()) {
            first_error_ = error;
        }
        return error;
    }

    // Model output may carry invalid UTF-8; replace rather than throw.
    out << record.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    if (!out.good()) {
        HiveError error{ErrorKind::Internal, "Unable to write journal record: " + path.string(),
                        "journal_write_failed"};
        if (!first_error_.has_value()) {
            first_error_ = error;
        }
        return error;
    }

    ++records_written_;
    return path;
}

void EventJournal::publish(const protocol::HiveEvent& event) {
    json record;
    record["ts_unix_ms"] = core::config::to_unix_ms(clock_());
    record["event"] = protocol::event_name(event);
    record["run_id"] = run_id_;
    record["payload"] = event_to_json(event);
    // Failures are kept in first_error_.
    static_cast<void>(append(record));
}

core::errors::Result<std::filesystem::path> EventJournal::write_record(
    const std::string& event_name, const json& payload) {
    json record;
    record["ts_unix_ms"] = core::config::to_unix_ms(clock_());
    record["event"] = event_name;
    record["run_id"] = run_id_;
    record["payload"] = payload;
    return append(record);
}

core::errors::Result<std::filesystem::path> EventJournal::write_final(
    const std::string& status, const std::string& summary,
    const std::optional<std::string>& error_message) {
    json payload;
    payload["status"] = status;
    payload["summary"] = summary;
    payload["error_message"] = error_message.has_value() ? error_message.value() : "";
    return write_record("final", payload);
}

std::optional<HiveError> EventJournal::first_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return first_error_;
}

std::size_t EventJournal::records_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_written_;
}

}  // namespace hive::session
