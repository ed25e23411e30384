#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/hive_errors.hpp"
#include "protocol/event_contract.hpp"
#include "session/event_journal.hpp"
#include "test_support.hpp"

namespace {

using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::protocol::MissionEvent;
using hive::protocol::MissionEventKind;
using hive::protocol::MissionPhase;
using hive::protocol::QuotaEvent;
using hive::protocol::QuotaEventKind;
using hive::protocol::TaskEvent;
using hive::protocol::TaskEventKind;
using hive::session::EventJournal;
using hive::session::event_to_json;
using hive::testing::TempWorkspace;
using nlohmann::json;

std::vector<json> read_records(const std::filesystem::path& file_path) {
    std::vector<json> records;
    std::ifstream in(file_path);
    std::string line;
    while (std::getline(in, line)) {
        records.push_back(json::parse(line));
    }
    return records;
}

hive::core::config::SystemTime fixed_time() {
    return hive::core::config::SystemTime(std::chrono::milliseconds(1700000000000));
}

TEST(EventJournalTest, AppendsOneRecordPerEvent) {
    TempWorkspace workspace("event_journal");
    EventJournal journal(workspace.root(), "run-abc", ".hive_runs", fixed_time);

    journal.publish(TaskEvent{TaskEventKind::Started, "task-1", "mission-1", ""});
    journal.publish(MissionEvent{MissionEventKind::PhaseChanged, "mission-1",
                                 MissionPhase::Planning, MissionPhase::Validation, ""});

    auto path = journal.journal_path();
    ASSERT_FALSE(is_error(path));
    EXPECT_EQ(get_value(path).filename(), "run-abc.jsonl");

    const auto records = read_records(get_value(path));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["event"], "task.started");
    EXPECT_EQ(records[0]["run_id"], "run-abc");
    EXPECT_EQ(records[0]["ts_unix_ms"], 1700000000000LL);
    EXPECT_EQ(records[0]["payload"]["task_id"], "task-1");
    EXPECT_EQ(records[1]["event"], "mission.phase_changed");
    EXPECT_EQ(records[1]["payload"]["to_phase"], "validation");
    EXPECT_EQ(journal.records_written(), 2u);
    EXPECT_FALSE(journal.first_error().has_value());
}

TEST(EventJournalTest, WritesPlanAndFinalRecords) {
    TempWorkspace workspace("event_journal");
    EventJournal journal(workspace.root(), "run-final");

    ASSERT_FALSE(is_error(journal.write_record("plan", json{{"title", "demo"}})));
    auto final_path = journal.write_final("failed", "2 of 3 tasks completed", "merge failed");
    ASSERT_FALSE(is_error(final_path));

    const auto records = read_records(get_value(final_path));
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]["payload"]["title"], "demo");
    EXPECT_EQ(records[1]["event"], "final");
    EXPECT_EQ(records[1]["payload"]["status"], "failed");
    EXPECT_EQ(records[1]["payload"]["error_message"], "merge failed");
}

TEST(EventJournalTest, KeepsFirstErrorWithoutThrowing) {
    TempWorkspace workspace("event_journal");
    EventJournal journal(workspace.root() / "missing", "run-x");

    journal.publish(QuotaEvent{QuotaEventKind::Warning, "claude", 0.8,
                               std::chrono::milliseconds(1000)});
    ASSERT_TRUE(journal.first_error().has_value());
    EXPECT_EQ(journal.first_error()->code, "invalid_workspace_root");
    EXPECT_EQ(journal.records_written(), 0u);
}

TEST(EventJournalTest, EmptyRunIdIsRejected) {
    TempWorkspace workspace("event_journal");
    EventJournal journal(workspace.root(), "");
    auto path = journal.journal_path();
    ASSERT_TRUE(is_error(path));
    EXPECT_EQ(get_error(path).code, "invalid_run_id");
}

TEST(EventJournalTest, QuotaPayloadCarriesRatioAndReset) {
    const json payload = event_to_json(
        QuotaEvent{QuotaEventKind::Exceeded, "claude", 0.96, std::chrono::milliseconds(5000)});
    EXPECT_EQ(payload["provider"], "claude");
    EXPECT_DOUBLE_EQ(payload["usage_ratio"].get<double>(), 0.96);
    EXPECT_EQ(payload["reset_in_ms"], 5000);
}

}  // namespace
