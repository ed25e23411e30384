#include <string>
#include <gtest/gtest.h>
#include "core/errors/hive_errors.hpp"
#include "mission/mission_manager.hpp"
#include "scheduler/task_scheduler.hpp"
#include "test_support.hpp"
#include "workspace/snapshot_rollback_store.hpp"

namespace {

using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::mission::MissionManager;
using hive::protocol::Mission;
using hive::protocol::MissionConfig;
using hive::protocol::MissionEvent;
using hive::protocol::MissionPhase;
using hive::protocol::MissionStatus;
using hive::protocol::TaskResult;
using hive::protocol::TaskSpec;
using hive::protocol::TaskStatus;
using hive::scheduler::TaskScheduler;
using hive::testing::InMemoryFileSystem;
using hive::testing::RecordingEventSink;
using hive::workspace::SnapshotRollbackStore;

class MissionManagerTest : public ::testing::Test {
protected:
    MissionManagerTest()
        : scheduler_(events_), rollback_(files_), missions_(scheduler_, rollback_, events_) {}

    Mission create_started(const std::string& title = "Refactor parser") {
        MissionConfig config;
        config.title = title;
        config.scope = {"src/"};
        auto created = missions_.create(config);
        EXPECT_FALSE(is_error(created));
        const Mission mission = get_value(created);
        EXPECT_FALSE(is_error(missions_.start(mission.id)));
        return mission;
    }

    TaskSpec task_spec(const std::string& description) {
        TaskSpec spec;
        spec.type = "code";
        spec.description = description;
        return spec;
    }

    RecordingEventSink events_;
    InMemoryFileSystem files_;
    TaskScheduler scheduler_;
    SnapshotRollbackStore rollback_;
    MissionManager missions_;
};

TEST_F(MissionManagerTest, CreateStartsPendingInPlanning) {
    MissionConfig config;
    config.title = "Add logging";
    config.constraints = {"no new dependencies"};
    auto created = missions_.create(config);
    ASSERT_FALSE(is_error(created));

    const Mission mission = get_value(created);
    EXPECT_EQ(mission.id.rfind("mission-", 0), 0u);
    EXPECT_EQ(mission.status, MissionStatus::Pending);
    EXPECT_EQ(mission.phase, MissionPhase::Planning);
    EXPECT_EQ(mission.constraints.size(), 1u);
    EXPECT_EQ(events_.count("mission.created"), 1u);
}

TEST_F(MissionManagerTest, RejectsEmptyTitle) {
    auto created = missions_.create(MissionConfig{});
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).kind, ErrorKind::Input);
    EXPECT_EQ(get_error(created).code, "invalid_mission_config");
}

TEST_F(MissionManagerTest, StartPauseResumeFollowStatusRules) {
    const Mission mission = create_started();
    EXPECT_EQ(get_value(missions_.get_status(mission.id)), MissionStatus::Active);
    EXPECT_TRUE(missions_.get(mission.id)->started_at.has_value());

    auto again = missions_.start(mission.id);
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).kind, ErrorKind::InvalidState);

    ASSERT_FALSE(is_error(missions_.pause(mission.id)));
    EXPECT_EQ(get_value(missions_.get_status(mission.id)), MissionStatus::Paused);
    EXPECT_TRUE(is_error(missions_.pause(mission.id)));

    ASSERT_FALSE(is_error(missions_.resume(mission.id)));
    EXPECT_EQ(get_value(missions_.get_status(mission.id)), MissionStatus::Active);
    EXPECT_EQ(events_.count("mission.paused"), 1u);
    EXPECT_EQ(events_.count("mission.resumed"), 1u);
}

TEST_F(MissionManagerTest, UnknownMissionIsNotFound) {
    auto status = missions_.start("mission-missing");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::NotFound);
    EXPECT_FALSE(missions_.get("mission-missing").has_value());
}

TEST_F(MissionManagerTest, AdvancesThroughPhasesInOrder) {
    const Mission mission = create_started();

    const MissionPhase expected[] = {MissionPhase::Validation, MissionPhase::Execution,
                                     MissionPhase::Verification, MissionPhase::Completion};
    for (const MissionPhase phase : expected) {
        ASSERT_FALSE(is_error(missions_.advance_phase(mission.id)));
        EXPECT_EQ(missions_.get(mission.id)->phase, phase);
    }

    auto beyond = missions_.advance_phase(mission.id);
    ASSERT_TRUE(is_error(beyond));
    EXPECT_EQ(get_error(beyond).kind, ErrorKind::InvalidTransition);

    auto progress = get_value(missions_.get_progress(mission.id));
    EXPECT_DOUBLE_EQ(progress.percent_complete, 100.0);

    const auto changes = events_.of<MissionEvent>();
    std::size_t phase_changes = 0;
    for (const auto& event : changes) {
        if (event.kind == hive::protocol::MissionEventKind::PhaseChanged) {
            ++phase_changes;
        }
    }
    EXPECT_EQ(phase_changes, 4u);
}

TEST_F(MissionManagerTest, RejectsPhaseEdgeOutsideGraph) {
    const Mission mission = create_started();

    auto skip = missions_.advance_phase(mission.id, MissionPhase::Execution);
    ASSERT_TRUE(is_error(skip));
    EXPECT_EQ(get_error(skip).kind, ErrorKind::InvalidTransition);
    EXPECT_EQ(missions_.get(mission.id)->phase, MissionPhase::Planning);

    // Planning may jump straight to completion.
    EXPECT_FALSE(is_error(missions_.advance_phase(mission.id, MissionPhase::Completion)));
}

TEST_F(MissionManagerTest, VerificationCanReturnToExecution) {
    const Mission mission = create_started();
    ASSERT_FALSE(is_error(missions_.advance_phase(mission.id)));
    ASSERT_FALSE(is_error(missions_.advance_phase(mission.id)));
    ASSERT_FALSE(is_error(missions_.advance_phase(mission.id)));
    EXPECT_FALSE(is_error(missions_.advance_phase(mission.id, MissionPhase::Execution)));
    EXPECT_EQ(missions_.get(mission.id)->phase, MissionPhase::Execution);
}

TEST_F(MissionManagerTest, PhaseGraphIsQueryable) {
    EXPECT_TRUE(MissionManager::is_valid_transition(MissionPhase::Execution,
                                                    MissionPhase::Planning));
    EXPECT_FALSE(MissionManager::is_valid_transition(MissionPhase::Validation,
                                                     MissionPhase::Verification));
    EXPECT_TRUE(MissionManager::allowed_transitions(MissionPhase::Completion).empty());
}

TEST_F(MissionManagerTest, CompleteRequiresActiveMission) {
    MissionConfig config;
    config.title = "Not started";
    const Mission pending = get_value(missions_.create(config));

    auto early = missions_.complete(pending.id);
    ASSERT_TRUE(is_error(early));
    EXPECT_EQ(get_error(early).kind, ErrorKind::InvalidState);

    const Mission mission = create_started();
    ASSERT_FALSE(is_error(missions_.complete(mission.id)));
    const Mission done = *missions_.get(mission.id);
    EXPECT_EQ(done.status, MissionStatus::Completed);
    EXPECT_EQ(done.phase, MissionPhase::Completion);
    EXPECT_TRUE(done.completed_at.has_value());
}

TEST_F(MissionManagerTest, FailRecordsReasonOnce) {
    const Mission mission = create_started();
    ASSERT_FALSE(is_error(missions_.fail(mission.id, "tests broke")));
    EXPECT_EQ(missions_.get(mission.id)->failure_reason.value_or(""), "tests broke");

    auto again = missions_.fail(mission.id, "still broken");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).kind, ErrorKind::InvalidState);
}

TEST_F(MissionManagerTest, CancelStopsOpenTasksAndRejectsSecondCancel) {
    const Mission mission = create_started();
    const auto first = get_value(missions_.add_task(mission.id, task_spec("one")));
    const auto second = get_value(missions_.add_task(mission.id, task_spec("two")));
    ASSERT_FALSE(is_error(scheduler_.start(first.id)));

    ASSERT_FALSE(is_error(missions_.cancel(mission.id, "user abort")));
    EXPECT_EQ(scheduler_.get(first.id)->status, TaskStatus::Cancelled);
    EXPECT_EQ(scheduler_.get(second.id)->status, TaskStatus::Cancelled);
    EXPECT_EQ(missions_.get(mission.id)->cancel_reason.value_or(""), "user abort");

    auto again = missions_.cancel(mission.id, "again");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).kind, ErrorKind::InvalidState);

    auto late = missions_.add_task(mission.id, task_spec("three"));
    ASSERT_TRUE(is_error(late));
    EXPECT_EQ(get_error(late).kind, ErrorKind::InvalidState);
}

TEST_F(MissionManagerTest, FailCancelsOpenTasksButKeepsFinishedOnes) {
    const Mission mission = create_started();
    const auto done = get_value(missions_.add_task(mission.id, task_spec("done")));
    const auto waiting = get_value(missions_.add_task(mission.id, task_spec("waiting")));
    ASSERT_FALSE(is_error(scheduler_.start(done.id)));
    TaskResult result;
    result.success = true;
    ASSERT_FALSE(is_error(scheduler_.complete(done.id, result)));
    ASSERT_TRUE(scheduler_.get_next().has_value());

    ASSERT_FALSE(is_error(missions_.fail(mission.id, "merge failed")));
    EXPECT_EQ(scheduler_.get(done.id)->status, TaskStatus::Completed);
    EXPECT_EQ(scheduler_.get(waiting.id)->status, TaskStatus::Cancelled);
    EXPECT_FALSE(scheduler_.get_next().has_value());
    EXPECT_EQ(scheduler_.stats().pending, 0u);
}

TEST_F(MissionManagerTest, RollbackWithoutHistoryFails) {
    const Mission mission = create_started();
    auto status = missions_.rollback(mission.id);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).kind, ErrorKind::NoRollbackPoint);
}

TEST_F(MissionManagerTest, RollbackRestoresNewestPointAndResetsPhase) {
    const Mission mission = create_started();
    files_.put("src/a.ts", "v1");
    ASSERT_FALSE(is_error(rollback_.backup({"src/a.ts"}, mission.id)));
    files_.put("src/a.ts", "v2");
    ASSERT_FALSE(is_error(rollback_.backup({"src/a.ts", "src/new.ts"}, mission.id)));
    files_.put("src/a.ts", "v3");
    files_.put("src/new.ts", "created later");

    ASSERT_FALSE(is_error(missions_.advance_phase(mission.id)));
    ASSERT_FALSE(is_error(missions_.advance_phase(mission.id)));

    ASSERT_FALSE(is_error(missions_.rollback(mission.id)));
    EXPECT_EQ(files_.get("src/a.ts").value_or(""), "v2");
    EXPECT_FALSE(files_.get("src/new.ts").has_value());
    EXPECT_EQ(missions_.get(mission.id)->phase, MissionPhase::Planning);
    EXPECT_EQ(events_.count("mission.rolled_back"), 1u);
}

TEST_F(MissionManagerTest, TaskCompletionDrivesPhaseProgress) {
    const Mission mission = create_started();
    const auto first = get_value(missions_.add_task(mission.id, task_spec("one")));
    get_value(missions_.add_task(mission.id, task_spec("two")));

    ASSERT_FALSE(is_error(missions_.task_completed(mission.id, first.id)));
    auto progress = get_value(missions_.get_progress(mission.id));
    EXPECT_EQ(progress.tasks_total, 2u);
    EXPECT_EQ(progress.tasks_completed, 1u);
    EXPECT_DOUBLE_EQ(progress.phase_progress, 50.0);
    EXPECT_TRUE(progress.estimated_completion.has_value());

    ASSERT_FALSE(is_error(missions_.update_progress(mission.id, 250.0)));
    EXPECT_DOUBLE_EQ(get_value(missions_.get_progress(mission.id)).phase_progress, 100.0);
}

TEST_F(MissionManagerTest, StatsQueriesAndClearCompleted) {
    const Mission done = create_started("done");
    const Mission running = create_started("running");
    MissionConfig config;
    config.title = "waiting";
    get_value(missions_.create(config));
    ASSERT_FALSE(is_error(missions_.complete(done.id)));

    const auto stats = missions_.stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.active, 1u);
    EXPECT_EQ(stats.pending, 1u);
    ASSERT_EQ(missions_.active().size(), 1u);
    EXPECT_EQ(missions_.active().front().id, running.id);
    EXPECT_EQ(missions_.all().front().id, done.id);

    EXPECT_EQ(missions_.clear_completed(), 1u);
    EXPECT_EQ(missions_.all().size(), 2u);
    EXPECT_FALSE(missions_.get(done.id).has_value());
}

TEST_F(MissionManagerTest, ExportIncludesProgressAndTasks) {
    const Mission mission = create_started();
    const auto task = get_value(missions_.add_task(mission.id, task_spec("write docs")));

    auto exported = missions_.export_mission(mission.id);
    ASSERT_FALSE(is_error(exported));
    const auto& document = get_value(exported);
    EXPECT_EQ(document["mission"]["status"], "active");
    EXPECT_EQ(document["mission"]["phase"], "planning");
    EXPECT_EQ(document["progress"]["tasks_total"], 1);
    ASSERT_EQ(document["tasks"].size(), 1u);
    EXPECT_EQ(document["tasks"][0]["id"], task.id);
    EXPECT_EQ(document["tasks"][0]["status"], "pending");

    EXPECT_TRUE(is_error(missions_.export_mission("mission-missing")));
}

}  // namespace
