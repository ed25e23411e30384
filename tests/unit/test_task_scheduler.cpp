#include <chrono>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/errors/hive_errors.hpp"
#include "scheduler/task_scheduler.hpp"
#include "test_support.hpp"

namespace {

using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::protocol::DependencyType;
using hive::protocol::Task;
using hive::protocol::TaskPriority;
using hive::protocol::TaskResult;
using hive::protocol::TaskSpec;
using hive::protocol::TaskStatus;
using hive::scheduler::SchedulerConfig;
using hive::scheduler::TaskScheduler;
using hive::testing::RecordingEventSink;

TaskSpec spec(const std::string& description, TaskPriority priority = TaskPriority::Normal) {
    TaskSpec s;
    s.type = "code";
    s.description = description;
    s.priority = priority;
    return s;
}

Task create(TaskScheduler& scheduler, const TaskSpec& s, const std::string& mission = "m-1") {
    auto created = scheduler.create(mission, s);
    EXPECT_FALSE(is_error(created));
    return get_value(created);
}

TaskResult success(const std::string& output = "done") {
    TaskResult result;
    result.success = true;
    result.output = output;
    return result;
}

TEST(TaskSchedulerTest, CreatesPendingTaskAndPublishesEvent) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);

    Task task = create(scheduler, spec("write parser"));
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_EQ(task.mission_id, "m-1");
    EXPECT_EQ(task.id.rfind("task-", 0), 0u);
    EXPECT_EQ(events.count("task.created"), 1u);
}

TEST(TaskSchedulerTest, RejectsTaskWithoutMission) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);
    auto created = scheduler.create("", spec("orphan"));
    ASSERT_TRUE(is_error(created));
    EXPECT_EQ(get_error(created).code, "invalid_task_spec");
}

TEST(TaskSchedulerTest, NextTaskFollowsPriorityThenCreationOrder) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);

    Task first_normal = create(scheduler, spec("first", TaskPriority::Normal));
    create(scheduler, spec("second", TaskPriority::Normal));
    Task critical = create(scheduler, spec("urgent", TaskPriority::Critical));

    auto next = scheduler.get_next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, critical.id);

    ASSERT_FALSE(is_error(scheduler.start(critical.id)));
    next = scheduler.get_next();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, first_normal.id);
}

TEST(TaskSchedulerTest, RequiredDependencyBlocksUntilCompleted) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);

    Task base = create(scheduler, spec("base"));
    TaskSpec dependent_spec = spec("dependent");
    dependent_spec.dependencies.push_back({base.id, DependencyType::Required});
    Task dependent = create(scheduler, dependent_spec);

    auto refused = scheduler.start(dependent.id);
    ASSERT_TRUE(is_error(refused));
    EXPECT_EQ(get_error(refused).kind, ErrorKind::DependenciesUnmet);
    EXPECT_EQ(get_value(scheduler.get_status(dependent.id)), TaskStatus::Blocked);

    ASSERT_FALSE(is_error(scheduler.start(base.id)));
    ASSERT_FALSE(is_error(scheduler.complete(base.id, success())));

    EXPECT_EQ(get_value(scheduler.get_status(dependent.id)), TaskStatus::Pending);
    EXPECT_EQ(events.count("task.unblocked"), 1u);
    EXPECT_FALSE(is_error(scheduler.start(dependent.id)));
}

TEST(TaskSchedulerTest, FailedRequiredDependencyKeepsTaskBlocked) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);

    Task base = create(scheduler, spec("base"));
    TaskSpec dependent_spec = spec("dependent");
    dependent_spec.dependencies.push_back({base.id, DependencyType::Required});
    Task dependent = create(scheduler, dependent_spec);

    ASSERT_FALSE(is_error(scheduler.start(base.id)));
    TaskResult failure;
    failure.error = "compile error";
    ASSERT_FALSE(is_error(scheduler.complete(base.id, failure)));

    EXPECT_TRUE(is_error(scheduler.start(dependent.id)));
    EXPECT_TRUE(scheduler.ready_tasks("m-1").empty());
}

TEST(TaskSchedulerTest, SoftDependencyOnlyWaitsWhileTargetRuns) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);

    Task base = create(scheduler, spec("base"));
    TaskSpec soft_spec = spec("soft");
    soft_spec.dependencies.push_back({base.id, DependencyType::Soft});
    Task soft = create(scheduler, soft_spec);

    ASSERT_FALSE(is_error(scheduler.start(base.id)));
    EXPECT_TRUE(is_error(scheduler.start(soft.id)));

    TaskResult failure;
    failure.error = "gave up";
    ASSERT_FALSE(is_error(scheduler.complete(base.id, failure)));
    EXPECT_FALSE(is_error(scheduler.start(soft.id)));
}

TEST(TaskSchedulerTest, ConcurrencyCeilingRefusesExtraStarts) {
    RecordingEventSink events;
    SchedulerConfig config;
    config.max_concurrent_tasks = 1;
    TaskScheduler scheduler(events, config);

    Task a = create(scheduler, spec("a"));
    Task b = create(scheduler, spec("b"));
    ASSERT_FALSE(is_error(scheduler.start(a.id)));

    auto refused = scheduler.start(b.id);
    ASSERT_TRUE(is_error(refused));
    EXPECT_EQ(get_error(refused).kind, ErrorKind::CapacityExceeded);
    EXPECT_EQ(scheduler.running_count(), 1u);
}

TEST(TaskSchedulerTest, CompleteRequiresRunningTask) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);
    Task task = create(scheduler, spec("a"));

    auto result = scheduler.complete(task.id, success());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_task_state");

    auto missing = scheduler.complete("task-missing", success());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).kind, ErrorKind::NotFound);
}

TEST(TaskSchedulerTest, SecondCancelIsInvalidState) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);
    Task task = create(scheduler, spec("a"));
    ASSERT_FALSE(is_error(scheduler.start(task.id)));
    auto token = scheduler.cancel_token(task.id);
    ASSERT_TRUE(token.has_value());

    ASSERT_FALSE(is_error(scheduler.cancel(task.id, "user request")));
    EXPECT_TRUE(token->is_cancelled());
    auto stored = scheduler.get(task.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, TaskStatus::Cancelled);
    EXPECT_EQ(stored->cancel_reason.value_or(""), "user request");

    auto again = scheduler.cancel(task.id, "again");
    ASSERT_TRUE(is_error(again));
    EXPECT_EQ(get_error(again).kind, ErrorKind::InvalidState);
}

TEST(TaskSchedulerTest, RetryCreatesLinkedTaskUntilLimit) {
    RecordingEventSink events;
    SchedulerConfig config;
    config.retry_policy.max_attempts = 2;
    TaskScheduler scheduler(events, config);

    Task task = create(scheduler, spec("flaky", TaskPriority::High));
    ASSERT_FALSE(is_error(scheduler.start(task.id)));
    TaskResult failure;
    failure.error = "boom";
    ASSERT_FALSE(is_error(scheduler.complete(task.id, failure)));

    auto retried = scheduler.retry(task.id);
    ASSERT_FALSE(is_error(retried));
    const Task& copy = get_value(retried);
    EXPECT_NE(copy.id, task.id);
    EXPECT_EQ(copy.retry_attempt, 1u);
    EXPECT_EQ(copy.retried_from.value_or(""), task.id);
    EXPECT_EQ(copy.priority, TaskPriority::High);
    EXPECT_EQ(copy.status, TaskStatus::Pending);

    ASSERT_FALSE(is_error(scheduler.start(copy.id)));
    ASSERT_FALSE(is_error(scheduler.complete(copy.id, failure)));
    auto exhausted = scheduler.retry(copy.id);
    ASSERT_TRUE(is_error(exhausted));
    EXPECT_EQ(get_error(exhausted).code, "retry_limit_reached");
}

TEST(TaskSchedulerTest, RetryRejectsTasksThatDidNotFail) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);
    Task task = create(scheduler, spec("a"));
    auto result = scheduler.retry(task.id);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_task_state");
}

TEST(TaskSchedulerTest, RecordAttemptCountsOnlyRunningTasks) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);
    Task task = create(scheduler, spec("a"));

    EXPECT_TRUE(is_error(scheduler.record_attempt(task.id)));
    ASSERT_FALSE(is_error(scheduler.start(task.id)));
    EXPECT_EQ(get_value(scheduler.record_attempt(task.id)), 1u);
    EXPECT_EQ(get_value(scheduler.record_attempt(task.id)), 2u);
}

TEST(TaskSchedulerTest, TimeoutFailsTaskAndFiresToken) {
    RecordingEventSink events;
    SchedulerConfig config;
    config.task_timeout = std::chrono::milliseconds(20);
    TaskScheduler scheduler(events, config);

    Task task = create(scheduler, spec("slow"));
    ASSERT_FALSE(is_error(scheduler.start(task.id)));
    auto token = scheduler.cancel_token(task.id);
    ASSERT_TRUE(token.has_value());

    EXPECT_TRUE(token->wait_for(std::chrono::seconds(5)));
    EXPECT_EQ(get_value(scheduler.get_status(task.id)), TaskStatus::Failed);
    auto result = scheduler.get_result(task.id);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(events.count("task.timed_out"), 1u);
}

TEST(TaskSchedulerTest, StatsAndClearCompleted) {
    RecordingEventSink events;
    TaskScheduler scheduler(events);
    Task done = create(scheduler, spec("done"));
    create(scheduler, spec("waiting"));
    create(scheduler, spec("elsewhere"), "m-2");

    ASSERT_FALSE(is_error(scheduler.start(done.id)));
    ASSERT_FALSE(is_error(scheduler.complete(done.id, success())));

    auto stats = scheduler.stats();
    EXPECT_EQ(stats.total, 3u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.pending, 2u);

    EXPECT_EQ(scheduler.get_by_mission("m-1").size(), 2u);
    EXPECT_EQ(scheduler.clear_completed("m-1"), 1u);
    EXPECT_FALSE(scheduler.get(done.id).has_value());
    EXPECT_EQ(scheduler.stats().total, 2u);
}

}  // namespace
