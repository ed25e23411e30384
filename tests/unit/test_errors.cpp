#include <string>
#include <gtest/gtest.h>
#include "core/errors/hive_errors.hpp"

using namespace hive::core::errors;

// A dummy lookup that fails for unknown ids
Result<std::string> simulate_lookup(bool should_fail) {
    if (should_fail) {
        return HiveError{ErrorKind::NotFound, "Task not found: task-1", "task_not_found"};
    }
    return std::string("task contents here");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_lookup(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "task contents here");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_lookup(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.kind, ErrorKind::NotFound);
    EXPECT_EQ(error.message, "Task not found: task-1");
    EXPECT_EQ(error.code, "task_not_found");
    EXPECT_TRUE(error.hint.empty());
}

TEST(ErrorModelTest, StatusDefaultsToSuccess) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
}

TEST(ErrorModelTest, UnspecifiedCodeFallsBackToUnknown) {
    Status status = HiveError{ErrorKind::Internal, "boom"};
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "unknown_error");
}

TEST(ErrorModelTest, KindsHaveStableNames) {
    EXPECT_EQ(to_string(ErrorKind::DependenciesUnmet), "dependencies_unmet");
    EXPECT_EQ(to_string(ErrorKind::QuotaExceeded), "quota_exceeded");
    EXPECT_EQ(to_string(ErrorKind::NoRollbackPoint), "no_rollback_point");
    EXPECT_EQ(to_string(ErrorKind::Cancelled), "cancelled");
}
