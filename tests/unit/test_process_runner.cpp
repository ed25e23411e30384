#include <chrono>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/hive_errors.hpp"
#include "test_support.hpp"
#include "workspace/process_runner.hpp"

namespace {

using hive::core::concurrency::CancelToken;
using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::testing::TempWorkspace;
using hive::workspace::ProcessOutcome;
using hive::workspace::ProcessRequest;
using hive::workspace::run_process;

TEST(ProcessRunnerTest, CapturesBothStreamsAndExitCode) {
    TempWorkspace workspace("process");
    ProcessRequest request;
    request.command = "echo out; echo err 1>&2; exit 3";
    request.working_directory = workspace.root();

    auto result = run_process(request, CancelToken{});
    ASSERT_FALSE(is_error(result));
    const ProcessOutcome& outcome = get_value(result);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stdout_text, "out\n");
    EXPECT_EQ(outcome.stderr_text, "err\n");
    EXPECT_FALSE(outcome.timed_out);
}

TEST(ProcessRunnerTest, RunsInWorkingDirectory) {
    TempWorkspace workspace("process");
    workspace.write("marker.txt", "present");
    ProcessRequest request;
    request.command = "cat marker.txt";
    request.working_directory = workspace.root();

    auto result = run_process(request, CancelToken{});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).stdout_text, "present");
    EXPECT_EQ(get_value(result).exit_code, 0);
}

TEST(ProcessRunnerTest, KillsCommandOnTimeout) {
    ProcessRequest request;
    request.command = "sleep 5; echo late";
    request.timeout = std::chrono::milliseconds(100);

    const auto started = std::chrono::steady_clock::now();
    auto result = run_process(request, CancelToken{});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).timed_out);
    EXPECT_NE(get_value(result).exit_code, 0);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(ProcessRunnerTest, StopsWhenCancelled) {
    CancelToken cancel;
    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(80));
        cancel.cancel();
    });

    ProcessRequest request;
    request.command = "sleep 5";
    auto result = run_process(request, cancel);
    canceller.join();

    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).cancelled);
}

TEST(ProcessRunnerTest, KeepsOnlyTailOfLargeOutput) {
    ProcessRequest request;
    request.command = "i=0; while [ $i -lt 200 ]; do echo line$i; i=$((i+1)); done";
    request.max_output_bytes = 64;

    auto result = run_process(request, CancelToken{});
    ASSERT_FALSE(is_error(result));
    const std::string& text = get_value(result).stdout_text;
    EXPECT_LE(text.size(), 64u);
    EXPECT_NE(text.find("line199"), std::string::npos);
}

TEST(ProcessRunnerTest, EmptyCommandIsInputError) {
    auto result = run_process(ProcessRequest{}, CancelToken{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).kind, ErrorKind::Input);
}

}  // namespace
