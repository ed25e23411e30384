#include <chrono>
#include <string>
#include <gtest/gtest.h>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/hive_errors.hpp"
#include "test_support.hpp"
#include "workspace/command_verifier.hpp"

namespace {

using hive::core::concurrency::CancelToken;
using hive::core::errors::ErrorKind;
using hive::core::errors::get_error;
using hive::core::errors::get_value;
using hive::core::errors::is_error;
using hive::protocol::VerificationRequest;
using hive::testing::TempWorkspace;
using hive::workspace::CommandVerifier;
using hive::workspace::PassThroughVerifier;

VerificationRequest request_for(const std::string& mission_id) {
    VerificationRequest request;
    request.mission_id = mission_id;
    request.file_paths = {"src/a.ts"};
    return request;
}

TEST(CommandVerifierTest, ZeroExitIsValid) {
    TempWorkspace workspace("verifier");
    workspace.write("src/a.ts", "export const a = 1;");
    CommandVerifier verifier(workspace.root(), "test -f src/a.ts");

    auto report = verifier.verify(request_for("m-1"), CancelToken{});
    ASSERT_FALSE(is_error(report));
    EXPECT_TRUE(get_value(report).valid);
    EXPECT_NE(get_value(report).summary.find("passed"), std::string::npos);
}

TEST(CommandVerifierTest, NonZeroExitIsInvalidWithDetails) {
    TempWorkspace workspace("verifier");
    CommandVerifier verifier(workspace.root(), "echo 'type error in a.ts' 1>&2; exit 2");

    auto report = verifier.verify(request_for("m-1"), CancelToken{});
    ASSERT_FALSE(is_error(report));
    EXPECT_FALSE(get_value(report).valid);
    EXPECT_NE(get_value(report).summary.find("exit code 2"), std::string::npos);
    ASSERT_EQ(get_value(report).details.size(), 1u);
    EXPECT_EQ(get_value(report).details[0], "type error in a.ts");
}

TEST(CommandVerifierTest, TimeoutIsInvalid) {
    TempWorkspace workspace("verifier");
    CommandVerifier verifier(workspace.root(), "sleep 5", std::chrono::milliseconds(100));

    auto report = verifier.verify(request_for("m-1"), CancelToken{});
    ASSERT_FALSE(is_error(report));
    EXPECT_FALSE(get_value(report).valid);
    EXPECT_NE(get_value(report).summary.find("timed out"), std::string::npos);
}

TEST(CommandVerifierTest, BlockedCommandIsPolicyError) {
    TempWorkspace workspace("verifier");
    CommandVerifier verifier(workspace.root(), "sudo make test");

    auto report = verifier.verify(request_for("m-1"), CancelToken{});
    ASSERT_TRUE(is_error(report));
    EXPECT_EQ(get_error(report).kind, ErrorKind::Policy);
}

TEST(CommandVerifierTest, CancelledTokenIsCancelledError) {
    TempWorkspace workspace("verifier");
    CommandVerifier verifier(workspace.root(), "true");
    CancelToken cancel;
    cancel.cancel();

    auto report = verifier.verify(request_for("m-1"), cancel);
    ASSERT_TRUE(is_error(report));
    EXPECT_EQ(get_error(report).kind, ErrorKind::Cancelled);
}

TEST(PassThroughVerifierTest, AcceptsEverything) {
    PassThroughVerifier verifier;
    auto report = verifier.verify(request_for("m-1"), CancelToken{});
    ASSERT_FALSE(is_error(report));
    EXPECT_TRUE(get_value(report).valid);
}

}  // namespace
