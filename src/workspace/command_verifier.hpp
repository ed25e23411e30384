#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include "policy/policy_guard.hpp"
#include "protocol/capability_contract.hpp"

namespace hive::workspace {

// Runs a shell command (build, tests, linter) in the workspace; exit code 0
// means the mission's changes verify.
class CommandVerifier final : public protocol::Verifier {
public:
    CommandVerifier(std::filesystem::path root, std::string command,
                    std::chrono::milliseconds timeout = std::chrono::seconds(120),
                    policy::PolicyGuard guard = {});

    core::errors::Result<protocol::VerificationReport> verify(
        const protocol::VerificationRequest& request,
        const core::concurrency::CancelToken& cancel) override;

private:
    std::filesystem::path root_;
    std::string command_;
    std::chrono::milliseconds timeout_;
    policy::PolicyGuard guard_;
};

// Accepts everything. Used when no verification command is configured.
class PassThroughVerifier final : public protocol::Verifier {
public:
    core::errors::Result<protocol::VerificationReport> verify(
        const protocol::VerificationRequest& request,
        const core::concurrency::CancelToken& cancel) override;
};

}  // namespace hive::workspace
