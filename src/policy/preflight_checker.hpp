#pragma once

#include <string>
#include <vector>
#include "policy/policy_guard.hpp"
#include "protocol/capability_contract.hpp"
#include "protocol/workspace_contract.hpp"

namespace hive::policy {

// Static checks of a planned change set against the current workspace.
// Errors block the mission; warnings are only reported.
class WorkspacePreflightChecker final : public protocol::PreflightChecker {
public:
    WorkspacePreflightChecker(const protocol::FileSystem& files,
                              std::vector<std::string> protected_paths = {});

    core::errors::Result<protocol::PreflightReport> check(
        const std::string& mission_id, const std::vector<protocol::FileChange>& changes) override;

    core::errors::Result<protocol::ImpactAnalysis> analyze(
        const std::vector<protocol::FileChange>& changes) override;

private:
    const protocol::FileSystem& files_;
    PolicyGuard guard_;
};

// Unbalanced (), [] or {} outside string literals; empty when balanced.
std::vector<std::string> bracket_problems(const std::string& content);

}  // namespace hive::policy
