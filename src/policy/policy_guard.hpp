#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/hive_errors.hpp"

namespace hive::policy {

struct WorkspacePolicy {
    // Matched case-insensitively anywhere in a shell command.
    std::vector<std::string> blocked_commands = {
        "sudo",
        "rm -rf",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};
    // Workspace-relative files or directories no change may touch.
    std::vector<std::string> protected_paths;
};

// Workspace confinement shared by the file system, the preflight checker and
// the command verifier.
class PolicyGuard {
public:
    explicit PolicyGuard(WorkspacePolicy policy = {});

    // Resolves `target_path` against the root; the result is canonical and
    // inside the root. Missing files are fine, a missing root is not.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    // Lexical check for plan paths: non-empty, relative, no ".." escape.
    core::errors::Status validate_relative_path(const std::string& path) const;

    // validate_relative_path plus the protected path list.
    core::errors::Status validate_change_path(const std::string& path) const;

    core::errors::Result<std::string> validate_command(const std::string& command) const;

    // True when `path` equals a protected entry or lies under one.
    bool is_protected(const std::string& path) const;

    const WorkspacePolicy& policy() const { return policy_; }

private:
    WorkspacePolicy policy_;
    std::vector<std::string> blocked_lowered_;
    std::vector<std::filesystem::path> protected_roots_;
};

}  // namespace hive::policy
