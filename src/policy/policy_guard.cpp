#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace hive::policy {

using core::errors::ErrorKind;
using core::errors::HiveError;

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Component-wise prefix test; "a/b" is under "a" but "ab" is not.
bool starts_with_path(const std::filesystem::path& child, const std::filesystem::path& root) {
    auto r = root.begin();
    auto c = child.begin();
    while (r != root.end() && c != child.end() && *r == *c) {
        ++r;
        ++c;
    }
    return r == root.end();
}

HiveError escape_error(const std::string& shown) {
    return HiveError{ErrorKind::Policy, "Path escapes workspace root: " + shown,
                     "path_outside_workspace",
                     "Plan paths are relative to the workspace and may not leave it."};
}

core::errors::Result<std::filesystem::path> canonical_root(const std::filesystem::path& root) {
    std::error_code ec;
    const bool is_dir = std::filesystem::is_directory(root, ec);
    if (ec || !is_dir) {
        return HiveError{ErrorKind::Input, "Workspace root is not a directory: " + root.string(),
                         "invalid_workspace_root"};
    }
    auto resolved = std::filesystem::weakly_canonical(root, ec);
    if (ec) {
        return HiveError{ErrorKind::Input, "Unable to resolve workspace root: " + root.string(),
                         "invalid_workspace_root"};
    }
    return resolved;
}

}  // namespace

PolicyGuard::PolicyGuard(WorkspacePolicy policy) : policy_(std::move(policy)) {
    for (const auto& blocked : policy_.blocked_commands) {
        if (!blocked.empty()) {
            blocked_lowered_.push_back(to_lower(blocked));
        }
    }
    for (const auto& entry : policy_.protected_paths) {
        std::filesystem::path root = std::filesystem::path(entry).lexically_normal();
        if (!root.empty() && root.filename().empty()) {
            root = root.parent_path();  // "dir/" -> "dir"
        }
        if (!root.empty()) {
            protected_roots_.push_back(root);
        }
    }
}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    auto root = canonical_root(workspace_root);
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    const std::filesystem::path& base = core::errors::get_value(root);

    std::error_code ec;
    const auto resolved = std::filesystem::weakly_canonical(
        target_path.is_relative() ? base / target_path : target_path, ec);
    if (ec) {
        return HiveError{ErrorKind::Input, "Unable to resolve target path: " + target_path.string(),
                         "invalid_path"};
    }
    if (!starts_with_path(resolved, base)) {
        return escape_error(resolved.string());
    }
    return resolved;
}

core::errors::Status PolicyGuard::validate_relative_path(const std::string& path) const {
    if (path.empty()) {
        return HiveError{ErrorKind::Input, "File path cannot be empty.", "invalid_path"};
    }
    const std::filesystem::path candidate(path);
    if (candidate.is_absolute()) {
        return HiveError{ErrorKind::Policy, "Absolute paths are not allowed: " + path,
                         "path_outside_workspace"};
    }

    int depth = 0;
    for (const auto& part : candidate.lexically_normal()) {
        if (part == "..") {
            --depth;
        } else if (part != "." && !part.empty()) {
            ++depth;
        }
        if (depth < 0) {
            return escape_error(path);
        }
    }
    return core::errors::ok();
}

core::errors::Status PolicyGuard::validate_change_path(const std::string& path) const {
    auto relative = validate_relative_path(path);
    if (core::errors::is_error(relative)) {
        return relative;
    }
    if (is_protected(path)) {
        return HiveError{ErrorKind::Policy, "Protected path: " + path, "protected_path"};
    }
    return core::errors::ok();
}

core::errors::Result<std::string> PolicyGuard::validate_command(const std::string& command) const {
    if (command.empty()) {
        return HiveError{ErrorKind::Input, "Command cannot be empty.", "empty_command"};
    }
    const std::string lowered = to_lower(command);
    for (std::size_t i = 0; i < blocked_lowered_.size(); ++i) {
        if (lowered.find(blocked_lowered_[i]) != std::string::npos) {
            return HiveError{ErrorKind::Policy,
                             "Command contains blocked operation: " + blocked_lowered_[i],
                             "blocked_command"};
        }
    }
    return command;
}

bool PolicyGuard::is_protected(const std::string& path) const {
    const std::filesystem::path normalized = std::filesystem::path(path).lexically_normal();
    return std::any_of(protected_roots_.begin(), protected_roots_.end(),
                       [&normalized](const std::filesystem::path& root) {
                           return starts_with_path(normalized, root);
                       });
}

}  // namespace hive::policy
