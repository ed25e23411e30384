#include "merge/branch_manager.hpp"

#include <algorithm>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"
#include "merge/line_merge.hpp"

namespace hive::merge {

using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::BranchEvent;
using protocol::BranchEventKind;
using protocol::ChangeType;
using protocol::FileChange;

namespace {

HiveError branch_not_found(const std::string& branch_id) {
    return HiveError{ErrorKind::NotFound, "Branch not found: " + branch_id, "branch_not_found"};
}

HiveError branch_not_active(const VirtualBranch& branch) {
    return HiveError{ErrorKind::InvalidState,
                     "Branch " + branch.id + " is not active (status: " +
                         to_string(branch.status) + ")",
                     "branch_not_active"};
}

}  // namespace

std::string to_string(const BranchStatus status) {
    switch (status) {
        case BranchStatus::Active:
            return "active";
        case BranchStatus::Merged:
            return "merged";
        case BranchStatus::Abandoned:
            return "abandoned";
        default:
            return "unknown";
    }
}

BranchManager::BranchManager(protocol::FileSystem& files, protocol::EventSink& events,
                             core::config::Clock clock)
    : files_(files), events_(events), clock_(std::move(clock)) {}

core::errors::Result<VirtualBranch> BranchManager::create_branch(const std::string& agent_id,
                                                                 const std::string& task_id) {
    VirtualBranch snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string branch_id;
        constexpr int kMaxAttempts = 16;
        for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
            const std::string candidate = core::config::generate_id("branch");
            if (branches_.find(candidate) == branches_.end()) {
                branch_id = candidate;
                break;
            }
        }
        if (branch_id.empty()) {
            return HiveError{ErrorKind::Internal, "Unable to allocate unique branch ID.",
                             "branch_id_generation_failed"};
        }

        VirtualBranch branch;
        branch.id = branch_id;
        branch.agent_id = agent_id;
        branch.task_id = task_id;
        branch.created_at = clock_();
        branch.base_snapshot = "snap-" + std::to_string(core::config::to_unix_ms(branch.created_at));

        if (!agent_id.empty()) {
            branch_by_agent_[agent_id] = branch_id;
        }
        if (!task_id.empty()) {
            branch_by_task_[task_id] = branch_id;
        }
        order_.push_back(branch_id);
        branches_.emplace(branch_id, branch);
        snapshot = branch;
    }

    LOG_INFO("BranchManager: branch " + snapshot.id + " created for task " + snapshot.task_id);
    events_.publish(BranchEvent{BranchEventKind::Created, snapshot.id, snapshot.agent_id,
                                snapshot.task_id, ""});
    return snapshot;
}

core::errors::Status BranchManager::record_change(const std::string& branch_id,
                                                  FileChange change) {
    if (change.path.empty()) {
        return HiveError{ErrorKind::Input, "File change has an empty path.", "invalid_change"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = branches_.find(branch_id);
        if (it == branches_.end()) {
            return branch_not_found(branch_id);
        }
        if (it->second.status != BranchStatus::Active) {
            return branch_not_active(it->second);
        }
    }

    if (!change.original_content.has_value() && change.type != ChangeType::Create) {
        auto snapshot = snapshot_file(change.path);
        if (core::errors::is_error(snapshot)) {
            return core::errors::get_error(snapshot);
        }
        change.original_content = core::errors::get_value(snapshot);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) {
        return branch_not_found(branch_id);
    }
    VirtualBranch& branch = it->second;
    if (branch.status != BranchStatus::Active) {
        return branch_not_active(branch);
    }

    auto existing = std::find_if(branch.changes.begin(), branch.changes.end(),
                                 [&change](const FileChange& c) { return c.path == change.path; });
    if (existing != branch.changes.end()) {
        LOG_DEBUG("BranchManager: updated change for " + change.path + " in branch " + branch_id);
        *existing = std::move(change);
    } else {
        LOG_DEBUG("BranchManager: recorded change for " + change.path + " in branch " + branch_id);
        branch.changes.push_back(std::move(change));
    }
    return core::errors::ok();
}

core::errors::Status BranchManager::record_changes(const std::string& branch_id,
                                                   const std::vector<FileChange>& changes) {
    for (const auto& change : changes) {
        auto status = record_change(branch_id, change);
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    return core::errors::ok();
}

core::errors::Status BranchManager::assign_agent(const std::string& branch_id,
                                                 const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) {
        return branch_not_found(branch_id);
    }
    VirtualBranch& branch = it->second;
    if (branch.status != BranchStatus::Active) {
        return branch_not_active(branch);
    }
    auto previous = branch_by_agent_.find(branch.agent_id);
    if (previous != branch_by_agent_.end() && previous->second == branch_id) {
        branch_by_agent_.erase(previous);
    }
    branch.agent_id = agent_id;
    if (!agent_id.empty()) {
        branch_by_agent_[agent_id] = branch_id;
    }
    return core::errors::ok();
}

core::errors::Result<bool> BranchManager::drop_change(const std::string& branch_id,
                                                      const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) {
        return branch_not_found(branch_id);
    }
    VirtualBranch& branch = it->second;
    if (branch.status != BranchStatus::Active) {
        return branch_not_active(branch);
    }
    auto change = std::find_if(branch.changes.begin(), branch.changes.end(),
                               [&path](const FileChange& c) { return c.path == path; });
    if (change == branch.changes.end()) {
        return false;
    }
    branch.changes.erase(change);
    return true;
}

core::errors::Status BranchManager::abandon_branch(const std::string& branch_id,
                                                   const std::string& reason) {
    BranchEvent event{BranchEventKind::Abandoned, branch_id, "", "", reason};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = branches_.find(branch_id);
        if (it == branches_.end()) {
            return branch_not_found(branch_id);
        }
        VirtualBranch& branch = it->second;
        if (branch.status != BranchStatus::Active) {
            return branch_not_active(branch);
        }
        branch.status = BranchStatus::Abandoned;
        release_snapshots_locked(branch);
        event.agent_id = branch.agent_id;
        event.task_id = branch.task_id;
    }

    LOG_INFO("BranchManager: branch " + branch_id + " transition active -> abandoned");
    events_.publish(event);
    return core::errors::ok();
}

core::errors::Status BranchManager::apply_change(const FileChange& change,
                                                 std::vector<AppliedWrite>& applied) {
    auto exists = files_.exists(change.path);
    if (core::errors::is_error(exists)) {
        return core::errors::get_error(exists);
    }

    std::optional<std::string> current;
    if (core::errors::get_value(exists)) {
        auto content = files_.read_file(change.path);
        if (core::errors::is_error(content)) {
            return core::errors::get_error(content);
        }
        current = core::errors::get_value(content);
    }

    if (change.type == ChangeType::Delete) {
        if (!current.has_value()) {
            return core::errors::ok();
        }
        applied.push_back(AppliedWrite{change.path, current});
        return files_.remove_file(change.path);
    }

    std::string target = change.modified_content;
    if (current.has_value() && *current != change.modified_content) {
        if (change.original_content.has_value()) {
            if (*current != *change.original_content) {
                // Someone else changed the file since this branch saw it.
                auto merged =
                    three_way_merge(*change.original_content, change.modified_content, *current);
                if (!merged.clean) {
                    return HiveError{ErrorKind::MergeFailed,
                                     "Concurrent edits to " + change.path + " could not be merged.",
                                     "merge_conflict"};
                }
                target = merged.content;
            }
        } else if (change.type == ChangeType::Create) {
            return HiveError{ErrorKind::MergeFailed,
                             "Cannot create " + change.path + ": file already exists.",
                             "merge_conflict"};
        }
    }

    applied.push_back(AppliedWrite{change.path, current});
    return files_.write_file(change.path, target);
}

void BranchManager::restore(const std::vector<AppliedWrite>& applied) {
    for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
        const core::errors::Status status =
            it->previous.has_value() ? files_.write_file(it->path, *it->previous)
                                     : files_.remove_file(it->path);
        if (core::errors::is_error(status)) {
            LOG_ERROR("BranchManager: failed to restore " + it->path + ": " +
                      core::errors::get_error(status).message);
        }
    }
}

core::errors::Status BranchManager::merge_branch(const std::string& branch_id) {
    std::lock_guard<std::mutex> merge_lock(merge_mutex_);

    VirtualBranch branch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = branches_.find(branch_id);
        if (it == branches_.end()) {
            return branch_not_found(branch_id);
        }
        if (it->second.status != BranchStatus::Active) {
            return branch_not_active(it->second);
        }
        branch = it->second;
    }

    std::vector<AppliedWrite> applied;
    for (const auto& change : branch.changes) {
        auto status = apply_change(change, applied);
        if (core::errors::is_error(status)) {
            const HiveError& cause = core::errors::get_error(status);
            restore(applied);
            LOG_ERROR("BranchManager: failed to merge branch " + branch_id + ": " + cause.message);
            events_.publish(BranchEvent{BranchEventKind::MergeFailed, branch.id, branch.agent_id,
                                        branch.task_id, cause.message});
            return HiveError{ErrorKind::MergeFailed,
                             "Failed to apply " + change.path + ": " + cause.message,
                             "merge_failed", cause.code};
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = branches_.find(branch_id);
        if (it != branches_.end()) {
            it->second.status = BranchStatus::Merged;
            release_snapshots_locked(it->second);
        }
    }

    LOG_INFO("BranchManager: branch " + branch_id + " transition active -> merged (" +
             std::to_string(branch.changes.size()) + " changes)");
    events_.publish(BranchEvent{BranchEventKind::Merged, branch.id, branch.agent_id,
                                branch.task_id, ""});
    return core::errors::ok();
}

core::errors::Status BranchManager::delete_branch(const std::string& branch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) {
        return branch_not_found(branch_id);
    }
    if (it->second.status == BranchStatus::Active) {
        return HiveError{ErrorKind::InvalidState, "Active branch cannot be deleted: " + branch_id,
                         "branch_active"};
    }
    auto agent = branch_by_agent_.find(it->second.agent_id);
    if (agent != branch_by_agent_.end() && agent->second == branch_id) {
        branch_by_agent_.erase(agent);
    }
    auto task = branch_by_task_.find(it->second.task_id);
    if (task != branch_by_task_.end() && task->second == branch_id) {
        branch_by_task_.erase(task);
    }
    branches_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), branch_id), order_.end());
    return core::errors::ok();
}

std::optional<VirtualBranch> BranchManager::get_branch(const std::string& branch_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<VirtualBranch> BranchManager::branch_for_agent(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = branch_by_agent_.find(agent_id);
    if (index == branch_by_agent_.end()) {
        return std::nullopt;
    }
    auto it = branches_.find(index->second);
    if (it == branches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<VirtualBranch> BranchManager::branch_for_task(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto index = branch_by_task_.find(task_id);
    if (index == branch_by_task_.end()) {
        return std::nullopt;
    }
    auto it = branches_.find(index->second);
    if (it == branches_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<VirtualBranch> BranchManager::active_branches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<VirtualBranch> active;
    for (const auto& branch_id : order_) {
        const VirtualBranch& branch = branches_.at(branch_id);
        if (branch.status == BranchStatus::Active) {
            active.push_back(branch);
        }
    }
    return active;
}

std::vector<VirtualBranch> BranchManager::branches_modifying(const std::string& path) const {
    std::vector<VirtualBranch> matching;
    for (auto& branch : active_branches()) {
        const bool touches = std::any_of(branch.changes.begin(), branch.changes.end(),
                                         [&path](const FileChange& c) { return c.path == path; });
        if (touches) {
            matching.push_back(std::move(branch));
        }
    }
    return matching;
}

std::vector<std::string> BranchManager::modified_files(const std::string& branch_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> paths;
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) {
        return paths;
    }
    for (const auto& change : it->second.changes) {
        paths.push_back(change.path);
    }
    return paths;
}

std::vector<std::string> BranchManager::conflicting_files(const std::string& branch_a,
                                                          const std::string& branch_b) const {
    if (branch_a == branch_b) {
        return {};
    }
    const auto files_a = modified_files(branch_a);
    const std::set<std::string> lookup(files_a.begin(), files_a.end());
    std::vector<std::string> shared;
    for (const auto& path : modified_files(branch_b)) {
        if (lookup.count(path) > 0) {
            shared.push_back(path);
        }
    }
    return shared;
}

core::errors::Result<std::optional<std::string>> BranchManager::snapshot_file(
    const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = snapshots_.find(path);
        if (it != snapshots_.end()) {
            return it->second;
        }
    }

    auto exists = files_.exists(path);
    if (core::errors::is_error(exists)) {
        return core::errors::get_error(exists);
    }
    std::optional<std::string> content;
    if (core::errors::get_value(exists)) {
        auto read = files_.read_file(path);
        if (core::errors::is_error(read)) {
            return core::errors::get_error(read);
        }
        content = core::errors::get_value(read);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // First snapshot wins when two callers race.
    auto inserted = snapshots_.emplace(path, content);
    return inserted.first->second;
}

std::optional<std::string> BranchManager::original_content(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(path);
    if (it == snapshots_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void BranchManager::release_snapshots_locked(const VirtualBranch& branch) {
    for (const auto& change : branch.changes) {
        const bool still_used = std::any_of(
            branches_.begin(), branches_.end(), [&change](const auto& entry) {
                const VirtualBranch& other = entry.second;
                return other.status == BranchStatus::Active &&
                       std::any_of(other.changes.begin(), other.changes.end(),
                                   [&change](const FileChange& c) { return c.path == change.path; });
            });
        if (!still_used) {
            snapshots_.erase(change.path);
        }
    }
}

BranchStats BranchManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BranchStats stats;
    std::set<std::string> files;
    for (const auto& entry : branches_) {
        const VirtualBranch& branch = entry.second;
        switch (branch.status) {
            case BranchStatus::Active:
                ++stats.active_branches;
                stats.total_changes += branch.changes.size();
                for (const auto& change : branch.changes) {
                    files.insert(change.path);
                }
                break;
            case BranchStatus::Merged:
                ++stats.merged_branches;
                break;
            case BranchStatus::Abandoned:
                ++stats.abandoned_branches;
                break;
        }
    }
    stats.modified_files = files.size();
    return stats;
}

}  // namespace hive::merge
