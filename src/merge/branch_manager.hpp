#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/config/ids.hpp"
#include "core/errors/hive_errors.hpp"
#include "protocol/change_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/workspace_contract.hpp"

namespace hive::merge {

enum class BranchStatus {
    Active,
    Merged,
    Abandoned
};

// Isolated change set of one task. Changes are kept one per path in
// recording order.
struct VirtualBranch {
    std::string id;
    std::string agent_id;
    std::string task_id;
    std::string base_snapshot;
    std::vector<protocol::FileChange> changes;
    BranchStatus status = BranchStatus::Active;
    core::config::SystemTime created_at{};
};

struct BranchStats {
    std::size_t active_branches = 0;
    std::size_t merged_branches = 0;
    std::size_t abandoned_branches = 0;
    std::size_t total_changes = 0;   // Across active branches
    std::size_t modified_files = 0;  // Distinct paths across active branches
};

class BranchManager {
public:
    BranchManager(protocol::FileSystem& files, protocol::EventSink& events,
                  core::config::Clock clock = core::config::system_clock());

    BranchManager(const BranchManager&) = delete;
    BranchManager& operator=(const BranchManager&) = delete;

    core::errors::Result<VirtualBranch> create_branch(const std::string& agent_id,
                                                      const std::string& task_id);

    // Re-recording a path replaces the earlier change. A change without an
    // original snapshot gets the workspace content at first sight.
    core::errors::Status record_change(const std::string& branch_id,
                                       protocol::FileChange change);
    core::errors::Status record_changes(const std::string& branch_id,
                                        const std::vector<protocol::FileChange>& changes);

    core::errors::Status assign_agent(const std::string& branch_id, const std::string& agent_id);

    // Removes the change for `path`; false when the branch has none.
    core::errors::Result<bool> drop_change(const std::string& branch_id, const std::string& path);

    core::errors::Status abandon_branch(const std::string& branch_id, const std::string& reason);

    // Applies every change of the branch or none of them.
    core::errors::Status merge_branch(const std::string& branch_id);

    // Forgets a closed branch.
    core::errors::Status delete_branch(const std::string& branch_id);

    std::optional<VirtualBranch> get_branch(const std::string& branch_id) const;
    std::optional<VirtualBranch> branch_for_agent(const std::string& agent_id) const;
    std::optional<VirtualBranch> branch_for_task(const std::string& task_id) const;
    std::vector<VirtualBranch> active_branches() const;
    std::vector<VirtualBranch> branches_modifying(const std::string& path) const;

    std::vector<std::string> modified_files(const std::string& branch_id) const;
    std::vector<std::string> conflicting_files(const std::string& branch_a,
                                               const std::string& branch_b) const;

    // Content of `path` the first time it was seen; nullopt for a missing file.
    // The snapshot is shared by every active branch touching the path and is
    // released once the last of them is merged or abandoned.
    core::errors::Result<std::optional<std::string>> snapshot_file(const std::string& path);
    std::optional<std::string> original_content(const std::string& path) const;

    BranchStats stats() const;

private:
    struct AppliedWrite {
        std::string path;
        std::optional<std::string> previous;
    };

    core::errors::Status apply_change(const protocol::FileChange& change,
                                      std::vector<AppliedWrite>& applied);
    void restore(const std::vector<AppliedWrite>& applied);
    // Caller holds mutex_; `branch` is no longer active.
    void release_snapshots_locked(const VirtualBranch& branch);

    protocol::FileSystem& files_;
    protocol::EventSink& events_;
    core::config::Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, VirtualBranch> branches_;
    std::vector<std::string> order_;  // Creation order of branch ids
    std::unordered_map<std::string, std::string> branch_by_agent_;
    std::unordered_map<std::string, std::string> branch_by_task_;
    std::unordered_map<std::string, std::optional<std::string>> snapshots_;

    // Serializes merges against the workspace.
    std::mutex merge_mutex_;
};

std::string to_string(BranchStatus status);

}  // namespace hive::merge
