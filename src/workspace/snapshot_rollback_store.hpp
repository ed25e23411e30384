#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/config/ids.hpp"
#include "protocol/capability_contract.hpp"
#include "protocol/workspace_contract.hpp"

namespace hive::workspace {

// In-memory RollbackStore. Each recovery point keeps the full content of
// its files (or their absence) as seen through the FileSystem at backup time.
class SnapshotRollbackStore final : public protocol::RollbackStore {
public:
    explicit SnapshotRollbackStore(protocol::FileSystem& files,
                                   std::size_t max_points_per_mission = 50,
                                   core::config::Clock clock = core::config::system_clock());

    core::errors::Result<protocol::RecoveryPoint> backup(
        const std::vector<std::string>& paths, const std::string& mission_id) override;

    core::errors::Result<std::vector<std::string>> rollback(const std::string& point_id) override;

    std::vector<protocol::RecoveryPoint> history(const std::string& mission_id) const override;

    // Restores one file from the newest point of the mission that holds it.
    core::errors::Status restore(const std::string& path, const std::string& mission_id);

private:
    struct StoredPoint {
        protocol::RecoveryPoint point;
        std::uint64_t sequence = 0;
        std::map<std::string, std::optional<std::string>> contents;
    };

    core::errors::Status restore_file(const std::string& path,
                                      const std::optional<std::string>& content);
    void enforce_limit_locked(const std::string& mission_id);

    protocol::FileSystem& files_;
    std::size_t max_points_per_mission_;
    core::config::Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, StoredPoint> points_;
    std::uint64_t next_sequence_ = 1;
};

}  // namespace hive::workspace
