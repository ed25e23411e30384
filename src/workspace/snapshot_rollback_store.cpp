#include "workspace/snapshot_rollback_store.hpp"

#include <algorithm>
#include <utility>
#include "core/logging/logger.hpp"

namespace hive::workspace {

using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::RecoveryPoint;

SnapshotRollbackStore::SnapshotRollbackStore(protocol::FileSystem& files,
                                             const std::size_t max_points_per_mission,
                                             core::config::Clock clock)
    : files_(files),
      max_points_per_mission_(max_points_per_mission == 0 ? 1 : max_points_per_mission),
      clock_(std::move(clock)) {}

core::errors::Result<RecoveryPoint> SnapshotRollbackStore::backup(
    const std::vector<std::string>& paths, const std::string& mission_id) {
    StoredPoint stored;
    for (const auto& path : paths) {
        if (stored.contents.count(path) > 0) {
            continue;
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
        stored.contents.emplace(path, std::move(content));
        stored.point.paths.push_back(path);
    }

    stored.point.mission_id = mission_id;
    stored.point.created_at = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    std::string point_id;
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string candidate = core::config::generate_id("rp");
        if (points_.find(candidate) == points_.end()) {
            point_id = candidate;
            break;
        }
    }
    if (point_id.empty()) {
        return HiveError{ErrorKind::Internal, "Unable to allocate unique recovery point ID.",
                         "recovery_point_id_generation_failed"};
    }
    stored.point.id = point_id;
    stored.sequence = next_sequence_++;
    RecoveryPoint snapshot = stored.point;
    points_.emplace(point_id, std::move(stored));
    enforce_limit_locked(mission_id);

    LOG_INFO("SnapshotRollbackStore: recovery point " + point_id + " created for mission " +
             mission_id + " (" + std::to_string(snapshot.paths.size()) + " files)");
    return snapshot;
}

void SnapshotRollbackStore::enforce_limit_locked(const std::string& mission_id) {
    std::vector<std::pair<std::uint64_t, std::string>> owned;
    for (const auto& entry : points_) {
        if (entry.second.point.mission_id == mission_id) {
            owned.emplace_back(entry.second.sequence, entry.first);
        }
    }
    if (owned.size() <= max_points_per_mission_) {
        return;
    }
    std::sort(owned.begin(), owned.end());
    const std::size_t excess = owned.size() - max_points_per_mission_;
    for (std::size_t i = 0; i < excess; ++i) {
        points_.erase(owned[i].second);
    }
    LOG_DEBUG("SnapshotRollbackStore: pruned " + std::to_string(excess) +
              " recovery points of mission " + mission_id);
}

core::errors::Status SnapshotRollbackStore::restore_file(
    const std::string& path, const std::optional<std::string>& content) {
    if (content.has_value()) {
        return files_.write_file(path, *content);
    }
    // The file did not exist at backup time.
    auto exists = files_.exists(path);
    if (core::errors::is_error(exists)) {
        return core::errors::get_error(exists);
    }
    if (!core::errors::get_value(exists)) {
        return core::errors::ok();
    }
    return files_.remove_file(path);
}

core::errors::Result<std::vector<std::string>> SnapshotRollbackStore::rollback(
    const std::string& point_id) {
    StoredPoint stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = points_.find(point_id);
        if (it == points_.end()) {
            return HiveError{ErrorKind::NotFound, "Rollback point not found: " + point_id,
                             "rollback_point_not_found"};
        }
        stored = it->second;
    }

    LOG_INFO("SnapshotRollbackStore: rolling back to " + point_id);
    std::vector<std::string> restored;
    std::vector<std::string> failed;
    for (const auto& path : stored.point.paths) {
        auto status = restore_file(path, stored.contents.at(path));
        if (core::errors::is_error(status)) {
            LOG_ERROR("SnapshotRollbackStore: failed to restore " + path + ": " +
                      core::errors::get_error(status).message);
            failed.push_back(path);
            continue;
        }
        restored.push_back(path);
    }

    if (!failed.empty()) {
        std::string listing;
        for (const auto& path : failed) {
            listing += (listing.empty() ? "" : ", ") + path;
        }
        return HiveError{ErrorKind::Internal, "Rollback incomplete, could not restore: " + listing,
                         "rollback_incomplete"};
    }
    return restored;
}

std::vector<RecoveryPoint> SnapshotRollbackStore::history(const std::string& mission_id) const {
    std::vector<std::pair<std::uint64_t, RecoveryPoint>> owned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : points_) {
            if (entry.second.point.mission_id == mission_id) {
                owned.emplace_back(entry.second.sequence, entry.second.point);
            }
        }
    }
    std::sort(owned.begin(), owned.end(),
              [](const auto& l, const auto& r) { return l.first > r.first; });
    std::vector<RecoveryPoint> points;
    for (auto& entry : owned) {
        points.push_back(std::move(entry.second));
    }
    return points;
}

core::errors::Status SnapshotRollbackStore::restore(const std::string& path,
                                                    const std::string& mission_id) {
    std::optional<std::optional<std::string>> content;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uint64_t newest = 0;
        for (const auto& entry : points_) {
            const StoredPoint& stored = entry.second;
            if (stored.point.mission_id != mission_id || stored.sequence < newest) {
                continue;
            }
            auto found = stored.contents.find(path);
            if (found != stored.contents.end()) {
                newest = stored.sequence;
                content = found->second;
            }
        }
    }
    if (!content.has_value()) {
        return HiveError{ErrorKind::NoRollbackPoint, "No backup found for file: " + path,
                         "no_rollback_point"};
    }
    return restore_file(path, *content);
}

}  // namespace hive::workspace
