#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/hive_errors.hpp"
#include "merge/branch_manager.hpp"
#include "merge/region_analyzer.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/model_contract.hpp"

namespace hive::merge {

enum class ResolutionStrategy {
    Auto,
    AiAssisted,
    Manual
};

struct ConflictSide {
    std::string branch_id;
    std::string agent_id;
    std::string task_id;
    protocol::ChangeType change_type = protocol::ChangeType::Modify;
    std::string content;
};

// Overlapping region-level change of two active branches on one file.
// `ours` is always the branch with the smaller id.
struct MergeConflict {
    std::string id;
    std::string file_path;
    std::string base_content;
    ConflictSide ours;
    ConflictSide theirs;
    std::vector<CodeRegion> regions;
};

struct MergeResolution {
    std::string conflict_id;
    std::string file_path;
    ResolutionStrategy strategy = ResolutionStrategy::Manual;
    std::optional<std::string> resolved_content;  // Absent for manual
    std::string ours_content;
    std::string theirs_content;
    std::string base_content;
    std::string resolved_by;
};

struct MergeEngineConfig {
    bool enable_ai_merge = true;
    std::uint32_t ai_max_tokens = 4096;
    double ai_temperature = 0.1;
};

class MergeEngine {
public:
    // `assistant` may be null; AI resolution is then unavailable for the
    // lifetime of the engine.
    MergeEngine(BranchManager& branches, RegionAnalyzer analyzer, protocol::EventSink& events,
                protocol::ModelClient* assistant = nullptr, MergeEngineConfig config = {});

    MergeEngine(const MergeEngine&) = delete;
    MergeEngine& operator=(const MergeEngine&) = delete;

    // All active branches.
    std::vector<MergeConflict> detect_conflicts();

    // Only pairs drawn from `branch_ids` (inactive ids are skipped).
    std::vector<MergeConflict> detect_conflicts(const std::vector<std::string>& branch_ids);

    // Cascade auto -> ai_assisted -> manual, or exactly `strategy` when given.
    core::errors::Result<MergeResolution> resolve_conflict(
        const MergeConflict& conflict,
        std::optional<ResolutionStrategy> strategy = std::nullopt,
        const core::concurrency::CancelToken& cancel = core::concurrency::CancelToken());

    // Writes the resolved content into the first branch, drops the file from
    // the second and closes the conflict.
    core::errors::Status apply_resolution(const MergeResolution& resolution);

    std::vector<MergeConflict> active_conflicts() const;
    std::optional<MergeConflict> get_conflict(const std::string& conflict_id) const;
    void clear_conflicts();

    bool ai_available() const;

    static std::string conflict_id(const std::string& branch_a, const std::string& branch_b,
                                   const std::string& file_path);

private:
    std::vector<MergeConflict> detect_among(const std::vector<VirtualBranch>& branches);
    std::optional<MergeConflict> build_conflict(const VirtualBranch& a, const VirtualBranch& b,
                                                const std::string& file_path) const;

    // Region keys ("type:name") whose text differs between base and side.
    std::map<std::string, CodeRegion> changed_regions(const std::string& file_path,
                                                      const std::string& base,
                                                      const std::string& side) const;

    std::optional<std::string> try_auto(const MergeConflict& conflict) const;
    core::errors::Result<std::optional<std::string>> try_ai(
        const MergeConflict& conflict, const core::concurrency::CancelToken& cancel);
    std::string build_prompt(const MergeConflict& conflict) const;

    BranchManager& branches_;
    RegionAnalyzer analyzer_;
    protocol::EventSink& events_;
    protocol::ModelClient* assistant_;
    MergeEngineConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, MergeConflict> conflicts_;
};

std::string to_string(ResolutionStrategy strategy);
std::optional<ResolutionStrategy> parse_resolution_strategy(const std::string& text);

// Body of the first fenced code block, or nullopt when there is none.
std::optional<std::string> extract_code_block(const std::string& text);

}  // namespace hive::merge
