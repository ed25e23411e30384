#include "merge/merge_engine.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "merge/line_merge.hpp"

namespace hive::merge {

using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::ChangeType;
using protocol::ConflictEvent;
using protocol::ConflictEventKind;
using protocol::FileChange;

namespace {

const FileChange* find_change(const VirtualBranch& branch, const std::string& path) {
    for (const auto& change : branch.changes) {
        if (change.path == path) {
            return &change;
        }
    }
    return nullptr;
}

std::string side_content(const FileChange& change) {
    return change.type == ChangeType::Delete ? std::string() : change.modified_content;
}

std::string region_key(const CodeRegion& region) {
    return to_string(region.type) + ":" + region.name;
}

}  // namespace

std::string to_string(const ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::Auto:
            return "auto";
        case ResolutionStrategy::AiAssisted:
            return "ai_assisted";
        case ResolutionStrategy::Manual:
            return "manual";
        default:
            return "unknown";
    }
}

std::optional<ResolutionStrategy> parse_resolution_strategy(const std::string& text) {
    if (text == "auto") return ResolutionStrategy::Auto;
    if (text == "ai_assisted") return ResolutionStrategy::AiAssisted;
    if (text == "manual") return ResolutionStrategy::Manual;
    return std::nullopt;
}

std::optional<std::string> extract_code_block(const std::string& text) {
    const auto open = text.find("```");
    if (open == std::string::npos) {
        return std::nullopt;
    }
    // Skip the info string ("```ts") up to the end of the fence line.
    auto body_start = text.find('\n', open + 3);
    if (body_start == std::string::npos) {
        return std::nullopt;
    }
    ++body_start;
    const auto close = text.find("```", body_start);
    if (close == std::string::npos) {
        return std::nullopt;
    }
    std::string body = text.substr(body_start, close - body_start);
    if (!body.empty() && body.back() == '\n') {
        body.pop_back();
    }
    return body;
}

MergeEngine::MergeEngine(BranchManager& branches, RegionAnalyzer analyzer,
                         protocol::EventSink& events, protocol::ModelClient* assistant,
                         MergeEngineConfig config)
    : branches_(branches),
      analyzer_(std::move(analyzer)),
      events_(events),
      assistant_(config.enable_ai_merge ? assistant : nullptr),
      config_(config) {}

bool MergeEngine::ai_available() const {
    return assistant_ != nullptr;
}

std::string MergeEngine::conflict_id(const std::string& branch_a, const std::string& branch_b,
                                     const std::string& file_path) {
    const std::string& low = std::min(branch_a, branch_b);
    const std::string& high = std::max(branch_a, branch_b);
    return core::config::stable_id("conflict", low + "|" + high + "|" + file_path);
}

std::map<std::string, CodeRegion> MergeEngine::changed_regions(const std::string& file_path,
                                                               const std::string& base,
                                                               const std::string& side) const {
    std::map<std::string, CodeRegion> base_regions;
    for (const auto& region : analyzer_.analyze(file_path, base)) {
        base_regions.emplace(region_key(region), region);
    }
    std::map<std::string, CodeRegion> side_regions;
    for (const auto& region : analyzer_.analyze(file_path, side)) {
        side_regions.emplace(region_key(region), region);
    }

    std::map<std::string, CodeRegion> changed;
    for (const auto& entry : side_regions) {
        auto original = base_regions.find(entry.first);
        if (original == base_regions.end() ||
            RegionAnalyzer::region_text(base, original->second) !=
                RegionAnalyzer::region_text(side, entry.second)) {
            changed.emplace(entry.first, entry.second);
        }
    }
    for (const auto& entry : base_regions) {
        if (side_regions.find(entry.first) == side_regions.end()) {
            changed.emplace(entry.first, entry.second);
        }
    }
    return changed;
}

std::optional<MergeConflict> MergeEngine::build_conflict(const VirtualBranch& a,
                                                         const VirtualBranch& b,
                                                         const std::string& file_path) const {
    const FileChange* change_a = find_change(a, file_path);
    const FileChange* change_b = find_change(b, file_path);
    if (change_a == nullptr || change_b == nullptr) {
        return std::nullopt;
    }

    std::string base;
    if (change_a->original_content.has_value()) {
        base = *change_a->original_content;
    } else if (change_b->original_content.has_value()) {
        base = *change_b->original_content;
    } else {
        base = branches_.original_content(file_path).value_or("");
    }

    const std::string ours = side_content(*change_a);
    const std::string theirs = side_content(*change_b);
    if (ours == theirs) {
        return std::nullopt;  // Same edit on both sides
    }

    const auto changed_a = changed_regions(file_path, base, ours);
    const auto changed_b = changed_regions(file_path, base, theirs);

    MergeConflict conflict;
    for (const auto& entry : changed_a) {
        if (changed_b.count(entry.first) > 0) {
            conflict.regions.push_back(entry.second);
        }
    }
    if (conflict.regions.empty()) {
        return std::nullopt;
    }
    std::sort(conflict.regions.begin(), conflict.regions.end(),
              [](const CodeRegion& l, const CodeRegion& r) { return l.start_line < r.start_line; });

    conflict.id = conflict_id(a.id, b.id, file_path);
    conflict.file_path = file_path;
    conflict.base_content = base;
    conflict.ours = ConflictSide{a.id, a.agent_id, a.task_id, change_a->type, ours};
    conflict.theirs = ConflictSide{b.id, b.agent_id, b.task_id, change_b->type, theirs};
    return conflict;
}

std::vector<MergeConflict> MergeEngine::detect_among(const std::vector<VirtualBranch>& branches) {
    std::vector<VirtualBranch> ordered = branches;
    std::sort(ordered.begin(), ordered.end(),
              [](const VirtualBranch& l, const VirtualBranch& r) { return l.id < r.id; });
    ordered.erase(std::unique(ordered.begin(), ordered.end(),
                              [](const VirtualBranch& l, const VirtualBranch& r) {
                                  return l.id == r.id;
                              }),
                  ordered.end());

    std::vector<MergeConflict> detected;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        for (std::size_t j = i + 1; j < ordered.size(); ++j) {
            for (const auto& path : branches_.conflicting_files(ordered[i].id, ordered[j].id)) {
                auto conflict = build_conflict(ordered[i], ordered[j], path);
                if (conflict.has_value()) {
                    detected.push_back(std::move(*conflict));
                }
            }
        }
    }

    std::set<std::string> considered;
    for (const auto& branch : ordered) {
        considered.insert(branch.id);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = conflicts_.begin(); it != conflicts_.end();) {
            const bool covered = considered.count(it->second.ours.branch_id) > 0 &&
                                 considered.count(it->second.theirs.branch_id) > 0;
            it = covered ? conflicts_.erase(it) : std::next(it);
        }
        for (const auto& conflict : detected) {
            conflicts_[conflict.id] = conflict;
        }
    }

    if (!detected.empty()) {
        LOG_INFO("MergeEngine: detected " + std::to_string(detected.size()) + " conflicts");
    }
    for (const auto& conflict : detected) {
        std::string names;
        for (const auto& region : conflict.regions) {
            names += (names.empty() ? "" : ", ") + region.name;
        }
        events_.publish(ConflictEvent{ConflictEventKind::Detected, conflict.id,
                                      conflict.file_path, conflict.ours.branch_id,
                                      conflict.theirs.branch_id, names});
    }
    return detected;
}

std::vector<MergeConflict> MergeEngine::detect_conflicts() {
    return detect_among(branches_.active_branches());
}

std::vector<MergeConflict> MergeEngine::detect_conflicts(const std::vector<std::string>& branch_ids) {
    std::vector<VirtualBranch> selected;
    for (const auto& branch_id : branch_ids) {
        auto branch = branches_.get_branch(branch_id);
        if (branch.has_value() && branch->status == BranchStatus::Active) {
            selected.push_back(std::move(*branch));
        }
    }
    return detect_among(selected);
}

std::optional<std::string> MergeEngine::try_auto(const MergeConflict& conflict) const {
    const auto merged =
        three_way_merge(conflict.base_content, conflict.ours.content, conflict.theirs.content);
    if (merged.clean) {
        return merged.content;
    }

    // One side only extends the other. The contained side must have kept every
    // base line, otherwise taking the larger side would undo its deletions.
    const auto base = split_lines(conflict.base_content);
    const auto ours = split_lines(conflict.ours.content);
    const auto theirs = split_lines(conflict.theirs.content);
    if (contains_in_order(ours, theirs) && contains_in_order(theirs, base)) {
        return conflict.ours.content;
    }
    if (contains_in_order(theirs, ours) && contains_in_order(ours, base)) {
        return conflict.theirs.content;
    }
    return std::nullopt;
}

std::string MergeEngine::build_prompt(const MergeConflict& conflict) const {
    std::ostringstream prompt;
    prompt << "You are resolving a merge conflict in " << conflict.file_path << ".\n\n"
           << "Two workers made different changes to the same file.\n"
           << "- Branch 1 (task " << conflict.ours.task_id << ")\n"
           << "- Branch 2 (task " << conflict.theirs.task_id << ")\n\n"
           << "CONFLICTING REGIONS:\n";
    for (const auto& region : conflict.regions) {
        prompt << "- " << to_string(region.type) << ": " << region.name << " (lines "
               << region.start_line << "-" << region.end_line << ")\n";
    }
    prompt << "\nBASE VERSION:\n```\n" << conflict.base_content << "\n```\n\n"
           << "BRANCH 1 VERSION:\n```\n" << conflict.ours.content << "\n```\n\n"
           << "BRANCH 2 VERSION:\n```\n" << conflict.theirs.content << "\n```\n\n"
           << "Keep both sets of changes where they are compatible. Respond with ONLY the "
              "merged file content wrapped in a single code block.";
    return prompt.str();
}

core::errors::Result<std::optional<std::string>> MergeEngine::try_ai(
    const MergeConflict& conflict, const core::concurrency::CancelToken& cancel) {
    protocol::CompletionRequest request;
    request.system_prompt = "You merge source files. Output only code.";
    request.prompt = build_prompt(conflict);
    request.max_tokens = config_.ai_max_tokens;
    request.temperature = config_.ai_temperature;

    auto response = assistant_->complete(request, cancel);
    if (core::errors::is_error(response)) {
        return core::errors::get_error(response);
    }
    return extract_code_block(core::errors::get_value(response).content);
}

core::errors::Result<MergeResolution> MergeEngine::resolve_conflict(
    const MergeConflict& conflict, std::optional<ResolutionStrategy> strategy,
    const core::concurrency::CancelToken& cancel) {
    LOG_INFO("MergeEngine: resolving conflict " + conflict.id + " for " + conflict.file_path);

    MergeResolution resolution;
    resolution.conflict_id = conflict.id;
    resolution.file_path = conflict.file_path;
    resolution.ours_content = conflict.ours.content;
    resolution.theirs_content = conflict.theirs.content;
    resolution.base_content = conflict.base_content;

    const bool cascade = !strategy.has_value();
    bool resolved = false;

    if (cascade || *strategy == ResolutionStrategy::Auto) {
        auto merged = try_auto(conflict);
        if (merged.has_value()) {
            resolution.strategy = ResolutionStrategy::Auto;
            resolution.resolved_content = std::move(merged);
            resolution.resolved_by = "auto";
            resolved = true;
        } else if (!cascade) {
            return HiveError{ErrorKind::MergeFailed,
                             "Automatic merge of " + conflict.file_path + " is not possible.",
                             "auto_merge_failed"};
        }
    }

    if (!resolved && (cascade || *strategy == ResolutionStrategy::AiAssisted)) {
        if (!ai_available()) {
            if (!cascade) {
                return HiveError{ErrorKind::InvalidState,
                                 "AI-assisted merge is not configured.", "ai_merge_unavailable"};
            }
        } else {
            auto merged = try_ai(conflict, cancel);
            if (core::errors::is_error(merged)) {
                const HiveError& error = core::errors::get_error(merged);
                if (!cascade || error.kind == ErrorKind::Cancelled) {
                    return error;
                }
                LOG_WARN("MergeEngine: AI resolution failed for " + conflict.file_path + ": " +
                         error.message);
            } else if (core::errors::get_value(merged).has_value()) {
                resolution.strategy = ResolutionStrategy::AiAssisted;
                resolution.resolved_content = core::errors::get_value(merged);
                resolution.resolved_by = "ai";
                resolved = true;
            } else if (!cascade) {
                return HiveError{ErrorKind::MergeFailed,
                                 "AI response for " + conflict.file_path +
                                     " contained no code block.",
                                 "ai_merge_unparseable"};
            } else {
                LOG_WARN("MergeEngine: AI response for " + conflict.file_path +
                         " contained no code block");
            }
        }
    }

    if (!resolved) {
        // Never guess: the caller decides between the two originals.
        resolution.strategy = ResolutionStrategy::Manual;
        resolution.resolved_content = std::nullopt;
        resolution.resolved_by = "pending";
    }

    events_.publish(ConflictEvent{ConflictEventKind::Resolved, conflict.id, conflict.file_path,
                                  conflict.ours.branch_id, conflict.theirs.branch_id,
                                  to_string(resolution.strategy)});
    return resolution;
}

core::errors::Status MergeEngine::apply_resolution(const MergeResolution& resolution) {
    if (!resolution.resolved_content.has_value()) {
        return HiveError{ErrorKind::InvalidState,
                         "Resolution for " + resolution.file_path + " has no resolved content.",
                         "resolution_incomplete"};
    }

    MergeConflict conflict;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = conflicts_.find(resolution.conflict_id);
        if (it == conflicts_.end()) {
            return HiveError{ErrorKind::NotFound,
                             "Conflict not found: " + resolution.conflict_id,
                             "conflict_not_found"};
        }
        conflict = it->second;
    }

    FileChange change;
    change.path = conflict.file_path;
    change.type = conflict.ours.change_type == ChangeType::Create ? ChangeType::Create
                                                                  : ChangeType::Modify;
    change.modified_content = *resolution.resolved_content;
    auto ours_branch = branches_.get_branch(conflict.ours.branch_id);
    if (ours_branch.has_value()) {
        const FileChange* existing = find_change(*ours_branch, conflict.file_path);
        if (existing != nullptr) {
            change.original_content = existing->original_content;
        }
    }

    auto recorded = branches_.record_change(conflict.ours.branch_id, change);
    if (core::errors::is_error(recorded)) {
        return recorded;
    }
    auto dropped = branches_.drop_change(conflict.theirs.branch_id, conflict.file_path);
    if (core::errors::is_error(dropped)) {
        return core::errors::get_error(dropped);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        conflicts_.erase(conflict.id);
    }

    LOG_INFO("MergeEngine: conflict " + conflict.id + " applied to branch " +
             conflict.ours.branch_id + " (" + to_string(resolution.strategy) + ")");
    events_.publish(ConflictEvent{ConflictEventKind::Applied, conflict.id, conflict.file_path,
                                  conflict.ours.branch_id, conflict.theirs.branch_id,
                                  to_string(resolution.strategy)});
    return core::errors::ok();
}

std::vector<MergeConflict> MergeEngine::active_conflicts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<MergeConflict> conflicts;
    for (const auto& entry : conflicts_) {
        conflicts.push_back(entry.second);
    }
    return conflicts;
}

std::optional<MergeConflict> MergeEngine::get_conflict(const std::string& conflict_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conflicts_.find(conflict_id);
    if (it == conflicts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MergeEngine::clear_conflicts() {
    std::lock_guard<std::mutex> lock(mutex_);
    conflicts_.clear();
}

}  // namespace hive::merge
