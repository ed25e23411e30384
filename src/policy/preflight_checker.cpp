#include "policy/preflight_checker.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <set>
#include <utility>
#include "core/logging/logger.hpp"

namespace hive::policy {

using protocol::ChangeType;
using protocol::FileChange;
using protocol::ImpactAnalysis;
using protocol::PreflightReport;

namespace {

const std::vector<std::regex>& high_risk_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(package\.json$)"),   std::regex(R"(tsconfig\.json$)"),
        std::regex(R"(CMakeLists\.txt$)"), std::regex(R"(\.config\.(js|ts|json)$)"),
        std::regex(R"((^|/)index\.(ts|js)$)"), std::regex(R"((^|/)main\.(ts|js|cpp|c)$)")};
    return patterns;
}

const std::vector<std::regex>& sensitive_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"((^|/)\.env)"), std::regex(R"(webpack\.config)"),
        std::regex(R"(vite\.config)"), std::regex(R"(jest\.config)"),
        std::regex(R"((^|/)\.git/)")};
    return patterns;
}

bool matches_any(const std::string& path, const std::vector<std::regex>& patterns) {
    return std::any_of(patterns.begin(), patterns.end(),
                       [&path](const std::regex& p) { return std::regex_search(path, p); });
}

bool is_brace_source(const std::string& path) {
    static const std::regex pattern(R"(\.(ts|tsx|js|jsx|mjs|cjs|c|cc|cpp|h|hpp|java|go|rs|cs|json)$)");
    return std::regex_search(path, pattern);
}

int change_weight(const ChangeType type) {
    switch (type) {
        case ChangeType::Delete:
            return 5;
        case ChangeType::Create:
            return 2;
        case ChangeType::Modify:
            return 3;
        default:
            return 1;
    }
}

}  // namespace

std::vector<std::string> bracket_problems(const std::string& content) {
    std::vector<std::string> problems;
    std::vector<char> expected;
    char quote = 0;
    for (std::size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];
        if (quote != 0) {
            if (c == '\\') {
                ++i;
            } else if (c == quote || (c == '\n' && quote != '`')) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            quote = c;
        } else if (c == '(') {
            expected.push_back(')');
        } else if (c == '[') {
            expected.push_back(']');
        } else if (c == '{') {
            expected.push_back('}');
        } else if (c == ')' || c == ']' || c == '}') {
            if (expected.empty() || expected.back() != c) {
                problems.push_back(std::string("Unmatched bracket '") + c + "' at offset " +
                                   std::to_string(i));
                return problems;
            }
            expected.pop_back();
        }
    }
    if (!expected.empty()) {
        problems.push_back("Missing " + std::to_string(expected.size()) + " closing bracket(s)");
    }
    return problems;
}

WorkspacePreflightChecker::WorkspacePreflightChecker(const protocol::FileSystem& files,
                                                     std::vector<std::string> protected_paths)
    : files_(files), guard_([&protected_paths] {
          WorkspacePolicy policy;
          policy.protected_paths = std::move(protected_paths);
          return policy;
      }()) {}

core::errors::Result<PreflightReport> WorkspacePreflightChecker::check(
    const std::string& mission_id, const std::vector<FileChange>& changes) {
    PreflightReport report;
    std::set<std::string> seen;

    for (const auto& change : changes) {
        auto valid = guard_.validate_change_path(change.path);
        if (core::errors::is_error(valid)) {
            report.errors.push_back(core::errors::get_error(valid).message);
            continue;
        }
        if (!seen.insert(change.path).second) {
            report.warnings.push_back("Multiple changes planned for " + change.path);
        }

        auto exists = files_.exists(change.path);
        if (core::errors::is_error(exists)) {
            report.errors.push_back("Cannot inspect " + change.path + ": " +
                                    core::errors::get_error(exists).message);
            continue;
        }
        const bool present = core::errors::get_value(exists);
        if (change.type == ChangeType::Delete && !present) {
            report.warnings.push_back("Deleting a file that does not exist: " + change.path);
        } else if (change.type == ChangeType::Create && present) {
            report.warnings.push_back("Creating a file that already exists: " + change.path);
        } else if (change.type == ChangeType::Modify && !present) {
            report.warnings.push_back("Modifying a file that does not exist: " + change.path);
        }

        if (matches_any(change.path, sensitive_patterns())) {
            report.warnings.push_back("Sensitive file touched: " + change.path);
        }
        if (change.type != ChangeType::Delete && is_brace_source(change.path)) {
            for (const auto& problem : bracket_problems(change.modified_content)) {
                report.warnings.push_back(change.path + ": " + problem);
            }
        }
    }

    report.can_proceed = report.errors.empty();
    LOG_INFO("PreflightChecker: mission " + mission_id + " checked " +
             std::to_string(changes.size()) + " changes (" +
             std::to_string(report.errors.size()) + " errors, " +
             std::to_string(report.warnings.size()) + " warnings)");
    return report;
}

core::errors::Result<ImpactAnalysis> WorkspacePreflightChecker::analyze(
    const std::vector<FileChange>& changes) {
    ImpactAnalysis analysis;
    std::set<std::string> directories;
    std::set<std::string> files;
    int score = 0;

    for (const auto& change : changes) {
        switch (change.type) {
            case ChangeType::Create:
                ++analysis.files_created;
                break;
            case ChangeType::Modify:
                ++analysis.files_modified;
                break;
            case ChangeType::Delete:
                ++analysis.files_deleted;
                break;
        }
        files.insert(change.path);
        const std::string parent = std::filesystem::path(change.path).parent_path().string();
        directories.insert(parent.empty() ? "." : parent);

        score += change_weight(change.type);
        if (matches_any(change.path, high_risk_patterns())) {
            score += 3;
        }
        if (matches_any(change.path, sensitive_patterns())) {
            score += 5;
        }
    }

    analysis.directories.assign(directories.begin(), directories.end());
    const double normalized =
        static_cast<double>(score) / static_cast<double>(std::max<std::size_t>(changes.size(), 1));
    if (normalized >= 7.0 || files.size() > 20) {
        analysis.risk_level = "high";
    } else if (normalized >= 4.0) {
        analysis.risk_level = "medium";
    } else {
        analysis.risk_level = "low";
    }

    analysis.summary = std::to_string(analysis.files_created) + " created, " +
                       std::to_string(analysis.files_modified) + " modified, " +
                       std::to_string(analysis.files_deleted) + " deleted across " +
                       std::to_string(analysis.directories.size()) + " directories (risk: " +
                       analysis.risk_level + ")";
    return analysis;
}

}  // namespace hive::policy
