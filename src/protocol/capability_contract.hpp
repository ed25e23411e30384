#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/config/ids.hpp"
#include "core/errors/hive_errors.hpp"
#include "protocol/change_contract.hpp"
#include "protocol/task_contract.hpp"

namespace hive::protocol {

// 1. Rollback
struct RecoveryPoint {
    std::string id;
    std::string mission_id;
    core::config::SystemTime created_at{};
    std::vector<std::string> paths;
};

class RollbackStore {
public:
    virtual ~RollbackStore() = default;

    virtual core::errors::Result<RecoveryPoint> backup(
        const std::vector<std::string>& paths, const std::string& mission_id) = 0;

    // Restores the point; returns the restored paths.
    virtual core::errors::Result<std::vector<std::string>> rollback(
        const std::string& point_id) = 0;

    // Newest first.
    virtual std::vector<RecoveryPoint> history(const std::string& mission_id) const = 0;
};

// 2. Verification
struct VerificationRequest {
    std::string mission_id;
    std::vector<FileChange> changes;
    std::vector<std::string> file_paths;
    std::string strictness = "standard";
};

struct VerificationReport {
    bool valid = false;
    std::string summary;
    std::vector<std::string> details;
};

class Verifier {
public:
    virtual ~Verifier() = default;

    virtual core::errors::Result<VerificationReport> verify(
        const VerificationRequest& request,
        const core::concurrency::CancelToken& cancel) = 0;
};

// 3. Preflight
struct PreflightReport {
    bool can_proceed = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct ImpactAnalysis {
    std::size_t files_created = 0;
    std::size_t files_modified = 0;
    std::size_t files_deleted = 0;
    std::vector<std::string> directories;
    std::string risk_level = "low";
    std::string summary;
};

class PreflightChecker {
public:
    virtual ~PreflightChecker() = default;

    virtual core::errors::Result<PreflightReport> check(
        const std::string& mission_id, const std::vector<FileChange>& changes) = 0;

    virtual core::errors::Result<ImpactAnalysis> analyze(
        const std::vector<FileChange>& changes) = 0;
};

// 4. Approval
struct ApprovalDecision {
    bool approved = false;
    std::optional<std::vector<FileChange>> modifications;
    std::string comment;
};

class ApprovalGate {
public:
    virtual ~ApprovalGate() = default;

    virtual core::errors::Result<ApprovalDecision> request_approval(
        const Task& task, const std::vector<FileChange>& changes) = 0;
};

}  // namespace hive::protocol
