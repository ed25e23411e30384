#include "workspace/command_verifier.hpp"

#include <sstream>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "workspace/process_runner.hpp"

namespace hive::workspace {

using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::VerificationReport;

namespace {

constexpr std::size_t kMaxDetailLines = 20;

// Last non-empty lines of a captured stream.
std::vector<std::string> tail_lines(const std::string& text, const std::size_t limit) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    if (lines.size() > limit) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return lines;
}

}  // namespace

CommandVerifier::CommandVerifier(std::filesystem::path root, std::string command,
                                 const std::chrono::milliseconds timeout,
                                 policy::PolicyGuard guard)
    : root_(std::move(root)), command_(std::move(command)), timeout_(timeout),
      guard_(std::move(guard)) {}

core::errors::Result<VerificationReport> CommandVerifier::verify(
    const protocol::VerificationRequest& request,
    const core::concurrency::CancelToken& cancel) {
    auto command = guard_.validate_command(command_);
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }

    ProcessRequest process;
    process.command = core::errors::get_value(command);
    process.working_directory = root_;
    process.timeout = timeout_;

    LOG_INFO("CommandVerifier: mission " + request.mission_id + " running `" + process.command +
             "` over " + std::to_string(request.file_paths.size()) + " files");
    auto outcome_result = run_process(process, cancel);
    if (core::errors::is_error(outcome_result)) {
        return core::errors::get_error(outcome_result);
    }
    const ProcessOutcome& outcome = core::errors::get_value(outcome_result);

    if (outcome.cancelled) {
        return HiveError{ErrorKind::Cancelled, "Verification cancelled.",
                         "verification_cancelled"};
    }

    VerificationReport report;
    report.details = tail_lines(outcome.stderr_text, kMaxDetailLines);
    for (auto& line : tail_lines(outcome.stdout_text, kMaxDetailLines)) {
        report.details.push_back(std::move(line));
    }

    if (outcome.timed_out) {
        report.valid = false;
        report.summary = "Verification command timed out after " +
                         std::to_string(timeout_.count()) + " ms";
    } else if (outcome.exit_code != 0) {
        report.valid = false;
        report.summary = "Verification command failed with exit code " +
                         std::to_string(outcome.exit_code);
    } else {
        report.valid = true;
        report.summary = "Verification command passed in " +
                         std::to_string(outcome.duration.count()) + " ms";
    }
    return report;
}

core::errors::Result<VerificationReport> PassThroughVerifier::verify(
    const protocol::VerificationRequest& request, const core::concurrency::CancelToken& cancel) {
    if (cancel.is_cancelled()) {
        return HiveError{ErrorKind::Cancelled, "Verification cancelled.",
                         "verification_cancelled"};
    }
    VerificationReport report;
    report.valid = true;
    report.summary = "No verification configured (" + std::to_string(request.changes.size()) +
                     " changes accepted)";
    return report;
}

}  // namespace hive::workspace
