#include "policy/approval_gate.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

namespace hive::policy {

using protocol::ApprovalDecision;

namespace {

std::string normalize_answer(std::string answer) {
    answer.erase(std::remove_if(answer.begin(), answer.end(),
                                [](const unsigned char c) { return std::isspace(c) != 0; }),
                 answer.end());
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer;
}

}  // namespace

core::errors::Result<ApprovalDecision> AutoApprovalGate::request_approval(
    const protocol::Task&, const std::vector<protocol::FileChange>&) {
    ApprovalDecision decision;
    decision.approved = true;
    decision.comment = "auto-approved";
    return decision;
}

ConsoleApprovalGate::ConsoleApprovalGate(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

core::errors::Result<ApprovalDecision> ConsoleApprovalGate::request_approval(
    const protocol::Task& task, const std::vector<protocol::FileChange>& changes) {
    std::lock_guard<std::mutex> lock(mutex_);

    out_ << "\nTask " << task.id << ": " << task.description << "\n";
    for (const auto& change : changes) {
        out_ << "  " << protocol::to_string(change.type) << " " << change.path << "\n";
    }
    out_ << "Apply " << changes.size() << " change(s)? [y/N] " << std::flush;

    ApprovalDecision decision;
    std::string answer;
    if (!std::getline(in_, answer)) {
        decision.approved = false;
        decision.comment = "no answer (end of input)";
        return decision;
    }

    answer = normalize_answer(answer);
    decision.approved = answer == "y" || answer == "yes";
    decision.comment = decision.approved ? "approved at console" : "rejected at console";
    return decision;
}

}  // namespace hive::policy
