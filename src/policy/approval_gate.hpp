#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>
#include "protocol/capability_contract.hpp"

namespace hive::policy {

// Approves every change set unchanged.
class AutoApprovalGate final : public protocol::ApprovalGate {
public:
    core::errors::Result<protocol::ApprovalDecision> request_approval(
        const protocol::Task& task, const std::vector<protocol::FileChange>& changes) override;
};

// Asks on `out` and reads a yes/no answer from `in`. Concurrent requests are
// asked one at a time.
class ConsoleApprovalGate final : public protocol::ApprovalGate {
public:
    ConsoleApprovalGate(std::istream& in, std::ostream& out);

    core::errors::Result<protocol::ApprovalDecision> request_approval(
        const protocol::Task& task, const std::vector<protocol::FileChange>& changes) override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex mutex_;
};

}  // namespace hive::policy
