#pragma once

#include <string>
#include "pool/agent_pool.hpp"
#include "protocol/model_contract.hpp"

namespace hive::runtime {

// ModelClient that routes completions through the agent pool, so merge
// assistance shares the pool's concurrency limit and quota accounting.
class PoolModelClient final : public protocol::ModelClient {
public:
    explicit PoolModelClient(pool::AgentPool& pool,
                             protocol::HierarchyTier tier = protocol::HierarchyTier::Lord,
                             std::string provider = "claude", std::string request_type = "merge");

    core::errors::Result<protocol::CompletionResponse> complete(
        const protocol::CompletionRequest& request,
        const core::concurrency::CancelToken& cancel) override;

private:
    pool::AgentPool& pool_;
    protocol::HierarchyTier tier_;
    std::string provider_;
    std::string request_type_;
};

}  // namespace hive::runtime
