#include "runtime/pool_model_client.hpp"

#include <utility>
#include "core/config/ids.hpp"

namespace hive::runtime {

PoolModelClient::PoolModelClient(pool::AgentPool& pool, const protocol::HierarchyTier tier,
                                 std::string provider, std::string request_type)
    : pool_(pool), tier_(tier), provider_(std::move(provider)),
      request_type_(std::move(request_type)) {}

core::errors::Result<protocol::CompletionResponse> PoolModelClient::complete(
    const protocol::CompletionRequest& request, const core::concurrency::CancelToken& cancel) {
    protocol::AgentRequest agent_request;
    agent_request.id = core::config::generate_id("req");
    agent_request.type = request_type_;
    agent_request.prompt = request.prompt;
    agent_request.system_context = request.system_prompt;
    agent_request.max_tokens = request.max_tokens;
    agent_request.temperature = request.temperature;
    agent_request.stop_sequences = request.stop_sequences;
    agent_request.provider = provider_;
    agent_request.tier = tier_;

    auto outcome = pool_.execute(agent_request, cancel);
    if (core::errors::is_error(outcome)) {
        return core::errors::get_error(outcome);
    }
    const auto& response = core::errors::get_value(outcome);

    protocol::CompletionResponse completion;
    completion.content = response.content;
    completion.usage = response.usage;
    completion.model = response.model;
    completion.finish_reason = response.finish_reason;
    return completion;
}

}  // namespace hive::runtime
