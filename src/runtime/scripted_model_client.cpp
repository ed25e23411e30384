#include "runtime/scripted_model_client.hpp"

#include <utility>

namespace hive::runtime {

using core::errors::ErrorKind;
using core::errors::HiveError;
using protocol::CompletionResponse;

ScriptedModelClient::ScriptedModelClient(std::string model_name,
                                         const std::chrono::milliseconds latency)
    : model_name_(std::move(model_name)), latency_(latency) {}

void ScriptedModelClient::add_reply(std::string match, std::string content,
                                    const std::size_t fail_times) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.push_back(Rule{std::move(match), std::move(content), fail_times});
}

void ScriptedModelClient::set_default_reply(std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_reply_ = std::move(content);
}

void ScriptedModelClient::set_latency(const std::chrono::milliseconds latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    latency_ = latency;
}

void ScriptedModelClient::fail_next(const std::size_t count, HiveError error) {
    std::lock_guard<std::mutex> lock(mutex_);
    forced_failures_ = count;
    forced_error_ = std::move(error);
}

core::errors::Result<CompletionResponse> ScriptedModelClient::complete(
    const protocol::CompletionRequest& request, const core::concurrency::CancelToken& cancel) {
    std::chrono::milliseconds latency{0};
    std::optional<HiveError> failure;
    std::string content;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prompts_.push_back(request.prompt);
        latency = latency_;

        if (forced_failures_ > 0) {
            --forced_failures_;
            failure = forced_error_;
        } else {
            bool matched = false;
            for (auto& rule : rules_) {
                if (request.prompt.find(rule.match) == std::string::npos) {
                    continue;
                }
                matched = true;
                if (rule.fail_times > 0) {
                    --rule.fail_times;
                    failure = HiveError{ErrorKind::ExecutionFailed,
                                        "Scripted failure for '" + rule.match + "'",
                                        "scripted_failure"};
                } else {
                    content = rule.content;
                }
                break;
            }
            if (!matched) {
                if (default_reply_.has_value()) {
                    content = *default_reply_;
                } else {
                    const auto newline = request.prompt.find('\n');
                    content = "Acknowledged: " + request.prompt.substr(0, newline);
                }
            }
        }
    }

    if (latency.count() > 0 && cancel.wait_for(latency)) {
        return HiveError{ErrorKind::Cancelled, "Model call cancelled.", "model_call_cancelled"};
    }
    if (cancel.is_cancelled()) {
        return HiveError{ErrorKind::Cancelled, "Model call cancelled.", "model_call_cancelled"};
    }
    if (failure.has_value()) {
        return *failure;
    }

    CompletionResponse response;
    response.content = content;
    response.model = model_name_;
    response.usage.prompt_tokens =
        protocol::estimate_tokens(request.system_prompt) + protocol::estimate_tokens(request.prompt);
    response.usage.completion_tokens = protocol::estimate_tokens(content);
    response.usage.total_tokens = response.usage.prompt_tokens + response.usage.completion_tokens;
    return response;
}

std::size_t ScriptedModelClient::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_.size();
}

std::vector<std::string> ScriptedModelClient::prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_;
}

}  // namespace hive::runtime
