#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "protocol/model_contract.hpp"

namespace hive::runtime {

// Deterministic ModelClient. Replies are chosen by the first rule whose
// match text occurs in the prompt; unmatched prompts get the default reply.
class ScriptedModelClient final : public protocol::ModelClient {
public:
    explicit ScriptedModelClient(std::string model_name = "scripted",
                                 std::chrono::milliseconds latency = std::chrono::milliseconds(0));

    // The first `fail_times` matching calls fail with ExecutionFailed.
    void add_reply(std::string match, std::string content, std::size_t fail_times = 0);
    void set_default_reply(std::string content);
    void set_latency(std::chrono::milliseconds latency);

    // Next `count` calls fail with `error`, whatever the prompt.
    void fail_next(std::size_t count, core::errors::HiveError error);

    core::errors::Result<protocol::CompletionResponse> complete(
        const protocol::CompletionRequest& request,
        const core::concurrency::CancelToken& cancel) override;

    std::size_t call_count() const;
    std::vector<std::string> prompts() const;

private:
    struct Rule {
        std::string match;
        std::string content;
        std::size_t fail_times = 0;
    };

    std::string model_name_;

    mutable std::mutex mutex_;
    std::chrono::milliseconds latency_;
    std::vector<Rule> rules_;
    std::optional<std::string> default_reply_;
    std::size_t forced_failures_ = 0;
    std::optional<core::errors::HiveError> forced_error_;
    std::vector<std::string> prompts_;
};

}  // namespace hive::runtime
