#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/concurrency/cancel_token.hpp"
#include "core/errors/hive_errors.hpp"

namespace hive::protocol {

// Agent hierarchy level a call is billed to.
enum class HierarchyTier {
    Sovereign,
    Lord,
    Overlord,
    Worker
};

struct TokenUsage {
    std::uint64_t prompt_tokens = 0;
    std::uint64_t completion_tokens = 0;
    std::uint64_t total_tokens = 0;
};

struct CompletionRequest {
    std::string prompt;
    std::string system_prompt;
    std::uint32_t max_tokens = 4096;
    double temperature = 0.7;
    std::vector<std::string> stop_sequences;
};

struct CompletionResponse {
    std::string content;
    TokenUsage usage;
    std::string model;
    std::string finish_reason = "stop";
};

// Language-model backend. Implementations must be safe to call from several
// threads and should return promptly once `cancel` fires.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual core::errors::Result<CompletionResponse> complete(
        const CompletionRequest& request,
        const core::concurrency::CancelToken& cancel) = 0;
};

struct ContextItem {
    std::string type;  // "file", "note", ...
    std::string path;
    std::string content;
};

struct AgentRequest {
    std::string id;
    std::string task_id;
    std::string mission_id;
    std::string type;
    std::string prompt;
    std::string system_context;
    std::vector<ContextItem> context;
    std::optional<std::uint32_t> max_tokens;
    std::optional<double> temperature;
    std::vector<std::string> stop_sequences;
    std::string provider = "claude";
    HierarchyTier tier = HierarchyTier::Worker;
};

struct AgentResponse {
    std::string agent_id;
    std::string request_id;
    std::string task_id;
    std::string content;
    TokenUsage usage;
    std::chrono::milliseconds duration{0};
    std::string provider;
    std::string model;
    std::string finish_reason;
};

inline std::string to_string(const HierarchyTier tier) {
    switch (tier) {
        case HierarchyTier::Sovereign:
            return "sovereign";
        case HierarchyTier::Lord:
            return "lord";
        case HierarchyTier::Overlord:
            return "overlord";
        case HierarchyTier::Worker:
            return "worker";
        default:
            return "unknown";
    }
}

inline std::optional<HierarchyTier> parse_tier(const std::string& text) {
    if (text == "sovereign") return HierarchyTier::Sovereign;
    if (text == "lord") return HierarchyTier::Lord;
    if (text == "overlord") return HierarchyTier::Overlord;
    if (text == "worker") return HierarchyTier::Worker;
    return std::nullopt;
}

// Rough token estimate used when a backend reports no usage.
inline std::uint64_t estimate_tokens(const std::string& text) {
    return static_cast<std::uint64_t>((text.size() + 3) / 4);
}

}  // namespace hive::protocol
