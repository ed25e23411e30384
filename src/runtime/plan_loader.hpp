#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/hive_errors.hpp"
#include "protocol/mission_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "runtime/scripted_model_client.hpp"

namespace hive::runtime {

struct ScriptedResponse {
    std::string task_key;
    std::string content;
    std::size_t fail_attempts = 0;  // Failures before the reply is returned
};

// A mission plan file: the mission to create, the execution plan (its
// mission_id is filled in once the mission exists) and canned model replies.
struct LoadedPlan {
    protocol::MissionConfig mission;
    protocol::ExecutionPlan plan;
    std::vector<ScriptedResponse> responses;
    std::optional<std::string> default_response;
};

core::errors::Result<LoadedPlan> parse_plan(const nlohmann::json& document);
core::errors::Result<LoadedPlan> parse_plan_text(const std::string& text);
core::errors::Result<LoadedPlan> load_plan(const std::filesystem::path& path);

// Registers the plan's replies, keyed on each task's prompt marker.
void register_responses(const LoadedPlan& plan, ScriptedModelClient& model);

}  // namespace hive::runtime
