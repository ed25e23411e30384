#include "runtime/plan_loader.hpp"

#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace hive::runtime {

using core::errors::ErrorKind;
using core::errors::HiveError;
using core::errors::Status;
using nlohmann::json;
using protocol::ChangeType;
using protocol::ExecutionTaskConfig;
using protocol::FileChange;
using protocol::PlanDependency;

namespace {

HiveError plan_error(const std::string& message, const std::string& code = "invalid_plan") {
    return HiveError{ErrorKind::Input, message, code,
                     "See the plan file format: mission, tasks[], changes[]."};
}

Status read_string(const json& object, const char* key, std::string& out,
                   const std::string& where) {
    if (!object.contains(key)) {
        return core::errors::ok();
    }
    if (!object[key].is_string()) {
        return plan_error(where + "." + key + " must be a string.");
    }
    out = object[key].get<std::string>();
    return core::errors::ok();
}

Status read_string_list(const json& object, const char* key, std::vector<std::string>& out,
                        const std::string& where) {
    if (!object.contains(key)) {
        return core::errors::ok();
    }
    const json& value = object[key];
    if (!value.is_array()) {
        return plan_error(where + "." + key + " must be an array of strings.");
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return plan_error(where + "." + key + " must be an array of strings.");
        }
        out.push_back(item.get<std::string>());
    }
    return core::errors::ok();
}

Status parse_mission(const json& document, protocol::MissionConfig& mission) {
    const json& source =
        document.contains("mission") && document["mission"].is_object() ? document["mission"]
                                                                         : document;
    const std::string where = &source == &document ? "plan" : "mission";

    for (auto status : {read_string(source, "title", mission.title, where),
                        read_string(source, "description", mission.description, where),
                        read_string_list(source, "scope", mission.scope, where),
                        read_string_list(source, "constraints", mission.constraints, where)}) {
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    if (mission.title.empty()) {
        return plan_error("Plan is missing a mission title.", "plan_missing_title");
    }

    std::string priority;
    auto status = read_string(source, "priority", priority, where);
    if (core::errors::is_error(status)) {
        return status;
    }
    if (!priority.empty()) {
        auto parsed = protocol::parse_priority(priority);
        if (!parsed.has_value()) {
            return plan_error("Unknown mission priority: " + priority);
        }
        mission.priority = *parsed;
    }
    return core::errors::ok();
}

Status parse_change(const json& entry, const std::string& where, FileChange& change) {
    if (!entry.is_object()) {
        return plan_error(where + " must be an object.");
    }
    auto status = read_string(entry, "path", change.path, where);
    if (core::errors::is_error(status)) {
        return status;
    }
    if (change.path.empty()) {
        return plan_error(where + ".path is required.");
    }
    std::string type = "modify";
    status = read_string(entry, "type", type, where);
    if (core::errors::is_error(status)) {
        return status;
    }
    auto parsed = protocol::parse_change_type(type);
    if (!parsed.has_value()) {
        return plan_error(where + ".type must be create, modify or delete.");
    }
    change.type = *parsed;
    return read_string(entry, "content", change.modified_content, where);
}

Status parse_dependency(const json& entry, const std::string& where, PlanDependency& dependency) {
    if (entry.is_string()) {
        dependency.key = entry.get<std::string>();
        return core::errors::ok();
    }
    if (!entry.is_object()) {
        return plan_error(where + " must be a task key or {key, type}.");
    }
    auto status = read_string(entry, "key", dependency.key, where);
    if (core::errors::is_error(status)) {
        return status;
    }
    std::string type = "required";
    status = read_string(entry, "type", type, where);
    if (core::errors::is_error(status)) {
        return status;
    }
    auto parsed = protocol::parse_dependency_type(type);
    if (!parsed.has_value()) {
        return plan_error(where + ".type must be required or soft.");
    }
    dependency.type = *parsed;
    return core::errors::ok();
}

Status parse_task(const json& entry, const std::string& where, ExecutionTaskConfig& task,
                  LoadedPlan& loaded) {
    if (!entry.is_object()) {
        return plan_error(where + " must be an object.");
    }
    for (auto status : {read_string(entry, "key", task.key, where),
                        read_string(entry, "type", task.type, where),
                        read_string(entry, "description", task.description, where),
                        read_string(entry, "provider", task.provider, where),
                        read_string_list(entry, "relevant_files", task.relevant_files, where)}) {
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    if (task.key.empty()) {
        return plan_error(where + ".key is required.");
    }
    if (task.description.empty()) {
        task.description = task.key;
    }

    if (entry.contains("prompt")) {
        std::string prompt;
        auto status = read_string(entry, "prompt", prompt, where);
        if (core::errors::is_error(status)) {
            return status;
        }
        task.prompt = prompt;
    }

    std::string priority;
    auto status = read_string(entry, "priority", priority, where);
    if (core::errors::is_error(status)) {
        return status;
    }
    if (!priority.empty()) {
        auto parsed = protocol::parse_priority(priority);
        if (!parsed.has_value()) {
            return plan_error(where + ".priority is unknown: " + priority);
        }
        task.priority = *parsed;
    }

    std::string tier;
    status = read_string(entry, "tier", tier, where);
    if (core::errors::is_error(status)) {
        return status;
    }
    if (!tier.empty()) {
        auto parsed = protocol::parse_tier(tier);
        if (!parsed.has_value()) {
            return plan_error(where + ".tier is unknown: " + tier);
        }
        task.tier = *parsed;
    }

    if (entry.contains("max_tokens")) {
        if (!entry["max_tokens"].is_number_unsigned() || entry["max_tokens"].get<std::uint64_t>() == 0) {
            return plan_error(where + ".max_tokens must be a positive integer.");
        }
        task.max_tokens = entry["max_tokens"].get<std::uint32_t>();
    }

    if (entry.contains("depends_on")) {
        if (!entry["depends_on"].is_array()) {
            return plan_error(where + ".depends_on must be an array.");
        }
        std::size_t index = 0;
        for (const auto& item : entry["depends_on"]) {
            PlanDependency dependency;
            status = parse_dependency(item, where + ".depends_on[" + std::to_string(index++) + "]",
                                      dependency);
            if (core::errors::is_error(status)) {
                return status;
            }
            task.depends_on.push_back(dependency);
        }
    }

    if (entry.contains("response")) {
        ScriptedResponse response;
        response.task_key = task.key;
        status = read_string(entry, "response", response.content, where);
        if (core::errors::is_error(status)) {
            return status;
        }
        if (entry.contains("fail_attempts")) {
            if (!entry["fail_attempts"].is_number_unsigned()) {
                return plan_error(where + ".fail_attempts must be a non-negative integer.");
            }
            response.fail_attempts = entry["fail_attempts"].get<std::size_t>();
        }
        loaded.responses.push_back(response);
    }
    return core::errors::ok();
}

// Depth-first search for a cycle over required and soft edges alike.
bool has_cycle(const std::string& key, const std::map<std::string, const ExecutionTaskConfig*>& by_key,
               std::map<std::string, int>& marks) {
    marks[key] = 1;
    for (const auto& dependency : by_key.at(key)->depends_on) {
        const int mark = marks[dependency.key];
        if (mark == 1) {
            return true;
        }
        if (mark == 0 && has_cycle(dependency.key, by_key, marks)) {
            return true;
        }
    }
    marks[key] = 2;
    return false;
}

}  // namespace

core::errors::Result<LoadedPlan> parse_plan(const json& document) {
    if (!document.is_object()) {
        return plan_error("Plan document must be a JSON object.");
    }

    LoadedPlan loaded;
    auto status = parse_mission(document, loaded.mission);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }

    if (document.contains("require_approval")) {
        if (!document["require_approval"].is_boolean()) {
            return plan_error("plan.require_approval must be a boolean.");
        }
        loaded.plan.require_approval = document["require_approval"].get<bool>();
    }

    if (document.contains("default_response")) {
        std::string reply;
        status = read_string(document, "default_response", reply, "plan");
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
        loaded.default_response = reply;
    }

    if (document.contains("changes")) {
        if (!document["changes"].is_array()) {
            return plan_error("plan.changes must be an array.");
        }
        std::size_t index = 0;
        for (const auto& entry : document["changes"]) {
            FileChange change;
            status = parse_change(entry, "changes[" + std::to_string(index++) + "]", change);
            if (core::errors::is_error(status)) {
                return core::errors::get_error(status);
            }
            loaded.plan.changes.push_back(change);
        }
    }

    if (!document.contains("tasks") || !document["tasks"].is_array()) {
        return plan_error("plan.tasks must be an array.", "plan_missing_tasks");
    }
    std::size_t index = 0;
    for (const auto& entry : document["tasks"]) {
        ExecutionTaskConfig task;
        status = parse_task(entry, "tasks[" + std::to_string(index++) + "]", task, loaded);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
        loaded.plan.tasks.push_back(task);
    }

    std::map<std::string, const ExecutionTaskConfig*> by_key;
    for (const auto& task : loaded.plan.tasks) {
        if (!by_key.emplace(task.key, &task).second) {
            return plan_error("Duplicate task key: " + task.key, "plan_duplicate_key");
        }
    }
    for (const auto& task : loaded.plan.tasks) {
        for (const auto& dependency : task.depends_on) {
            if (dependency.key == task.key) {
                return plan_error("Task depends on itself: " + task.key, "plan_dependency_cycle");
            }
            if (by_key.count(dependency.key) == 0) {
                return plan_error("Task " + task.key + " depends on unknown task " + dependency.key,
                                  "plan_unknown_dependency");
            }
        }
    }
    std::map<std::string, int> marks;
    for (const auto& task : loaded.plan.tasks) {
        if (marks[task.key] == 0 && has_cycle(task.key, by_key, marks)) {
            return plan_error("Task dependencies form a cycle through " + task.key,
                              "plan_dependency_cycle");
        }
    }

    return loaded;
}

core::errors::Result<LoadedPlan> parse_plan_text(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return plan_error(std::string("Plan is not valid JSON: ") + e.what(), "plan_parse_failed");
    }
    return parse_plan(document);
}

core::errors::Result<LoadedPlan> load_plan(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return HiveError{ErrorKind::Input, "Plan file does not exist: " + path.string(),
                         "plan_not_found"};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return HiveError{ErrorKind::Input, "Unable to open plan file: " + path.string(),
                         "plan_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_plan_text(buffer.str());
}

void register_responses(const LoadedPlan& plan, ScriptedModelClient& model) {
    for (const auto& response : plan.responses) {
        model.add_reply(protocol::task_marker(response.task_key), response.content,
                        response.fail_attempts);
    }
    if (plan.default_response.has_value()) {
        model.set_default_reply(*plan.default_response);
    }
}

}  // namespace hive::runtime
