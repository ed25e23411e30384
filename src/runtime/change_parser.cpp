#include "runtime/change_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace hive::runtime {

using nlohmann::json;
using protocol::ChangeType;
using protocol::FileChange;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

ChangeType infer_change_type(const std::string& word) {
    const std::string lower = lowercase(word);
    if (lower.find("create") != std::string::npos || lower.find("add") != std::string::npos ||
        lower.find("new") != std::string::npos) {
        return ChangeType::Create;
    }
    if (lower.find("delete") != std::string::npos || lower.find("remove") != std::string::npos) {
        return ChangeType::Delete;
    }
    return ChangeType::Modify;
}

bool looks_like_path(const std::string& text) {
    return !text.empty() && text.find(' ') == std::string::npos &&
           (text.find('/') != std::string::npos || text.find('.') != std::string::npos);
}

void upsert(std::vector<FileChange>& changes, FileChange change) {
    auto existing = std::find_if(changes.begin(), changes.end(),
                                 [&change](const FileChange& c) { return c.path == change.path; });
    if (existing != changes.end()) {
        *existing = std::move(change);
    } else {
        changes.push_back(std::move(change));
    }
}

std::vector<FileChange> parse_json_block(const std::string& output) {
    std::vector<FileChange> changes;
    const auto open = output.find("```json");
    if (open == std::string::npos) {
        return changes;
    }
    const auto body_start = output.find('\n', open);
    if (body_start == std::string::npos) {
        return changes;
    }
    const auto close = output.find("```", body_start + 1);
    if (close == std::string::npos) {
        return changes;
    }

    json parsed;
    try {
        parsed = json::parse(output.substr(body_start + 1, close - body_start - 1));
    } catch (const json::parse_error& e) {
        LOG_DEBUG(std::string("ChangeParser: json block is not valid JSON: ") + e.what());
        return changes;
    }

    const json* files = nullptr;
    if (parsed.is_array()) {
        files = &parsed;
    } else if (parsed.is_object() && parsed.contains("files") && parsed["files"].is_array()) {
        files = &parsed["files"];
    } else if (parsed.is_object() && parsed.contains("fileChanges") &&
               parsed["fileChanges"].is_array()) {
        files = &parsed["fileChanges"];
    }
    if (files == nullptr) {
        return changes;
    }

    for (const auto& entry : *files) {
        if (!entry.is_object()) {
            continue;
        }
        FileChange change;
        for (const char* key : {"path", "filePath", "file"}) {
            if (entry.contains(key) && entry[key].is_string()) {
                change.path = entry[key].get<std::string>();
                break;
            }
        }
        for (const char* key : {"content", "modifiedContent", "newContent", "code"}) {
            if (entry.contains(key) && entry[key].is_string()) {
                change.modified_content = entry[key].get<std::string>();
                break;
            }
        }
        for (const char* key : {"type", "changeType", "action"}) {
            if (entry.contains(key) && entry[key].is_string()) {
                change.type = infer_change_type(entry[key].get<std::string>());
                break;
            }
        }
        if (!change.path.empty()) {
            upsert(changes, std::move(change));
        }
    }
    return changes;
}

// "File: x", "Path: x", "<!-- file: x -->", "### Create: x" and friends.
std::optional<std::pair<std::string, ChangeType>> parse_path_header(const std::string& line) {
    std::string text = trim(line);
    if (text.rfind("<!--", 0) == 0) {
        const auto end = text.find("-->");
        text = trim(text.substr(4, end == std::string::npos ? std::string::npos : end - 4));
    }
    while (!text.empty() && (text.front() == '#' || text.front() == '*')) {
        text.erase(0, 1);
    }
    text = trim(text);
    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    const std::string label = lowercase(trim(text.substr(0, colon)));
    static const std::vector<std::string> labels = {"file", "path", "create", "modify",
                                                    "update", "delete", "remove", "new file"};
    if (std::find(labels.begin(), labels.end(), label) == labels.end()) {
        return std::nullopt;
    }
    std::string path = trim(text.substr(colon + 1));
    while (!path.empty() && (path.back() == '*' || path.back() == '`')) {
        path.pop_back();
    }
    while (!path.empty() && path.front() == '`') {
        path.erase(0, 1);
    }
    if (path.empty()) {
        return std::nullopt;
    }
    return std::make_pair(path, infer_change_type(label));
}

}  // namespace

std::vector<FileChange> parse_file_changes(const std::string& output) {
    auto changes = parse_json_block(output);
    if (!changes.empty()) {
        return changes;
    }

    std::istringstream in(output);
    std::string line;
    std::optional<std::pair<std::string, ChangeType>> pending;

    while (std::getline(in, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.rfind("```", 0) != 0) {
            if (trimmed.empty()) {
                continue;
            }
            auto header = parse_path_header(trimmed);
            if (header.has_value() && header->second == ChangeType::Delete) {
                FileChange change;
                change.path = header->first;
                change.type = ChangeType::Delete;
                upsert(changes, std::move(change));
                pending.reset();
            } else {
                pending = header;
            }
            continue;
        }

        // Fence opening: ```lang:path, ```lang path, ```path or bare ```
        const std::string info = trim(trimmed.substr(3));
        std::optional<std::string> path;
        ChangeType type = ChangeType::Modify;
        const auto colon = info.find(':');
        const auto space = info.find(' ');
        if (colon != std::string::npos) {
            path = trim(info.substr(colon + 1));
        } else if (space != std::string::npos && looks_like_path(trim(info.substr(space + 1)))) {
            path = trim(info.substr(space + 1));
        } else if (pending.has_value()) {
            path = pending->first;
            type = pending->second;
        } else if (looks_like_path(info)) {
            path = info;
        }
        pending.reset();

        std::string body;
        bool closed = false;
        while (std::getline(in, line)) {
            if (trim(line) == "```") {
                closed = true;
                break;
            }
            body += line;
            body.push_back('\n');
        }
        if (!closed || !path.has_value() || path->empty()) {
            continue;
        }

        FileChange change;
        change.path = *path;
        change.type = type;
        change.modified_content = body;
        upsert(changes, std::move(change));
    }

    if (changes.empty()) {
        LOG_DEBUG("ChangeParser: no file changes detected in output");
    }
    return changes;
}

}  // namespace hive::runtime
