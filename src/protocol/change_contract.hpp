#pragma once

#include <optional>
#include <string>

namespace hive::protocol {

enum class ChangeType {
    Create,
    Modify,
    Delete
};

struct FileChange {
    std::string path;
    ChangeType type = ChangeType::Modify;
    std::optional<std::string> original_content;  // Base snapshot, absent for new files
    std::string modified_content;
};

inline std::string to_string(const ChangeType type) {
    switch (type) {
        case ChangeType::Create:
            return "create";
        case ChangeType::Modify:
            return "modify";
        case ChangeType::Delete:
            return "delete";
        default:
            return "unknown";
    }
}

inline std::optional<ChangeType> parse_change_type(const std::string& text) {
    if (text == "create") return ChangeType::Create;
    if (text == "modify") return ChangeType::Modify;
    if (text == "delete") return ChangeType::Delete;
    return std::nullopt;
}

}  // namespace hive::protocol
