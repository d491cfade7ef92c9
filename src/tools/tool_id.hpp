#pragma once

#include <array>
#include <optional>
#include <string>

namespace helm::tools {

// The closed set of tools the runtime can dispatch to.
enum class ToolId {
    Shell,
    ReadFile,
    WriteFile,
    ListFiles,
    SearchFiles,
    TodoWrite
};

constexpr std::array<ToolId, 6> kAllToolIds = {
    ToolId::Shell,     ToolId::ReadFile,    ToolId::WriteFile,
    ToolId::ListFiles, ToolId::SearchFiles, ToolId::TodoWrite};

inline std::string to_string(const ToolId id) {
    switch (id) {
        case ToolId::Shell:
            return "shell";
        case ToolId::ReadFile:
            return "read_file";
        case ToolId::WriteFile:
            return "write_file";
        case ToolId::ListFiles:
            return "list_files";
        case ToolId::SearchFiles:
            return "search_files";
        case ToolId::TodoWrite:
            return "todo_write";
        default:
            return "unknown";
    }
}

// Case-insensitive; accepts "todowrite" as an alias of "todo_write".
inline std::optional<ToolId> parse_tool_id(const std::string& name) {
    std::string lowered;
    lowered.reserve(name.size());
    for (const char c : name) {
        lowered.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
    }
    if (lowered == "todowrite") {
        return ToolId::TodoWrite;
    }
    for (const ToolId id : kAllToolIds) {
        if (to_string(id) == lowered) {
            return id;
        }
    }
    return std::nullopt;
}

inline bool is_todo_tool(const std::string& name) {
    const auto id = parse_tool_id(name);
    return id.has_value() && id.value() == ToolId::TodoWrite;
}

}  // namespace helm::tools
