#pragma once

#include <cctype>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace helm::policy {

inline std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

// Drops a leading "cd <workspace> &&" (or "cd . &&"), which changes nothing
// since commands already run in the workspace.
inline std::string strip_workspace_cd(const std::string& command,
                                      const std::filesystem::path& workspace_root) {
    if (command.rfind("cd ", 0) != 0) {
        return command;
    }
    const auto chain = command.find(" && ");
    if (chain == std::string::npos) {
        return command;
    }
    std::string target = command.substr(3, chain - 3);
    if (target.size() >= 2 && (target.front() == '"' || target.front() == '\'') &&
        target.back() == target.front()) {
        target = target.substr(1, target.size() - 2);
    }
    while (target.size() > 1 && target.back() == '/') {
        target.pop_back();
    }
    std::string root = workspace_root.string();
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }
    if (target == "." || (!root.empty() && target == root)) {
        return command.substr(chain + 4);
    }
    return command;
}

inline std::string normalize_shell_command(const std::string& command,
                                           const std::filesystem::path& workspace_root) {
    return strip_workspace_cd(collapse_whitespace(command), workspace_root);
}

// The "command" field of a shell tool input, or "" when absent.
inline std::string command_from_input(const nlohmann::json& input) {
    if (!input.is_object()) {
        return "";
    }
    const auto it = input.find("command");
    if (it == input.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

}  // namespace helm::policy
