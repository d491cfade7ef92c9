#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace helm::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool is_separator(const std::string& command, const std::size_t i, std::size_t& width) {
    const char c = command[i];
    if (c == ';' || c == '\n' || c == '`' || c == '(' || c == ')') {
        width = 1;
        return true;
    }
    if (c == '&' || c == '|') {
        width = (i + 1 < command.size() && command[i + 1] == c) ? 2 : 1;
        return true;
    }
    return false;
}

std::string first_program(const std::string& segment) {
    std::size_t pos = 0;
    while (pos < segment.size()) {
        while (pos < segment.size() && std::isspace(static_cast<unsigned char>(segment[pos]))) {
            ++pos;
        }
        const std::size_t start = pos;
        while (pos < segment.size() && !std::isspace(static_cast<unsigned char>(segment[pos]))) {
            ++pos;
        }
        std::string word = segment.substr(start, pos - start);
        if (word.empty()) {
            return "";
        }
        if (word.find('=') != std::string::npos && word.front() != '=') {
            continue;
        }
        const auto slash = word.find_last_of('/');
        return slash == std::string::npos ? word : word.substr(slash + 1);
    }
    return "";
}

AgentError blocked(const std::string& what, const std::string& reason) {
    return AgentError{ErrorCategory::Policy,
                      "Command contains blocked operation: " + what + " (" + reason + ")",
                      "blocked_command", "Ask the user to run this command manually."};
}

}  // namespace

std::vector<std::string> command_programs(const std::string& command) {
    std::vector<std::string> programs;
    std::size_t segment_start = 0;
    for (std::size_t i = 0; i <= command.size(); ++i) {
        std::size_t width = 0;
        if (i < command.size() && !is_separator(command, i, width)) {
            continue;
        }
        const std::string program = first_program(command.substr(segment_start, i - segment_start));
        if (!program.empty()) {
            programs.push_back(program);
        }
        i += width > 0 ? width - 1 : 0;
        segment_start = i + 1;
    }
    return programs;
}

PolicyGuard::PolicyGuard(CommandPolicy command_policy)
    : command_policy_(std::move(command_policy)) {}

core::errors::Result<std::filesystem::path> PolicyGuard::validate_path_in_workspace(
    const std::filesystem::path& workspace_root,
    const std::filesystem::path& target_path) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Workspace root is not an existing directory: " +
                              workspace_root.string(),
                          "invalid_workspace_root"};
    }
    const auto root = std::filesystem::canonical(workspace_root, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root.string(),
                          "invalid_workspace_root"};
    }

    // weakly_canonical follows symlinks in the existing prefix of the path.
    const auto resolved = std::filesystem::weakly_canonical(
        target_path.is_relative() ? root / target_path : target_path, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve target path: " + target_path.string(),
                          "invalid_path"};
    }

    const auto relative = resolved.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return AgentError{ErrorCategory::Policy,
                          "Path escapes workspace root: " + resolved.string(),
                          "path_outside_workspace",
                          "Use a path relative to the workspace root."};
    }
    return resolved;
}

core::errors::Result<std::string> PolicyGuard::check_programs(const std::string& lowered) const {
    for (const auto& program : command_programs(lowered)) {
        for (const auto& name : command_policy_.blocked_programs) {
            // "mkfs" also covers "mkfs.ext4" and friends.
            if (program == name || program.rfind(name + ".", 0) == 0) {
                return blocked(program, "privileged or destructive program");
            }
        }
    }
    return lowered;
}

core::errors::Result<std::string> PolicyGuard::validate_command(
    const std::string& command) const {
    if (command.find_first_not_of(" \t\r\n") == std::string::npos) {
        return AgentError{ErrorCategory::Input, "Command cannot be empty.", "empty_command"};
    }
    if (command.size() > command_policy_.max_command_length) {
        return AgentError{ErrorCategory::Policy,
                          "Command exceeds " +
                              std::to_string(command_policy_.max_command_length) +
                              " characters.",
                          "command_too_long", "Write long scripts to a file first."};
    }

    const std::string lowered = lowercase(command);
    auto programs = check_programs(lowered);
    if (core::errors::is_error(programs)) {
        return core::errors::get_error(programs);
    }
    for (const auto& pattern : command_policy_.blocked_patterns) {
        if (lowered.find(lowercase(pattern.needle)) != std::string::npos) {
            return blocked(pattern.needle, pattern.reason);
        }
    }
    return command;
}

}  // namespace helm::policy
