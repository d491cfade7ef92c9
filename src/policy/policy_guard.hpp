#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace helm::policy {

struct BlockedPattern {
    std::string needle;
    std::string reason;
};

// Static safety net applied to every shell command, approved or not.
struct CommandPolicy {
    // Refused when they start any segment of the command line
    // ("a && sudo b" is caught as well as "sudo b").
    std::vector<std::string> blocked_programs = {
        "sudo", "su", "doas", "shutdown", "reboot", "halt", "poweroff", "mkfs"};
    // Refused anywhere in the command line.
    std::vector<BlockedPattern> blocked_patterns = {
        {"rm -rf /", "recursive delete from the filesystem root"},
        {"rm -rf ~", "recursive delete of the home directory"},
        {"dd if=", "raw device copy"},
        {":(){ :|:& };:", "fork bomb"},
        {"git push --force", "force push"},
        {"git push -f", "force push"}};
    std::size_t max_command_length = 8192;
};

class PolicyGuard {
public:
    explicit PolicyGuard(CommandPolicy command_policy = {});

    // Resolves `target_path` against the workspace and rejects anything that
    // escapes it, symlinks included. Missing trailing components are allowed.
    core::errors::Result<std::filesystem::path> validate_path_in_workspace(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& target_path) const;

    core::errors::Result<std::string> validate_command(
        const std::string& command) const;

private:
    core::errors::Result<std::string> check_programs(const std::string& lowered) const;

    CommandPolicy command_policy_;
};

// First word of each segment split on shell separators, backticks and
// parentheses, without leading VAR=value assignments or directories.
std::vector<std::string> command_programs(const std::string& command);

}  // namespace helm::policy
