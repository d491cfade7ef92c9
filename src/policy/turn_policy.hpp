#pragma once

#include <optional>
#include <string>
#include "protocol/plan_contract.hpp"

namespace helm::policy {

// Recognizes narrowly scoped git requests. No match means an unconstrained turn.
std::optional<protocol::TurnPolicy> detect_turn_policy(const std::string& user_message);

// True when the policy has no prefix list, or the command starts with one of
// its prefixes and chains nothing else.
bool is_command_allowed(const protocol::TurnPolicy& policy, const std::string& command);

bool is_tool_allowed(const protocol::TurnPolicy& policy, const std::string& tool);

// "git commit" or "git push" anywhere in the command.
bool is_terminal_git_command(const std::string& command);

}  // namespace helm::policy
