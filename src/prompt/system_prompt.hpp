#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "protocol/message_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/skill_contract.hpp"

namespace helm::prompt {

struct PromptInputs {
    std::filesystem::path workspace_dir;
    bool auto_approve = false;
    std::vector<protocol::Skill> active_skills;
    std::optional<protocol::Plan> active_plan;
    std::optional<std::string> project_instructions;
    bool native_tools = false;
    std::optional<protocol::TurnPolicy> turn_policy;
    // Names of connected external protocol servers, if any.
    std::vector<std::string> protocol_servers;
};

using PromptBuilder = std::function<std::string(const PromptInputs&)>;

constexpr std::size_t kMaxHistoryResultChars = 4000;
constexpr std::size_t kMaxSkillBodyChars = 6000;

std::string build_system_prompt(const PromptInputs& inputs);

// "ACTIVE PLAN:" block: summary, numbered steps (at most eight), tool budget.
std::string render_plan(const protocol::Plan& plan);

std::string format_history(const protocol::ConversationHistory& history);

}  // namespace helm::prompt
