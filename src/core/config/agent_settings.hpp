#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace helm::core::config {

enum class PlanningMode {
    Off,
    Auto,
    Always
};

enum class NativeFormat {
    OpenAI,
    Anthropic
};

struct ProviderSettings {
    std::string base_url = "https://api.openai.com/v1";
    std::string model = "gpt-4o-mini";
    std::string api_key;
    std::uint32_t timeout_ms = 120000;
};

struct AgentSettings {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool auto_approve = false;
    bool native_tools = false;
    NativeFormat native_format = NativeFormat::OpenAI;
    PlanningMode planning = PlanningMode::Auto;

    // Hard cap on model requests per turn; the checkpoint gate asks the
    // approval callback every checkpoint_interval iterations below it.
    std::uint32_t max_iterations = 40;
    std::uint32_t checkpoint_interval = 20;

    std::size_t preserve_recent = 12;
    std::size_t auto_compact_threshold = 80;
    std::uint32_t shell_timeout_ms = 60000;
    bool log_events = false;

    // Skills enabled from the start, and extra directories searched for SKILL.md.
    std::vector<std::string> skills;
    std::vector<std::filesystem::path> skill_dirs;

    ProviderSettings provider;
};

// Applies HELM_* environment overrides on top of the given settings.
errors::Result<AgentSettings> apply_environment(AgentSettings settings);

errors::Result<PlanningMode> parse_planning_mode(const std::string& text);
errors::Result<NativeFormat> parse_native_format(const std::string& text);
std::string to_string(PlanningMode mode);
std::string to_string(NativeFormat format);

}  // namespace helm::core::config
