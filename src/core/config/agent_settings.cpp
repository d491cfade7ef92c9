#include "core/config/agent_settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <system_error>

namespace helm::core::config {

using errors::AgentError;
using errors::ErrorCategory;
using errors::Result;

namespace {

std::optional<std::string> read_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const auto end = comma == std::string::npos ? text.size() : comma;
        std::string item = text.substr(start, end - start);
        const auto first = item.find_first_not_of(" \t");
        if (first != std::string::npos) {
            const auto last = item.find_last_not_of(" \t");
            items.push_back(item.substr(first, last - first + 1));
        }
        start = end + 1;
    }
    return items;
}

bool parse_flag(const std::string& text) {
    const std::string lowered = lowercase(text);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

Result<std::uint32_t> parse_bounded(const std::string& name, const std::string& text,
                                    const std::uint32_t min_value,
                                    const std::uint32_t max_value) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return AgentError{ErrorCategory::Input, "Invalid number in " + name + ": " + text,
                          "invalid_integer"};
    }
    if (value < min_value || value > max_value) {
        return AgentError{ErrorCategory::Input, name + " out of bounds", "bounds_error",
                          "Must be between " + std::to_string(min_value) + " and " +
                              std::to_string(max_value) + "."};
    }
    return value;
}

}  // namespace

Result<PlanningMode> parse_planning_mode(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "off") {
        return PlanningMode::Off;
    }
    if (lowered == "auto") {
        return PlanningMode::Auto;
    }
    if (lowered == "always") {
        return PlanningMode::Always;
    }
    return AgentError{ErrorCategory::Input, "Unknown planning mode: " + text,
                      "invalid_planning_mode", "Use off, auto or always."};
}

Result<NativeFormat> parse_native_format(const std::string& text) {
    const std::string lowered = lowercase(text);
    if (lowered == "openai") {
        return NativeFormat::OpenAI;
    }
    if (lowered == "anthropic") {
        return NativeFormat::Anthropic;
    }
    return AgentError{ErrorCategory::Input, "Unknown native format: " + text,
                      "invalid_native_format", "Use openai or anthropic."};
}

std::string to_string(const PlanningMode mode) {
    switch (mode) {
        case PlanningMode::Off:
            return "off";
        case PlanningMode::Auto:
            return "auto";
        case PlanningMode::Always:
            return "always";
        default:
            return "unknown";
    }
}

std::string to_string(const NativeFormat format) {
    switch (format) {
        case NativeFormat::OpenAI:
            return "openai";
        case NativeFormat::Anthropic:
            return "anthropic";
        default:
            return "unknown";
    }
}

Result<AgentSettings> apply_environment(AgentSettings settings) {
    if (auto base_url = read_env("HELM_BASE_URL")) {
        settings.provider.base_url = *base_url;
    }
    if (auto model = read_env("HELM_MODEL")) {
        settings.provider.model = *model;
    }
    if (auto key = read_env("HELM_API_KEY")) {
        settings.provider.api_key = *key;
    } else if (auto fallback_key = read_env("OPENAI_API_KEY")) {
        settings.provider.api_key = *fallback_key;
    }
    if (auto native = read_env("HELM_NATIVE_TOOLS")) {
        settings.native_tools = parse_flag(*native);
    }
    if (auto approve = read_env("HELM_AUTO_APPROVE")) {
        settings.auto_approve = parse_flag(*approve);
    }
    if (auto format = read_env("HELM_NATIVE_FORMAT")) {
        auto parsed = parse_native_format(*format);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.native_format = errors::get_value(parsed);
    }
    if (auto planning = read_env("HELM_PLANNING")) {
        auto parsed = parse_planning_mode(*planning);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.planning = errors::get_value(parsed);
    }
    if (auto max_iterations = read_env("HELM_MAX_ITERATIONS")) {
        auto parsed = parse_bounded("HELM_MAX_ITERATIONS", *max_iterations, 1, 1000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.max_iterations = errors::get_value(parsed);
    }
    if (auto checkpoint = read_env("HELM_CHECKPOINT_INTERVAL")) {
        auto parsed = parse_bounded("HELM_CHECKPOINT_INTERVAL", *checkpoint, 1, 1000);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        settings.checkpoint_interval = errors::get_value(parsed);
    }
    if (auto skills = read_env("HELM_SKILLS")) {
        settings.skills = split_list(*skills);
    }
    if (auto skill_dirs = read_env("HELM_SKILLS_DIR")) {
        for (const auto& dir : split_list(*skill_dirs)) {
            settings.skill_dirs.emplace_back(dir);
        }
    }
    return settings;
}

}  // namespace helm::core::config
