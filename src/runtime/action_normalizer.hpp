#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/agent_settings.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/message_contract.hpp"

namespace helm::runtime {

struct ParsedAction {
    protocol::Action action;
    // Name of the strategy that produced the action ("whole_text",
    // "fenced_block", "balanced_object", "tool_use_pattern" or "raw_text").
    std::string strategy;
    // Strategies tried and rejected before the winning one.
    std::size_t fallback_attempts = 0;
};

// First JSON object found by the whole-text, fenced-block and balanced-brace
// strategies, in that order. Shared with the planner.
std::optional<nlohmann::json> extract_json_object(const std::string& text);

// Never fails: text that matches no strategy becomes a FinalAction.
ParsedAction parse_model_action_detailed(const std::string& text);
protocol::Action parse_model_action(const std::string& text);

protocol::Action parse_native_response(const nlohmann::json& response,
                                       core::config::NativeFormat format);

struct BuildMessagesOptions {
    std::string system_prompt;
    std::string prompt;
    core::config::NativeFormat format = core::config::NativeFormat::OpenAI;
};

nlohmann::json build_messages(const protocol::ConversationHistory& history,
                              const BuildMessagesOptions& options);

// Legacy text encodings stored in Message::content next to the structured fields.
std::string encode_tool_use_content(const protocol::ToolCall& call,
                                    const std::string& reason);
std::string encode_tool_result_content(const protocol::ToolResultRecord& record);
std::string encode_thought_content(const std::string& content);

protocol::Message make_tool_call_message(const protocol::ToolCall& call,
                                         const std::string& reason);
protocol::Message make_tool_result_message(const protocol::ToolResultRecord& record);

// Fills tool_call/tool_result from a legacy content payload when the
// structured fields are missing. Returns the message unchanged otherwise.
protocol::Message upgrade_legacy_message(protocol::Message message);

}  // namespace helm::runtime
