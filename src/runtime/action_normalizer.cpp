#include "runtime/action_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <utility>
#include <vector>
#include "tools/tool_id.hpp"

namespace helm::runtime {

using nlohmann::json;
using protocol::Action;
using protocol::FinalAction;
using protocol::ThoughtAction;
using protocol::ToolUseAction;
using protocol::ToolUsesAction;
using protocol::UnknownAction;

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::optional<json> parse_object(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    return parsed;
}

// Returns the end (exclusive) of the balanced object starting at `start`,
// skipping braces inside string literals.
std::optional<std::size_t> balanced_object_end(const std::string& text,
                                               const std::size_t start) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (std::size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
            if (depth == 0) {
                return i + 1;
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> fenced_block(const std::string& text) {
    const auto open = text.find("```");
    if (open == std::string::npos) {
        return std::nullopt;
    }
    std::size_t body = open + 3;
    while (body < text.size() && std::isalpha(static_cast<unsigned char>(text[body]))) {
        ++body;
    }
    const auto close = text.find("```", body);
    if (close == std::string::npos) {
        return std::nullopt;
    }
    return trim(text.substr(body, close - body));
}

ToolUseAction tool_use_from_json(const json& object, std::string tool) {
    ToolUseAction action;
    action.tool = std::move(tool);
    const auto input = object.find("input");
    if (input != object.end() && input->is_object()) {
        action.input = *input;
    }
    action.reason = string_field(object, "reason");
    action.thought = string_field(object, "thought");
    action.call_id = string_field(object, "_callId");
    if (action.call_id.empty()) {
        action.call_id = string_field(object, "id");
    }
    return action;
}

std::optional<Action> action_from_json(const json& object) {
    if (!object.is_object()) {
        return std::nullopt;
    }

    std::string type = lowercase(string_field(object, "type"));
    if (type.empty() && !string_field(object, "tool").empty()) {
        type = "tool_use";
    }

    if (type == "final") {
        if (object.contains("message") && object["message"].is_string()) {
            return FinalAction{object["message"].get<std::string>()};
        }
        if (object.contains("content") && object["content"].is_string()) {
            return FinalAction{object["content"].get<std::string>()};
        }
        return std::nullopt;
    }

    if (type == "thought") {
        if (object.contains("content") && object["content"].is_string()) {
            return ThoughtAction{object["content"].get<std::string>()};
        }
        return std::nullopt;
    }

    if (type == "tool_use") {
        std::string tool = string_field(object, "tool");
        if (tool.empty()) {
            return std::nullopt;
        }
        return tool_use_from_json(object, std::move(tool));
    }

    if (type == "tool_uses") {
        const auto calls = object.find("calls");
        if (calls == object.end() || !calls->is_array() || calls->empty()) {
            return std::nullopt;
        }
        ToolUsesAction batch;
        for (const auto& call : *calls) {
            if (!call.is_object() || string_field(call, "tool").empty()) {
                return std::nullopt;
            }
            batch.calls.push_back(tool_use_from_json(call, string_field(call, "tool")));
        }
        return batch;
    }

    // {"type":"read_file","input":{...}} is shorthand for a tool_use.
    if (tools::parse_tool_id(type).has_value()) {
        ToolUseAction action = tool_use_from_json(object, string_field(object, "type"));
        if (!object.contains("input")) {
            json inline_input = object;
            for (const char* reserved : {"type", "reason", "thought", "_callId", "id"}) {
                inline_input.erase(reserved);
            }
            action.input = inline_input;
        }
        return action;
    }

    return std::nullopt;
}

using Strategy = std::optional<Action> (*)(const std::string&);

std::optional<Action> from_whole_text(const std::string& text) {
    const auto parsed = parse_object(text);
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    return action_from_json(parsed.value());
}

std::optional<Action> from_fenced_block(const std::string& text) {
    const auto block = fenced_block(text);
    if (!block.has_value()) {
        return std::nullopt;
    }
    const auto parsed = parse_object(block.value());
    if (!parsed.has_value()) {
        return std::nullopt;
    }
    return action_from_json(parsed.value());
}

std::optional<Action> from_balanced_object(const std::string& text) {
    std::size_t start = text.find('{');
    while (start != std::string::npos) {
        const auto end = balanced_object_end(text, start);
        if (end.has_value()) {
            const auto parsed = parse_object(text.substr(start, end.value() - start));
            if (parsed.has_value()) {
                auto action = action_from_json(parsed.value());
                if (action.has_value()) {
                    return action;
                }
            }
        }
        start = text.find('{', start + 1);
    }
    return std::nullopt;
}

// "Tool Use: read_file ... Input: {...}", the transcript form models tend to echo.
std::optional<Action> from_tool_use_pattern(const std::string& text) {
    static const std::string kMarker = "Tool Use:";
    const auto marker = text.find(kMarker);
    if (marker == std::string::npos) {
        return std::nullopt;
    }

    std::size_t pos = marker + kMarker.size();
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    std::string name;
    while (pos < text.size()) {
        const char c = text[pos];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            break;
        }
        name.push_back(c);
        ++pos;
    }
    if (name.empty()) {
        return std::nullopt;
    }

    const auto input_marker = text.find("Input:", pos);
    if (input_marker == std::string::npos) {
        return std::nullopt;
    }
    const auto open = text.find('{', input_marker);
    if (open == std::string::npos) {
        return std::nullopt;
    }
    const auto close = balanced_object_end(text, open);
    if (!close.has_value()) {
        return std::nullopt;
    }
    const auto input = parse_object(text.substr(open, close.value() - open));
    if (!input.has_value()) {
        return std::nullopt;
    }

    ToolUseAction action;
    action.tool = name;
    action.input = input.value();
    action.reason = "Parsed from text pattern";
    return action;
}

struct NamedStrategy {
    const char* name;
    Strategy parse;
};

const std::vector<NamedStrategy>& strategies() {
    static const std::vector<NamedStrategy> kStrategies = {
        {"whole_text", &from_whole_text},
        {"fenced_block", &from_fenced_block},
        {"balanced_object", &from_balanced_object},
        {"tool_use_pattern", &from_tool_use_pattern}};
    return kStrategies;
}

std::string json_to_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::string join_text_blocks(const json& content) {
    std::string joined;
    for (const auto& block : content) {
        if (!block.is_object() || string_field(block, "type") != "text") {
            continue;
        }
        if (!joined.empty()) {
            joined += "\n";
        }
        joined += string_field(block, "text");
    }
    return joined;
}

Action collapse_calls(std::vector<ToolUseAction> calls) {
    if (calls.size() == 1) {
        return std::move(calls.front());
    }
    return ToolUsesAction{std::move(calls)};
}

Action parse_anthropic(const json& response) {
    const auto content_it = response.find("content");
    if (content_it == response.end() || !content_it->is_array()) {
        return FinalAction{""};
    }
    const json& content = *content_it;

    std::string reason;
    for (const auto& block : content) {
        if (block.is_object() && string_field(block, "type") == "text") {
            reason = string_field(block, "text");
            break;
        }
    }

    std::vector<ToolUseAction> calls;
    for (const auto& block : content) {
        if (!block.is_object() || string_field(block, "type") != "tool_use") {
            continue;
        }
        ToolUseAction call;
        call.tool = string_field(block, "name");
        if (block.contains("input") && block["input"].is_object()) {
            call.input = block["input"];
        }
        call.reason = reason;
        call.call_id = string_field(block, "id");
        calls.push_back(std::move(call));
    }
    if (!calls.empty()) {
        return collapse_calls(std::move(calls));
    }
    return FinalAction{join_text_blocks(content)};
}

Action parse_openai(const json& response) {
    const json* message = &response;
    if (response.contains("message") && response["message"].is_object()) {
        message = &response["message"];
    } else if (response.contains("choices") && response["choices"].is_array() &&
               !response["choices"].empty() && response["choices"][0].is_object() &&
               response["choices"][0].contains("message")) {
        message = &response["choices"][0]["message"];
    }

    std::string content;
    if (message->contains("content")) {
        const json& raw = (*message)["content"];
        content = raw.is_array() ? join_text_blocks(raw) : json_to_text(raw);
    }

    const auto tool_calls = message->find("tool_calls");
    if (tool_calls != message->end() && tool_calls->is_array() && !tool_calls->empty()) {
        std::vector<ToolUseAction> calls;
        for (const auto& entry : *tool_calls) {
            if (!entry.is_object()) {
                continue;
            }
            ToolUseAction call;
            call.call_id = string_field(entry, "id");
            call.reason = content;
            if (entry.contains("function") && entry["function"].is_object()) {
                const json& function = entry["function"];
                call.tool = string_field(function, "name");
                if (function.contains("arguments")) {
                    const json& arguments = function["arguments"];
                    if (arguments.is_object()) {
                        call.input = arguments;
                    } else if (arguments.is_string()) {
                        const auto parsed = parse_object(arguments.get<std::string>());
                        if (parsed.has_value()) {
                            call.input = parsed.value();
                        }
                    }
                }
            }
            calls.push_back(std::move(call));
        }
        if (!calls.empty()) {
            return collapse_calls(std::move(calls));
        }
    }
    return FinalAction{content};
}

struct EffectiveCall {
    std::string id;
    std::string name;
    json input = json::object();
};

struct EffectiveResult {
    std::string id;
    std::string name;
    std::string result;
};

std::optional<json> legacy_payload(const std::string& content) {
    const std::string text = trim(content);
    if (text.empty() || text.front() != '{') {
        return std::nullopt;
    }
    return parse_object(text);
}

bool payload_has_type(const std::optional<json>& payload, const char* type) {
    return payload.has_value() && lowercase(string_field(payload.value(), "type")) == type;
}

}  // namespace

std::optional<json> extract_json_object(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    if (auto whole = parse_object(trimmed)) {
        return whole;
    }
    if (const auto block = fenced_block(trimmed)) {
        if (auto parsed = parse_object(block.value())) {
            return parsed;
        }
    }
    std::size_t start = trimmed.find('{');
    while (start != std::string::npos) {
        const auto end = balanced_object_end(trimmed, start);
        if (end.has_value()) {
            if (auto parsed = parse_object(trimmed.substr(start, end.value() - start))) {
                return parsed;
            }
        }
        start = trimmed.find('{', start + 1);
    }
    return std::nullopt;
}

ParsedAction parse_model_action_detailed(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return ParsedAction{UnknownAction{text}, "empty", 0};
    }

    std::size_t attempts = 0;
    for (const auto& strategy : strategies()) {
        auto action = strategy.parse(trimmed);
        if (action.has_value()) {
            return ParsedAction{std::move(action.value()), strategy.name, attempts};
        }
        ++attempts;
    }
    return ParsedAction{FinalAction{trimmed}, "raw_text", attempts};
}

Action parse_model_action(const std::string& text) {
    return parse_model_action_detailed(text).action;
}

Action parse_native_response(const json& response, const core::config::NativeFormat format) {
    if (response.is_string()) {
        return FinalAction{response.get<std::string>()};
    }
    if (!response.is_object()) {
        return FinalAction{""};
    }
    if (format == core::config::NativeFormat::Anthropic) {
        return parse_anthropic(response);
    }
    return parse_openai(response);
}

json build_messages(const protocol::ConversationHistory& history,
                    const BuildMessagesOptions& options) {
    const bool anthropic = options.format == core::config::NativeFormat::Anthropic;
    json messages = json::array();
    if (!options.system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", options.system_prompt}});
    }

    for (const auto& message : history) {
        const auto payload = legacy_payload(message.content);

        std::optional<EffectiveCall> call;
        std::string reason;
        if (payload_has_type(payload, "tool_use")) {
            reason = string_field(payload.value(), "reason");
        }
        if (message.tool_call.has_value() && !message.tool_call->name.empty()) {
            call = EffectiveCall{message.tool_call->id, message.tool_call->name,
                                 message.tool_call->input};
        } else if (payload_has_type(payload, "tool_use")) {
            const json& legacy = payload.value();
            EffectiveCall recovered;
            recovered.id = string_field(legacy, "_callId");
            recovered.name = string_field(legacy, "tool");
            if (legacy.contains("input") && legacy["input"].is_object()) {
                recovered.input = legacy["input"];
            }
            if (!recovered.name.empty()) {
                call = std::move(recovered);
            }
        }

        std::optional<EffectiveResult> result;
        if (message.tool_result.has_value() && !message.tool_result->tool_call_id.empty()) {
            result = EffectiveResult{message.tool_result->tool_call_id, message.tool_result->name,
                                     message.tool_result->result};
        } else if (payload_has_type(payload, "tool_result")) {
            const json& legacy = payload.value();
            EffectiveResult recovered;
            recovered.id = string_field(legacy, "_callId");
            recovered.name = string_field(legacy, "tool");
            recovered.result = legacy.contains("result") ? json_to_text(legacy["result"]) : "";
            if (!recovered.id.empty()) {
                result = std::move(recovered);
            }
        }

        if (call.has_value()) {
            if (anthropic) {
                json blocks = json::array();
                std::string preface = reason;
                if (!payload_has_type(payload, "tool_use") && message.content != "{}") {
                    preface = message.content;
                }
                if (!preface.empty()) {
                    blocks.push_back({{"type", "text"}, {"text", preface}});
                }
                blocks.push_back({{"type", "tool_use"},
                                  {"id", call->id},
                                  {"name", call->name},
                                  {"input", call->input}});
                messages.push_back({{"role", "assistant"}, {"content", blocks}});
            } else {
                json tool_call = {{"id", call->id},
                                  {"type", "function"},
                                  {"function",
                                   {{"name", call->name}, {"arguments", call->input.dump()}}}};
                messages.push_back({{"role", "assistant"},
                                    {"content", nullptr},
                                    {"tool_calls", json::array({tool_call})}});
            }
            continue;
        }

        if (result.has_value()) {
            if (anthropic) {
                json block = {{"type", "tool_result"},
                              {"tool_use_id", result->id},
                              {"content", result->result}};
                messages.push_back({{"role", "user"}, {"content", json::array({block})}});
            } else {
                messages.push_back({{"role", "tool"},
                                    {"tool_call_id", result->id},
                                    {"content", result->result}});
            }
            continue;
        }

        messages.push_back({{"role", protocol::to_string(message.role)},
                            {"content", message.content}});
    }

    if (!options.prompt.empty()) {
        messages.push_back({{"role", "user"}, {"content", options.prompt}});
    }
    return messages;
}

std::string encode_tool_use_content(const protocol::ToolCall& call, const std::string& reason) {
    json payload = {{"type", "tool_use"},
                    {"tool", call.name},
                    {"input", call.input},
                    {"reason", reason},
                    {"_callId", call.id}};
    return payload.dump();
}

std::string encode_tool_result_content(const protocol::ToolResultRecord& record) {
    json payload = {{"type", "tool_result"},
                    {"tool", record.name},
                    {"result", record.result},
                    {"_callId", record.tool_call_id}};
    // Command output is not guaranteed to be valid UTF-8.
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string encode_thought_content(const std::string& content) {
    return json{{"type", "thought"}, {"content", content}}.dump();
}

protocol::Message make_tool_call_message(const protocol::ToolCall& call,
                                         const std::string& reason) {
    protocol::Message message;
    message.role = protocol::Role::Assistant;
    message.content = encode_tool_use_content(call, reason);
    message.tool_call = call;
    return message;
}

protocol::Message make_tool_result_message(const protocol::ToolResultRecord& record) {
    protocol::Message message;
    message.role = protocol::Role::User;
    message.content = encode_tool_result_content(record);
    message.tool_result = record;
    return message;
}

protocol::Message upgrade_legacy_message(protocol::Message message) {
    if (message.tool_call.has_value() || message.tool_result.has_value()) {
        return message;
    }
    const auto payload = legacy_payload(message.content);
    if (payload_has_type(payload, "tool_use")) {
        const json& legacy = payload.value();
        protocol::ToolCall call;
        call.id = string_field(legacy, "_callId");
        call.name = string_field(legacy, "tool");
        if (legacy.contains("input") && legacy["input"].is_object()) {
            call.input = legacy["input"];
        }
        if (!call.name.empty()) {
            message.tool_call = std::move(call);
        }
    } else if (payload_has_type(payload, "tool_result")) {
        const json& legacy = payload.value();
        const std::string id = string_field(legacy, "_callId");
        if (!id.empty()) {
            message.tool_result = protocol::ToolResultRecord{
                id, string_field(legacy, "tool"),
                legacy.contains("result") ? json_to_text(legacy["result"]) : ""};
        }
    }
    return message;
}

}  // namespace helm::runtime
