#pragma once
#include <optional>
#include <string>
#include <vector>
#include "tool_contract.hpp"

namespace helm::protocol {

    enum class Role {
        User,
        Assistant
    };

    // One canonical history entry. Structured call/result fields are filled
    // once at append time; content always carries the legacy text form too.
    struct Message {
        Role role = Role::User;
        std::string content;

        std::optional<ToolCall> tool_call;
        std::optional<ToolResultRecord> tool_result;

        // Set on the synthetic entry produced by history compaction.
        bool is_summary = false;
    };

    using ConversationHistory = std::vector<Message>;

    inline std::string to_string(const Role role) {
        return role == Role::Assistant ? "assistant" : "user";
    }

    inline bool operator==(const ToolCall& lhs, const ToolCall& rhs) {
        return lhs.id == rhs.id && lhs.name == rhs.name && lhs.input == rhs.input;
    }

    inline bool operator==(const ToolResultRecord& lhs, const ToolResultRecord& rhs) {
        return lhs.tool_call_id == rhs.tool_call_id && lhs.name == rhs.name &&
               lhs.result == rhs.result;
    }

    inline bool operator==(const Message& lhs, const Message& rhs) {
        return lhs.role == rhs.role && lhs.content == rhs.content &&
               lhs.tool_call == rhs.tool_call && lhs.tool_result == rhs.tool_result &&
               lhs.is_summary == rhs.is_summary;
    }

} // namespace helm::protocol
