#pragma once
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace helm::protocol {

    struct FinalAction {
        std::string message;
    };

    struct ThoughtAction {
        std::string content;
    };

    struct ToolUseAction {
        std::string tool;
        nlohmann::json input = nlohmann::json::object();
        std::string reason;
        std::string thought;
        std::string call_id;
    };

    // Several calls emitted by the provider in a single response.
    struct ToolUsesAction {
        std::vector<ToolUseAction> calls;
    };

    struct UnknownAction {
        std::string raw;
    };

    // The canonical "what the model wants next", independent of wire format.
    using Action = std::variant<
        FinalAction,
        ThoughtAction,
        ToolUseAction,
        ToolUsesAction,
        UnknownAction
    >;

} // namespace helm::protocol
