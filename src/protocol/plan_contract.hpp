#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace helm::protocol {

    constexpr std::size_t kMaxPlanSteps = 8;
    constexpr int kMinToolBudget = 1;
    constexpr int kMaxToolBudget = 12;

    // Advisory, turn-scoped plan produced by the planning call.
    struct Plan {
        std::string summary;
        std::vector<std::string> steps;
        int tool_budget = 6;
    };

    // Constrained execution contract derived from the user's request text.
    struct TurnPolicy {
        std::string name;
        std::optional<int> max_tool_calls;
        std::vector<std::string> allowed_tools;
        // Shell commands must start with one of these when non-empty.
        std::vector<std::string> allowed_command_prefixes;
        bool force_finalize_after_tool = false;
        bool disable_todos = false;
        bool require_commit_message = false;
        std::string note;
    };

} // namespace helm::protocol
