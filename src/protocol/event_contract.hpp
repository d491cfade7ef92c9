#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "plan_contract.hpp"

namespace helm::protocol {

    struct TurnStartEvent { std::string turn_id; std::string user_message; };
    struct ModelCallEvent { std::string provider; std::string model; std::string stage; int iteration = 0; };
    struct ThoughtEvent { std::string content; };
    struct ToolStartEvent { std::string call_id; std::string tool; nlohmann::json input; std::string reason; };
    struct ToolEndEvent { std::string call_id; std::string tool; std::size_t result_chars = 0; bool failed = false; };
    struct PlanEvent { Plan plan; };
    struct ReplanEvent { Plan plan; int previous_budget = 0; };
    struct PolicyEvent { std::string policy_name; std::string detail; };
    struct CheckpointEvent { int iteration = 0; bool approved = false; };
    struct CompactionEvent { std::size_t before_messages = 0; std::size_t after_messages = 0; bool used_fallback = false; };
    struct TurnEndEvent { std::string turn_id; std::string state; };

    // Fire-and-forget notifications for UI and telemetry.
    using AgentEvent = std::variant<
        TurnStartEvent,
        ModelCallEvent,
        ThoughtEvent,
        ToolStartEvent,
        ToolEndEvent,
        PlanEvent,
        ReplanEvent,
        PolicyEvent,
        CheckpointEvent,
        CompactionEvent,
        TurnEndEvent
    >;

    using EventSink = std::function<void(const AgentEvent&)>;

    inline std::string event_name(const AgentEvent& event) {
        struct Namer {
            std::string operator()(const TurnStartEvent&) const { return "turn_start"; }
            std::string operator()(const ModelCallEvent&) const { return "model_call"; }
            std::string operator()(const ThoughtEvent&) const { return "thought"; }
            std::string operator()(const ToolStartEvent&) const { return "tool_start"; }
            std::string operator()(const ToolEndEvent&) const { return "tool_end"; }
            std::string operator()(const PlanEvent&) const { return "plan"; }
            std::string operator()(const ReplanEvent&) const { return "replan"; }
            std::string operator()(const PolicyEvent&) const { return "policy"; }
            std::string operator()(const CheckpointEvent&) const { return "checkpoint"; }
            std::string operator()(const CompactionEvent&) const { return "compaction"; }
            std::string operator()(const TurnEndEvent&) const { return "turn_end"; }
        };
        return std::visit(Namer{}, event);
    }

} // namespace helm::protocol
