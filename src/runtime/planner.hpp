#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config/agent_settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "protocol/plan_contract.hpp"
#include "providers/provider.hpp"

namespace helm::runtime {

struct ReplanRequest {
    std::string user_message;
    protocol::Plan previous_plan;
    // One line per executed call, e.g. "shell {\"command\":\"ls\"}".
    std::vector<std::string> tool_calls_so_far;
};

// Planning is advisory: every failure except cancellation yields "no plan".
class Planner {
public:
    explicit Planner(std::shared_ptr<providers::IProvider> provider);

    core::errors::Result<std::optional<protocol::Plan>> plan_turn(
        const std::string& user_message, const providers::CancelToken& cancel_token) const;

    // The adopted budget is at least previous_plan.tool_budget + 1.
    core::errors::Result<std::optional<protocol::Plan>> replan_turn(
        const ReplanRequest& request, const providers::CancelToken& cancel_token) const;

    static bool should_plan(const std::string& user_message, core::config::PlanningMode mode);

    // {summary, steps, toolBudget} with steps capped at eight and the budget
    // clamped to [1, 12]; std::nullopt when nothing usable was found.
    static std::optional<protocol::Plan> parse_plan(const std::string& text);

private:
    core::errors::Result<std::optional<protocol::Plan>> request_plan(
        const std::string& prompt, const std::string& stage,
        const providers::CancelToken& cancel_token) const;

    std::shared_ptr<providers::IProvider> provider_;
};

}  // namespace helm::runtime
