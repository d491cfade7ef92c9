#include "runtime/planner.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <sstream>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "runtime/action_normalizer.hpp"

namespace helm::runtime {

using core::errors::AgentError;
using nlohmann::json;

namespace {

const char* const kPlanningSystemPrompt =
    "You are a planning assistant for a command line coding agent. "
    "Break the user's request into concrete steps before any tool is used. "
    "Respond with strict JSON only: "
    R"({"summary":"one sentence","steps":["step 1","step 2"],"toolBudget":6}. )"
    "Use at most 8 steps. toolBudget is the number of tool calls you expect to need (1-12).";

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

bool is_cancelled(const providers::CancelToken& token) {
    return token && token->load();
}

}  // namespace

Planner::Planner(std::shared_ptr<providers::IProvider> provider)
    : provider_(std::move(provider)) {}

bool Planner::should_plan(const std::string& user_message, const core::config::PlanningMode mode) {
    if (mode == core::config::PlanningMode::Off) {
        return false;
    }
    if (mode == core::config::PlanningMode::Always) {
        return true;
    }

    static const std::vector<std::string> kComplexKeywords = {
        "analyze", "implement", "refactor", "debug",   "test",    "build",       "create",
        "design",  "develop",   "improve",  "fix",     "optimize", "restructure", "update"};
    static const std::vector<std::string> kStepIndicators = {
        "first", "then", "next", "after that", "finally", "step 1", "step 2", "step 3",
        "1.",    "2.",   "3."};

    const std::string text = lowercase(user_message);
    const auto mentions = [&text](const std::vector<std::string>& needles) {
        return std::any_of(needles.begin(), needles.end(), [&text](const std::string& needle) {
            return text.find(needle) != std::string::npos;
        });
    };
    return mentions(kComplexKeywords) || mentions(kStepIndicators) || user_message.size() > 100;
}

std::optional<protocol::Plan> Planner::parse_plan(const std::string& text) {
    const auto object = extract_json_object(text);
    if (!object.has_value()) {
        return std::nullopt;
    }
    const json& value = object.value();

    protocol::Plan plan;
    if (value.contains("summary") && value["summary"].is_string()) {
        plan.summary = trim(value["summary"].get<std::string>());
    }
    if (value.contains("steps") && value["steps"].is_array()) {
        for (const auto& step : value["steps"]) {
            if (plan.steps.size() >= protocol::kMaxPlanSteps) {
                break;
            }
            if (!step.is_string()) {
                continue;
            }
            const std::string cleaned = trim(step.get<std::string>());
            if (!cleaned.empty()) {
                plan.steps.push_back(cleaned);
            }
        }
    }
    if (plan.summary.empty() && plan.steps.empty()) {
        return std::nullopt;
    }

    for (const char* key : {"toolBudget", "tool_budget"}) {
        if (value.contains(key) && value[key].is_number()) {
            const double budget = value[key].get<double>();
            plan.tool_budget = static_cast<int>(
                std::clamp(budget, static_cast<double>(protocol::kMinToolBudget),
                           static_cast<double>(protocol::kMaxToolBudget)));
            break;
        }
    }
    return plan;
}

core::errors::Result<std::optional<protocol::Plan>> Planner::request_plan(
    const std::string& prompt, const std::string& stage,
    const providers::CancelToken& cancel_token) const {
    if (is_cancelled(cancel_token)) {
        return core::errors::task_aborted(stage);
    }

    providers::CompletionRequest request;
    request.system_prompt = kPlanningSystemPrompt;
    request.prompt = prompt;
    request.cancel_token = cancel_token;

    auto reply = provider_->complete(request);
    if (is_cancelled(cancel_token)) {
        return core::errors::task_aborted(stage);
    }
    if (core::errors::is_error(reply)) {
        const auto& error = core::errors::get_error(reply);
        if (core::errors::is_cancellation(error)) {
            return error;
        }
        HELM_LOG_WARN("Planner: " + stage + " failed [" + error.code + "]: " + error.message);
        return std::optional<protocol::Plan>{};
    }

    const auto& value = core::errors::get_value(reply);
    std::string text = value.text;
    if (value.is_native()) {
        const auto action = parse_native_response(value.native.value(), provider_->native_format());
        if (const auto* final_action = std::get_if<protocol::FinalAction>(&action)) {
            text = final_action->message;
        }
    }

    auto plan = parse_plan(text);
    if (!plan.has_value()) {
        HELM_LOG_WARN("Planner: " + stage + " reply did not contain a usable plan");
    }
    return plan;
}

core::errors::Result<std::optional<protocol::Plan>> Planner::plan_turn(
    const std::string& user_message, const providers::CancelToken& cancel_token) const {
    return request_plan("User request:\n" + user_message, "planning", cancel_token);
}

core::errors::Result<std::optional<protocol::Plan>> Planner::replan_turn(
    const ReplanRequest& request, const providers::CancelToken& cancel_token) const {
    std::ostringstream prompt;
    prompt << "User request:\n" << request.user_message << "\n\nCurrent plan:\n";
    if (!request.previous_plan.summary.empty()) {
        prompt << "Summary: " << request.previous_plan.summary << "\n";
    }
    for (std::size_t i = 0; i < request.previous_plan.steps.size(); ++i) {
        prompt << (i + 1) << ". " << request.previous_plan.steps[i] << "\n";
    }
    prompt << "Tool budget: " << request.previous_plan.tool_budget << " (exhausted)\n\n"
           << "Tool calls so far:\n";
    for (const auto& call : request.tool_calls_so_far) {
        prompt << "- " << call << "\n";
    }
    prompt << "\nRevise the remaining steps given the work already done.";

    auto revised = request_plan(prompt.str(), "replanning", cancel_token);
    if (core::errors::is_error(revised)) {
        return revised;
    }
    auto plan = core::errors::get_value(revised);
    if (plan.has_value()) {
        plan->tool_budget =
            std::max(plan->tool_budget, request.previous_plan.tool_budget + 1);
    }
    return plan;
}

}  // namespace helm::runtime
