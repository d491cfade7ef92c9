#include "runtime/turn_controller.hpp"

#include <exception>
#include <sstream>
#include <utility>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"
#include "policy/shell_command.hpp"
#include "policy/turn_policy.hpp"
#include "runtime/action_normalizer.hpp"

namespace helm::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::FinalAction;
using protocol::ThoughtAction;
using protocol::ToolUseAction;
using protocol::ToolUsesAction;
using protocol::UnknownAction;

namespace {

constexpr int kMaxSynthesisAttempts = 2;
constexpr std::size_t kEvidenceExcerptChars = 2000;
constexpr std::size_t kDigestExcerptChars = 600;
constexpr std::size_t kForcedFinalExcerptChars = 2000;

const char* const kSynthesisSystemPrompt =
    "Answer the user's request using only the collected evidence below. "
    "Do not call tools and do not ask to run more commands. Reply in plain text.";

std::string excerpt(const std::string& text, const std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return text.substr(0, limit) + "\n...";
}

std::string describe_call(const tools::ToolId id, const json& input) {
    if (id == tools::ToolId::Shell) {
        const std::string command = policy::command_from_input(input);
        if (!command.empty()) {
            return command;
        }
    }
    if (input.is_object()) {
        const auto path = input.find("path");
        if (path != input.end() && path->is_string() &&
            (id == tools::ToolId::ReadFile || id == tools::ToolId::WriteFile)) {
            return tools::to_string(id) + " " + path->get<std::string>();
        }
    }
    return tools::to_string(id) + " " + input.dump();
}

std::string loop_message(const std::string& tool) {
    return "Stopped: the same verified step result was repeated for `" + tool +
           "`, so running it again would not make progress. The earlier result is in the "
           "conversation above; please refine the request or tell me what to try next.";
}

std::string forced_final_text(const std::string& description, const std::string& output) {
    return "Ran `" + description + "`.\n\n" + excerpt(output, kForcedFinalExcerptChars);
}

}  // namespace

std::string to_string(const TurnState state) {
    switch (state) {
        case TurnState::Start:
            return "start";
        case TurnState::Plan:
            return "plan";
        case TurnState::RequestModel:
            return "request_model";
        case TurnState::Parse:
            return "parse";
        case TurnState::Dispatch:
            return "dispatch";
        case TurnState::Finalized:
            return "finalized";
        case TurnState::LoopDetected:
            return "loop_detected";
        case TurnState::UnknownTool:
            return "unknown_tool";
        case TurnState::PolicyViolation:
            return "policy_violation";
        case TurnState::CheckpointDeclined:
            return "checkpoint_declined";
        case TurnState::IterationCapReached:
            return "iteration_cap_reached";
        case TurnState::Aborted:
            return "aborted";
        default:
            return "unknown";
    }
}

bool is_terminal(const TurnState state) {
    switch (state) {
        case TurnState::Start:
        case TurnState::Plan:
        case TurnState::RequestModel:
        case TurnState::Parse:
        case TurnState::Dispatch:
            return false;
        default:
            return true;
    }
}

void SessionContext::set_auto_approve(const bool value) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.auto_approve = value;
}

void SessionContext::set_active_skills(std::vector<protocol::Skill> skills) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.active_skills = std::move(skills);
}

void SessionContext::set_project_instructions(std::optional<std::string> instructions) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.project_instructions = std::move(instructions);
}

SessionContext::Snapshot SessionContext::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TurnController::TurnController(core::config::AgentSettings settings, TurnControllerDeps deps)
    : settings_(std::move(settings)),
      deps_(std::move(deps)),
      planner_(deps_.provider),
      compactor_(deps_.provider) {
    if (!deps_.session) {
        deps_.session = std::make_shared<SessionContext>();
        deps_.session->set_auto_approve(settings_.auto_approve);
    }
    if (!deps_.prompt_builder) {
        deps_.prompt_builder = &prompt::build_system_prompt;
    }
    if (!deps_.tools) {
        deps_.tools = std::make_shared<tools::ToolRegistry>();
    }
}

bool TurnController::request_abort() {
    return tracker_.request_abort();
}

void TurnController::clear_history() {
    history_.clear();
}

void TurnController::set_history(protocol::ConversationHistory history) {
    history_.clear();
    history_.reserve(history.size());
    for (auto& message : history) {
        history_.push_back(upgrade_legacy_message(std::move(message)));
    }
}

void TurnController::emit(const protocol::AgentEvent& event) const {
    if (!deps_.on_event) {
        return;
    }
    try {
        deps_.on_event(event);
    } catch (const std::exception& e) {
        HELM_LOG_WARN("TurnController: event sink failed on " + protocol::event_name(event) +
                      ": " + e.what());
    }
}

bool TurnController::use_native_tools() const {
    return settings_.native_tools && deps_.provider->supports_native_tools();
}

bool TurnController::is_cancelled(const TurnContext& ctx) const {
    return ctx.token && ctx.token->load();
}

core::errors::Result<CompactionResult> TurnController::compact_history(
    const std::optional<std::size_t> preserve_recent) {
    const auto token = std::make_shared<std::atomic_bool>(false);
    auto compacted =
        compactor_.compact(history_, preserve_recent.value_or(settings_.preserve_recent), token);
    if (core::errors::is_error(compacted)) {
        return compacted;
    }
    auto& result = core::errors::get_value(compacted);
    if (result.compacted) {
        history_ = result.history;
        emit(protocol::CompactionEvent{result.before_messages, result.after_messages,
                                       result.used_fallback});
    }
    return compacted;
}

core::errors::Result<bool> TurnController::maybe_auto_compact(const providers::CancelToken& token) {
    if (settings_.auto_compact_threshold == 0 ||
        history_.size() <= settings_.auto_compact_threshold) {
        return false;
    }
    auto compacted = compactor_.compact(history_, settings_.preserve_recent, token);
    if (core::errors::is_error(compacted)) {
        return core::errors::get_error(compacted);
    }
    const auto& result = core::errors::get_value(compacted);
    if (!result.compacted) {
        return false;
    }
    HELM_LOG_INFO("TurnController: auto-compacted history " +
                  std::to_string(result.before_messages) + " -> " +
                  std::to_string(result.after_messages));
    history_ = result.history;
    emit(protocol::CompactionEvent{result.before_messages, result.after_messages,
                                   result.used_fallback});
    return true;
}

core::errors::Result<std::string> TurnController::run_turn(const std::string& user_message) {
    TurnContext ctx;
    ctx.turn_id = core::config::generate_turn_id();
    ctx.user_message = user_message;

    auto begun = tracker_.begin_turn(ctx.turn_id);
    if (core::errors::is_error(begun)) {
        return core::errors::get_error(begun);
    }
    ctx.token = core::errors::get_value(begun);
    last_turn_id_ = ctx.turn_id;
    last_plan_.reset();
    last_tool_calls_ = 0;
    core::logging::Logger::get().set_correlation_id(ctx.turn_id);
    emit(protocol::TurnStartEvent{ctx.turn_id, user_message});

    auto outcome = drive(ctx);

    last_plan_ = ctx.plan;
    last_tool_calls_ = ctx.tool_calls;
    if (core::errors::is_error(outcome)) {
        const auto& error = core::errors::get_error(outcome);
        if (core::errors::is_cancellation(error)) {
            ctx.state = TurnState::Aborted;
            static_cast<void>(tracker_.mark_cancelled(ctx.turn_id));
            HELM_LOG_INFO("TurnController: turn aborted");
        } else {
            static_cast<void>(tracker_.mark_failed(ctx.turn_id, error.message));
            HELM_LOG_ERROR("TurnController: turn failed [" + error.code + "]: " + error.message);
        }
    } else {
        static_cast<void>(tracker_.mark_completed(ctx.turn_id));
        HELM_LOG_INFO("TurnController: turn ended in state " + to_string(ctx.state));
    }
    last_state_ = ctx.state;
    emit(protocol::TurnEndEvent{ctx.turn_id, to_string(ctx.state)});
    return outcome;
}

core::errors::Result<std::string> TurnController::drive(TurnContext& ctx) {
    auto compacted = maybe_auto_compact(ctx.token);
    if (core::errors::is_error(compacted)) {
        return core::errors::get_error(compacted);
    }

    protocol::Message user;
    user.role = protocol::Role::User;
    user.content = ctx.user_message;
    history_.push_back(std::move(user));

    ctx.turn_policy = policy::detect_turn_policy(ctx.user_message);
    if (ctx.turn_policy.has_value()) {
        HELM_LOG_INFO("TurnController: turn policy " + ctx.turn_policy->name);
        emit(protocol::PolicyEvent{ctx.turn_policy->name, "detected"});
    }

    ctx.state = Planner::should_plan(ctx.user_message, settings_.planning) ? TurnState::Plan
                                                                           : TurnState::RequestModel;
    while (!is_terminal(ctx.state)) {
        if (is_cancelled(ctx)) {
            return core::errors::task_aborted();
        }

        StepResult next = TurnState::Aborted;
        switch (ctx.state) {
            case TurnState::Plan:
                next = step_plan(ctx);
                break;
            case TurnState::RequestModel:
                next = step_request_model(ctx);
                break;
            case TurnState::Parse:
                next = step_parse(ctx);
                break;
            case TurnState::Dispatch:
                next = step_dispatch(ctx);
                break;
            default:
                return AgentError{ErrorCategory::Internal,
                                  "Unexpected turn state: " + to_string(ctx.state),
                                  "invalid_turn_state"};
        }
        if (core::errors::is_error(next)) {
            return core::errors::get_error(next);
        }
        HELM_LOG_DEBUG("TurnController: " + to_string(ctx.state) + " -> " +
                       to_string(core::errors::get_value(next)));
        ctx.state = core::errors::get_value(next);
    }
    return ctx.final_text;
}

TurnController::StepResult TurnController::step_plan(TurnContext& ctx) {
    auto planned = planner_.plan_turn(ctx.user_message, ctx.token);
    if (core::errors::is_error(planned)) {
        return core::errors::get_error(planned);
    }
    ctx.plan = core::errors::get_value(planned);
    if (ctx.plan.has_value()) {
        emit(protocol::PlanEvent{ctx.plan.value()});
    } else {
        HELM_LOG_WARN("TurnController: continuing without a plan");
    }
    return TurnState::RequestModel;
}

TurnController::StepResult TurnController::step_request_model(TurnContext& ctx) {
    ctx.snapshot = deps_.session->snapshot();

    // Calls from a multi-call response run before the model is asked again.
    if (!ctx.pending.empty()) {
        ctx.current_call = ctx.pending.front();
        ctx.pending.pop_front();
        return TurnState::Dispatch;
    }
    ctx.current_call.reset();

    if (ctx.model_calls >= settings_.max_iterations) {
        return finish(ctx, TurnState::IterationCapReached,
                      "Stopped after " + std::to_string(ctx.model_calls) +
                          " model requests in this turn (iteration cap).");
    }

    if (settings_.checkpoint_interval > 0 && ctx.model_calls > 0 &&
        ctx.model_calls % settings_.checkpoint_interval == 0) {
        const std::string details = "Completed " + std::to_string(ctx.model_calls) +
                                    " iterations in this turn. Continue?";
        const bool approved = !deps_.approve || deps_.approve("continue", details);
        if (is_cancelled(ctx)) {
            return core::errors::task_aborted("checkpoint approval");
        }
        emit(protocol::CheckpointEvent{static_cast<int>(ctx.model_calls), approved});
        if (!approved) {
            return finish(ctx, TurnState::CheckpointDeclined,
                          "Stopped after " + std::to_string(ctx.model_calls) +
                              " iterations: continuing was not approved at the checkpoint.");
        }
    }

    prompt::PromptInputs inputs;
    inputs.workspace_dir = settings_.workspace_root;
    inputs.auto_approve = ctx.snapshot.auto_approve;
    inputs.active_skills = ctx.snapshot.active_skills;
    inputs.active_plan = ctx.plan;
    inputs.project_instructions = ctx.snapshot.project_instructions;
    inputs.native_tools = use_native_tools();
    inputs.turn_policy = ctx.turn_policy;

    providers::CompletionRequest request;
    request.system_prompt = deps_.prompt_builder(inputs);
    request.cancel_token = ctx.token;
    if (inputs.native_tools) {
        const auto format = deps_.provider->native_format();
        request.messages = build_messages(history_, BuildMessagesOptions{request.system_prompt, "", format});
        request.tools = deps_.tools->definitions(format);
    } else {
        request.prompt = prompt::format_history(history_);
    }

    ++ctx.model_calls;
    emit(protocol::ModelCallEvent{deps_.provider->kind(), deps_.provider->model(), "turn",
                                  static_cast<int>(ctx.model_calls)});
    auto reply = deps_.provider->complete(request);
    if (is_cancelled(ctx)) {
        return core::errors::task_aborted("model request");
    }
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    ctx.reply = core::errors::get_value(reply);
    return TurnState::Parse;
}

TurnController::StepResult TurnController::step_parse(TurnContext& ctx) {
    if (ctx.reply.is_native()) {
        ctx.action = parse_native_response(ctx.reply.native.value(),
                                           deps_.provider->native_format());
        return TurnState::Dispatch;
    }
    auto parsed = parse_model_action_detailed(ctx.reply.text);
    HELM_LOG_DEBUG("TurnController: reply parsed by " + parsed.strategy + " after " +
                   std::to_string(parsed.fallback_attempts) + " fallbacks");
    ctx.action = std::move(parsed.action);
    return TurnState::Dispatch;
}

TurnController::StepResult TurnController::step_dispatch(TurnContext& ctx) {
    if (ctx.current_call.has_value()) {
        const PendingCall pending = ctx.current_call.value();
        ctx.current_call.reset();
        return handle_tool_use(ctx, pending);
    }

    if (const auto* final_action = std::get_if<FinalAction>(&ctx.action)) {
        return finish(ctx, TurnState::Finalized, final_action->message);
    }
    if (const auto* thought = std::get_if<ThoughtAction>(&ctx.action)) {
        emit(protocol::ThoughtEvent{thought->content});
        protocol::Message message;
        message.role = protocol::Role::Assistant;
        message.content = encode_thought_content(thought->content);
        history_.push_back(std::move(message));
        return TurnState::RequestModel;
    }
    if (const auto* call = std::get_if<ToolUseAction>(&ctx.action)) {
        return handle_tool_use(ctx, PendingCall{*call, false});
    }
    if (const auto* batch = std::get_if<ToolUsesAction>(&ctx.action)) {
        if (batch->calls.empty()) {
            return finish(ctx, TurnState::Finalized, "The model returned an empty response.");
        }
        for (std::size_t i = 1; i < batch->calls.size(); ++i) {
            ctx.pending.push_back(PendingCall{batch->calls[i], true});
        }
        return handle_tool_use(ctx, PendingCall{batch->calls.front(), true});
    }
    return finish(ctx, TurnState::Finalized, "The model returned an empty response.");
}

TurnController::StepResult TurnController::handle_tool_use(TurnContext& ctx,
                                                           const PendingCall& pending) {
    const ToolUseAction& call = pending.call;
    const auto id = deps_.tools->resolve(call.tool);
    if (!id.has_value()) {
        HELM_LOG_INFO("TurnController: unknown tool " + call.tool);
        return finish(ctx, TurnState::UnknownTool, "Unknown tool: " + call.tool);
    }
    const std::string name = tools::to_string(id.value());
    const json input = call.input.is_object() ? call.input : json::object();
    const std::string signature =
        policy::tool_signature(name, input, settings_.workspace_root);

    if (ctx.turn_policy.has_value()) {
        const auto& active = ctx.turn_policy.value();
        if (active.disable_todos && id.value() == tools::ToolId::TodoWrite) {
            emit(protocol::PolicyEvent{active.name, "todo tool rejected"});
            return finish(ctx, TurnState::PolicyViolation,
                          "Todo tracking is disabled for this request (" + active.name +
                              "). Please answer directly without todo_write.");
        }
        if (!policy::is_tool_allowed(active, name)) {
            std::string allowed;
            for (const auto& tool : active.allowed_tools) {
                allowed += (allowed.empty() ? "" : ", ") + tool;
            }
            emit(protocol::PolicyEvent{active.name, "tool " + name + " rejected"});
            return finish(ctx, TurnState::PolicyViolation,
                          "Tool `" + name + "` is not allowed for this request (" + active.name +
                              "). Allowed tools: " + allowed + ".");
        }
        if (active.max_tool_calls.has_value() &&
            ctx.tool_calls >= static_cast<std::size_t>(active.max_tool_calls.value())) {
            return synthesize_from_evidence(ctx, "tool-call limit reached");
        }
        if (id.value() == tools::ToolId::Shell &&
            !policy::is_command_allowed(active, policy::command_from_input(input))) {
            emit(protocol::PolicyEvent{active.name,
                                       "command outside allowed prefixes: " +
                                           policy::command_from_input(input)});
            return synthesize_from_evidence(ctx, "command outside the allowed set");
        }
        if (ctx.tool_calls > 0 && signature == ctx.guard.last_signature()) {
            return synthesize_from_evidence(ctx, "repeated call");
        }
    }

    const std::string call_id = call.call_id.empty() ? core::config::generate_id("call") : call.call_id;

    if (pending.from_batch && ctx.guard.was_executed(signature)) {
        HELM_LOG_INFO("TurnController: skipping duplicate batch call to " + name);
        record_pair(protocol::ToolCall{call_id, name, input}, call.reason,
                    "Skipped duplicate call: an identical " + name +
                        " call already ran in this turn; its result is above.");
        return TurnState::RequestModel;
    }

    if (ctx.guard.classify(signature) == policy::CallVerdict::DefiniteLoop) {
        HELM_LOG_INFO("TurnController: consecutive loop on " + name);
        return finish(ctx, TurnState::LoopDetected, loop_message(name));
    }

    HELM_LOG_INFO("TurnController: dispatching " + name);
    emit(protocol::ToolStartEvent{call_id, name, input, call.reason});
    history_.push_back(make_tool_call_message(protocol::ToolCall{call_id, name, input}, call.reason));

    tools::ToolInvocation invocation;
    invocation.cancel_token = ctx.token;
    invocation.auto_approve = ctx.snapshot.auto_approve;
    invocation.approve = deps_.approve;
    invocation.workspace_root = settings_.workspace_root;
    invocation.shell_timeout_ms = settings_.shell_timeout_ms;

    tools::ToolOutput output;
    bool failed = false;
    try {
        auto result = deps_.tools->invoke(id.value(), input, invocation);
        if (is_cancelled(ctx)) {
            return core::errors::task_aborted("tool " + name);
        }
        if (core::errors::is_error(result)) {
            const auto& error = core::errors::get_error(result);
            if (core::errors::is_cancellation(error)) {
                return error;
            }
            output.text = "Tool error: " + error.message;
            failed = true;
        } else {
            output = core::errors::get_value(result);
        }
    } catch (const std::exception& e) {
        if (is_cancelled(ctx)) {
            return core::errors::task_aborted("tool " + name);
        }
        output.text = std::string("Tool error: ") + e.what();
        failed = true;
    }

    history_.push_back(make_tool_result_message(protocol::ToolResultRecord{call_id, name, output.text}));
    emit(protocol::ToolEndEvent{call_id, name, output.text.size(), failed});
    ++ctx.tool_calls;
    ctx.call_log.push_back(name + " " + input.dump());
    ctx.evidence.push_back(Evidence{name, describe_call(id.value(), input), output.text});

    return after_tool_result(ctx, id.value(), ToolUseAction{name, input, call.reason, call.thought, call_id},
                             signature, output);
}

TurnController::StepResult TurnController::after_tool_result(TurnContext& ctx,
                                                             const tools::ToolId id,
                                                             const ToolUseAction& call,
                                                             const std::string& signature,
                                                             const tools::ToolOutput& output) {
    if (id == tools::ToolId::TodoWrite && output.no_op && ctx.guard.record_todo_noop()) {
        return finish(ctx, TurnState::LoopDetected,
                      "Todo list is already up to date. Tell me the concrete next step you want "
                      "me to take.");
    }

    if (ctx.guard.record_outcome(signature, output.text) == policy::OutcomeVerdict::RepeatedOutcome) {
        HELM_LOG_INFO("TurnController: repeated outcome for " + call.tool);
        return finish(ctx, TurnState::LoopDetected, loop_message(call.tool));
    }

    const std::string description = describe_call(id, call.input);
    if (id == tools::ToolId::Shell &&
        policy::is_terminal_git_command(policy::command_from_input(call.input))) {
        return finish(ctx, TurnState::Finalized, forced_final_text(description, output.text));
    }

    if (ctx.turn_policy.has_value() && ctx.turn_policy->max_tool_calls.has_value()) {
        const auto& active = ctx.turn_policy.value();
        const auto ceiling = static_cast<std::size_t>(active.max_tool_calls.value());
        if (ctx.tool_calls >= ceiling) {
            if (active.force_finalize_after_tool) {
                return finish(ctx, TurnState::Finalized, forced_final_text(description, output.text));
            }
            if (!ctx.ceiling_notice_sent) {
                ctx.ceiling_notice_sent = true;
                protocol::Message notice;
                notice.role = protocol::Role::User;
                notice.content = "Tool-call limit for this request reached (" +
                                 std::to_string(ceiling) +
                                 "). Answer now using the evidence above without calling more tools.";
                if (active.require_commit_message) {
                    notice.content += " Include a suggested commit message.";
                }
                history_.push_back(std::move(notice));
            }
        }
    }

    if (ctx.plan.has_value() && !ctx.replanned &&
        ctx.tool_calls >= static_cast<std::size_t>(ctx.plan->tool_budget)) {
        ctx.replanned = true;
        const int previous_budget = ctx.plan->tool_budget;
        auto revised = planner_.replan_turn(
            ReplanRequest{ctx.user_message, ctx.plan.value(), ctx.call_log}, ctx.token);
        if (core::errors::is_error(revised)) {
            return core::errors::get_error(revised);
        }
        const auto& plan = core::errors::get_value(revised);
        if (plan.has_value()) {
            ctx.plan = plan;
            emit(protocol::ReplanEvent{plan.value(), previous_budget});
            HELM_LOG_INFO("TurnController: replanned, budget " + std::to_string(previous_budget) +
                          " -> " + std::to_string(plan->tool_budget));
        } else {
            HELM_LOG_WARN("TurnController: replan failed, keeping the current plan");
        }
    }

    return TurnState::RequestModel;
}

TurnController::StepResult TurnController::synthesize_from_evidence(TurnContext& ctx,
                                                                    const std::string& reason) {
    const std::string policy_name = ctx.turn_policy.has_value() ? ctx.turn_policy->name : "";
    const bool wants_commit_message =
        ctx.turn_policy.has_value() && ctx.turn_policy->require_commit_message;
    emit(protocol::PolicyEvent{policy_name, "answering from evidence: " + reason});
    HELM_LOG_INFO("TurnController: answering from evidence (" + reason + ")");

    std::ostringstream prompt;
    prompt << "User request:\n" << ctx.user_message << "\n\nCollected evidence:\n";
    if (ctx.evidence.empty()) {
        prompt << "(none)\n";
    }
    for (const auto& item : ctx.evidence) {
        prompt << "- " << item.description << ":\n" << excerpt(item.result, kEvidenceExcerptChars)
               << "\n";
    }
    if (wants_commit_message) {
        prompt << "\nInclude a suggested commit message.";
    }

    for (int attempt = 1; attempt <= kMaxSynthesisAttempts; ++attempt) {
        providers::CompletionRequest request;
        request.system_prompt = kSynthesisSystemPrompt;
        request.prompt = prompt.str();
        request.cancel_token = ctx.token;

        emit(protocol::ModelCallEvent{deps_.provider->kind(), deps_.provider->model(), "synthesis",
                                      attempt});
        auto reply = deps_.provider->complete(request);
        if (is_cancelled(ctx)) {
            return core::errors::task_aborted("evidence synthesis");
        }
        if (core::errors::is_error(reply)) {
            const auto& error = core::errors::get_error(reply);
            if (core::errors::is_cancellation(error)) {
                return error;
            }
            HELM_LOG_WARN("TurnController: synthesis attempt " + std::to_string(attempt) +
                          " failed [" + error.code + "]: " + error.message);
            continue;
        }

        const auto& value = core::errors::get_value(reply);
        const protocol::Action action =
            value.is_native()
                ? parse_native_response(value.native.value(), deps_.provider->native_format())
                : parse_model_action(value.text);
        const auto* final_action = std::get_if<FinalAction>(&action);
        if (final_action != nullptr &&
            final_action->message.find_first_not_of(" \t\r\n") != std::string::npos) {
            return finish(ctx, TurnState::Finalized, final_action->message);
        }
        HELM_LOG_WARN("TurnController: synthesis attempt " + std::to_string(attempt) +
                      " returned no usable answer");
    }

    std::ostringstream digest;
    digest << "Answer based on collected evidence (" << reason << "):";
    if (ctx.evidence.empty()) {
        digest << "\n\nNo tool output was collected for this request.";
    }
    for (const auto& item : ctx.evidence) {
        digest << "\n\nRan `" << item.description << "`:\n"
               << excerpt(item.result, kDigestExcerptChars);
    }
    if (wants_commit_message) {
        digest << "\n\nSuggested commit message:\n\n    Update files summarized above";
    }
    return finish(ctx, TurnState::Finalized, digest.str());
}

TurnController::StepResult TurnController::finish(TurnContext& ctx, const TurnState state,
                                                  const std::string& text) {
    protocol::Message message;
    message.role = protocol::Role::Assistant;
    message.content = text;
    history_.push_back(std::move(message));
    ctx.final_text = text;
    return state;
}

void TurnController::record_pair(const protocol::ToolCall& call, const std::string& reason,
                                 const std::string& result) {
    history_.push_back(make_tool_call_message(call, reason));
    history_.push_back(make_tool_result_message(protocol::ToolResultRecord{call.id, call.name, result}));
}

}  // namespace helm::runtime
