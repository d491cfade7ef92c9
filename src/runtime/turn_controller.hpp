#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/config/agent_settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "policy/loop_guard.hpp"
#include "prompt/system_prompt.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/plan_contract.hpp"
#include "protocol/skill_contract.hpp"
#include "providers/provider.hpp"
#include "runtime/history_compactor.hpp"
#include "runtime/planner.hpp"
#include "session/turn_tracker.hpp"
#include "tools/tool_registry.hpp"

namespace helm::runtime {

enum class TurnState {
    Start,
    Plan,
    RequestModel,
    Parse,
    Dispatch,
    // Terminal states.
    Finalized,
    LoopDetected,
    UnknownTool,
    PolicyViolation,
    CheckpointDeclined,
    IterationCapReached,
    Aborted
};

std::string to_string(TurnState state);
bool is_terminal(TurnState state);

// Live session values (approval mode, skills, project instructions). The
// controller takes a snapshot at the top of every iteration.
class SessionContext {
public:
    struct Snapshot {
        bool auto_approve = false;
        std::vector<protocol::Skill> active_skills;
        std::optional<std::string> project_instructions;
    };

    void set_auto_approve(bool value);
    void set_active_skills(std::vector<protocol::Skill> skills);
    void set_project_instructions(std::optional<std::string> instructions);
    Snapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    Snapshot state_;
};

struct TurnControllerDeps {
    std::shared_ptr<providers::IProvider> provider;
    std::shared_ptr<const tools::ToolRegistry> tools;
    std::shared_ptr<SessionContext> session;
    // Defaults to prompt::build_system_prompt.
    prompt::PromptBuilder prompt_builder;
    // Asked for shell commands and at iteration checkpoints ("continue").
    tools::ApprovalCallback approve;
    protocol::EventSink on_event;
};

// Drives one user message to a final answer. Turns must be serialized per
// instance; request_abort() may be called from any thread.
class TurnController {
public:
    TurnController(core::config::AgentSettings settings, TurnControllerDeps deps);

    // Returns the final text, or task_aborted after request_abort(). Provider
    // failures outside planning and compaction are returned as errors.
    core::errors::Result<std::string> run_turn(const std::string& user_message);

    // Signals the running turn once; false when nothing was signalled.
    bool request_abort();

    core::errors::Result<CompactionResult> compact_history(
        std::optional<std::size_t> preserve_recent = std::nullopt);
    void clear_history();

    const protocol::ConversationHistory& history() const { return history_; }
    // Legacy entries are upgraded to the structured form on the way in.
    void set_history(protocol::ConversationHistory history);

    TurnState last_state() const { return last_state_; }
    const std::optional<protocol::Plan>& last_plan() const { return last_plan_; }
    std::size_t last_tool_calls() const { return last_tool_calls_; }
    const std::string& last_turn_id() const { return last_turn_id_; }

private:
    struct Evidence {
        std::string tool;
        std::string description;
        std::string result;
    };

    struct PendingCall {
        protocol::ToolUseAction call;
        bool from_batch = false;
    };

    struct TurnContext {
        std::string turn_id;
        std::string user_message;
        providers::CancelToken token;
        SessionContext::Snapshot snapshot;
        std::optional<protocol::TurnPolicy> turn_policy;
        std::optional<protocol::Plan> plan;
        bool replanned = false;
        policy::LoopGuard guard;
        std::deque<PendingCall> pending;
        std::optional<PendingCall> current_call;
        providers::ProviderReply reply;
        protocol::Action action;
        std::vector<Evidence> evidence;
        std::vector<std::string> call_log;
        std::size_t tool_calls = 0;
        std::size_t model_calls = 0;
        bool ceiling_notice_sent = false;
        TurnState state = TurnState::Start;
        std::string final_text;
    };

    using StepResult = core::errors::Result<TurnState>;

    core::errors::Result<std::string> drive(TurnContext& ctx);
    StepResult step_plan(TurnContext& ctx);
    StepResult step_request_model(TurnContext& ctx);
    StepResult step_parse(TurnContext& ctx);
    StepResult step_dispatch(TurnContext& ctx);
    StepResult handle_tool_use(TurnContext& ctx, const PendingCall& pending);
    StepResult after_tool_result(TurnContext& ctx, tools::ToolId id,
                                 const protocol::ToolUseAction& call,
                                 const std::string& signature,
                                 const tools::ToolOutput& output);
    StepResult synthesize_from_evidence(TurnContext& ctx, const std::string& reason);
    StepResult finish(TurnContext& ctx, TurnState state, const std::string& text);

    core::errors::Result<bool> maybe_auto_compact(const providers::CancelToken& token);
    bool use_native_tools() const;
    bool is_cancelled(const TurnContext& ctx) const;
    void emit(const protocol::AgentEvent& event) const;
    void record_pair(const protocol::ToolCall& call, const std::string& reason,
                     const std::string& result);

    core::config::AgentSettings settings_;
    TurnControllerDeps deps_;
    Planner planner_;
    HistoryCompactor compactor_;
    session::TurnTracker tracker_;

    protocol::ConversationHistory history_;
    TurnState last_state_ = TurnState::Start;
    std::optional<protocol::Plan> last_plan_;
    std::size_t last_tool_calls_ = 0;
    std::string last_turn_id_;
};

}  // namespace helm::runtime
