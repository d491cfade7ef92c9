#include "session/event_log_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <utility>

namespace helm::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json plan_to_json(const protocol::Plan& plan) {
    return {{"summary", plan.summary}, {"steps", plan.steps}, {"tool_budget", plan.tool_budget}};
}

struct PayloadVisitor {
    json operator()(const protocol::TurnStartEvent& event) const {
        return {{"turn_id", event.turn_id}, {"user_message", event.user_message}};
    }
    json operator()(const protocol::ModelCallEvent& event) const {
        return {{"provider", event.provider},
                {"model", event.model},
                {"stage", event.stage},
                {"iteration", event.iteration}};
    }
    json operator()(const protocol::ThoughtEvent& event) const {
        return {{"content", event.content}};
    }
    json operator()(const protocol::ToolStartEvent& event) const {
        return {{"call_id", event.call_id},
                {"tool", event.tool},
                {"input", event.input},
                {"reason", event.reason}};
    }
    json operator()(const protocol::ToolEndEvent& event) const {
        return {{"call_id", event.call_id},
                {"tool", event.tool},
                {"result_chars", event.result_chars},
                {"failed", event.failed}};
    }
    json operator()(const protocol::PlanEvent& event) const {
        return plan_to_json(event.plan);
    }
    json operator()(const protocol::ReplanEvent& event) const {
        json payload = plan_to_json(event.plan);
        payload["previous_budget"] = event.previous_budget;
        return payload;
    }
    json operator()(const protocol::PolicyEvent& event) const {
        return {{"policy", event.policy_name}, {"detail", event.detail}};
    }
    json operator()(const protocol::CheckpointEvent& event) const {
        return {{"iteration", event.iteration}, {"approved", event.approved}};
    }
    json operator()(const protocol::CompactionEvent& event) const {
        return {{"before_messages", event.before_messages},
                {"after_messages", event.after_messages},
                {"used_fallback", event.used_fallback}};
    }
    json operator()(const protocol::TurnEndEvent& event) const {
        return {{"turn_id", event.turn_id}, {"state", event.state}};
    }
};

}  // namespace

json event_to_json(const protocol::AgentEvent& event) {
    json line;
    line["ts_unix_ms"] = now_unix_ms();
    line["event"] = protocol::event_name(event);
    line["payload"] = std::visit(PayloadVisitor{}, event);
    return line;
}

EventLogWriter::EventLogWriter(std::filesystem::path workspace_root,
                               std::filesystem::path log_subdir)
    : workspace_root_(std::move(workspace_root)), log_subdir_(std::move(log_subdir)) {}

core::errors::Result<std::filesystem::path> EventLogWriter::turn_log_path(
    const std::string& turn_id) const {
    if (turn_id.empty()) {
        return AgentError{ErrorCategory::Input, "Turn ID cannot be empty.", "invalid_turn_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Workspace root is not a directory: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " + workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto log_dir = canonical_root / log_subdir_;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create event log directory: " + log_dir.string(),
                          "event_log_dir_create_failed"};
    }
    return log_dir / (turn_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> EventLogWriter::append_line(
    const std::string& turn_id, const std::string& line) const {
    auto path_result = turn_log_path(turn_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal, "Unable to open event log: " + path.string(),
                          "event_log_open_failed"};
    }
    out << line << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal, "Unable to write event log: " + path.string(),
                          "event_log_write_failed"};
    }
    return path;
}

core::errors::Result<std::filesystem::path> EventLogWriter::write_event(
    const std::string& turn_id, const protocol::AgentEvent& event) const {
    json line = event_to_json(event);
    line["turn_id"] = turn_id;
    return append_line(turn_id, line.dump(-1, ' ', false, json::error_handler_t::replace));
}

}  // namespace helm::session
