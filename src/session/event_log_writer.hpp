#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"

namespace helm::session {

nlohmann::json event_to_json(const protocol::AgentEvent& event);

// Appends every event of a turn as one JSON line to
// <workspace>/.helm_runs/<turn-id>.jsonl.
class EventLogWriter {
public:
    explicit EventLogWriter(std::filesystem::path workspace_root,
                            std::filesystem::path log_subdir = ".helm_runs");

    core::errors::Result<std::filesystem::path> write_event(
        const std::string& turn_id, const protocol::AgentEvent& event) const;

    core::errors::Result<std::filesystem::path> turn_log_path(
        const std::string& turn_id) const;

private:
    core::errors::Result<std::filesystem::path> append_line(
        const std::string& turn_id, const std::string& line) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path log_subdir_;
};

}  // namespace helm::session
