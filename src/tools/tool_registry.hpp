#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/agent_settings.hpp"
#include "core/errors/agent_errors.hpp"
#include "tools/tool_id.hpp"

namespace helm::tools {

class ToolHost;
class TodoStore;

struct ToolOutput {
    std::string text;
    // Set when the call changed nothing (an identical todo list, for example).
    bool no_op = false;
};

using ApprovalCallback = std::function<bool(const std::string& kind, const std::string& details)>;

struct ToolInvocation {
    std::shared_ptr<std::atomic_bool> cancel_token;
    bool auto_approve = false;
    ApprovalCallback approve;
    std::filesystem::path workspace_root;
    std::uint32_t shell_timeout_ms = 60000;
};

// Handlers return task_aborted once the invocation's token fires; any other
// error becomes a "Tool error: ..." result for the model.
using ToolHandler = std::function<core::errors::Result<ToolOutput>(
    const nlohmann::json& input, const ToolInvocation& invocation)>;

struct ToolDefinition {
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();
};

class ToolRegistry {
public:
    void register_tool(ToolId id, ToolDefinition definition, ToolHandler handler);

    // Typed lookup: unknown or unregistered names yield std::nullopt.
    std::optional<ToolId> resolve(const std::string& name) const;
    bool contains(ToolId id) const;
    std::size_t size() const { return entries_.size(); }

    core::errors::Result<ToolOutput> invoke(ToolId id, const nlohmann::json& input,
                                            const ToolInvocation& invocation) const;

    // Native tool definitions in the provider's wire format.
    nlohmann::json definitions(core::config::NativeFormat format) const;

private:
    struct Entry {
        ToolDefinition definition;
        ToolHandler handler;
    };
    std::map<ToolId, Entry> entries_;
};

// Registers shell, read_file, write_file, list_files, search_files and todo_write.
ToolRegistry make_builtin_registry(std::shared_ptr<const ToolHost> host,
                                   std::shared_ptr<TodoStore> todos);

}  // namespace helm::tools
