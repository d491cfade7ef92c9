#include "tools/tool_registry.hpp"

#include <algorithm>
#include <utility>
#include "tools/todo_store.hpp"
#include "tools/tool_host.hpp"

namespace helm::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxSizeArg = 100000;

AgentError invalid_input(const std::string& message) {
    return AgentError{ErrorCategory::Input, message, "invalid_tool_input"};
}

std::optional<std::string> string_arg(const json& input, const char* key) {
    if (!input.is_object()) {
        return std::nullopt;
    }
    const auto it = input.find(key);
    if (it == input.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::size_t size_arg(const json& input, const char* key, const std::size_t fallback) {
    if (!input.is_object()) {
        return fallback;
    }
    const auto it = input.find(key);
    if (it == input.end() || !it->is_number()) {
        return fallback;
    }
    const double value = it->get<double>();
    if (!(value >= 1)) {
        return fallback;
    }
    // Clamped as a double; casting an out-of-range value is undefined.
    return static_cast<std::size_t>(std::min(value, static_cast<double>(kMaxSizeArg)));
}

json string_property(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

ToolDefinition shell_definition() {
    return {"Run a shell command in the workspace directory. Returns exit code, stdout and stderr. "
            "Prefer read/list/search for information gathering.",
            {{"type", "object"},
             {"properties", {{"command", string_property("Shell command to execute")}}},
             {"required", json::array({"command"})}}};
}

ToolDefinition read_file_definition() {
    return {"Read the contents of a file at the given path (relative to workspace root).",
            {{"type", "object"},
             {"properties", {{"path", string_property("Relative path to the file")}}},
             {"required", json::array({"path"})}}};
}

ToolDefinition write_file_definition() {
    return {"Write content to a file at the given path (relative to workspace root). "
            "Creates parent directories if needed.",
            {{"type", "object"},
             {"properties",
              {{"path", string_property("Relative path to the file")},
               {"content", string_property("Content to write")}}},
             {"required", json::array({"path", "content"})}}};
}

ToolDefinition list_files_definition() {
    return {"List files and directories at the given path. Returns relative paths.",
            {{"type", "object"},
             {"properties",
              {{"path", string_property("Relative path to directory (default: current)")},
               {"max_entries",
                {{"type", "integer"}, {"description", "Maximum entries to return (default: 200)"}}}}}}};
}

ToolDefinition search_files_definition() {
    return {"Search file contents for a regular expression. Skips .git, node_modules, dist and "
            "build directories.",
            {{"type", "object"},
             {"properties",
              {{"regex", string_property("Regular expression to search for")},
               {"path", string_property("Relative path to search in (default: workspace root)")},
               {"file_pattern", string_property("Glob filter on file names, e.g. '*.cpp'")},
               {"max_results",
                {{"type", "integer"}, {"description", "Maximum results (default: 50, max: 200)"}}},
               {"case_sensitive",
                {{"type", "boolean"}, {"description", "Case-sensitive search (default: false)"}}}}},
             {"required", json::array({"regex"})}}};
}

ToolDefinition todo_write_definition() {
    json item = {{"type", "object"},
                 {"properties",
                  {{"id", {{"type", "string"}}},
                   {"content", {{"type", "string"}}},
                   {"status",
                    {{"type", "string"}, {"enum", json::array({"pending", "in_progress", "completed"})}}}}},
                 {"required", json::array({"content", "status"})}};
    return {"Update the task tracking todo list. Use to show progress on multi-step tasks.",
            {{"type", "object"},
             {"properties", {{"todos", {{"type", "array"}, {"items", item}}}}},
             {"required", json::array({"todos"})}}};
}

}  // namespace

void ToolRegistry::register_tool(const ToolId id, ToolDefinition definition, ToolHandler handler) {
    entries_[id] = Entry{std::move(definition), std::move(handler)};
}

std::optional<ToolId> ToolRegistry::resolve(const std::string& name) const {
    const auto id = parse_tool_id(name);
    if (!id.has_value() || !contains(id.value())) {
        return std::nullopt;
    }
    return id;
}

bool ToolRegistry::contains(const ToolId id) const {
    return entries_.find(id) != entries_.end();
}

core::errors::Result<ToolOutput> ToolRegistry::invoke(const ToolId id, const json& input,
                                                      const ToolInvocation& invocation) const {
    const auto it = entries_.find(id);
    if (it == entries_.end() || !it->second.handler) {
        return AgentError{ErrorCategory::Input, "Unknown tool: " + to_string(id), "unknown_tool"};
    }
    return it->second.handler(input, invocation);
}

json ToolRegistry::definitions(const core::config::NativeFormat format) const {
    json tools = json::array();
    for (const auto& [id, entry] : entries_) {
        if (format == core::config::NativeFormat::Anthropic) {
            tools.push_back({{"name", to_string(id)},
                             {"description", entry.definition.description},
                             {"input_schema", entry.definition.input_schema}});
        } else {
            tools.push_back({{"type", "function"},
                             {"function",
                              {{"name", to_string(id)},
                               {"description", entry.definition.description},
                               {"parameters", entry.definition.input_schema}}}});
        }
    }
    return tools;
}

ToolRegistry make_builtin_registry(std::shared_ptr<const ToolHost> host,
                                   std::shared_ptr<TodoStore> todos) {
    ToolRegistry registry;

    registry.register_tool(
        ToolId::Shell, shell_definition(),
        [host](const json& input, const ToolInvocation& invocation)
            -> core::errors::Result<ToolOutput> {
            const auto command = string_arg(input, "command");
            if (!command.has_value() || command->empty()) {
                return invalid_input("shell tool requires { command: string }");
            }
            if (!invocation.auto_approve) {
                const bool approved =
                    invocation.approve && invocation.approve("shell", command.value());
                if (invocation.cancel_token && invocation.cancel_token->load()) {
                    return core::errors::task_aborted("shell approval");
                }
                if (!approved) {
                    return ToolOutput{"Command was not approved by the user.", false};
                }
            }
            CommandRequest request;
            request.command = command.value();
            request.timeout_ms = invocation.shell_timeout_ms;
            request.cancel_token = invocation.cancel_token;
            return host->run_command(invocation.workspace_root, request);
        });

    registry.register_tool(
        ToolId::ReadFile, read_file_definition(),
        [host](const json& input, const ToolInvocation& invocation)
            -> core::errors::Result<ToolOutput> {
            const auto path = string_arg(input, "path");
            if (!path.has_value() || path->empty()) {
                return invalid_input("read_file tool requires { path: string }");
            }
            return host->read_file(invocation.workspace_root, path.value());
        });

    registry.register_tool(
        ToolId::WriteFile, write_file_definition(),
        [host](const json& input, const ToolInvocation& invocation)
            -> core::errors::Result<ToolOutput> {
            const auto path = string_arg(input, "path");
            const auto content = string_arg(input, "content");
            if (!path.has_value() || path->empty() || !content.has_value()) {
                return invalid_input("write_file tool requires { path: string, content: string }");
            }
            return host->write_file(invocation.workspace_root, path.value(), content.value());
        });

    registry.register_tool(
        ToolId::ListFiles, list_files_definition(),
        [host](const json& input, const ToolInvocation& invocation)
            -> core::errors::Result<ToolOutput> {
            ListRequest request;
            request.path = string_arg(input, "path").value_or(".");
            request.max_entries = size_arg(input, "max_entries", 200);
            return host->list_files(invocation.workspace_root, request);
        });

    registry.register_tool(
        ToolId::SearchFiles, search_files_definition(),
        [host](const json& input, const ToolInvocation& invocation)
            -> core::errors::Result<ToolOutput> {
            SearchRequest request;
            const auto regex = string_arg(input, "regex");
            if (!regex.has_value()) {
                return invalid_input("search_files tool requires { regex: string }");
            }
            request.regex = regex.value();
            request.scope = string_arg(input, "path").value_or(".");
            request.file_pattern = string_arg(input, "file_pattern").value_or("");
            request.max_matches = size_arg(input, "max_results", 50);
            const auto case_sensitive =
                input.is_object() ? input.find("case_sensitive") : input.end();
            request.case_sensitive = input.is_object() && case_sensitive != input.end() &&
                                     case_sensitive->is_boolean() &&
                                     case_sensitive->get<bool>();
            return host->search(invocation.workspace_root, request);
        });

    registry.register_tool(
        ToolId::TodoWrite, todo_write_definition(),
        [todos](const json& input, const ToolInvocation&) -> core::errors::Result<ToolOutput> {
            return todos->update(input);
        });

    return registry;
}

}  // namespace helm::tools
