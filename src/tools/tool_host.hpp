#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "tools/tool_registry.hpp"

namespace helm::tools {

struct SearchRequest {
    std::string regex;
    std::filesystem::path scope = ".";
    std::string file_pattern;
    std::size_t max_matches = 50;
    bool case_sensitive = false;
};

struct CommandRequest {
    std::string command;
    std::filesystem::path working_directory = ".";
    std::uint32_t timeout_ms = 60000;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

struct ListRequest {
    std::filesystem::path path = ".";
    std::size_t max_entries = 200;
};

// Built-in workspace tools. Every path is confined to the workspace root.
class ToolHost {
public:
    core::errors::Result<ToolOutput> read_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path) const;

    core::errors::Result<ToolOutput> write_file(
        const std::filesystem::path& workspace_root,
        const std::filesystem::path& path, const std::string& content) const;

    core::errors::Result<ToolOutput> list_files(
        const std::filesystem::path& workspace_root,
        const ListRequest& request) const;

    core::errors::Result<ToolOutput> search(
        const std::filesystem::path& workspace_root,
        const SearchRequest& request) const;

    // The child is killed on timeout or cancellation; cancellation returns task_aborted.
    core::errors::Result<ToolOutput> run_command(
        const std::filesystem::path& workspace_root,
        const CommandRequest& request) const;
};

}  // namespace helm::tools
