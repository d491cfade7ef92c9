#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/tool_registry.hpp"

namespace helm::tools {

enum class TodoStatus {
    Pending,
    InProgress,
    Completed
};

struct TodoItem {
    std::string id;
    std::string content;
    TodoStatus status = TodoStatus::Pending;
};

bool operator==(const TodoItem& lhs, const TodoItem& rhs);

std::string to_string(TodoStatus status);

// Session-scoped task list behind the todo_write tool.
class TodoStore {
public:
    // Replaces the list; reports no_op when the new list equals the current one.
    core::errors::Result<ToolOutput> update(const nlohmann::json& input);

    std::vector<TodoItem> items() const;
    void clear();

private:
    static std::string render(const std::vector<TodoItem>& items);

    mutable std::mutex mutex_;
    std::vector<TodoItem> items_;
};

}  // namespace helm::tools
