#include "tools/todo_store.hpp"

#include <sstream>

namespace helm::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

core::errors::Result<TodoStatus> parse_status(const std::string& text) {
    if (text == "pending") {
        return TodoStatus::Pending;
    }
    if (text == "in_progress") {
        return TodoStatus::InProgress;
    }
    if (text == "completed") {
        return TodoStatus::Completed;
    }
    return AgentError{ErrorCategory::Input,
                      "Invalid todo status: " + text + " (expected pending, in_progress or completed)",
                      "invalid_todo_status"};
}

}  // namespace

bool operator==(const TodoItem& lhs, const TodoItem& rhs) {
    return lhs.id == rhs.id && lhs.content == rhs.content && lhs.status == rhs.status;
}

std::string to_string(const TodoStatus status) {
    switch (status) {
        case TodoStatus::Pending:
            return "pending";
        case TodoStatus::InProgress:
            return "in_progress";
        case TodoStatus::Completed:
            return "completed";
        default:
            return "unknown";
    }
}

core::errors::Result<ToolOutput> TodoStore::update(const nlohmann::json& input) {
    if (!input.is_object() || !input.contains("todos") || !input["todos"].is_array()) {
        return AgentError{ErrorCategory::Input, "todo_write requires { todos: array }",
                          "invalid_todo_input"};
    }

    std::vector<TodoItem> next;
    int in_progress = 0;
    for (const auto& entry : input["todos"]) {
        if (!entry.is_object() || !entry.contains("content") || !entry["content"].is_string()) {
            return AgentError{ErrorCategory::Input, "Each todo needs a string content.",
                              "invalid_todo_input"};
        }
        const std::string status_text =
            entry.contains("status") && entry["status"].is_string()
                ? entry["status"].get<std::string>()
                : "pending";
        auto status = parse_status(status_text);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }

        TodoItem item;
        item.content = entry["content"].get<std::string>();
        item.status = core::errors::get_value(status);
        if (entry.contains("id") && entry["id"].is_string()) {
            item.id = entry["id"].get<std::string>();
        } else {
            item.id = std::to_string(next.size() + 1);
        }
        if (item.status == TodoStatus::InProgress) {
            ++in_progress;
        }
        next.push_back(std::move(item));
    }

    if (in_progress > 1) {
        return AgentError{ErrorCategory::Input, "At most one todo can be in_progress.",
                          "too_many_in_progress"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (next == items_) {
        return ToolOutput{"Todo list unchanged.\n" + render(items_), true};
    }
    items_ = std::move(next);
    return ToolOutput{"Todo list updated.\n" + render(items_), false};
}

std::vector<TodoItem> TodoStore::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_;
}

void TodoStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
}

std::string TodoStore::render(const std::vector<TodoItem>& items) {
    if (items.empty()) {
        return "(no todos)";
    }
    std::ostringstream out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        const char* box = item.status == TodoStatus::Completed    ? "[x]"
                          : item.status == TodoStatus::InProgress ? "[~]"
                                                                  : "[ ]";
        out << box << " " << item.content;
        if (i + 1 < items.size()) {
            out << "\n";
        }
    }
    return out.str();
}

}  // namespace helm::tools
