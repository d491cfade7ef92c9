#pragma once
#include <string>
#include <variant>

namespace helm::core::errors {

    enum class ErrorCategory {
        Input,      // E.g., an invalid CLI flag or a malformed tool input
        Execution,  // E.g., a tool or shell command failed
        Provider,   // E.g., the model endpoint timed out
        Policy,     // E.g., a path escaping the workspace
        Internal,   // E.g., a logic bug or an unexpected state
        Cancelled   // The turn was aborted; always propagates
    };

    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // A Result holds either a value of type T or an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline AgentError task_aborted(const std::string& where = "") {
        return AgentError{ErrorCategory::Cancelled,
                          where.empty() ? "Task aborted." : "Task aborted during " + where + ".",
                          "task_aborted"};
    }

    inline bool is_cancellation(const AgentError& error) {
        return error.category == ErrorCategory::Cancelled;
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Provider: return "provider";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Internal: return "internal";
            case ErrorCategory::Cancelled: return "cancelled";
            default: return "unknown";
        }
    }

} // namespace helm::core::errors
