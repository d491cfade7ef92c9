#include "policy/turn_policy.hpp"

#include <algorithm>
#include <cctype>
#include <vector>
#include "policy/shell_command.hpp"
#include "tools/tool_id.hpp"

namespace helm::policy {

using protocol::TurnPolicy;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool contains_any(const std::string& text, const std::vector<std::string>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&text](const std::string& needle) {
        return text.find(needle) != std::string::npos;
    });
}

const std::vector<std::string> kChainOperators = {"&&", "||", ";", "|", ">", "<", "`", "$("};

bool wants_commit_message(const std::string& text) {
    return contains_any(text, {"commit message", "commit msg", "commit title"});
}

bool wants_commit(const std::string& text) {
    if (text.find("git commit") != std::string::npos) {
        return true;
    }
    if (wants_commit_message(text) && text.find("and commit") == std::string::npos) {
        return false;
    }
    return contains_any(text, {"commit the", "commit my", "commit these", "commit all",
                               "commit everything", "commit changes", "commit this",
                               "make a commit", "create a commit", "and commit"});
}

bool wants_diff_summary(const std::string& text) {
    const bool mentions_changes =
        contains_any(text, {"diff", "changes", "changed", "uncommitted", "staged"});
    const bool asks_summary =
        contains_any(text, {"summar", "describe", "explain", "review", "what changed",
                            "overview", "commit message"});
    return mentions_changes && asks_summary;
}

bool wants_status(const std::string& text) {
    if (text.find("git status") != std::string::npos) {
        return true;
    }
    return text.find("status") != std::string::npos &&
           contains_any(text, {"repo", "repository", "working tree", "git", "branch"});
}

TurnPolicy git_commit_policy() {
    TurnPolicy policy;
    policy.name = "git_commit";
    policy.max_tool_calls = 6;
    policy.allowed_tools = {"shell"};
    policy.disable_todos = true;
    policy.note = "Inspect the changes, stage what was asked for and commit once.";
    return policy;
}

TurnPolicy diff_summary_policy(const bool commit_message) {
    TurnPolicy policy;
    policy.name = "repo_diff_summary";
    policy.max_tool_calls = 2;
    policy.allowed_tools = {"shell"};
    policy.allowed_command_prefixes = {"git diff", "git status", "git show", "git log"};
    policy.disable_todos = true;
    policy.force_finalize_after_tool = !commit_message;
    policy.require_commit_message = commit_message;
    policy.note = "Use read-only git commands and summarize the diff.";
    return policy;
}

TurnPolicy status_policy() {
    TurnPolicy policy;
    policy.name = "repo_status";
    policy.max_tool_calls = 1;
    policy.allowed_tools = {"shell"};
    policy.allowed_command_prefixes = {"git status", "git branch", "git log"};
    policy.force_finalize_after_tool = true;
    policy.disable_todos = true;
    policy.note = "One read-only git command is enough to answer.";
    return policy;
}

}  // namespace

std::optional<TurnPolicy> detect_turn_policy(const std::string& user_message) {
    const std::string text = lowercase(collapse_whitespace(user_message));
    if (text.empty()) {
        return std::nullopt;
    }
    if (wants_commit(text)) {
        return git_commit_policy();
    }
    if (wants_diff_summary(text)) {
        return diff_summary_policy(wants_commit_message(text));
    }
    if (wants_status(text)) {
        return status_policy();
    }
    return std::nullopt;
}

bool is_command_allowed(const TurnPolicy& policy, const std::string& command) {
    if (policy.allowed_command_prefixes.empty()) {
        return true;
    }
    const std::string normalized = collapse_whitespace(command);
    if (contains_any(normalized, kChainOperators)) {
        return false;
    }
    return std::any_of(policy.allowed_command_prefixes.begin(),
                       policy.allowed_command_prefixes.end(),
                       [&normalized](const std::string& prefix) {
                           if (normalized.rfind(prefix, 0) != 0) {
                               return false;
                           }
                           return normalized.size() == prefix.size() ||
                                  normalized[prefix.size()] == ' ';
                       });
}

bool is_tool_allowed(const TurnPolicy& policy, const std::string& tool) {
    if (policy.allowed_tools.empty()) {
        return true;
    }
    const auto id = tools::parse_tool_id(tool);
    return std::any_of(policy.allowed_tools.begin(), policy.allowed_tools.end(),
                       [&](const std::string& allowed) {
                           const auto allowed_id = tools::parse_tool_id(allowed);
                           if (id.has_value() && allowed_id.has_value()) {
                               return id.value() == allowed_id.value();
                           }
                           return allowed == tool;
                       });
}

bool is_terminal_git_command(const std::string& command) {
    const std::string normalized = lowercase(collapse_whitespace(command));
    return normalized.find("git commit") != std::string::npos ||
           normalized.find("git push") != std::string::npos;
}

}  // namespace helm::policy
