#include "prompt/system_prompt.hpp"

#include <algorithm>
#include <initializer_list>
#include <sstream>
#include <nlohmann/json.hpp>
#include "runtime/action_normalizer.hpp"

namespace helm::prompt {

using nlohmann::json;

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += items[i];
    }
    return joined;
}

void append_lines(std::vector<std::string>& sections, std::initializer_list<const char*> lines) {
    for (const char* line : lines) {
        sections.emplace_back(line);
    }
}

std::string truncate_result(const std::string& result) {
    if (result.size() <= kMaxHistoryResultChars) {
        return result;
    }
    std::ostringstream out;
    out << result.substr(0, kMaxHistoryResultChars) << "\n... [truncated for context budget] "
        << "(result chars: " << result.size() << ")";
    return out.str();
}

std::optional<std::string> thought_content(const std::string& content) {
    if (content.empty() || content.front() != '{') {
        return std::nullopt;
    }
    const json parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::nullopt;
    }
    const auto type = parsed.find("type");
    const auto text = parsed.find("content");
    if (type == parsed.end() || *type != "thought" || text == parsed.end() ||
        !text->is_string()) {
        return std::nullopt;
    }
    return text->get<std::string>();
}

std::string legacy_reason(const std::string& content) {
    const json parsed = json::parse(content, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return "";
    }
    const auto reason = parsed.find("reason");
    return (reason != parsed.end() && reason->is_string()) ? reason->get<std::string>() : "";
}

}  // namespace

std::string render_plan(const protocol::Plan& plan) {
    std::ostringstream out;
    out << "ACTIVE PLAN:\n";
    if (!plan.summary.empty()) {
        out << "Summary: " << plan.summary << "\n";
    }
    const std::size_t step_count = std::min(plan.steps.size(), protocol::kMaxPlanSteps);
    for (std::size_t i = 0; i < step_count; ++i) {
        out << (i + 1) << ". " << plan.steps[i] << "\n";
    }
    out << "Tool budget: " << plan.tool_budget << "\n";
    out << "Follow this plan to complete the current task.";
    return out.str();
}

std::string build_system_prompt(const PromptInputs& inputs) {
    std::vector<std::string> sections = {
        "You are helm, a command line coding agent designed to help with software engineering tasks.",
        "Workspace root: " + inputs.workspace_dir.string(),
        std::string("Shell auto approval: ") + (inputs.auto_approve ? "ON" : "OFF")};

    append_lines(sections, {
        "CORE PRINCIPLES:",
        "- Focus on safe, secure and correct code",
        "- Keep solutions simple and focused",
        "- Maintain existing coding style",
        "- Don't make changes beyond what's requested",
        "CONVENTIONS:",
        "- Use todo_write only for genuinely multi-step work (3+ actionable steps)",
        "- Do not repeat identical todo_write payloads",
        "- Keep todo states strict: pending, in_progress, completed",
        "- Keep at most one todo in_progress at a time",
        "RULES:",
        "- Use tool calls whenever workspace state, files or commands must be verified",
        "- For purely conceptual questions, answer directly",
        "- NEVER claim file or command facts without tool verification",
        "DECISION POLICY:",
        "- Prefer the minimum number of tools needed to complete the task correctly",
        "- Start with read/list tools before shell when possible",
        "- Avoid repeating the same tool call unless new input changed",
        "- After each tool result, proceed with the next necessary step or finalize"});

    if (!inputs.native_tools) {
        append_lines(sections, {
            "RESPONSE FORMAT:",
            "You must respond with strict JSON only. Choose one of these formats:",
            "1. Final Answer (when you have all necessary information):",
            R"({"type":"final","message":"Your complete response here"})",
            "2. Tool Use (when you need to gather information or perform an action):",
            R"({"type":"tool_use","tool":"shell|read_file|write_file|list_files|search_files|todo_write","input":{...},"reason":"Why this tool is needed","thought":"Your reasoning"})",
            "3. Thought Process (when you need to explain your reasoning):",
            R"({"type":"thought","content":"Your reasoning here"})",
            "TOOL SCHEMAS:",
            "- shell: { command: string } - Run a shell command in the workspace directory",
            "- read_file: { path: string } - Read the contents of a file",
            "- write_file: { path: string, content: string } - Write content to a file",
            "- list_files: { path?: string, max_entries?: number } - List files in a directory",
            "- search_files: { regex: string, path?: string, max_results?: number } - Search file contents",
            "- todo_write: { todos: Array<{id?: string, content: string, status: 'pending'|'in_progress'|'completed'}> } - Update task tracking",
            "- todowrite: alias for todo_write",
            "CRITICAL:",
            "- Your entire response must be valid JSON",
            "- No explanatory text before or after the JSON"});
    }

    if (!inputs.protocol_servers.empty()) {
        sections.emplace_back("");
        sections.emplace_back("Connected protocol servers: " + join(inputs.protocol_servers, ", "));
    }

    if (!inputs.active_skills.empty()) {
        sections.emplace_back("");
        std::vector<std::string> names;
        for (const auto& skill : inputs.active_skills) {
            names.push_back(skill.name);
        }
        sections.emplace_back("ACTIVE SKILLS: " + join(names, ", "));
        sections.emplace_back("These skills are currently enabled and should be applied to relevant tasks.");
        for (const auto& skill : inputs.active_skills) {
            sections.emplace_back("");
            sections.emplace_back("SKILL " + skill.name + ":");
            if (skill.body.size() > kMaxSkillBodyChars) {
                sections.emplace_back(skill.body.substr(0, kMaxSkillBodyChars) +
                                      "\n... [skill truncated]");
            } else {
                sections.emplace_back(skill.body);
            }
        }
    }

    if (inputs.active_plan.has_value()) {
        sections.emplace_back("");
        sections.emplace_back(render_plan(inputs.active_plan.value()));
    }

    if (inputs.project_instructions.has_value() &&
        inputs.project_instructions->find_first_not_of(" \t\r\n") != std::string::npos) {
        sections.emplace_back("");
        sections.emplace_back("PROJECT INSTRUCTIONS:");
        sections.emplace_back(inputs.project_instructions.value());
    }

    if (inputs.turn_policy.has_value()) {
        const auto& policy = inputs.turn_policy.value();
        sections.emplace_back("");
        sections.emplace_back("TURN EXECUTION CONTRACT:");
        if (!policy.name.empty()) {
            sections.emplace_back("- Intent: " + policy.name);
        }
        if (policy.max_tool_calls.has_value()) {
            sections.emplace_back("- Maximum tool calls this turn: " +
                                  std::to_string(policy.max_tool_calls.value()));
        }
        if (policy.force_finalize_after_tool) {
            sections.emplace_back("- After the final allowed tool result, provide final answer and stop.");
        }
        if (policy.disable_todos) {
            sections.emplace_back("- Do not call todo_write/todowrite for this turn.");
        }
        if (!policy.allowed_tools.empty()) {
            sections.emplace_back("- Allowed tools for this turn: " + join(policy.allowed_tools, ", "));
        }
        if (!policy.allowed_command_prefixes.empty()) {
            sections.emplace_back("- Allowed shell commands: " +
                                  join(policy.allowed_command_prefixes, ", "));
        }
        if (!policy.note.empty()) {
            sections.emplace_back("- Note: " + policy.note);
        }
        if (policy.require_commit_message) {
            sections.emplace_back("- Final answer must include a suggested commit message.");
        }
    }

    return join(sections, "\n");
}

std::string format_history(const protocol::ConversationHistory& history) {
    std::ostringstream out;
    bool first = true;
    for (const auto& raw : history) {
        const protocol::Message message = runtime::upgrade_legacy_message(raw);
        if (!first) {
            out << "\n";
        }
        first = false;

        if (message.tool_call.has_value()) {
            const auto& call = message.tool_call.value();
            out << "ASSISTANT: Tool Use: " << call.name << "\nInput: " << call.input.dump();
            const std::string reason = legacy_reason(message.content);
            if (!reason.empty()) {
                out << "\nReason: " << reason;
            }
            continue;
        }
        if (message.tool_result.has_value()) {
            const auto& record = message.tool_result.value();
            out << "USER: Tool Result: " << record.name << "\n" << truncate_result(record.result);
            continue;
        }
        if (const auto thought = thought_content(message.content)) {
            out << "ASSISTANT: Thought: " << thought.value();
            continue;
        }
        out << (message.role == protocol::Role::Assistant ? "ASSISTANT: " : "USER: ")
            << message.content;
    }
    return out.str();
}

}  // namespace helm::prompt
