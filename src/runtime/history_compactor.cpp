#include "runtime/history_compactor.hpp"

#include <sstream>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "prompt/system_prompt.hpp"
#include "runtime/action_normalizer.hpp"

namespace helm::runtime {

namespace {

constexpr std::size_t kExcerptChars = 500;

const char* const kCompactionSystemPrompt =
    "Summarize the earlier part of a coding-agent conversation. Keep the user's goals, "
    "decisions, file paths, commands and their key results. Plain text, at most 15 lines.";

std::string excerpt(const std::string& text) {
    if (text.size() <= kExcerptChars) {
        return text;
    }
    return text.substr(0, kExcerptChars) + "...";
}

std::string strip_marker(const std::string& content) {
    const std::string marker = kSummaryMarker;
    if (content.rfind(marker, 0) != 0) {
        return content;
    }
    const auto body = content.find_first_not_of("\n ", marker.size());
    return body == std::string::npos ? "" : content.substr(body);
}

bool is_cancelled(const providers::CancelToken& token) {
    return token && token->load();
}

}  // namespace

HistoryCompactor::HistoryCompactor(std::shared_ptr<providers::IProvider> provider)
    : provider_(std::move(provider)) {}

std::string HistoryCompactor::fallback_summary(const protocol::ConversationHistory& messages) {
    std::string last_user;
    std::string last_assistant;
    for (const auto& message : messages) {
        if (message.is_summary || message.tool_call.has_value() ||
            message.tool_result.has_value()) {
            continue;
        }
        if (message.role == protocol::Role::User) {
            last_user = message.content;
        } else {
            last_assistant = message.content;
        }
    }

    std::ostringstream out;
    out << "Earlier conversation: " << messages.size() << " messages.";
    if (!last_user.empty()) {
        out << "\nLast user request: " << excerpt(last_user);
    }
    if (!last_assistant.empty()) {
        out << "\nLast assistant reply: " << excerpt(last_assistant);
    }
    return out.str();
}

core::errors::Result<CompactionResult> HistoryCompactor::compact(
    const protocol::ConversationHistory& history, const std::size_t preserve_recent,
    const providers::CancelToken& cancel_token) const {
    CompactionResult result;
    result.before_messages = history.size();
    if (history.size() <= preserve_recent) {
        result.history = history;
        result.after_messages = history.size();
        return result;
    }

    std::size_t split = history.size() - preserve_recent;
    // Never separate a tool result from the call that produced it.
    while (split > 0 && split < history.size() && history[split].tool_result.has_value() &&
           history[split - 1].tool_call.has_value()) {
        --split;
    }
    if (split == 0) {
        result.history = history;
        result.after_messages = history.size();
        return result;
    }

    std::vector<std::string> carried;
    protocol::ConversationHistory to_summarize;
    for (std::size_t i = 0; i < split; ++i) {
        if (history[i].is_summary) {
            carried.push_back(strip_marker(history[i].content));
        } else {
            to_summarize.push_back(history[i]);
        }
    }

    std::string fresh;
    if (!to_summarize.empty()) {
        if (is_cancelled(cancel_token)) {
            return core::errors::task_aborted("history compaction");
        }
        providers::CompletionRequest request;
        request.system_prompt = kCompactionSystemPrompt;
        request.prompt = prompt::format_history(to_summarize);
        request.cancel_token = cancel_token;

        auto reply = provider_->complete(request);
        if (is_cancelled(cancel_token)) {
            return core::errors::task_aborted("history compaction");
        }
        if (core::errors::is_error(reply)) {
            const auto& error = core::errors::get_error(reply);
            if (core::errors::is_cancellation(error)) {
                return error;
            }
            HELM_LOG_WARN("HistoryCompactor: summary call failed [" + error.code + "]: " +
                          error.message);
        } else {
            const auto& value = core::errors::get_value(reply);
            fresh = value.text;
            if (value.is_native()) {
                const auto action =
                    parse_native_response(value.native.value(), provider_->native_format());
                if (const auto* final_action = std::get_if<protocol::FinalAction>(&action)) {
                    fresh = final_action->message;
                }
            }
        }

        if (fresh.find_first_not_of(" \t\r\n") == std::string::npos) {
            fresh = fallback_summary(to_summarize);
            result.used_fallback = true;
        }
    }

    std::string content = kSummaryMarker;
    for (const auto& part : carried) {
        content += "\n" + part;
    }
    if (!fresh.empty()) {
        content += "\n" + fresh;
    }

    protocol::Message summary;
    summary.role = protocol::Role::Assistant;
    summary.content = content;
    summary.is_summary = true;

    result.history.reserve(history.size() - split + 1);
    result.history.push_back(std::move(summary));
    result.history.insert(result.history.end(), history.begin() + static_cast<std::ptrdiff_t>(split),
                          history.end());
    result.compacted = true;
    result.after_messages = result.history.size();
    return result;
}

}  // namespace helm::runtime
