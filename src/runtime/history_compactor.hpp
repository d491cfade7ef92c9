#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "providers/provider.hpp"

namespace helm::runtime {

constexpr const char* kSummaryMarker = "[CONTEXT SUMMARY]";

struct CompactionResult {
    protocol::ConversationHistory history;
    bool compacted = false;
    std::size_t before_messages = 0;
    std::size_t after_messages = 0;
    bool used_fallback = false;
};

// Replaces everything older than the preserved window with one summary message.
class HistoryCompactor {
public:
    explicit HistoryCompactor(std::shared_ptr<providers::IProvider> provider);

    core::errors::Result<CompactionResult> compact(
        const protocol::ConversationHistory& history, std::size_t preserve_recent,
        const providers::CancelToken& cancel_token) const;

    // Last user ask, last assistant reply and message count.
    static std::string fallback_summary(const protocol::ConversationHistory& messages);

private:
    std::shared_ptr<providers::IProvider> provider_;
};

}  // namespace helm::runtime
