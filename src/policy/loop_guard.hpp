#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace helm::policy {

constexpr std::size_t kOutcomeDigestChars = 1000;

enum class CallVerdict {
    Fresh,
    Repeated,      // Same signature as the previous call; allowed for now.
    DefiniteLoop   // Third identical call after an identical repeat result.
};

enum class OutcomeVerdict {
    New,
    RepeatedOutcome  // This exact (signature, result) was already seen this turn.
};

// Tool name plus key-sorted input; shell commands are whitespace-collapsed and
// lose a redundant "cd <workspace> &&" prefix.
std::string tool_signature(const std::string& tool, const nlohmann::json& input,
                           const std::filesystem::path& workspace_root);

// Per-turn bookkeeping for repeated, non-progressing tool calls.
class LoopGuard {
public:
    CallVerdict classify(const std::string& signature) const;
    OutcomeVerdict record_outcome(const std::string& signature, const std::string& result);

    // Returns true when the no-op must end the turn (the second one).
    bool record_todo_noop();

    bool was_executed(const std::string& signature) const;
    const std::string& last_signature() const { return last_signature_; }

private:
    std::string last_signature_;
    std::string last_digest_;
    std::size_t consecutive_count_ = 0;
    // Set when the first repeat of last_signature_ produced the original digest.
    bool repeat_matched_ = false;

    std::set<std::pair<std::string, std::string>> outcomes_;
    std::set<std::string> executed_;
    std::size_t todo_noops_ = 0;
};

}  // namespace helm::policy
