#include "policy/loop_guard.hpp"

#include "policy/shell_command.hpp"
#include "tools/tool_id.hpp"

namespace helm::policy {

std::string tool_signature(const std::string& tool, const nlohmann::json& input,
                           const std::filesystem::path& workspace_root) {
    const auto id = tools::parse_tool_id(tool);
    const std::string name = id.has_value() ? tools::to_string(id.value()) : tool;

    nlohmann::json normalized = input.is_object() ? input : nlohmann::json::object();
    if (id.has_value() && id.value() == tools::ToolId::Shell) {
        const std::string command = command_from_input(normalized);
        if (!command.empty()) {
            normalized["command"] = normalize_shell_command(command, workspace_root);
        }
    }
    // nlohmann::json objects iterate in key order, so dump() is canonical.
    return name + ":" + normalized.dump();
}

CallVerdict LoopGuard::classify(const std::string& signature) const {
    if (signature != last_signature_ || consecutive_count_ == 0) {
        return CallVerdict::Fresh;
    }
    if (consecutive_count_ >= 2 && repeat_matched_) {
        return CallVerdict::DefiniteLoop;
    }
    return CallVerdict::Repeated;
}

OutcomeVerdict LoopGuard::record_outcome(const std::string& signature,
                                         const std::string& result) {
    const std::string digest = result.substr(0, kOutcomeDigestChars);

    if (signature == last_signature_ && consecutive_count_ > 0) {
        ++consecutive_count_;
        if (consecutive_count_ == 2) {
            repeat_matched_ = (digest == last_digest_);
        }
    } else {
        last_signature_ = signature;
        last_digest_ = digest;
        consecutive_count_ = 1;
        repeat_matched_ = false;
    }

    executed_.insert(signature);
    const bool inserted = outcomes_.emplace(signature, digest).second;
    return inserted ? OutcomeVerdict::New : OutcomeVerdict::RepeatedOutcome;
}

bool LoopGuard::record_todo_noop() {
    ++todo_noops_;
    return todo_noops_ >= 2;
}

bool LoopGuard::was_executed(const std::string& signature) const {
    return executed_.count(signature) > 0;
}

}  // namespace helm::policy
