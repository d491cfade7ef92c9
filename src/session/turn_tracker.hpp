#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "core/errors/agent_errors.hpp"

namespace helm::session {

enum class TurnStatus {
    Running,
    Completed,
    Failed,
    Cancelled
};

struct TurnRecord {
    std::string turn_id;
    TurnStatus status = TurnStatus::Running;
    std::optional<std::string> failure_reason;
    std::shared_ptr<std::atomic_bool> cancel_token;
};

// Owns the lifecycle and cancellation token of each turn. At most one turn
// runs at a time. A finished turn drops its token and only the most recent
// kMaxFinishedTurns records are kept.
class TurnTracker {
public:
    static constexpr std::size_t kMaxFinishedTurns = 16;

    core::errors::Result<std::shared_ptr<std::atomic_bool>> begin_turn(const std::string& turn_id);

    // Signals the running turn's token. Returns false when no turn is running
    // or the token was already signalled.
    bool request_abort();

    core::errors::Result<TurnStatus> mark_completed(const std::string& turn_id);
    core::errors::Result<TurnStatus> mark_failed(const std::string& turn_id,
                                                 const std::string& reason);
    core::errors::Result<TurnStatus> mark_cancelled(const std::string& turn_id);

    core::errors::Result<TurnStatus> status(const std::string& turn_id) const;
    std::optional<std::string> active_turn() const;
    std::size_t turn_count() const;

private:
    core::errors::Result<TurnStatus> transition_to_terminal(
        const std::string& turn_id, TurnStatus next_status,
        const std::optional<std::string>& failure_reason);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, TurnRecord> turns_;
    std::optional<std::string> active_turn_;
    std::deque<std::string> finished_;
};

std::string to_string(TurnStatus status);

}  // namespace helm::session
