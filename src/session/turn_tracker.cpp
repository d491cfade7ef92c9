#include "session/turn_tracker.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace helm::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;

std::string to_string(const TurnStatus status) {
    switch (status) {
        case TurnStatus::Running:
            return "running";
        case TurnStatus::Completed:
            return "completed";
        case TurnStatus::Failed:
            return "failed";
        case TurnStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

core::errors::Result<std::shared_ptr<std::atomic_bool>> TurnTracker::begin_turn(
    const std::string& turn_id) {
    if (turn_id.empty()) {
        return AgentError{ErrorCategory::Input, "Turn ID cannot be empty.", "invalid_turn_id"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_turn_.has_value()) {
        return AgentError{ErrorCategory::Internal,
                          "Turn " + active_turn_.value() + " is still running.",
                          "turn_in_progress",
                          "Wait for the current turn to finish before starting another."};
    }
    if (turns_.find(turn_id) != turns_.end()) {
        return AgentError{ErrorCategory::Internal, "Duplicate turn ID: " + turn_id,
                          "duplicate_turn_id"};
    }

    TurnRecord record;
    record.turn_id = turn_id;
    record.cancel_token = std::make_shared<std::atomic_bool>(false);
    auto token = record.cancel_token;
    turns_.emplace(turn_id, std::move(record));
    active_turn_ = turn_id;
    HELM_LOG_DEBUG("TurnTracker: turn " + turn_id + " -> running");
    return token;
}

bool TurnTracker::request_abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_turn_.has_value()) {
        return false;
    }
    auto it = turns_.find(active_turn_.value());
    if (it == turns_.end() || !it->second.cancel_token) {
        return false;
    }
    bool expected = false;
    const bool signalled = it->second.cancel_token->compare_exchange_strong(expected, true);
    if (signalled) {
        HELM_LOG_INFO("TurnTracker: abort requested for turn " + it->first);
    }
    return signalled;
}

core::errors::Result<TurnStatus> TurnTracker::mark_completed(const std::string& turn_id) {
    return transition_to_terminal(turn_id, TurnStatus::Completed, std::nullopt);
}

core::errors::Result<TurnStatus> TurnTracker::mark_failed(const std::string& turn_id,
                                                          const std::string& reason) {
    return transition_to_terminal(turn_id, TurnStatus::Failed, reason);
}

core::errors::Result<TurnStatus> TurnTracker::mark_cancelled(const std::string& turn_id) {
    return transition_to_terminal(turn_id, TurnStatus::Cancelled, std::nullopt);
}

core::errors::Result<TurnStatus> TurnTracker::transition_to_terminal(
    const std::string& turn_id, const TurnStatus next_status,
    const std::optional<std::string>& failure_reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(turn_id);
    if (it == turns_.end()) {
        return AgentError{ErrorCategory::Input, "Turn ID not found: " + turn_id,
                          "turn_not_found"};
    }
    if (it->second.status != TurnStatus::Running) {
        return AgentError{ErrorCategory::Input,
                          "Turn is already terminal: " + to_string(it->second.status),
                          "invalid_state_transition"};
    }

    it->second.status = next_status;
    it->second.failure_reason = failure_reason;
    it->second.cancel_token.reset();
    if (active_turn_ == turn_id) {
        active_turn_.reset();
    }
    HELM_LOG_DEBUG("TurnTracker: turn " + turn_id + " running -> " + to_string(next_status));

    finished_.push_back(turn_id);
    while (finished_.size() > kMaxFinishedTurns) {
        turns_.erase(finished_.front());
        finished_.pop_front();
    }
    return next_status;
}

core::errors::Result<TurnStatus> TurnTracker::status(const std::string& turn_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = turns_.find(turn_id);
    if (it == turns_.end()) {
        return AgentError{ErrorCategory::Input, "Turn ID not found: " + turn_id,
                          "turn_not_found"};
    }
    return it->second.status;
}

std::optional<std::string> TurnTracker::active_turn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_turn_;
}

std::size_t TurnTracker::turn_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turns_.size();
}

}  // namespace helm::session
