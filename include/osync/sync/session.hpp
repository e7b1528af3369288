#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/result.hpp"
#include "osync/sync/types.hpp"

#include <string>

namespace osync::sync {

/**
 * @brief State of one sync session
 *
 * Idle → Probing → Pushing → Pulling → Reconciling, with Failed and Paused
 * reachable from every active state. finish() returns to Idle from anywhere.
 */
class SyncSession {
public:
    SyncSession(std::string session_id, const Clock& clock);

    [[nodiscard]] const std::string& session_id() const noexcept { return info_.session_id; }
    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const SyncSessionInfo& info() const noexcept { return info_; }
    [[nodiscard]] SessionStats& stats() noexcept { return info_.stats; }
    [[nodiscard]] bool active() const noexcept { return info_.state != SessionState::Idle; }

    Result<void> start();
    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(std::string error_message);
    Result<void> mark_paused(std::string reason);

    /// Back to Idle; the session info keeps its stats and last error.
    void finish();

    [[nodiscard]] Timestamp last_transition() const noexcept { return last_transition_; }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    const Clock& clock_;
    SyncSessionInfo info_;
    Timestamp last_transition_ = 0;
    bool started_ = false;
};

} // namespace osync::sync
