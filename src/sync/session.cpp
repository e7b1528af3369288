#include "osync/sync/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace osync::sync {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::Probing}},
        {SessionState::Probing, {SessionState::Pushing}},
        {SessionState::Pushing, {SessionState::Pulling}},
        {SessionState::Pulling, {SessionState::Reconciling}},
    };

    if (current != SessionState::Idle &&
        (target == SessionState::Failed || target == SessionState::Paused)) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

SyncSession::SyncSession(std::string session_id, const Clock& clock)
    : clock_(clock) {
    info_.session_id = std::move(session_id);
    info_.state = SessionState::Idle;
    last_transition_ = clock_.now();
}

Result<void> SyncSession::start() {
    if (started_) {
        return Err<void>(ErrorKind::InvalidState, "Session already started");
    }
    started_ = true;
    info_.started_at = clock_.now();
    return transition_to(SessionState::Probing);
}

Result<void> SyncSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("Illegal session state transition ") + to_string(info_.state) +
                         " -> " + to_string(next_state));
    }

    info_.state = next_state;
    last_transition_ = clock_.now();
    if (next_state != SessionState::Failed && next_state != SessionState::Paused) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> SyncSession::mark_failed(std::string error_message) {
    info_.last_error = std::move(error_message);
    return transition_to(SessionState::Failed);
}

Result<void> SyncSession::mark_paused(std::string reason) {
    info_.last_error = std::move(reason);
    return transition_to(SessionState::Paused);
}

void SyncSession::finish() {
    info_.state = SessionState::Idle;
    last_transition_ = clock_.now();
}

bool SyncSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (info_.state == SessionState::Failed || info_.state == SessionState::Paused) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace osync::sync
