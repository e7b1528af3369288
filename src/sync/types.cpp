#include "osync/sync/types.hpp"

namespace osync::sync {

const char* to_string(Operation operation) noexcept {
    switch (operation) {
        case Operation::Create: return "create";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
    }
    return "unknown";
}

const char* to_string(ChangeStatus status) noexcept {
    switch (status) {
        case ChangeStatus::Pending: return "pending";
        case ChangeStatus::InFlight: return "in_flight";
        case ChangeStatus::Acked: return "acked";
        case ChangeStatus::Failed: return "failed";
        case ChangeStatus::Conflicted: return "conflicted";
    }
    return "unknown";
}

const char* to_string(ConflictPolicy policy) noexcept {
    switch (policy) {
        case ConflictPolicy::LastWriteWins: return "last_write_wins";
        case ConflictPolicy::RemoteWins: return "remote_wins";
        case ConflictPolicy::LocalWins: return "local_wins";
        case ConflictPolicy::Manual: return "manual";
        case ConflictPolicy::Merge: return "merge";
    }
    return "unknown";
}

const char* to_string(ConflictOutcome outcome) noexcept {
    switch (outcome) {
        case ConflictOutcome::ResolvedLocal: return "resolved_local";
        case ConflictOutcome::ResolvedRemote: return "resolved_remote";
        case ConflictOutcome::ResolvedMerged: return "resolved_merged";
        case ConflictOutcome::Unresolved: return "unresolved";
    }
    return "unknown";
}

const char* to_string(ConflictKind kind) noexcept {
    switch (kind) {
        case ConflictKind::UpdateUpdate: return "update_update";
        case ConflictKind::UpdateDelete: return "update_delete";
        case ConflictKind::DeleteUpdate: return "delete_update";
    }
    return "unknown";
}

const char* to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Probing: return "probing";
        case SessionState::Pushing: return "pushing";
        case SessionState::Pulling: return "pulling";
        case SessionState::Reconciling: return "reconciling";
        case SessionState::Failed: return "failed";
        case SessionState::Paused: return "paused";
    }
    return "unknown";
}

const char* to_string(SessionOutcome outcome) noexcept {
    switch (outcome) {
        case SessionOutcome::Completed: return "completed";
        case SessionOutcome::Failed: return "failed";
        case SessionOutcome::Paused: return "paused";
        case SessionOutcome::Cancelled: return "cancelled";
        case SessionOutcome::TimedOut: return "timed_out";
    }
    return "unknown";
}

std::optional<ConflictPolicy> parse_conflict_policy(const std::string& name) {
    for (auto policy : {ConflictPolicy::LastWriteWins, ConflictPolicy::RemoteWins,
                        ConflictPolicy::LocalWins, ConflictPolicy::Manual, ConflictPolicy::Merge}) {
        if (name == to_string(policy)) {
            return policy;
        }
    }
    return std::nullopt;
}

} // namespace osync::sync
