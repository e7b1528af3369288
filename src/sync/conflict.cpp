#include "osync/sync/conflict.hpp"

#include "osync/core/ids.hpp"
#include "osync/sync/codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace osync::sync {
namespace {

const std::string kConflictPrefix = "conflict/";

bool local_wins_by_time(const ChangeRecord& local, const RemoteRecord& remote) {
    if (local.created_at == remote.last_updated) {
        return local.client_id > remote.origin_client_id;
    }
    return local.created_at > remote.last_updated;
}

Operation requeue_operation(const ChangeRecord& local, const RemoteRecord& remote) {
    if (local.operation == Operation::Delete) {
        return Operation::Delete;
    }
    return remote.deleted ? Operation::Create : Operation::Update;
}

} // namespace

ConflictResolver::ConflictResolver(storage::LocalPersistence& persistence, ChangeTracker& tracker, const Clock& clock)
    : persistence_(persistence), tracker_(tracker), clock_(clock) {}

std::string ConflictResolver::key(const std::string& conflict_id) {
    return kConflictPrefix + conflict_id;
}

ConflictKind ConflictResolver::classify(const ChangeRecord& local, const RemoteRecord& remote) noexcept {
    if (local.operation == Operation::Delete && !remote.deleted) {
        return ConflictKind::DeleteUpdate;
    }
    if (local.operation != Operation::Delete && remote.deleted) {
        return ConflictKind::UpdateDelete;
    }
    return ConflictKind::UpdateUpdate;
}

json ConflictResolver::merge(const json& local, const json& remote) {
    if (!local.is_object() || !remote.is_object()) {
        return local;
    }
    json merged = local;
    for (auto it = remote.begin(); it != remote.end(); ++it) {
        // A null local field counts as unset.
        if (!merged.contains(it.key()) || merged[it.key()].is_null()) {
            merged[it.key()] = it.value();
        }
    }
    return merged;
}

ConflictDecision ConflictResolver::decide(const ChangeRecord& local, const RemoteRecord& remote, ConflictPolicy policy) {
    ConflictDecision decision;
    decision.kind = classify(local, remote);

    // Both sides deleted the entity: nothing left to disagree about.
    if (local.operation == Operation::Delete && remote.deleted) {
        decision.outcome = ConflictOutcome::ResolvedRemote;
        return decision;
    }

    switch (policy) {
        case ConflictPolicy::RemoteWins:
            decision.outcome = ConflictOutcome::ResolvedRemote;
            break;
        case ConflictPolicy::LocalWins:
            decision.outcome = ConflictOutcome::ResolvedLocal;
            break;
        case ConflictPolicy::Manual:
            decision.outcome = ConflictOutcome::Unresolved;
            break;
        case ConflictPolicy::Merge:
            if (decision.kind == ConflictKind::UpdateUpdate) {
                decision.outcome = ConflictOutcome::ResolvedMerged;
                decision.merged = merge(local.payload, remote.payload);
                break;
            }
            // Deletions cannot be merged field by field.
            [[fallthrough]];
        case ConflictPolicy::LastWriteWins:
            decision.outcome = local_wins_by_time(local, remote) ? ConflictOutcome::ResolvedLocal
                                                                 : ConflictOutcome::ResolvedRemote;
            break;
    }
    return decision;
}

Result<ConflictRecord> ConflictResolver::reconcile(const ChangeRecord& local,
                                                   const RemoteRecord& remote,
                                                   ConflictPolicy policy,
                                                   const std::string& cursor_token,
                                                   const storage::WriteBatch& extra) {
    const auto decision = decide(local, remote, policy);

    ConflictRecord conflict;
    conflict.id = generate_uuid();
    conflict.entity_type = local.entity_type;
    conflict.entity_id = local.entity_id;
    conflict.local_change = local;
    conflict.remote_snapshot = remote;
    conflict.policy = policy;
    conflict.kind = decision.kind;
    conflict.detected_at = clock_.now();
    conflict.cursor_token = cursor_token;

    if (auto res = apply(conflict, decision, extra); res.is_error()) {
        spdlog::error("[ConflictResolver] {}/{} seq={}: {}", local.entity_type, local.entity_id,
                      local.sequence, res.error().message);
        return Err<ConflictRecord>(res.error());
    }

    spdlog::info("[ConflictResolver] {} conflict on {}/{} -> {} ({})", to_string(conflict.kind),
                 conflict.entity_type, conflict.entity_id, to_string(conflict.outcome), to_string(policy));
    return Ok(std::move(conflict));
}

Result<ConflictRecord> ConflictResolver::resolve(const std::string& conflict_id, ConflictOutcome outcome) {
    if (outcome == ConflictOutcome::Unresolved) {
        return Err<ConflictRecord>(ErrorKind::InvalidArgument, "resolve() needs a resolved outcome");
    }

    auto loaded = get(conflict_id);
    if (loaded.is_error()) {
        return loaded;
    }
    auto conflict = std::move(loaded.value());
    if (conflict.outcome != ConflictOutcome::Unresolved) {
        return Err<ConflictRecord>(ErrorKind::InvalidState,
                                   "conflict " + conflict_id + " already " + to_string(conflict.outcome));
    }

    // The queued record may have been rebased since detection; work on the stored one.
    auto local = tracker_.get(conflict.local_change.sequence);
    if (local.is_error()) {
        return Err<ConflictRecord>(local.error());
    }
    if (local.value().status != ChangeStatus::Conflicted || local.value().conflict_id != conflict_id) {
        return Err<ConflictRecord>(ErrorKind::InvalidState,
                                   "seq " + std::to_string(local.value().sequence) +
                                   " is not held by conflict " + conflict_id);
    }
    conflict.local_change = local.value();

    ConflictDecision decision;
    decision.kind = conflict.kind;
    decision.outcome = outcome;
    if (outcome == ConflictOutcome::ResolvedMerged) {
        decision.merged = merge(conflict.local_change.payload, conflict.remote_snapshot.payload);
    }

    if (auto res = apply(conflict, decision, {}); res.is_error()) {
        return Err<ConflictRecord>(res.error());
    }
    spdlog::info("[ConflictResolver] conflict {} on {}/{} resolved as {}", conflict_id, conflict.entity_type,
                 conflict.entity_id, to_string(outcome));
    return Ok(std::move(conflict));
}

Result<ConflictRecord> ConflictResolver::get(const std::string& conflict_id) const {
    auto stored = persistence_.get(key(conflict_id));
    if (stored.is_error()) {
        return Err<ConflictRecord>(stored.error());
    }
    if (!stored.value().has_value()) {
        return Err<ConflictRecord>(ErrorKind::NotFound, "No conflict " + conflict_id);
    }
    return decode<ConflictRecord>(*stored.value());
}

Result<std::vector<ConflictRecord>> ConflictResolver::unresolved() const {
    auto rows = persistence_.scan(kConflictPrefix);
    if (rows.is_error()) {
        return Err<std::vector<ConflictRecord>>(rows.error());
    }

    std::vector<ConflictRecord> out;
    for (const auto& [_, value] : rows.value()) {
        auto conflict = decode<ConflictRecord>(value);
        if (conflict.is_error()) {
            return Err<std::vector<ConflictRecord>>(conflict.error());
        }
        if (conflict.value().outcome == ConflictOutcome::Unresolved) {
            out.push_back(std::move(conflict.value()));
        }
    }
    std::sort(out.begin(), out.end(), [](const ConflictRecord& a, const ConflictRecord& b) {
        return a.detected_at < b.detected_at;
    });
    return Ok(std::move(out));
}

Result<std::size_t> ConflictResolver::collect_resolved() {
    auto rows = persistence_.scan(kConflictPrefix);
    if (rows.is_error()) {
        return Err<std::size_t>(rows.error());
    }

    storage::WriteBatch batch;
    for (const auto& [stored_key, value] : rows.value()) {
        auto conflict = decode<ConflictRecord>(value);
        if (conflict.is_error()) {
            return Err<std::size_t>(conflict.error());
        }
        if (conflict.value().outcome != ConflictOutcome::Unresolved) {
            batch.erase(stored_key);
        }
    }
    const std::size_t removed = batch.size();
    if (auto res = persistence_.commit(batch); res.is_error()) {
        return Err<std::size_t>(res.error());
    }
    return Ok(removed);
}

Result<void> ConflictResolver::apply(ConflictRecord& conflict,
                                     const ConflictDecision& decision,
                                     const storage::WriteBatch& extra) {
    const auto& local = conflict.local_change;
    const auto& remote = conflict.remote_snapshot;

    conflict.outcome = decision.outcome;
    if (decision.outcome != ConflictOutcome::Unresolved) {
        conflict.resolved_at = clock_.now();
    }

    storage::WriteBatch batch;
    batch.append(extra);
    batch.put(key(conflict.id), encode(conflict));

    if (decision.outcome == ConflictOutcome::Unresolved) {
        return tracker_.mark_conflicted(local.sequence, conflict.id, batch);
    }

    if (decision.outcome == ConflictOutcome::ResolvedRemote) {
        return tracker_.yield_to_remote(local.sequence, remote, batch);
    }

    json payload = decision.outcome == ConflictOutcome::ResolvedMerged && decision.merged.has_value()
        ? *decision.merged
        : local.payload;

    auto requeued = tracker_.requeue(local.sequence, requeue_operation(local, remote), std::move(payload),
                                     remote.revision, remote.last_updated, batch);
    if (requeued.is_error()) {
        return Err<void>(requeued.error());
    }
    return Ok();
}

} // namespace osync::sync
