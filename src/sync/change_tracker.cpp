#include "osync/sync/change_tracker.hpp"

#include "osync/core/ids.hpp"
#include "osync/sync/codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <unordered_map>

namespace osync::sync {
namespace {

const std::string kChangePrefix = "change/";
const std::string kNextSequenceKey = "meta/next_sequence";

bool can_transition(ChangeStatus current, ChangeStatus target) {
    static const std::unordered_map<ChangeStatus, std::vector<ChangeStatus>> transitions {
        {ChangeStatus::Pending, {ChangeStatus::InFlight, ChangeStatus::Conflicted, ChangeStatus::Failed}},
        {ChangeStatus::InFlight, {ChangeStatus::InFlight, ChangeStatus::Pending, ChangeStatus::Acked,
                                  ChangeStatus::Failed, ChangeStatus::Conflicted}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

bool same_entity(const ChangeRecord& a, const ChangeRecord& b) {
    return a.entity_type == b.entity_type && a.entity_id == b.entity_id;
}

} // namespace

ChangeTracker::ChangeTracker(storage::LocalPersistence& persistence, const Clock& clock)
    : persistence_(persistence), clock_(clock), entities_(persistence) {}

std::string ChangeTracker::key(std::uint64_t sequence) {
    char buffer[21];
    std::snprintf(buffer, sizeof(buffer), "%020llu", static_cast<unsigned long long>(sequence));
    return kChangePrefix + buffer;
}

Result<ChangeRecord> ChangeTracker::append(const std::string& entity_type,
                                           const std::string& entity_id,
                                           Operation operation,
                                           json payload) {
    if (entity_type.empty() || entity_id.empty()) {
        return Err<ChangeRecord>(ErrorKind::InvalidArgument, "entity type and id must not be empty");
    }
    if (entity_type.find('/') != std::string::npos) {
        return Err<ChangeRecord>(ErrorKind::InvalidArgument, "entity type must not contain '/': " + entity_type);
    }
    if (operation != Operation::Delete && payload.is_null()) {
        return Err<ChangeRecord>(ErrorKind::InvalidArgument,
                                 std::string("payload required for ") + to_string(operation));
    }

    std::lock_guard lock(mutex_);
    if (auto res = ensure_loaded_locked(); res.is_error()) {
        return Err<ChangeRecord>(res.error());
    }

    auto current = entities_.get(entity_type, entity_id);
    if (current.is_error()) {
        return Err<ChangeRecord>(current.error());
    }
    const std::string base_revision = current.value() ? current.value()->revision : std::string();

    ChangeRecord record = make_record_locked(entity_type, entity_id, operation, std::move(payload), base_revision);

    storage::WriteBatch batch;
    batch.put(key(record.sequence), encode(record));
    batch.put(kNextSequenceKey, std::to_string(record.sequence + 1));
    entities_.stage_local(batch, current.value(), entity_type, entity_id, operation, record.payload,
                          record.created_at);

    if (auto res = persistence_.commit(batch); res.is_error()) {
        spdlog::error("[ChangeTracker] append {}/{} failed: {}", entity_type, entity_id, res.error().message);
        return Err<ChangeRecord>(res.error());
    }

    next_sequence_ = record.sequence + 1;
    spdlog::debug("[ChangeTracker] queued seq={} {} {}/{}", record.sequence, to_string(operation),
                  entity_type, entity_id);
    return Ok(std::move(record));
}

Result<std::vector<ChangeRecord>> ChangeTracker::snapshot_pending(
    const std::optional<std::string>& entity_type) const {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return all;
    }

    std::vector<ChangeRecord> pending;
    for (auto& record : all.value()) {
        if (record.status != ChangeStatus::Pending) {
            continue;
        }
        if (entity_type.has_value() && record.entity_type != *entity_type) {
            continue;
        }
        pending.push_back(std::move(record));
    }
    return Ok(std::move(pending));
}

Result<ChangeRecord> ChangeTracker::get(std::uint64_t sequence) const {
    std::lock_guard lock(mutex_);
    return load_locked(sequence);
}

Result<std::vector<ChangeRecord>> ChangeTracker::records(std::optional<ChangeStatus> status) const {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error() || !status.has_value()) {
        return all;
    }

    std::vector<ChangeRecord> filtered;
    for (auto& record : all.value()) {
        if (record.status == *status) {
            filtered.push_back(std::move(record));
        }
    }
    return Ok(std::move(filtered));
}

Result<std::vector<ChangeRecord>> ChangeTracker::entity_queue(const std::string& entity_type,
                                                              const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return all;
    }

    std::vector<ChangeRecord> queue;
    for (auto& record : all.value()) {
        if (record.entity_type == entity_type && record.entity_id == entity_id &&
            record.status != ChangeStatus::Acked) {
            queue.push_back(std::move(record));
        }
    }
    return Ok(std::move(queue));
}

Result<bool> ChangeTracker::is_blocked(const std::string& entity_type, const std::string& entity_id) const {
    auto queue = entity_queue(entity_type, entity_id);
    if (queue.is_error()) {
        return Err<bool>(queue.error());
    }
    const bool blocked = std::any_of(queue.value().begin(), queue.value().end(), [](const ChangeRecord& r) {
        return r.status == ChangeStatus::Conflicted || r.status == ChangeStatus::Failed;
    });
    return Ok(blocked);
}

Result<void> ChangeTracker::mark_in_flight(std::uint64_t sequence) {
    std::lock_guard lock(mutex_);
    return transition_locked(sequence, ChangeStatus::InFlight, std::nullopt, {});
}

Result<void> ChangeTracker::mark_pending(std::uint64_t sequence, std::optional<std::string> reason) {
    std::lock_guard lock(mutex_);
    return transition_locked(sequence, ChangeStatus::Pending, std::move(reason), {});
}

Result<void> ChangeTracker::mark_failed(std::uint64_t sequence, const std::string& reason) {
    std::lock_guard lock(mutex_);
    return transition_locked(sequence, ChangeStatus::Failed, reason, {});
}

Result<void> ChangeTracker::mark_conflicted(std::uint64_t sequence,
                                            const std::string& conflict_id,
                                            const storage::WriteBatch& extra) {
    std::lock_guard lock(mutex_);
    auto loaded = load_locked(sequence);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    auto record = std::move(loaded.value());
    if (!can_transition(record.status, ChangeStatus::Conflicted)) {
        return Err<void>(ErrorKind::InvalidState,
                         "seq " + std::to_string(sequence) + ": illegal transition " +
                         to_string(record.status) + " -> conflicted");
    }

    record.status = ChangeStatus::Conflicted;
    record.conflict_id = conflict_id;

    storage::WriteBatch batch;
    batch.put(key(sequence), encode(record));
    batch.append(extra);
    return persistence_.commit(batch);
}

Result<void> ChangeTracker::mark_acked(std::uint64_t sequence, const std::string& revision, Timestamp last_updated) {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<void>(all.error());
    }

    auto it = std::find_if(all.value().begin(), all.value().end(),
                           [sequence](const ChangeRecord& r) { return r.sequence == sequence; });
    if (it == all.value().end()) {
        return Err<void>(ErrorKind::NotFound, "No change record with seq " + std::to_string(sequence));
    }
    ChangeRecord record = *it;
    if (!can_transition(record.status, ChangeStatus::Acked)) {
        return Err<void>(ErrorKind::InvalidState,
                         "seq " + std::to_string(sequence) + ": illegal transition " +
                         to_string(record.status) + " -> acked");
    }

    record.status = ChangeStatus::Acked;
    record.last_error.reset();

    storage::WriteBatch batch;
    batch.put(key(sequence), encode(record));

    // Later edits of the entity were made on top of this one, so they now sit on the acked revision.
    stage_rebase_locked(batch, all.value(), record, revision);

    auto entity = entities_.get(record.entity_type, record.entity_id);
    if (entity.is_error()) {
        return Err<void>(entity.error());
    }
    if (entity.value().has_value()) {
        entities_.stage_revision(batch, *entity.value(), revision, last_updated);
    }
    return persistence_.commit(batch);
}

Result<void> ChangeTracker::discard(std::uint64_t sequence,
                                    const std::string& rebase_revision,
                                    const storage::WriteBatch& extra) {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<void>(all.error());
    }

    auto it = std::find_if(all.value().begin(), all.value().end(),
                           [sequence](const ChangeRecord& r) { return r.sequence == sequence; });
    if (it == all.value().end()) {
        return Err<void>(ErrorKind::NotFound, "No change record with seq " + std::to_string(sequence));
    }

    storage::WriteBatch batch;
    batch.erase(key(sequence));
    stage_rebase_locked(batch, all.value(), *it, rebase_revision);
    batch.append(extra);
    return persistence_.commit(batch);
}

Result<std::optional<ChangeRecord>> ChangeTracker::requeue(std::uint64_t sequence,
                                                           Operation operation,
                                                           json payload,
                                                           const std::string& base_revision,
                                                           Timestamp remote_updated,
                                                           const storage::WriteBatch& extra) {
    using Requeued = std::optional<ChangeRecord>;

    std::lock_guard lock(mutex_);
    if (auto res = ensure_loaded_locked(); res.is_error()) {
        return Err<Requeued>(res.error());
    }
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<Requeued>(all.error());
    }
    auto it = std::find_if(all.value().begin(), all.value().end(),
                           [sequence](const ChangeRecord& r) { return r.sequence == sequence; });
    if (it == all.value().end()) {
        return Err<Requeued>(ErrorKind::NotFound, "No change record with seq " + std::to_string(sequence));
    }
    const ChangeRecord original = *it;

    auto entity = entities_.get(original.entity_type, original.entity_id);
    if (entity.is_error()) {
        return Err<Requeued>(entity.error());
    }

    storage::WriteBatch batch;
    batch.append(extra);
    batch.erase(key(sequence));

    if (has_later_locked(all.value(), original)) {
        stage_rebase_locked(batch, all.value(), original, base_revision);
        if (entity.value().has_value()) {
            entities_.stage_revision(batch, *entity.value(), base_revision, remote_updated);
        }
        if (auto res = persistence_.commit(batch); res.is_error()) {
            return Err<Requeued>(res.error());
        }
        spdlog::debug("[ChangeTracker] seq={} superseded by later changes, rebased on {}", sequence, base_revision);
        return Ok(Requeued{});
    }

    ChangeRecord replacement = make_record_locked(original.entity_type, original.entity_id, operation,
                                                  std::move(payload), base_revision);
    batch.put(key(replacement.sequence), encode(replacement));
    batch.put(kNextSequenceKey, std::to_string(replacement.sequence + 1));

    LocalEntity updated = entity.value().value_or(LocalEntity{original.entity_type, original.entity_id});
    updated.payload = replacement.payload;
    updated.deleted = operation == Operation::Delete;
    entities_.stage_revision(batch, updated, base_revision, remote_updated);

    if (auto res = persistence_.commit(batch); res.is_error()) {
        return Err<Requeued>(res.error());
    }
    next_sequence_ = replacement.sequence + 1;
    spdlog::debug("[ChangeTracker] requeued seq={} as seq={} on {}", sequence, replacement.sequence, base_revision);
    return Ok(Requeued{std::move(replacement)});
}

Result<void> ChangeTracker::yield_to_remote(std::uint64_t sequence,
                                            const RemoteRecord& remote,
                                            const storage::WriteBatch& extra) {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<void>(all.error());
    }
    auto it = std::find_if(all.value().begin(), all.value().end(),
                           [sequence](const ChangeRecord& r) { return r.sequence == sequence; });
    if (it == all.value().end()) {
        return Err<void>(ErrorKind::NotFound, "No change record with seq " + std::to_string(sequence));
    }
    const ChangeRecord original = *it;

    storage::WriteBatch batch;
    batch.append(extra);
    batch.erase(key(sequence));

    if (has_later_locked(all.value(), original)) {
        stage_rebase_locked(batch, all.value(), original, remote.revision);
        auto entity = entities_.get(original.entity_type, original.entity_id);
        if (entity.is_error()) {
            return Err<void>(entity.error());
        }
        if (entity.value().has_value()) {
            entities_.stage_revision(batch, *entity.value(), remote.revision, remote.last_updated);
        }
    } else {
        entities_.stage_remote(batch, remote);
    }
    return persistence_.commit(batch);
}

Result<std::size_t> ChangeTracker::apply_pulled(
    const std::vector<RemoteRecord>& records,
    const std::function<void(storage::WriteBatch&, const RemoteRecord&)>& park,
    const storage::WriteBatch& tail) {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<std::size_t>(all.error());
    }

    storage::WriteBatch batch;
    batch.append(tail);

    std::size_t parked = 0;
    for (const auto& record : records) {
        const bool unsettled = std::any_of(all.value().begin(), all.value().end(), [&](const ChangeRecord& r) {
            return r.entity_type == record.entity_type && r.entity_id == record.entity_id &&
                   r.status != ChangeStatus::Acked;
        });
        if (unsettled) {
            park(batch, record);
            ++parked;
        } else {
            entities_.stage_remote(batch, record);
        }
    }

    if (auto res = persistence_.commit(batch); res.is_error()) {
        return Err<std::size_t>(res.error());
    }
    return Ok(parked);
}

Result<void> ChangeTracker::rebase(const std::string& entity_type,
                                   const std::string& entity_id,
                                   const std::string& revision,
                                   const storage::WriteBatch& extra) {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<void>(all.error());
    }

    ChangeRecord anchor;
    anchor.entity_type = entity_type;
    anchor.entity_id = entity_id;

    storage::WriteBatch batch;
    stage_rebase_locked(batch, all.value(), anchor, revision);
    batch.append(extra);
    return persistence_.commit(batch);
}

Result<void> ChangeTracker::acknowledge_failure(std::uint64_t sequence) {
    std::lock_guard lock(mutex_);
    auto record = load_locked(sequence);
    if (record.is_error()) {
        return Err<void>(record.error());
    }
    if (record.value().status != ChangeStatus::Failed) {
        return Err<void>(ErrorKind::InvalidState,
                         "seq " + std::to_string(sequence) + " is " + to_string(record.value().status) +
                         ", not failed");
    }
    return persistence_.erase(key(sequence));
}

Result<std::size_t> ChangeTracker::collect_garbage() {
    std::lock_guard lock(mutex_);
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<std::size_t>(all.error());
    }

    storage::WriteBatch batch;
    for (const auto& record : all.value()) {
        if (record.status == ChangeStatus::Acked) {
            batch.erase(key(record.sequence));
        }
    }
    const std::size_t removed = batch.size();
    if (auto res = persistence_.commit(batch); res.is_error()) {
        return Err<std::size_t>(res.error());
    }
    return Ok(removed);
}

Result<std::size_t> ChangeTracker::recover() {
    std::lock_guard lock(mutex_);
    if (auto res = ensure_loaded_locked(); res.is_error()) {
        return Err<std::size_t>(res.error());
    }
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<std::size_t>(all.error());
    }

    storage::WriteBatch batch;
    for (auto record : all.value()) {
        if (record.status == ChangeStatus::InFlight) {
            record.status = ChangeStatus::Pending;
            record.last_error = "interrupted before acknowledgement";
            batch.put(key(record.sequence), encode(record));
        }
    }
    const std::size_t recovered = batch.size();
    if (auto res = persistence_.commit(batch); res.is_error()) {
        return Err<std::size_t>(res.error());
    }
    if (recovered > 0) {
        spdlog::info("[ChangeTracker] recovered {} in-flight record(s) to pending", recovered);
    }
    return Ok(recovered);
}

Result<std::size_t> ChangeTracker::pending_count() const {
    auto pending = snapshot_pending();
    if (pending.is_error()) {
        return Err<std::size_t>(pending.error());
    }
    return Ok(pending.value().size());
}

Result<void> ChangeTracker::ensure_loaded_locked() {
    if (loaded_) {
        return Ok();
    }

    auto stored = persistence_.get(kNextSequenceKey);
    if (stored.is_error()) {
        return Err<void>(stored.error());
    }
    std::uint64_t next = 1;
    if (stored.value().has_value()) {
        try {
            next = std::stoull(*stored.value());
        } catch (const std::exception&) {
            return Err<void>(ErrorKind::Parse, "Corrupt sequence counter: " + *stored.value());
        }
    }

    // The counter is written with every append; the scan only guards against a hand-edited store.
    auto all = scan_locked();
    if (all.is_error()) {
        return Err<void>(all.error());
    }
    if (!all.value().empty()) {
        next = std::max(next, all.value().back().sequence + 1);
    }

    next_sequence_ = next;
    loaded_ = true;
    return Ok();
}

Result<ChangeRecord> ChangeTracker::load_locked(std::uint64_t sequence) const {
    auto stored = persistence_.get(key(sequence));
    if (stored.is_error()) {
        return Err<ChangeRecord>(stored.error());
    }
    if (!stored.value().has_value()) {
        return Err<ChangeRecord>(ErrorKind::NotFound, "No change record with seq " + std::to_string(sequence));
    }
    return decode<ChangeRecord>(*stored.value());
}

Result<std::vector<ChangeRecord>> ChangeTracker::scan_locked() const {
    auto rows = persistence_.scan(kChangePrefix);
    if (rows.is_error()) {
        return Err<std::vector<ChangeRecord>>(rows.error());
    }

    std::vector<ChangeRecord> out;
    out.reserve(rows.value().size());
    for (const auto& [_, value] : rows.value()) {
        auto record = decode<ChangeRecord>(value);
        if (record.is_error()) {
            return Err<std::vector<ChangeRecord>>(record.error());
        }
        out.push_back(std::move(record.value()));
    }
    return Ok(std::move(out));
}

Result<void> ChangeTracker::transition_locked(std::uint64_t sequence,
                                              ChangeStatus target,
                                              std::optional<std::string> reason,
                                              const storage::WriteBatch& extra) {
    auto loaded = load_locked(sequence);
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    auto record = std::move(loaded.value());
    if (!can_transition(record.status, target)) {
        return Err<void>(ErrorKind::InvalidState,
                         "seq " + std::to_string(sequence) + ": illegal transition " +
                         to_string(record.status) + " -> " + to_string(target));
    }

    if (target == ChangeStatus::InFlight) {
        ++record.attempts;
    }
    record.status = target;
    if (reason.has_value()) {
        record.last_error = std::move(reason);
    }

    storage::WriteBatch batch;
    batch.put(key(sequence), encode(record));
    batch.append(extra);
    return persistence_.commit(batch);
}

bool ChangeTracker::has_later_locked(const std::vector<ChangeRecord>& all, const ChangeRecord& anchor) const {
    return std::any_of(all.begin(), all.end(), [&anchor](const ChangeRecord& r) {
        return same_entity(r, anchor) && r.sequence > anchor.sequence && r.status != ChangeStatus::Acked;
    });
}

void ChangeTracker::stage_rebase_locked(storage::WriteBatch& batch,
                                        const std::vector<ChangeRecord>& all,
                                        const ChangeRecord& anchor,
                                        const std::string& revision) const {
    for (auto record : all) {
        if (record.sequence == anchor.sequence || !same_entity(record, anchor)) {
            continue;
        }
        if (record.status == ChangeStatus::Acked || record.sequence < anchor.sequence) {
            continue;
        }
        if (record.base_revision == revision) {
            continue;
        }
        record.base_revision = revision;
        batch.put(key(record.sequence), encode(record));
    }
}

ChangeRecord ChangeTracker::make_record_locked(const std::string& entity_type,
                                               const std::string& entity_id,
                                               Operation operation,
                                               json payload,
                                               const std::string& base_revision) {
    ChangeRecord record;
    record.sequence = next_sequence_;
    record.client_id = generate_uuid();
    record.entity_type = entity_type;
    record.entity_id = entity_id;
    record.operation = operation;
    record.payload = operation == Operation::Delete ? json() : std::move(payload);
    record.created_at = clock_.now();
    record.status = ChangeStatus::Pending;
    record.base_revision = base_revision;
    return record;
}

} // namespace osync::sync
