#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/result.hpp"
#include "osync/storage/local_persistence.hpp"
#include "osync/sync/entity_store.hpp"
#include "osync/sync/types.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace osync::sync {

/**
 * @brief Durable, append-only intent log of local mutations
 *
 * Every write is one atomic LocalPersistence commit. append() stores the
 * record, the sequence counter and the optimistic local entity value together,
 * so after a crash either all three exist or none does.
 *
 * THREAD SAFETY:
 * All operations serialize on an internal mutex; append() may run while the
 * engine is pushing.
 */
class ChangeTracker {
public:
    ChangeTracker(storage::LocalPersistence& persistence, const Clock& clock);

    ChangeTracker(const ChangeTracker&) = delete;
    ChangeTracker& operator=(const ChangeTracker&) = delete;

    /**
     * @brief Queue a local mutation
     *
     * Assigns the next sequence and a fresh clientId, captures the entity's
     * current server revision as base_revision and updates the local entity.
     * Fails with Storage when the commit fails; nothing is queued then.
     */
    Result<ChangeRecord> append(const std::string& entity_type,
                                const std::string& entity_id,
                                Operation operation,
                                json payload);

    /// Pending records (optionally of one entity type) in ascending sequence order.
    Result<std::vector<ChangeRecord>> snapshot_pending(
        const std::optional<std::string>& entity_type = std::nullopt) const;

    Result<ChangeRecord> get(std::uint64_t sequence) const;

    /// Every stored record, optionally filtered by status, in sequence order.
    Result<std::vector<ChangeRecord>> records(std::optional<ChangeStatus> status = std::nullopt) const;

    /// Stored records of one entity that are not Acked, in sequence order.
    Result<std::vector<ChangeRecord>> entity_queue(const std::string& entity_type,
                                                   const std::string& entity_id) const;

    /// True while a Conflicted or unacknowledged Failed record holds the entity's queue.
    Result<bool> is_blocked(const std::string& entity_type, const std::string& entity_id) const;

    Result<void> mark_in_flight(std::uint64_t sequence);
    Result<void> mark_pending(std::uint64_t sequence, std::optional<std::string> reason = std::nullopt);
    Result<void> mark_acked(std::uint64_t sequence, const std::string& revision, Timestamp last_updated);
    Result<void> mark_failed(std::uint64_t sequence, const std::string& reason);
    Result<void> mark_conflicted(std::uint64_t sequence,
                                 const std::string& conflict_id,
                                 const storage::WriteBatch& extra = {});

    /**
     * @brief Drop a record and rebase the rest of its entity's queue
     *
     * Remaining unacknowledged records of the entity get `rebase_revision` as
     * their base. `extra` commits in the same batch.
     */
    Result<void> discard(std::uint64_t sequence,
                         const std::string& rebase_revision,
                         const storage::WriteBatch& extra = {});

    /**
     * @brief Settle a record in favour of its local payload on top of `base_revision`
     *
     * Without later unacknowledged records of the entity, the record is
     * replaced by a new one (fresh sequence and clientId) carrying `payload`,
     * and the local entity takes `payload`. With later records, which already
     * hold newer local state, the record is dropped and those are rebased.
     * Returns the replacement, or nullopt when the record was dropped.
     */
    Result<std::optional<ChangeRecord>> requeue(std::uint64_t sequence,
                                                Operation operation,
                                                json payload,
                                                const std::string& base_revision,
                                                Timestamp remote_updated,
                                                const storage::WriteBatch& extra = {});

    /**
     * @brief Settle a record in favour of the remote value
     *
     * The record is dropped and later records are rebased on remote.revision.
     * Without later records the local entity takes the remote value; with
     * them it keeps its payload and only moves to the remote revision.
     */
    Result<void> yield_to_remote(std::uint64_t sequence,
                                 const RemoteRecord& remote,
                                 const storage::WriteBatch& extra = {});

    /**
     * @brief Commit one pulled page under the queue lock
     *
     * Records of entities with unsettled local records are handed to `park`;
     * the rest replace the local entity. `tail` is committed first in the same
     * batch. Returns how many records were parked.
     */
    Result<std::size_t> apply_pulled(const std::vector<RemoteRecord>& records,
                                     const std::function<void(storage::WriteBatch&, const RemoteRecord&)>& park,
                                     const storage::WriteBatch& tail = {});

    /// Give every unacknowledged record of the entity `revision` as base.
    Result<void> rebase(const std::string& entity_type,
                        const std::string& entity_id,
                        const std::string& revision,
                        const storage::WriteBatch& extra = {});

    /// Caller has seen a terminal failure; the record is removed and the entity unblocked.
    Result<void> acknowledge_failure(std::uint64_t sequence);

    /// Remove Acked records. Returns how many were removed.
    Result<std::size_t> collect_garbage();

    /// Return InFlight records to Pending after a restart. Returns how many moved.
    Result<std::size_t> recover();

    Result<std::size_t> pending_count() const;

    static std::string key(std::uint64_t sequence);

private:
    Result<void> ensure_loaded_locked();
    Result<ChangeRecord> load_locked(std::uint64_t sequence) const;
    Result<std::vector<ChangeRecord>> scan_locked() const;
    Result<void> transition_locked(std::uint64_t sequence,
                                   ChangeStatus target,
                                   std::optional<std::string> reason,
                                   const storage::WriteBatch& extra);
    void stage_rebase_locked(storage::WriteBatch& batch,
                             const std::vector<ChangeRecord>& all,
                             const ChangeRecord& anchor,
                             const std::string& revision) const;
    bool has_later_locked(const std::vector<ChangeRecord>& all, const ChangeRecord& anchor) const;
    ChangeRecord make_record_locked(const std::string& entity_type,
                                    const std::string& entity_id,
                                    Operation operation,
                                    json payload,
                                    const std::string& base_revision);

    storage::LocalPersistence& persistence_;
    const Clock& clock_;
    EntityStore entities_;
    mutable std::mutex mutex_;
    std::uint64_t next_sequence_ = 1;
    bool loaded_ = false;
};

} // namespace osync::sync
