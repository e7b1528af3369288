#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/error.hpp"
#include "osync/version/remote_version.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace osync::sync {

using json = nlohmann::json;

enum class Operation {
    Create,
    Update,
    Delete
};

/**
 * @brief Lifecycle of a queued local mutation
 *
 * Pending → InFlight → Acked | Failed | Conflicted
 * InFlight → Pending (transient failure, cancellation, crash recovery)
 * Pending → Conflicted (conflict found before the record was pushed)
 */
enum class ChangeStatus {
    Pending,
    InFlight,
    Acked,
    Failed,
    Conflicted
};

/**
 * @brief A durably-queued local mutation awaiting synchronization
 */
struct ChangeRecord {
    std::uint64_t sequence = 0;             ///< Monotonic, assigned at append
    std::string client_id;                  ///< UUID idempotency key, sent with every push
    std::string entity_type;                ///< Also the collection name
    std::string entity_id;
    Operation operation = Operation::Update;
    json payload;                           ///< Full entity document (null for deletes)
    Timestamp created_at = 0;
    ChangeStatus status = ChangeStatus::Pending;
    std::optional<std::string> last_error;
    std::string base_revision;              ///< Server revision the edit was made on; empty if never synced
    std::optional<std::string> conflict_id; ///< Set while status == Conflicted
    std::uint32_t attempts = 0;             ///< Push attempts so far
};

/**
 * @brief Opaque per-collection delta token
 */
struct SyncCursor {
    std::string collection;
    std::string token;
    Timestamp updated_at = 0;
    std::uint64_t generation = 0; ///< Incremented by every commit
};

/**
 * @brief Entity state as reported by a pull
 */
struct RemoteRecord {
    std::string entity_type;
    std::string entity_id;
    std::string revision;
    Timestamp last_updated = 0;
    json payload;
    bool deleted = false;
    std::string origin_client_id; ///< client_id of the mutation that produced this revision, if known
};

enum class ConflictPolicy {
    LastWriteWins,
    RemoteWins,
    LocalWins,
    Manual,
    Merge
};

enum class ConflictOutcome {
    ResolvedLocal,
    ResolvedRemote,
    ResolvedMerged,
    Unresolved
};

enum class ConflictKind {
    UpdateUpdate, ///< both sides changed the entity
    UpdateDelete, ///< local update, remote deletion
    DeleteUpdate  ///< local deletion, remote update
};

/**
 * @brief Detected divergence between a pending local change and the remote
 */
struct ConflictRecord {
    std::string id;
    std::string entity_type;
    std::string entity_id;
    ChangeRecord local_change;
    RemoteRecord remote_snapshot;
    ConflictPolicy policy = ConflictPolicy::LastWriteWins;
    ConflictKind kind = ConflictKind::UpdateUpdate;
    ConflictOutcome outcome = ConflictOutcome::Unresolved;
    Timestamp detected_at = 0;
    std::optional<Timestamp> resolved_at;
    std::string cursor_token; ///< Collection cursor when the conflict was found
};

enum class SessionState {
    Idle,
    Probing,
    Pushing,
    Pulling,
    Reconciling,
    Failed,
    Paused
};

enum class SessionOutcome {
    Completed,
    Failed,
    Paused,
    Cancelled,
    TimedOut
};

struct SessionStats {
    std::size_t pushed = 0;
    std::size_t pulled = 0;
    std::size_t conflicted = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

/**
 * @brief One record-level problem reported by a session
 */
struct SyncIssue {
    std::string entity_type;
    std::string entity_id;
    std::optional<std::uint64_t> sequence;
    ErrorKind kind = ErrorKind::InvalidState;
    std::string message;
};

/**
 * @brief High-level summary of an active or completed sync session
 */
struct SyncSessionInfo {
    std::string session_id;
    Timestamp started_at = 0;
    SessionState state = SessionState::Idle;
    SessionStats stats;
    std::string last_error; ///< Populated when state == Failed or Paused
};

/**
 * @brief What run() reports once a session is back to Idle
 */
struct SessionResult {
    std::string session_id;
    Timestamp started_at = 0;
    Timestamp finished_at = 0;
    SessionOutcome outcome = SessionOutcome::Completed;
    SessionStats stats;
    std::vector<SyncIssue> issues;
    std::vector<std::string> unresolved_entities; ///< Entity ids waiting for manual resolution
    std::vector<std::string> failed_entities;     ///< Entity ids with a terminal push failure
    version::RemoteCapability capability;
    std::optional<Error> error;                   ///< Why the session did not complete

    [[nodiscard]] bool succeeded() const noexcept { return outcome == SessionOutcome::Completed; }
};

const char* to_string(Operation operation) noexcept;
const char* to_string(ChangeStatus status) noexcept;
const char* to_string(ConflictPolicy policy) noexcept;
const char* to_string(ConflictOutcome outcome) noexcept;
const char* to_string(ConflictKind kind) noexcept;
const char* to_string(SessionState state) noexcept;
const char* to_string(SessionOutcome outcome) noexcept;

std::optional<ConflictPolicy> parse_conflict_policy(const std::string& name);

} // namespace osync::sync
