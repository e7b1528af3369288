/**
 * @file events.hpp
 * @brief Event types emitted by the sync engine
 *
 * WHY THIS FILE EXISTS:
 * Defines every event the engine publishes on the EventBus. Applications
 * use them for progress UI and diagnostics; LoggerComponent and
 * MetricsComponent are the built-in subscribers.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: SyncStateChangedEvent, ConflictDetectedEvent
 * - Timestamps come from the engine's Clock, so tests see ManualClock time
 */

#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/error.hpp"
#include "osync/sync/types.hpp"

#include <cstdint>
#include <string>

namespace osync::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted on every engine state transition
 *
 * WHO EMITS:
 * - SyncEngine, including the final return to Idle
 *
 * WHO SUBSCRIBES:
 * - Logger (trace the session)
 * - Applications (show "syncing..." indicators)
 */
struct SyncStateChangedEvent {
    std::string session_id;
    sync::SessionState from = sync::SessionState::Idle;
    sync::SessionState to = sync::SessionState::Idle;
    Timestamp timestamp = 0;
};

struct SyncSessionStartedEvent {
    std::string session_id;
    std::size_t pending_records = 0;
    Timestamp timestamp = 0;
};

/**
 * @brief Emitted once per session, after the result is archived
 */
struct SyncSessionCompletedEvent {
    sync::SessionResult result;
    Timestamp timestamp = 0;
};

/**
 * @brief Emitted after every push batch and pull page
 */
struct SyncProgressEvent {
    std::string session_id;
    sync::SessionState phase = sync::SessionState::Idle;
    std::string collection; ///< Entity type of the batch or pulled collection
    std::size_t completed = 0;
    std::size_t total = 0;  ///< 0 when unknown (pull)
    Timestamp timestamp = 0;
};

// ════════════════════════════════════════════════════════
// Record Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the remote rejects a record for good
 *
 * The entity stays blocked until ChangeTracker::acknowledge_failure().
 */
struct ChangeRecordFailedEvent {
    std::string session_id;
    std::uint64_t sequence = 0;
    std::string entity_type;
    std::string entity_id;
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
    Timestamp timestamp = 0;
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

struct ConflictDetectedEvent {
    std::string session_id;
    sync::ConflictRecord conflict;
    Timestamp timestamp = 0;
};

/**
 * @brief Emitted for automatic resolutions and for resolve_conflict() calls
 *
 * session_id is empty when the resolution came from the application.
 */
struct ConflictResolvedEvent {
    std::string session_id;
    sync::ConflictRecord conflict;
    Timestamp timestamp = 0;
};

} // namespace osync::events
