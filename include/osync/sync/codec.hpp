#pragma once

/**
 * @file codec.hpp
 * @brief JSON encoding of sync state for LocalPersistence
 *
 * Every value the engine persists (ChangeRecord, SyncCursor, ConflictRecord,
 * archived SessionResult, cached RemoteCapability, local entities) is stored
 * as a compact JSON document. The to_json/from_json overloads are found by
 * nlohmann::json through ADL, so `json j = record;` and
 * `j.get<ChangeRecord>()` both work.
 *
 * decode<T>() wraps the throwing conversion for callers that report errors
 * through Result: malformed documents become ErrorKind::Parse.
 */

#include "osync/core/result.hpp"
#include "osync/sync/types.hpp"
#include "osync/version/remote_version.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace osync::version {

void to_json(nlohmann::json& j, const RemoteCapability& capability);
void from_json(const nlohmann::json& j, RemoteCapability& capability);

} // namespace osync::version

namespace osync {

NLOHMANN_JSON_SERIALIZE_ENUM(ErrorKind, {
    {ErrorKind::Network, "network"},
    {ErrorKind::Auth, "auth"},
    {ErrorKind::Validation, "validation"},
    {ErrorKind::VersionIncompatible, "version_incompatible"},
    {ErrorKind::ConflictUnresolved, "conflict_unresolved"},
    {ErrorKind::Storage, "storage"},
    {ErrorKind::Parse, "parse"},
    {ErrorKind::NotFound, "not_found"},
    {ErrorKind::InvalidArgument, "invalid_argument"},
    {ErrorKind::InvalidState, "invalid_state"},
    {ErrorKind::Cancelled, "cancelled"},
    {ErrorKind::Timeout, "timeout"},
})

void to_json(nlohmann::json& j, const Error& error);
void from_json(const nlohmann::json& j, Error& error);

} // namespace osync

namespace osync::sync {

NLOHMANN_JSON_SERIALIZE_ENUM(Operation, {
    {Operation::Create, "create"},
    {Operation::Update, "update"},
    {Operation::Delete, "delete"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ChangeStatus, {
    {ChangeStatus::Pending, "pending"},
    {ChangeStatus::InFlight, "in_flight"},
    {ChangeStatus::Acked, "acked"},
    {ChangeStatus::Failed, "failed"},
    {ChangeStatus::Conflicted, "conflicted"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ConflictPolicy, {
    {ConflictPolicy::LastWriteWins, "last_write_wins"},
    {ConflictPolicy::RemoteWins, "remote_wins"},
    {ConflictPolicy::LocalWins, "local_wins"},
    {ConflictPolicy::Manual, "manual"},
    {ConflictPolicy::Merge, "merge"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ConflictOutcome, {
    {ConflictOutcome::ResolvedLocal, "resolved_local"},
    {ConflictOutcome::ResolvedRemote, "resolved_remote"},
    {ConflictOutcome::ResolvedMerged, "resolved_merged"},
    {ConflictOutcome::Unresolved, "unresolved"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(ConflictKind, {
    {ConflictKind::UpdateUpdate, "update_update"},
    {ConflictKind::UpdateDelete, "update_delete"},
    {ConflictKind::DeleteUpdate, "delete_update"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(SessionOutcome, {
    {SessionOutcome::Completed, "completed"},
    {SessionOutcome::Failed, "failed"},
    {SessionOutcome::Paused, "paused"},
    {SessionOutcome::Cancelled, "cancelled"},
    {SessionOutcome::TimedOut, "timed_out"},
})

void to_json(json& j, const ChangeRecord& record);
void from_json(const json& j, ChangeRecord& record);

void to_json(json& j, const SyncCursor& cursor);
void from_json(const json& j, SyncCursor& cursor);

void to_json(json& j, const RemoteRecord& record);
void from_json(const json& j, RemoteRecord& record);

void to_json(json& j, const ConflictRecord& record);
void from_json(const json& j, ConflictRecord& record);

void to_json(json& j, const SessionStats& stats);
void from_json(const json& j, SessionStats& stats);

void to_json(json& j, const SyncIssue& issue);
void from_json(const json& j, SyncIssue& issue);

void to_json(json& j, const SessionResult& result);
void from_json(const json& j, SessionResult& result);

template<typename T>
Result<T> decode(const std::string& text) {
    try {
        return Ok(json::parse(text).get<T>());
    } catch (const json::exception& e) {
        return Err<T>(ErrorKind::Parse, std::string("Corrupt stored document: ") + e.what());
    }
}

inline std::string encode(const json& document) {
    return document.dump();
}

} // namespace osync::sync
