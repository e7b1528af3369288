#include "osync/sync/delta_store.hpp"

#include "osync/sync/codec.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>

namespace osync::sync {
namespace {

const std::string kCursorPrefix = "cursor/";
const std::string kParkPrefix = "reconcile/";
const std::string kCapabilityKey = "meta/capability";
const std::string kLastSessionKey = "session/last";
const std::string kSessionLogPrefix = "session/log/";

std::string session_log_key(Timestamp finished_at, const std::string& session_id) {
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "%020lld", static_cast<long long>(finished_at));
    return kSessionLogPrefix + buffer + "-" + session_id;
}

} // namespace

DeltaStore::DeltaStore(storage::LocalPersistence& persistence, const Clock& clock)
    : persistence_(persistence), clock_(clock) {}

std::string DeltaStore::cursor_key(const std::string& collection) {
    return kCursorPrefix + collection;
}

std::string DeltaStore::park_key(const std::string& entity_type, const std::string& entity_id) {
    return kParkPrefix + entity_type + "/" + entity_id;
}

Result<std::optional<SyncCursor>> DeltaStore::get_cursor(const std::string& collection) const {
    auto stored = persistence_.get(cursor_key(collection));
    if (stored.is_error()) {
        return Err<std::optional<SyncCursor>>(stored.error());
    }
    if (!stored.value().has_value()) {
        return Ok(std::optional<SyncCursor>{});
    }
    auto cursor = decode<SyncCursor>(*stored.value());
    if (cursor.is_error()) {
        return Err<std::optional<SyncCursor>>(cursor.error());
    }
    return Ok(std::optional<SyncCursor>{std::move(cursor.value())});
}

Result<SyncCursor> DeltaStore::stage_cursor(storage::WriteBatch& batch,
                                            const std::string& collection,
                                            const std::string& token) const {
    if (collection.empty()) {
        return Err<SyncCursor>(ErrorKind::InvalidArgument, "collection must not be empty");
    }
    if (token.empty()) {
        return Err<SyncCursor>(ErrorKind::InvalidArgument, "refusing to commit empty token for " + collection);
    }

    auto current = get_cursor(collection);
    if (current.is_error()) {
        return Err<SyncCursor>(current.error());
    }

    SyncCursor cursor;
    cursor.collection = collection;
    cursor.token = token;
    cursor.updated_at = clock_.now();
    cursor.generation = current.value() ? current.value()->generation + 1 : 1;
    batch.put(cursor_key(collection), encode(cursor));
    return Ok(std::move(cursor));
}

Result<SyncCursor> DeltaStore::commit_cursor(const std::string& collection,
                                             const std::string& token,
                                             const storage::WriteBatch& extra) {
    std::lock_guard lock(mutex_);
    storage::WriteBatch batch;
    batch.append(extra);
    auto cursor = stage_cursor(batch, collection, token);
    if (cursor.is_error()) {
        return cursor;
    }
    if (auto res = persistence_.commit(batch); res.is_error()) {
        return Err<SyncCursor>(res.error());
    }
    spdlog::debug("[DeltaStore] cursor {} -> {} (gen {})", collection, token, cursor.value().generation);
    return cursor;
}

Result<void> DeltaStore::reset_cursor(const std::string& collection) {
    std::lock_guard lock(mutex_);
    return persistence_.erase(cursor_key(collection));
}

Result<std::vector<SyncCursor>> DeltaStore::cursors() const {
    auto rows = persistence_.scan(kCursorPrefix);
    if (rows.is_error()) {
        return Err<std::vector<SyncCursor>>(rows.error());
    }
    std::vector<SyncCursor> out;
    for (const auto& [_, value] : rows.value()) {
        auto cursor = decode<SyncCursor>(value);
        if (cursor.is_error()) {
            return Err<std::vector<SyncCursor>>(cursor.error());
        }
        out.push_back(std::move(cursor.value()));
    }
    return Ok(std::move(out));
}

void DeltaStore::stage_park(storage::WriteBatch& batch, const RemoteRecord& record) const {
    batch.put(park_key(record.entity_type, record.entity_id), encode(record));
}

void DeltaStore::stage_unpark(storage::WriteBatch& batch,
                              const std::string& entity_type,
                              const std::string& entity_id) const {
    batch.erase(park_key(entity_type, entity_id));
}

Result<std::vector<RemoteRecord>> DeltaStore::parked() const {
    auto rows = persistence_.scan(kParkPrefix);
    if (rows.is_error()) {
        return Err<std::vector<RemoteRecord>>(rows.error());
    }
    std::vector<RemoteRecord> out;
    for (const auto& [_, value] : rows.value()) {
        auto record = decode<RemoteRecord>(value);
        if (record.is_error()) {
            return Err<std::vector<RemoteRecord>>(record.error());
        }
        out.push_back(std::move(record.value()));
    }
    return Ok(std::move(out));
}

Result<void> DeltaStore::save_capability(const version::RemoteCapability& capability) {
    json document = capability;
    return persistence_.put(kCapabilityKey, encode(document));
}

Result<std::optional<version::RemoteCapability>> DeltaStore::load_capability() const {
    using Capability = version::RemoteCapability;

    auto stored = persistence_.get(kCapabilityKey);
    if (stored.is_error()) {
        return Err<std::optional<Capability>>(stored.error());
    }
    if (!stored.value().has_value()) {
        return Ok(std::optional<Capability>{});
    }
    auto capability = decode<Capability>(*stored.value());
    if (capability.is_error()) {
        return Err<std::optional<Capability>>(capability.error());
    }
    return Ok(std::optional<Capability>{capability.value()});
}

Result<void> DeltaStore::archive_session(const SessionResult& result) {
    std::lock_guard lock(mutex_);
    auto rows = persistence_.scan(kSessionLogPrefix);
    if (rows.is_error()) {
        return Err<void>(rows.error());
    }

    json document = result;
    const auto encoded = encode(document);

    storage::WriteBatch batch;
    batch.put(kLastSessionKey, encoded);
    batch.put(session_log_key(result.finished_at, result.session_id), encoded);

    const auto& existing = rows.value();
    if (existing.size() + 1 > kSessionHistoryLimit) {
        const std::size_t excess = existing.size() + 1 - kSessionHistoryLimit;
        for (std::size_t i = 0; i < excess; ++i) {
            batch.erase(existing[i].first);
        }
    }
    return persistence_.commit(batch);
}

Result<std::optional<SessionResult>> DeltaStore::last_session() const {
    auto stored = persistence_.get(kLastSessionKey);
    if (stored.is_error()) {
        return Err<std::optional<SessionResult>>(stored.error());
    }
    if (!stored.value().has_value()) {
        return Ok(std::optional<SessionResult>{});
    }
    auto result = decode<SessionResult>(*stored.value());
    if (result.is_error()) {
        return Err<std::optional<SessionResult>>(result.error());
    }
    return Ok(std::optional<SessionResult>{std::move(result.value())});
}

Result<std::vector<SessionResult>> DeltaStore::session_history() const {
    auto rows = persistence_.scan(kSessionLogPrefix);
    if (rows.is_error()) {
        return Err<std::vector<SessionResult>>(rows.error());
    }
    std::vector<SessionResult> out;
    out.reserve(rows.value().size());
    for (const auto& [_, value] : rows.value()) {
        auto result = decode<SessionResult>(value);
        if (result.is_error()) {
            return Err<std::vector<SessionResult>>(result.error());
        }
        out.push_back(std::move(result.value()));
    }
    return Ok(std::move(out));
}

} // namespace osync::sync
