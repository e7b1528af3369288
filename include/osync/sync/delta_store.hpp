#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/result.hpp"
#include "osync/storage/local_persistence.hpp"
#include "osync/sync/types.hpp"
#include "osync/version/remote_version.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace osync::sync {

/**
 * @brief Pull cursors and session bookkeeping
 *
 * A cursor only moves forward through commit_cursor(), and only after the
 * records it covers are applied or parked. Passing those writes as `extra`
 * makes the page and its cursor one commit. Re-applying a page after a crash
 * is harmless because pulled records are keyed by entity id.
 */
class DeltaStore {
public:
    static constexpr std::size_t kSessionHistoryLimit = 50;

    DeltaStore(storage::LocalPersistence& persistence, const Clock& clock);

    DeltaStore(const DeltaStore&) = delete;
    DeltaStore& operator=(const DeltaStore&) = delete;

    Result<std::optional<SyncCursor>> get_cursor(const std::string& collection) const;

    /// Rejects an empty token with InvalidArgument. Bumps the cursor generation.
    Result<SyncCursor> commit_cursor(const std::string& collection,
                                     const std::string& token,
                                     const storage::WriteBatch& extra = {});

    /// Adds the cursor write to a caller-owned batch; same checks as commit_cursor().
    Result<SyncCursor> stage_cursor(storage::WriteBatch& batch,
                                    const std::string& collection,
                                    const std::string& token) const;

    /// Next pull of the collection starts from a full snapshot.
    Result<void> reset_cursor(const std::string& collection);

    Result<std::vector<SyncCursor>> cursors() const;

    /// Pulled records waiting for reconciliation against local edits.
    void stage_park(storage::WriteBatch& batch, const RemoteRecord& record) const;
    void stage_unpark(storage::WriteBatch& batch, const std::string& entity_type, const std::string& entity_id) const;
    Result<std::vector<RemoteRecord>> parked() const;

    Result<void> save_capability(const version::RemoteCapability& capability);
    Result<std::optional<version::RemoteCapability>> load_capability() const;

    /// Stores the result as last session and appends it to the bounded history.
    Result<void> archive_session(const SessionResult& result);
    Result<std::optional<SessionResult>> last_session() const;

    /// Oldest first, at most kSessionHistoryLimit entries.
    Result<std::vector<SessionResult>> session_history() const;

    static std::string cursor_key(const std::string& collection);
    static std::string park_key(const std::string& entity_type, const std::string& entity_id);

private:
    storage::LocalPersistence& persistence_;
    const Clock& clock_;
    mutable std::mutex mutex_;
};

} // namespace osync::sync
