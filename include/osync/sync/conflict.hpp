#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/result.hpp"
#include "osync/storage/local_persistence.hpp"
#include "osync/sync/change_tracker.hpp"
#include "osync/sync/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace osync::sync {

struct ConflictDecision {
    ConflictOutcome outcome = ConflictOutcome::Unresolved;
    ConflictKind kind = ConflictKind::UpdateUpdate;
    std::optional<json> merged; ///< Set for ResolvedMerged
};

/**
 * @brief Decides and applies the outcome of a local/remote divergence
 *
 * decide() is pure and deterministic. reconcile() and resolve() apply an
 * outcome through ChangeTracker so the queue change, the entity update and
 * the stored ConflictRecord land in one commit.
 */
class ConflictResolver {
public:
    ConflictResolver(storage::LocalPersistence& persistence, ChangeTracker& tracker, const Clock& clock);

    static ConflictDecision decide(const ChangeRecord& local, const RemoteRecord& remote, ConflictPolicy policy);
    static ConflictKind classify(const ChangeRecord& local, const RemoteRecord& remote) noexcept;

    /// Local top-level fields win; fields only the remote has are kept.
    static json merge(const json& local, const json& remote);

    /**
     * @brief Settle `local` (the oldest pending record of the entity) against `remote`
     *
     * `extra` commits together with the outcome; the engine passes the
     * removal of the parked pull entry there.
     */
    Result<ConflictRecord> reconcile(const ChangeRecord& local,
                                     const RemoteRecord& remote,
                                     ConflictPolicy policy,
                                     const std::string& cursor_token,
                                     const storage::WriteBatch& extra = {});

    /// Settle an Unresolved conflict. `outcome` must not be Unresolved.
    Result<ConflictRecord> resolve(const std::string& conflict_id, ConflictOutcome outcome);

    Result<ConflictRecord> get(const std::string& conflict_id) const;
    Result<std::vector<ConflictRecord>> unresolved() const;

    /// Drop stored conflicts that are no longer Unresolved.
    Result<std::size_t> collect_resolved();

    static std::string key(const std::string& conflict_id);

private:
    Result<void> apply(ConflictRecord& conflict,
                       const ConflictDecision& decision,
                       const storage::WriteBatch& extra);

    storage::LocalPersistence& persistence_;
    ChangeTracker& tracker_;
    const Clock& clock_;
};

} // namespace osync::sync
