#pragma once

#include "osync/core/result.hpp"
#include "osync/storage/local_persistence.hpp"
#include "osync/sync/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace osync::sync {

/**
 * @brief Local materialized copy of one entity
 *
 * `revision` is the last server revision this copy is known to be based on;
 * pending local edits change `payload` but not `revision`. Deletions are kept
 * as tombstones so the revision survives.
 */
struct LocalEntity {
    std::string entity_type;
    std::string entity_id;
    json payload;
    std::string revision;
    Timestamp last_updated = 0;
    bool deleted = false;
};

void to_json(json& j, const LocalEntity& entity);
void from_json(const json& j, LocalEntity& entity);

/**
 * @brief Local entity state stored under entity/<type>/<id>
 *
 * The stage_* methods only add operations to a caller-owned WriteBatch so
 * that entity updates can commit atomically with ChangeTracker and
 * reconciliation writes.
 */
class EntityStore {
public:
    explicit EntityStore(storage::LocalPersistence& persistence);

    Result<std::optional<LocalEntity>> get(const std::string& entity_type,
                                           const std::string& entity_id) const;

    Result<std::vector<LocalEntity>> list(const std::string& entity_type) const;

    /// Remote value becomes the local value (pull without pending local edits).
    Result<void> apply_remote(const RemoteRecord& record);

    void stage_remote(storage::WriteBatch& batch, const RemoteRecord& record) const;

    void stage_local(storage::WriteBatch& batch,
                     const std::optional<LocalEntity>& current,
                     const std::string& entity_type,
                     const std::string& entity_id,
                     Operation operation,
                     const json& payload,
                     Timestamp now) const;

    void stage_revision(storage::WriteBatch& batch,
                        LocalEntity entity,
                        const std::string& revision,
                        Timestamp last_updated) const;

    static std::string key(const std::string& entity_type, const std::string& entity_id);

private:
    storage::LocalPersistence& persistence_;
};

} // namespace osync::sync
