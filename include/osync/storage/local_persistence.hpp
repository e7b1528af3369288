#pragma once

/**
 * @file local_persistence.hpp
 * @brief Transactional key-value contract used by every sync component
 *
 * WHY THIS FILE EXISTS:
 * ChangeTracker, DeltaStore, EntityStore and ConflictResolver all need the
 * same three things from local storage: point reads, ordered prefix scans and
 * atomic multi-key writes that survive a crash. This interface is the only
 * shared mutable resource of the sync engine; nothing writes around it.
 *
 * KEY LAYOUT (owned by the components, listed here for reference):
 * - change/<20-digit sequence>   ChangeRecord
 * - meta/next_sequence           next ChangeRecord sequence
 * - entity/<type>/<id>           LocalEntity
 * - reconcile/<type>/<id>        pulled RemoteRecord awaiting reconciliation
 * - cursor/<collection>          SyncCursor
 * - conflict/<id>                ConflictRecord
 * - meta/capability              cached RemoteCapability
 * - session/last, session/log/*  archived SessionResult
 *
 * DURABILITY:
 * commit() must not return success before the batch is durable. A batch is
 * applied completely or not at all, including across a crash.
 */

#include "osync/core/result.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace osync::storage {

/**
 * @brief Ordered list of puts and erases committed atomically
 */
class WriteBatch {
public:
    struct Op {
        std::string key;
        std::optional<std::string> value; ///< nullopt = erase
    };

    void put(std::string key, std::string value) {
        ops_.push_back({std::move(key), std::move(value)});
    }

    void erase(std::string key) {
        ops_.push_back({std::move(key), std::nullopt});
    }

    void append(const WriteBatch& other) {
        ops_.insert(ops_.end(), other.ops_.begin(), other.ops_.end());
    }

    [[nodiscard]] const std::vector<Op>& ops() const noexcept { return ops_; }
    [[nodiscard]] bool empty() const noexcept { return ops_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return ops_.size(); }

private:
    std::vector<Op> ops_;
};

using KeyValue = std::pair<std::string, std::string>;

class LocalPersistence {
public:
    virtual ~LocalPersistence() = default;

    /// Value for key, nullopt when absent.
    virtual Result<std::optional<std::string>> get(const std::string& key) const = 0;

    /// All entries whose key starts with prefix, in ascending key order.
    virtual Result<std::vector<KeyValue>> scan(const std::string& prefix) const = 0;

    /// Apply every op of the batch atomically and durably.
    virtual Result<void> commit(const WriteBatch& batch) = 0;

    Result<void> put(std::string key, std::string value) {
        WriteBatch batch;
        batch.put(std::move(key), std::move(value));
        return commit(batch);
    }

    Result<void> erase(std::string key) {
        WriteBatch batch;
        batch.erase(std::move(key));
        return commit(batch);
    }
};

} // namespace osync::storage
