#pragma once

/**
 * @file memory_store.hpp
 * @brief In-memory LocalPersistence with thread-safe operations
 *
 * WHY THIS FILE EXISTS:
 * Tests and short-lived clients need a LocalPersistence without touching the
 * disk. Durability is trivially "until process exit", which is exactly what
 * unit tests want.
 *
 * THREAD SAFETY PATTERN:
 * - get/scan take a std::shared_lock (many concurrent readers)
 * - commit takes a std::unique_lock (one writer, blocks readers)
 *
 * WHY std::map AND NOT std::unordered_map:
 * scan() must return keys in ascending order so that change/<sequence> keys
 * come back in sequence order without sorting.
 */

#include "osync/storage/local_persistence.hpp"

#include <map>
#include <shared_mutex>
#include <mutex>

namespace osync::storage {

class MemoryStore : public LocalPersistence {
public:
    MemoryStore() = default;

    Result<std::optional<std::string>> get(const std::string& key) const override {
        std::shared_lock lock(mutex_);

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return Ok(std::optional<std::string>{});
        }
        return Ok(std::optional<std::string>{it->second});
    }

    Result<std::vector<KeyValue>> scan(const std::string& prefix) const override {
        std::shared_lock lock(mutex_);

        std::vector<KeyValue> out;
        for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) {
                break;
            }
            out.emplace_back(it->first, it->second);
        }
        return Ok(std::move(out));
    }

    Result<void> commit(const WriteBatch& batch) override {
        std::unique_lock lock(mutex_);

        for (const auto& op : batch.ops()) {
            if (op.value.has_value()) {
                entries_[op.key] = *op.value;
            } else {
                entries_.erase(op.key);
            }
        }
        return Ok();
    }

    /**
     * Number of stored keys
     * WHY: lets tests assert that garbage collection really removed entries
     */
    std::size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

private:
    std::map<std::string, std::string> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace osync::storage
