#pragma once

#include "osync/core/result.hpp"
#include "osync/sync/backoff.hpp"
#include "osync/sync/types.hpp"
#include "osync/version/feature_matrix.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace osync::sync {

/**
 * @brief Immutable settings of one SyncEngine
 *
 * JSON form (every key optional, durations in milliseconds):
 * {
 *   "batch_size": 100, "max_retries": 3,
 *   "backoff_base_ms": 1000, "backoff_cap_ms": 30000,
 *   "conflict_policy": "last_write_wins",
 *   "sync_interval_hint_ms": 300000,
 *   "request_timeout_ms": 30000, "session_timeout_ms": 600000,
 *   "collections": ["patients", "visits"],
 *   "required_features": {"tracker_events": "tracker_api"}
 * }
 */
struct SyncConfig {
    std::size_t batch_size = 100;
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{30000};
    ConflictPolicy conflict_policy = ConflictPolicy::LastWriteWins;
    std::chrono::milliseconds sync_interval_hint{300000}; ///< Advisory; the engine never schedules itself
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds session_timeout{600000};    ///< 0 disables the limit
    std::vector<std::string> collections;                 ///< Pulled in this order
    std::map<std::string, version::FeatureId> required_features; ///< entity type → gating feature

    [[nodiscard]] RetryPolicy retry_policy() const {
        return RetryPolicy{backoff_base, backoff_cap, max_retries};
    }

    /// InvalidArgument describing the first bad setting, if any.
    Result<void> validate() const;
};

Result<SyncConfig> parse_config(const nlohmann::json& document);
Result<SyncConfig> load_config(const std::filesystem::path& path);

} // namespace osync::sync
