#pragma once

#include "osync/version/remote_version.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace osync::version {

/**
 * @brief Capabilities that depend on the remote release
 *
 * The first group selects the sync protocol variant; the second group gates
 * entity types (see SyncConfig::required_features).
 */
enum class FeatureId {
    DeltaPull,
    BatchPush,
    ConditionalPush,
    OfflineSync,
    TrackerApi,
    DataStore,
    AppDataStore,
    TrackerOwnership,
    PotentialDuplicates,
    DataStoreVersioning
};

/**
 * @brief Protocol choices derived from a RemoteCapability
 */
struct ProtocolVariant {
    bool batched_push = false;     ///< several records per push request
    bool delta_pull = false;       ///< cursor-based incremental pull
    bool conditional_push = false; ///< remote rejects pushes with stale base revisions
    std::size_t batch_size = 1;    ///< effective records per push request
};

/**
 * @brief Static capability-by-version lookup
 *
 * Every query is a pure function over a fixed table. supports() is monotonic:
 * once true for a version it stays true for every later version.
 */
class FeatureMatrix {
public:
    [[nodiscard]] static RemoteVersion minimum_version(FeatureId feature) noexcept;

    [[nodiscard]] static bool supports(FeatureId feature, const RemoteCapability& capability) noexcept;
    [[nodiscard]] static bool supports(FeatureId feature, const RemoteVersion& version) noexcept;

    [[nodiscard]] static std::vector<FeatureId> all_features();
    [[nodiscard]] static std::vector<FeatureId> supported_features(const RemoteCapability& capability);

    [[nodiscard]] static const char* feature_name(FeatureId feature) noexcept;
    [[nodiscard]] static std::optional<FeatureId> parse_feature(const std::string& name);

    [[nodiscard]] static ProtocolVariant select_protocol(const RemoteCapability& capability,
                                                         std::size_t configured_batch_size) noexcept;
};

} // namespace osync::version
