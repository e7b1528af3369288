#include "osync/version/feature_matrix.hpp"

#include <algorithm>
#include <array>

namespace osync::version {
namespace {

struct FeatureEntry {
    FeatureId id;
    const char* name;
    RemoteVersion minimum;
};

constexpr std::array<FeatureEntry, 10> kFeatureTable{{
    {FeatureId::DeltaPull, "delta_pull", {2, 36, 0}},
    {FeatureId::BatchPush, "batch_push", {2, 37, 0}},
    {FeatureId::ConditionalPush, "conditional_push", {2, 39, 0}},
    {FeatureId::OfflineSync, "offline_sync", {2, 40, 0}},
    {FeatureId::TrackerApi, "tracker_api", {2, 36, 0}},
    {FeatureId::DataStore, "data_store", {2, 36, 0}},
    {FeatureId::AppDataStore, "app_data_store", {2, 38, 0}},
    {FeatureId::TrackerOwnership, "tracker_ownership", {2, 38, 0}},
    {FeatureId::PotentialDuplicates, "potential_duplicates", {2, 39, 0}},
    {FeatureId::DataStoreVersioning, "data_store_versioning", {2, 42, 0}},
}};

const FeatureEntry& entry_for(FeatureId feature) noexcept {
    for (const auto& entry : kFeatureTable) {
        if (entry.id == feature) {
            return entry;
        }
    }
    // Every enumerator has a row; unreachable for valid values.
    return kFeatureTable.front();
}

} // namespace

RemoteVersion FeatureMatrix::minimum_version(FeatureId feature) noexcept {
    return entry_for(feature).minimum;
}

bool FeatureMatrix::supports(FeatureId feature, const RemoteVersion& version) noexcept {
    return version >= entry_for(feature).minimum;
}

bool FeatureMatrix::supports(FeatureId feature, const RemoteCapability& capability) noexcept {
    return supports(feature, capability.version());
}

std::vector<FeatureId> FeatureMatrix::all_features() {
    std::vector<FeatureId> features;
    features.reserve(kFeatureTable.size());
    for (const auto& entry : kFeatureTable) {
        features.push_back(entry.id);
    }
    return features;
}

std::vector<FeatureId> FeatureMatrix::supported_features(const RemoteCapability& capability) {
    std::vector<FeatureId> features;
    for (const auto& entry : kFeatureTable) {
        if (capability.version() >= entry.minimum) {
            features.push_back(entry.id);
        }
    }
    return features;
}

const char* FeatureMatrix::feature_name(FeatureId feature) noexcept {
    return entry_for(feature).name;
}

std::optional<FeatureId> FeatureMatrix::parse_feature(const std::string& name) {
    const auto it = std::find_if(kFeatureTable.begin(), kFeatureTable.end(),
                                 [&name](const FeatureEntry& entry) { return name == entry.name; });
    if (it == kFeatureTable.end()) {
        return std::nullopt;
    }
    return it->id;
}

ProtocolVariant FeatureMatrix::select_protocol(const RemoteCapability& capability,
                                               std::size_t configured_batch_size) noexcept {
    ProtocolVariant variant;
    variant.batched_push = supports(FeatureId::BatchPush, capability);
    variant.delta_pull = supports(FeatureId::DeltaPull, capability);
    variant.conditional_push = supports(FeatureId::ConditionalPush, capability);
    variant.batch_size = variant.batched_push ? std::max<std::size_t>(1, configured_batch_size) : 1;
    return variant;
}

} // namespace osync::version
