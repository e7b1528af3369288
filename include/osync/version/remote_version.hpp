#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/result.hpp"

#include <cstdint>
#include <string>
#include <tuple>

namespace osync::version {

/**
 * @brief Semantic version reported by the remote service
 *
 * Ordering compares major, minor and patch only; build suffixes such as
 * "-SNAPSHOT" are accepted by parse() and dropped.
 */
struct RemoteVersion {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;

    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Parse "2.40", "2.40.1", "2.41-SNAPSHOT", "2.38.2.1"
     *
     * Needs at least two numeric components. A non-numeric third component
     * is read as patch 0.
     */
    static Result<RemoteVersion> parse(const std::string& text);
};

inline bool operator==(const RemoteVersion& lhs, const RemoteVersion& rhs) {
    return std::tie(lhs.major, lhs.minor, lhs.patch) == std::tie(rhs.major, rhs.minor, rhs.patch);
}
inline bool operator!=(const RemoteVersion& lhs, const RemoteVersion& rhs) { return !(lhs == rhs); }
inline bool operator<(const RemoteVersion& lhs, const RemoteVersion& rhs) {
    return std::tie(lhs.major, lhs.minor, lhs.patch) < std::tie(rhs.major, rhs.minor, rhs.patch);
}
inline bool operator>(const RemoteVersion& lhs, const RemoteVersion& rhs) { return rhs < lhs; }
inline bool operator<=(const RemoteVersion& lhs, const RemoteVersion& rhs) { return !(rhs < lhs); }
inline bool operator>=(const RemoteVersion& lhs, const RemoteVersion& rhs) { return !(lhs < rhs); }

/// Oldest remote release the engine talks to; assumed when nothing better is known.
inline constexpr RemoteVersion kMinimumSupportedVersion{2, 35, 0};

/**
 * @brief Detected version snapshot of the remote service
 */
struct RemoteCapability {
    std::uint32_t major_version = kMinimumSupportedVersion.major;
    std::uint32_t minor_version = kMinimumSupportedVersion.minor;
    std::uint32_t patch_version = kMinimumSupportedVersion.patch;
    Timestamp probed_at = 0;
    bool stale = false; ///< true when a failed probe reused an older value

    [[nodiscard]] RemoteVersion version() const {
        return RemoteVersion{major_version, minor_version, patch_version};
    }

    static RemoteCapability from_version(const RemoteVersion& v, Timestamp probed_at, bool stale) {
        RemoteCapability capability;
        capability.major_version = v.major;
        capability.minor_version = v.minor;
        capability.patch_version = v.patch;
        capability.probed_at = probed_at;
        capability.stale = stale;
        return capability;
    }
};

} // namespace osync::version
