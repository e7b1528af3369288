#pragma once

#include "osync/core/clock.hpp"
#include "osync/core/result.hpp"
#include "osync/remote/remote_service.hpp"
#include "osync/version/remote_version.hpp"

#include <chrono>
#include <optional>

namespace osync::version {

/**
 * @brief Detects the remote release once per session
 */
class VersionProbe {
public:
    VersionProbe(remote::RemoteDataService& remote, const Clock& clock, std::chrono::milliseconds timeout);

    /// Fresh capability (stale == false). Network, Auth or Parse on failure.
    Result<RemoteCapability> probe() const;

    /// Cached capability marked stale, or the minimum supported version when nothing is cached.
    RemoteCapability fallback(const std::optional<RemoteCapability>& cached) const;

private:
    remote::RemoteDataService& remote_;
    const Clock& clock_;
    std::chrono::milliseconds timeout_;
};

} // namespace osync::version
