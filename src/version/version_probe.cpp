#include "osync/version/version_probe.hpp"

#include <spdlog/spdlog.h>

namespace osync::version {

VersionProbe::VersionProbe(remote::RemoteDataService& remote, const Clock& clock, std::chrono::milliseconds timeout)
    : remote_(remote), clock_(clock), timeout_(timeout) {}

Result<RemoteCapability> VersionProbe::probe() const {
    auto info = remote_.get_server_info(timeout_);
    if (info.is_error()) {
        spdlog::warn("[VersionProbe] server info failed: {} ({})", info.error().message, to_string(info.error().kind));
        return Err<RemoteCapability>(info.error());
    }

    auto parsed = RemoteVersion::parse(info.value());
    if (parsed.is_error()) {
        spdlog::warn("[VersionProbe] unparseable version '{}'", info.value());
        return Err<RemoteCapability>(parsed.error());
    }

    if (parsed.value() < kMinimumSupportedVersion) {
        spdlog::warn("[VersionProbe] remote {} is older than {}; using the minimum feature set",
                     parsed.value().to_string(), kMinimumSupportedVersion.to_string());
    }
    spdlog::debug("[VersionProbe] remote version {}", parsed.value().to_string());
    return Ok(RemoteCapability::from_version(parsed.value(), clock_.now(), false));
}

RemoteCapability VersionProbe::fallback(const std::optional<RemoteCapability>& cached) const {
    if (cached.has_value()) {
        auto capability = *cached;
        capability.stale = true;
        return capability;
    }
    return RemoteCapability::from_version(kMinimumSupportedVersion, clock_.now(), true);
}

} // namespace osync::version
