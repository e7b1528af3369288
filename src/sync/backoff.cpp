#include "osync/sync/backoff.hpp"

#include <algorithm>

namespace osync::sync {

std::chrono::milliseconds RetryPolicy::ceiling(std::uint32_t attempt) const noexcept {
    if (base.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    const auto limit = std::max(cap, base);
    std::int64_t delay = base.count();
    for (std::uint32_t i = 1; i < attempt && delay < limit.count(); ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds{std::min(delay, limit.count())};
}

std::chrono::milliseconds RetryPolicy::delay_for(std::uint32_t attempt, std::mt19937_64& rng) const {
    const auto top = ceiling(attempt).count();
    if (top <= 1) {
        return std::chrono::milliseconds{top};
    }
    const std::int64_t half = top / 2;
    std::uniform_int_distribution<std::int64_t> jitter(0, top - half);
    return std::chrono::milliseconds{half + jitter(rng)};
}

} // namespace osync::sync
