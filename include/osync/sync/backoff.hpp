#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace osync::sync {

/**
 * @brief Exponential backoff with equal jitter
 *
 * Attempt n (1-based) waits between half and all of min(cap, base * 2^(n-1)).
 */
struct RetryPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{30000};
    std::uint32_t max_retries = 3; ///< Retries after the first attempt

    [[nodiscard]] std::chrono::milliseconds ceiling(std::uint32_t attempt) const noexcept;
    [[nodiscard]] std::chrono::milliseconds delay_for(std::uint32_t attempt, std::mt19937_64& rng) const;
    [[nodiscard]] bool exhausted(std::uint32_t retries_done) const noexcept { return retries_done >= max_retries; }
};

} // namespace osync::sync
