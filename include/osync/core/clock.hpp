#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace osync {

/// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
    [[nodiscard]] Timestamp now() const override {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }
};

/// Process-wide SystemClock for components constructed without a clock.
inline const Clock& system_clock() {
    static const SystemClock clock;
    return clock;
}

/**
 * @brief Settable clock for deterministic tests and replays
 */
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    [[nodiscard]] Timestamp now() const override { return now_.load(); }

    void set(Timestamp value) { now_.store(value); }
    void advance(std::int64_t delta_ms) { now_.fetch_add(delta_ms); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace osync
