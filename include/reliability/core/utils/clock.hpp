// ============================================================================
// INJECTABLE WALL CLOCK
// ============================================================================
// All timestamps in the engine are milliseconds since the Unix epoch (UTC).
// Hour buckets are calendar hours, so production code uses system_clock,
// not steady_clock.
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace Reliability {

constexpr uint64_t MS_PER_SECOND = 1000;
constexpr uint64_t MS_PER_HOUR = 3600 * MS_PER_SECOND;
constexpr uint64_t MS_PER_DAY = 24 * MS_PER_HOUR;

// Index of the calendar hour containing ts_ms
inline uint64_t hourOf(uint64_t ts_ms) {
    return ts_ms / MS_PER_HOUR;
}

class Clock {
public:
    virtual ~Clock() = default;

    // Current time in milliseconds since epoch
    virtual uint64_t now_ms() const = 0;
};

using ClockPtr = std::shared_ptr<Clock>;

class SystemClock : public Clock {
public:
    uint64_t now_ms() const override {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ).count();
    }
};

/**
 * @class ManualClock
 * @brief Clock that only moves when told to (tests, replay)
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start_ms = 0) : now_(start_ms) {}

    uint64_t now_ms() const override {
        return now_.load(std::memory_order_acquire);
    }

    void set_ms(uint64_t ts_ms) {
        now_.store(ts_ms, std::memory_order_release);
    }

    void advance(std::chrono::milliseconds delta) {
        now_.fetch_add(static_cast<uint64_t>(delta.count()), std::memory_order_acq_rel);
    }

private:
    std::atomic<uint64_t> now_;
};

} // namespace Reliability
