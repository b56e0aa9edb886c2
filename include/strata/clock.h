#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace strata {

// Microseconds since the Unix epoch
using Timestamp = uint64_t;

// Durations are expressed in the same unit as Timestamp
using Duration = uint64_t;

constexpr Duration kMicrosPerSecond = 1000000ULL;
constexpr Duration kMicrosPerHour = 3600ULL * kMicrosPerSecond;
constexpr Duration kMicrosPerDay = 24ULL * kMicrosPerHour;

// Source of created_at / dropped_at timestamps
class Clock {
public:
    virtual ~Clock() = default;

    // Never goes backwards between calls
    virtual Timestamp Now() = 0;
};

// Wall clock, clamped so that consecutive readings never decrease
class SystemClock : public Clock {
public:
    SystemClock() : last_(0) {}

    Timestamp Now() override {
        auto now = static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        Timestamp prev = last_.load(std::memory_order_acquire);
        while (now > prev &&
               !last_.compare_exchange_weak(prev, now, std::memory_order_acq_rel)) {
        }
        return now > prev ? now : prev;
    }

private:
    std::atomic<Timestamp> last_;
};

// Manually driven clock for tests and deterministic replays
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = kMicrosPerDay) : now_(start) {}

    Timestamp Now() override { return now_.load(std::memory_order_acquire); }

    void Set(Timestamp ts) { now_.store(ts, std::memory_order_release); }
    void Advance(Duration d) { now_.fetch_add(d, std::memory_order_acq_rel); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace strata
