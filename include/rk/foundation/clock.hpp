#pragma once

/// @file clock.hpp
/// @brief Injectable time source used by every algorithm and the memory store.
///
/// Timestamps are wall-clock based so that state written by one host can be
/// interpreted by another through a shared store, while SystemClock advances
/// them with the steady clock so that local arithmetic stays monotonic.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace rk::foundation {

/// Microsecond duration used for windows, TTLs and retry hints.
using Duration = std::chrono::microseconds;

/// Wall-clock time point with microsecond resolution.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, Duration>;

/// Abstract time source.
class Clock {
public:
    virtual ~Clock() = default;

    /// Current time.
    [[nodiscard]] virtual Timestamp now() const = 0;
};

/// Wall clock anchored at construction and advanced by the steady clock.
///
/// Never goes backwards within one process even if the system clock is
/// stepped by NTP. Different processes may still disagree (cross-host skew),
/// which the algorithms tolerate by clamping elapsed time at zero.
class SystemClock final : public Clock {
public:
    SystemClock();

    [[nodiscard]] Timestamp now() const override;

private:
    Timestamp wallAnchor_;
    std::chrono::steady_clock::time_point steadyAnchor_;
};

/// Manually driven clock for deterministic tests and simulations.
///
/// Thread-safe: time is held in an atomic microsecond counter.
class ManualClock final : public Clock {
public:
    explicit ManualClock(Timestamp start = Timestamp{});

    [[nodiscard]] Timestamp now() const override;

    /// Jump to an absolute time (may move backwards to simulate skew).
    void set(Timestamp t);

    /// Move forward (or backward, for negative values) by @p d.
    void advance(Duration d);

private:
    std::atomic<int64_t> micros_;
};

/// Shared process-wide SystemClock instance.
[[nodiscard]] std::shared_ptr<const Clock> systemClock();

/// Convert a duration to fractional seconds.
[[nodiscard]] constexpr double toSeconds(Duration d) {
    return static_cast<double>(d.count()) / 1'000'000.0;
}

/// Convert fractional seconds to a duration, rounding up to the next microsecond.
/// Negative and NaN inputs yield zero.
[[nodiscard]] Duration durationFromSeconds(double seconds);

/// later - earlier, clamped at zero.
[[nodiscard]] constexpr Duration elapsedSince(Timestamp later, Timestamp earlier) {
    return later > earlier ? later - earlier : Duration::zero();
}

/// Microseconds since the Unix epoch.
[[nodiscard]] constexpr int64_t toEpochMicros(Timestamp t) {
    return t.time_since_epoch().count();
}

/// Build a Timestamp from microseconds since the Unix epoch.
[[nodiscard]] constexpr Timestamp fromEpochMicros(int64_t micros) {
    return Timestamp{Duration{micros}};
}

} // namespace rk::foundation
