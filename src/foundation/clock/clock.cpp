/// @file clock.cpp
/// @brief SystemClock / ManualClock implementation.

#include "rk/foundation/clock.hpp"

#include <cmath>
#include <limits>

namespace rk::foundation {

SystemClock::SystemClock()
    : wallAnchor_(std::chrono::time_point_cast<Duration>(std::chrono::system_clock::now())),
      steadyAnchor_(std::chrono::steady_clock::now()) {}

Timestamp SystemClock::now() const {
    auto elapsed = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - steadyAnchor_);
    return wallAnchor_ + elapsed;
}

ManualClock::ManualClock(Timestamp start)
    : micros_(toEpochMicros(start)) {}

Timestamp ManualClock::now() const {
    return fromEpochMicros(micros_.load(std::memory_order_acquire));
}

void ManualClock::set(Timestamp t) {
    micros_.store(toEpochMicros(t), std::memory_order_release);
}

void ManualClock::advance(Duration d) {
    micros_.fetch_add(d.count(), std::memory_order_acq_rel);
}

std::shared_ptr<const Clock> systemClock() {
    static const auto instance = std::make_shared<SystemClock>();
    return instance;
}

Duration durationFromSeconds(double seconds) {
    if (!(seconds > 0.0)) {
        return Duration::zero();
    }
    // Absorb representation error so that e.g. 0.1 s maps to 100000 us, not 100001.
    double micros = std::ceil(seconds * 1'000'000.0 - 1e-6);
    if (micros >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return Duration::max();
    }
    return Duration{static_cast<int64_t>(micros)};
}

} // namespace rk::foundation
