/// @file fixed_window.cpp
/// @brief FixedWindow state transition.

#include "rk/limiter/fixed_window.hpp"

#include <algorithm>

namespace rk::limiter {

using foundation::Duration;
using foundation::elapsedSince;
using foundation::Timestamp;

Timestamp alignedWindowStart(Timestamp now, Duration window) {
    const int64_t w = window.count();
    const int64_t t = foundation::toEpochMicros(now);
    int64_t index = t / w;
    if (t % w != 0 && t < 0) {
        --index; // floor, not truncation
    }
    return foundation::fromEpochMicros(index * w);
}

Transition<WindowCounter> FixedWindow::evaluate(const std::optional<WindowCounter>& prior,
                                                Timestamp now, int64_t cost) const {
    const auto window = config().window;
    const Timestamp currentStart = alignedWindowStart(now, window);

    WindowCounter state = prior.value_or(WindowCounter{0, currentStart});
    // Roll over lazily. A stored window ahead of our clock (skew) is kept.
    if (state.windowStart < currentStart) {
        state = WindowCounter{0, currentStart};
    }

    const Timestamp windowEnd = state.windowStart + window;

    Transition<WindowCounter> out;
    out.decision.limit = config().capacity;
    if (state.count + cost <= config().capacity) {
        state.count += cost;
        out.decision.allowed = true;
    } else {
        out.decision.allowed = false;
        out.decision.retryAfter = elapsedSince(windowEnd, now);
    }
    out.decision.remaining = std::max<int64_t>(0, config().capacity - state.count);
    out.decision.resetAt = windowEnd;

    out.ttl = roundTtl(elapsedSince(windowEnd, now));
    out.state = state;
    return out;
}

} // namespace rk::limiter
