/// @file sliding_counter.cpp
/// @brief SlidingCounter state transition.

#include "rk/limiter/sliding_counter.hpp"

#include <algorithm>
#include <cmath>

#include "rk/limiter/fixed_window.hpp"

namespace rk::limiter {

using foundation::Duration;
using foundation::durationFromSeconds;
using foundation::elapsedSince;
using foundation::Timestamp;
using foundation::toSeconds;

namespace {

/// Advance the pair of windows so that the current one starts at @p start.
void roll(DualWindowCounter& state, Timestamp start, Duration window) {
    if (start <= state.currentWindowStart) {
        return;
    }
    if (start - state.currentWindowStart == window) {
        state.previousCount = state.currentCount;
    } else {
        // More than one whole window idle: the old counts no longer overlap.
        state.previousCount = 0;
    }
    state.previousWindowStart = start - window;
    state.currentCount = 0;
    state.currentWindowStart = start;
}

} // anonymous namespace

Transition<DualWindowCounter> SlidingCounter::evaluate(
    const std::optional<DualWindowCounter>& prior, Timestamp now, int64_t cost) const {
    const auto window = config().window;
    const auto capacity = static_cast<double>(config().capacity);
    const double windowSecs = toSeconds(window);
    const Timestamp start = alignedWindowStart(now, window);

    DualWindowCounter state =
        prior.value_or(DualWindowCounter{0, start - window, 0, start});
    roll(state, start, window);

    const double elapsed = toSeconds(elapsedSince(now, state.currentWindowStart));
    const double weight = std::clamp(1.0 - elapsed / windowSecs, 0.0, 1.0);
    const auto previous = static_cast<double>(state.previousCount);
    const auto current = static_cast<double>(state.currentCount);
    const double estimated = weight * previous + current;
    const auto units = static_cast<double>(cost);
    const Timestamp windowEnd = state.currentWindowStart + window;

    Transition<DualWindowCounter> out;
    out.decision.limit = config().capacity;

    if (estimated + units <= capacity) {
        state.currentCount += cost;
        out.decision.allowed = true;
        out.decision.remaining =
            std::max<int64_t>(0, static_cast<int64_t>(std::floor(capacity - estimated - units)));
    } else {
        out.decision.allowed = false;
        out.decision.remaining =
            std::max<int64_t>(0, static_cast<int64_t>(std::floor(capacity - estimated)));

        double waitSecs = 0.0;
        if (current + units <= capacity && previous > 0.0) {
            // Fits later in this window once the previous share has decayed.
            double needed = windowSecs * (1.0 - (capacity - current - units) / previous);
            waitSecs = needed - elapsed;
        } else {
            // Only fits in the next window, where this window becomes the previous one.
            double needed = windowSecs * (1.0 - (capacity - units) / current);
            waitSecs = toSeconds(elapsedSince(windowEnd, now)) + needed;
        }
        out.decision.retryAfter = std::max(durationFromSeconds(waitSecs), Duration{1});
    }
    out.decision.resetAt = windowEnd;

    // The current count stops mattering one full window after it closes.
    out.ttl = roundTtl(elapsedSince(windowEnd + window, now));
    out.state = state;
    return out;
}

} // namespace rk::limiter
