/// @file leaky_bucket.cpp
/// @brief LeakyBucket state transition.

#include "rk/limiter/leaky_bucket.hpp"

#include <algorithm>
#include <cmath>

namespace rk::limiter {

using foundation::durationFromSeconds;
using foundation::elapsedSince;
using foundation::Timestamp;
using foundation::toSeconds;

Transition<QueueState> LeakyBucket::evaluate(const std::optional<QueueState>& prior,
                                             Timestamp now, int64_t cost) const {
    const double capacity = static_cast<double>(config().capacity);
    const double rate = config().refillRate;

    QueueState state = prior.value_or(QueueState{0.0, now});

    double elapsed = toSeconds(elapsedSince(now, state.lastLeakAt));
    state.queueLevel = std::max(0.0, state.queueLevel - elapsed * rate);
    state.lastLeakAt = std::max(state.lastLeakAt, now);

    Transition<QueueState> out;
    out.decision.limit = config().capacity;

    const auto units = static_cast<double>(cost);
    if (state.queueLevel + units <= capacity) {
        state.queueLevel += units;
        out.decision.allowed = true;
    } else {
        out.decision.allowed = false;
        out.decision.retryAfter =
            durationFromSeconds((state.queueLevel + units - capacity) / rate);
    }
    out.decision.remaining =
        std::max<int64_t>(0, static_cast<int64_t>(std::floor(capacity - state.queueLevel)));

    auto drain = durationFromSeconds(state.queueLevel / rate);
    out.decision.resetAt = now + drain;
    out.ttl = roundTtl(drain);
    out.state = state;
    return out;
}

} // namespace rk::limiter
