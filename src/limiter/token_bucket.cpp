/// @file token_bucket.cpp
/// @brief TokenBucket state transition.

#include "rk/limiter/token_bucket.hpp"

#include <algorithm>
#include <cmath>

namespace rk::limiter {

using foundation::durationFromSeconds;
using foundation::elapsedSince;
using foundation::Timestamp;
using foundation::toSeconds;

Transition<BucketState> TokenBucket::evaluate(const std::optional<BucketState>& prior,
                                              Timestamp now, int64_t cost) const {
    const double capacity = static_cast<double>(config().capacity);
    const double rate = config().refillRate;

    // A fresh key starts with a full bucket.
    BucketState state = prior.value_or(BucketState{capacity, now});

    double elapsed = toSeconds(elapsedSince(now, state.lastRefillAt));
    state.tokens = std::min(capacity, state.tokens + elapsed * rate);
    state.lastRefillAt = std::max(state.lastRefillAt, now);

    Transition<BucketState> out;
    out.decision.limit = config().capacity;

    const auto units = static_cast<double>(cost);
    if (state.tokens >= units) {
        state.tokens -= units;
        out.decision.allowed = true;
    } else {
        out.decision.allowed = false;
        out.decision.retryAfter = durationFromSeconds((units - state.tokens) / rate);
    }
    out.decision.remaining = static_cast<int64_t>(std::floor(state.tokens));
    out.decision.resetAt = now + durationFromSeconds((capacity - state.tokens) / rate);

    // After capacity/rate of inactivity the bucket is full again, which is
    // exactly the state of an absent key.
    out.ttl = roundTtl(durationFromSeconds(capacity / rate));
    out.state = state;
    return out;
}

} // namespace rk::limiter
