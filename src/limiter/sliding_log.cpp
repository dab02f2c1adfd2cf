/// @file sliding_log.cpp
/// @brief SlidingLog state transition.

#include "rk/limiter/sliding_log.hpp"

#include <algorithm>

namespace rk::limiter {

using foundation::Duration;
using foundation::elapsedSince;
using foundation::Timestamp;

Transition<TimestampLog> SlidingLog::evaluate(const std::optional<TimestampLog>& prior,
                                              Timestamp now, int64_t cost) const {
    const auto window = config().window;
    const int64_t capacity = config().capacity;

    TimestampLog state = prior.value_or(TimestampLog{});

    // Prune: an entry counts while at >= now - window.
    const Timestamp horizon = now - window;
    auto firstLive = std::find_if(state.entries.begin(), state.entries.end(),
                                  [horizon](const LogEntry& e) { return e.at >= horizon; });
    state.entries.erase(state.entries.begin(), firstLive);

    int64_t used = 0;
    for (const auto& entry : state.entries) {
        used += entry.weight;
    }

    Transition<TimestampLog> out;
    out.decision.limit = capacity;

    if (used + cost <= capacity) {
        // Appends never go behind the newest entry, keeping the log ordered.
        Timestamp at = state.entries.empty() ? now : std::max(now, state.entries.back().at);
        if (!state.entries.empty() && state.entries.back().at == at) {
            state.entries.back().weight += cost;
        } else {
            state.entries.push_back(LogEntry{at, cost});
        }
        used += cost;
        out.decision.allowed = true;
    } else {
        // Wait until enough of the oldest weight has aged out for cost to fit.
        const int64_t excess = used + cost - capacity;
        int64_t freed = 0;
        Timestamp agesOut = now;
        for (const auto& entry : state.entries) {
            freed += entry.weight;
            if (freed >= excess) {
                agesOut = entry.at + window + Duration{1};
                break;
            }
        }
        out.decision.allowed = false;
        out.decision.retryAfter = std::max(elapsedSince(agesOut, now), Duration{1});
    }
    out.decision.remaining = std::max<int64_t>(0, capacity - used);
    out.decision.resetAt =
        state.entries.empty() ? now : state.entries.front().at + window + Duration{1};

    // The newest entry still counts at exactly newest + window; keep the
    // record one tick beyond that.
    Timestamp newest = state.entries.empty() ? now : state.entries.back().at;
    out.ttl = roundTtl(elapsedSince(newest + window + Duration{1}, now));
    out.state = std::move(state);
    return out;
}

} // namespace rk::limiter
