#pragma once

/// @file limiter_state.hpp
/// @brief Per-key state records and their store encoding.
///
/// Records are encoded as "v1;<tag>;<field>;..." text. Doubles use the
/// shortest representation that parses back to the identical value and
/// timestamps are integral epoch microseconds, so decode(encode(s)) == s.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "rk/foundation/clock.hpp"
#include "rk/foundation/limiter_result.hpp"

namespace rk::limiter {

/// Token bucket: 0 <= tokens <= capacity.
struct BucketState {
    double tokens = 0.0;
    foundation::Timestamp lastRefillAt{};

    bool operator==(const BucketState&) const = default;
};

/// Leaky bucket: 0 <= queueLevel <= capacity.
struct QueueState {
    double queueLevel = 0.0;
    foundation::Timestamp lastLeakAt{};

    bool operator==(const QueueState&) const = default;
};

/// Fixed window counter.
struct WindowCounter {
    int64_t count = 0;
    foundation::Timestamp windowStart{};

    bool operator==(const WindowCounter&) const = default;
};

/// One sliding-log record: @p weight units admitted at @p at.
struct LogEntry {
    foundation::Timestamp at{};
    int64_t weight = 1;

    bool operator==(const LogEntry&) const = default;
};

/// Sliding window log; entries ordered by time, oldest first.
struct TimestampLog {
    std::vector<LogEntry> entries;

    bool operator==(const TimestampLog&) const = default;
};

/// Sliding window counter: currentWindowStart == previousWindowStart + window.
struct DualWindowCounter {
    int64_t previousCount = 0;
    foundation::Timestamp previousWindowStart{};
    int64_t currentCount = 0;
    foundation::Timestamp currentWindowStart{};

    bool operator==(const DualWindowCounter&) const = default;
};

[[nodiscard]] std::string encodeState(const BucketState& s);
[[nodiscard]] std::string encodeState(const QueueState& s);
[[nodiscard]] std::string encodeState(const WindowCounter& s);
[[nodiscard]] std::string encodeState(const TimestampLog& s);
[[nodiscard]] std::string encodeState(const DualWindowCounter& s);

/// Decode into @p out. @return CorruptState on a malformed or foreign record.
[[nodiscard]] foundation::LimiterResult<void> decodeState(std::string_view raw, BucketState& out);
[[nodiscard]] foundation::LimiterResult<void> decodeState(std::string_view raw, QueueState& out);
[[nodiscard]] foundation::LimiterResult<void> decodeState(std::string_view raw, WindowCounter& out);
[[nodiscard]] foundation::LimiterResult<void> decodeState(std::string_view raw, TimestampLog& out);
[[nodiscard]] foundation::LimiterResult<void> decodeState(std::string_view raw, DualWindowCounter& out);

} // namespace rk::limiter
