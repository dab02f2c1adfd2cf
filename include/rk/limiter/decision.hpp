#pragma once

/// @file decision.hpp
/// @brief Outcome of one admission check.

#include <cstdint>
#include <optional>

#include "rk/foundation/clock.hpp"

namespace rk::limiter {

/// Reported when the store could not be consulted.
inline constexpr int64_t kUnknownRemaining = -1;

/// Result of Decide(key, cost). Transient; never persisted.
struct Decision {
    /// Whether the request may proceed.
    bool allowed = false;

    /// Configured capacity (X-RateLimit-Limit).
    int64_t limit = 0;

    /// Best-effort units left after this decision, or kUnknownRemaining.
    int64_t remaining = 0;

    /// When the quota meaningfully refreshes.
    foundation::Timestamp resetAt{};

    /// How long to wait before retrying; set only on denial.
    std::optional<foundation::Duration> retryAfter;

    /// True when the failure policy produced this decision because the
    /// store was unavailable.
    bool degraded = false;
};

} // namespace rk::limiter
