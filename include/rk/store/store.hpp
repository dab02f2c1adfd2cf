#pragma once

/// @file store.hpp
/// @brief Key/value store abstraction holding all per-key limiter state.
///
/// Every algorithm persists its state exclusively through these atomic
/// primitives. Implementations must make each call all-or-nothing: a call
/// that fails or times out leaves the key either fully updated or untouched.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rk/foundation/clock.hpp"
#include "rk/foundation/limiter_result.hpp"

namespace rk::store {

/// Point in (local, monotonic) time by which a store call must complete.
using Deadline = std::chrono::steady_clock::time_point;

/// Deadline @p timeout from now.
[[nodiscard]] inline Deadline deadlineAfter(std::chrono::milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

/// Abstract key/value store with TTL expiry.
///
/// Expired entries are indistinguishable from absent ones. A TTL must be
/// positive; implementations reject zero or negative TTLs with
/// InvalidArgument.
class Store {
public:
    virtual ~Store() = default;

    /// Read the current value, or nullopt if absent/expired.
    [[nodiscard]] virtual foundation::LimiterResult<std::optional<std::string>> get(
        std::string_view key, Deadline deadline) = 0;

    /// Unconditionally write @p value with a fresh TTL.
    [[nodiscard]] virtual foundation::LimiterResult<void> set(
        std::string_view key, std::string_view value,
        foundation::Duration ttl, Deadline deadline) = 0;

    /// Atomically add @p delta to an integer value (absent counts as 0),
    /// refresh the TTL and return the new value.
    [[nodiscard]] virtual foundation::LimiterResult<int64_t> increment(
        std::string_view key, int64_t delta,
        foundation::Duration ttl, Deadline deadline) = 0;

    /// Atomically replace the value with @p desired if the current value
    /// equals @p expected (nullopt meaning "must be absent").
    /// @return true if the swap happened, false on a conflicting value.
    [[nodiscard]] virtual foundation::LimiterResult<bool> compareAndSwap(
        std::string_view key, const std::optional<std::string>& expected,
        std::string_view desired, foundation::Duration ttl, Deadline deadline) = 0;

    /// Delete the key. @return true if a live entry was removed.
    [[nodiscard]] virtual foundation::LimiterResult<bool> remove(
        std::string_view key, Deadline deadline) = 0;
};

} // namespace rk::store
