#pragma once

/// @file limiter_config.hpp
/// @brief Quota configuration: algorithm choice, parameters and failure policy.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rk/foundation/clock.hpp"
#include "rk/foundation/config_manager.hpp"
#include "rk/foundation/limiter_result.hpp"

namespace rk::limiter {

/// The closed set of admission strategies.
enum class AlgorithmKind : uint8_t {
    TokenBucket,
    LeakyBucket,
    FixedWindow,
    SlidingLog,
    SlidingCounter
};

/// What Decide reports when the store cannot be consulted.
enum class FailurePolicy : uint8_t {
    FailOpen,   ///< Admit, with remaining unknown.
    FailClosed  ///< Deny, preserving the limit at the cost of availability.
};

/// Configuration name of an algorithm ("token_bucket", ...).
[[nodiscard]] constexpr std::string_view toString(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::TokenBucket:    return "token_bucket";
        case AlgorithmKind::LeakyBucket:    return "leaky_bucket";
        case AlgorithmKind::FixedWindow:    return "fixed_window";
        case AlgorithmKind::SlidingLog:     return "sliding_log";
        case AlgorithmKind::SlidingCounter: return "sliding_counter";
    }
    return "unknown";
}

/// Configuration name of a failure policy.
[[nodiscard]] constexpr std::string_view toString(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::FailOpen:   return "fail_open";
        case FailurePolicy::FailClosed: return "fail_closed";
    }
    return "unknown";
}

/// Parse an algorithm name. @return UnknownAlgorithm on no match.
[[nodiscard]] foundation::LimiterResult<AlgorithmKind> parseAlgorithm(std::string_view name);

/// Parse a failure policy name. @return UnknownFailurePolicy on no match.
[[nodiscard]] foundation::LimiterResult<FailurePolicy> parseFailurePolicy(std::string_view name);

/// True for the rate-based algorithms (token and leaky bucket).
[[nodiscard]] constexpr bool usesRefillRate(AlgorithmKind kind) {
    return kind == AlgorithmKind::TokenBucket || kind == AlgorithmKind::LeakyBucket;
}

/// Immutable quota configuration bound to a RateLimiter.
struct LimiterConfig {
    /// Identifies the quota in store keys and logs.
    std::string name = "default";

    AlgorithmKind algorithm = AlgorithmKind::TokenBucket;

    /// Bucket size, queue size, or units permitted per window.
    int64_t capacity = 0;

    /// Window length (fixed_window, sliding_log, sliding_counter).
    foundation::Duration window{0};

    /// Units per second: refill rate (token_bucket) or leak rate (leaky_bucket).
    double refillRate = 0.0;

    FailurePolicy failurePolicy = FailurePolicy::FailOpen;

    /// Per-call budget for store round-trips, CAS retries included.
    std::chrono::milliseconds storeTimeout{50};

    /// Optimistic update attempts before ContentionExhausted.
    uint32_t maxCasRetries = 16;

    /// Prepended to every store key.
    std::string keyPrefix = "rk:";

    /// Check the parameters the chosen algorithm depends on.
    /// @return Success, or InvalidCapacity / InvalidWindow / InvalidRefillRate /
    ///         InvalidStoreOptions.
    [[nodiscard]] foundation::LimiterResult<void> validate() const;
};

/// Build a LimiterConfig from the keys under @p section, e.g.
///
/// @code
///   limiters:
///     free:
///       algorithm: sliding_counter
///       capacity: 100
///       window_ms: 60000
///       failure_policy: fail_closed
/// @endcode
///
/// The config's name defaults to the last component of @p section.
/// The result is validated before being returned.
[[nodiscard]] foundation::LimiterResult<LimiterConfig> loadLimiterConfig(
    const foundation::ConfigManager& config, std::string_view section);

} // namespace rk::limiter
