#pragma once

/// @file rate_limiter.hpp
/// @brief RateLimiter facade: one validated quota bound to a store and clock.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

#include "rk/foundation/clock.hpp"
#include "rk/foundation/limiter_result.hpp"
#include "rk/limiter/decision.hpp"
#include "rk/limiter/limiter_config.hpp"
#include "rk/store/store.hpp"

namespace rk::limiter {

/// Decides whether requests for a key may proceed under one quota.
///
/// Holds no per-key state: every call performs a fresh read-modify-write
/// against the Store, so any number of RateLimiter instances (in this
/// process or on other hosts) sharing a Store enforce one quota.
///
/// Store failures, timeouts and CAS exhaustion are converted into a
/// Decision by the configured FailurePolicy (flagged as degraded). Only
/// caller errors such as an invalid cost are returned as errors.
///
/// Thread-safe.
///
/// Example:
/// @code
///   LimiterConfig cfg;
///   cfg.name = "api";
///   cfg.algorithm = AlgorithmKind::SlidingCounter;
///   cfg.capacity = 100;
///   cfg.window = std::chrono::seconds{60};
///   auto store = std::make_shared<store::MemoryStore>(foundation::systemClock());
///   auto limiter = RateLimiter::create(cfg, store);
///   if (limiter.hasValue()) {
///       auto d = limiter.value()->decide("user-42");
///   }
/// @endcode
class RateLimiter {
    /// Only create() can name this, so only create() can construct.
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    /// Validate @p config and bind it to @p store and @p clock.
    /// @return The limiter, or the configuration error.
    [[nodiscard]] static foundation::LimiterResult<std::unique_ptr<RateLimiter>> create(
        LimiterConfig config, std::shared_ptr<store::Store> store,
        std::shared_ptr<const foundation::Clock> clock = foundation::systemClock());

    explicit RateLimiter(Passkey);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&) noexcept;
    RateLimiter& operator=(RateLimiter&&) noexcept;

    /// Admit or deny @p cost units for @p key within the configured store timeout.
    /// @return InvalidCost or CostExceedsCapacity for unusable costs.
    [[nodiscard]] foundation::LimiterResult<Decision> decide(std::string_view key,
                                                             int64_t cost = 1);

    /// As decide(key, cost), with a caller-supplied timeout.
    [[nodiscard]] foundation::LimiterResult<Decision> decide(std::string_view key, int64_t cost,
                                                             std::chrono::milliseconds timeout);

    /// What a unit-cost decide would report right now, without consuming quota.
    [[nodiscard]] foundation::LimiterResult<Decision> peek(std::string_view key);

    /// Drop @p key's state so its quota starts fresh.
    [[nodiscard]] foundation::LimiterResult<void> reset(std::string_view key);

    /// The validated configuration.
    [[nodiscard]] const LimiterConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rk::limiter
