#pragma once

/// @file limiter_registry.hpp
/// @brief Named quota tiers sharing one store and clock.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "rk/foundation/clock.hpp"
#include "rk/foundation/config_manager.hpp"
#include "rk/foundation/limiter_result.hpp"
#include "rk/limiter/rate_limiter.hpp"

namespace rk::limiter {

/// Collection of RateLimiters keyed by tier name ("free", "pro", ...).
///
/// Example:
/// @code
///   foundation::ConfigManager config;
///   config.load("limits.yaml");
///   LimiterRegistry registry(store);
///   registry.loadFromConfig(config);
///   auto d = registry.decide("free", "user-42");
/// @endcode
///
/// Tiers are added during setup; lookups and decisions are thread-safe.
class LimiterRegistry {
public:
    explicit LimiterRegistry(std::shared_ptr<store::Store> store,
                             std::shared_ptr<const foundation::Clock> clock =
                                 foundation::systemClock());
    ~LimiterRegistry();

    LimiterRegistry(const LimiterRegistry&) = delete;
    LimiterRegistry& operator=(const LimiterRegistry&) = delete;

    /// Create and register a limiter under @p config.name.
    /// @return InvalidArgument if the name is already taken, or the
    ///         configuration error.
    foundation::LimiterResult<void> add(LimiterConfig config);

    /// Register one tier for every child of @p section (each child is a
    /// LimiterConfig section, see loadLimiterConfig()).
    /// @return Number of tiers added; stops at the first invalid tier.
    foundation::LimiterResult<std::size_t> loadFromConfig(
        const foundation::ConfigManager& config, std::string_view section = "limiters");

    /// Decide under the named tier. @return NotFound for an unknown tier.
    [[nodiscard]] foundation::LimiterResult<Decision> decide(std::string_view tier,
                                                             std::string_view key,
                                                             int64_t cost = 1);

    /// The limiter for @p tier, or nullptr.
    [[nodiscard]] RateLimiter* find(std::string_view tier) const;

    [[nodiscard]] bool has(std::string_view tier) const;

    /// Registered tier names, sorted.
    [[nodiscard]] std::vector<std::string> names() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rk::limiter
