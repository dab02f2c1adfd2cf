#pragma once

/// @file token_bucket.hpp
/// @brief Token bucket: bursts up to capacity, sustained rate capped at refillRate.

#include "rk/limiter/algorithm.hpp"

namespace rk::limiter {

/// Token bucket over a Store.
///
/// Tokens accumulate continuously at refillRate per second up to capacity.
/// The token count is kept as a real number; only the reported remaining
/// count is floored. A denied call still persists the refilled state.
///
/// Example:
/// @code
///   LimiterConfig cfg;
///   cfg.algorithm = AlgorithmKind::TokenBucket;
///   cfg.capacity = 10;
///   cfg.refillRate = 2.0; // tokens per second
///   TokenBucket bucket(cfg, store, clock);
///   auto d = bucket.decide("rk:api:user-42", 1, deadline);
/// @endcode
class TokenBucket final : public StoreBackedAlgorithm<BucketState> {
public:
    using StoreBackedAlgorithm::StoreBackedAlgorithm;

    [[nodiscard]] Transition<BucketState> evaluate(const std::optional<BucketState>& prior,
                                                   foundation::Timestamp now,
                                                   int64_t cost) const override;
};

} // namespace rk::limiter
