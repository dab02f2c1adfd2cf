#pragma once

/// @file leaky_bucket.hpp
/// @brief Leaky bucket (as a meter): a bounded queue draining at a constant rate.

#include "rk/limiter/algorithm.hpp"

namespace rk::limiter {

/// Leaky bucket over a Store.
///
/// The queue level drains at LimiterConfig::refillRate units per second
/// (the leak rate). A request of cost c is admitted while level + c fits
/// in capacity, so the sustained admission rate converges to the leak rate
/// regardless of how bursty the input is.
class LeakyBucket final : public StoreBackedAlgorithm<QueueState> {
public:
    using StoreBackedAlgorithm::StoreBackedAlgorithm;

    [[nodiscard]] Transition<QueueState> evaluate(const std::optional<QueueState>& prior,
                                                  foundation::Timestamp now,
                                                  int64_t cost) const override;
};

} // namespace rk::limiter
