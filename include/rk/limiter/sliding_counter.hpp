#pragma once

/// @file sliding_counter.hpp
/// @brief Sliding window counter: O(1) approximation of a sliding window.

#include "rk/limiter/algorithm.hpp"

namespace rk::limiter {

/// Sliding window counter over a Store.
///
/// Keeps the counts of the current and previous epoch-aligned windows and
/// estimates the trailing-window usage as
///
///   estimated = (1 - elapsedInCurrent / window) * previousCount + currentCount
///
/// which removes the fixed-window boundary burst to within the error of
/// assuming the previous window's requests were evenly spread.
class SlidingCounter final : public StoreBackedAlgorithm<DualWindowCounter> {
public:
    using StoreBackedAlgorithm::StoreBackedAlgorithm;

    [[nodiscard]] Transition<DualWindowCounter> evaluate(
        const std::optional<DualWindowCounter>& prior, foundation::Timestamp now,
        int64_t cost) const override;
};

} // namespace rk::limiter
