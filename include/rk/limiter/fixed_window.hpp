#pragma once

/// @file fixed_window.hpp
/// @brief Fixed window counter aligned to multiples of the window length.

#include "rk/limiter/algorithm.hpp"

namespace rk::limiter {

/// Fixed window counter over a Store.
///
/// Windows start at floor(now / window) * window on the epoch timeline, so
/// every host agrees on the boundaries. O(1) state per key.
///
/// @note Up to 2 x capacity units can be admitted inside a single
///       window-length span straddling a boundary (capacity just before it,
///       capacity just after). Use SlidingCounter or SlidingLog when that
///       matters.
class FixedWindow final : public StoreBackedAlgorithm<WindowCounter> {
public:
    using StoreBackedAlgorithm::StoreBackedAlgorithm;

    [[nodiscard]] Transition<WindowCounter> evaluate(const std::optional<WindowCounter>& prior,
                                                     foundation::Timestamp now,
                                                     int64_t cost) const override;
};

/// Start of the epoch-aligned window containing @p now.
[[nodiscard]] foundation::Timestamp alignedWindowStart(foundation::Timestamp now,
                                                       foundation::Duration window);

} // namespace rk::limiter
