#pragma once

/// @file sliding_log.hpp
/// @brief Sliding window log: exact trailing-window enforcement.

#include "rk/limiter/algorithm.hpp"

namespace rk::limiter {

/// Sliding window log over a Store.
///
/// Keeps one weighted entry per admission time. Entries older than
/// now - window are pruned before every check, so at most capacity units
/// are ever admitted inside any closed window-length span. State and work
/// are O(capacity) per key; prefer SlidingCounter for large quotas.
class SlidingLog final : public StoreBackedAlgorithm<TimestampLog> {
public:
    using StoreBackedAlgorithm::StoreBackedAlgorithm;

    [[nodiscard]] Transition<TimestampLog> evaluate(const std::optional<TimestampLog>& prior,
                                                    foundation::Timestamp now,
                                                    int64_t cost) const override;
};

} // namespace rk::limiter
