/// @file algorithm.cpp
/// @brief Shared algorithm helpers and the algorithm factory.

#include "rk/limiter/algorithm.hpp"

#include "rk/limiter/fixed_window.hpp"
#include "rk/limiter/leaky_bucket.hpp"
#include "rk/limiter/sliding_counter.hpp"
#include "rk/limiter/sliding_log.hpp"
#include "rk/limiter/token_bucket.hpp"

namespace rk::limiter {

using foundation::Duration;
using foundation::ErrorCode;
using foundation::LimiterError;
using foundation::LimiterResult;

Duration roundTtl(Duration ttl) {
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(ttl);
    if (ms < std::chrono::milliseconds{1}) {
        ms = std::chrono::milliseconds{1};
    }
    return std::chrono::duration_cast<Duration>(ms);
}

LimiterResult<void> checkCost(const LimiterConfig& config, int64_t cost) {
    if (cost <= 0) {
        return LimiterResult<void>::err(LimiterError(
            ErrorCode::InvalidCost, "cost must be positive, got " + std::to_string(cost)));
    }
    if (cost > config.capacity) {
        return LimiterResult<void>::err(LimiterError(
            ErrorCode::CostExceedsCapacity,
            "cost " + std::to_string(cost) + " can never fit capacity " +
                std::to_string(config.capacity)));
    }
    return LimiterResult<void>::ok();
}

std::unique_ptr<Algorithm> makeAlgorithm(const LimiterConfig& config,
                                         std::shared_ptr<store::Store> store,
                                         std::shared_ptr<const foundation::Clock> clock) {
    switch (config.algorithm) {
        case AlgorithmKind::TokenBucket:
            return std::make_unique<TokenBucket>(config, std::move(store), std::move(clock));
        case AlgorithmKind::LeakyBucket:
            return std::make_unique<LeakyBucket>(config, std::move(store), std::move(clock));
        case AlgorithmKind::FixedWindow:
            return std::make_unique<FixedWindow>(config, std::move(store), std::move(clock));
        case AlgorithmKind::SlidingLog:
            return std::make_unique<SlidingLog>(config, std::move(store), std::move(clock));
        case AlgorithmKind::SlidingCounter:
            return std::make_unique<SlidingCounter>(config, std::move(store), std::move(clock));
    }
    return nullptr;
}

} // namespace rk::limiter
