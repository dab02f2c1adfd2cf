#pragma once

/// @file algorithm.hpp
/// @brief Admission algorithm interface and the store-backed CAS driver.
///
/// Each algorithm is a pure transition from the prior per-key state to
/// (new state, Decision, TTL). StoreBackedAlgorithm runs that transition
/// inside an optimistic read / compare-and-swap loop so that concurrent
/// callers, in-process or on other hosts, never over-admit.

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "rk/foundation/clock.hpp"
#include "rk/foundation/limiter_logger.hpp"
#include "rk/foundation/limiter_result.hpp"
#include "rk/limiter/decision.hpp"
#include "rk/limiter/limiter_config.hpp"
#include "rk/limiter/limiter_state.hpp"
#include "rk/store/store.hpp"

namespace rk::limiter {

/// Outcome of one pure state transition.
template <typename State>
struct Transition {
    State state;
    Decision decision;
    foundation::Duration ttl{0};
};

/// Round a TTL up to whole milliseconds, at least one.
[[nodiscard]] foundation::Duration roundTtl(foundation::Duration ttl);

/// Check a per-call cost against the quota.
/// @return InvalidCost for cost <= 0, CostExceedsCapacity for cost > capacity.
[[nodiscard]] foundation::LimiterResult<void> checkCost(const LimiterConfig& config,
                                                        int64_t cost);

/// One admission strategy bound to a store and a clock.
///
/// Keys passed here are full store keys; the RateLimiter facade adds the
/// quota prefix.
class Algorithm {
public:
    virtual ~Algorithm() = default;

    [[nodiscard]] virtual AlgorithmKind kind() const noexcept = 0;

    /// Admit or deny @p cost units and persist the resulting state.
    [[nodiscard]] virtual foundation::LimiterResult<Decision> decide(
        std::string_view storeKey, int64_t cost, store::Deadline deadline) = 0;

    /// Report what a unit-cost decide would return, without persisting.
    [[nodiscard]] virtual foundation::LimiterResult<Decision> peek(
        std::string_view storeKey, store::Deadline deadline) = 0;

    /// Forget the key's state; the next decide starts fresh.
    [[nodiscard]] virtual foundation::LimiterResult<void> reset(
        std::string_view storeKey, store::Deadline deadline) = 0;
};

/// Algorithm whose state lives in a Store as an encoded record.
///
/// Subclasses implement evaluate(); decide() reads the record, evaluates
/// and writes back with compareAndSwap, retrying on conflict up to
/// LimiterConfig::maxCasRetries times before failing with
/// ContentionExhausted.
template <typename State>
class StoreBackedAlgorithm : public Algorithm {
public:
    StoreBackedAlgorithm(LimiterConfig config, std::shared_ptr<store::Store> store,
                         std::shared_ptr<const foundation::Clock> clock)
        : config_(std::move(config)), store_(std::move(store)), clock_(std::move(clock)) {}

    [[nodiscard]] AlgorithmKind kind() const noexcept override { return config_.algorithm; }

    /// Pure transition. @p prior is nullopt for a key with no live state.
    /// Never touches the store or the clock.
    [[nodiscard]] virtual Transition<State> evaluate(const std::optional<State>& prior,
                                                     foundation::Timestamp now,
                                                     int64_t cost) const = 0;

    [[nodiscard]] foundation::LimiterResult<Decision> decide(
        std::string_view storeKey, int64_t cost, store::Deadline deadline) override {
        using R = foundation::LimiterResult<Decision>;
        if (auto valid = checkCost(config_, cost); valid.hasError()) {
            return R::err(valid.error());
        }

        for (uint32_t attempt = 0; attempt < config_.maxCasRetries; ++attempt) {
            if (attempt > 0 && std::chrono::steady_clock::now() >= deadline) {
                return R::err(foundation::LimiterError(
                    foundation::ErrorCode::StoreTimeout,
                    "deadline passed after " + std::to_string(attempt) + " CAS attempts",
                    foundation::StoreFailure{"CAS", std::string(storeKey), attempt}));
            }

            auto raw = store_->get(storeKey, deadline);
            if (raw.hasError()) {
                return R::err(raw.error());
            }
            auto prior = load(storeKey, raw.value());
            if (prior.hasError()) {
                return R::err(prior.error());
            }

            auto next = evaluate(prior.value(), clock_->now(), cost);
            auto swapped = store_->compareAndSwap(storeKey, raw.value(),
                                                  encodeState(next.state), next.ttl, deadline);
            if (swapped.hasError()) {
                return R::err(swapped.error());
            }
            if (swapped.value()) {
                return R::ok(next.decision);
            }
        }

        foundation::LogContext ctx;
        ctx.key = std::string(storeKey);
        ctx.algorithm = std::string(toString(config_.algorithm));
        ctx.extra["attempts"] = std::to_string(config_.maxCasRetries);
        foundation::LimiterLogger::instance().logWithContext(
            foundation::LogLevel::Warning, foundation::LogCategory::Algorithm,
            "CAS retry budget exhausted", ctx);
        return R::err(foundation::LimiterError(
            foundation::ErrorCode::ContentionExhausted,
            "CAS retry budget exhausted for key: " + std::string(storeKey),
            foundation::StoreFailure{"CAS", std::string(storeKey), config_.maxCasRetries}));
    }

    [[nodiscard]] foundation::LimiterResult<Decision> peek(std::string_view storeKey,
                                                           store::Deadline deadline) override {
        using R = foundation::LimiterResult<Decision>;
        auto raw = store_->get(storeKey, deadline);
        if (raw.hasError()) {
            return R::err(raw.error());
        }
        auto prior = load(storeKey, raw.value());
        if (prior.hasError()) {
            return R::err(prior.error());
        }
        return R::ok(evaluate(prior.value(), clock_->now(), 1).decision);
    }

    [[nodiscard]] foundation::LimiterResult<void> reset(std::string_view storeKey,
                                                        store::Deadline deadline) override {
        auto removed = store_->remove(storeKey, deadline);
        if (removed.hasError()) {
            return foundation::LimiterResult<void>::err(removed.error());
        }
        return foundation::LimiterResult<void>::ok();
    }

protected:
    [[nodiscard]] const LimiterConfig& config() const noexcept { return config_; }

private:
    foundation::LimiterResult<std::optional<State>> load(
        std::string_view storeKey, const std::optional<std::string>& raw) const {
        using R = foundation::LimiterResult<std::optional<State>>;
        if (!raw) {
            return R::ok(std::nullopt);
        }
        State state;
        auto decoded = decodeState(*raw, state);
        if (decoded.hasError()) {
            foundation::LogContext ctx;
            ctx.key = std::string(storeKey);
            ctx.algorithm = std::string(toString(config_.algorithm));
            foundation::LimiterLogger::instance().logWithContext(
                foundation::LogLevel::Error, foundation::LogCategory::Algorithm,
                decoded.error().message(), ctx);
            return R::err(decoded.error().withContext(
                foundation::StoreFailure{"decode", std::string(storeKey), 0}));
        }
        return R::ok(std::move(state));
    }

    LimiterConfig config_;
    std::shared_ptr<store::Store> store_;
    std::shared_ptr<const foundation::Clock> clock_;
};

/// Build the algorithm named by @p config.algorithm.
/// @p config must already be validated.
[[nodiscard]] std::unique_ptr<Algorithm> makeAlgorithm(
    const LimiterConfig& config, std::shared_ptr<store::Store> store,
    std::shared_ptr<const foundation::Clock> clock);

} // namespace rk::limiter
