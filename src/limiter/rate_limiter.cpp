/// @file rate_limiter.cpp
/// @brief RateLimiter implementation: key namespacing, deadlines and the
///        failure policy.

#include "rk/limiter/rate_limiter.hpp"

#include <string>
#include <utility>

#include "rk/foundation/limiter_logger.hpp"
#include "rk/limiter/algorithm.hpp"
#include "rk/version.hpp"

namespace rk::limiter {

using foundation::LimiterError;
using foundation::LimiterResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

// ── Impl ────────────────────────────────────────────────────────────────────

struct RateLimiter::Impl {
    LimiterConfig config;
    std::shared_ptr<const foundation::Clock> clock;
    std::unique_ptr<Algorithm> algorithm;

    std::string storeKey(std::string_view key) const {
        std::string out;
        out.reserve(config.keyPrefix.size() + config.name.size() + 1 + key.size());
        out.append(config.keyPrefix).append(config.name).append(1, ':').append(key);
        return out;
    }

    /// Turn a store-class failure into a Decision; anything else propagates.
    LimiterResult<Decision> applyPolicy(std::string_view key, const LimiterError& error) const {
        if (!error.isStoreFailure()) {
            return LimiterResult<Decision>::err(error);
        }

        LogContext ctx;
        ctx.key = std::string(key);
        ctx.algorithm = std::string(toString(config.algorithm));
        ctx.extra["policy"] = std::string(toString(config.failurePolicy));
        ctx.extra["error"] = std::string(error.message());
        if (const auto* where = error.context<foundation::StoreFailure>()) {
            ctx.extra["operation"] = where->operation;
            if (where->attempts > 0) {
                ctx.extra["attempts"] = std::to_string(where->attempts);
            }
        }
        foundation::LimiterLogger::instance().logWithContext(
            LogLevel::Warning, LogCategory::Core, "store unavailable, failure policy applied", ctx);

        Decision d;
        d.limit = config.capacity;
        d.remaining = kUnknownRemaining;
        d.degraded = true;
        d.resetAt = clock->now();
        if (config.failurePolicy == FailurePolicy::FailOpen) {
            d.allowed = true;
        } else {
            d.allowed = false;
            d.retryAfter = std::chrono::duration_cast<foundation::Duration>(config.storeTimeout);
            d.resetAt += *d.retryAfter;
        }
        return LimiterResult<Decision>::ok(d);
    }
};

// ── Public API ──────────────────────────────────────────────────────────────

RateLimiter::RateLimiter(Passkey) : impl_(std::make_unique<Impl>()) {}
RateLimiter::~RateLimiter() = default;
RateLimiter::RateLimiter(RateLimiter&&) noexcept = default;
RateLimiter& RateLimiter::operator=(RateLimiter&&) noexcept = default;

LimiterResult<std::unique_ptr<RateLimiter>> RateLimiter::create(
    LimiterConfig config, std::shared_ptr<store::Store> store,
    std::shared_ptr<const foundation::Clock> clock) {
    using R = LimiterResult<std::unique_ptr<RateLimiter>>;
    if (!store || !clock) {
        return R::err(LimiterError(foundation::ErrorCode::InvalidArgument,
                                   "a limiter needs a store and a clock"));
    }
    if (auto valid = config.validate(); valid.hasError()) {
        RK_LOG_ERROR(LogCategory::Config, std::string(valid.error().message()));
        return R::err(valid.error());
    }

    auto limiter = std::make_unique<RateLimiter>(Passkey{});
    limiter->impl_->algorithm = makeAlgorithm(config, std::move(store), clock);
    limiter->impl_->clock = std::move(clock);
    limiter->impl_->config = std::move(config);

    const auto& cfg = limiter->impl_->config;
    LogContext ctx;
    ctx.algorithm = std::string(toString(cfg.algorithm));
    ctx.extra["name"] = cfg.name;
    ctx.extra["capacity"] = std::to_string(cfg.capacity);
    ctx.extra["policy"] = std::string(toString(cfg.failurePolicy));
    ctx.extra["state_format"] = rk::Version::stateTag;
    foundation::LimiterLogger::instance().logWithContext(LogLevel::Info, LogCategory::Core,
                                                         "limiter created", ctx);
    return R::ok(std::move(limiter));
}

LimiterResult<Decision> RateLimiter::decide(std::string_view key, int64_t cost) {
    return decide(key, cost, impl_->config.storeTimeout);
}

LimiterResult<Decision> RateLimiter::decide(std::string_view key, int64_t cost,
                                            std::chrono::milliseconds timeout) {
    auto result = impl_->algorithm->decide(impl_->storeKey(key), cost,
                                           store::deadlineAfter(timeout));
    if (result.hasError()) {
        return impl_->applyPolicy(key, result.error());
    }
    return result;
}

LimiterResult<Decision> RateLimiter::peek(std::string_view key) {
    auto result = impl_->algorithm->peek(impl_->storeKey(key),
                                         store::deadlineAfter(impl_->config.storeTimeout));
    if (result.hasError()) {
        return impl_->applyPolicy(key, result.error());
    }
    return result;
}

LimiterResult<void> RateLimiter::reset(std::string_view key) {
    return impl_->algorithm->reset(impl_->storeKey(key),
                                   store::deadlineAfter(impl_->config.storeTimeout));
}

const LimiterConfig& RateLimiter::config() const noexcept {
    return impl_->config;
}

} // namespace rk::limiter
