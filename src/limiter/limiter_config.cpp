/// @file limiter_config.cpp
/// @brief LimiterConfig parsing and validation.

#include "rk/limiter/limiter_config.hpp"

#include <array>
#include <cmath>

#include "rk/foundation/limiter_logger.hpp"

namespace rk::limiter {

using foundation::ErrorCode;
using foundation::LimiterError;
using foundation::LimiterResult;
using foundation::LogCategory;

LimiterResult<AlgorithmKind> parseAlgorithm(std::string_view name) {
    static constexpr std::array<AlgorithmKind, 5> kAll = {
        AlgorithmKind::TokenBucket, AlgorithmKind::LeakyBucket, AlgorithmKind::FixedWindow,
        AlgorithmKind::SlidingLog, AlgorithmKind::SlidingCounter};
    for (auto kind : kAll) {
        if (toString(kind) == name) {
            return LimiterResult<AlgorithmKind>::ok(kind);
        }
    }
    return LimiterResult<AlgorithmKind>::err(
        LimiterError(ErrorCode::UnknownAlgorithm, "unknown algorithm: " + std::string(name)));
}

LimiterResult<FailurePolicy> parseFailurePolicy(std::string_view name) {
    if (name == toString(FailurePolicy::FailOpen)) {
        return LimiterResult<FailurePolicy>::ok(FailurePolicy::FailOpen);
    }
    if (name == toString(FailurePolicy::FailClosed)) {
        return LimiterResult<FailurePolicy>::ok(FailurePolicy::FailClosed);
    }
    return LimiterResult<FailurePolicy>::err(LimiterError(
        ErrorCode::UnknownFailurePolicy, "unknown failure policy: " + std::string(name)));
}

LimiterResult<void> LimiterConfig::validate() const {
    auto fail = [this](ErrorCode code, const std::string& what) {
        return LimiterResult<void>::err(LimiterError(code, name + ": " + what));
    };

    if (capacity <= 0) {
        return fail(ErrorCode::InvalidCapacity, "capacity must be positive");
    }
    if (usesRefillRate(algorithm)) {
        if (!std::isfinite(refillRate) || refillRate <= 0.0) {
            return fail(ErrorCode::InvalidRefillRate, "refill rate must be positive");
        }
    } else if (window <= foundation::Duration::zero()) {
        return fail(ErrorCode::InvalidWindow, "window must be positive");
    }
    if (storeTimeout <= std::chrono::milliseconds::zero()) {
        return fail(ErrorCode::InvalidStoreOptions, "store timeout must be positive");
    }
    if (maxCasRetries == 0) {
        return fail(ErrorCode::InvalidStoreOptions, "at least one CAS attempt is required");
    }
    return LimiterResult<void>::ok();
}

LimiterResult<LimiterConfig> loadLimiterConfig(const foundation::ConfigManager& config,
                                               std::string_view section) {
    using R = LimiterResult<LimiterConfig>;
    std::string prefix(section);
    auto key = [&prefix](const char* leaf) { return prefix + "." + leaf; };

    LimiterConfig out;
    auto dot = prefix.rfind('.');
    out.name = dot == std::string::npos ? prefix : prefix.substr(dot + 1);

    auto algorithmName = config.get<std::string>(key("algorithm"));
    if (algorithmName.hasError()) {
        return R::err(algorithmName.error());
    }
    auto algorithm = parseAlgorithm(algorithmName.value());
    if (algorithm.hasError()) {
        return R::err(algorithm.error());
    }
    out.algorithm = algorithm.value();

    auto capacity = config.get<int64_t>(key("capacity"));
    if (capacity.hasError()) {
        return R::err(capacity.error());
    }
    out.capacity = capacity.value();

    auto windowMs = config.getOr<int64_t>(key("window_ms"), 0);
    if (windowMs.hasError()) {
        return R::err(windowMs.error());
    }
    out.window = std::chrono::milliseconds(windowMs.value());

    auto refillRate = config.getOr<double>(key("refill_rate"), 0.0);
    if (refillRate.hasError()) {
        return R::err(refillRate.error());
    }
    out.refillRate = refillRate.value();

    auto policyName = config.getOr<std::string>(key("failure_policy"),
                                                std::string(toString(out.failurePolicy)));
    if (policyName.hasError()) {
        return R::err(policyName.error());
    }
    auto policy = parseFailurePolicy(policyName.value());
    if (policy.hasError()) {
        return R::err(policy.error());
    }
    out.failurePolicy = policy.value();

    auto timeoutMs = config.getOr<int64_t>(key("store_timeout_ms"), out.storeTimeout.count());
    if (timeoutMs.hasError()) {
        return R::err(timeoutMs.error());
    }
    out.storeTimeout = std::chrono::milliseconds(timeoutMs.value());

    auto retries = config.getOr<uint32_t>(key("max_cas_retries"), out.maxCasRetries);
    if (retries.hasError()) {
        return R::err(retries.error());
    }
    out.maxCasRetries = retries.value();

    auto keyPrefix = config.getOr<std::string>(key("key_prefix"), out.keyPrefix);
    if (keyPrefix.hasError()) {
        return R::err(keyPrefix.error());
    }
    out.keyPrefix = keyPrefix.value();

    if (auto valid = out.validate(); valid.hasError()) {
        RK_LOG_ERROR(LogCategory::Config, std::string(valid.error().message()));
        return R::err(valid.error());
    }
    return R::ok(std::move(out));
}

} // namespace rk::limiter
