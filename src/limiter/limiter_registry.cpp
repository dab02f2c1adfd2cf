/// @file limiter_registry.cpp
/// @brief LimiterRegistry implementation.

#include "rk/limiter/limiter_registry.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>

#include "rk/foundation/limiter_logger.hpp"

namespace rk::limiter {

using foundation::ErrorCode;
using foundation::LimiterError;
using foundation::LimiterResult;
using foundation::LogCategory;

struct LimiterRegistry::Impl {
    std::shared_ptr<store::Store> store;
    std::shared_ptr<const foundation::Clock> clock;

    mutable std::shared_mutex mutex;
    std::map<std::string, std::unique_ptr<RateLimiter>, std::less<>> tiers;
};

LimiterRegistry::LimiterRegistry(std::shared_ptr<store::Store> store,
                                 std::shared_ptr<const foundation::Clock> clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->store = std::move(store);
    impl_->clock = std::move(clock);
}

LimiterRegistry::~LimiterRegistry() = default;

LimiterResult<void> LimiterRegistry::add(LimiterConfig config) {
    std::string name = config.name;
    {
        std::shared_lock lock(impl_->mutex);
        if (impl_->tiers.count(name) > 0) {
            return LimiterResult<void>::err(
                LimiterError(ErrorCode::InvalidArgument, "duplicate limiter tier: " + name));
        }
    }

    auto limiter = RateLimiter::create(std::move(config), impl_->store, impl_->clock);
    if (limiter.hasError()) {
        return LimiterResult<void>::err(limiter.error());
    }

    std::unique_lock lock(impl_->mutex);
    bool inserted = impl_->tiers.emplace(name, std::move(limiter).value()).second;
    if (!inserted) {
        return LimiterResult<void>::err(
            LimiterError(ErrorCode::InvalidArgument, "duplicate limiter tier: " + name));
    }
    return LimiterResult<void>::ok();
}

LimiterResult<std::size_t> LimiterRegistry::loadFromConfig(
    const foundation::ConfigManager& config, std::string_view section) {
    auto children = config.childKeys(section);
    if (children.empty()) {
        RK_LOG_WARN(LogCategory::Config,
                    "no limiter tiers under section: " + std::string(section));
    }

    std::size_t added = 0;
    for (const auto& child : children) {
        auto tier = loadLimiterConfig(config, std::string(section) + "." + child);
        if (tier.hasError()) {
            return LimiterResult<std::size_t>::err(tier.error());
        }
        if (auto result = add(std::move(tier).value()); result.hasError()) {
            return LimiterResult<std::size_t>::err(result.error());
        }
        ++added;
    }
    return LimiterResult<std::size_t>::ok(added);
}

LimiterResult<Decision> LimiterRegistry::decide(std::string_view tier, std::string_view key,
                                                int64_t cost) {
    auto* limiter = find(tier);
    if (limiter == nullptr) {
        return LimiterResult<Decision>::err(
            LimiterError(ErrorCode::NotFound, "unknown limiter tier: " + std::string(tier)));
    }
    return limiter->decide(key, cost);
}

RateLimiter* LimiterRegistry::find(std::string_view tier) const {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->tiers.find(tier);
    return it == impl_->tiers.end() ? nullptr : it->second.get();
}

bool LimiterRegistry::has(std::string_view tier) const {
    return find(tier) != nullptr;
}

std::vector<std::string> LimiterRegistry::names() const {
    std::shared_lock lock(impl_->mutex);
    std::vector<std::string> out;
    out.reserve(impl_->tiers.size());
    for (const auto& entry : impl_->tiers) {
        out.push_back(entry.first);
    }
    return out;
}

} // namespace rk::limiter
