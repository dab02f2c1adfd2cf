#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "rk/foundation/clock.hpp"
#include "rk/limiter/rate_limiter.hpp"
#include "rk/limiter/token_bucket.hpp"
#include "rk/store/memory_store.hpp"
#include "support/algorithm_fixture.hpp"

using namespace rk::limiter;
using rk::foundation::Duration;
using rk::foundation::ErrorCode;
using rk::foundation::LimiterError;
using rk::foundation::LimiterResult;
using rk::foundation::ManualClock;
using rk::foundation::StoreFailure;
using rk::store::Deadline;
using rk::store::MemoryStore;
using rk::store::Store;
using rk::test::kStart;
using ::testing::_;
using ::testing::Return;
using namespace std::chrono_literals;

namespace {

/// MemoryStore that can be switched off to simulate an outage.
class FlakyStore final : public Store {
public:
    explicit FlakyStore(std::shared_ptr<const rk::foundation::Clock> clock)
        : inner_(std::move(clock)) {}

    void setDown(bool down) { down_ = down; }

    LimiterResult<std::optional<std::string>> get(std::string_view key,
                                                  Deadline deadline) override {
        if (down_) {
            return LimiterResult<std::optional<std::string>>::err(outage());
        }
        return inner_.get(key, deadline);
    }

    LimiterResult<void> set(std::string_view key, std::string_view value, Duration ttl,
                            Deadline deadline) override {
        if (down_) {
            return LimiterResult<void>::err(outage());
        }
        return inner_.set(key, value, ttl, deadline);
    }

    LimiterResult<int64_t> increment(std::string_view key, int64_t delta, Duration ttl,
                                     Deadline deadline) override {
        if (down_) {
            return LimiterResult<int64_t>::err(outage());
        }
        return inner_.increment(key, delta, ttl, deadline);
    }

    LimiterResult<bool> compareAndSwap(std::string_view key,
                                       const std::optional<std::string>& expected,
                                       std::string_view desired, Duration ttl,
                                       Deadline deadline) override {
        if (down_) {
            return LimiterResult<bool>::err(outage());
        }
        return inner_.compareAndSwap(key, expected, desired, ttl, deadline);
    }

    LimiterResult<bool> remove(std::string_view key, Deadline deadline) override {
        if (down_) {
            return LimiterResult<bool>::err(outage());
        }
        return inner_.remove(key, deadline);
    }

private:
    static LimiterError outage() {
        return LimiterError(ErrorCode::StoreUnavailable, "connection refused");
    }

    MemoryStore inner_;
    std::atomic<bool> down_{false};
};

class MockStore : public Store {
public:
    MOCK_METHOD((LimiterResult<std::optional<std::string>>), get,
                (std::string_view, Deadline), (override));
    MOCK_METHOD(LimiterResult<void>, set,
                (std::string_view, std::string_view, Duration, Deadline), (override));
    MOCK_METHOD(LimiterResult<int64_t>, increment,
                (std::string_view, int64_t, Duration, Deadline), (override));
    MOCK_METHOD(LimiterResult<bool>, compareAndSwap,
                (std::string_view, const std::optional<std::string>&, std::string_view,
                 Duration, Deadline),
                (override));
    MOCK_METHOD(LimiterResult<bool>, remove, (std::string_view, Deadline), (override));
};

LimiterConfig tokenBucket(FailurePolicy policy = FailurePolicy::FailOpen) {
    LimiterConfig cfg;
    cfg.name = "api";
    cfg.algorithm = AlgorithmKind::TokenBucket;
    cfg.capacity = 10;
    cfg.refillRate = 2.0;
    cfg.failurePolicy = policy;
    cfg.storeTimeout = 20ms;
    return cfg;
}

} // namespace

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>(kStart);
        store_ = std::make_shared<FlakyStore>(clock_);
    }

    std::unique_ptr<RateLimiter> make(LimiterConfig cfg) {
        auto created = RateLimiter::create(std::move(cfg), store_, clock_);
        EXPECT_TRUE(created.hasValue());
        if (created.hasError()) {
            return nullptr;
        }
        return std::move(created).value();
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<FlakyStore> store_;
};

// =============================================================================
// Creation
// =============================================================================

TEST_F(RateLimiterTest, CreateRejectsInvalidConfig) {
    auto cfg = tokenBucket();
    cfg.refillRate = 0.0;
    auto created = RateLimiter::create(cfg, store_, clock_);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::InvalidRefillRate);
}

TEST_F(RateLimiterTest, CreateRequiresStoreAndClock) {
    auto noStore = RateLimiter::create(tokenBucket(), nullptr, clock_);
    ASSERT_TRUE(noStore.hasError());
    EXPECT_EQ(noStore.error().code(), ErrorCode::InvalidArgument);

    auto noClock = RateLimiter::create(tokenBucket(), store_, nullptr);
    ASSERT_TRUE(noClock.hasError());
    EXPECT_EQ(noClock.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(RateLimiterTest, EveryAlgorithmIsConstructible) {
    for (auto kind : {AlgorithmKind::TokenBucket, AlgorithmKind::LeakyBucket,
                      AlgorithmKind::FixedWindow, AlgorithmKind::SlidingLog,
                      AlgorithmKind::SlidingCounter}) {
        LimiterConfig cfg;
        cfg.name = std::string(toString(kind));
        cfg.algorithm = kind;
        cfg.capacity = 3;
        cfg.refillRate = 1.0;
        cfg.window = 1s;
        auto limiter = make(cfg);
        ASSERT_NE(limiter, nullptr);

        int admitted = 0;
        for (int i = 0; i < 5; ++i) {
            auto d = limiter->decide("user");
            ASSERT_TRUE(d.hasValue());
            admitted += d.value().allowed ? 1 : 0;
            EXPECT_EQ(d.value().limit, 3);
        }
        EXPECT_EQ(admitted, 3) << toString(kind);
    }
}

// =============================================================================
// Decisions
// =============================================================================

TEST_F(RateLimiterTest, TenImmediateRequestsThenRetryAfterHalfSecond) {
    auto limiter = make(tokenBucket());
    for (int i = 0; i < 10; ++i) {
        auto d = limiter->decide("user-42");
        ASSERT_TRUE(d.hasValue());
        EXPECT_TRUE(d.value().allowed);
        EXPECT_FALSE(d.value().degraded);
    }
    auto d = limiter->decide("user-42");
    ASSERT_TRUE(d.hasValue());
    EXPECT_FALSE(d.value().allowed);
    EXPECT_EQ(d.value().retryAfter, std::optional<Duration>(500ms));
}

TEST_F(RateLimiterTest, StoreKeyIsPrefixNameAndKey) {
    auto limiter = make(tokenBucket());
    ASSERT_TRUE(limiter->decide("user-42").hasValue());

    auto stored = store_->get("rk:api:user-42", rk::store::deadlineAfter(1s));
    ASSERT_TRUE(stored.hasValue());
    EXPECT_TRUE(stored.value().has_value());
}

TEST_F(RateLimiterTest, QuotasWithDifferentNamesDoNotShareState) {
    auto api = make(tokenBucket());
    auto cfg = tokenBucket();
    cfg.name = "other";
    cfg.keyPrefix = "edge:";
    auto other = make(cfg);

    ASSERT_TRUE(api->decide("u", 10).value().allowed);
    EXPECT_FALSE(api->decide("u").value().allowed);
    EXPECT_TRUE(other->decide("u", 10).value().allowed);

    EXPECT_TRUE(store_->get("edge:other:u", rk::store::deadlineAfter(1s)).value().has_value());
}

TEST_F(RateLimiterTest, InstancesSharingStoreEnforceOneQuota) {
    auto a = make(tokenBucket());
    auto b = make(tokenBucket());
    int admitted = 0;
    for (int i = 0; i < 10; ++i) {
        admitted += a->decide("shared").value().allowed ? 1 : 0;
        admitted += b->decide("shared").value().allowed ? 1 : 0;
    }
    EXPECT_EQ(admitted, 10);
}

TEST_F(RateLimiterTest, CostErrorsAreNotMaskedByPolicy) {
    auto limiter = make(tokenBucket(FailurePolicy::FailOpen));

    auto zero = limiter->decide("u", 0);
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidCost);

    auto negative = limiter->decide("u", -2);
    ASSERT_TRUE(negative.hasError());
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidCost);

    auto huge = limiter->decide("u", 11);
    ASSERT_TRUE(huge.hasError());
    EXPECT_EQ(huge.error().code(), ErrorCode::CostExceedsCapacity);
}

TEST_F(RateLimiterTest, PeekAndReset) {
    auto limiter = make(tokenBucket());
    ASSERT_TRUE(limiter->decide("u", 10).value().allowed);

    auto peeked = limiter->peek("u");
    ASSERT_TRUE(peeked.hasValue());
    EXPECT_FALSE(peeked.value().allowed);

    ASSERT_TRUE(limiter->reset("u").hasValue());
    auto fresh = limiter->peek("u");
    ASSERT_TRUE(fresh.hasValue());
    EXPECT_TRUE(fresh.value().allowed);
    EXPECT_EQ(fresh.value().remaining, 9);
}

TEST_F(RateLimiterTest, ExplicitTimeoutOverload) {
    auto limiter = make(tokenBucket());
    auto d = limiter->decide("u", 2, 100ms);
    ASSERT_TRUE(d.hasValue());
    EXPECT_EQ(d.value().remaining, 8);
}

TEST_F(RateLimiterTest, LimiterIsMovable) {
    auto limiter = make(tokenBucket());
    RateLimiter moved = std::move(*limiter);
    EXPECT_EQ(moved.config().name, "api");
    EXPECT_TRUE(moved.decide("u").value().allowed);
}

// =============================================================================
// Failure policy
// =============================================================================

TEST_F(RateLimiterTest, FailOpenAdmitsWithUnknownRemaining) {
    auto limiter = make(tokenBucket(FailurePolicy::FailOpen));
    store_->setDown(true);

    auto d = limiter->decide("u");
    ASSERT_TRUE(d.hasValue());
    EXPECT_TRUE(d.value().allowed);
    EXPECT_TRUE(d.value().degraded);
    EXPECT_EQ(d.value().remaining, kUnknownRemaining);
    EXPECT_EQ(d.value().limit, 10);
    EXPECT_FALSE(d.value().retryAfter.has_value());
}

TEST_F(RateLimiterTest, FailClosedDeniesEveryKeyUntilStoreRecovers) {
    auto limiter = make(tokenBucket(FailurePolicy::FailClosed));
    store_->setDown(true);

    for (const char* key : {"alice", "bob", "carol"}) {
        auto d = limiter->decide(key);
        ASSERT_TRUE(d.hasValue());
        EXPECT_FALSE(d.value().allowed) << key;
        EXPECT_TRUE(d.value().degraded);
        EXPECT_EQ(d.value().remaining, kUnknownRemaining);
        EXPECT_EQ(d.value().retryAfter, std::optional<Duration>(20ms));
        EXPECT_EQ(d.value().resetAt, clock_->now() + 20ms);
    }

    store_->setDown(false);
    auto d = limiter->decide("alice");
    ASSERT_TRUE(d.hasValue());
    EXPECT_TRUE(d.value().allowed);
    EXPECT_FALSE(d.value().degraded);
    EXPECT_EQ(d.value().remaining, 9);
}

TEST_F(RateLimiterTest, PeekFollowsFailurePolicy) {
    auto limiter = make(tokenBucket(FailurePolicy::FailClosed));
    store_->setDown(true);

    auto d = limiter->peek("u");
    ASSERT_TRUE(d.hasValue());
    EXPECT_FALSE(d.value().allowed);
    EXPECT_TRUE(d.value().degraded);
}

TEST_F(RateLimiterTest, ResetReportsStoreErrors) {
    auto limiter = make(tokenBucket());
    store_->setDown(true);

    auto r = limiter->reset("u");
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::StoreUnavailable);
}

TEST_F(RateLimiterTest, CorruptStateFallsBackToPolicy) {
    auto limiter = make(tokenBucket(FailurePolicy::FailOpen));
    ASSERT_TRUE(store_->set("rk:api:u", "not a record", 1s, rk::store::deadlineAfter(1s))
                    .hasValue());

    auto d = limiter->decide("u");
    ASSERT_TRUE(d.hasValue());
    EXPECT_TRUE(d.value().allowed);
    EXPECT_TRUE(d.value().degraded);
}

TEST_F(RateLimiterTest, CasContentionIsBoundedThenPolicyApplies) {
    auto mock = std::make_shared<MockStore>();
    ON_CALL(*mock, get(_, _))
        .WillByDefault(Return(LimiterResult<std::optional<std::string>>::ok(std::nullopt)));
    // Another writer always wins the race.
    EXPECT_CALL(*mock, compareAndSwap(_, _, _, _, _))
        .Times(4)
        .WillRepeatedly(Return(LimiterResult<bool>::ok(false)));
    EXPECT_CALL(*mock, get(_, _)).Times(4);

    auto cfg = tokenBucket(FailurePolicy::FailClosed);
    cfg.maxCasRetries = 4;
    cfg.storeTimeout = 1000ms;
    auto created = RateLimiter::create(cfg, mock, clock_);
    ASSERT_TRUE(created.hasValue());

    auto d = created.value()->decide("hot");
    ASSERT_TRUE(d.hasValue());
    EXPECT_FALSE(d.value().allowed);
    EXPECT_TRUE(d.value().degraded);
}

TEST_F(RateLimiterTest, ExhaustedContentionCarriesKeyAndAttempts) {
    auto mock = std::make_shared<MockStore>();
    ON_CALL(*mock, get(_, _))
        .WillByDefault(Return(LimiterResult<std::optional<std::string>>::ok(std::nullopt)));
    EXPECT_CALL(*mock, get(_, _)).Times(3);
    EXPECT_CALL(*mock, compareAndSwap(_, _, _, _, _))
        .Times(3)
        .WillRepeatedly(Return(LimiterResult<bool>::ok(false)));

    auto cfg = tokenBucket();
    cfg.maxCasRetries = 3;
    TokenBucket algo(cfg, mock, clock_);

    auto result = algo.decide("rk:api:hot", 1, rk::store::deadlineAfter(1s));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentionExhausted);
    auto* where = result.error().context<StoreFailure>();
    ASSERT_NE(where, nullptr);
    EXPECT_EQ(where->operation, "CAS");
    EXPECT_EQ(where->key, "rk:api:hot");
    EXPECT_EQ(where->attempts, 3u);
}

TEST_F(RateLimiterTest, CasConflictIsRetried) {
    auto mock = std::make_shared<MockStore>();
    ON_CALL(*mock, get(_, _))
        .WillByDefault(Return(LimiterResult<std::optional<std::string>>::ok(std::nullopt)));
    EXPECT_CALL(*mock, get(_, _)).Times(2);
    EXPECT_CALL(*mock, compareAndSwap(_, _, _, _, _))
        .WillOnce(Return(LimiterResult<bool>::ok(false)))
        .WillOnce(Return(LimiterResult<bool>::ok(true)));

    auto created = RateLimiter::create(tokenBucket(), mock, clock_);
    ASSERT_TRUE(created.hasValue());

    auto d = created.value()->decide("warm");
    ASSERT_TRUE(d.hasValue());
    EXPECT_TRUE(d.value().allowed);
    EXPECT_FALSE(d.value().degraded);
    EXPECT_EQ(d.value().remaining, 9);
}
