#include <gtest/gtest.h>

#include <chrono>

#include "rk/limiter/fixed_window.hpp"
#include "support/algorithm_fixture.hpp"

using namespace rk::limiter;
using rk::foundation::Duration;
using rk::foundation::fromEpochMicros;
using rk::test::kStart;
using namespace std::chrono_literals;

class FixedWindowTest : public rk::test::AlgorithmFixture<FixedWindow> {
protected:
    void SetUp() override {
        LimiterConfig cfg;
        cfg.name = "search";
        cfg.algorithm = AlgorithmKind::FixedWindow;
        cfg.capacity = 100;
        cfg.window = 60s;
        build(cfg);
    }
};

TEST_F(FixedWindowTest, CountsDownWithinWindow) {
    clock_->advance(10s);
    auto first = decide();
    EXPECT_TRUE(first.allowed);
    EXPECT_EQ(first.limit, 100);
    EXPECT_EQ(first.remaining, 99);
    EXPECT_EQ(first.resetAt, kStart + 60s);

    EXPECT_EQ(decide(9).remaining, 90);
}

TEST_F(FixedWindowTest, DeniesUntilWindowEnds) {
    clock_->advance(45s);
    EXPECT_EQ(admitBurst(100), 100);

    auto denied = decide();
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(denied.remaining, 0);
    ASSERT_TRUE(denied.retryAfter.has_value());
    EXPECT_EQ(*denied.retryAfter, 15s);
    EXPECT_EQ(denied.resetAt, kStart + 60s);
}

TEST_F(FixedWindowTest, BoundaryBurstAdmitsTwiceCapacity) {
    clock_->set(kStart + 59900ms);
    EXPECT_EQ(admitBurst(100), 100);
    auto denied = decide();
    EXPECT_FALSE(denied.allowed);
    EXPECT_EQ(*denied.retryAfter, 100ms);

    clock_->set(kStart + 60100ms);
    EXPECT_EQ(admitBurst(100), 100);
    // 200 admitted within 0.2 s: the known fixed-window defect.
}

TEST_F(FixedWindowTest, StateExpiresAtWindowEnd) {
    clock_->advance(30s);
    EXPECT_TRUE(decide().allowed);

    clock_->advance(30s);
    EXPECT_EQ(store_->size(), 0u);
    EXPECT_EQ(decide().remaining, 99);
}

TEST_F(FixedWindowTest, AheadWindowFromSkewedHostIsKept) {
    auto ahead = kStart + 60s;
    auto t = algo_->evaluate(WindowCounter{5, ahead}, kStart + 1s, 1);
    EXPECT_TRUE(t.decision.allowed);
    EXPECT_EQ(t.state.count, 6);
    EXPECT_EQ(t.state.windowStart, ahead);
    EXPECT_EQ(t.decision.resetAt, ahead + 60s);
}

TEST_F(FixedWindowTest, StaleWindowIsReplaced) {
    auto t = algo_->evaluate(WindowCounter{100, kStart - 60s}, kStart + 1s, 1);
    EXPECT_TRUE(t.decision.allowed);
    EXPECT_EQ(t.state, (WindowCounter{1, kStart}));
}

TEST(AlignedWindowStartTest, FloorsToWindowMultiple) {
    const Duration w{10};
    EXPECT_EQ(alignedWindowStart(fromEpochMicros(25), w), fromEpochMicros(20));
    EXPECT_EQ(alignedWindowStart(fromEpochMicros(20), w), fromEpochMicros(20));
    EXPECT_EQ(alignedWindowStart(fromEpochMicros(0), w), fromEpochMicros(0));
    EXPECT_EQ(alignedWindowStart(fromEpochMicros(-1), w), fromEpochMicros(-10));
    EXPECT_EQ(alignedWindowStart(fromEpochMicros(-10), w), fromEpochMicros(-10));
}

TEST(AlignedWindowStartTest, HostsAgreeOnBoundaries) {
    EXPECT_EQ(alignedWindowStart(kStart + 59999999us, 60s), kStart);
    EXPECT_EQ(alignedWindowStart(kStart + 60s, 60s), kStart + 60s);
}
