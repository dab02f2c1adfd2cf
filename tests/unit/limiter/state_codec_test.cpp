#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "rk/limiter/leaky_bucket.hpp"
#include "rk/limiter/limiter_state.hpp"
#include "rk/limiter/sliding_counter.hpp"
#include "rk/limiter/sliding_log.hpp"
#include "rk/limiter/token_bucket.hpp"
#include "rk/store/memory_store.hpp"

using namespace rk::limiter;
using rk::foundation::ErrorCode;
using rk::foundation::fromEpochMicros;
using namespace std::chrono_literals;

// =============================================================================
// Exact round trips
// =============================================================================

TEST(StateCodecTest, BucketStateKeepsFractionalTokensExactly) {
    BucketState in{0.1 + 0.2, fromEpochMicros(1'700'000'000'123'456)};
    BucketState out;
    ASSERT_TRUE(decodeState(encodeState(in), out).hasValue());
    EXPECT_EQ(out, in);
}

TEST(StateCodecTest, QueueStateRoundTrip) {
    QueueState in{7.000000000000001, fromEpochMicros(42)};
    QueueState out;
    ASSERT_TRUE(decodeState(encodeState(in), out).hasValue());
    EXPECT_EQ(out, in);
}

TEST(StateCodecTest, WindowCounterEncoding) {
    WindowCounter in{17, fromEpochMicros(60'000'000)};
    EXPECT_EQ(encodeState(in), "v1;fw;17;60000000");

    WindowCounter out;
    ASSERT_TRUE(decodeState("v1;fw;17;60000000", out).hasValue());
    EXPECT_EQ(out, in);
}

TEST(StateCodecTest, TimestampLogEncoding) {
    TimestampLog in;
    in.entries = {{fromEpochMicros(10), 1}, {fromEpochMicros(10), 2}, {fromEpochMicros(25), 3}};
    EXPECT_EQ(encodeState(in), "v1;sl;3;10,1;10,2;25,3");

    TimestampLog out;
    ASSERT_TRUE(decodeState(encodeState(in), out).hasValue());
    EXPECT_EQ(out, in);
}

TEST(StateCodecTest, EmptyTimestampLog) {
    TimestampLog in;
    EXPECT_EQ(encodeState(in), "v1;sl;0");

    TimestampLog out;
    out.entries.push_back({fromEpochMicros(1), 1});
    ASSERT_TRUE(decodeState("v1;sl;0", out).hasValue());
    EXPECT_TRUE(out.entries.empty());
}

TEST(StateCodecTest, DualWindowCounterRoundTrip) {
    DualWindowCounter in{80, fromEpochMicros(0), 20, fromEpochMicros(60'000'000)};
    EXPECT_EQ(encodeState(in), "v1;sc;80;0;20;60000000");

    DualWindowCounter out;
    ASSERT_TRUE(decodeState(encodeState(in), out).hasValue());
    EXPECT_EQ(out, in);
}

TEST(StateCodecTest, NegativeEpochTimestampsSurvive) {
    WindowCounter in{1, fromEpochMicros(-5'000'000)};
    WindowCounter out;
    ASSERT_TRUE(decodeState(encodeState(in), out).hasValue());
    EXPECT_EQ(out, in);
}

// =============================================================================
// Corrupt records
// =============================================================================

TEST(StateCodecTest, RejectsForeignTag) {
    BucketState out;
    auto result = decodeState("v1;fw;3;100", out);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CorruptState);
}

TEST(StateCodecTest, RejectsUnknownVersion) {
    WindowCounter out;
    EXPECT_TRUE(decodeState("v2;fw;3;100", out).hasError());
}

TEST(StateCodecTest, RejectsMalformedFields) {
    BucketState bucket;
    EXPECT_TRUE(decodeState("v1;tb;abc;100", bucket).hasError());
    EXPECT_TRUE(decodeState("v1;tb;1.5", bucket).hasError());
    EXPECT_TRUE(decodeState("v1;tb;1.5;100;extra", bucket).hasError());
    EXPECT_TRUE(decodeState("v1;tb;nan;100", bucket).hasError());
    EXPECT_TRUE(decodeState("", bucket).hasError());

    DualWindowCounter dual;
    EXPECT_TRUE(decodeState("v1;sc;1;0;2", dual).hasError());
}

TEST(StateCodecTest, RejectsNegativeQuantities) {
    BucketState bucket;
    EXPECT_TRUE(decodeState("v1;tb;-0.5;100", bucket).hasError());

    WindowCounter window;
    EXPECT_TRUE(decodeState("v1;fw;-1;100", window).hasError());

    DualWindowCounter dual;
    EXPECT_TRUE(decodeState("v1;sc;-1;0;2;60", dual).hasError());
}

TEST(StateCodecTest, RejectsInconsistentLog) {
    TimestampLog log;
    // Count says two, one entry present.
    EXPECT_TRUE(decodeState("v1;sl;2;10,1", log).hasError());
    // Out of order.
    EXPECT_TRUE(decodeState("v1;sl;2;20,1;10,1", log).hasError());
    // Zero weight.
    EXPECT_TRUE(decodeState("v1;sl;1;10,0", log).hasError());
    // Missing weight.
    EXPECT_TRUE(decodeState("v1;sl;1;10", log).hasError());
}

TEST(StateCodecTest, FailedDecodeLeavesOutputUntouched) {
    WindowCounter out{5, fromEpochMicros(7)};
    ASSERT_TRUE(decodeState("v1;fw;x;100", out).hasError());
    EXPECT_EQ(out, (WindowCounter{5, fromEpochMicros(7)}));
}

// =============================================================================
// Persisted state reproduces decisions
// =============================================================================

namespace {

/// Decide a few times at awkward instants, then check that the persisted
/// record evaluates exactly like the in-memory state it came from.
template <typename Algo, typename State>
void expectNoSerializationDrift(LimiterConfig cfg) {
    auto clock = std::make_shared<rk::foundation::ManualClock>(
        fromEpochMicros(1'700'000'040'000'000));
    auto store = std::make_shared<rk::store::MemoryStore>(clock);
    Algo algo(cfg, store, clock);

    for (auto step : {0ms, 333ms, 1ms, 777ms}) {
        clock->advance(step);
        ASSERT_TRUE(algo.decide("k", 1, rk::store::deadlineAfter(1s)).hasValue());
    }

    auto raw = store->get("k", rk::store::deadlineAfter(1s));
    ASSERT_TRUE(raw.hasValue());
    ASSERT_TRUE(raw.value().has_value());

    State decoded;
    ASSERT_TRUE(decodeState(*raw.value(), decoded).hasValue());
    EXPECT_EQ(encodeState(decoded), *raw.value());

    // Same state, same instant (elapsed 0): identical outcome, twice over.
    auto first = algo.evaluate(decoded, clock->now(), 1);
    auto again = algo.evaluate(decoded, clock->now(), 1);
    EXPECT_EQ(first.state, again.state);
    EXPECT_EQ(first.decision.allowed, again.decision.allowed);
    EXPECT_EQ(first.decision.remaining, again.decision.remaining);
    EXPECT_EQ(first.decision.resetAt, again.decision.resetAt);
    EXPECT_EQ(first.decision.retryAfter, again.decision.retryAfter);

    State reread;
    ASSERT_TRUE(decodeState(encodeState(first.state), reread).hasValue());
    EXPECT_EQ(reread, first.state);
}

} // namespace

TEST(StateCodecTest, TokenBucketRecordHasNoDrift) {
    LimiterConfig cfg;
    cfg.algorithm = AlgorithmKind::TokenBucket;
    cfg.capacity = 3;
    cfg.refillRate = 0.7;
    expectNoSerializationDrift<TokenBucket, BucketState>(cfg);
}

TEST(StateCodecTest, LeakyBucketRecordHasNoDrift) {
    LimiterConfig cfg;
    cfg.algorithm = AlgorithmKind::LeakyBucket;
    cfg.capacity = 3;
    cfg.refillRate = 1.3;
    expectNoSerializationDrift<LeakyBucket, QueueState>(cfg);
}

TEST(StateCodecTest, SlidingLogRecordHasNoDrift) {
    LimiterConfig cfg;
    cfg.algorithm = AlgorithmKind::SlidingLog;
    cfg.capacity = 3;
    cfg.window = 1s;
    expectNoSerializationDrift<SlidingLog, TimestampLog>(cfg);
}

TEST(StateCodecTest, SlidingCounterRecordHasNoDrift) {
    LimiterConfig cfg;
    cfg.algorithm = AlgorithmKind::SlidingCounter;
    cfg.capacity = 3;
    cfg.window = 1s;
    expectNoSerializationDrift<SlidingCounter, DualWindowCounter>(cfg);
}
