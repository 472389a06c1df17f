#include <gtest/gtest.h>
#include "bidder/bidder.h"
#include "rng/mt19937_rng.h"

#include <chrono>
#include <deque>
#include <string>

namespace auctionsim {
namespace test {

using namespace std::chrono_literals;

/// Replays a fixed script of uniform() and uniformInt() values.
class ScriptedRng : public IRng {
public:
    std::deque<double> uniforms;
    std::deque<int32_t> ints;

    double uniform() override {
        double v = uniforms.empty() ? 0.0 : uniforms.front();
        if (!uniforms.empty()) uniforms.pop_front();
        return v;
    }
    int32_t uniformInt(int32_t lo, int32_t hi) override {
        int32_t v = ints.empty() ? lo : ints.front();
        if (!ints.empty()) ints.pop_front();
        return v < lo ? lo : (v > hi ? hi : v);
    }
    void seed(uint64_t) override {}
};

static Item makeItem(uint32_t id, double base_price) {
    Item it{};
    it.id         = id;
    it.name       = "Item " + std::to_string(id);
    it.base_price = base_price;
    return it;
}

static BidderConfig makeConfig(double p, uint32_t min_ms, uint32_t max_ms) {
    BidderConfig c;
    c.total_bidders   = 1;
    c.bid_probability = p;
    c.min_multiplier  = 1.0;
    c.max_multiplier  = 2.0;
    c.min_delay_ms    = min_ms;
    c.max_delay_ms    = max_ms;
    return c;
}

TEST(Bidder, DecisionFollowsProbability) {
    Bidder b(1, makeConfig(0.3, 0, 0), 1);
    ScriptedRng rng;
    rng.uniforms = {0.29, 0.31};
    EXPECT_TRUE(b.decideIfBid(rng));
    EXPECT_FALSE(b.decideIfBid(rng));
}

TEST(Bidder, AmountScalesWithBasePrice) {
    Bidder b(1, makeConfig(1.0, 0, 0), 1);
    ScriptedRng rng;
    rng.uniforms = {0.0, 0.5};
    const Item it = makeItem(1, 200.0);
    EXPECT_DOUBLE_EQ(b.bidAmount(rng, it), 200.0);
    EXPECT_DOUBLE_EQ(b.bidAmount(rng, it), 300.0);

    Mt19937Rng real(5);
    for (int i = 0; i < 1000; ++i) {
        const double amt = b.bidAmount(real, it);
        EXPECT_GE(amt, 200.0);
        EXPECT_LE(amt, 400.0);
    }
}

TEST(Bidder, DelayWithinConfiguredRange) {
    Bidder b(1, makeConfig(1.0, 100, 2000), 1);
    Mt19937Rng rng(8);
    for (int i = 0; i < 1000; ++i) {
        const auto d = b.bidDelay(rng);
        EXPECT_GE(d, 100ms);
        EXPECT_LE(d, 2000ms);
    }
}

TEST(Bidder, PairingSeedsDiffer) {
    Bidder b(3, makeConfig(1.0, 0, 0), 77);
    EXPECT_NE(b.pairingSeed(1), b.pairingSeed(2));
    EXPECT_EQ(b.pairingSeed(1), b.pairingSeed(1));
}

TEST(Bidder, NotInterestedSendsNothing) {
    Bidder b(1, makeConfig(0.0, 0, 0), 1);
    Channel<Bid> ch(4);
    auto scope = CancelScope::background();
    EXPECT_EQ(b.participate(scope, 1, makeItem(1, 100.0), ch),
              ParticipationOutcome::NOT_INTERESTED);
    EXPECT_EQ(ch.size(), 0u);
}

TEST(Bidder, SubmitsExactlyOneBid) {
    Bidder b(5, makeConfig(1.0, 0, 5), 1);
    Channel<Bid> ch(4);
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 1s);

    const uint64_t before = wallClockNs();
    EXPECT_EQ(b.participate(scope, 9, makeItem(9, 100.0), ch), ParticipationOutcome::SUBMITTED);
    ASSERT_EQ(ch.size(), 1u);

    Bid bid{};
    ASSERT_TRUE(ch.tryRecv(bid));
    EXPECT_EQ(bid.bidder_id, 5u);
    EXPECT_EQ(bid.auction_id, 9u);
    EXPECT_GE(bid.amount, 100.0);
    EXPECT_LE(bid.amount, 200.0);
    EXPECT_GE(bid.ts_ns, before);
}

TEST(Bidder, AbandonsWhenThinkTimeOutlastsDeadline) {
    Bidder b(1, makeConfig(1.0, 500, 500), 1);
    Channel<Bid> ch(4);
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 30ms);

    auto t0 = SteadyClock::now();
    EXPECT_EQ(b.participate(scope, 1, makeItem(1, 100.0), ch),
              ParticipationOutcome::ABANDONED_IN_DELAY);
    EXPECT_LT(SteadyClock::now() - t0, 400ms);
    EXPECT_EQ(ch.size(), 0u);
}

TEST(Bidder, DroppedWhenChannelClosed) {
    Bidder b(1, makeConfig(1.0, 0, 0), 1);
    Channel<Bid> ch(4);
    ch.close();
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 1s);
    EXPECT_EQ(b.participate(scope, 1, makeItem(1, 100.0), ch),
              ParticipationOutcome::DROPPED_AT_SEND);
}

TEST(Bidder, DroppedWhenBufferStaysFullPastDeadline) {
    Bidder b(1, makeConfig(1.0, 0, 0), 1);
    Channel<Bid> ch(1);
    ASSERT_TRUE(ch.trySend(Bid{}));
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 30ms);
    EXPECT_EQ(b.participate(scope, 1, makeItem(1, 100.0), ch),
              ParticipationOutcome::DROPPED_AT_SEND);
    EXPECT_EQ(ch.size(), 1u);
}

TEST(Bidder, ScriptedParticipationIsDeterministic) {
    Bidder b(2, makeConfig(0.5, 0, 10), 1);
    ScriptedRng rng;
    rng.uniforms = {0.1, 0.25};   // decide yes, multiplier 1.25
    rng.ints = {0};               // no think time
    Channel<Bid> ch(2);
    auto scope = CancelScope::background();

    EXPECT_EQ(b.participate(scope, rng, 4, makeItem(4, 80.0), ch),
              ParticipationOutcome::SUBMITTED);
    Bid bid{};
    ASSERT_TRUE(ch.tryRecv(bid));
    EXPECT_DOUBLE_EQ(bid.amount, 100.0);
    EXPECT_STREQ(outcomeName(ParticipationOutcome::SUBMITTED), "submitted");
}

TEST(Bidder, PlanDrawsInProtocolOrder) {
    Bidder b(6, makeConfig(0.7, 100, 2000), 11);
    const Item it = makeItem(3, 50.0);

    // Same generator, same order: decide, think time, amount.
    Mt19937Rng rng(b.pairingSeed(3));
    const bool interested = b.decideIfBid(rng);
    const BidPlan p = b.plan(3, it);
    ASSERT_EQ(p.interested, interested);
    if (interested) {
        EXPECT_EQ(p.delay, b.bidDelay(rng));
        EXPECT_DOUBLE_EQ(p.amount, b.bidAmount(rng, it));
    } else {
        EXPECT_EQ(p.delay, 0ms);
    }

    const BidPlan again = b.plan(3, it);
    EXPECT_EQ(again.interested, p.interested);
    EXPECT_EQ(again.delay, p.delay);
    EXPECT_DOUBLE_EQ(again.amount, p.amount);
}

TEST(Bidder, PlanHonoursZeroAndCertainProbability) {
    const Item it = makeItem(1, 100.0);
    Bidder never(1, makeConfig(0.0, 0, 10), 4);
    Bidder always(2, makeConfig(1.0, 0, 10), 4);
    for (uint32_t a = 1; a <= 50; ++a) {
        EXPECT_FALSE(never.plan(a, it).interested);
        const BidPlan p = always.plan(a, it);
        EXPECT_TRUE(p.interested);
        EXPECT_LE(p.delay, 10ms);
        EXPECT_GE(p.amount, 100.0);
        EXPECT_LE(p.amount, 200.0);
    }
}

TEST(Bidder, DeliverAfterDeadlineIsAbandoned) {
    Bidder b(1, makeConfig(1.0, 0, 0), 1);
    Channel<Bid> ch(4);
    auto root = CancelScope::background();
    auto scope = CancelScope::withTimeout(root, 0ms);
    EXPECT_EQ(b.deliver(scope, 1, 120.0, ch), ParticipationOutcome::ABANDONED_AFTER_DELAY);
    EXPECT_EQ(ch.size(), 0u);

    auto live = CancelScope::withTimeout(root, 1s);
    EXPECT_EQ(b.deliver(live, 1, 120.0, ch), ParticipationOutcome::SUBMITTED);
    Bid bid{};
    ASSERT_TRUE(ch.tryRecv(bid));
    EXPECT_DOUBLE_EQ(bid.amount, 120.0);
    EXPECT_EQ(bid.bidder_id, 1u);
}

}  // namespace test
}  // namespace auctionsim
