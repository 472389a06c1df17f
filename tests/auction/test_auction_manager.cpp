#include <gtest/gtest.h>
#include "auction/auction_manager.h"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace auctionsim {
namespace test {

using namespace std::chrono_literals;

static SimConfig smallConfig() {
    SimConfig c = defaultConfig();
    c.auction.total_auctions = 4;
    c.auction.timeout_ms     = 200;
    c.bidder.total_bidders   = 10;
    c.bidder.bid_probability = 1.0;
    c.bidder.min_delay_ms    = 0;
    c.bidder.max_delay_ms    = 20;
    c.system.warmup_ms       = 10;
    c.system.seed            = 1234;
    return c;
}

/// Records the ids it receives and counts flush/close calls.
class RecordingSink : public IResultSink {
public:
    void append(const AuctionResult& r) override { ids.push_back(r.auction_id); }
    void flush() override { ++flushes; }
    void close() override { ++closes; }

    std::vector<uint32_t> ids;
    int flushes = 0;
    int closes = 0;
};

static AuctionResult makeResult(uint32_t id, uint32_t bids, bool winner) {
    AuctionResult r{};
    r.auction_id = id;
    r.total_bids = bids;
    if (winner) {
        Bid b{};
        b.bidder_id  = 1;
        b.auction_id = id;
        b.amount     = 10.0;
        r.winning_bid = b;
        r.status = AuctionStatus::COMPLETED;
    } else {
        r.status = AuctionStatus::NO_BIDS;
    }
    return r;
}

TEST(AuctionManager, CreateAuctionsBuildsRoster) {
    AuctionManager m(smallConfig());
    m.createAuctions();
    m.createAuctions();
    ASSERT_EQ(m.auctions().size(), 4u);
    for (size_t i = 0; i < m.auctions().size(); ++i) {
        const Auction& a = *m.auctions()[i];
        EXPECT_EQ(a.id(), i + 1);
        EXPECT_EQ(a.item().id, a.id());
        EXPECT_EQ(a.timeout(), 200ms);
        EXPECT_EQ(a.state(), AuctionState::PENDING);
    }
    EXPECT_EQ(m.auctionPointers().size(), 4u);
}

TEST(AuctionManager, AggregateCountsAndOrdersResults) {
    AuctionManager m(smallConfig());
    m.recordResult(makeResult(3, 0, false));
    m.recordResult(makeResult(1, 5, true));
    m.recordResult(makeResult(2, 2, true));

    SimulationResult sim = m.aggregateResults();
    EXPECT_EQ(sim.total_auctions, 3u);
    EXPECT_EQ(sim.successful_auctions, 2u);
    EXPECT_EQ(sim.failed_auctions, 1u);
    EXPECT_EQ(sim.total_bids, 7u);
    ASSERT_EQ(sim.auction_results.size(), 3u);
    EXPECT_EQ(sim.auction_results[0].auction_id, 1u);
    EXPECT_EQ(sim.auction_results[1].auction_id, 2u);
    EXPECT_EQ(sim.auction_results[2].auction_id, 3u);
}

TEST(AuctionManager, RunProducesOneResultPerAuction) {
    SimConfig c = smallConfig();
    AuctionManager m(c);
    BidderPool pool(c.bidder, c.system.seed);
    RecordingSink first, second;
    m.addSink(&first);
    m.addSink(&second);
    EXPECT_EQ(m.sinkCount(), 2u);

    SimulationResult sim = m.run(pool);

    EXPECT_EQ(sim.total_auctions, 4u);
    EXPECT_EQ(sim.successful_auctions + sim.failed_auctions, sim.total_auctions);
    EXPECT_EQ(first.ids.size(), 4u);
    EXPECT_EQ(second.ids, first.ids);
    EXPECT_EQ(first.flushes, 1);
    EXPECT_EQ(first.closes, 0);
    m.closeSinks();
    EXPECT_EQ(second.closes, 1);
    EXPECT_EQ(m.resultCount(), 4u);

    uint64_t bids = 0;
    for (const auto& r : sim.auction_results) {
        bids += r.total_bids;
        EXPECT_EQ(r.status == AuctionStatus::COMPLETED, r.winning_bid.has_value());
        EXPECT_GE(std::chrono::nanoseconds(r.duration_ns), 200ms);
    }
    EXPECT_EQ(bids, sim.total_bids);
    EXPECT_EQ(sim.total_bids, sim.participation.submitted);
    EXPECT_EQ(sim.participation.pairings, 40u);
    EXPECT_GE(std::chrono::nanoseconds(sim.duration_ns), 200ms);
    EXPECT_GE(sim.end_ns, sim.start_ns);
}

TEST(AuctionManager, RunTwiceThrows) {
    SimConfig c = smallConfig();
    c.auction.total_auctions = 1;
    c.auction.timeout_ms = 20;
    AuctionManager m(c);
    BidderPool pool(c.bidder, 1);
    m.run(pool);
    EXPECT_THROW(m.run(pool), std::logic_error);
}

TEST(AuctionManager, CancelEndsRunEarly) {
    SimConfig c = smallConfig();
    c.auction.timeout_ms = 10000;
    c.bidder.min_delay_ms = 5000;
    c.bidder.max_delay_ms = 5000;
    AuctionManager m(c);
    BidderPool pool(c.bidder, 1);

    std::thread canceller([&m]() {
        std::this_thread::sleep_for(50ms);
        m.cancel();
    });
    auto t0 = SteadyClock::now();
    SimulationResult sim = m.run(pool);
    canceller.join();

    EXPECT_LT(SteadyClock::now() - t0, 3s);
    EXPECT_EQ(sim.total_auctions, 4u);
    EXPECT_EQ(sim.total_bids, 0u);
    EXPECT_EQ(sim.failed_auctions, 4u);
}

/// Throws on every append; the run must still finish.
class ThrowingSink : public IResultSink {
public:
    void append(const AuctionResult&) override { throw std::runtime_error("boom"); }
    void flush() override { throw std::runtime_error("flush boom"); }
    void close() override { throw std::runtime_error("close boom"); }
};

TEST(AuctionManager, SinkFailureDoesNotAbortRun) {
    SimConfig c = smallConfig();
    c.auction.timeout_ms = 30;
    AuctionManager m(c);
    BidderPool pool(c.bidder, 1);
    ThrowingSink bad;
    RecordingSink good;
    m.addSink(&bad);
    m.addSink(&good);
    SimulationResult sim;
    EXPECT_NO_THROW(sim = m.run(pool));
    EXPECT_EQ(sim.total_auctions, 4u);
    EXPECT_EQ(good.ids.size(), 4u);
    EXPECT_EQ(good.flushes, 1);
    EXPECT_NO_THROW(m.closeSinks());
    EXPECT_EQ(good.closes, 1);
}

TEST(AuctionManager, AddSinkRejectsNullAndLateRegistration) {
    SimConfig c = smallConfig();
    c.auction.timeout_ms = 20;
    AuctionManager m(c);
    EXPECT_THROW(m.addSink(nullptr), std::invalid_argument);

    BidderPool pool(c.bidder, 1);
    m.run(pool);
    RecordingSink late;
    EXPECT_THROW(m.addSink(&late), std::logic_error);
    EXPECT_EQ(m.sinkCount(), 0u);
}

TEST(AuctionManager, FiftyThousandPairingsComplete) {
    SimConfig c = defaultConfig();
    c.auction.total_auctions = 100;
    c.auction.timeout_ms     = 1500;
    c.bidder.total_bidders   = 500;
    c.bidder.bid_probability = 0.5;
    c.bidder.min_delay_ms    = 100;
    c.bidder.max_delay_ms    = 2000;
    c.bidder.worker_threads  = 8;
    c.system.warmup_ms       = 10;
    ASSERT_NO_THROW(c.validate());

    AuctionManager m(c);
    BidderPool pool(c.bidder, c.system.seed);
    EXPECT_EQ(pool.workerCount(), 8u);

    SimulationResult sim;
    ASSERT_NO_THROW(sim = m.run(pool));

    const ParticipationReport& p = sim.participation;
    EXPECT_EQ(sim.total_auctions, 100u);
    EXPECT_EQ(p.pairings, 50000u);
    EXPECT_EQ(p.submitted + p.not_interested + p.abandoned(), p.pairings);
    EXPECT_EQ(sim.total_bids, p.submitted);
    EXPECT_GT(p.submitted, 0u);
    // Think times up to 2 s against a 1.5 s timeout leave some pairings late.
    EXPECT_GT(p.abandoned(), 0u);
}

}  // namespace test
}  // namespace auctionsim
