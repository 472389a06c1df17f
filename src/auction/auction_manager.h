#pragma once

#include "auction/auction.h"
#include "bidder/bidder_pool.h"
#include "config/sim_config.h"
#include "core/clock.h"
#include "core/records.h"
#include "io/i_result_sink.h"
#include "model/item_generator.h"
#include "sync/cancel_scope.h"

#include <memory>
#include <mutex>
#include <vector>

namespace auctionsim {

/// Orchestrates one simulation: construct, run, aggregate, discard.
///
/// run() opens every auction and starts one thread per auction, waits out the
/// warm-up, then fans the bidder pool out on a single extra thread. Each
/// finished result is appended under the manager lock and then forwarded to
/// every registered sink outside it. Sinks are best-effort: a sink that
/// throws is logged and skipped, and the run goes on.
class AuctionManager {
public:
    explicit AuctionManager(const SimConfig& config);

    AuctionManager(const AuctionManager&) = delete;
    AuctionManager& operator=(const AuctionManager&) = delete;

    /// Generate items 1..total_auctions and build the auctions.
    /// No-op if the roster already exists.
    void createAuctions();

    /// Register a non-owning result sink. Sinks receive results in
    /// completion order, one call at a time.
    /// Throws std::logic_error once run() has started.
    void addSink(IResultSink* sink);
    size_t sinkCount() const { return sinks_.size(); }

    /// Run the whole simulation. Creates the roster if needed and flushes
    /// every sink at the end.
    /// Throws std::logic_error if called twice, std::runtime_error if an
    /// auction or the pool failed.
    SimulationResult run(BidderPool& pool);

    /// Close every sink, logging failures. Idempotent per sink contract.
    void closeSinks();

    /// Append one finished result under the manager lock.
    void recordResult(const AuctionResult& result);

    /// Build the SimulationResult from everything recorded so far, ordered
    /// by auction id.
    SimulationResult aggregateResults() const;

    /// Cancel the root scope: every auction and pairing finishes early.
    void cancel() { root_.cancel(); }

    const SimConfig& config() const { return config_; }
    const std::vector<std::unique_ptr<Auction>>& auctions() const { return auctions_; }
    std::vector<Auction*> auctionPointers() const;
    size_t resultCount() const;

private:
    void forward(const AuctionResult& result);
    void flushSinks();

    SimConfig config_;
    ItemGenerator items_;
    CancelScope root_;
    std::vector<std::unique_ptr<Auction>> auctions_;
    bool ran_ = false;

    mutable std::mutex mu_;           // guards results and timestamps below
    std::vector<AuctionResult> results_;
    ParticipationReport participation_;
    uint64_t start_ns_ = 0;
    uint64_t end_ns_ = 0;
    SteadyClock::time_point started_at_{};
    SteadyClock::time_point finished_at_{};

    std::mutex sink_mu_;               // serializes calls into sinks_
    std::vector<IResultSink*> sinks_;
};

}  // namespace auctionsim
