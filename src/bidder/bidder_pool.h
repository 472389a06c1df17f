#pragma once

#include "auction/auction.h"
#include "bidder/bidder.h"
#include "config/sim_config.h"
#include "core/records.h"

#include <cstdint>
#include <vector>

namespace auctionsim {

/// Fans every bidder out against every auction. Each (bidder, auction)
/// pairing runs under a fresh child of that auction's scope, so an auction
/// closing cancels all of its pending bidders.
///
/// Pairings do not own threads: a fixed WorkerPool draws each pairing's plan,
/// parks it on a timer for its think time and delivers the bid when the
/// timer fires. The pairing count is bounded by memory, not by the
/// process thread limit.
class BidderPool {
public:
    /// Bidders get ids 1..total_bidders and seeds derived from base_seed.
    BidderPool(const BidderConfig& config, uint64_t base_seed);

    /// Blocks until every pairing has bid, declined or been cancelled.
    /// Every auction must already be open (see Auction::open).
    ParticipationReport participateInAll(const std::vector<Auction*>& auctions);

    const std::vector<Bidder>& bidders() const { return bidders_; }
    size_t bidderCount() const { return bidders_.size(); }

    /// Worker threads used per participateInAll() call.
    size_t workerCount() const { return workers_; }

private:
    BidderConfig config_;
    std::vector<Bidder> bidders_;
    size_t workers_;
};

}  // namespace auctionsim
