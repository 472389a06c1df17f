#pragma once

#include "config/sim_config.h"
#include "core/records.h"
#include "rng/irng.h"
#include "sync/cancel_scope.h"
#include "sync/channel.h"

#include <chrono>
#include <cstdint>

namespace auctionsim {

enum class ParticipationOutcome : uint8_t {
    NOT_INTERESTED,
    ABANDONED_IN_DELAY,     // deadline fired during think time
    ABANDONED_AFTER_DELAY,  // deadline fired between timer expiry and the re-check
    DROPPED_AT_SEND,        // deadline fired (or channel closed) during the handoff
    SUBMITTED,
};

const char* outcomeName(ParticipationOutcome o);

/// Draws for one pairing, taken up front in protocol order.
struct BidPlan {
    bool interested = false;
    std::chrono::milliseconds delay{0};
    double amount = 0.0;
};

/// Simulated bidder. Immutable after construction, so one Bidder can take
/// part in many auctions at once; each participation draws from its own
/// generator seeded by pairingSeed(auction_id).
class Bidder {
public:
    Bidder(uint32_t id, const BidderConfig& config, uint64_t seed);

    uint32_t id() const { return id_; }
    uint64_t seed() const { return seed_; }
    const BidderConfig& config() const { return config_; }

    /// Seed of the private generator used for one (bidder, auction) pairing.
    uint64_t pairingSeed(uint32_t auction_id) const { return mixSeed(seed_, auction_id); }

    /// True with probability config.bid_probability.
    bool decideIfBid(IRng& rng) const;

    /// Think time, uniform in [min_delay_ms, max_delay_ms].
    std::chrono::milliseconds bidDelay(IRng& rng) const;

    /// Amount, uniform in [base * min_multiplier, base * max_multiplier].
    double bidAmount(IRng& rng, const Item& item) const;

    /// Decision, think time and amount for one pairing, drawn from a
    /// generator seeded by pairingSeed(auction_id) in the same order
    /// participate() draws them. Delay and amount are zero when not interested.
    BidPlan plan(uint32_t auction_id, const Item& item) const;

    /// Second half of the protocol, run once the think time is over:
    /// re-check the scope, then hand the bid to the channel.
    ParticipationOutcome deliver(const CancelScope& scope,
                                 uint32_t auction_id,
                                 double amount,
                                 Channel<Bid>& channel) const;

    /// Full participation protocol for one auction with a generator seeded
    /// from pairingSeed(auction_id). Submits at most one bid.
    ParticipationOutcome participate(const CancelScope& scope,
                                     uint32_t auction_id,
                                     const Item& item,
                                     Channel<Bid>& channel) const;

    /// Same protocol drawing from a caller-supplied generator.
    ParticipationOutcome participate(const CancelScope& scope,
                                     IRng& rng,
                                     uint32_t auction_id,
                                     const Item& item,
                                     Channel<Bid>& channel) const;

private:
    uint32_t id_;
    BidderConfig config_;
    uint64_t seed_;
};

}  // namespace auctionsim
