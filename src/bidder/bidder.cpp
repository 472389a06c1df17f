#include "bidder/bidder.h"

#include "core/clock.h"
#include "rng/mt19937_rng.h"

namespace auctionsim {

const char* outcomeName(ParticipationOutcome o) {
    switch (o) {
        case ParticipationOutcome::NOT_INTERESTED:        return "not_interested";
        case ParticipationOutcome::ABANDONED_IN_DELAY:    return "abandoned_in_delay";
        case ParticipationOutcome::ABANDONED_AFTER_DELAY: return "abandoned_after_delay";
        case ParticipationOutcome::DROPPED_AT_SEND:       return "dropped_at_send";
        case ParticipationOutcome::SUBMITTED:             return "submitted";
        default:                                          return "unknown";
    }
}

Bidder::Bidder(uint32_t id, const BidderConfig& config, uint64_t seed)
    : id_(id), config_(config), seed_(seed) {}

bool Bidder::decideIfBid(IRng& rng) const {
    return rng.bernoulli(config_.bid_probability);
}

std::chrono::milliseconds Bidder::bidDelay(IRng& rng) const {
    const int32_t ms = rng.uniformInt(static_cast<int32_t>(config_.min_delay_ms),
                                      static_cast<int32_t>(config_.max_delay_ms));
    return std::chrono::milliseconds(ms);
}

double Bidder::bidAmount(IRng& rng, const Item& item) const {
    const double mult = rng.uniformReal(config_.min_multiplier, config_.max_multiplier);
    return item.base_price * mult;
}

BidPlan Bidder::plan(uint32_t auction_id, const Item& item) const {
    Mt19937Rng rng(pairingSeed(auction_id));
    BidPlan p;
    p.interested = decideIfBid(rng);
    if (p.interested) {
        p.delay  = bidDelay(rng);
        p.amount = bidAmount(rng, item);
    }
    return p;
}

ParticipationOutcome Bidder::deliver(const CancelScope& scope,
                                     uint32_t auction_id,
                                     double amount,
                                     Channel<Bid>& channel) const {
    if (scope.done())
        return ParticipationOutcome::ABANDONED_AFTER_DELAY;

    Bid bid{};
    bid.bidder_id  = id_;
    bid.auction_id = auction_id;
    bid.amount     = amount;
    bid.ts_ns      = wallClockNs();

    if (!channel.send(bid, scope))
        return ParticipationOutcome::DROPPED_AT_SEND;
    return ParticipationOutcome::SUBMITTED;
}

ParticipationOutcome Bidder::participate(const CancelScope& scope,
                                         uint32_t auction_id,
                                         const Item& item,
                                         Channel<Bid>& channel) const {
    Mt19937Rng rng(pairingSeed(auction_id));
    return participate(scope, rng, auction_id, item, channel);
}

ParticipationOutcome Bidder::participate(const CancelScope& scope,
                                         IRng& rng,
                                         uint32_t auction_id,
                                         const Item& item,
                                         Channel<Bid>& channel) const {
    if (!decideIfBid(rng))
        return ParticipationOutcome::NOT_INTERESTED;

    if (!scope.sleepFor(bidDelay(rng)))
        return ParticipationOutcome::ABANDONED_IN_DELAY;
    return deliver(scope, auction_id, bidAmount(rng, item), channel);
}

}  // namespace auctionsim
