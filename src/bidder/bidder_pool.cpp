#include "bidder/bidder_pool.h"

#include "rng/irng.h"
#include "sync/cancel_scope.h"
#include "sync/worker_pool.h"

#include <atomic>
#include <thread>

namespace auctionsim {

namespace {

size_t resolveWorkers(uint32_t requested) {
    if (requested != 0)
        return requested;
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}

}  // namespace

BidderPool::BidderPool(const BidderConfig& config, uint64_t base_seed)
    : config_(config), workers_(resolveWorkers(config.worker_threads))
{
    bidders_.reserve(config_.total_bidders);
    for (uint32_t i = 0; i < config_.total_bidders; ++i)
        bidders_.emplace_back(i + 1, config_, mixSeed(base_seed, i + 1));
}

ParticipationReport BidderPool::participateInAll(const std::vector<Auction*>& auctions) {
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> not_interested{0};
    std::atomic<uint64_t> abandoned_in_delay{0};
    std::atomic<uint64_t> abandoned_after_delay{0};
    std::atomic<uint64_t> dropped_at_send{0};

    auto tally = [&](ParticipationOutcome o) {
        switch (o) {
            case ParticipationOutcome::SUBMITTED:             ++submitted; break;
            case ParticipationOutcome::NOT_INTERESTED:        ++not_interested; break;
            case ParticipationOutcome::ABANDONED_IN_DELAY:    ++abandoned_in_delay; break;
            case ParticipationOutcome::ABANDONED_AFTER_DELAY: ++abandoned_after_delay; break;
            case ParticipationOutcome::DROPPED_AT_SEND:       ++dropped_at_send; break;
        }
    };

    // Resolve scopes up front so an unopened auction fails before any work starts.
    std::vector<CancelScope> auction_scopes;
    auction_scopes.reserve(auctions.size());
    for (Auction* a : auctions)
        auction_scopes.push_back(a->scope());

    WorkerPool workers(workers_);

    // One planning task per bidder keeps the immediate queue short; each
    // interested pairing then waits on a timer, not on a thread.
    for (const Bidder& bidder : bidders_) {
        workers.post([&workers, &bidder, &auctions, &auction_scopes, &tally] {
            for (size_t ai = 0; ai < auctions.size(); ++ai) {
                Auction* auction = auctions[ai];
                const BidPlan plan = bidder.plan(auction->id(), auction->item());
                if (!plan.interested) {
                    tally(ParticipationOutcome::NOT_INTERESTED);
                    continue;
                }
                const CancelScope pairing =
                    CancelScope::withTimeout(auction_scopes[ai], auction->timeout());
                workers.postAt(SteadyClock::now() + plan.delay, pairing,
                               [&bidder, auction, pairing, plan, &tally](bool elapsed) {
                    if (!elapsed) {
                        tally(ParticipationOutcome::ABANDONED_IN_DELAY);
                        return;
                    }
                    tally(bidder.deliver(pairing, auction->id(), plan.amount,
                                         auction->bidChannel()));
                });
            }
        });
    }
    workers.waitIdle();

    ParticipationReport report;
    report.pairings              = static_cast<uint64_t>(bidders_.size()) * auctions.size();
    report.submitted             = submitted.load();
    report.not_interested        = not_interested.load();
    report.abandoned_in_delay    = abandoned_in_delay.load();
    report.abandoned_after_delay = abandoned_after_delay.load();
    report.dropped_at_send       = dropped_at_send.load();
    return report;
}

}  // namespace auctionsim
