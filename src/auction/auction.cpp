#include "auction/auction.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace auctionsim {

const char* stateName(AuctionState s) {
    switch (s) {
        case AuctionState::PENDING:    return "pending";
        case AuctionState::COLLECTING: return "collecting";
        case AuctionState::DRAINING:   return "draining";
        case AuctionState::RESOLVED:   return "resolved";
        default:                       return "unknown";
    }
}

std::optional<Bid> selectWinner(const std::vector<Bid>& bids) {
    if (bids.empty())
        return std::nullopt;

    // Head of the (amount desc, ts asc) order; strict comparisons keep the
    // earlier-received bid on a full tie.
    const Bid* best = &bids.front();
    for (const Bid& b : bids) {
        if (b.amount > best->amount ||
            (b.amount == best->amount && b.ts_ns < best->ts_ns))
            best = &b;
    }
    return *best;
}

Auction::Auction(uint32_t id, Item item, std::chrono::milliseconds timeout,
                 size_t channel_capacity)
    : id_(id)
    , item_(std::move(item))
    , timeout_(timeout)
    , channel_(channel_capacity)
{
    bids_.reserve(channel_capacity);
}

void Auction::open(const CancelScope& parent) {
    std::lock_guard<std::mutex> g(mu_);
    if (scope_)
        return;
    opened_at_ = SteadyClock::now();
    start_ns_  = wallClockNs();
    scope_     = CancelScope::withTimeout(parent, timeout_);
    state_.store(AuctionState::COLLECTING, std::memory_order_release);
}

AuctionResult Auction::run(const CancelScope& parent) {
    if (run_called_.exchange(true))
        throw std::logic_error("Auction: run called twice on auction " + std::to_string(id_));

    open(parent);
    collect(scope());
    return resolve();
}

bool Auction::submit(const Bid& bid) {
    if (state() != AuctionState::COLLECTING)
        return false;
    return channel_.trySend(bid);
}

bool Auction::submit(const Bid& bid, const CancelScope& scope) {
    if (state() != AuctionState::COLLECTING)
        return false;
    return channel_.send(bid, scope);
}

CancelScope Auction::scope() const {
    std::lock_guard<std::mutex> g(mu_);
    if (!scope_)
        throw std::logic_error("Auction: scope requested before open on auction " +
                               std::to_string(id_));
    return *scope_;
}

std::vector<Bid> Auction::bids() const {
    std::lock_guard<std::mutex> g(mu_);
    return bids_;
}

// --- Private ---

void Auction::collect(const CancelScope& scope) {
    Bid bid{};
    while (channel_.recv(bid, scope) == RecvStatus::ITEM)
        record(bid);

    // Deadline or external close. Closing first makes every later send fail,
    // so nothing is stranded in the buffer after the drain below.
    state_.store(AuctionState::DRAINING, std::memory_order_release);
    channel_.close();
    while (channel_.tryRecv(bid))
        record(bid);

    std::lock_guard<std::mutex> g(mu_);
    closed_at_ = SteadyClock::now();
    end_ns_    = wallClockNs();
}

void Auction::record(const Bid& bid) {
    std::lock_guard<std::mutex> g(mu_);
    bids_.push_back(bid);
}

AuctionResult Auction::resolve() {
    AuctionResult result{};
    {
        std::lock_guard<std::mutex> g(mu_);
        result.auction_id  = id_;
        result.item        = item_;
        result.total_bids  = static_cast<uint32_t>(bids_.size());
        result.start_ns    = start_ns_;
        result.end_ns      = end_ns_;
        result.duration_ns = elapsedNs(opened_at_, closed_at_);
        result.winning_bid = selectWinner(bids_);
    }
    result.status = result.winning_bid ? AuctionStatus::COMPLETED : AuctionStatus::NO_BIDS;

    state_.store(AuctionState::RESOLVED, std::memory_order_release);
    return result;
}

}  // namespace auctionsim
