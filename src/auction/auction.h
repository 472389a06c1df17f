#pragma once

#include "config/sim_config.h"
#include "core/clock.h"
#include "core/records.h"
#include "sync/cancel_scope.h"
#include "sync/channel.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace auctionsim {

enum class AuctionState : uint8_t {
    PENDING    = 0,  // constructed, collection window not opened
    COLLECTING = 1,
    DRAINING   = 2,  // deadline fired; retrieving already-buffered bids
    RESOLVED   = 3,
};

const char* stateName(AuctionState s);

/// Highest amount wins; equal amounts go to the earliest timestamp, then to
/// the bid received first. Empty input yields no winner.
std::optional<Bid> selectWinner(const std::vector<Bid>& bids);

/// One timed sealed-bid auction.
///
/// Bids arrive through a bounded channel while the auction is COLLECTING.
/// When the auction's scope is done (or the channel is closed externally),
/// the channel is closed, whatever is already buffered is drained without
/// waiting, and the winner is chosen. Sends still in flight at that point
/// fail; they are never delivered late.
class Auction {
public:
    Auction(uint32_t id, Item item, std::chrono::milliseconds timeout,
            size_t channel_capacity = kDefaultChannelCapacity);

    Auction(const Auction&) = delete;
    Auction& operator=(const Auction&) = delete;

    /// Start the collection window: records the start instant and derives
    /// this auction's scope from parent, bounded by the timeout.
    /// No-op if already opened.
    void open(const CancelScope& parent);

    /// Open if needed, collect until the scope is done or the channel is
    /// closed, drain, and resolve. Throws std::logic_error if called twice.
    AuctionResult run(const CancelScope& parent);

    /// Non-blocking submission. False once the auction stopped collecting or
    /// when the buffer is full.
    bool submit(const Bid& bid);

    /// Submission that waits for buffer space until scope is done.
    bool submit(const Bid& bid, const CancelScope& scope);

    /// External close: ends collection early. Buffered bids are still drained.
    void closeChannel() { channel_.close(); }

    /// The auction's scope. Throws std::logic_error while PENDING.
    CancelScope scope() const;

    /// Copy of every bid recorded so far.
    std::vector<Bid> bids() const;

    AuctionState state() const { return state_.load(std::memory_order_acquire); }
    uint32_t id() const { return id_; }
    const Item& item() const { return item_; }
    std::chrono::milliseconds timeout() const { return timeout_; }
    Channel<Bid>& bidChannel() { return channel_; }

private:
    void collect(const CancelScope& scope);
    void record(const Bid& bid);
    AuctionResult resolve();

    const uint32_t id_;
    const Item item_;
    const std::chrono::milliseconds timeout_;

    Channel<Bid> channel_;
    std::atomic<AuctionState> state_{AuctionState::PENDING};
    std::atomic<bool> run_called_{false};

    mutable std::mutex mu_;           // guards everything below
    std::vector<Bid> bids_;
    std::optional<CancelScope> scope_;
    uint64_t start_ns_ = 0;
    uint64_t end_ns_ = 0;
    SteadyClock::time_point opened_at_{};
    SteadyClock::time_point closed_at_{};
};

}  // namespace auctionsim
