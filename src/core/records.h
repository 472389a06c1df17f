#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace auctionsim {

// --- Item (20 attributes, immutable once generated) ---
struct Item {
    uint32_t    id;
    std::string name;
    std::string category;
    std::string brand;
    std::string condition;
    std::string color;
    std::string size;
    double      weight_kg;
    std::string material;
    int32_t     year_made;
    std::string origin;
    std::string rarity;
    double      base_price;
    std::string description;
    std::string features;
    int32_t     warranty_months;
    double      ship_weight_kg;
    std::string dimensions;     // "LxWxH" in cm
    std::string certification;
    double      rating;         // 3.0 - 10.0
};

// --- Bid ---
struct Bid {
    uint32_t bidder_id;
    uint32_t auction_id;
    double   amount;
    uint64_t ts_ns;             // wall clock, ns since epoch
};

enum class AuctionStatus : uint8_t {
    COMPLETED = 0,
    NO_BIDS   = 1,
};

inline const char* statusName(AuctionStatus s) {
    switch (s) {
        case AuctionStatus::COMPLETED: return "completed";
        case AuctionStatus::NO_BIDS:   return "no_bids";
        default:                       return "unknown";
    }
}

// --- AuctionResult: produced exactly once per auction ---
struct AuctionResult {
    uint32_t           auction_id;
    Item               item;
    std::optional<Bid> winning_bid;  // present iff status == COMPLETED
    uint32_t           total_bids;
    AuctionStatus      status;
    uint64_t           start_ns;
    uint64_t           end_ns;
    uint64_t           duration_ns;  // steady clock, open -> resolved
};

// --- Outcome tallies reported by BidderPool ---
struct ParticipationReport {
    uint64_t pairings              = 0;
    uint64_t submitted             = 0;
    uint64_t not_interested        = 0;
    uint64_t abandoned_in_delay    = 0;
    uint64_t abandoned_after_delay = 0;
    uint64_t dropped_at_send       = 0;

    uint64_t abandoned() const {
        return abandoned_in_delay + abandoned_after_delay + dropped_at_send;
    }
};

// --- Resource figures reported by ResourceMonitor ---
struct ResourceStats {
    double   initial_memory_mb = 0.0;
    double   final_memory_mb   = 0.0;
    double   peak_memory_mb    = 0.0;
    double   average_memory_mb = 0.0;
    uint32_t peak_threads      = 0;
    uint32_t hardware_threads  = 0;
    uint32_t samples           = 0;
};

// --- SimulationResult: built once after every auction resolved ---
struct SimulationResult {
    uint32_t                   total_auctions;
    uint32_t                   successful_auctions;
    uint32_t                   failed_auctions;
    uint64_t                   total_bids;
    uint64_t                   start_ns;
    uint64_t                   end_ns;
    uint64_t                   duration_ns;
    std::vector<AuctionResult> auction_results;
    ParticipationReport        participation;
    ResourceStats              resources;
};

}  // namespace auctionsim
