#pragma once

#include <cstdint>
#include <string>

namespace auctionsim {

constexpr uint32_t kDefaultChannelCapacity = 100;

// Each auction owns a collector thread; pairings share a fixed worker pool.
constexpr uint32_t kMaxAuctions      = 4096;
constexpr uint32_t kMaxWorkerThreads = 1024;

struct AuctionConfig {
    uint32_t total_auctions        = 40;
    uint32_t timeout_ms            = 10000;
    double   minimum_bid_increment = 1.0;     // reported only; sealed bids are not stepped
    uint32_t channel_capacity      = kDefaultChannelCapacity;
};

struct BidderConfig {
    uint32_t total_bidders   = 100;
    double   bid_probability = 0.3;   // chance a bidder bids on a given item
    double   min_multiplier  = 1.0;   // min bid = base_price * min_multiplier
    double   max_multiplier  = 2.5;   // max bid = base_price * max_multiplier
    uint32_t min_delay_ms    = 100;
    uint32_t max_delay_ms    = 2000;
    uint32_t worker_threads  = 0;     // pairing workers, 0 = hardware concurrency
};

struct SystemConfig {
    uint64_t    seed               = 42;
    uint32_t    warmup_ms          = 50;    // auctions listen before bidders start
    uint32_t    log_every          = 10;    // progress line every N-th auction (0 = off)
    uint32_t    sample_interval_ms = 500;   // resource monitor period
    std::string output_dir         = "output";
    bool        export_results     = true;
    bool        write_bid_log      = false;
    std::string kafka_brokers;              // empty = no Kafka
    std::string kafka_topic        = "auction.results";
};

struct SimConfig {
    AuctionConfig auction;
    BidderConfig  bidder;
    SystemConfig  system;

    /// Throws std::invalid_argument naming the first offending field.
    void validate() const;
};

/// Defaults from the reference run: 40 auctions x 100 bidders, 10 s timeout.
SimConfig defaultConfig();

/// Parse command-line flags on top of defaultConfig(). Sets help_requested
/// instead of parsing further when --help / -h is seen.
/// Throws std::invalid_argument on unknown flags or malformed values.
SimConfig parseArgs(int argc, const char* const argv[], bool& help_requested);

void printUsage(const char* prog);

}  // namespace auctionsim
