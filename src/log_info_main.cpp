#include "io/bid_log_reader.h"
#include "io/auction_log_format.h"

#include <cstdio>
#include <cstdlib>
#include <vector>
#include <string>

using auctionsim::BidLogReader;
using auctionsim::FileHeader;

static void printHeader(const FileHeader& h) {
    std::printf("=== File Header ===\n");
    std::printf("  version:             %u.%u\n", h.version_major, h.version_minor);
    std::printf("  record_size:         %u bytes\n", h.record_size);
    std::printf("  seed:                %llu\n", (unsigned long long)h.seed);
    std::printf("  total_auctions:      %u\n", h.total_auctions);
    std::printf("  total_bidders:       %u\n", h.total_bidders);
    std::printf("  timeout_ms:          %u\n", h.timeout_ms);
    std::printf("  bid_probability:     %.3f\n", h.bid_probability);
    std::printf("  start_ns:            %llu\n", (unsigned long long)h.start_ns);
    std::printf("  chunk_capacity:      %u\n", h.chunk_capacity);
    std::printf("  has_index:           %s\n",
                (h.header_flags & auctionsim::kHeaderFlagHasIndex) ? "yes" : "no");
}

static void printSummary(const BidLogReader& reader) {
    const auto& idx = reader.index();
    uint64_t total = reader.totalRecords();
    uint64_t first_ts = idx.empty() ? 0 : idx.front().first_ts_ns;
    uint64_t last_ts = idx.empty() ? 0 : idx.back().last_ts_ns;
    double duration_sec = last_ts > first_ts ? static_cast<double>(last_ts - first_ts) / 1e9 : 0.0;

    std::printf("\n=== Summary ===\n");
    std::printf("  chunks:              %u\n", reader.chunkCount());
    std::printf("  total_bids:          %llu\n", (unsigned long long)total);
    std::printf("  time_range:          %llu - %llu ns\n",
                (unsigned long long)first_ts, (unsigned long long)last_ts);
    std::printf("  duration:            %.3f s\n", duration_sec);
    if (duration_sec > 0.0)
        std::printf("  bids/sec:            %.1f\n", static_cast<double>(total) / duration_sec);

    uint64_t raw_bytes = total * reader.header().record_size;
    std::printf("  raw_size:            %.2f MB\n", static_cast<double>(raw_bytes) / (1024.0 * 1024.0));
}

static void printAuctionDistribution(const BidLogReader& reader) {
    const auto per_auction = reader.bidsPerAuction();
    const auto winners = reader.replayWinners();

    std::printf("\n=== Bids per Auction ===\n");
    std::printf("  %-10s %8s   %s\n", "auction", "bids", "winner");
    for (const auto& entry : per_auction) {
        auto w = winners.find(entry.first);
        if (w != winners.end())
            std::printf("  #%-9u %8llu   bidder #%u @ %.2f\n", entry.first,
                        (unsigned long long)entry.second, w->second.bidder_id, w->second.amount);
        else
            std::printf("  #%-9u %8llu   -\n", entry.first, (unsigned long long)entry.second);
    }
}

static void printBids(const char* title, const std::vector<auctionsim::Bid>& bids) {
    std::printf("\n=== %s (%zu bids) ===\n", title, bids.size());
    std::printf("  %-20s %-10s %-10s %-12s\n", "ts_ns", "auction", "bidder", "amount");
    for (const auto& b : bids)
        std::printf("  %-20llu %-10u %-10u %-12.2f\n",
                    (unsigned long long)b.ts_ns, b.auction_id, b.bidder_id, b.amount);
}

static void printFirstN(const BidLogReader& reader, int n) {
    std::printf("\n=== First %d Bids ===\n", n);
    std::printf("  %-20s %-10s %-10s %-12s\n", "ts_ns", "auction", "bidder", "amount");

    int printed = 0;
    for (uint32_t c = 0; c < reader.chunkCount() && printed < n; ++c) {
        auto chunk = reader.readChunk(c);
        for (const auto& r : chunk) {
            if (printed >= n) break;
            std::printf("  %-20llu %-10u %-10u %-12.2f\n",
                        (unsigned long long)r.ts_ns, r.auction_id, r.bidder_id, r.amount);
            printed++;
        }
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::fprintf(stderr,
                     "Usage: %s <file.alog> [--bids N] [--per-auction] [--auction ID] [--bidder ID]\n",
                     argv[0]);
        return 1;
    }

    const char* path = argv[1];
    int show_bids = 10;
    bool per_auction = false;
    long auction_id = -1;
    long bidder_id = -1;

    for (int i = 2; i < argc; ++i) {
        if (std::string(argv[i]) == "--bids" && i + 1 < argc) {
            show_bids = std::atoi(argv[++i]);
        } else if (std::string(argv[i]) == "--per-auction") {
            per_auction = true;
        } else if (std::string(argv[i]) == "--auction" && i + 1 < argc) {
            auction_id = std::atol(argv[++i]);
        } else if (std::string(argv[i]) == "--bidder" && i + 1 < argc) {
            bidder_id = std::atol(argv[++i]);
        }
    }

    try {
        BidLogReader reader(path);

        printHeader(reader.header());
        printSummary(reader);
        if (per_auction)
            printAuctionDistribution(reader);
        if (auction_id >= 0) {
            const std::string title = "Auction #" + std::to_string(auction_id);
            printBids(title.c_str(), reader.readAuction(static_cast<uint32_t>(auction_id)));
        }
        if (bidder_id >= 0) {
            const std::string title = "Bidder #" + std::to_string(bidder_id);
            printBids(title.c_str(), reader.readBidder(static_cast<uint32_t>(bidder_id)));
        }
        printFirstN(reader, show_bids);

    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
