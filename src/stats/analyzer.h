#pragma once

#include "core/records.h"

#include <cstdint>
#include <string>

namespace auctionsim {

struct Statistics {
    // Bids per auction
    uint64_t total_bids   = 0;
    double   average_bids = 0.0;
    uint32_t min_bids     = 0;
    uint32_t max_bids     = 0;
    double   median_bids  = 0.0;
    double   stddev_bids  = 0.0;     // population standard deviation

    // Winning amounts
    double total_revenue      = 0.0;
    double average_win_amount = 0.0;
    double min_win_amount     = 0.0;
    double max_win_amount     = 0.0;
    double median_win_amount  = 0.0;

    // Bidders
    uint32_t unique_winners         = 0;
    uint32_t most_successful_bidder = 0;  // 0 = no winners
    uint32_t most_successful_wins   = 0;

    // Throughput over the manager's wall time
    double bids_per_second     = 0.0;
    double auctions_per_second = 0.0;

    double   success_rate        = 0.0;   // percent of auctions with a winner
    uint32_t successful_auctions = 0;
    uint32_t failed_auctions     = 0;
};

/// Post-run statistics over a SimulationResult. Stateless.
class Analyzer {
public:
    Statistics analyze(const SimulationResult& result) const;

    /// Multi-line text report; the revenue block is omitted when nothing sold.
    std::string formatReport(const Statistics& stats) const;
};

}  // namespace auctionsim
