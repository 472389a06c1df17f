#include "stats/analyzer.h"

#include "core/format.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <vector>

namespace auctionsim {

namespace {

template <typename T>
double median(std::vector<T> values) {
    if (values.empty())
        return 0.0;
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    if (values.size() % 2 == 0)
        return (static_cast<double>(values[mid - 1]) + static_cast<double>(values[mid])) / 2.0;
    return static_cast<double>(values[mid]);
}

void analyzeBidCounts(const std::vector<AuctionResult>& results, Statistics& s) {
    if (results.empty())
        return;

    std::vector<uint32_t> counts;
    counts.reserve(results.size());
    uint64_t sum = 0;
    s.min_bids = results.front().total_bids;
    s.max_bids = results.front().total_bids;
    for (const auto& r : results) {
        counts.push_back(r.total_bids);
        sum += r.total_bids;
        s.min_bids = std::min(s.min_bids, r.total_bids);
        s.max_bids = std::max(s.max_bids, r.total_bids);
    }

    s.average_bids = static_cast<double>(sum) / static_cast<double>(counts.size());
    s.median_bids  = median(counts);

    double variance = 0.0;
    for (uint32_t c : counts) {
        const double diff = static_cast<double>(c) - s.average_bids;
        variance += diff * diff;
    }
    variance /= static_cast<double>(counts.size());
    s.stddev_bids = std::sqrt(variance);
}

void analyzeWinningAmounts(const std::vector<AuctionResult>& results, Statistics& s) {
    std::vector<double> amounts;
    for (const auto& r : results) {
        if (r.winning_bid) {
            amounts.push_back(r.winning_bid->amount);
            s.total_revenue += r.winning_bid->amount;
        }
    }
    if (amounts.empty())
        return;

    const auto mm = std::minmax_element(amounts.begin(), amounts.end());
    s.min_win_amount     = *mm.first;
    s.max_win_amount     = *mm.second;
    s.average_win_amount = s.total_revenue / static_cast<double>(amounts.size());
    s.median_win_amount  = median(amounts);
}

void analyzeWinners(const std::vector<AuctionResult>& results, Statistics& s) {
    std::map<uint32_t, uint32_t> wins;
    for (const auto& r : results) {
        if (r.winning_bid)
            ++wins[r.winning_bid->bidder_id];
    }
    s.unique_winners = static_cast<uint32_t>(wins.size());

    // Ordered map: ties go to the lowest bidder id.
    for (const auto& w : wins) {
        if (w.second > s.most_successful_wins) {
            s.most_successful_wins   = w.second;
            s.most_successful_bidder = w.first;
        }
    }
}

}  // namespace

Statistics Analyzer::analyze(const SimulationResult& result) const {
    Statistics s;
    s.total_bids          = result.total_bids;
    s.successful_auctions = result.successful_auctions;
    s.failed_auctions     = result.failed_auctions;

    analyzeBidCounts(result.auction_results, s);
    analyzeWinningAmounts(result.auction_results, s);
    analyzeWinners(result.auction_results, s);

    const double seconds = static_cast<double>(result.duration_ns) / 1e9;
    if (seconds > 0.0) {
        s.bids_per_second     = static_cast<double>(result.total_bids) / seconds;
        s.auctions_per_second = static_cast<double>(result.total_auctions) / seconds;
    }

    if (result.total_auctions > 0)
        s.success_rate = 100.0 * static_cast<double>(result.successful_auctions) /
                         static_cast<double>(result.total_auctions);
    return s;
}

std::string Analyzer::formatReport(const Statistics& s) const {
    std::string out;
    out += "\n=== Detailed Statistics ===\n\n";

    out += "Bids:\n";
    appendf(out, "  total:               %llu\n", (unsigned long long)s.total_bids);
    appendf(out, "  average/auction:     %.1f\n", s.average_bids);
    appendf(out, "  median:              %.1f\n", s.median_bids);
    appendf(out, "  min/max:             %u / %u\n", s.min_bids, s.max_bids);
    appendf(out, "  stddev:              %.2f\n\n", s.stddev_bids);

    if (s.total_revenue > 0.0) {
        out += "Revenue:\n";
        appendf(out, "  total:               %.2f\n", s.total_revenue);
        appendf(out, "  average win:         %.2f\n", s.average_win_amount);
        appendf(out, "  median win:          %.2f\n", s.median_win_amount);
        appendf(out, "  min/max:             %.2f / %.2f\n\n", s.min_win_amount, s.max_win_amount);
    }

    out += "Bidders:\n";
    appendf(out, "  unique winners:      %u\n", s.unique_winners);
    if (s.most_successful_bidder > 0)
        appendf(out, "  top bidder:          #%u (%u wins)\n\n",
                s.most_successful_bidder, s.most_successful_wins);
    else
        out += "  top bidder:          none\n\n";

    out += "Performance:\n";
    appendf(out, "  bids/sec:            %.1f\n", s.bids_per_second);
    appendf(out, "  auctions/sec:        %.2f\n", s.auctions_per_second);
    appendf(out, "  success rate:        %.1f%% (%u ok, %u failed)\n",
            s.success_rate, s.successful_auctions, s.failed_auctions);

    return out;
}

}  // namespace auctionsim
