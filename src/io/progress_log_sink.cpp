#include "io/progress_log_sink.h"

namespace auctionsim {

ProgressLogSink::ProgressLogSink(uint32_t every, std::FILE* out)
    : every_(every), out_(out) {}

bool ProgressLogSink::selected(uint32_t auction_id) const {
    if (every_ == 0)
        return false;
    return auction_id == 1 || auction_id % every_ == 0;
}

void ProgressLogSink::append(const AuctionResult& r) {
    if (!selected(r.auction_id))
        return;

    if (r.winning_bid) {
        std::fprintf(out_, "  auction #%-4u %-32s base=%10.2f  bids=%4u  winner=bidder #%u @ %.2f\n",
                     r.auction_id, r.item.name.c_str(), r.item.base_price, r.total_bids,
                     r.winning_bid->bidder_id, r.winning_bid->amount);
    } else {
        std::fprintf(out_, "  auction #%-4u %-32s base=%10.2f  bids=%4u  %s\n",
                     r.auction_id, r.item.name.c_str(), r.item.base_price, r.total_bids,
                     statusName(r.status));
    }
    ++lines_;
}

void ProgressLogSink::flush() {
    std::fflush(out_);
}

}  // namespace auctionsim
