#pragma once

#include "io/i_result_sink.h"

#include <cstdint>
#include <cstdio>

namespace auctionsim {

/// Prints one line per finished auction for auction #1 and every N-th
/// auction after it. Writes to the given stream (stdout by default).
class ProgressLogSink : public IResultSink {
public:
    explicit ProgressLogSink(uint32_t every, std::FILE* out = stdout);

    void append(const AuctionResult& result) override;
    void flush() override;

    /// Whether an auction with this id gets a progress line.
    bool selected(uint32_t auction_id) const;
    uint32_t linesWritten() const { return lines_; }

private:
    uint32_t every_;
    std::FILE* out_;
    uint32_t lines_ = 0;
};

}  // namespace auctionsim
