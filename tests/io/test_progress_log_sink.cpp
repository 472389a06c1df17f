#include <gtest/gtest.h>
#include "io/progress_log_sink.h"
#include "core/records.h"

#include <cstdio>
#include <string>

namespace auctionsim {
namespace test {

static AuctionResult makeResult(uint32_t id, bool winner = true) {
    AuctionResult r{};
    r.auction_id      = id;
    r.item.id         = id;
    r.item.name       = "Canon Art " + std::to_string(id);
    r.item.base_price = 250.0;
    r.total_bids      = winner ? 3 : 0;
    r.status          = winner ? AuctionStatus::COMPLETED : AuctionStatus::NO_BIDS;
    if (winner) {
        Bid b{};
        b.bidder_id  = 17;
        b.auction_id = id;
        b.amount     = 400.0;
        r.winning_bid = b;
    }
    return r;
}

TEST(ProgressLogSink, SelectsFirstAndEveryNth) {
    ProgressLogSink sink(10);
    EXPECT_TRUE(sink.selected(1));
    EXPECT_FALSE(sink.selected(2));
    EXPECT_FALSE(sink.selected(9));
    EXPECT_TRUE(sink.selected(10));
    EXPECT_TRUE(sink.selected(40));

    ProgressLogSink off(0);
    EXPECT_FALSE(off.selected(1));
}

TEST(ProgressLogSink, WritesOnlySelectedLines) {
    std::FILE* out = std::tmpfile();
    ASSERT_NE(out, nullptr);
    {
        ProgressLogSink sink(2, out);
        for (uint32_t id = 1; id <= 5; ++id)
            sink.append(makeResult(id, id != 4));
        sink.flush();
        EXPECT_EQ(sink.linesWritten(), 3u);   // 1, 2, 4
    }

    std::rewind(out);
    std::string text;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), out))
        text += buf;
    std::fclose(out);

    EXPECT_NE(text.find("auction #1 "), std::string::npos);
    EXPECT_NE(text.find("winner=bidder #17"), std::string::npos);
    EXPECT_NE(text.find("no_bids"), std::string::npos);
    EXPECT_EQ(text.find("auction #3 "), std::string::npos);
}

}  // namespace test
}  // namespace auctionsim
