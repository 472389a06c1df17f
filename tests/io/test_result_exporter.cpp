#include <gtest/gtest.h>
#include "io/result_exporter.h"

#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace auctionsim {
namespace test {

namespace fs = std::filesystem;

static SimulationResult makeSimulation() {
    SimulationResult sim{};

    AuctionResult won{};
    won.auction_id        = 1;
    won.item.id           = 1;
    won.item.name         = "Rolex Jewelry 1";
    won.item.category     = "Jewelry";
    won.item.base_price   = 1200.5;
    won.item.dimensions   = "10.0x20.0x30.0";
    won.total_bids        = 4;
    won.status            = AuctionStatus::COMPLETED;
    won.duration_ns       = 10'000'000'000ULL;
    Bid b{};
    b.bidder_id  = 42;
    b.auction_id = 1;
    b.amount     = 2000.25;
    won.winning_bid = b;

    AuctionResult empty{};
    empty.auction_id      = 2;
    empty.item.id         = 2;
    empty.item.name       = "Generic \"Quoted\", Books 2";
    empty.item.category   = "Books";
    empty.item.base_price = 15.0;
    empty.total_bids      = 0;
    empty.status          = AuctionStatus::NO_BIDS;
    empty.duration_ns     = 10'000'500'000ULL;

    sim.auction_results     = {won, empty};
    sim.total_auctions      = 2;
    sim.successful_auctions = 1;
    sim.failed_auctions     = 1;
    sim.total_bids          = 4;
    sim.start_ns            = 1700000000000000000ULL;
    sim.end_ns              = 1700000010000000000ULL;
    sim.duration_ns         = 10'000'000'000ULL;
    return sim;
}

static std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string line;
    while (std::getline(ss, line))
        out.push_back(line);
    return out;
}

class ResultExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = testing::TempDir() + "exporter_" +
               std::to_string(reinterpret_cast<uintptr_t>(this)) + "/nested";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(fs::path(dir_).parent_path(), ec);
    }

    std::string dir_;
};

TEST_F(ResultExporterTest, CsvHasHeaderAndNaForMissingWinner) {
    ResultExporter exporter(dir_);
    const std::string path = exporter.exportCsv(makeSimulation());

    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::path(path).extension(), ".csv");
    EXPECT_EQ(fs::path(path).filename().string().rfind("simulation_", 0), 0u);

    auto rows = lines(slurp(path));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], "AuctionID,ItemName,ItemCategory,BasePrice,Status,TotalBids,"
                       "WinnerBidderID,WinningAmount,Duration_ms");
    EXPECT_EQ(rows[1], "1,Rolex Jewelry 1,Jewelry,1200.50,completed,4,42,2000.25,10000");
    EXPECT_EQ(rows[2], "2,\"Generic \"\"Quoted\"\", Books 2\",Books,15.00,no_bids,0,N/A,N/A,10000");
}

TEST_F(ResultExporterTest, JsonContainsResultsAndNullWinner) {
    ResultExporter exporter(dir_);
    const std::string path = exporter.exportJson(makeSimulation());
    const std::string json = slurp(path);

    EXPECT_EQ(fs::path(path).extension(), ".json");
    EXPECT_NE(json.find("\"total_auctions\": 2"), std::string::npos);
    EXPECT_NE(json.find("\"successful_auctions\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"bidder_id\": 42"), std::string::npos);
    EXPECT_NE(json.find("\"winning_bid\": null"), std::string::npos);
    EXPECT_NE(json.find("\"status\": \"no_bids\""), std::string::npos);
    EXPECT_NE(json.find("\"name\": \"Generic \\\"Quoted\\\", Books 2\""), std::string::npos);
    EXPECT_NE(json.find("\"dimensions\": \"10.0x20.0x30.0\""), std::string::npos);
    EXPECT_EQ(json.front(), '{');
}

TEST_F(ResultExporterTest, SummaryIncludesOverviewAndReport) {
    ResultExporter exporter(dir_);
    const std::string path =
        exporter.exportSummary(makeSimulation(), "\n=== Detailed Statistics ===\n");
    const std::string text = slurp(path);

    EXPECT_EQ(fs::path(path).filename().string().rfind("summary_", 0), 0u);
    EXPECT_NE(text.find("AUCTION SIMULATION SUMMARY"), std::string::npos);
    EXPECT_NE(text.find("total auctions: 2"), std::string::npos);
    EXPECT_NE(text.find("failed:         1"), std::string::npos);
    EXPECT_NE(text.find("=== Detailed Statistics ==="), std::string::npos);
}

TEST(ResultExporter, JsonStringEscapes) {
    EXPECT_EQ(ResultExporter::jsonString("plain"), "\"plain\"");
    EXPECT_EQ(ResultExporter::jsonString("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(ResultExporter::jsonString(std::string(1, '\x01')), "\"\\u0001\"");
}

TEST(ResultExporter, CsvFieldQuoting) {
    EXPECT_EQ(ResultExporter::csvField("plain"), "plain");
    EXPECT_EQ(ResultExporter::csvField("a,b"), "\"a,b\"");
    EXPECT_EQ(ResultExporter::csvField("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(ResultExporter, UnwritableDirectoryThrows) {
    const std::string file = testing::TempDir() + "exporter_blocker_file";
    { std::ofstream out(file); out << "x"; }
    ResultExporter exporter(file + "/sub");
    EXPECT_THROW(exporter.exportCsv(makeSimulation()), std::runtime_error);
    std::remove(file.c_str());
}

}  // namespace test
}  // namespace auctionsim
