#pragma once

#include "io/auction_log_format.h"
#include "core/records.h"

#include <cstdint>
#include <cstdio>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace auctionsim {

/// Reads .alog bid journals produced by BidLogWriter and answers questions
/// about the bids in them: per-auction and per-bidder selections, counts,
/// and a replay of each auction's winner from the recorded bids.
///
/// Every offset and size taken from the file is checked against the file
/// length before anything is allocated or read, so a truncated or corrupt
/// journal raises std::runtime_error instead of reading out of bounds.
class BidLogReader {
public:
    using BidVisitor = std::function<void(const Bid&)>;

    /// Opens the file, validates the header and loads the chunk index.
    explicit BidLogReader(const std::string& path);

    ~BidLogReader();

    BidLogReader(const BidLogReader&) = delete;
    BidLogReader& operator=(const BidLogReader&) = delete;

    const FileHeader& header() const { return header_; }
    const std::vector<IndexEntry>& index() const { return index_; }
    uint32_t chunkCount() const { return static_cast<uint32_t>(index_.size()); }
    uint64_t totalRecords() const;
    uint64_t fileSize() const { return file_size_; }

    /// Decode one chunk (0-based). Throws std::out_of_range past the end.
    std::vector<Bid> readChunk(uint32_t idx) const;

    /// Bids of every chunk whose time span overlaps [ts_start, ts_end],
    /// filtered to that window.
    std::vector<Bid> readRange(uint64_t ts_start, uint64_t ts_end) const;

    std::vector<Bid> readAll() const;

    /// Stream every bid in file order, one chunk in memory at a time.
    void forEachBid(const BidVisitor& visit) const;

    std::vector<Bid> readAuction(uint32_t auction_id) const;
    std::vector<Bid> readBidder(uint32_t bidder_id) const;

    std::map<uint32_t, uint64_t> bidsPerAuction() const;
    std::map<uint32_t, uint64_t> bidsPerBidder() const;

    /// Winner of every auction that has at least one journaled bid, chosen
    /// with the same rule the live auction uses.
    std::map<uint32_t, Bid> replayWinners() const;

private:
    void loadIndex();
    void loadFooterIndex();
    void scanChunkHeaders();

    void seekTo(uint64_t offset) const;
    void readExact(void* dst, size_t bytes, const char* what) const;
    void decodeChunk(const IndexEntry& entry, const BidVisitor& visit) const;

    std::string path_;
    std::FILE* file_ = nullptr;
    uint64_t file_size_ = 0;
    FileHeader header_{};
    std::vector<IndexEntry> index_;
};

}  // namespace auctionsim
