#pragma once

#include "io/auction_log_format.h"
#include "core/records.h"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace auctionsim {

/// Run metadata stamped into the bid journal header.
struct BidLogSession {
    uint64_t seed;
    uint32_t total_auctions;
    uint32_t total_bidders;
    uint32_t timeout_ms;
    double   bid_probability;
    uint64_t start_ns;
};

/// Writes bids to a .alog journal: 64-byte header, LZ4-compressed chunks of
/// DiskBidRecords, then a chunk index and tail.
class BidLogWriter {
public:
    /// Opens the file and writes the file header.
    /// chunk_capacity controls records per LZ4 chunk (default 4096).
    BidLogWriter(const std::string& path,
                 const BidLogSession& session,
                 uint32_t chunk_capacity = kDefaultChunkCapacity);

    ~BidLogWriter();

    BidLogWriter(const BidLogWriter&) = delete;
    BidLogWriter& operator=(const BidLogWriter&) = delete;

    void append(const Bid& bid);

    /// Flush any buffered records as a partial chunk.
    void flush();

    /// Flush, write chunk index, set the HAS_INDEX flag, close the file.
    /// Safe to call multiple times; subsequent calls are no-ops.
    void close();

    bool isOpen() const { return file_ != nullptr; }
    uint64_t recordsWritten() const { return total_records_; }
    uint32_t chunksWritten() const { return static_cast<uint32_t>(index_.size()); }

private:
    void writeFileHeader(const BidLogSession& session);
    void flushChunk();
    void writeIndex();

    std::FILE* file_ = nullptr;
    uint32_t chunk_capacity_;
    uint64_t total_records_ = 0;

    std::vector<DiskBidRecord> buffer_;
    std::vector<IndexEntry> index_;
    std::vector<char> compress_buf_;
};

}  // namespace auctionsim
