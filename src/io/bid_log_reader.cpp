#include "io/bid_log_reader.h"

#include "auction/auction.h"

#include <lz4.h>

#include <cstring>
#include <stdexcept>

namespace auctionsim {

namespace {

Bid toBid(const DiskBidRecord& r) {
    Bid b{};
    b.bidder_id  = r.bidder_id;
    b.auction_id = r.auction_id;
    b.amount     = r.amount;
    b.ts_ns      = r.ts_ns;
    return b;
}

}  // namespace

BidLogReader::BidLogReader(const std::string& path) : path_(path) {
    file_ = std::fopen(path.c_str(), "rb");
    if (!file_)
        throw std::runtime_error("BidLogReader: cannot open " + path);

    try {
        if (std::fseek(file_, 0, SEEK_END) != 0)
            throw std::runtime_error("BidLogReader: cannot size " + path);
        const long end = std::ftell(file_);
        if (end < 0)
            throw std::runtime_error("BidLogReader: cannot size " + path);
        file_size_ = static_cast<uint64_t>(end);

        if (file_size_ < sizeof(FileHeader))
            throw std::runtime_error("BidLogReader: file too short for a header: " + path);
        seekTo(0);
        readExact(&header_, sizeof(header_), "header");

        if (!validateMagic(header_))
            throw std::runtime_error("BidLogReader: invalid magic in " + path);
        if (header_.version_major != kLogVersionMajor)
            throw std::runtime_error("BidLogReader: unsupported version in " + path);
        if (header_.record_size != sizeof(DiskBidRecord))
            throw std::runtime_error("BidLogReader: record size mismatch in " + path);
        if (header_.chunk_capacity == 0)
            throw std::runtime_error("BidLogReader: zero chunk capacity in " + path);

        loadIndex();
    } catch (...) {
        std::fclose(file_);
        file_ = nullptr;
        throw;
    }
}

BidLogReader::~BidLogReader() {
    if (file_)
        std::fclose(file_);
}

uint64_t BidLogReader::totalRecords() const {
    uint64_t total = 0;
    for (const auto& entry : index_)
        total += entry.record_count;
    return total;
}

// --- Queries ---

std::vector<Bid> BidLogReader::readChunk(uint32_t idx) const {
    if (idx >= chunkCount())
        throw std::out_of_range("BidLogReader: chunk index out of range");
    std::vector<Bid> out;
    out.reserve(index_[idx].record_count);
    decodeChunk(index_[idx], [&out](const Bid& b) { out.push_back(b); });
    return out;
}

std::vector<Bid> BidLogReader::readRange(uint64_t ts_start, uint64_t ts_end) const {
    std::vector<Bid> out;
    for (const auto& entry : index_) {
        if (entry.first_ts_ns > ts_end || entry.last_ts_ns < ts_start)
            continue;
        decodeChunk(entry, [&](const Bid& b) {
            if (b.ts_ns >= ts_start && b.ts_ns <= ts_end)
                out.push_back(b);
        });
    }
    return out;
}

std::vector<Bid> BidLogReader::readAll() const {
    std::vector<Bid> out;
    out.reserve(totalRecords());
    forEachBid([&out](const Bid& b) { out.push_back(b); });
    return out;
}

void BidLogReader::forEachBid(const BidVisitor& visit) const {
    for (const auto& entry : index_)
        decodeChunk(entry, visit);
}

std::vector<Bid> BidLogReader::readAuction(uint32_t auction_id) const {
    std::vector<Bid> out;
    forEachBid([&](const Bid& b) {
        if (b.auction_id == auction_id)
            out.push_back(b);
    });
    return out;
}

std::vector<Bid> BidLogReader::readBidder(uint32_t bidder_id) const {
    std::vector<Bid> out;
    forEachBid([&](const Bid& b) {
        if (b.bidder_id == bidder_id)
            out.push_back(b);
    });
    return out;
}

std::map<uint32_t, uint64_t> BidLogReader::bidsPerAuction() const {
    std::map<uint32_t, uint64_t> counts;
    forEachBid([&counts](const Bid& b) { ++counts[b.auction_id]; });
    return counts;
}

std::map<uint32_t, uint64_t> BidLogReader::bidsPerBidder() const {
    std::map<uint32_t, uint64_t> counts;
    forEachBid([&counts](const Bid& b) { ++counts[b.bidder_id]; });
    return counts;
}

std::map<uint32_t, Bid> BidLogReader::replayWinners() const {
    std::map<uint32_t, std::vector<Bid>> by_auction;
    forEachBid([&by_auction](const Bid& b) { by_auction[b.auction_id].push_back(b); });

    std::map<uint32_t, Bid> winners;
    for (const auto& entry : by_auction) {
        if (auto w = selectWinner(entry.second))
            winners.emplace(entry.first, *w);
    }
    return winners;
}

// --- Index ---

void BidLogReader::loadIndex() {
    if (header_.header_flags & kHeaderFlagHasIndex)
        loadFooterIndex();
    else
        scanChunkHeaders();
}

void BidLogReader::loadFooterIndex() {
    if (file_size_ < sizeof(FileHeader) + sizeof(IndexTail))
        throw std::runtime_error("BidLogReader: index flag set but no room for a tail");

    const uint64_t tail_offset = file_size_ - sizeof(IndexTail);
    IndexTail tail{};
    seekTo(tail_offset);
    readExact(&tail, sizeof(tail), "index tail");

    if (std::memcmp(tail.index_magic, kIndexMagic, 4) != 0)
        throw std::runtime_error("BidLogReader: invalid index magic");

    // The index must sit exactly between the last chunk and the tail.
    const uint64_t index_bytes = static_cast<uint64_t>(tail.chunk_count) * sizeof(IndexEntry);
    if (tail.index_start_offset < sizeof(FileHeader) ||
        tail.index_start_offset > tail_offset ||
        tail_offset - tail.index_start_offset != index_bytes)
        throw std::runtime_error("BidLogReader: index tail out of bounds");

    index_.resize(tail.chunk_count);
    if (tail.chunk_count > 0) {
        seekTo(tail.index_start_offset);
        readExact(index_.data(), index_bytes, "index entries");
    }

    for (const auto& entry : index_) {
        if (entry.file_offset < sizeof(FileHeader) ||
            entry.file_offset > tail.index_start_offset - sizeof(ChunkHeader) ||
            entry.record_count > header_.chunk_capacity)
            throw std::runtime_error("BidLogReader: index entry out of bounds");
    }
}

void BidLogReader::scanChunkHeaders() {
    // A writer that never reached close() leaves no footer; the last chunk
    // may be cut short, in which case it is ignored.
    uint64_t offset = sizeof(FileHeader);
    while (file_size_ - offset >= sizeof(ChunkHeader)) {
        ChunkHeader chdr{};
        seekTo(offset);
        readExact(&chdr, sizeof(chdr), "chunk header");

        const uint64_t payload_end = offset + sizeof(ChunkHeader) + chdr.compressed_size;
        if (payload_end > file_size_)
            break;
        if (chdr.record_count > header_.chunk_capacity)
            throw std::runtime_error("BidLogReader: chunk exceeds header capacity");

        IndexEntry entry{};
        entry.file_offset  = offset;
        entry.first_ts_ns  = chdr.first_ts_ns;
        entry.last_ts_ns   = chdr.last_ts_ns;
        entry.record_count = chdr.record_count;
        index_.push_back(entry);

        offset = payload_end;
    }
}

// --- Chunk decoding ---

void BidLogReader::decodeChunk(const IndexEntry& entry, const BidVisitor& visit) const {
    ChunkHeader chdr{};
    seekTo(entry.file_offset);
    readExact(&chdr, sizeof(chdr), "chunk header");

    if (chdr.record_count != entry.record_count ||
        chdr.record_count > header_.chunk_capacity ||
        chdr.uncompressed_size != chdr.record_count * sizeof(DiskBidRecord))
        throw std::runtime_error("BidLogReader: chunk header disagrees with index");

    const uint64_t payload_offset = entry.file_offset + sizeof(ChunkHeader);
    if (chdr.compressed_size > file_size_ - payload_offset ||
        chdr.compressed_size > static_cast<uint32_t>(LZ4_compressBound(static_cast<int>(chdr.uncompressed_size))))
        throw std::runtime_error("BidLogReader: chunk payload out of bounds");

    std::vector<char> compressed(chdr.compressed_size);
    readExact(compressed.data(), compressed.size(), "chunk payload");

    std::vector<DiskBidRecord> records(chdr.record_count);
    const int n = LZ4_decompress_safe(compressed.data(),
                                      reinterpret_cast<char*>(records.data()),
                                      static_cast<int>(chdr.compressed_size),
                                      static_cast<int>(chdr.uncompressed_size));
    if (n != static_cast<int>(chdr.uncompressed_size))
        throw std::runtime_error("BidLogReader: LZ4 decompression failed");

    for (const auto& r : records)
        visit(toBid(r));
}

// --- File helpers ---

void BidLogReader::seekTo(uint64_t offset) const {
    if (offset > file_size_ || std::fseek(file_, static_cast<long>(offset), SEEK_SET) != 0)
        throw std::runtime_error("BidLogReader: seek failed in " + path_);
}

void BidLogReader::readExact(void* dst, size_t bytes, const char* what) const {
    if (bytes > 0 && std::fread(dst, 1, bytes, file_) != bytes)
        throw std::runtime_error(std::string("BidLogReader: short read of ") + what +
                                 " in " + path_);
}

}  // namespace auctionsim
