#include "io/bid_log_writer.h"

#include <lz4.h>

#include <cstddef>
#include <cstring>
#include <stdexcept>

namespace auctionsim {

BidLogWriter::BidLogWriter(const std::string& path,
                           const BidLogSession& session,
                           uint32_t chunk_capacity)
    : chunk_capacity_(chunk_capacity)
{
    if (chunk_capacity_ == 0)
        throw std::invalid_argument("BidLogWriter: chunk capacity must be positive");

    file_ = std::fopen(path.c_str(), "wb");
    if (!file_)
        throw std::runtime_error("BidLogWriter: cannot open " + path);

    // The destructor does not run if the constructor throws.
    try {
        buffer_.reserve(chunk_capacity_);

        const int max_compressed = LZ4_compressBound(
            static_cast<int>(chunk_capacity_ * sizeof(DiskBidRecord)));
        if (max_compressed <= 0)
            throw std::invalid_argument("BidLogWriter: chunk capacity too large");
        compress_buf_.resize(static_cast<size_t>(max_compressed));

        writeFileHeader(session);
    } catch (...) {
        std::fclose(file_);
        file_ = nullptr;
        throw;
    }
}

BidLogWriter::~BidLogWriter() {
    if (!file_)
        return;
    try {
        close();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "BidLogWriter: close failed: %s\n", e.what());
    }
}

void BidLogWriter::append(const Bid& bid) {
    if (!file_)
        throw std::runtime_error("BidLogWriter: append after close");

    DiskBidRecord disk;
    disk.ts_ns      = bid.ts_ns;
    disk.bidder_id  = bid.bidder_id;
    disk.auction_id = bid.auction_id;
    disk.amount     = bid.amount;
    buffer_.push_back(disk);

    if (buffer_.size() >= chunk_capacity_)
        flushChunk();
}

void BidLogWriter::flush() {
    if (!buffer_.empty())
        flushChunk();
}

void BidLogWriter::close() {
    if (!file_)
        return;

    try {
        flush();
        writeIndex();
    } catch (...) {
        std::fclose(file_);
        file_ = nullptr;
        throw;
    }
    const bool failed = std::fclose(file_) != 0;
    file_ = nullptr;
    if (failed)
        throw std::runtime_error("BidLogWriter: close failed");
}

// --- Private ---

void BidLogWriter::writeFileHeader(const BidLogSession& session) {
    FileHeader hdr{};
    std::memcpy(hdr.magic, kLogMagic, 8);
    hdr.version_major   = kLogVersionMajor;
    hdr.version_minor   = kLogVersionMinor;
    hdr.record_size     = static_cast<uint32_t>(sizeof(DiskBidRecord));
    hdr.seed            = session.seed;
    hdr.total_auctions  = session.total_auctions;
    hdr.total_bidders   = session.total_bidders;
    hdr.timeout_ms      = session.timeout_ms;
    hdr.chunk_capacity  = chunk_capacity_;
    hdr.header_flags    = 0;
    hdr.bid_probability = session.bid_probability;
    hdr.start_ns        = session.start_ns;

    if (std::fwrite(&hdr, sizeof(hdr), 1, file_) != 1)
        throw std::runtime_error("BidLogWriter: cannot write file header");
}

void BidLogWriter::flushChunk() {
    if (buffer_.empty())
        return;

    const uint32_t record_count = static_cast<uint32_t>(buffer_.size());
    const auto raw_bytes = static_cast<int>(record_count * sizeof(DiskBidRecord));

    const int compressed_bytes = LZ4_compress_default(
        reinterpret_cast<const char*>(buffer_.data()),
        compress_buf_.data(),
        raw_bytes,
        static_cast<int>(compress_buf_.size()));

    if (compressed_bytes <= 0)
        throw std::runtime_error("BidLogWriter: LZ4 compression failed");

    // Chunk ranges assume appends arrive in timestamp order.
    IndexEntry entry{};
    entry.file_offset  = static_cast<uint64_t>(std::ftell(file_));
    entry.first_ts_ns  = buffer_.front().ts_ns;
    entry.last_ts_ns   = buffer_.back().ts_ns;
    entry.record_count = record_count;
    entry.reserved     = 0;
    index_.push_back(entry);

    ChunkHeader chdr{};
    chdr.uncompressed_size = static_cast<uint32_t>(raw_bytes);
    chdr.compressed_size   = static_cast<uint32_t>(compressed_bytes);
    chdr.record_count      = record_count;
    chdr.chunk_flags       = 0;
    chdr.first_ts_ns       = buffer_.front().ts_ns;
    chdr.last_ts_ns        = buffer_.back().ts_ns;

    if (std::fwrite(&chdr, sizeof(chdr), 1, file_) != 1 ||
        std::fwrite(compress_buf_.data(), 1, static_cast<size_t>(compressed_bytes), file_) !=
            static_cast<size_t>(compressed_bytes))
        throw std::runtime_error("BidLogWriter: short write on chunk");

    total_records_ += record_count;
    buffer_.clear();
}

void BidLogWriter::writeIndex() {
    if (index_.empty())
        return;

    const uint64_t index_start = static_cast<uint64_t>(std::ftell(file_));

    if (std::fwrite(index_.data(), sizeof(IndexEntry), index_.size(), file_) != index_.size())
        throw std::runtime_error("BidLogWriter: short write on index");

    IndexTail tail{};
    tail.chunk_count        = static_cast<uint32_t>(index_.size());
    std::memcpy(tail.index_magic, kIndexMagic, 4);
    tail.index_start_offset = index_start;

    if (std::fwrite(&tail, sizeof(tail), 1, file_) != 1)
        throw std::runtime_error("BidLogWriter: short write on index tail");

    // Seek back and set HAS_INDEX flag in file header
    uint32_t flags = kHeaderFlagHasIndex;
    if (std::fseek(file_, static_cast<long>(offsetof(FileHeader, header_flags)), SEEK_SET) != 0 ||
        std::fwrite(&flags, sizeof(flags), 1, file_) != 1)
        throw std::runtime_error("BidLogWriter: cannot set index flag");

    std::fseek(file_, 0, SEEK_END);
}

}  // namespace auctionsim
