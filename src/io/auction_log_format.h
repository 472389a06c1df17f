#pragma once

#include <cstdint>
#include <cstring>

namespace auctionsim {

// --- Magic bytes and version ---
constexpr char     kLogMagic[8] = {'A','U','C','T','N','L','O','G'};
constexpr uint16_t kLogVersionMajor = 1;
constexpr uint16_t kLogVersionMinor = 0;
constexpr uint32_t kDefaultChunkCapacity = 4096;

// --- Header flags ---
constexpr uint32_t kHeaderFlagHasIndex = 0x1;

// --- File Header (64 bytes) ---
#pragma pack(push, 1)
struct FileHeader {
    char     magic[8];
    uint16_t version_major;
    uint16_t version_minor;
    uint32_t record_size;
    uint64_t seed;
    uint32_t total_auctions;
    uint32_t total_bidders;
    uint32_t timeout_ms;
    uint32_t chunk_capacity;
    uint32_t header_flags;
    double   bid_probability;
    uint64_t start_ns;
    uint32_t reserved;
};
#pragma pack(pop)
static_assert(sizeof(FileHeader) == 64, "FileHeader must be 64 bytes");

// --- On-disk bid record (24 bytes) ---
#pragma pack(push, 1)
struct DiskBidRecord {
    uint64_t ts_ns;
    uint32_t bidder_id;
    uint32_t auction_id;
    double   amount;
};
#pragma pack(pop)
static_assert(sizeof(DiskBidRecord) == 24, "DiskBidRecord must be 24 bytes");

// --- Chunk Header (32 bytes) ---
#pragma pack(push, 1)
struct ChunkHeader {
    uint32_t uncompressed_size;
    uint32_t compressed_size;
    uint32_t record_count;
    uint32_t chunk_flags;
    uint64_t first_ts_ns;
    uint64_t last_ts_ns;
};
#pragma pack(pop)
static_assert(sizeof(ChunkHeader) == 32, "ChunkHeader must be 32 bytes");

// --- Chunk Index Entry (32 bytes) ---
#pragma pack(push, 1)
struct IndexEntry {
    uint64_t file_offset;
    uint64_t first_ts_ns;
    uint64_t last_ts_ns;
    uint32_t record_count;
    uint32_t reserved;
};
#pragma pack(pop)
static_assert(sizeof(IndexEntry) == 32, "IndexEntry must be 32 bytes");

// --- Index Tail (16 bytes) ---
constexpr char kIndexMagic[4] = {'A','I','D','X'};

#pragma pack(push, 1)
struct IndexTail {
    uint32_t chunk_count;
    char     index_magic[4];
    uint64_t index_start_offset;
};
#pragma pack(pop)
static_assert(sizeof(IndexTail) == 16, "IndexTail must be 16 bytes");

// --- Fixed-width result message (56 bytes), published by KafkaResultSink ---
#pragma pack(push, 1)
struct WireResultRecord {
    uint32_t auction_id;
    uint8_t  status;            // AuctionStatus
    uint32_t total_bids;
    uint32_t winner_bidder_id;  // 0 when no winner
    double   winning_amount;    // 0.0 when no winner
    uint64_t winning_ts_ns;
    uint64_t start_ns;
    uint64_t end_ns;
    double   base_price;
    uint8_t  reserved[3];
};
#pragma pack(pop)
static_assert(sizeof(WireResultRecord) == 56, "WireResultRecord must be 56 bytes");

inline bool validateMagic(const FileHeader& h) {
    return std::memcmp(h.magic, kLogMagic, 8) == 0;
}

}  // namespace auctionsim
