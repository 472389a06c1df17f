#pragma once

#include "core/records.h"
#include "rng/mt19937_rng.h"

#include <cstdint>
#include <mutex>
#include <vector>

namespace auctionsim {

/// Generates auction items with the fixed 20-attribute schema.
/// Thread-safe: the generator's RNG is guarded by its own mutex.
class ItemGenerator {
public:
    explicit ItemGenerator(uint64_t seed);

    /// One item with the given id. Name is "<brand> <category> <id>".
    Item generateItem(uint32_t id);

    /// Items with ids 1..count.
    std::vector<Item> generateItems(uint32_t count);

private:
    Mt19937Rng rng_;
    std::mutex mu_;
};

}  // namespace auctionsim
