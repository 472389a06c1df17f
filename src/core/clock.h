#pragma once

#include <chrono>
#include <cstdint>

namespace auctionsim {

using SteadyClock = std::chrono::steady_clock;

/// Wall-clock nanoseconds since the Unix epoch (bid and result timestamps).
inline uint64_t wallClockNs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

inline uint64_t elapsedNs(SteadyClock::time_point from, SteadyClock::time_point to) {
    if (to <= from) return 0;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(to - from).count());
}

}  // namespace auctionsim
