#pragma once

#include <cstdint>

namespace auctionsim {

/// Seeded RNG interface; bidders and the item generator draw through it so
/// tests can substitute a scripted source.
class IRng {
public:
    virtual ~IRng() = default;
    /// Uniform [0, 1).
    virtual double uniform() = 0;
    /// Uniform integer in [lo, hi], both inclusive. Requires lo <= hi.
    virtual int32_t uniformInt(int32_t lo, int32_t hi) = 0;
    /// Reseed (e.g. per pairing).
    virtual void seed(uint64_t s) = 0;

    /// Uniform real in [lo, hi).
    double uniformReal(double lo, double hi) { return lo + uniform() * (hi - lo); }

    /// True with probability p.
    bool bernoulli(double p) { return uniform() < p; }
};

/// SplitMix64 finalizer; derives well-spread child seeds from (base, salt).
inline uint64_t mixSeed(uint64_t base, uint64_t salt) {
    uint64_t z = base + 0x9E3779B97F4A7C15ull * (salt + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
}

}  // namespace auctionsim
