#pragma once

#include "rng/irng.h"
#include <cstdint>
#include <random>

namespace auctionsim {

/// Deterministic RNG: std::mt19937_64. Not synchronized; one instance per
/// owning thread.
class Mt19937Rng : public IRng {
public:
    explicit Mt19937Rng(uint64_t seed = 0);
    double uniform() override;
    int32_t uniformInt(int32_t lo, int32_t hi) override;
    void seed(uint64_t s) override;

private:
    std::mt19937_64 gen_;
    std::uniform_real_distribution<double> dist_;
};

}  // namespace auctionsim
