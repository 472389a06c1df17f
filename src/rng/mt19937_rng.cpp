#include "rng/mt19937_rng.h"

namespace auctionsim {

Mt19937Rng::Mt19937Rng(uint64_t seed) : gen_(seed), dist_(0.0, 1.0) {}

double Mt19937Rng::uniform() {
    return dist_(gen_);
}

int32_t Mt19937Rng::uniformInt(int32_t lo, int32_t hi) {
    std::uniform_int_distribution<int32_t> d(lo, hi);
    return d(gen_);
}

void Mt19937Rng::seed(uint64_t s) {
    gen_.seed(s);
    dist_.reset();
}

}  // namespace auctionsim
