#include "config/sim_config.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace auctionsim {

void SimConfig::validate() const {
    if (auction.total_auctions == 0)
        throw std::invalid_argument("total auctions must be positive");
    if (auction.total_auctions > kMaxAuctions)
        throw std::invalid_argument("total auctions exceeds " + std::to_string(kMaxAuctions));
    if (auction.timeout_ms == 0)
        throw std::invalid_argument("auction timeout must be positive");
    if (auction.channel_capacity == 0)
        throw std::invalid_argument("channel capacity must be positive");
    if (auction.minimum_bid_increment < 0.0)
        throw std::invalid_argument("minimum bid increment must not be negative");
    if (bidder.total_bidders == 0)
        throw std::invalid_argument("total bidders must be positive");
    if (!(bidder.bid_probability >= 0.0 && bidder.bid_probability <= 1.0))
        throw std::invalid_argument("bid probability must be between 0 and 1");
    if (bidder.min_multiplier < 0.0)
        throw std::invalid_argument("min bid multiplier must not be negative");
    if (bidder.min_multiplier > bidder.max_multiplier)
        throw std::invalid_argument("min bid multiplier exceeds max bid multiplier");
    if (bidder.min_delay_ms > bidder.max_delay_ms)
        throw std::invalid_argument("min bid delay exceeds max bid delay");
    if (bidder.max_delay_ms > static_cast<uint32_t>(std::numeric_limits<int32_t>::max()))
        throw std::invalid_argument("max bid delay out of range");
    if (bidder.worker_threads > kMaxWorkerThreads)
        throw std::invalid_argument("worker threads exceeds " + std::to_string(kMaxWorkerThreads));
    if (system.sample_interval_ms == 0)
        throw std::invalid_argument("sample interval must be positive");
}

SimConfig defaultConfig() {
    return SimConfig{};
}

// ---------------------------------------------------------------------------
// Flag parsing
// ---------------------------------------------------------------------------

namespace {

uint32_t parseU32(const char* flag, const char* value) {
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || value[0] == '-' ||
        v > std::numeric_limits<uint32_t>::max())
        throw std::invalid_argument(std::string("bad value for ") + flag + ": " + value);
    return static_cast<uint32_t>(v);
}

uint64_t parseU64(const char* flag, const char* value) {
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || value[0] == '-')
        throw std::invalid_argument(std::string("bad value for ") + flag + ": " + value);
    return static_cast<uint64_t>(v);
}

double parseDouble(const char* flag, const char* value) {
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(value, &end);
    if (errno != 0 || end == value || *end != '\0')
        throw std::invalid_argument(std::string("bad value for ") + flag + ": " + value);
    return v;
}

}  // namespace

SimConfig parseArgs(int argc, const char* const argv[], bool& help_requested) {
    SimConfig config = defaultConfig();
    help_requested = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&]() -> const char* {
            if (i + 1 >= argc)
                throw std::invalid_argument(std::string("missing value for ") + arg);
            return argv[++i];
        };

        if (std::strcmp(arg, "--auctions") == 0)          config.auction.total_auctions = parseU32(arg, next());
        else if (std::strcmp(arg, "--timeout-ms") == 0)   config.auction.timeout_ms = parseU32(arg, next());
        else if (std::strcmp(arg, "--capacity") == 0)     config.auction.channel_capacity = parseU32(arg, next());
        else if (std::strcmp(arg, "--bidders") == 0)      config.bidder.total_bidders = parseU32(arg, next());
        else if (std::strcmp(arg, "--probability") == 0)  config.bidder.bid_probability = parseDouble(arg, next());
        else if (std::strcmp(arg, "--min-mult") == 0)     config.bidder.min_multiplier = parseDouble(arg, next());
        else if (std::strcmp(arg, "--max-mult") == 0)     config.bidder.max_multiplier = parseDouble(arg, next());
        else if (std::strcmp(arg, "--min-delay-ms") == 0) config.bidder.min_delay_ms = parseU32(arg, next());
        else if (std::strcmp(arg, "--max-delay-ms") == 0) config.bidder.max_delay_ms = parseU32(arg, next());
        else if (std::strcmp(arg, "--workers") == 0)      config.bidder.worker_threads = parseU32(arg, next());
        else if (std::strcmp(arg, "--seed") == 0)         config.system.seed = parseU64(arg, next());
        else if (std::strcmp(arg, "--warmup-ms") == 0)    config.system.warmup_ms = parseU32(arg, next());
        else if (std::strcmp(arg, "--log-every") == 0)    config.system.log_every = parseU32(arg, next());
        else if (std::strcmp(arg, "--sample-ms") == 0)    config.system.sample_interval_ms = parseU32(arg, next());
        else if (std::strcmp(arg, "--output") == 0)       config.system.output_dir = next();
        else if (std::strcmp(arg, "--no-export") == 0)    config.system.export_results = false;
        else if (std::strcmp(arg, "--bid-log") == 0)      config.system.write_bid_log = true;
        else if (std::strcmp(arg, "--kafka-brokers") == 0) config.system.kafka_brokers = next();
        else if (std::strcmp(arg, "--kafka-topic") == 0)  config.system.kafka_topic = next();
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            help_requested = true;
            return config;
        } else {
            throw std::invalid_argument(std::string("unknown argument: ") + arg);
        }
    }
    return config;
}

void printUsage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "  --auctions <n>        Concurrent auctions (default: 40)\n"
        "  --timeout-ms <n>      Per-auction timeout in ms (default: 10000)\n"
        "  --capacity <n>        Bid channel capacity per auction (default: 100)\n"
        "  --bidders <n>         Number of bidders (default: 100)\n"
        "  --probability <p>     Chance a bidder bids on an item, 0..1 (default: 0.3)\n"
        "  --min-mult <x>        Min bid as multiple of base price (default: 1.0)\n"
        "  --max-mult <x>        Max bid as multiple of base price (default: 2.5)\n"
        "  --min-delay-ms <n>    Min think time in ms (default: 100)\n"
        "  --max-delay-ms <n>    Max think time in ms (default: 2000)\n"
        "  --workers <n>         Pairing worker threads, 0 = one per core (default: 0)\n"
        "  --seed <n>            Base seed (default: 42)\n"
        "  --warmup-ms <n>       Delay before bidders start (default: 50)\n"
        "  --log-every <n>       Progress line every N-th auction, 0 = off (default: 10)\n"
        "  --sample-ms <n>       Resource sampling period in ms (default: 500)\n"
        "  --output <dir>        Output directory (default: output)\n"
        "  --no-export           Skip JSON/CSV/summary export\n"
        "  --bid-log             Also write the LZ4 bid journal (<output>/bids_<seed>.alog)\n"
        "  --kafka-brokers <s>   Publish results to Kafka (requires Kafka support)\n"
        "  --kafka-topic <s>     Kafka topic (default: auction.results)\n"
        "  --help                Show this help\n",
        prog);
}

}  // namespace auctionsim
