#include "auction/auction_manager.h"
#include "bidder/bidder_pool.h"
#include "config/sim_config.h"
#include "io/bid_log_reader.h"
#include "io/bid_log_writer.h"
#include "io/progress_log_sink.h"
#include "io/result_exporter.h"
#include "monitor/resource_monitor.h"
#include "stats/analyzer.h"

#ifdef AUCTIONSIM_KAFKA_ENABLED
#include "io/kafka_sink.h"
#endif

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace auctionsim;

// ---------------------------------------------------------------------------
// Graceful shutdown on SIGTERM / SIGINT
// ---------------------------------------------------------------------------

static std::atomic<bool> g_shutdown_requested{false};

static void signalHandler(int /*sig*/) {
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

static std::string writeBidLog(const SimConfig& config,
                               const AuctionManager& manager,
                               const SimulationResult& result) {
    namespace fs = std::filesystem;
    fs::create_directories(config.system.output_dir);

    std::vector<Bid> bids;
    for (const auto& a : manager.auctions()) {
        auto ab = a->bids();
        bids.insert(bids.end(), ab.begin(), ab.end());
    }
    std::stable_sort(bids.begin(), bids.end(),
                     [](const Bid& a, const Bid& b) { return a.ts_ns < b.ts_ns; });

    const std::string path = (fs::path(config.system.output_dir) /
        ("bids_" + std::to_string(config.system.seed) + ".alog")).string();

    BidLogSession session{};
    session.seed            = config.system.seed;
    session.total_auctions  = config.auction.total_auctions;
    session.total_bidders   = config.bidder.total_bidders;
    session.timeout_ms      = config.auction.timeout_ms;
    session.bid_probability = config.bidder.bid_probability;
    session.start_ns        = result.start_ns;

    {
        BidLogWriter writer(path, session);
        for (const Bid& b : bids)
            writer.append(b);
        writer.close();
    }

    BidLogReader reader(path);
    if (reader.totalRecords() != bids.size())
        throw std::runtime_error("read-back count mismatch for " + path);

    const auto replayed = reader.replayWinners();
    for (const auto& r : result.auction_results) {
        auto it = replayed.find(r.auction_id);
        const bool has_replay = it != replayed.end();
        if (has_replay != r.winning_bid.has_value() ||
            (has_replay && it->second.bidder_id != r.winning_bid->bidder_id))
            throw std::runtime_error("winner replay mismatch for auction " +
                                     std::to_string(r.auction_id) + " in " + path);
    }
    return path;
}

static void printParticipation(const ParticipationReport& p) {
    std::printf("\n=== Participation ===\n");
    std::printf("  pairings:            %llu\n", (unsigned long long)p.pairings);
    std::printf("  submitted:           %llu\n", (unsigned long long)p.submitted);
    std::printf("  not interested:      %llu\n", (unsigned long long)p.not_interested);
    std::printf("  abandoned in delay:  %llu\n", (unsigned long long)p.abandoned_in_delay);
    std::printf("  abandoned at check:  %llu\n", (unsigned long long)p.abandoned_after_delay);
    std::printf("  dropped at send:     %llu\n", (unsigned long long)p.dropped_at_send);
}

int main(int argc, char* argv[]) {
    SimConfig config;
    try {
        bool help = false;
        config = parseArgs(argc, argv, help);
        if (help) {
            printUsage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::printf("=== auctionsim_run ===\n");
    std::printf("auctions=%u  bidders=%u  timeout=%u ms  p=%.2f  mult=%.2f-%.2f  "
                "delay=%u-%u ms  seed=%llu\n",
                config.auction.total_auctions, config.bidder.total_bidders,
                config.auction.timeout_ms, config.bidder.bid_probability,
                config.bidder.min_multiplier, config.bidder.max_multiplier,
                config.bidder.min_delay_ms, config.bidder.max_delay_ms,
                (unsigned long long)config.system.seed);

    try {
        ResourceMonitor monitor(std::chrono::milliseconds(config.system.sample_interval_ms));
        monitor.start();

        AuctionManager manager(config);
        manager.createAuctions();
        BidderPool pool(config.bidder, config.system.seed);

        ProgressLogSink progress(config.system.log_every);
        manager.addSink(&progress);

#ifdef AUCTIONSIM_KAFKA_ENABLED
        std::unique_ptr<KafkaResultSink> kafka;
        if (!config.system.kafka_brokers.empty()) {
            kafka = std::make_unique<KafkaResultSink>(config.system.kafka_brokers,
                                                      config.system.kafka_topic);
            manager.addSink(kafka.get());
            std::printf("kafka: %s -> %s\n", config.system.kafka_brokers.c_str(),
                        config.system.kafka_topic.c_str());
        }
#else
        if (!config.system.kafka_brokers.empty())
            std::fprintf(stderr, "auctionsim_run: built without Kafka support, ignoring --kafka-brokers\n");
#endif

        // Watches for a shutdown signal while the simulation runs.
        CancelScope watch = CancelScope::background();
        std::thread watcher([&manager, watch]() {
            while (watch.sleepFor(std::chrono::milliseconds(100))) {
                if (g_shutdown_requested.load(std::memory_order_relaxed)) {
                    std::fprintf(stderr, "auctionsim_run: shutdown requested, closing auctions\n");
                    manager.cancel();
                    return;
                }
            }
        });

        std::printf("\npool: %zu bidders x %zu auctions = %zu pairings on %zu workers (warm-up %u ms)\n\n",
                    pool.bidderCount(), manager.auctions().size(),
                    pool.bidderCount() * manager.auctions().size(),
                    pool.workerCount(), config.system.warmup_ms);

        SimulationResult result;
        try {
            result = manager.run(pool);
        } catch (...) {
            watch.cancel();
            watcher.join();
            throw;
        }
        watch.cancel();
        watcher.join();
        manager.closeSinks();

        monitor.stop();
        result.resources = monitor.stats();

        std::printf("\npool: all pairings finished\n");

        std::printf("\n=== Summary ===\n");
        std::printf("  auctions:            %u\n", result.total_auctions);
        std::printf("  successful:          %u\n", result.successful_auctions);
        std::printf("  failed:              %u\n", result.failed_auctions);
        std::printf("  total bids:          %llu\n", (unsigned long long)result.total_bids);
        std::printf("  wall time:           %.3f s\n", static_cast<double>(result.duration_ns) / 1e9);
        printParticipation(result.participation);

        Analyzer analyzer;
        const std::string report = analyzer.formatReport(analyzer.analyze(result));
        std::fputs(report.c_str(), stdout);
        std::fputs(ResourceMonitor::formatReport(result.resources).c_str(), stdout);

        std::printf("\n");
        if (config.system.export_results) {
            ResultExporter exporter(config.system.output_dir);
            std::printf("Wrote %s\n", exporter.exportJson(result).c_str());
            std::printf("Wrote %s\n", exporter.exportCsv(result).c_str());
            std::printf("Wrote %s\n", exporter.exportSummary(result, report).c_str());
        }
        if (config.system.write_bid_log)
            std::printf("Wrote %s\n", writeBidLog(config, manager, result).c_str());

    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
