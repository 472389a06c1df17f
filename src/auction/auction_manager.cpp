#include "auction/auction_manager.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace auctionsim {

AuctionManager::AuctionManager(const SimConfig& config)
    : config_(config)
    , items_(config.system.seed)
    , root_(CancelScope::background())
{}

void AuctionManager::createAuctions() {
    if (!auctions_.empty())
        return;

    const auto timeout = std::chrono::milliseconds(config_.auction.timeout_ms);
    std::vector<Item> items = items_.generateItems(config_.auction.total_auctions);

    auctions_.reserve(items.size());
    for (auto& item : items) {
        const uint32_t id = item.id;
        auctions_.push_back(std::make_unique<Auction>(
            id, std::move(item), timeout, config_.auction.channel_capacity));
    }
}

std::vector<Auction*> AuctionManager::auctionPointers() const {
    std::vector<Auction*> out;
    out.reserve(auctions_.size());
    for (const auto& a : auctions_)
        out.push_back(a.get());
    return out;
}

size_t AuctionManager::resultCount() const {
    std::lock_guard<std::mutex> g(mu_);
    return results_.size();
}

// ---------------------------------------------------------------------------
// Main run loop
// ---------------------------------------------------------------------------

void AuctionManager::addSink(IResultSink* sink) {
    if (ran_)
        throw std::logic_error("AuctionManager: addSink after run");
    if (!sink)
        throw std::invalid_argument("AuctionManager: null sink");
    sinks_.push_back(sink);
}

SimulationResult AuctionManager::run(BidderPool& pool) {
    if (ran_)
        throw std::logic_error("AuctionManager: run called twice");
    ran_ = true;

    createAuctions();

    {
        std::lock_guard<std::mutex> g(mu_);
        start_ns_   = wallClockNs();
        started_at_ = SteadyClock::now();
    }

    // Every auction is opened before any bidder starts, so each pairing's
    // scope can be derived from its auction's.
    for (auto& a : auctions_)
        a->open(root_);

    std::vector<std::thread> threads;
    std::vector<std::string> errors(auctions_.size());
    std::string pool_error;
    threads.reserve(auctions_.size() + 1);

    try {
        for (size_t i = 0; i < auctions_.size(); ++i) {
            threads.emplace_back([this, i, &errors]() {
                try {
                    AuctionResult result = auctions_[i]->run(root_);
                    recordResult(result);
                    forward(result);
                } catch (const std::exception& e) {
                    errors[i] = e.what();
                }
            });
        }

        root_.sleepFor(std::chrono::milliseconds(config_.system.warmup_ms));

        threads.emplace_back([this, &pool, &pool_error]() {
            try {
                ParticipationReport report = pool.participateInAll(auctionPointers());
                std::lock_guard<std::mutex> g(mu_);
                participation_ = report;
            } catch (const std::exception& e) {
                pool_error = e.what();
            }
        });
    } catch (...) {
        root_.cancel();
        for (auto& t : threads)
            t.join();
        throw;
    }

    for (auto& t : threads)
        t.join();

    {
        std::lock_guard<std::mutex> g(mu_);
        end_ns_      = wallClockNs();
        finished_at_ = SteadyClock::now();
    }

    for (size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i].empty())
            throw std::runtime_error("AuctionManager: auction " +
                                     std::to_string(auctions_[i]->id()) +
                                     " failed: " + errors[i]);
    }
    if (!pool_error.empty())
        throw std::runtime_error("AuctionManager: bidder pool failed: " + pool_error);

    flushSinks();
    return aggregateResults();
}

void AuctionManager::recordResult(const AuctionResult& result) {
    std::lock_guard<std::mutex> g(mu_);
    results_.push_back(result);
}

SimulationResult AuctionManager::aggregateResults() const {
    std::lock_guard<std::mutex> g(mu_);

    SimulationResult sim{};
    sim.auction_results = results_;
    std::sort(sim.auction_results.begin(), sim.auction_results.end(),
              [](const AuctionResult& a, const AuctionResult& b) {
                  return a.auction_id < b.auction_id;
              });

    sim.total_auctions = static_cast<uint32_t>(sim.auction_results.size());
    for (const auto& r : sim.auction_results) {
        sim.total_bids += r.total_bids;
        if (r.status == AuctionStatus::COMPLETED && r.winning_bid)
            ++sim.successful_auctions;
        else
            ++sim.failed_auctions;
    }

    sim.start_ns      = start_ns_;
    sim.end_ns        = end_ns_;
    sim.duration_ns   = elapsedNs(started_at_, finished_at_);
    sim.participation = participation_;
    return sim;
}

// --- Private ---

void AuctionManager::forward(const AuctionResult& result) {
    std::lock_guard<std::mutex> g(sink_mu_);
    for (size_t i = 0; i < sinks_.size(); ++i) {
        try {
            sinks_[i]->append(result);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "AuctionManager: sink %zu error on auction %u: %s\n",
                         i, result.auction_id, e.what());
        }
    }
}

void AuctionManager::flushSinks() {
    std::lock_guard<std::mutex> g(sink_mu_);
    for (size_t i = 0; i < sinks_.size(); ++i) {
        try {
            sinks_[i]->flush();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "AuctionManager: sink %zu flush error: %s\n", i, e.what());
        }
    }
}

void AuctionManager::closeSinks() {
    std::lock_guard<std::mutex> g(sink_mu_);
    for (size_t i = 0; i < sinks_.size(); ++i) {
        try {
            sinks_[i]->close();
        } catch (const std::exception& e) {
            std::fprintf(stderr, "AuctionManager: sink %zu close error: %s\n", i, e.what());
        }
    }
}

}  // namespace auctionsim
