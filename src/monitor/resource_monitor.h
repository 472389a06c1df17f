#pragma once

#include "core/records.h"
#include "sync/cancel_scope.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace auctionsim {

struct ResourceSample {
    double   rss_mb  = 0.0;
    uint32_t threads = 0;
};

/// Periodic sampler of process memory and thread count.
/// start() takes an initial sample and launches the sampling thread;
/// stop() joins it and takes a final sample.
class ResourceMonitor {
public:
    explicit ResourceMonitor(std::chrono::milliseconds interval);
    ~ResourceMonitor();

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    /// Throws std::logic_error if already started.
    void start();

    /// Idempotent.
    void stop();

    bool running() const { return worker_.joinable(); }

    /// Aggregate of every sample so far. Zeroed when nothing was sampled.
    ResourceStats stats() const;

    size_t sampleCount() const;

    /// VmRSS and Threads from /proc/self/status. nullopt where unavailable.
    static std::optional<ResourceSample> sampleSelf();

    static std::string formatReport(const ResourceStats& stats);

private:
    void takeSample();

    std::chrono::milliseconds interval_;
    CancelScope scope_;
    std::thread worker_;

    mutable std::mutex mu_;
    std::vector<ResourceSample> samples_;
};

}  // namespace auctionsim
