#include "monitor/resource_monitor.h"

#include "core/format.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace auctionsim {

ResourceMonitor::ResourceMonitor(std::chrono::milliseconds interval)
    : interval_(interval)
    , scope_(CancelScope::background())
{
    if (interval_.count() <= 0)
        throw std::invalid_argument("ResourceMonitor: interval must be positive");
}

ResourceMonitor::~ResourceMonitor() {
    stop();
}

void ResourceMonitor::start() {
    if (worker_.joinable())
        throw std::logic_error("ResourceMonitor: already started");

    scope_ = CancelScope::background();
    takeSample();
    worker_ = std::thread([this]() {
        while (scope_.sleepFor(interval_))
            takeSample();
    });
}

void ResourceMonitor::stop() {
    if (!worker_.joinable())
        return;
    scope_.cancel();
    worker_.join();
    takeSample();
}

size_t ResourceMonitor::sampleCount() const {
    std::lock_guard<std::mutex> g(mu_);
    return samples_.size();
}

ResourceStats ResourceMonitor::stats() const {
    std::lock_guard<std::mutex> g(mu_);

    ResourceStats s;
    s.hardware_threads = std::thread::hardware_concurrency();
    if (samples_.empty())
        return s;

    s.initial_memory_mb = samples_.front().rss_mb;
    s.final_memory_mb   = samples_.back().rss_mb;
    s.samples           = static_cast<uint32_t>(samples_.size());

    double total = 0.0;
    for (const auto& sample : samples_) {
        s.peak_memory_mb = std::max(s.peak_memory_mb, sample.rss_mb);
        s.peak_threads   = std::max(s.peak_threads, sample.threads);
        total += sample.rss_mb;
    }
    s.average_memory_mb = total / static_cast<double>(samples_.size());
    return s;
}

std::optional<ResourceSample> ResourceMonitor::sampleSelf() {
    std::FILE* f = std::fopen("/proc/self/status", "r");
    if (!f)
        return std::nullopt;

    ResourceSample sample;
    bool have_rss = false;
    char line[256];
    while (std::fgets(line, sizeof(line), f)) {
        unsigned long value = 0;
        if (std::strncmp(line, "VmRSS:", 6) == 0 &&
            std::sscanf(line + 6, "%lu", &value) == 1) {
            sample.rss_mb = static_cast<double>(value) / 1024.0;  // kB
            have_rss = true;
        } else if (std::strncmp(line, "Threads:", 8) == 0 &&
                   std::sscanf(line + 8, "%lu", &value) == 1) {
            sample.threads = static_cast<uint32_t>(value);
        }
    }
    std::fclose(f);

    if (!have_rss)
        return std::nullopt;
    return sample;
}

std::string ResourceMonitor::formatReport(const ResourceStats& s) {
    std::string out;
    appendf(out,
        "\n=== Resource Usage ===\n\n"
        "Memory (RSS):\n"
        "  initial:             %.2f MB\n"
        "  final:               %.2f MB\n"
        "  peak:                %.2f MB\n"
        "  average:             %.2f MB\n"
        "  delta:               %+.2f MB\n\n"
        "Concurrency:\n"
        "  hardware threads:    %u\n"
        "  peak threads:        %u\n"
        "  samples:             %u\n",
        s.initial_memory_mb, s.final_memory_mb, s.peak_memory_mb,
        s.average_memory_mb, s.final_memory_mb - s.initial_memory_mb,
        s.hardware_threads, s.peak_threads, s.samples);
    return out;
}

// --- Private ---

void ResourceMonitor::takeSample() {
    auto sample = sampleSelf();
    if (!sample)
        return;
    std::lock_guard<std::mutex> g(mu_);
    samples_.push_back(*sample);
}

}  // namespace auctionsim
