#pragma once

#include "core/records.h"

namespace auctionsim {

/// Abstract consumer of finished auction results.
/// Implementations: ProgressLogSink, KafkaResultSink.
/// AuctionManager fans each result out to its registered sinks and serializes
/// the calls; implementations need no locking of their own.
class IResultSink {
public:
    virtual ~IResultSink() = default;
    virtual void append(const AuctionResult&) = 0;
    virtual void flush() {}
    virtual void close() {}
};

}  // namespace auctionsim
