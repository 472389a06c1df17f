#pragma once

#ifdef AUCTIONSIM_KAFKA_ENABLED

#include "io/i_result_sink.h"
#include "io/auction_log_format.h"
#include "core/records.h"

#include <librdkafka/rdkafkacpp.h>

#include <cstdio>
#include <memory>
#include <string>

namespace auctionsim {

/// Kafka result sink: publishes each AuctionResult as a 56-byte
/// WireResultRecord. The auction id is the message key, so all messages
/// for one auction land on the same partition.
/// Best-effort: delivery failures are logged but do not stop the simulation.
class KafkaResultSink : public IResultSink {
public:
    KafkaResultSink(const std::string& brokers, const std::string& topic);

    ~KafkaResultSink() override;

    KafkaResultSink(const KafkaResultSink&) = delete;
    KafkaResultSink& operator=(const KafkaResultSink&) = delete;

    void append(const AuctionResult& result) override;
    void flush() override;
    void close() override;

    /// Encode a result the way it is published.
    static WireResultRecord toWire(const AuctionResult& result);

private:
    std::unique_ptr<RdKafka::Producer> producer_;
    RdKafka::Topic* topic_ = nullptr;  // owned by producer_ lifetime

    class DeliveryReportCb : public RdKafka::DeliveryReportCb {
    public:
        void dr_cb(RdKafka::Message& message) override {
            if (message.err()) {
                std::fprintf(stderr, "KafkaResultSink: delivery failed: %s\n",
                             message.errstr().c_str());
            }
        }
    };

    DeliveryReportCb dr_cb_;
};

}  // namespace auctionsim

#endif  // AUCTIONSIM_KAFKA_ENABLED
