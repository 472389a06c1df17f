#ifdef AUCTIONSIM_KAFKA_ENABLED

#include "io/kafka_sink.h"

#include <cstring>
#include <stdexcept>

namespace auctionsim {

KafkaResultSink::KafkaResultSink(const std::string& brokers,
                                 const std::string& topic_name)
{
    std::string errstr;

    auto conf = std::unique_ptr<RdKafka::Conf>(
        RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));

    if (conf->set("bootstrap.servers", brokers, errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaResultSink: " + errstr);
    if (conf->set("enable.idempotence", "true", errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaResultSink: " + errstr);
    if (conf->set("linger.ms", "5", errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaResultSink: " + errstr);
    if (conf->set("compression.type", "lz4", errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaResultSink: " + errstr);
    if (conf->set("dr_cb", &dr_cb_, errstr) != RdKafka::Conf::CONF_OK)
        throw std::runtime_error("KafkaResultSink: " + errstr);

    producer_.reset(RdKafka::Producer::create(conf.get(), errstr));
    if (!producer_)
        throw std::runtime_error("KafkaResultSink: failed to create producer: " + errstr);

    auto tconf = std::unique_ptr<RdKafka::Conf>(
        RdKafka::Conf::create(RdKafka::Conf::CONF_TOPIC));

    topic_ = RdKafka::Topic::create(producer_.get(), topic_name, tconf.get(), errstr);
    if (!topic_)
        throw std::runtime_error("KafkaResultSink: failed to create topic: " + errstr);
}

KafkaResultSink::~KafkaResultSink() {
    close();
    delete topic_;
}

WireResultRecord KafkaResultSink::toWire(const AuctionResult& result) {
    WireResultRecord wire{};
    wire.auction_id = result.auction_id;
    wire.status     = static_cast<uint8_t>(result.status);
    wire.total_bids = result.total_bids;
    wire.start_ns   = result.start_ns;
    wire.end_ns     = result.end_ns;
    wire.base_price = result.item.base_price;
    if (result.winning_bid) {
        wire.winner_bidder_id = result.winning_bid->bidder_id;
        wire.winning_amount   = result.winning_bid->amount;
        wire.winning_ts_ns    = result.winning_bid->ts_ns;
    }
    return wire;
}

void KafkaResultSink::append(const AuctionResult& result) {
    const WireResultRecord wire = toWire(result);
    const std::string key = std::to_string(result.auction_id);

    RdKafka::ErrorCode err = producer_->produce(
        topic_,
        RdKafka::Topic::PARTITION_UA,
        RdKafka::Producer::RK_MSG_COPY,
        const_cast<WireResultRecord*>(&wire), sizeof(wire),
        key.data(), key.size(),
        nullptr);

    if (err == RdKafka::ERR__QUEUE_FULL) {
        producer_->poll(100);
        err = producer_->produce(
            topic_,
            RdKafka::Topic::PARTITION_UA,
            RdKafka::Producer::RK_MSG_COPY,
            const_cast<WireResultRecord*>(&wire), sizeof(wire),
            key.data(), key.size(),
            nullptr);
    }
    if (err != RdKafka::ERR_NO_ERROR) {
        std::fprintf(stderr, "KafkaResultSink: produce failed for auction %u: %s\n",
                     result.auction_id, RdKafka::err2str(err).c_str());
    }

    producer_->poll(0);
}

void KafkaResultSink::flush() {
    if (producer_)
        producer_->flush(5000);
}

void KafkaResultSink::close() {
    if (producer_)
        producer_->flush(10000);
}

}  // namespace auctionsim

#endif  // AUCTIONSIM_KAFKA_ENABLED
