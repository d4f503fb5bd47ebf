#pragma once

#include "broker/broker_client.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Forward-declare librdkafka types
typedef struct rd_kafka_s rd_kafka_t;

namespace tracebridge {

struct KafkaClientConfig {
    std::string group_id = "tracebridge-processor";
    std::string client_id = "tracebridge";
    std::string auto_offset_reset = "earliest";
    int metadata_timeout_ms = 5000;     // connect() reachability check
    int publish_timeout_ms = 10000;     // wait for delivery report
    int delivery_timeout_ms = 30000;    // message.timeout.ms, local retry bound
    int poll_timeout_ms = 200;          // consumer poll granularity
    int num_partitions = 1;             // declare_queue()
    int replication_factor = 1;
};

/**
 * @brief Broker client on librdkafka
 *
 * Mapping onto the queue model:
 * - queue         = topic
 * - headers       = Kafka record headers
 * - declare_queue = CreateTopics (TOPIC_ALREADY_EXISTS is success)
 * - publish       = produce + wait for the delivery report
 * - consume       = consumer-group subscription, auto-commit (acknowledged at
 *                   delivery), polled on a dedicated thread per consumer tag
 */
class KafkaConnection;

class KafkaBrokerClient : public IBrokerClient {
public:
    explicit KafkaBrokerClient(const KafkaClientConfig& config = KafkaClientConfig{});

    [[nodiscard]] Result<std::unique_ptr<IBrokerConnection>> connect(const std::string& host) override;
    [[nodiscard]] std::string name() const override;

    /// Create the producer handle without the reachability check connect() runs
    [[nodiscard]] Result<std::unique_ptr<KafkaConnection>> open(const std::string& host);

private:
    KafkaClientConfig config_;
};

/**
 * @brief One producer handle, verified reachable at connect time
 *
 * close() flushes for up to publish_timeout_ms, then purges whatever is still
 * queued so every outstanding delivery report is served before the handle is
 * destroyed.
 */
class KafkaConnection : public IBrokerConnection {
public:
    KafkaConnection(rd_kafka_t* producer, std::string host, const KafkaClientConfig& config);
    ~KafkaConnection() override;

    KafkaConnection(const KafkaConnection&) = delete;
    KafkaConnection& operator=(const KafkaConnection&) = delete;

    [[nodiscard]] std::unique_ptr<IBrokerChannel> create_channel() override;
    void close() override;
    [[nodiscard]] bool is_open() const override { return producer_ != nullptr; }

    /// Metadata round trip; false with error set when the broker does not answer
    [[nodiscard]] bool check_reachable(int timeout_ms, std::string& error);

    /// Produced messages still waiting for their delivery report, process-wide
    [[nodiscard]] static uint64_t pending_deliveries();

private:
    rd_kafka_t* producer_ = nullptr;
    std::string host_;
    KafkaClientConfig config_;
};

class KafkaChannel : public IBrokerChannel {
public:
    /// producer is borrowed from the owning KafkaConnection
    KafkaChannel(rd_kafka_t* producer, std::string host, const KafkaClientConfig& config);
    ~KafkaChannel() override;

    KafkaChannel(const KafkaChannel&) = delete;
    KafkaChannel& operator=(const KafkaChannel&) = delete;

    void declare_queue(const std::string& queue) override;
    void publish(const std::string& queue, const MessageHeaders& headers,
                 std::string_view body) override;
    [[nodiscard]] std::string consume(const std::string& queue, MessageHandler handler) override;
    void cancel(const std::string& consumer_tag) override;
    void close() override;
    [[nodiscard]] bool is_open() const override;

private:
    struct ConsumerWorker {
        rd_kafka_t* consumer = nullptr;
        std::jthread thread;
    };

    static void poll_loop(std::stop_token stop, rd_kafka_t* consumer, std::string queue,
                          MessageHandler handler, int poll_timeout_ms);
    static void destroy_worker(ConsumerWorker& worker);

    rd_kafka_t* producer_;
    std::string host_;
    KafkaClientConfig config_;

    mutable std::mutex mutex_;
    bool open_ = true;
    std::map<std::string, std::unique_ptr<ConsumerWorker>> consumers_;
    std::atomic<uint64_t> next_consumer_id_{1};
};

} // namespace tracebridge
