#include "broker/kafka_broker_client.hpp"
#include "core/utils.hpp"

#include <librdkafka/rdkafka.h>

#include <format>

namespace tracebridge {

namespace {

// Delivery result for one produced message. Owned jointly by the publisher
// and the delivery report callback (which may fire after a publish timeout).
struct DeliveryState {
    std::atomic<bool> done{false};
    std::atomic<int> error{RD_KAFKA_RESP_ERR_NO_ERROR};
};

std::atomic<uint64_t> g_pending_deliveries{0};

// Upper bound on serving delivery reports of purged messages in close()
constexpr int kPurgeDrainMs = 1000;

void delivery_report(rd_kafka_t* /*rk*/, const rd_kafka_message_t* message, void* /*opaque*/) {
    auto* holder = static_cast<std::shared_ptr<DeliveryState>*>(message->_private);
    if (!holder) return;
    (*holder)->error.store(message->err, std::memory_order_relaxed);
    (*holder)->done.store(true, std::memory_order_release);
    delete holder;
    g_pending_deliveries.fetch_sub(1, std::memory_order_relaxed);
}

bool set_conf(rd_kafka_conf_t* conf, const char* key, const std::string& value,
              std::string& error) {
    char errstr[512];
    if (rd_kafka_conf_set(conf, key, value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
        error = std::format("Kafka: failed to set {}: {}", key, errstr);
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// KafkaBrokerClient
// ============================================================================

KafkaBrokerClient::KafkaBrokerClient(const KafkaClientConfig& config)
    : config_(config) {}

Result<std::unique_ptr<IBrokerConnection>> KafkaBrokerClient::connect(const std::string& host) {
    using ConnectResult = Result<std::unique_ptr<IBrokerConnection>>;

    auto opened = open(host);
    if (opened.is_error()) {
        return ConnectResult::error(opened.error_category(), opened.error_message());
    }
    auto connection = std::move(opened.value());

    // librdkafka connects lazily; a metadata round trip proves the broker answers
    std::string error;
    if (!connection->check_reachable(config_.metadata_timeout_ms, error)) {
        return ConnectResult::error(ErrorCategory::CONNECTION_ERROR, error);
    }

    utils::log::info(std::format("Kafka: connected to {}", host));
    return ConnectResult::ok(std::move(connection));
}

Result<std::unique_ptr<KafkaConnection>> KafkaBrokerClient::open(const std::string& host) {
    using OpenResult = Result<std::unique_ptr<KafkaConnection>>;

    rd_kafka_conf_t* conf = rd_kafka_conf_new();
    std::string error;
    if (!set_conf(conf, "bootstrap.servers", host, error) ||
        !set_conf(conf, "client.id", config_.client_id, error) ||
        !set_conf(conf, "message.timeout.ms", std::to_string(config_.delivery_timeout_ms), error)) {
        rd_kafka_conf_destroy(conf);
        return OpenResult::error(ErrorCategory::CONNECTION_ERROR, error);
    }
    rd_kafka_conf_set_dr_msg_cb(conf, delivery_report);

    char errstr[512];
    rd_kafka_t* producer = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
    if (!producer) {
        // conf is only consumed on success
        rd_kafka_conf_destroy(conf);
        return OpenResult::error(ErrorCategory::CONNECTION_ERROR,
            std::format("Kafka: failed to create producer: {}", errstr));
    }
    return OpenResult::ok(std::make_unique<KafkaConnection>(producer, host, config_));
}

std::string KafkaBrokerClient::name() const {
    return std::format("kafka:{}", config_.client_id);
}

// ============================================================================
// KafkaConnection
// ============================================================================

KafkaConnection::KafkaConnection(rd_kafka_t* producer, std::string host,
                                 const KafkaClientConfig& config)
    : producer_(producer), host_(std::move(host)), config_(config) {}

KafkaConnection::~KafkaConnection() {
    close();
}

std::unique_ptr<IBrokerChannel> KafkaConnection::create_channel() {
    if (!producer_) {
        throw BrokerError(std::format("Kafka: connection to {} is closed", host_));
    }
    return std::make_unique<KafkaChannel>(producer_, host_, config_);
}

void KafkaConnection::close() {
    if (!producer_) return;

    (void)rd_kafka_flush(producer_, config_.publish_timeout_ms);
    if (const int undelivered = rd_kafka_outq_len(producer_); undelivered > 0) {
        // rd_kafka_destroy() drops queued messages without their delivery reports
        rd_kafka_purge(producer_, RD_KAFKA_PURGE_F_QUEUE | RD_KAFKA_PURGE_F_INFLIGHT);
        (void)rd_kafka_flush(producer_, kPurgeDrainMs);
        utils::log::warn(std::format("Kafka: purged {} undelivered message(s) closing {}",
                                     undelivered, host_));
    }
    rd_kafka_destroy(producer_);
    producer_ = nullptr;
}

bool KafkaConnection::check_reachable(int timeout_ms, std::string& error) {
    if (!producer_) {
        error = std::format("Kafka: connection to {} is closed", host_);
        return false;
    }
    const rd_kafka_metadata_t* metadata = nullptr;
    const auto err = rd_kafka_metadata(producer_, 0, nullptr, &metadata, timeout_ms);
    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        error = std::format("Kafka: broker {} unreachable: {}", host_, rd_kafka_err2str(err));
        return false;
    }
    rd_kafka_metadata_destroy(metadata);
    return true;
}

uint64_t KafkaConnection::pending_deliveries() {
    return g_pending_deliveries.load(std::memory_order_relaxed);
}

// ============================================================================
// KafkaChannel
// ============================================================================

KafkaChannel::KafkaChannel(rd_kafka_t* producer, std::string host,
                           const KafkaClientConfig& config)
    : producer_(producer), host_(std::move(host)), config_(config) {}

KafkaChannel::~KafkaChannel() {
    close();
}

bool KafkaChannel::is_open() const {
    std::lock_guard lock(mutex_);
    return open_;
}

void KafkaChannel::declare_queue(const std::string& queue) {
    if (!is_open()) throw BrokerError("Kafka: channel is closed");

    char errstr[512];
    rd_kafka_NewTopic_t* new_topic = rd_kafka_NewTopic_new(
        queue.c_str(), config_.num_partitions, config_.replication_factor,
        errstr, sizeof(errstr));
    if (!new_topic) {
        throw BrokerError(std::format("Kafka: invalid topic '{}': {}", queue, errstr));
    }

    rd_kafka_AdminOptions_t* options = rd_kafka_AdminOptions_new(
        producer_, RD_KAFKA_ADMIN_OP_CREATETOPICS);
    rd_kafka_AdminOptions_set_operation_timeout(
        options, config_.metadata_timeout_ms, errstr, sizeof(errstr));
    rd_kafka_queue_t* result_queue = rd_kafka_queue_new(producer_);

    rd_kafka_CreateTopics(producer_, &new_topic, 1, options, result_queue);
    rd_kafka_event_t* event = rd_kafka_queue_poll(result_queue, config_.metadata_timeout_ms + 1000);

    std::string failure;
    if (!event) {
        failure = "timed out";
    } else if (rd_kafka_event_error(event) != RD_KAFKA_RESP_ERR_NO_ERROR) {
        failure = rd_kafka_event_error_string(event);
    } else {
        const rd_kafka_CreateTopics_result_t* result = rd_kafka_event_CreateTopics_result(event);
        size_t count = 0;
        const rd_kafka_topic_result_t** topics = rd_kafka_CreateTopics_result_topics(result, &count);
        for (size_t i = 0; i < count; ++i) {
            const auto err = rd_kafka_topic_result_error(topics[i]);
            if (err != RD_KAFKA_RESP_ERR_NO_ERROR &&
                err != RD_KAFKA_RESP_ERR_TOPIC_ALREADY_EXISTS) {
                const char* message = rd_kafka_topic_result_error_string(topics[i]);
                failure = message ? message : rd_kafka_err2str(err);
            }
        }
    }

    if (event) rd_kafka_event_destroy(event);
    rd_kafka_queue_destroy(result_queue);
    rd_kafka_AdminOptions_destroy(options);
    rd_kafka_NewTopic_destroy(new_topic);

    if (!failure.empty()) {
        throw BrokerError(std::format("Kafka: declare '{}' failed: {}", queue, failure));
    }
    utils::log::debug(std::format("Kafka: topic '{}' declared", queue));
}

void KafkaChannel::publish(const std::string& queue, const MessageHeaders& headers,
                           std::string_view body) {
    if (!is_open()) throw BrokerError("Kafka: channel is closed");

    rd_kafka_headers_t* kafka_headers = rd_kafka_headers_new(headers.size());
    for (const auto& [key, value] : headers) {
        rd_kafka_header_add(kafka_headers, key.c_str(), static_cast<ssize_t>(key.size()),
                            value.data(), static_cast<ssize_t>(value.size()));
    }

    auto state = std::make_shared<DeliveryState>();
    auto* holder = new std::shared_ptr<DeliveryState>(state);
    g_pending_deliveries.fetch_add(1, std::memory_order_relaxed);

    const auto err = rd_kafka_producev(
        producer_,
        RD_KAFKA_V_TOPIC(queue.c_str()),
        RD_KAFKA_V_VALUE(const_cast<char*>(body.data()), body.size()),
        RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY),
        RD_KAFKA_V_HEADERS(kafka_headers),
        RD_KAFKA_V_OPAQUE(holder),
        RD_KAFKA_V_END);

    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        // Ownership of headers and opaque only passes on success
        rd_kafka_headers_destroy(kafka_headers);
        delete holder;
        g_pending_deliveries.fetch_sub(1, std::memory_order_relaxed);
        throw BrokerError(std::format("Kafka: produce to '{}' failed: {}",
                                      queue, rd_kafka_err2str(err)));
    }

    utils::Timer timer;
    while (!state->done.load(std::memory_order_acquire) &&
           timer.elapsed_ms().count() < config_.publish_timeout_ms) {
        rd_kafka_poll(producer_, 50);
    }

    if (!state->done.load(std::memory_order_acquire)) {
        throw BrokerError(std::format("Kafka: delivery to '{}' timed out", queue));
    }
    const auto delivery_err = static_cast<rd_kafka_resp_err_t>(
        state->error.load(std::memory_order_relaxed));
    if (delivery_err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        throw BrokerError(std::format("Kafka: delivery to '{}' failed: {}",
                                      queue, rd_kafka_err2str(delivery_err)));
    }
}

std::string KafkaChannel::consume(const std::string& queue, MessageHandler handler) {
    if (!is_open()) throw BrokerError("Kafka: channel is closed");

    rd_kafka_conf_t* conf = rd_kafka_conf_new();
    std::string error;
    if (!set_conf(conf, "bootstrap.servers", host_, error) ||
        !set_conf(conf, "group.id", config_.group_id, error) ||
        !set_conf(conf, "client.id", config_.client_id, error) ||
        !set_conf(conf, "enable.auto.commit", "true", error) ||
        !set_conf(conf, "auto.offset.reset", config_.auto_offset_reset, error)) {
        rd_kafka_conf_destroy(conf);
        throw BrokerError(error);
    }

    char errstr[512];
    rd_kafka_t* consumer = rd_kafka_new(RD_KAFKA_CONSUMER, conf, errstr, sizeof(errstr));
    if (!consumer) {
        rd_kafka_conf_destroy(conf);
        throw BrokerError(std::format("Kafka: failed to create consumer: {}", errstr));
    }
    rd_kafka_poll_set_consumer(consumer);

    rd_kafka_topic_partition_list_t* topics = rd_kafka_topic_partition_list_new(1);
    rd_kafka_topic_partition_list_add(topics, queue.c_str(), RD_KAFKA_PARTITION_UA);
    const auto err = rd_kafka_subscribe(consumer, topics);
    rd_kafka_topic_partition_list_destroy(topics);
    if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
        rd_kafka_destroy(consumer);
        throw BrokerError(std::format("Kafka: subscribe to '{}' failed: {}",
                                      queue, rd_kafka_err2str(err)));
    }

    const std::string tag = std::format("{}-{}", queue,
        next_consumer_id_.fetch_add(1, std::memory_order_relaxed));

    auto worker = std::make_unique<ConsumerWorker>();
    worker->consumer = consumer;
    worker->thread = std::jthread(poll_loop, consumer, queue, std::move(handler),
                                  config_.poll_timeout_ms);

    std::lock_guard lock(mutex_);
    consumers_.emplace(tag, std::move(worker));
    utils::log::info(std::format("Kafka: consuming '{}' (group={}, tag={})",
                                 queue, config_.group_id, tag));
    return tag;
}

void KafkaChannel::poll_loop(std::stop_token stop, rd_kafka_t* consumer, std::string queue,
                             MessageHandler handler, int poll_timeout_ms) {
    while (!stop.stop_requested()) {
        rd_kafka_message_t* message = rd_kafka_consumer_poll(consumer, poll_timeout_ms);
        if (!message) continue;

        if (message->err == RD_KAFKA_RESP_ERR_NO_ERROR) {
            BrokerMessage delivered;
            delivered.queue = queue;
            delivered.delivery_tag = static_cast<uint64_t>(message->offset);
            if (message->payload) {
                delivered.body.assign(static_cast<const char*>(message->payload), message->len);
            }

            rd_kafka_headers_t* headers = nullptr;
            if (rd_kafka_message_headers(message, &headers) == RD_KAFKA_RESP_ERR_NO_ERROR) {
                const char* name = nullptr;
                const void* value = nullptr;
                size_t size = 0;
                for (size_t idx = 0;
                     rd_kafka_header_get_all(headers, idx, &name, &value, &size) ==
                         RD_KAFKA_RESP_ERR_NO_ERROR;
                     ++idx) {
                    delivered.headers[name] = value
                        ? std::string(static_cast<const char*>(value), size)
                        : std::string();
                }
            }

            try {
                handler(delivered);
            } catch (const std::exception& e) {
                utils::log::error(std::format("Kafka: handler for '{}' threw: {}", queue, e.what()));
            }
        } else if (message->err != RD_KAFKA_RESP_ERR__PARTITION_EOF) {
            utils::log::warn(std::format("Kafka: consume error on '{}': {}",
                                         queue, rd_kafka_message_errstr(message)));
        }
        rd_kafka_message_destroy(message);
    }
}

void KafkaChannel::destroy_worker(ConsumerWorker& worker) {
    worker.thread.request_stop();
    if (worker.thread.joinable()) {
        worker.thread.join();
    }
    if (worker.consumer) {
        rd_kafka_consumer_close(worker.consumer);
        rd_kafka_destroy(worker.consumer);
        worker.consumer = nullptr;
    }
}

void KafkaChannel::cancel(const std::string& consumer_tag) {
    std::unique_ptr<ConsumerWorker> worker;
    {
        std::lock_guard lock(mutex_);
        const auto it = consumers_.find(consumer_tag);
        if (it == consumers_.end()) return;
        worker = std::move(it->second);
        consumers_.erase(it);
    }
    destroy_worker(*worker);
    utils::log::debug(std::format("Kafka: consumer {} cancelled", consumer_tag));
}

void KafkaChannel::close() {
    std::map<std::string, std::unique_ptr<ConsumerWorker>> consumers;
    {
        std::lock_guard lock(mutex_);
        if (!open_) return;
        open_ = false;
        consumers.swap(consumers_);
    }
    for (auto& [tag, worker] : consumers) {
        destroy_worker(*worker);
    }
}

} // namespace tracebridge
