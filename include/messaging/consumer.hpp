#pragma once

#include "broker/broker_client.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "metrics/metrics_registry.hpp"
#include "tracing/tracer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace tracebridge {

enum class ConsumerState { DISCONNECTED, CONNECTING, CONSUMING };

[[nodiscard]] const char* consumer_state_to_string(ConsumerState state);

/**
 * @brief Structured event emitted on consumer state transitions
 */
struct ConsumerStateChange {
    ConsumerState from;
    ConsumerState to;
    std::chrono::system_clock::time_point timestamp;
    std::string reason;
};

/**
 * @brief Downstream processing step for one message
 *
 * Receives the consumer span (parent for any child spans) and a logging
 * scope keyed by the trace id. Throwing marks the span as failed.
 */
using MessageProcessor =
    std::function<void(const BrokerMessage&, Span&, const utils::log::Scope&)>;

struct ConsumerConfig {
    std::string host = "localhost:9092";
    std::string queue = "web-queue";
    std::chrono::milliseconds retry_backoff{3000};
    std::chrono::milliseconds drain_timeout{5000};
};

/**
 * @brief Resilient queue consumer with per-message trace correlation
 *
 * States:
 * - DISCONNECTED: no broker resources held
 * - CONNECTING:   connect + channel + declare + consume in progress
 * - CONSUMING:    deliveries flow into handle_message()
 *
 * start() retries with a fixed backoff until it reaches CONSUMING or its
 * stop_token is triggered (the backoff wait wakes immediately). Each failed
 * attempt releases whatever it had acquired before waiting.
 *
 * Per message: the traceparent header is required. A missing or malformed
 * header is rejected fail-fast (FORMAT_ERROR, no span, counted in
 * Trace_Header_Rejected); the message still counts as acknowledged. Valid
 * messages are processed inside a CONSUMER child span that always ends.
 */
class Consumer {
public:
    Consumer(ConsumerConfig config,
             std::shared_ptr<IBrokerClient> client,
             std::shared_ptr<Tracer> tracer,
             MessageProcessor processor,
             std::shared_ptr<MetricsRegistry> metrics = nullptr);
    ~Consumer();

    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    /**
     * @brief Connect and begin consuming, retrying until success or cancel
     * @return true once CONSUMING, false when cancelled (or already stopped)
     */
    bool start(std::stop_token stop);

    /**
     * @brief Reject new deliveries, drain in-flight handlers (bounded by
     * drain_timeout), cancel the consumer and close channel + connection.
     * Idempotent.
     */
    void stop();

    /**
     * @brief Process one delivered message
     * @return The consumer span's context; FORMAT_ERROR for a missing or
     *         malformed header, PROCESSING_ERROR when the processor threw
     */
    Result<TraceContext> handle_message(const BrokerMessage& message);

    [[nodiscard]] ConsumerState state() const;

    void set_on_state_change(std::function<void(const ConsumerStateChange&)> cb);

    /// Most recent last, bounded
    [[nodiscard]] std::vector<ConsumerStateChange> get_recent_events() const;

    struct Stats {
        uint64_t connect_attempts;
        uint64_t connect_failures;
        uint64_t messages_received;
        uint64_t messages_processed;
        uint64_t processing_failures;
        uint64_t headers_rejected;
    };

    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] size_t in_flight() const;
    [[nodiscard]] const ConsumerConfig& config() const { return config_; }

private:
    bool try_connect(std::string& error);
    void release_resources();
    void on_delivery(const BrokerMessage& message);
    Result<TraceContext> reject(const BrokerMessage& message, const std::string& reason);
    void transition(ConsumerState to, std::string reason);

    ConsumerConfig config_;
    std::shared_ptr<IBrokerClient> client_;
    std::shared_ptr<Tracer> tracer_;
    MessageProcessor processor_;
    std::shared_ptr<MetricsRegistry> metrics_;

    // Broker resources
    std::mutex resources_mutex_;
    std::unique_ptr<IBrokerConnection> connection_;
    std::unique_ptr<IBrokerChannel> channel_;
    std::string consumer_tag_;

    // Lifecycle
    std::atomic<bool> stopped_{false};
    std::atomic<bool> accepting_{false};
    std::mutex backoff_mutex_;
    std::condition_variable_any backoff_cv_;

    // In-flight delivery tracking for drain
    mutable std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    size_t in_flight_ = 0;

    // State + change events
    mutable std::mutex state_mutex_;
    ConsumerState state_ = ConsumerState::DISCONNECTED;
    std::function<void(const ConsumerStateChange&)> on_state_change_;
    std::deque<ConsumerStateChange> recent_events_;
    static constexpr size_t kMaxRecentEvents = 100;

    std::atomic<uint64_t> connect_attempts_{0};
    std::atomic<uint64_t> connect_failures_{0};
    std::atomic<uint64_t> messages_received_{0};
    std::atomic<uint64_t> messages_processed_{0};
    std::atomic<uint64_t> processing_failures_{0};
    std::atomic<uint64_t> headers_rejected_{0};
};

} // namespace tracebridge
