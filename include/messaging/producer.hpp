#pragma once

#include "broker/broker_client.hpp"
#include "diagnostics/diagnostic_registry.hpp"
#include "messaging/enqueued_message.hpp"
#include "metrics/metrics_registry.hpp"
#include "tracing/trace_context.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tracebridge {

struct ProducerConfig {
    std::string host = "localhost:9092";
    std::string queue = "web-queue";
};

/**
 * @brief Publishes messages carrying a traceparent header
 *
 * Each publish mints the trace identity of its span (child of the explicit
 * parent, or a new root) and writes it into the message headers. When the
 * "tracebridge.broker" source has subscribers, the publish is bracketed by
 * START and STOP (or EXCEPTION) diagnostic events carrying that identity,
 * so the span a Collector builds always covers the broker call:
 *
 *   START{context, tags: operation/host/queue}
 *     -> channel->publish(queue, {traceparent}, body)
 *   STOP  (or EXCEPTION + rethrow)
 *
 * Publishes are serialized; the channel is not shared.
 */
class Producer {
public:
    static constexpr const char* kSourceName = "tracebridge.broker";

    Producer(ProducerConfig config,
             std::shared_ptr<IBrokerClient> client,
             DiagnosticRegistry& diagnostics,
             std::shared_ptr<MetricsRegistry> metrics = nullptr);
    ~Producer();

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    /**
     * @brief Open connection + channel and declare the queue
     * @return false when the broker is unreachable or declare fails (logged)
     */
    [[nodiscard]] bool connect();

    /// Release channel and connection. Idempotent.
    void close();

    [[nodiscard]] bool is_connected() const;

    /**
     * @brief Publish one message
     * @param parent Explicit parent context; new root trace when absent
     * @return The TraceContext written into the traceparent header
     * @throws BrokerError when not connected or the broker rejects the message
     */
    TraceContext publish(std::string_view body,
                         const std::optional<TraceContext>& parent = std::nullopt);

    /**
     * @brief Publish an EnqueuedMessage as JSON and count it
     *
     * Increments Enqueued_Item{Source=message.source} on success.
     */
    TraceContext enqueue(const EnqueuedMessage& message,
                         const std::optional<TraceContext>& parent = std::nullopt);

    [[nodiscard]] const ProducerConfig& config() const { return config_; }
    [[nodiscard]] uint64_t messages_published() const {
        return messages_published_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t publish_failures() const {
        return publish_failures_.load(std::memory_order_relaxed);
    }

private:
    void close_locked();

    ProducerConfig config_;
    std::shared_ptr<IBrokerClient> client_;
    DiagnosticSource diagnostics_;
    std::shared_ptr<MetricsRegistry> metrics_;

    mutable std::mutex mutex_;
    std::unique_ptr<IBrokerConnection> connection_;
    std::unique_ptr<IBrokerChannel> channel_;

    std::atomic<uint64_t> messages_published_{0};
    std::atomic<uint64_t> publish_failures_{0};
};

} // namespace tracebridge
