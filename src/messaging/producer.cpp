#include "messaging/producer.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracebridge {

Producer::Producer(ProducerConfig config,
                   std::shared_ptr<IBrokerClient> client,
                   DiagnosticRegistry& diagnostics,
                   std::shared_ptr<MetricsRegistry> metrics)
    : config_(std::move(config)),
      client_(std::move(client)),
      diagnostics_(diagnostics, kSourceName),
      metrics_(std::move(metrics)) {}

Producer::~Producer() {
    close();
}

bool Producer::connect() {
    std::lock_guard lock(mutex_);
    if (channel_) return true;

    auto result = client_->connect(config_.host);
    if (result.is_error()) {
        utils::log::error(std::format("Producer: {} ({})", result.error_message(),
            error_category_to_string(result.error_category())));
        return false;
    }
    connection_ = std::move(result.value());

    try {
        channel_ = connection_->create_channel();
        channel_->declare_queue(config_.queue);
    } catch (const BrokerError& e) {
        utils::log::error(std::format("Producer: failed to open queue {}: {}",
                                      config_.queue, e.what()));
        close_locked();
        return false;
    }

    utils::log::info(std::format("Producer: publishing to {} on {}", config_.queue, config_.host));
    return true;
}

void Producer::close() {
    std::lock_guard lock(mutex_);
    close_locked();
}

void Producer::close_locked() {
    try {
        if (channel_) channel_->close();
        if (connection_) connection_->close();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Producer: close failed: {}", e.what()));
    }
    channel_.reset();
    connection_.reset();
}

bool Producer::is_connected() const {
    std::lock_guard lock(mutex_);
    return channel_ != nullptr;
}

TraceContext Producer::publish(std::string_view body, const std::optional<TraceContext>& parent) {
    const TraceContext context = parent ? parent->child() : TraceContext::generate();

    std::optional<DiagnosticEvent> start;
    if (diagnostics_.is_enabled()) {
        start = DiagnosticEvent{};
        start->kind = EventKind::START;
        start->name = std::format("publish {}", config_.queue);
        start->correlation_id = diagnostics_.next_correlation_id();
        start->span_kind = SpanKind::PRODUCER;
        start->context = context;
        if (parent) start->parent_span_id = parent->span_id;
        start->tags = {
            {"operation", "publish"},
            {"host", config_.host},
            {"queue", config_.queue}
        };
        diagnostics_.emit(*start);
    }

    const MessageHeaders headers{{std::string(kTraceParentHeader), context.to_traceparent()}};

    try {
        std::lock_guard lock(mutex_);
        if (!channel_) {
            throw BrokerError(std::format("producer for {} is not connected", config_.queue));
        }
        channel_->publish(config_.queue, headers, body);
    } catch (const std::exception& e) {
        publish_failures_.fetch_add(1, std::memory_order_relaxed);
        if (start) {
            DiagnosticEvent failed;
            failed.kind = EventKind::EXCEPTION;
            failed.name = start->name;
            failed.correlation_id = start->correlation_id;
            failed.error_description = e.what();
            diagnostics_.emit(std::move(failed));
        }
        throw;
    }

    messages_published_.fetch_add(1, std::memory_order_relaxed);
    if (start) {
        DiagnosticEvent stop;
        stop.kind = EventKind::STOP;
        stop.name = start->name;
        stop.correlation_id = start->correlation_id;
        diagnostics_.emit(std::move(stop));
    }
    return context;
}

TraceContext Producer::enqueue(const EnqueuedMessage& message,
                               const std::optional<TraceContext>& parent) {
    const nlohmann::json payload = message;
    auto context = publish(payload.dump(), parent);
    if (metrics_) {
        metrics_->increment(metrics::kEnqueuedItem, {{"Source", message.source}});
    }
    return context;
}

} // namespace tracebridge
