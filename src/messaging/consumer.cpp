#include "messaging/consumer.hpp"

#include <format>

namespace tracebridge {

const char* consumer_state_to_string(ConsumerState state) {
    switch (state) {
        case ConsumerState::DISCONNECTED: return "disconnected";
        case ConsumerState::CONNECTING:   return "connecting";
        case ConsumerState::CONSUMING:    return "consuming";
    }
    return "unknown";
}

Consumer::Consumer(ConsumerConfig config,
                   std::shared_ptr<IBrokerClient> client,
                   std::shared_ptr<Tracer> tracer,
                   MessageProcessor processor,
                   std::shared_ptr<MetricsRegistry> metrics)
    : config_(std::move(config)),
      client_(std::move(client)),
      tracer_(tracer ? std::move(tracer) : std::make_shared<Tracer>()),
      processor_(std::move(processor)),
      metrics_(std::move(metrics)) {}

Consumer::~Consumer() {
    stop();
}

// ============================================================================
// Connect loop
// ============================================================================

bool Consumer::start(std::stop_token stop) {
    while (!stop.stop_requested() && !stopped_.load(std::memory_order_acquire)) {
        const uint64_t attempt = connect_attempts_.fetch_add(1, std::memory_order_relaxed) + 1;
        transition(ConsumerState::CONNECTING, std::format("attempt {}", attempt));

        std::string error;
        if (try_connect(error)) {
            transition(ConsumerState::CONSUMING, std::format("consuming {}", config_.queue));
            return true;
        }

        connect_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Consumer: connect to {} failed ({}), retrying in {}ms",
            config_.host, error, config_.retry_backoff.count()));
        release_resources();
        transition(ConsumerState::DISCONNECTED, error);

        std::unique_lock lock(backoff_mutex_);
        backoff_cv_.wait_for(lock, stop, config_.retry_backoff, [this] {
            return stopped_.load(std::memory_order_acquire);
        });
    }

    utils::log::info(std::format("Consumer: start for {} cancelled", config_.queue));
    return false;
}

bool Consumer::try_connect(std::string& error) {
    auto result = client_->connect(config_.host);
    if (result.is_error()) {
        error = result.error_message();
        return false;
    }

    std::lock_guard lock(resources_mutex_);
    connection_ = std::move(result.value());
    if (stopped_.load(std::memory_order_acquire)) {
        error = "consumer stopped";
        return false;
    }
    try {
        channel_ = connection_->create_channel();
        channel_->declare_queue(config_.queue);
        accepting_.store(true, std::memory_order_release);
        consumer_tag_ = channel_->consume(config_.queue, [this](const BrokerMessage& message) {
            on_delivery(message);
        });
    } catch (const BrokerError& e) {
        accepting_.store(false, std::memory_order_release);
        error = e.what();
        return false;
    }
    return true;
}

void Consumer::release_resources() {
    std::lock_guard lock(resources_mutex_);
    if (channel_ && !consumer_tag_.empty()) {
        try {
            channel_->cancel(consumer_tag_);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Consumer: cancel {} failed: {}", consumer_tag_, e.what()));
        }
    }
    consumer_tag_.clear();

    if (channel_) {
        try {
            channel_->close();
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Consumer: channel close failed: {}", e.what()));
        }
        channel_.reset();
    }
    if (connection_) {
        try {
            connection_->close();
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Consumer: connection close failed: {}", e.what()));
        }
        connection_.reset();
    }
}

void Consumer::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) return;

    accepting_.store(false, std::memory_order_release);
    {
        // Pairs with the predicate check in start() so the wakeup is not lost
        std::lock_guard lock(backoff_mutex_);
    }
    backoff_cv_.notify_all();

    {
        std::unique_lock lock(inflight_mutex_);
        if (!inflight_cv_.wait_for(lock, config_.drain_timeout,
                                   [this] { return in_flight_ == 0; })) {
            utils::log::warn(std::format("Consumer: {} handler(s) still running after {}ms drain",
                                         in_flight_, config_.drain_timeout.count()));
        }
    }

    release_resources();
    if (state() != ConsumerState::DISCONNECTED) {
        transition(ConsumerState::DISCONNECTED, "stopped");
    }
    utils::log::info(std::format("Consumer: stopped ({})", config_.queue));
}

// ============================================================================
// Message handling
// ============================================================================

void Consumer::on_delivery(const BrokerMessage& message) {
    {
        std::lock_guard lock(inflight_mutex_);
        if (!accepting_.load(std::memory_order_acquire)) {
            utils::log::debug(std::format("Consumer: delivery {} ignored, stopping",
                                          message.delivery_tag));
            return;
        }
        ++in_flight_;
    }

    struct InFlightGuard {
        Consumer& self;
        ~InFlightGuard() {
            {
                std::lock_guard lock(self.inflight_mutex_);
                --self.in_flight_;
            }
            self.inflight_cv_.notify_all();
        }
    } guard{*this};

    (void)handle_message(message);
}

Result<TraceContext> Consumer::handle_message(const BrokerMessage& message) {
    messages_received_.fetch_add(1, std::memory_order_relaxed);

    const auto header = message.headers.find(std::string(kTraceParentHeader));
    if (header == message.headers.end()) {
        return reject(message, "trace information not found in message");
    }

    auto parent = TraceContext::parse_traceparent(header->second);
    if (parent.is_error()) {
        return reject(message, parent.error_message());
    }

    ScopedSpan span(tracer_->start_span(std::format("process {}", message.queue),
                                        SpanKind::CONSUMER, parent.value()));
    span->add_tag("queue", message.queue);

    const utils::log::Scope scope(std::format("trace={}", span->context().trace_id_hex()));
    try {
        processor_(message, *span, scope);
    } catch (const std::exception& e) {
        span->set_status(SpanStatus::error(e.what()));
        processing_failures_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->increment(metrics::kProcessingFailed, {{"Queue", message.queue}});
        }
        scope.error(std::format("processing failed: {}", e.what()));
        return Result<TraceContext>::error(ErrorCategory::PROCESSING_ERROR, e.what());
    }

    messages_processed_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) {
        metrics_->increment(metrics::kMessagesProcessed, {{"Queue", message.queue}});
    }
    if (utils::log::is_enabled(utils::log::Level::DEBUG)) {
        scope.debug(std::format("processed message: {}", message.body));
    }
    return Result<TraceContext>::ok(span->context());
}

Result<TraceContext> Consumer::reject(const BrokerMessage& message, const std::string& reason) {
    headers_rejected_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) {
        metrics_->increment(metrics::kTraceHeaderRejected, {{"Queue", message.queue}});
    }
    utils::log::warn(std::format("Consumer: message {} on {} rejected ({}): {}",
        message.delivery_tag, message.queue,
        error_category_to_string(ErrorCategory::FORMAT_ERROR), reason));
    return Result<TraceContext>::error(ErrorCategory::FORMAT_ERROR, reason);
}

// ============================================================================
// State tracking
// ============================================================================

void Consumer::transition(ConsumerState to, std::string reason) {
    std::function<void(const ConsumerStateChange&)> callback;
    ConsumerStateChange change;
    {
        std::lock_guard lock(state_mutex_);
        change = ConsumerStateChange{state_, to, utils::now(), std::move(reason)};
        state_ = to;
        recent_events_.push_back(change);
        if (recent_events_.size() > kMaxRecentEvents) {
            recent_events_.pop_front();
        }
        callback = on_state_change_;
    }

    utils::log::debug(std::format("Consumer: {} -> {} ({})",
        consumer_state_to_string(change.from), consumer_state_to_string(change.to),
        change.reason));
    if (callback) {
        callback(change);
    }
}

ConsumerState Consumer::state() const {
    std::lock_guard lock(state_mutex_);
    return state_;
}

void Consumer::set_on_state_change(std::function<void(const ConsumerStateChange&)> cb) {
    std::lock_guard lock(state_mutex_);
    on_state_change_ = std::move(cb);
}

std::vector<ConsumerStateChange> Consumer::get_recent_events() const {
    std::lock_guard lock(state_mutex_);
    return {recent_events_.begin(), recent_events_.end()};
}

Consumer::Stats Consumer::get_stats() const {
    return {
        connect_attempts_.load(std::memory_order_relaxed),
        connect_failures_.load(std::memory_order_relaxed),
        messages_received_.load(std::memory_order_relaxed),
        messages_processed_.load(std::memory_order_relaxed),
        processing_failures_.load(std::memory_order_relaxed),
        headers_rejected_.load(std::memory_order_relaxed)
    };
}

size_t Consumer::in_flight() const {
    std::lock_guard lock(inflight_mutex_);
    return in_flight_;
}

} // namespace tracebridge
