#include "diagnostics/collector.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracebridge {

Collector::Collector(DiagnosticRegistry& registry, std::shared_ptr<Tracer> tracer)
    : registry_(registry),
      state_(std::make_shared<SharedState>()) {
    state_->tracer = tracer ? std::move(tracer) : std::make_shared<Tracer>();
}

Collector::~Collector() {
    dispose();
}

Result<uint64_t> Collector::subscribe(const std::string& source) {
    return subscribe(source, span_handlers(state_));
}

Result<uint64_t> Collector::subscribe(const std::string& source, EventHandlerTable handlers) {
    std::lock_guard lock(subscriptions_mutex_);
    // Checked under the lock so dispose() cannot miss a late subscription
    if (is_disposed()) {
        return Result<uint64_t>::error(ErrorCategory::DISPOSAL_ERROR,
            std::format("collector disposed, cannot subscribe to {}", source));
    }

    auto subscription = registry_.subscribe(source, std::move(handlers));
    const uint64_t id = subscription.id();
    subscriptions_.push_back(std::move(subscription));
    utils::log::debug(std::format("Collector: subscribed to {} (id={})", source, id));
    return Result<uint64_t>::ok(id);
}

bool Collector::dispose() {
    std::vector<Subscription> subscriptions;
    {
        std::lock_guard lock(subscriptions_mutex_);
        if (state_->disposed.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
        subscriptions.swap(subscriptions_);
    }
    subscriptions.clear();

    std::unordered_map<uint64_t, std::shared_ptr<Span>> open_spans;
    {
        std::lock_guard lock(state_->spans_mutex);
        open_spans.swap(state_->open_spans);
    }
    for (auto& [id, span] : open_spans) {
        span->end(SpanStatus::error("collector disposed"));
    }
    if (!open_spans.empty()) {
        utils::log::warn(std::format("Collector: {} span(s) still open at dispose",
                                     open_spans.size()));
    }

    state_->tracer->flush();
    return true;
}

size_t Collector::subscription_count() const {
    std::lock_guard lock(subscriptions_mutex_);
    return subscriptions_.size();
}

size_t Collector::open_span_count() const {
    std::lock_guard lock(state_->spans_mutex);
    return state_->open_spans.size();
}

std::shared_ptr<Span> Collector::find_span(uint64_t correlation_id) const {
    std::lock_guard lock(state_->spans_mutex);
    const auto it = state_->open_spans.find(correlation_id);
    return it != state_->open_spans.end() ? it->second : nullptr;
}

EventHandlerTable Collector::span_handlers(const std::shared_ptr<SharedState>& state) {
    EventHandlerTable table;
    table.on_start = [state](const DiagnosticEvent& e) { on_start(*state, e); };
    table.on_stop = [state](const DiagnosticEvent& e) { on_stop(*state, e); };
    table.on_exception = [state](const DiagnosticEvent& e) { on_exception(*state, e); };
    return table;
}

void Collector::on_start(SharedState& state, const DiagnosticEvent& event) {
    if (state.disposed.load(std::memory_order_acquire)) return;

    std::shared_ptr<Span> span;
    if (event.context) {
        span = state.tracer->create_span(event.name, event.span_kind,
                                         *event.context, event.parent_span_id);
    } else if (event.parent) {
        span = state.tracer->create_span(event.name, event.span_kind,
                                         event.parent->child(), event.parent->span_id);
    } else {
        span = state.tracer->create_span(event.name, event.span_kind,
                                         TraceContext::generate(), std::nullopt);
    }
    span->start();
    for (const auto& [key, value] : event.tags) {
        span->add_tag(key, value);
    }

    {
        std::lock_guard lock(state.spans_mutex);
        if (!state.disposed.load(std::memory_order_acquire) &&
            state.open_spans.emplace(event.correlation_id, span).second) {
            return;
        }
    }

    // Not tracked, so nothing else would ever end it
    if (state.disposed.load(std::memory_order_acquire)) {
        span->end(SpanStatus::error("collector disposed"));
        return;
    }
    utils::log::warn(std::format("Collector: duplicate start for correlation id {} ({})",
                                 event.correlation_id, event.name));
    span->end(SpanStatus::error("duplicate start"));
}

void Collector::on_stop(SharedState& state, const DiagnosticEvent& event) {
    auto span = take_span(state, event.correlation_id);
    if (!span) return;
    for (const auto& [key, value] : event.tags) {
        span->add_tag(key, value);
    }
    span->end(SpanStatus::ok());
}

void Collector::on_exception(SharedState& state, const DiagnosticEvent& event) {
    auto span = take_span(state, event.correlation_id);
    if (!span) return;
    span->end(SpanStatus::error(event.error_description));
}

std::shared_ptr<Span> Collector::take_span(SharedState& state, uint64_t correlation_id) {
    std::lock_guard lock(state.spans_mutex);
    const auto it = state.open_spans.find(correlation_id);
    if (it == state.open_spans.end()) {
        utils::log::debug(std::format("Collector: no open span for correlation id {}",
                                      correlation_id));
        return nullptr;
    }
    auto span = std::move(it->second);
    state.open_spans.erase(it);
    return span;
}

} // namespace tracebridge
