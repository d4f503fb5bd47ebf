#include "tracing/span.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracebridge {

const char* span_kind_to_string(SpanKind kind) {
    switch (kind) {
        case SpanKind::INTERNAL: return "INTERNAL";
        case SpanKind::PRODUCER: return "PRODUCER";
        case SpanKind::CONSUMER: return "CONSUMER";
        case SpanKind::CLIENT:   return "CLIENT";
        case SpanKind::SERVER:   return "SERVER";
    }
    return "INTERNAL";
}

const char* span_state_to_string(SpanState state) {
    switch (state) {
        case SpanState::CREATED: return "created";
        case SpanState::STARTED: return "started";
        case SpanState::ENDED:   return "ended";
    }
    return "unknown";
}

Span::Span(std::string name, SpanKind kind, TraceContext context,
           std::optional<SpanId> parent_span_id, EndCallback on_end)
    : name_(std::move(name)),
      kind_(kind),
      context_(context),
      parent_span_id_(parent_span_id),
      on_end_(std::move(on_end)) {}

std::shared_ptr<Span> Span::create_root(std::string name, SpanKind kind) {
    return std::make_shared<Span>(std::move(name), kind, TraceContext::generate());
}

std::shared_ptr<Span> Span::create_child(std::string name, SpanKind kind,
                                         const TraceContext& parent) {
    return std::make_shared<Span>(std::move(name), kind, parent.child(), parent.span_id);
}

bool Span::start() {
    std::lock_guard lock(mutex_);
    if (state_ != SpanState::CREATED) return false;
    start_time_ = utils::now();
    state_ = SpanState::STARTED;
    return true;
}

bool Span::add_tag(const std::string& key, std::string value) {
    std::lock_guard lock(mutex_);
    if (state_ != SpanState::STARTED) return false;
    tags_[key] = std::move(value);
    return true;
}

bool Span::add_event(std::string name) {
    std::lock_guard lock(mutex_);
    if (state_ != SpanState::STARTED) return false;
    events_.push_back(SpanEvent{std::move(name), utils::now()});
    return true;
}

bool Span::set_status(SpanStatus status) {
    std::lock_guard lock(mutex_);
    if (state_ != SpanState::STARTED) return false;
    status_ = std::move(status);
    return true;
}

bool Span::end() {
    return finish(std::nullopt);
}

bool Span::end(SpanStatus status) {
    return finish(std::move(status));
}

bool Span::finish(std::optional<SpanStatus> status) {
    SpanData data;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SpanState::ENDED) return false;

        const auto now = utils::now();
        if (state_ == SpanState::CREATED) {
            start_time_ = now;
        }
        end_time_ = now;
        if (status) {
            status_ = std::move(*status);
        } else if (status_.code == StatusCode::UNSET) {
            status_ = SpanStatus::ok();
        }
        state_ = SpanState::ENDED;

        if (!on_end_) return true;
        data = snapshot_locked();
    }

    // Export outside the lock; the span is immutable from here on
    on_end_(data);
    return true;
}

SpanState Span::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

SpanStatus Span::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

SpanTags Span::tags() const {
    std::lock_guard lock(mutex_);
    return tags_;
}

std::vector<SpanEvent> Span::events() const {
    std::lock_guard lock(mutex_);
    return events_;
}

std::optional<std::chrono::system_clock::time_point> Span::end_time() const {
    std::lock_guard lock(mutex_);
    return end_time_;
}

SpanData Span::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_locked();
}

SpanData Span::snapshot_locked() const {
    SpanData data;
    data.context = context_;
    data.parent_span_id = parent_span_id_;
    data.name = name_;
    data.kind = kind_;
    data.tags = tags_;
    data.events = events_;
    data.status = status_;
    data.start_time = start_time_;
    data.end_time = end_time_.value_or(start_time_);
    return data;
}

ScopedSpan::~ScopedSpan() {
    if (!span_) return;
    try {
        span_->end();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Span '{}' end failed: {}", span_->name(), e.what()));
    }
}

} // namespace tracebridge
