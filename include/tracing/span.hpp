#pragma once

#include "tracing/trace_context.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracebridge {

enum class SpanKind { INTERNAL, PRODUCER, CONSUMER, CLIENT, SERVER };

enum class SpanState { CREATED, STARTED, ENDED };

enum class StatusCode { UNSET, OK, ERROR };

[[nodiscard]] const char* span_kind_to_string(SpanKind kind);
[[nodiscard]] const char* span_state_to_string(SpanState state);

struct SpanStatus {
    StatusCode code = StatusCode::UNSET;
    std::string description;

    static SpanStatus ok() { return {StatusCode::OK, {}}; }
    static SpanStatus error(std::string description) {
        return {StatusCode::ERROR, std::move(description)};
    }

    [[nodiscard]] bool is_error() const { return code == StatusCode::ERROR; }
    bool operator==(const SpanStatus&) const = default;
};

struct SpanEvent {
    std::string name;
    std::chrono::system_clock::time_point timestamp;
};

using SpanTags = std::unordered_map<std::string, std::string>;

/**
 * @brief Immutable snapshot of an ended span, handed to exporters
 */
struct SpanData {
    TraceContext context;                 // trace_id + this span's id + flags
    std::optional<SpanId> parent_span_id;
    std::string name;
    SpanKind kind = SpanKind::INTERNAL;
    SpanTags tags;
    std::vector<SpanEvent> events;
    SpanStatus status;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;

    /// Duration in microseconds
    [[nodiscard]] uint64_t duration_us() const {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                end_time - start_time).count());
    }
};

/**
 * @brief A timed unit of work with parent linkage, tags, events and status
 *
 * Lifecycle: CREATED -> STARTED -> ENDED.
 * - start() is idempotent; only the first call stamps start_time.
 * - add_tag()/add_event()/set_status() are accepted only while STARTED.
 * - end() is idempotent; only the first call stamps end_time and fires the
 *   end callback (export). Later calls return false and change nothing.
 *
 * The span's own TraceContext (context()) is what gets propagated to
 * children and onto the wire.
 */
class Span {
public:
    using EndCallback = std::function<void(const SpanData&)>;

    Span(std::string name, SpanKind kind, TraceContext context,
         std::optional<SpanId> parent_span_id = std::nullopt,
         EndCallback on_end = {});

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    /// Standalone span (no export on end) rooted in a fresh trace
    [[nodiscard]] static std::shared_ptr<Span> create_root(std::string name, SpanKind kind);

    /// Standalone child span: same trace, new span id, parent = parent.span_id
    [[nodiscard]] static std::shared_ptr<Span> create_child(
        std::string name, SpanKind kind, const TraceContext& parent);

    /// @return true if this call moved the span to STARTED
    bool start();

    /// @return false if the span is not STARTED
    bool add_tag(const std::string& key, std::string value);
    bool add_event(std::string name);
    bool set_status(SpanStatus status);

    /// End with the status recorded so far (OK when still unset)
    bool end();

    /// End with an explicit terminal status
    bool end(SpanStatus status);

    [[nodiscard]] SpanState state() const;
    [[nodiscard]] SpanStatus status() const;
    [[nodiscard]] SpanTags tags() const;
    [[nodiscard]] std::vector<SpanEvent> events() const;
    [[nodiscard]] std::optional<std::chrono::system_clock::time_point> end_time() const;

    [[nodiscard]] const TraceContext& context() const { return context_; }
    [[nodiscard]] const std::optional<SpanId>& parent_span_id() const { return parent_span_id_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] SpanKind kind() const { return kind_; }

    [[nodiscard]] SpanData snapshot() const;

private:
    bool finish(std::optional<SpanStatus> status);
    SpanData snapshot_locked() const;

    const std::string name_;
    const SpanKind kind_;
    const TraceContext context_;
    const std::optional<SpanId> parent_span_id_;
    EndCallback on_end_;

    mutable std::mutex mutex_;
    SpanState state_ = SpanState::CREATED;
    SpanTags tags_;
    std::vector<SpanEvent> events_;
    SpanStatus status_;
    std::chrono::system_clock::time_point start_time_{};
    std::optional<std::chrono::system_clock::time_point> end_time_;
};

/**
 * @brief RAII span helper: ends the span on scope exit
 *
 * Usage:
 *   ScopedSpan span(tracer->start_span("process", SpanKind::CONSUMER, parent));
 *   span->add_tag("queue", queue);
 *   ... // any exit path, including exceptions, ends the span
 */
class ScopedSpan {
public:
    explicit ScopedSpan(std::shared_ptr<Span> span) : span_(std::move(span)) {}
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    Span* operator->() const { return span_.get(); }
    Span& operator*() const { return *span_; }
    [[nodiscard]] const std::shared_ptr<Span>& get() const { return span_; }

private:
    std::shared_ptr<Span> span_;
};

} // namespace tracebridge
