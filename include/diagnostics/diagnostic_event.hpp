#pragma once

#include "tracing/span.hpp"
#include "tracing/trace_context.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tracebridge {

enum class EventKind { START, STOP, EXCEPTION };

[[nodiscard]] inline const char* event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::START:     return "start";
        case EventKind::STOP:      return "stop";
        case EventKind::EXCEPTION: return "exception";
    }
    return "unknown";
}

/**
 * @brief One raw instrumentation event from a named source
 *
 * START/STOP/EXCEPTION for the same operation share a correlation_id
 * (DiagnosticRegistry::next_correlation_id()).
 *
 * Span identity on START, in priority order:
 * - context:  identity already minted by the emitter (e.g. written into
 *             outgoing message metadata), parent in parent_span_id
 * - parent:   explicit in-process parent; the span becomes its child
 * - neither:  a new root trace
 */
struct DiagnosticEvent {
    EventKind kind = EventKind::START;
    std::string source;
    std::string name;
    uint64_t correlation_id = 0;

    SpanKind span_kind = SpanKind::INTERNAL;
    std::optional<TraceContext> context;
    std::optional<SpanId> parent_span_id;
    std::optional<TraceContext> parent;

    SpanTags tags;
    std::string error_description;   // EXCEPTION only
};

using EventHandler = std::function<void(const DiagnosticEvent&)>;

/**
 * @brief Callback table keyed by event kind
 *
 * Empty entries are skipped.
 */
struct EventHandlerTable {
    EventHandler on_start;
    EventHandler on_stop;
    EventHandler on_exception;

    [[nodiscard]] const EventHandler& for_kind(EventKind kind) const {
        switch (kind) {
            case EventKind::START: return on_start;
            case EventKind::STOP:  return on_stop;
            case EventKind::EXCEPTION: break;
        }
        return on_exception;
    }
};

} // namespace tracebridge
