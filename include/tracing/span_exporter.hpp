#pragma once

#include "tracing/span.hpp"

#include <string>

namespace tracebridge {

enum class ExportResult { SUCCESS, RETRYABLE_ERROR };

/**
 * @brief Abstract interface for span output destinations
 *
 * Each exporter receives ended spans from a Tracer. The Tracer serializes
 * calls into its exporters, so implementations need no internal locking.
 */
class ISpanExporter {
public:
    virtual ~ISpanExporter() = default;

    /// Accept one ended span. Failures are reported, never thrown.
    [[nodiscard]] virtual ExportResult export_span(const SpanData& span) = 0;

    /// Push any buffered spans to the backend.
    virtual void flush() = 0;

    /// Graceful shutdown (drain buffers, close handles).
    virtual void shutdown() = 0;

    /// Human-readable exporter name for logging (e.g. "zipkin:http://zipkin:9411/api/v2/spans")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace tracebridge
