#pragma once

#include "tracing/span.hpp"
#include "tracing/span_exporter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tracebridge {

/**
 * @brief Span factory bound to a set of exporters
 *
 * Spans created here fire export exactly once, when they end. Export
 * fan-out is serialized under one lock, so exporters see a single caller.
 * It runs on the thread that ended the span; exporters that talk to the
 * network only enqueue here (see ZipkinExporter):
 *
 *   [Handler 1] --end()--> [Tracer::export_span] --> [Exporter 1: Zipkin]
 *   [Handler 2] --end()-->                       --> [Exporter 2: File]
 *
 * Unsampled spans (flags bit 0 clear) are counted and dropped. A
 * RETRYABLE_ERROR from an exporter is retried once before it is counted as
 * a failure.
 *
 * Must be owned by a std::shared_ptr; spans hold a weak reference back so an
 * ended span never outlives-and-dereferences its Tracer.
 */
class Tracer : public std::enable_shared_from_this<Tracer> {
public:
    Tracer() = default;

    Tracer(const Tracer&) = delete;
    Tracer& operator=(const Tracer&) = delete;

    void add_exporter(std::shared_ptr<ISpanExporter> exporter);
    [[nodiscard]] size_t exporter_count() const;

    /**
     * @brief Create and start a span
     * @param parent Explicit parent context; a new root trace when absent
     */
    [[nodiscard]] std::shared_ptr<Span> start_span(
        std::string name, SpanKind kind,
        const std::optional<TraceContext>& parent = std::nullopt);

    /**
     * @brief Create (not start) a span with a caller-minted identity
     *
     * Used when the identity was decided before the span exists, e.g. by a
     * producer that already wrote it into outgoing message metadata.
     */
    [[nodiscard]] std::shared_ptr<Span> create_span(
        std::string name, SpanKind kind, const TraceContext& identity,
        std::optional<SpanId> parent_span_id);

    /// Forward an ended span to every exporter
    void export_span(const SpanData& span);

    void flush();
    void shutdown();

    struct Stats {
        uint64_t spans_exported;      ///< Spans accepted by all exporters
        uint64_t spans_unsampled;     ///< Spans dropped (sampled flag clear)
        uint64_t export_failures;     ///< Exporter calls failing after retry
    };

    [[nodiscard]] Stats get_stats() const;

private:
    Span::EndCallback make_end_callback();

    mutable std::mutex export_mutex_;
    std::vector<std::shared_ptr<ISpanExporter>> exporters_;

    std::atomic<uint64_t> spans_exported_{0};
    std::atomic<uint64_t> spans_unsampled_{0};
    std::atomic<uint64_t> export_failures_{0};
};

} // namespace tracebridge
