#include "tracing/tracer.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracebridge {

void Tracer::add_exporter(std::shared_ptr<ISpanExporter> exporter) {
    if (!exporter) return;
    std::lock_guard lock(export_mutex_);
    utils::log::info(std::format("Tracer: exporter registered: {}", exporter->name()));
    exporters_.push_back(std::move(exporter));
}

size_t Tracer::exporter_count() const {
    std::lock_guard lock(export_mutex_);
    return exporters_.size();
}

std::shared_ptr<Span> Tracer::start_span(std::string name, SpanKind kind,
                                         const std::optional<TraceContext>& parent) {
    std::shared_ptr<Span> span;
    if (parent) {
        span = create_span(std::move(name), kind, parent->child(), parent->span_id);
    } else {
        span = create_span(std::move(name), kind, TraceContext::generate(), std::nullopt);
    }
    span->start();
    return span;
}

std::shared_ptr<Span> Tracer::create_span(std::string name, SpanKind kind,
                                          const TraceContext& identity,
                                          std::optional<SpanId> parent_span_id) {
    return std::make_shared<Span>(std::move(name), kind, identity, parent_span_id,
                                  make_end_callback());
}

Span::EndCallback Tracer::make_end_callback() {
    std::weak_ptr<Tracer> weak = weak_from_this();
    return [weak](const SpanData& data) {
        if (auto self = weak.lock()) {
            self->export_span(data);
        }
    };
}

void Tracer::export_span(const SpanData& span) {
    if (!span.context.is_sampled()) {
        spans_unsampled_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    std::lock_guard lock(export_mutex_);
    bool all_ok = true;
    for (const auto& exporter : exporters_) {
        auto result = exporter->export_span(span);
        if (result == ExportResult::RETRYABLE_ERROR) {
            result = exporter->export_span(span);
        }
        if (result != ExportResult::SUCCESS) {
            all_ok = false;
            export_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Tracer: {} failed to export span {} ({})",
                exporter->name(), span.context.span_id_hex(), span.name));
        }
    }
    if (all_ok) {
        spans_exported_.fetch_add(1, std::memory_order_relaxed);
    }
}

void Tracer::flush() {
    std::lock_guard lock(export_mutex_);
    for (const auto& exporter : exporters_) {
        exporter->flush();
    }
}

void Tracer::shutdown() {
    std::lock_guard lock(export_mutex_);
    for (const auto& exporter : exporters_) {
        exporter->shutdown();
    }
}

Tracer::Stats Tracer::get_stats() const {
    return {
        spans_exported_.load(std::memory_order_relaxed),
        spans_unsampled_.load(std::memory_order_relaxed),
        export_failures_.load(std::memory_order_relaxed)
    };
}

} // namespace tracebridge
