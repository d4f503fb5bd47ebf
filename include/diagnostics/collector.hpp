#pragma once

#include "core/error.hpp"
#include "diagnostics/diagnostic_registry.hpp"
#include "tracing/tracer.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tracebridge {

/**
 * @brief Bridges diagnostic events into exported spans
 *
 *   [Producer] --START/STOP/EXCEPTION--> [DiagnosticRegistry] --> [Collector]
 *                                                                     |
 *                                              Tracer::create_span / end
 *                                                                     v
 *                                                        [Exporters: Zipkin, File]
 *
 * START opens a span keyed by the event's correlation id, STOP ends it OK,
 * EXCEPTION ends it with error(description). Ending triggers export
 * through this collector's Tracer.
 *
 * Several collectors may share one registry; each sees only the sources it
 * subscribed to. dispose() is idempotent and safe to race; spans still open
 * at that point end with error("collector disposed").
 */
class Collector {
public:
    Collector(DiagnosticRegistry& registry, std::shared_ptr<Tracer> tracer);
    ~Collector();

    Collector(const Collector&) = delete;
    Collector& operator=(const Collector&) = delete;

    /**
     * @brief Subscribe to a source with the span-building handlers
     * @return Subscription id, DISPOSAL_ERROR after dispose()
     */
    [[nodiscard]] Result<uint64_t> subscribe(const std::string& source);

    /// Subscribe with a caller-supplied handler table
    [[nodiscard]] Result<uint64_t> subscribe(const std::string& source, EventHandlerTable handlers);

    /**
     * @brief Unsubscribe everything and end open spans
     * @return true only for the call that performed the teardown
     */
    bool dispose();

    [[nodiscard]] bool is_disposed() const {
        return state_->disposed.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t subscription_count() const;
    [[nodiscard]] size_t open_span_count() const;

    /// Open span for a correlation id (nullptr once stopped or unknown)
    [[nodiscard]] std::shared_ptr<Span> find_span(uint64_t correlation_id) const;

    [[nodiscard]] const std::shared_ptr<Tracer>& tracer() const { return state_->tracer; }

private:
    // Shared with the handler closures, which the registry may still be
    // invoking after this Collector is gone.
    struct SharedState {
        std::shared_ptr<Tracer> tracer;
        std::atomic<bool> disposed{false};
        mutable std::mutex spans_mutex;
        std::unordered_map<uint64_t, std::shared_ptr<Span>> open_spans;
    };

    static EventHandlerTable span_handlers(const std::shared_ptr<SharedState>& state);
    static void on_start(SharedState& state, const DiagnosticEvent& event);
    static void on_stop(SharedState& state, const DiagnosticEvent& event);
    static void on_exception(SharedState& state, const DiagnosticEvent& event);
    static std::shared_ptr<Span> take_span(SharedState& state, uint64_t correlation_id);

    DiagnosticRegistry& registry_;
    std::shared_ptr<SharedState> state_;

    mutable std::mutex subscriptions_mutex_;
    std::vector<Subscription> subscriptions_;
};

} // namespace tracebridge
