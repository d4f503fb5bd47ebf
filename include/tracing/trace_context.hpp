#pragma once

#include "core/error.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace tracebridge {

using TraceId = std::array<uint8_t, 16>;
using SpanId = std::array<uint8_t, 8>;

/// Metadata key carrying the serialized trace context on every message
inline constexpr std::string_view kTraceParentHeader = "traceparent";

/**
 * @brief W3C Trace Context (traceparent)
 *
 * Canonical form: "00-{trace_id}-{span_id}-{flags}"
 *   version:  2 hex chars, only "00" is supported
 *   trace_id: 32 lowercase hex chars (128-bit)
 *   span_id:  16 lowercase hex chars (64-bit)
 *   flags:    2 hex chars (bit 0 = sampled)
 *
 * Immutable value type. The parent span id of a child context is recorded
 * on the Span, not here.
 */
struct TraceContext {
    static constexpr uint8_t kVersion = 0x00;
    static constexpr uint8_t kSampledFlag = 0x01;
    static constexpr size_t kHeaderLength = 55;

    uint8_t version = kVersion;
    TraceId trace_id{};
    SpanId span_id{};
    uint8_t flags = kSampledFlag;

    [[nodiscard]] bool is_valid() const;
    [[nodiscard]] bool is_sampled() const { return (flags & kSampledFlag) != 0; }

    [[nodiscard]] std::string trace_id_hex() const;
    [[nodiscard]] std::string span_id_hex() const;

    /// Fresh root context: random trace_id + span_id, sampled, version 00
    [[nodiscard]] static TraceContext generate();

    /// Same trace_id and flags, new random span_id
    [[nodiscard]] TraceContext child() const;

    /// Parse "00-{trace_id}-{span_id}-{flags}". Fails with FORMAT_ERROR.
    [[nodiscard]] static Result<TraceContext> parse_traceparent(std::string_view header);

    /// Serialize to traceparent header value (inverse of parse_traceparent)
    [[nodiscard]] std::string to_traceparent() const;

    [[nodiscard]] static SpanId generate_span_id();
    [[nodiscard]] static TraceId generate_trace_id();

    bool operator==(const TraceContext&) const = default;
};

[[nodiscard]] std::string to_hex(const SpanId& id);
[[nodiscard]] std::string to_hex(const TraceId& id);

} // namespace tracebridge
