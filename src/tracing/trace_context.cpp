#include "tracing/trace_context.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <random>

namespace tracebridge {

namespace {

bool is_valid_hex(std::string_view s) {
    return std::all_of(s.begin(), s.end(), utils::is_lower_hex);
}

template<size_t N>
bool is_all_zeros(const std::array<uint8_t, N>& bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

template<size_t N>
void fill_random(std::array<uint8_t, N>& out) {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    do {
        size_t pos = 0;
        while (pos < N) {
            uint64_t val = dis(gen);
            const size_t chunk = std::min(N - pos, size_t(8));
            for (size_t i = 0; i < chunk; ++i) {
                out[pos++] = static_cast<uint8_t>(val >> (i * 8));
            }
        }
    } while (is_all_zeros(out)); // all-zero ids are invalid on the wire
}

template<size_t N>
std::string bytes_to_hex(const std::array<uint8_t, N>& bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string result;
    result.reserve(N * 2);
    for (uint8_t b : bytes) {
        result += kDigits[b >> 4];
        result += kDigits[b & 0x0F];
    }
    return result;
}

// Caller has validated that hex has exactly 2*N lowercase hex chars
template<size_t N>
std::array<uint8_t, N> hex_to_array(std::string_view hex) {
    std::array<uint8_t, N> out{};
    for (size_t i = 0; i < N; ++i) {
        out[i] = static_cast<uint8_t>(
            (utils::hex_value(hex[i * 2]) << 4) | utils::hex_value(hex[i * 2 + 1]));
    }
    return out;
}

Result<TraceContext> format_error(std::string message) {
    return Result<TraceContext>::error(ErrorCategory::FORMAT_ERROR, std::move(message));
}

} // anonymous namespace

std::string to_hex(const SpanId& id) { return bytes_to_hex(id); }
std::string to_hex(const TraceId& id) { return bytes_to_hex(id); }

bool TraceContext::is_valid() const {
    return version == kVersion && !is_all_zeros(trace_id) && !is_all_zeros(span_id);
}

std::string TraceContext::trace_id_hex() const {
    return bytes_to_hex(trace_id);
}

std::string TraceContext::span_id_hex() const {
    return bytes_to_hex(span_id);
}

TraceContext TraceContext::generate() {
    TraceContext ctx;
    ctx.trace_id = generate_trace_id();
    ctx.span_id = generate_span_id();
    ctx.flags = kSampledFlag;
    return ctx;
}

TraceContext TraceContext::child() const {
    TraceContext ctx = *this;
    ctx.span_id = generate_span_id();
    return ctx;
}

Result<TraceContext> TraceContext::parse_traceparent(std::string_view header) {
    // Format: "VV-TTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTT-PPPPPPPPPPPPPPPP-FF"
    // Lengths: 2 + 1 + 32 + 1 + 16 + 1 + 2 = 55

    if (header.size() != kHeaderLength) {
        return format_error(std::format(
            "traceparent must be {} characters, got {}", kHeaderLength, header.size()));
    }

    if (header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return format_error("traceparent must have 4 hyphen-separated fields");
    }

    const auto version = header.substr(0, 2);
    const auto trace_id = header.substr(3, 32);
    const auto span_id = header.substr(36, 16);
    const auto flags = header.substr(53, 2);

    if (!is_valid_hex(version) || !is_valid_hex(trace_id)
        || !is_valid_hex(span_id) || !is_valid_hex(flags)) {
        return format_error("traceparent fields must be lowercase hex");
    }

    if (version != "00") {
        return format_error(std::format("unsupported traceparent version '{}'", version));
    }

    TraceContext ctx;
    ctx.version = kVersion;
    ctx.trace_id = hex_to_array<16>(trace_id);
    ctx.span_id = hex_to_array<8>(span_id);
    ctx.flags = hex_to_array<1>(flags)[0];

    if (is_all_zeros(ctx.trace_id)) return format_error("trace_id must not be all zeros");
    if (is_all_zeros(ctx.span_id)) return format_error("span_id must not be all zeros");

    return Result<TraceContext>::ok(ctx);
}

std::string TraceContext::to_traceparent() const {
    return std::format("{:02x}-{}-{}-{:02x}",
        version, bytes_to_hex(trace_id), bytes_to_hex(span_id), flags);
}

SpanId TraceContext::generate_span_id() {
    SpanId id;
    fill_random(id);
    return id;
}

TraceId TraceContext::generate_trace_id() {
    TraceId id;
    fill_random(id);
    return id;
}

} // namespace tracebridge
