#include "tracing/span_json.hpp"
#include "core/utils.hpp"

namespace tracebridge {

nlohmann::json to_zipkin_json(const SpanData& span, const std::string& service_name) {
    nlohmann::json j;
    j["traceId"] = span.context.trace_id_hex();
    j["id"] = span.context.span_id_hex();
    if (span.parent_span_id) {
        j["parentId"] = to_hex(*span.parent_span_id);
    }
    j["name"] = span.name;
    if (span.kind != SpanKind::INTERNAL) {
        j["kind"] = span_kind_to_string(span.kind);
    }
    j["timestamp"] = utils::to_epoch_us(span.start_time);
    j["duration"] = span.duration_us();
    j["localEndpoint"] = {{"serviceName", service_name}};

    if (!span.events.empty()) {
        auto annotations = nlohmann::json::array();
        for (const auto& event : span.events) {
            annotations.push_back({
                {"timestamp", utils::to_epoch_us(event.timestamp)},
                {"value", event.name}
            });
        }
        j["annotations"] = std::move(annotations);
    }

    auto tags = nlohmann::json::object();
    for (const auto& [key, value] : span.tags) {
        tags[key] = value;
    }
    if (span.status.is_error()) {
        tags["error"] = span.status.description.empty() ? "true" : span.status.description;
    }
    if (!tags.empty()) {
        j["tags"] = std::move(tags);
    }
    return j;
}

nlohmann::json to_zipkin_json(const std::vector<SpanData>& spans, const std::string& service_name) {
    auto arr = nlohmann::json::array();
    for (const auto& span : spans) {
        arr.push_back(to_zipkin_json(span, service_name));
    }
    return arr;
}

} // namespace tracebridge
