#pragma once

#include "tracing/span.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tracebridge {

/**
 * @brief Zipkin v2 JSON encoding of ended spans
 *
 * One span:
 *   {"traceId":"...","id":"...","parentId":"...","name":"publish web-queue",
 *    "kind":"PRODUCER","timestamp":<epoch us>,"duration":<us>,
 *    "localEndpoint":{"serviceName":"..."},
 *    "annotations":[{"timestamp":<epoch us>,"value":"event"}],
 *    "tags":{"queue":"web-queue","error":"..."}}
 *
 * INTERNAL spans carry no "kind" (Zipkin has no such value). An error
 * status is written as the "error" tag, as Zipkin expects.
 */
[[nodiscard]] nlohmann::json to_zipkin_json(const SpanData& span, const std::string& service_name);

[[nodiscard]] nlohmann::json to_zipkin_json(const std::vector<SpanData>& spans,
                                            const std::string& service_name);

} // namespace tracebridge
