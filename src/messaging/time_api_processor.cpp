#include "messaging/time_api_processor.hpp"
#include "core/error.hpp"
#include "server/http_constants.hpp"

#include <httplib.h>

#include <format>

namespace tracebridge {

TimeApiProcessor::TimeApiProcessor(TimeApiConfig config, std::shared_ptr<Tracer> tracer)
    : config_(std::move(config)),
      tracer_(tracer ? std::move(tracer) : std::make_shared<Tracer>()),
      url_(utils::parse_url(config_.api_url)) {
    std::string base = url_.path;
    while (!base.empty() && base.back() == '/') base.pop_back();
    url_.path = base + kTimePath;
    endpoint_ = url_.scheme_host_port() + url_.path;
}

void TimeApiProcessor::operator()(const BrokerMessage& message, Span& span,
                                  const utils::log::Scope& scope) const {
    const std::string time = fetch_time(span);
    scope.debug(std::format("time API returned {}", time));

    const auto payload = decode(message.body);
    if (!payload.event_name.empty()) {
        span.add_event(payload.event_name);
    }
}

std::string TimeApiProcessor::fetch_time(const Span& parent) const {
    ScopedSpan call(tracer_->start_span(std::format("GET {}", kTimePath),
                                        SpanKind::CLIENT, parent.context()));
    call->add_tag("http.method", "GET");
    call->add_tag("http.url", endpoint_);

    httplib::Client client(url_.scheme_host_port());
    client.set_connection_timeout(config_.timeout);
    client.set_read_timeout(config_.timeout);

    const httplib::Headers headers{
        {http::kTraceParentHeader, call->context().to_traceparent()}
    };

    auto res = client.Get(url_.path, headers);
    if (!res) {
        const std::string reason = std::format("time API {} unreachable: {}",
            endpoint_, httplib::to_string(res.error()));
        call->set_status(SpanStatus::error(reason));
        throw ProcessingError(reason);
    }

    call->add_tag("http.status_code", std::to_string(res->status));
    if (res->status < 200 || res->status >= 300) {
        const std::string reason = std::format("time API {} returned {}", endpoint_, res->status);
        call->set_status(SpanStatus::error(reason));
        throw ProcessingError(reason);
    }
    return res->body;
}

EnqueuedMessage TimeApiProcessor::decode(std::string_view body) {
    const auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded() || !json.is_object()) {
        throw ProcessingError("message body is not a JSON object");
    }
    try {
        return json.get<EnqueuedMessage>();
    } catch (const nlohmann::json::exception& e) {
        throw ProcessingError(std::format("invalid message payload: {}", e.what()));
    }
}

} // namespace tracebridge
