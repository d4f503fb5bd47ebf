#pragma once

#include "broker/broker_client.hpp"
#include "core/utils.hpp"
#include "messaging/enqueued_message.hpp"
#include "tracing/tracer.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace tracebridge {

struct TimeApiConfig {
    std::string api_url = "http://localhost:5002";
    std::chrono::milliseconds timeout{5000};
};

/**
 * @brief Default processing step of the processor role
 *
 * For each message:
 * 1. GET {api_url}/api/time/dbtime inside a CLIENT child span, sending the
 *    child's traceparent so the time API joins the same trace
 * 2. Decode the body as EnqueuedMessage; a non-empty eventName becomes an
 *    event on the consumer span
 *
 * Throws ProcessingError on transport failure, non-2xx status or an
 * undecodable body. Usable directly as a MessageProcessor.
 */
class TimeApiProcessor {
public:
    static constexpr const char* kTimePath = "/api/time/dbtime";

    TimeApiProcessor(TimeApiConfig config, std::shared_ptr<Tracer> tracer);

    void operator()(const BrokerMessage& message, Span& span,
                    const utils::log::Scope& scope) const;

    /// @return Response body of the time API
    [[nodiscard]] std::string fetch_time(const Span& parent) const;

    /// @throws ProcessingError when the body is not a JSON object
    [[nodiscard]] static EnqueuedMessage decode(std::string_view body);

    [[nodiscard]] const std::string& endpoint() const { return endpoint_; }

private:
    TimeApiConfig config_;
    std::shared_ptr<Tracer> tracer_;
    utils::ParsedUrl url_;
    std::string endpoint_;
};

} // namespace tracebridge
