#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"
#include "messaging/consumer.hpp"
#include "messaging/producer.hpp"
#include "metrics/metrics_registry.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>

namespace tracebridge {

namespace {

void write_error(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(nlohmann::json{{"success", false}, {"error", message}}.dump(),
                    http::kJsonContentType);
}

} // namespace

HttpServer::HttpServer(std::string service_name,
                       std::string host,
                       int port,
                       std::shared_ptr<MetricsRegistry> metrics,
                       std::shared_ptr<Producer> producer,
                       std::shared_ptr<Consumer> consumer,
                       Routes routes)
    : service_name_(std::move(service_name)),
      host_(std::move(host)),
      port_(port),
      metrics_(std::move(metrics)),
      producer_(std::move(producer)),
      consumer_(std::move(consumer)),
      routes_(std::move(routes)),
      server_(std::make_unique<httplib::Server>()) {
    register_routes(*server_);
}

HttpServer::~HttpServer() = default;

// ============================================================================
// start() / stop()
// ============================================================================

void HttpServer::start() {
    utils::log::info(std::format("Starting {} HTTP server on {}:{}", service_name_, host_, port_));
    if (!server_->listen(host_, port_)) {
        throw std::runtime_error(std::format("Failed to start HTTP server on {}:{}", host_, port_));
    }
}

void HttpServer::stop() {
    if (server_->is_running()) {
        server_->stop();
    }
    utils::log::info("Server stopped");
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

void HttpServer::register_routes(httplib::Server& svr) {
    if (producer_) {
        const auto enqueue = [this](const httplib::Request& req, httplib::Response& res) {
            handle_enqueue(req, res);
        };
        svr.Post(routes_.enqueue, enqueue);
        svr.Post(routes_.enqueue_default, enqueue);
    }
    if (metrics_) {
        svr.Get(routes_.metrics, [this](const httplib::Request& req, httplib::Response& res) {
            handle_metrics(req, res);
        });
    }
    svr.Get(routes_.health, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
}

// ============================================================================
// Handler: POST /api/enqueue/:source
// ============================================================================

void HttpServer::handle_enqueue(const httplib::Request& req, httplib::Response& res) {
    if (!producer_) {
        write_error(res, httplib::StatusCode::ServiceUnavailable_503, "no producer configured");
        return;
    }

    EnqueuedMessage message;
    const auto source_it = req.path_params.find("source");
    message.source = source_it != req.path_params.end() ? source_it->second : default_source_;
    if (message.source.empty()) {
        write_error(res, httplib::StatusCode::BadRequest_400, "missing source");
        return;
    }

    message.created_at = utils::format_timestamp(utils::now());

    if (!req.body.empty()) {
        const auto body = nlohmann::json::parse(req.body, nullptr, /*allow_exceptions=*/false);
        if (body.is_discarded() || !body.is_object()) {
            write_error(res, httplib::StatusCode::BadRequest_400, "body must be a JSON object");
            return;
        }
        const auto event_name = body.find("eventName");
        if (event_name != body.end() && event_name->is_string()) {
            message.event_name = event_name->get<std::string>();
        }
    }

    std::optional<TraceContext> parent;
    if (req.has_header(http::kTraceParentHeader)) {
        auto parsed = TraceContext::parse_traceparent(req.get_header_value(http::kTraceParentHeader));
        if (parsed.is_error()) {
            write_error(res, httplib::StatusCode::BadRequest_400,
                        std::format("invalid traceparent: {}", parsed.error_message()));
            return;
        }
        parent = parsed.value();
    }

    try {
        const auto context = producer_->enqueue(message, parent);
        const std::string traceparent = context.to_traceparent();
        res.status = httplib::StatusCode::Accepted_202;
        res.set_header(http::kTraceParentHeader, traceparent);
        res.set_content(nlohmann::json{
            {"success", true},
            {"source", message.source},
            {"traceparent", traceparent}
        }.dump(), http::kJsonContentType);
    } catch (const BrokerError& e) {
        utils::log::error(std::format("Enqueue from {} failed: {}", message.source, e.what()));
        write_error(res, httplib::StatusCode::ServiceUnavailable_503, "broker unavailable");
    }
}

// ============================================================================
// Handler: GET /metrics
// ============================================================================

void HttpServer::handle_metrics(const httplib::Request&, httplib::Response& res) {
    res.set_content(metrics_ ? metrics_->render_prometheus() : std::string{},
                    http::kPrometheusContentType);
}

// ============================================================================
// Handler: GET /health
// ============================================================================

void HttpServer::handle_health(const httplib::Request&, httplib::Response& res) {
    bool healthy = true;
    nlohmann::json checks = nlohmann::json::object();

    if (producer_) {
        const bool connected = producer_->is_connected();
        healthy = healthy && connected;
        checks["producer"] = connected ? "connected" : "disconnected";
    }
    if (consumer_) {
        const auto state = consumer_->state();
        healthy = healthy && state == ConsumerState::CONSUMING;
        checks["consumer"] = consumer_state_to_string(state);
    }

    res.status = healthy ? httplib::StatusCode::OK_200 : httplib::StatusCode::ServiceUnavailable_503;
    res.set_content(nlohmann::json{
        {"status", healthy ? "healthy" : "degraded"},
        {"service", service_name_},
        {"checks", checks}
    }.dump(), http::kJsonContentType);
}

} // namespace tracebridge
