#pragma once

#include <memory>
#include <string>
#include <utility>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace tracebridge {

class Consumer;
class MetricsRegistry;
class Producer;

/**
 * @brief HTTP front end for both service roles
 *
 * Routes:
 * - POST /api/enqueue/:source   (API role, needs a Producer)
 * - POST /api/enqueue           same, Source = default_source
 *     body (optional): {"eventName": "..."}
 *     header (optional): traceparent, used as the explicit parent
 *     202 {"source":..,"traceparent":..}, 400 bad traceparent or body,
 *     503 broker unavailable
 * - GET  /metrics               Prometheus text exposition
 * - GET  /health                200 healthy / 503 degraded
 */
class HttpServer {
public:
    struct Routes {
        Routes() {}
        std::string enqueue = "/api/enqueue/:source";
        std::string enqueue_default = "/api/enqueue";
        std::string metrics = "/metrics";
        std::string health = "/health";
    };

    HttpServer(std::string service_name,
               std::string host,
               int port,
               std::shared_ptr<MetricsRegistry> metrics,
               std::shared_ptr<Producer> producer = nullptr,
               std::shared_ptr<Consumer> consumer = nullptr,
               Routes routes = Routes{});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Blocks serving requests until stop()
    /// @throws std::runtime_error when the port cannot be bound
    void start();
    void stop();

    [[nodiscard]] bool is_running() const;

    /// Source label used when the request path names none
    void set_default_source(std::string source) { default_source_ = std::move(source); }

    // Handler methods (one per endpoint)
    void handle_enqueue(const httplib::Request& req, httplib::Response& res);
    void handle_metrics(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

private:
    void register_routes(httplib::Server& svr);

    std::string service_name_;
    std::string host_;
    int port_;
    std::shared_ptr<MetricsRegistry> metrics_;
    std::shared_ptr<Producer> producer_;
    std::shared_ptr<Consumer> consumer_;
    Routes routes_;
    std::string default_source_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace tracebridge
