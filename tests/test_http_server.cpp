#include <catch2/catch_test_macros.hpp>
#include "server/http_server.hpp"
#include "messaging/consumer.hpp"
#include "messaging/producer.hpp"
#include "metrics/metrics_registry.hpp"
#include "mocks/mock_broker.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace tracebridge;
using tracebridge::testing::MockBroker;

namespace {

struct ServerFixture {
    std::shared_ptr<MockBroker> broker = std::make_shared<MockBroker>();
    DiagnosticRegistry registry;
    std::shared_ptr<MetricsRegistry> metrics = std::make_shared<MetricsRegistry>();
    std::shared_ptr<Producer> producer;

    ServerFixture() {
        ProducerConfig cfg;
        cfg.queue = "web-queue";
        producer = std::make_shared<Producer>(cfg, broker, registry, metrics);
    }

    HttpServer server(std::shared_ptr<Consumer> consumer = nullptr) {
        return HttpServer("tracebridge-api", "127.0.0.1", 0, metrics, producer, std::move(consumer));
    }
};

httplib::Request enqueue_request(const std::string& source, std::string body = {}) {
    httplib::Request req;
    req.method = "POST";
    req.path = "/api/enqueue/" + source;
    req.path_params["source"] = source;
    req.body = std::move(body);
    return req;
}

} // namespace

// ============================================================================
// POST /api/enqueue/:source
// ============================================================================

TEST_CASE("HttpServer: enqueue publishes and returns 202 with traceparent", "[http]") {
    ServerFixture f;
    REQUIRE(f.producer->connect());
    auto server = f.server();

    httplib::Response res;
    server.handle_enqueue(enqueue_request("WebSiteA", R"({"eventName":"signup"})"), res);

    REQUIRE(res.status == 202);
    const auto body = nlohmann::json::parse(res.body);
    CHECK(body["success"] == true);
    CHECK(body["source"] == "WebSiteA");
    const std::string traceparent = body["traceparent"];
    CHECK(res.get_header_value("traceparent") == traceparent);
    CHECK(TraceContext::parse_traceparent(traceparent).is_ok());

    const auto published = f.broker->published();
    REQUIRE(published.size() == 1);
    CHECK(published[0].headers.at("traceparent") == traceparent);
    const auto payload = nlohmann::json::parse(published[0].body);
    CHECK(payload["source"] == "WebSiteA");
    CHECK(payload["eventName"] == "signup");
    CHECK_FALSE(payload["createdAt"].get<std::string>().empty());

    CHECK(f.metrics->value(metrics::kEnqueuedItem, {{"Source", "WebSiteA"}}) == 1);
}

TEST_CASE("HttpServer: incoming traceparent becomes the parent", "[http]") {
    ServerFixture f;
    REQUIRE(f.producer->connect());
    auto server = f.server();

    auto req = enqueue_request("WebSiteA");
    req.headers.emplace("traceparent", "00-cd4262a7f7adf040bdd892959cf8c4fc-4a28d39ff0e725f2-01");
    httplib::Response res;
    server.handle_enqueue(req, res);

    REQUIRE(res.status == 202);
    auto injected = TraceContext::parse_traceparent(res.get_header_value("traceparent"));
    REQUIRE(injected.is_ok());
    CHECK(injected.value().trace_id_hex() == "cd4262a7f7adf040bdd892959cf8c4fc");
    CHECK(injected.value().span_id_hex() != "4a28d39ff0e725f2");
}

TEST_CASE("HttpServer: malformed traceparent is a 400", "[http]") {
    ServerFixture f;
    REQUIRE(f.producer->connect());
    auto server = f.server();

    auto req = enqueue_request("WebSiteA");
    req.headers.emplace("traceparent", "garbage");
    httplib::Response res;
    server.handle_enqueue(req, res);

    CHECK(res.status == 400);
    CHECK(f.broker->published().empty());
}

TEST_CASE("HttpServer: non-object body is a 400", "[http]") {
    ServerFixture f;
    REQUIRE(f.producer->connect());
    auto server = f.server();

    httplib::Response res;
    server.handle_enqueue(enqueue_request("WebSiteA", "[1,2]"), res);
    CHECK(res.status == 400);

    httplib::Response res2;
    server.handle_enqueue(enqueue_request("WebSiteA", "{not json"), res2);
    CHECK(res2.status == 400);
    CHECK(f.broker->published().empty());
}

TEST_CASE("HttpServer: broker failure is a 503", "[http]") {
    ServerFixture f;
    auto server = f.server();

    // Producer never connected
    httplib::Response res;
    server.handle_enqueue(enqueue_request("WebSiteA"), res);
    CHECK(res.status == 503);
    CHECK(f.metrics->value(metrics::kEnqueuedItem, {{"Source", "WebSiteA"}}) == 0);
}

TEST_CASE("HttpServer: default source applies to the bare enqueue route", "[http]") {
    ServerFixture f;
    REQUIRE(f.producer->connect());
    auto server = f.server();

    httplib::Request req;
    req.method = "POST";
    req.path = "/api/enqueue";
    httplib::Response res;
    server.handle_enqueue(req, res);
    CHECK(res.status == 400);

    server.set_default_source("WebSiteB");
    httplib::Response res2;
    server.handle_enqueue(req, res2);
    CHECK(res2.status == 202);
    CHECK(f.metrics->value(metrics::kEnqueuedItem, {{"Source", "WebSiteB"}}) == 1);
}

// ============================================================================
// GET /metrics, GET /health
// ============================================================================

TEST_CASE("HttpServer: metrics endpoint renders Prometheus text", "[http]") {
    ServerFixture f;
    f.metrics->increment(metrics::kEnqueuedItem, {{"Source", "WebSiteA"}}, 2);
    auto server = f.server();

    httplib::Request req;
    httplib::Response res;
    server.handle_metrics(req, res);

    CHECK(res.get_header_value("Content-Type").starts_with("text/plain"));
    CHECK(res.body.find(R"(Enqueued_Item{Source="WebSiteA"} 2 )") != std::string::npos);
}

TEST_CASE("HttpServer: health reflects producer connectivity", "[http]") {
    ServerFixture f;
    auto server = f.server();

    httplib::Request req;
    httplib::Response down;
    server.handle_health(req, down);
    CHECK(down.status == 503);
    auto body = nlohmann::json::parse(down.body);
    CHECK(body["status"] == "degraded");
    CHECK(body["checks"]["producer"] == "disconnected");

    REQUIRE(f.producer->connect());
    httplib::Response up;
    server.handle_health(req, up);
    CHECK(up.status == 200);
    body = nlohmann::json::parse(up.body);
    CHECK(body["status"] == "healthy");
    CHECK(body["service"] == "tracebridge-api");
}

TEST_CASE("HttpServer: health reports consumer state", "[http]") {
    ServerFixture f;
    auto consumer = std::make_shared<Consumer>(ConsumerConfig{}, f.broker, nullptr,
        [](const BrokerMessage&, Span&, const utils::log::Scope&) {});
    HttpServer server("tracebridge-processor", "127.0.0.1", 0, f.metrics, nullptr, consumer);

    httplib::Request req;
    httplib::Response before;
    server.handle_health(req, before);
    CHECK(before.status == 503);
    CHECK(nlohmann::json::parse(before.body)["checks"]["consumer"] == "disconnected");

    std::stop_source stop;
    REQUIRE(consumer->start(stop.get_token()));
    httplib::Response after;
    server.handle_health(req, after);
    CHECK(after.status == 200);
    CHECK(nlohmann::json::parse(after.body)["checks"]["consumer"] == "consuming");
}
