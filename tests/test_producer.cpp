#include <catch2/catch_test_macros.hpp>
#include "diagnostics/collector.hpp"
#include "messaging/producer.hpp"
#include "mocks/mock_broker.hpp"
#include "mocks/mock_span_exporter.hpp"

#include <nlohmann/json.hpp>

using namespace tracebridge;
using tracebridge::testing::MockBroker;
using tracebridge::testing::RecordingExporter;

namespace {

struct ProducerFixture {
    std::shared_ptr<MockBroker> broker = std::make_shared<MockBroker>();
    DiagnosticRegistry registry;
    std::shared_ptr<RecordingExporter> recorder = std::make_shared<RecordingExporter>();
    std::shared_ptr<Tracer> tracer = std::make_shared<Tracer>();
    std::shared_ptr<MetricsRegistry> metrics = std::make_shared<MetricsRegistry>();

    ProducerFixture() { tracer->add_exporter(recorder); }

    ProducerConfig config() const {
        ProducerConfig cfg;
        cfg.host = "kafka:9092";
        cfg.queue = "web-queue";
        return cfg;
    }
};

} // namespace

TEST_CASE("Producer: connect declares the queue", "[producer]") {
    ProducerFixture f;
    Producer producer(f.config(), f.broker, f.registry);

    CHECK_FALSE(producer.is_connected());
    REQUIRE(producer.connect());
    CHECK(producer.is_connected());
    CHECK(f.broker->declared_queues() == std::vector<std::string>{"web-queue"});
    CHECK(f.broker->open_channels() == 1);

    // Already connected: no second connection
    REQUIRE(producer.connect());
    CHECK(f.broker->connect_attempts() == 1);
}

TEST_CASE("Producer: connect failure is reported, not thrown", "[producer]") {
    ProducerFixture f;
    f.broker->fail_next_connects(1);
    Producer producer(f.config(), f.broker, f.registry);

    CHECK_FALSE(producer.connect());
    CHECK_FALSE(producer.is_connected());
}

TEST_CASE("Producer: declare failure releases the connection", "[producer]") {
    ProducerFixture f;
    f.broker->fail_next_declares(1);
    Producer producer(f.config(), f.broker, f.registry);

    CHECK_FALSE(producer.connect());
    CHECK(f.broker->open_connections() == 0);
    CHECK(f.broker->open_channels() == 0);
}

TEST_CASE("Producer: close is idempotent", "[producer]") {
    ProducerFixture f;
    Producer producer(f.config(), f.broker, f.registry);
    REQUIRE(producer.connect());

    producer.close();
    producer.close();
    CHECK_FALSE(producer.is_connected());
    CHECK(f.broker->open_connections() == 0);
}

TEST_CASE("Producer: publish injects a traceparent header", "[producer]") {
    ProducerFixture f;
    Producer producer(f.config(), f.broker, f.registry);
    REQUIRE(producer.connect());

    const auto context = producer.publish("{\"x\":1}");

    const auto published = f.broker->published();
    REQUIRE(published.size() == 1);
    CHECK(published[0].queue == "web-queue");
    CHECK(published[0].body == "{\"x\":1}");
    REQUIRE(published[0].headers.count("traceparent") == 1);

    const auto header = published[0].headers.at("traceparent");
    CHECK(header == context.to_traceparent());
    auto parsed = TraceContext::parse_traceparent(header);
    REQUIRE(parsed.is_ok());
    CHECK(parsed.value().is_sampled());
    CHECK(producer.messages_published() == 1);
}

TEST_CASE("Producer: explicit parent keeps the trace id", "[producer]") {
    ProducerFixture f;
    Producer producer(f.config(), f.broker, f.registry);
    REQUIRE(producer.connect());

    const auto parent = TraceContext::generate();
    const auto context = producer.publish("body", parent);

    CHECK(context.trace_id == parent.trace_id);
    CHECK(context.span_id != parent.span_id);
}

TEST_CASE("Producer: collector records a producer span around publish", "[producer]") {
    ProducerFixture f;
    Collector collector(f.registry, f.tracer);
    REQUIRE(collector.subscribe(Producer::kSourceName).is_ok());

    Producer producer(f.config(), f.broker, f.registry);
    REQUIRE(producer.connect());

    const auto parent = TraceContext::generate();
    const auto context = producer.publish("body", parent);

    REQUIRE(f.recorder->span_count() == 1);
    const auto span = f.recorder->spans()[0];
    CHECK(span.name == "publish web-queue");
    CHECK(span.kind == SpanKind::PRODUCER);
    CHECK(span.status.code == StatusCode::OK);
    CHECK(span.context == context);
    REQUIRE(span.parent_span_id.has_value());
    CHECK(*span.parent_span_id == parent.span_id);
    CHECK(span.tags.at("operation") == "publish");
    CHECK(span.tags.at("host") == "kafka:9092");
    CHECK(span.tags.at("queue") == "web-queue");
}

TEST_CASE("Producer: broker failure ends the span with error and rethrows", "[producer]") {
    ProducerFixture f;
    Collector collector(f.registry, f.tracer);
    REQUIRE(collector.subscribe(Producer::kSourceName).is_ok());

    Producer producer(f.config(), f.broker, f.registry);
    REQUIRE(producer.connect());
    f.broker->set_fail_publish(true);

    CHECK_THROWS_AS(producer.publish("body"), BrokerError);

    CHECK(collector.open_span_count() == 0);
    REQUIRE(f.recorder->span_count() == 1);
    const auto span = f.recorder->spans()[0];
    CHECK(span.status.is_error());
    CHECK(span.status.description == "publish refused");
    CHECK(producer.publish_failures() == 1);
    CHECK(producer.messages_published() == 0);
}

TEST_CASE("Producer: publish while disconnected throws BrokerError", "[producer]") {
    ProducerFixture f;
    Collector collector(f.registry, f.tracer);
    REQUIRE(collector.subscribe(Producer::kSourceName).is_ok());
    Producer producer(f.config(), f.broker, f.registry);

    CHECK_THROWS_AS(producer.publish("body"), BrokerError);
    REQUIRE(f.recorder->span_count() == 1);
    CHECK(f.recorder->spans()[0].status.is_error());
}

TEST_CASE("Producer: no subscribers, no span, header still injected", "[producer]") {
    ProducerFixture f;
    Producer producer(f.config(), f.broker, f.registry);
    REQUIRE(producer.connect());

    producer.publish("body");
    CHECK(f.recorder->span_count() == 0);
    REQUIRE(f.broker->published().size() == 1);
    CHECK(f.broker->published()[0].headers.count("traceparent") == 1);
}

TEST_CASE("Producer: enqueue publishes JSON and counts Enqueued_Item", "[producer]") {
    ProducerFixture f;
    Producer producer(f.config(), f.broker, f.registry, f.metrics);
    REQUIRE(producer.connect());

    EnqueuedMessage message;
    message.source = "WebSiteA";
    message.event_name = "signup";
    message.created_at = "2024-01-01T00:00:00.000Z";

    producer.enqueue(message);
    producer.enqueue(message);

    CHECK(f.metrics->value(metrics::kEnqueuedItem, {{"Source", "WebSiteA"}}) == 2);

    const auto published = f.broker->published();
    REQUIRE(published.size() == 2);
    const auto body = nlohmann::json::parse(published[0].body);
    CHECK(body["source"] == "WebSiteA");
    CHECK(body["eventName"] == "signup");
    CHECK(body["createdAt"] == "2024-01-01T00:00:00.000Z");
}

TEST_CASE("Producer: failed enqueue is not counted", "[producer]") {
    ProducerFixture f;
    Producer producer(f.config(), f.broker, f.registry, f.metrics);
    REQUIRE(producer.connect());
    f.broker->set_fail_publish(true);

    EnqueuedMessage message;
    message.source = "WebSiteA";
    CHECK_THROWS_AS(producer.enqueue(message), BrokerError);
    CHECK(f.metrics->value(metrics::kEnqueuedItem, {{"Source", "WebSiteA"}}) == 0);
}
