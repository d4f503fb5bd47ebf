#include <catch2/catch_test_macros.hpp>
#include "tracing/file_span_exporter.hpp"
#include "tracing/span_json.hpp"
#include "tracing/tracer.hpp"
#include "tracing/zipkin_exporter.hpp"
#include "core/utils.hpp"
#include "mocks/mock_span_exporter.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tracebridge;
using tracebridge::testing::RecordingExporter;

namespace {

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

SpanData sample_span() {
    auto parent = TraceContext::parse_traceparent(
        "00-cd4262a7f7adf040bdd892959cf8c4fc-4a28d39ff0e725f2-01");
    SpanData span;
    span.context = parent.value().child();
    span.parent_span_id = parent.value().span_id;
    span.name = "process web-queue";
    span.kind = SpanKind::CONSUMER;
    span.tags = {{"queue", "web-queue"}};
    span.start_time = std::chrono::system_clock::time_point(std::chrono::microseconds(1'700'000'000'000'000));
    span.end_time = span.start_time + std::chrono::microseconds(2500);
    span.events.push_back(SpanEvent{"signup", span.start_time + std::chrono::microseconds(100)});
    span.status = SpanStatus::ok();
    return span;
}

/// Local Zipkin collector that can be made slow
class ZipkinStub {
public:
    explicit ZipkinStub(std::chrono::milliseconds delay = std::chrono::milliseconds(0))
        : delay_(delay) {
        server_.Post("/api/v2/spans", [this](const httplib::Request& req, httplib::Response& res) {
            std::this_thread::sleep_for(delay_);
            const auto body = nlohmann::json::parse(req.body);
            spans_received_.fetch_add(body.size());
            requests_.fetch_add(1);
            res.status = 202;
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~ZipkinStub() {
        server_.stop();
        thread_.join();
    }

    [[nodiscard]] std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_) + "/api/v2/spans";
    }
    [[nodiscard]] size_t spans_received() const { return spans_received_.load(); }
    [[nodiscard]] size_t requests() const { return requests_.load(); }

private:
    httplib::Server server_;
    std::chrono::milliseconds delay_;
    int port_ = 0;
    std::thread thread_;
    std::atomic<size_t> spans_received_{0};
    std::atomic<size_t> requests_{0};
};

ZipkinExporter::Config zipkin_config(const std::string& url) {
    ZipkinExporter::Config cfg;
    cfg.url = url;
    cfg.timeout = std::chrono::milliseconds(2000);
    cfg.max_retries = 1;
    cfg.batch_size = 1;
    return cfg;
}

} // namespace

// ============================================================================
// Zipkin JSON
// ============================================================================

TEST_CASE("Zipkin JSON: span fields", "[exporter][zipkin]") {
    const auto span = sample_span();
    const auto j = to_zipkin_json(span, "tracebridge-processor");

    CHECK(j["traceId"] == "cd4262a7f7adf040bdd892959cf8c4fc");
    CHECK(j["id"] == span.context.span_id_hex());
    CHECK(j["parentId"] == "4a28d39ff0e725f2");
    CHECK(j["name"] == "process web-queue");
    CHECK(j["kind"] == "CONSUMER");
    CHECK(j["timestamp"] == 1'700'000'000'000'000ULL);
    CHECK(j["duration"] == 2500);
    CHECK(j["localEndpoint"]["serviceName"] == "tracebridge-processor");
    CHECK(j["tags"]["queue"] == "web-queue");
    REQUIRE(j["annotations"].size() == 1);
    CHECK(j["annotations"][0]["value"] == "signup");
    CHECK_FALSE(j["tags"].contains("error"));
}

TEST_CASE("Zipkin JSON: root internal span omits parent and kind", "[exporter][zipkin]") {
    SpanData span;
    span.context = TraceContext::generate();
    span.name = "root";
    span.kind = SpanKind::INTERNAL;

    const auto j = to_zipkin_json(span, "svc");
    CHECK_FALSE(j.contains("parentId"));
    CHECK_FALSE(j.contains("kind"));
    CHECK_FALSE(j.contains("annotations"));
    CHECK_FALSE(j.contains("tags"));
}

TEST_CASE("Zipkin JSON: error status becomes error tag", "[exporter][zipkin]") {
    auto span = sample_span();
    span.status = SpanStatus::error("time API unreachable");

    const auto j = to_zipkin_json(span, "svc");
    CHECK(j["tags"]["error"] == "time API unreachable");
}

TEST_CASE("Zipkin JSON: batch is an array", "[exporter][zipkin]") {
    const auto j = to_zipkin_json(std::vector<SpanData>{sample_span(), sample_span()}, "svc");
    REQUIRE(j.is_array());
    CHECK(j.size() == 2);
}

TEST_CASE("ZipkinExporter: unreachable collector is counted, never thrown", "[exporter][zipkin]") {
    auto cfg = zipkin_config("http://127.0.0.1:1/api/v2/spans");
    cfg.timeout = std::chrono::milliseconds(200);
    ZipkinExporter exporter(cfg);

    CHECK(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
    exporter.flush();
    CHECK(exporter.send_failures() == 1);
    CHECK(exporter.spans_dropped() == 1);
    CHECK(exporter.buffered() == 0);
    CHECK(exporter.name() == "zipkin:http://127.0.0.1:1/api/v2/spans");

    exporter.shutdown();
    CHECK(exporter.export_span(sample_span()) == ExportResult::RETRYABLE_ERROR);
}

TEST_CASE("ZipkinExporter: posts spans to the collector", "[exporter][zipkin]") {
    ZipkinStub stub;
    ZipkinExporter exporter(zipkin_config(stub.url()));

    REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
    REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
    exporter.flush();

    CHECK(stub.spans_received() == 2);
    CHECK(exporter.batches_sent() == 2);
    CHECK(exporter.send_failures() == 0);
}

TEST_CASE("ZipkinExporter: partial batch waits for flush", "[exporter][zipkin]") {
    ZipkinStub stub;
    auto cfg = zipkin_config(stub.url());
    cfg.batch_size = 3;
    cfg.flush_interval = std::chrono::milliseconds(60'000);
    ZipkinExporter exporter(cfg);

    REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
    REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
    CHECK(exporter.buffered() == 2);
    CHECK(stub.requests() == 0);

    exporter.flush();
    CHECK(exporter.buffered() == 0);
    CHECK(stub.requests() == 1);
    CHECK(stub.spans_received() == 2);
}

TEST_CASE("ZipkinExporter: full queue refuses new spans", "[exporter][zipkin]") {
    ZipkinStub stub(std::chrono::milliseconds(500));
    auto cfg = zipkin_config(stub.url());
    cfg.max_buffered_spans = 2;
    ZipkinExporter exporter(cfg);

    // The sender holds at most one span in flight while the collector stalls
    int accepted = 0;
    for (int i = 0; i < 4; ++i) {
        if (exporter.export_span(sample_span()) == ExportResult::SUCCESS) ++accepted;
    }
    CHECK(accepted <= 3);
    CHECK(exporter.spans_dropped() == static_cast<uint64_t>(4 - accepted));

    exporter.flush();
    CHECK(stub.spans_received() == static_cast<size_t>(accepted));
}

TEST_CASE("ZipkinExporter: slow collector does not delay Span::end", "[exporter][zipkin][tracer]") {
    ZipkinStub stub(std::chrono::milliseconds(500));
    auto exporter = std::make_shared<ZipkinExporter>(zipkin_config(stub.url()));
    auto tracer = std::make_shared<Tracer>();
    tracer->add_exporter(exporter);

    auto first = tracer->start_span("first", SpanKind::CONSUMER);
    auto second = tracer->start_span("second", SpanKind::CONSUMER);

    utils::Timer timer;
    first->end();
    second->end();
    CHECK(timer.elapsed_ms() < std::chrono::milliseconds(250));
    CHECK(tracer->get_stats().spans_exported == 2);

    tracer->flush();
    CHECK(stub.spans_received() == 2);
}

// ============================================================================
// File exporter
// ============================================================================

TEST_CASE("FileSpanExporter: writes one JSON object per line", "[exporter][file]") {
    const auto path = temp_path("tracebridge_spans_test.jsonl");
    std::filesystem::remove(path);
    {
        FileSpanExporter::Config cfg;
        cfg.output_file = path;
        cfg.service_name = "svc";
        FileSpanExporter exporter(cfg);

        REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
        REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
        CHECK(exporter.spans_written() == 2);
        exporter.flush();
    }

    const auto lines = read_lines(path);
    REQUIRE(lines.size() == 2);
    const auto j = nlohmann::json::parse(lines[0]);
    CHECK(j["traceId"] == "cd4262a7f7adf040bdd892959cf8c4fc");
    CHECK(j["localEndpoint"]["serviceName"] == "svc");
    std::filesystem::remove(path);
}

TEST_CASE("FileSpanExporter: rotates when the size limit is reached", "[exporter][file]") {
    const auto path = temp_path("tracebridge_spans_rotate.jsonl");
    const auto rotated = path + ".1";
    std::filesystem::remove(path);
    std::filesystem::remove(rotated);
    {
        FileSpanExporter::Config cfg;
        cfg.output_file = path;
        cfg.max_file_size_bytes = 1;
        FileSpanExporter exporter(cfg);

        REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
        REQUIRE(exporter.export_span(sample_span()) == ExportResult::SUCCESS);
        exporter.shutdown();
    }

    CHECK(std::filesystem::exists(rotated));
    CHECK(read_lines(rotated).size() == 1);
    CHECK(read_lines(path).size() == 1);
    std::filesystem::remove(path);
    std::filesystem::remove(rotated);
}

TEST_CASE("FileSpanExporter: unopenable path throws", "[exporter][file]") {
    FileSpanExporter::Config cfg;
    cfg.output_file = "/nonexistent-dir/tracebridge/spans.jsonl";
    CHECK_THROWS_AS(FileSpanExporter{cfg}, std::runtime_error);
}

// ============================================================================
// Tracer
// ============================================================================

TEST_CASE("Tracer: ended span reaches every exporter once", "[tracer]") {
    auto tracer = std::make_shared<Tracer>();
    auto a = std::make_shared<RecordingExporter>("a");
    auto b = std::make_shared<RecordingExporter>("b");
    tracer->add_exporter(a);
    tracer->add_exporter(b);

    auto span = tracer->start_span("publish web-queue", SpanKind::PRODUCER);
    CHECK(span->state() == SpanState::STARTED);
    span->end();
    span->end();

    CHECK(a->span_count() == 1);
    CHECK(b->span_count() == 1);
    CHECK(tracer->get_stats().spans_exported == 1);
}

TEST_CASE("Tracer: start_span with parent creates a child", "[tracer]") {
    auto tracer = std::make_shared<Tracer>();
    auto recorder = std::make_shared<RecordingExporter>();
    tracer->add_exporter(recorder);

    const auto parent = TraceContext::generate();
    tracer->start_span("child", SpanKind::CONSUMER, parent)->end();

    auto exported = recorder->find("child");
    REQUIRE(exported.has_value());
    CHECK(exported->context.trace_id == parent.trace_id);
    REQUIRE(exported->parent_span_id.has_value());
    CHECK(*exported->parent_span_id == parent.span_id);
}

TEST_CASE("Tracer: retryable failure is retried once", "[tracer]") {
    auto tracer = std::make_shared<Tracer>();
    auto recorder = std::make_shared<RecordingExporter>();
    tracer->add_exporter(recorder);

    recorder->fail_next(1);
    tracer->start_span("retried", SpanKind::INTERNAL)->end();
    CHECK(recorder->export_calls() == 2);
    CHECK(recorder->span_count() == 1);
    CHECK(tracer->get_stats().export_failures == 0);

    recorder->fail_next(2);
    tracer->start_span("dropped", SpanKind::INTERNAL)->end();
    CHECK(recorder->span_count() == 1);
    CHECK(tracer->get_stats().export_failures == 1);
}

TEST_CASE("Tracer: unsampled spans are not exported", "[tracer]") {
    auto tracer = std::make_shared<Tracer>();
    auto recorder = std::make_shared<RecordingExporter>();
    tracer->add_exporter(recorder);

    auto parent = TraceContext::parse_traceparent(
        "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-00");
    REQUIRE(parent.is_ok());
    tracer->start_span("unsampled", SpanKind::CONSUMER, parent.value())->end();

    CHECK(recorder->span_count() == 0);
    CHECK(tracer->get_stats().spans_unsampled == 1);
}

TEST_CASE("Tracer: span outliving its tracer ends quietly", "[tracer]") {
    auto recorder = std::make_shared<RecordingExporter>();
    std::shared_ptr<Span> span;
    {
        auto tracer = std::make_shared<Tracer>();
        tracer->add_exporter(recorder);
        span = tracer->start_span("orphan", SpanKind::INTERNAL);
    }
    CHECK(span->end());
    CHECK(recorder->span_count() == 0);
}

TEST_CASE("Tracer: flush and shutdown reach exporters", "[tracer]") {
    auto tracer = std::make_shared<Tracer>();
    auto recorder = std::make_shared<RecordingExporter>();
    tracer->add_exporter(recorder);
    tracer->add_exporter(nullptr);

    tracer->flush();
    tracer->shutdown();
    CHECK(tracer->exporter_count() == 1);
    CHECK(recorder->flush_count() == 1);
    CHECK(recorder->shutdown_count() == 1);
}
