#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <string>

using namespace tracebridge;

namespace {

// Minimal config that passes validation
const std::string kValidToml = R"(
[service]
name = "tracebridge-processor"
role = "processor"

[tracing.file]
path = "spans.jsonl"
)";

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("ConfigLoader: defaults for omitted sections", "[config]") {
    auto result = ConfigLoader::load_from_string(kValidToml);
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(cfg.service.name == "tracebridge-processor");
    CHECK(parse_service_role(cfg.service.role) == ServiceRole::PROCESSOR);
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.broker.host == "localhost:9092");
    CHECK(cfg.broker.queue == "web-queue");
    CHECK(cfg.consumer.retry_backoff_ms == 3000);
    CHECK(cfg.consumer.drain_timeout_ms == 5000);
    CHECK(cfg.consumer.api_url == "http://localhost:5002");
    CHECK(cfg.tracing.enabled);
    CHECK(cfg.tracing.zipkin.url.empty());
    CHECK(cfg.tracing.file.path == "spans.jsonl");
    CHECK(cfg.tracing.file.max_file_size_mb == 100);
    CHECK(cfg.metrics.endpoint == "/metrics");
    CHECK(cfg.server.port == 8080);
}

TEST_CASE("ConfigLoader: full config", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[service]
name = "tracebridge-api"
role = "api"

[logging]
level = "debug"

[broker]
host = "kafka:9092"
queue = "events"
client_id = "api-1"
publish_timeout_ms = 2000

[consumer]
retry_backoff_ms = 500
api_url = "http://timeapi:5002"

[producer]
source = "WebSiteB"

[tracing.zipkin]
url = "http://zipkin:9411/api/v2/spans"
batch_size = 10
max_retries = 2
max_buffered_spans = 500
flush_interval_ms = 250

[metrics]
endpoint = "/prom"

[server]
host = "127.0.0.1"
port = 9090
)");
    REQUIRE(result.success);
    const auto& cfg = result.config;

    CHECK(parse_service_role(cfg.service.role) == ServiceRole::API);
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.broker.host == "kafka:9092");
    CHECK(cfg.broker.queue == "events");
    CHECK(cfg.broker.client_id == "api-1");
    CHECK(cfg.broker.publish_timeout_ms == 2000);
    CHECK(cfg.consumer.retry_backoff_ms == 500);
    CHECK(cfg.consumer.api_url == "http://timeapi:5002");
    CHECK(cfg.producer.source == "WebSiteB");
    CHECK(cfg.tracing.zipkin.url == "http://zipkin:9411/api/v2/spans");
    CHECK(cfg.tracing.zipkin.batch_size == 10);
    CHECK(cfg.tracing.zipkin.max_retries == 2);
    CHECK(cfg.tracing.zipkin.max_buffered_spans == 500);
    CHECK(cfg.tracing.zipkin.flush_interval_ms == 250);
    CHECK(cfg.metrics.endpoint == "/prom");
    CHECK(cfg.server.host == "127.0.0.1");
    CHECK(cfg.server.port == 9090);
}

TEST_CASE("ConfigLoader: environment variable expansion", "[config]") {
    ::setenv("TRACEBRIDGE_TEST_BROKER", "broker-1:9092", 1);
    ::setenv("TRACEBRIDGE_TEST_ZIPKIN", "http://zipkin:9411/api/v2/spans", 1);

    auto result = ConfigLoader::load_from_string(R"(
[broker]
host = "${TRACEBRIDGE_TEST_BROKER}"

[tracing.zipkin]
url = "${TRACEBRIDGE_TEST_ZIPKIN}"
)");
    ::unsetenv("TRACEBRIDGE_TEST_BROKER");
    ::unsetenv("TRACEBRIDGE_TEST_ZIPKIN");

    REQUIRE(result.success);
    CHECK(result.config.broker.host == "broker-1:9092");
    CHECK(result.config.tracing.zipkin.url == "http://zipkin:9411/api/v2/spans");
}

TEST_CASE("ConfigLoader: unset variable falls back to the default host", "[config]") {
    ::unsetenv("TRACEBRIDGE_TEST_UNSET");
    auto result = ConfigLoader::load_from_string(R"(
[broker]
host = "${TRACEBRIDGE_TEST_UNSET}"

[consumer]
api_url = "${TRACEBRIDGE_TEST_UNSET}"

[tracing.file]
path = "spans.jsonl"
)");
    REQUIRE(result.success);
    CHECK(result.config.broker.host == "localhost:9092");
    CHECK(result.config.consumer.api_url == "http://localhost:5002");
}

TEST_CASE("ConfigLoader: unclosed substitution is an error", "[config]") {
    auto result = ConfigLoader::load_from_string(R"(
[broker]
host = "${BROKEN"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("ConfigLoader: invalid TOML", "[config]") {
    auto result = ConfigLoader::load_from_string("[service\nname = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/tracebridge.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigLoader: tracing enabled without an exporter is rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[tracing]
enabled = true
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("no exporter was configured") != std::string::npos);
}

TEST_CASE("ConfigLoader: tracing disabled needs no exporter", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[tracing]
enabled = false
)");
    CHECK(result.success);
}

TEST_CASE("ConfigLoader: unknown role is rejected", "[config][validation]") {
    auto result = ConfigLoader::load_from_string(R"(
[service]
role = "worker"

[tracing.file]
path = "spans.jsonl"
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("service.role") != std::string::npos);

    TraceBridgeConfig cfg;
    cfg.service.role = "worker";
    cfg.tracing.file.path = "spans.jsonl";
    CHECK(ConfigLoader::validate_config(cfg).size() == 1);
}

TEST_CASE("ConfigLoader: validation errors accumulate", "[config][validation]") {
    TraceBridgeConfig cfg;
    cfg.server.port = 70000;
    cfg.broker.queue = "";
    cfg.consumer.retry_backoff_ms = 0;
    cfg.tracing.enabled = false;
    cfg.metrics.endpoint = "metrics";

    const auto errors = ConfigLoader::validate_config(cfg);
    CHECK(errors.size() == 4);

    auto result = ConfigLoader::load_from_string(R"(
[server]
port = 0

[broker]
queue = ""

[tracing]
enabled = false
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("server.port") != std::string::npos);
    CHECK(result.error_message.find("broker.queue") != std::string::npos);
}

TEST_CASE("ConfigLoader: zipkin settings are validated", "[config][validation]") {
    TraceBridgeConfig cfg;
    cfg.tracing.zipkin.url = "http://zipkin:9411/api/v2/spans";
    cfg.tracing.zipkin.batch_size = 0;
    cfg.tracing.zipkin.max_retries = 0;

    CHECK(ConfigLoader::validate_config(cfg).size() == 2);

    cfg.tracing.zipkin.batch_size = 100;
    cfg.tracing.zipkin.max_retries = 3;
    cfg.tracing.zipkin.max_buffered_spans = 10;
    cfg.tracing.zipkin.flush_interval_ms = 0;
    CHECK(ConfigLoader::validate_config(cfg).size() == 2);
}

TEST_CASE("ConfigLoader: default config is valid once an exporter is set", "[config][validation]") {
    TraceBridgeConfig cfg;
    CHECK(ConfigLoader::validate_config(cfg).size() == 1);
    cfg.tracing.file.path = "spans.jsonl";
    CHECK(ConfigLoader::validate_config(cfg).empty());
}

TEST_CASE("ServiceRole: parse is case-insensitive", "[config]") {
    CHECK(parse_service_role("API") == ServiceRole::API);
    CHECK(parse_service_role("Processor") == ServiceRole::PROCESSOR);
    CHECK_FALSE(parse_service_role("worker").has_value());
    CHECK(std::string(service_role_to_string(ServiceRole::API)) == "api");
}
