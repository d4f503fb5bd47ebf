#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "broker/kafka_broker_client.hpp"
#include "diagnostics/collector.hpp"
#include "diagnostics/diagnostic_registry.hpp"
#include "messaging/consumer.hpp"
#include "messaging/producer.hpp"
#include "messaging/time_api_processor.hpp"
#include "metrics/metrics_registry.hpp"
#include "server/http_server.hpp"
#include "tracing/file_span_exporter.hpp"
#include "tracing/tracer.hpp"
#include "tracing/zipkin_exporter.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>
#include <thread>

using namespace tracebridge;

// Global instances for signal handling. Destroyed in reverse order, so the
// registry is declared first and outlives the producer and collector.
std::shared_ptr<DiagnosticRegistry> g_diagnostics;
std::shared_ptr<HttpServer> g_server;
std::shared_ptr<Consumer> g_consumer;
std::unique_ptr<std::jthread> g_consumer_thread;
std::shared_ptr<Producer> g_producer;
std::shared_ptr<Collector> g_collector;
std::shared_ptr<Tracer> g_tracer;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Abort a reconnect loop still in its backoff wait
    if (g_consumer_thread) {
        g_consumer_thread->request_stop();
    }

    // Drain in-flight message handlers, then release broker resources
    if (g_consumer) {
        g_consumer->stop();
    }
    if (g_producer) {
        g_producer->close();
    }

    // End spans still open and push buffered spans out
    if (g_collector) {
        g_collector->dispose();
    }
    if (g_tracer) {
        g_tracer->flush();
        g_tracer->shutdown();
    }

    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("tracebridge starting...");

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/tracebridge.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/6] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));
        const auto role = parse_service_role(cfg.service.role).value_or(ServiceRole::PROCESSOR);
        utils::log::info(std::format("  service={} role={} broker={} queue={}",
            cfg.service.name, service_role_to_string(role), cfg.broker.host, cfg.broker.queue));

        // Tracing
        g_tracer = std::make_shared<Tracer>();
        if (cfg.tracing.enabled) {
            if (!cfg.tracing.zipkin.url.empty()) {
                ZipkinExporter::Config zipkin_cfg;
                zipkin_cfg.url = cfg.tracing.zipkin.url;
                zipkin_cfg.service_name = cfg.service.name;
                zipkin_cfg.timeout = std::chrono::milliseconds(cfg.tracing.zipkin.timeout_ms);
                zipkin_cfg.max_retries = cfg.tracing.zipkin.max_retries;
                zipkin_cfg.batch_size = cfg.tracing.zipkin.batch_size;
                zipkin_cfg.max_buffered_spans = cfg.tracing.zipkin.max_buffered_spans;
                zipkin_cfg.flush_interval = std::chrono::milliseconds(cfg.tracing.zipkin.flush_interval_ms);
                g_tracer->add_exporter(std::make_shared<ZipkinExporter>(zipkin_cfg));
            }
            if (!cfg.tracing.file.path.empty()) {
                FileSpanExporter::Config file_cfg;
                file_cfg.output_file = cfg.tracing.file.path;
                file_cfg.service_name = cfg.service.name;
                file_cfg.max_file_size_bytes = cfg.tracing.file.max_file_size_mb * 1024 * 1024;
                g_tracer->add_exporter(std::make_shared<FileSpanExporter>(file_cfg));
            }
        }
        utils::log::info(std::format("[2/6] Tracing: {} ({} exporters)",
            cfg.tracing.enabled ? "enabled" : "disabled", g_tracer->exporter_count()));

        // Diagnostics
        g_diagnostics = std::make_shared<DiagnosticRegistry>();
        g_collector = std::make_shared<Collector>(*g_diagnostics, g_tracer);
        if (cfg.tracing.enabled) {
            auto subscribed = g_collector->subscribe(Producer::kSourceName);
            if (subscribed.is_error()) {
                utils::log::warn(subscribed.error_message());
            }
        }
        utils::log::info(std::format("[3/6] Diagnostics: {} subscription(s)",
            g_collector->subscription_count()));

        // Metrics
        auto metrics = std::make_shared<MetricsRegistry>();
        metrics->describe(metrics::kEnqueuedItem, "Messages accepted for publishing");
        metrics->describe(metrics::kMessagesProcessed, "Messages processed successfully");
        metrics->describe(metrics::kProcessingFailed, "Messages whose processing failed");
        metrics->describe(metrics::kTraceHeaderRejected, "Messages rejected for a missing or malformed traceparent");
        utils::log::info(std::format("[4/6] Metrics: {}",
            cfg.metrics.enabled ? cfg.metrics.endpoint : "disabled"));

        // Broker
        KafkaClientConfig kafka_cfg;
        kafka_cfg.client_id = cfg.broker.client_id;
        kafka_cfg.group_id = cfg.consumer.group_id;
        kafka_cfg.metadata_timeout_ms = cfg.broker.metadata_timeout_ms;
        kafka_cfg.publish_timeout_ms = cfg.broker.publish_timeout_ms;
        kafka_cfg.poll_timeout_ms = cfg.consumer.poll_timeout_ms;
        auto broker = std::make_shared<KafkaBrokerClient>(kafka_cfg);

        if (role == ServiceRole::API) {
            ProducerConfig producer_cfg;
            producer_cfg.host = cfg.broker.host;
            producer_cfg.queue = cfg.broker.queue;
            g_producer = std::make_shared<Producer>(producer_cfg, broker, *g_diagnostics, metrics);
            if (!g_producer->connect()) {
                utils::log::warn("Producer not connected; enqueue requests will return 503");
            }
            utils::log::info(std::format("[5/6] Producer: {} -> {}", cfg.broker.host, cfg.broker.queue));
        } else {
            TimeApiConfig time_cfg;
            time_cfg.api_url = cfg.consumer.api_url;
            time_cfg.timeout = std::chrono::milliseconds(cfg.consumer.api_timeout_ms);

            ConsumerConfig consumer_cfg;
            consumer_cfg.host = cfg.broker.host;
            consumer_cfg.queue = cfg.broker.queue;
            consumer_cfg.retry_backoff = std::chrono::milliseconds(cfg.consumer.retry_backoff_ms);
            consumer_cfg.drain_timeout = std::chrono::milliseconds(cfg.consumer.drain_timeout_ms);

            g_consumer = std::make_shared<Consumer>(consumer_cfg, broker, g_tracer,
                                                    TimeApiProcessor(time_cfg, g_tracer), metrics);
            g_consumer->set_on_state_change([](const ConsumerStateChange& change) {
                utils::log::info(std::format("Consumer: {} -> {} ({})",
                    consumer_state_to_string(change.from),
                    consumer_state_to_string(change.to), change.reason));
            });
            g_consumer_thread = std::make_unique<std::jthread>(
                [consumer = g_consumer](std::stop_token stop) {
                    consumer->start(stop);
                });
            utils::log::info(std::format("[5/6] Consumer: {} <- {} (backoff {}ms, api {})",
                cfg.broker.host, cfg.broker.queue, cfg.consumer.retry_backoff_ms,
                cfg.consumer.api_url));
        }

        // HTTP front end (blocks)
        HttpServer::Routes routes;
        routes.metrics = cfg.metrics.endpoint;
        g_server = std::make_shared<HttpServer>(
            cfg.service.name, cfg.server.host, cfg.server.port,
            cfg.metrics.enabled ? metrics : nullptr,
            g_producer, g_consumer, routes);
        g_server->set_default_source(cfg.producer.source);
        utils::log::info(std::format("[6/6] HTTP server: {}:{}", cfg.server.host, cfg.server.port));
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }

    return 0;
}
