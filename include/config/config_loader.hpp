#pragma once

#include <toml++/toml.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tracebridge {

// ============================================================================
// Service
// ============================================================================

enum class ServiceRole { API, PROCESSOR };

[[nodiscard]] const char* service_role_to_string(ServiceRole role);
[[nodiscard]] std::optional<ServiceRole> parse_service_role(const std::string& role);

struct ServiceConfig {
    std::string name = "tracebridge";
    std::string role = "processor";     // "api" | "processor"
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Broker / Producer / Consumer Config
// ============================================================================

struct BrokerConfig {
    std::string host = "localhost:9092";
    std::string queue = "web-queue";
    std::string client_id = "tracebridge";
    int metadata_timeout_ms = 5000;
    int publish_timeout_ms = 10000;
};

struct ConsumerSettings {
    std::string group_id = "tracebridge-processor";
    int retry_backoff_ms = 3000;
    int drain_timeout_ms = 5000;
    int poll_timeout_ms = 200;
    std::string api_url = "http://localhost:5002";
    int api_timeout_ms = 5000;
};

struct ProducerSettings {
    std::string source = "tracebridge";   // default Source label for enqueue
};

// ============================================================================
// Tracing Config
// ============================================================================

struct ZipkinConfig {
    std::string url;                      // empty = disabled
    int timeout_ms = 5000;
    int max_retries = 3;
    size_t batch_size = 1;
    size_t max_buffered_spans = 10000;
    int flush_interval_ms = 1000;
};

struct FileExporterConfig {
    std::string path;                     // empty = disabled
    size_t max_file_size_mb = 100;
};

struct TracingConfig {
    bool enabled = true;
    ZipkinConfig zipkin;
    FileExporterConfig file;

    [[nodiscard]] bool has_exporter() const {
        return !zipkin.url.empty() || !file.path.empty();
    }
};

// ============================================================================
// Metrics / Server Config
// ============================================================================

struct MetricsConfig {
    bool enabled = true;
    std::string endpoint = "/metrics";
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
};

// ============================================================================
// TraceBridgeConfig - Complete parsed configuration
// ============================================================================

struct TraceBridgeConfig {
    ServiceConfig service;
    LoggingConfig logging;
    BrokerConfig broker;
    ConsumerSettings consumer;
    ProducerSettings producer;
    TracingConfig tracing;
    MetricsConfig metrics;
    ServerConfig server;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief TOML configuration loader (toml++)
 *
 * String values may reference environment variables as ${VAR_NAME}; an
 * unset variable expands to an empty string, so e.g.
 *   [tracing.zipkin]
 *   url = "${ZIPKIN_URL}"
 * enables the Zipkin exporter only when ZIPKIN_URL is set.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        TraceBridgeConfig config;

        static LoadResult ok(TraceBridgeConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to tracebridge.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every validation failure, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const TraceBridgeConfig& config);

private:
    static TraceBridgeConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(TraceBridgeConfig config);

    static ServiceConfig extract_service(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static BrokerConfig extract_broker(const toml::table& root);
    static ConsumerSettings extract_consumer(const toml::table& root);
    static ProducerSettings extract_producer(const toml::table& root);
    static TracingConfig extract_tracing(const toml::table& root);
    static MetricsConfig extract_metrics(const toml::table& root);
    static ServerConfig extract_server(const toml::table& root);
};

} // namespace tracebridge
