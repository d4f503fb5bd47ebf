#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace tracebridge {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/// "${VAR}" -> value of VAR, empty when unset
std::string expand_env_vars(const std::string& input) {
    std::string out;
    size_t pos = 0;
    for (;;) {
        const size_t open = input.find("${", pos);
        if (open == std::string::npos) {
            out.append(input, pos, std::string::npos);
            return out;
        }
        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        out.append(input, pos, open - pos);
        const std::string name = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) out += value;
        pos = close + 1;
    }
}

/// Rewrite every string value below node in place
void expand_env_vars_in(toml::node& node) {
    if (auto* str = node.as_string()) {
        str->get() = expand_env_vars(str->get());
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, child] : *tbl) expand_env_vars_in(child);
    } else if (auto* arr = node.as_array()) {
        for (auto& child : *arr) expand_env_vars_in(child);
    }
}

toml::table with_env_expanded(toml::table tbl) {
    expand_env_vars_in(tbl);
    return tbl;
}

} // anonymous namespace

// ============================================================================
// Service role
// ============================================================================

const char* service_role_to_string(ServiceRole role) {
    switch (role) {
        case ServiceRole::API:       return "api";
        case ServiceRole::PROCESSOR: return "processor";
    }
    return "unknown";
}

std::optional<ServiceRole> parse_service_role(const std::string& role) {
    const std::string lower = utils::to_lower(role);
    if (lower == "api") return ServiceRole::API;
    if (lower == "processor") return ServiceRole::PROCESSOR;
    return std::nullopt;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

ServiceConfig ConfigLoader::extract_service(const toml::table& root) {
    ServiceConfig cfg;
    const auto* service = root["service"].as_table();
    if (!service) return cfg;
    const auto& s = *service;

    cfg.name = s["name"].value_or("tracebridge"s);
    cfg.role = s["role"].value_or("processor"s);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

BrokerConfig ConfigLoader::extract_broker(const toml::table& root) {
    BrokerConfig cfg;
    const auto* broker = root["broker"].as_table();
    if (!broker) return cfg;
    const auto& b = *broker;

    cfg.host = b["host"].value_or("localhost:9092"s);
    cfg.queue = b["queue"].value_or("web-queue"s);
    cfg.client_id = b["client_id"].value_or("tracebridge"s);
    cfg.metadata_timeout_ms = b["metadata_timeout_ms"].value_or(5000);
    cfg.publish_timeout_ms = b["publish_timeout_ms"].value_or(10000);
    // ${BROKER_HOST} expanding to "" falls back to the default
    if (cfg.host.empty()) cfg.host = "localhost:9092";
    return cfg;
}

ConsumerSettings ConfigLoader::extract_consumer(const toml::table& root) {
    ConsumerSettings cfg;
    const auto* consumer = root["consumer"].as_table();
    if (!consumer) return cfg;
    const auto& c = *consumer;

    cfg.group_id = c["group_id"].value_or("tracebridge-processor"s);
    cfg.retry_backoff_ms = c["retry_backoff_ms"].value_or(3000);
    cfg.drain_timeout_ms = c["drain_timeout_ms"].value_or(5000);
    cfg.poll_timeout_ms = c["poll_timeout_ms"].value_or(200);
    cfg.api_url = c["api_url"].value_or("http://localhost:5002"s);
    cfg.api_timeout_ms = c["api_timeout_ms"].value_or(5000);
    // ${API_URL} expanding to "" falls back to the default
    if (cfg.api_url.empty()) cfg.api_url = "http://localhost:5002";
    return cfg;
}

ProducerSettings ConfigLoader::extract_producer(const toml::table& root) {
    ProducerSettings cfg;
    const auto* producer = root["producer"].as_table();
    if (!producer) return cfg;

    cfg.source = (*producer)["source"].value_or("tracebridge"s);
    return cfg;
}

TracingConfig ConfigLoader::extract_tracing(const toml::table& root) {
    TracingConfig cfg;
    const auto* tracing = root["tracing"].as_table();
    if (!tracing) return cfg;
    const auto& t = *tracing;

    cfg.enabled = t["enabled"].value_or(true);

    if (const auto* zipkin = t["zipkin"].as_table()) {
        cfg.zipkin.url = (*zipkin)["url"].value_or(""s);
        cfg.zipkin.timeout_ms = (*zipkin)["timeout_ms"].value_or(5000);
        cfg.zipkin.max_retries = (*zipkin)["max_retries"].value_or(3);
        cfg.zipkin.batch_size = static_cast<size_t>((*zipkin)["batch_size"].value_or(1));
        cfg.zipkin.max_buffered_spans = static_cast<size_t>(
            (*zipkin)["max_buffered_spans"].value_or(10000));
        cfg.zipkin.flush_interval_ms = (*zipkin)["flush_interval_ms"].value_or(1000);
    }

    if (const auto* file = t["file"].as_table()) {
        cfg.file.path = (*file)["path"].value_or(""s);
        cfg.file.max_file_size_mb = static_cast<size_t>((*file)["max_file_size_mb"].value_or(100));
    }
    return cfg;
}

MetricsConfig ConfigLoader::extract_metrics(const toml::table& root) {
    MetricsConfig cfg;
    const auto* metrics = root["metrics"].as_table();
    if (!metrics) return cfg;

    cfg.enabled = (*metrics)["enabled"].value_or(true);
    cfg.endpoint = (*metrics)["endpoint"].value_or("/metrics"s);
    return cfg;
}

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;

    cfg.host = (*server)["host"].value_or("0.0.0.0"s);
    cfg.port = (*server)["port"].value_or(8080);
    return cfg;
}

TraceBridgeConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    TraceBridgeConfig config;
    config.service = extract_service(root);
    config.logging = extract_logging(root);
    config.broker = extract_broker(root);
    config.consumer = extract_consumer(root);
    config.producer = extract_producer(root);
    config.tracing = extract_tracing(root);
    config.metrics = extract_metrics(root);
    config.server = extract_server(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(TraceBridgeConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = with_env_expanded(toml::parse_file(config_path));
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = with_env_expanded(toml::parse(toml_content));
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TraceBridgeConfig& config) {
    std::vector<std::string> errors;

    if (!parse_service_role(config.service.role)) {
        errors.push_back(std::format("service.role must be \"api\" or \"processor\", got \"{}\"",
                                     config.service.role));
    }

    if (config.server.port < 1 || config.server.port > 65535) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }

    if (config.broker.host.empty()) {
        errors.push_back("broker.host must not be empty");
    }
    if (config.broker.queue.empty()) {
        errors.push_back("broker.queue must not be empty");
    }
    if (config.broker.metadata_timeout_ms <= 0) {
        errors.push_back("broker.metadata_timeout_ms must be > 0");
    }
    if (config.broker.publish_timeout_ms <= 0) {
        errors.push_back("broker.publish_timeout_ms must be > 0");
    }

    if (config.consumer.retry_backoff_ms <= 0) {
        errors.push_back(std::format("consumer.retry_backoff_ms must be > 0, got {}",
                                     config.consumer.retry_backoff_ms));
    }
    if (config.consumer.drain_timeout_ms < 0) {
        errors.push_back("consumer.drain_timeout_ms must be >= 0");
    }
    if (config.consumer.poll_timeout_ms <= 0) {
        errors.push_back("consumer.poll_timeout_ms must be > 0");
    }

    if (config.tracing.enabled) {
        if (!config.tracing.has_exporter()) {
            errors.push_back("tracing is enabled but no exporter was configured "
                             "(set tracing.zipkin.url or tracing.file.path)");
        }
        if (!config.tracing.zipkin.url.empty()) {
            if (config.tracing.zipkin.batch_size == 0) {
                errors.push_back("tracing.zipkin.batch_size must be > 0");
            }
            if (config.tracing.zipkin.max_buffered_spans < config.tracing.zipkin.batch_size) {
                errors.push_back("tracing.zipkin.max_buffered_spans must be >= batch_size");
            }
            if (config.tracing.zipkin.flush_interval_ms <= 0) {
                errors.push_back("tracing.zipkin.flush_interval_ms must be > 0");
            }
            if (config.tracing.zipkin.max_retries < 1) {
                errors.push_back("tracing.zipkin.max_retries must be >= 1");
            }
        }
    }

    if (config.metrics.enabled && !config.metrics.endpoint.starts_with("/")) {
        errors.push_back(std::format("metrics.endpoint must start with '/', got \"{}\"",
                                     config.metrics.endpoint));
    }

    return errors;
}

} // namespace tracebridge
