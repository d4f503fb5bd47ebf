#pragma once

#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tracebridge::utils {

// ============================================================================
// Time Utilities
// ============================================================================

inline std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    ::gmtime_r(&time, &tm_buf);

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    return std::format("{}.{:03d}Z", time_buf, static_cast<int>(ms.count()));
}

inline std::chrono::system_clock::time_point now() {
    return std::chrono::system_clock::now();
}

/// Microseconds since the Unix epoch (Zipkin timestamp unit)
[[nodiscard]] inline int64_t to_epoch_us(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
}

/// Milliseconds since the Unix epoch (Prometheus sample timestamp unit)
[[nodiscard]] inline int64_t to_epoch_ms(const std::chrono::system_clock::time_point& tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

/// Lowercase hex digit check (W3C trace-context ids are lowercase only)
[[nodiscard]] constexpr bool is_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

[[nodiscard]] constexpr uint8_t hex_value(char c) {
    return (c >= '0' && c <= '9') ? static_cast<uint8_t>(c - '0')
                                  : static_cast<uint8_t>(c - 'a' + 10);
}

// ============================================================================
// URL Parsing (http/https endpoints for exporters and downstream calls)
// ============================================================================

struct ParsedUrl {
    std::string host;
    std::string path = "/";
    int port = 443;
    bool use_ssl = true;

    /// "http://host:port" form expected by httplib::Client
    [[nodiscard]] std::string scheme_host_port() const {
        return std::format("{}{}:{}", use_ssl ? "https://" : "http://", host, port);
    }
};

/// Split "http[s]://host[:port][/path]" into parts. No scheme → https.
[[nodiscard]] inline ParsedUrl parse_url(std::string url) {
    ParsedUrl result;

    if (url.starts_with("https://")) {
        url = url.substr(8);
    } else if (url.starts_with("http://")) {
        result.use_ssl = false;
        result.port = 80;
        url = url.substr(7);
    }

    const auto path_pos = url.find('/');
    if (path_pos != std::string::npos) {
        result.host = url.substr(0, path_pos);
        result.path = url.substr(path_pos);
    } else {
        result.host = url;
    }

    const auto port_pos = result.host.find(':');
    if (port_pos != std::string::npos) {
        const auto port_str = result.host.substr(port_pos + 1);
        int port = 0;
        const auto [ptr, ec] = std::from_chars(
            port_str.data(), port_str.data() + port_str.size(), port);
        if (ec == std::errc{} && port > 0 && port <= 65535) {
            result.port = port;
        }
        result.host = result.host.substr(0, port_pos);
    }
    return result;
}

// ============================================================================
// Timer
// ============================================================================

/// Steady-clock stopwatch for timeouts
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::chrono::milliseconds elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    inline void write(Level level, std::string_view scope, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        const auto formatted = scope.empty()
            ? std::format("{}.{:03d} [{}] {}\n",
                  time_buf, static_cast<int>(ms.count()), tag, msg)
            : std::format("{}.{:03d} [{}] [{}] {}\n",
                  time_buf, static_cast<int>(ms.count()), tag, scope, msg);

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

/// Parse "debug" / "info" / "warn" / "error" (case-insensitive). Unknown → INFO.
[[nodiscard]] inline Level parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return Level::INFO;
}

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline bool is_enabled(Level level) {
    return level >= detail::min_level().load(std::memory_order_relaxed);
}

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, {}, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, {}, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, {}, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, {}, msg);
}

/**
 * @brief Logging scope passed by value to the code that needs it
 *
 * Every line written through a Scope carries its key, e.g.
 * "[trace=cd4262a7f7adf040bdd892959cf8c4fc] processed message".
 *
 * Usage:
 *   log::Scope scope(std::format("trace={}", ctx.trace_id_hex()));
 *   scope.info("processing message");
 */
class Scope {
public:
    explicit Scope(std::string key) : key_(std::move(key)) {}

    [[nodiscard]] const std::string& key() const { return key_; }

    void debug(const std::string& msg) const { detail::write(Level::DEBUG, key_, msg); }
    void info(const std::string& msg) const { detail::write(Level::INFO, key_, msg); }
    void warn(const std::string& msg) const { detail::write(Level::WARN, key_, msg); }
    void error(const std::string& msg) const { detail::write(Level::ERROR, key_, msg); }

private:
    std::string key_;
};

} // namespace log

} // namespace tracebridge::utils
