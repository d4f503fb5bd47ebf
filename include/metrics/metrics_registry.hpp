#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace tracebridge {

namespace metrics {
inline constexpr const char* kEnqueuedItem = "Enqueued_Item";
inline constexpr const char* kMessagesProcessed = "Messages_Processed";
inline constexpr const char* kProcessingFailed = "Processing_Failed";
inline constexpr const char* kTraceHeaderRejected = "Trace_Header_Rejected";
} // namespace metrics

/// Ordered so rendered label sets are stable
using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Thread-safe labeled counters with Prometheus text exposition
 *
 * Output, one family per counter name:
 *   # HELP Enqueued_Item Messages accepted for publishing
 *   # TYPE Enqueued_Item counter
 *   Enqueued_Item{Source="WebSiteA"} 2 1700000000000
 *
 * The trailing sample timestamp is the last update, in Unix milliseconds.
 */
class MetricsRegistry {
public:
    MetricsRegistry() = default;

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /// Attach a # HELP line to a counter family
    void describe(const std::string& name, std::string help);

    void increment(const std::string& name, const MetricLabels& labels = {}, uint64_t delta = 1);

    /// Current value, 0 when never incremented
    [[nodiscard]] uint64_t value(const std::string& name, const MetricLabels& labels = {}) const;

    [[nodiscard]] std::string render_prometheus() const;

    [[nodiscard]] size_t family_count() const;

private:
    struct Sample {
        uint64_t value = 0;
        std::chrono::system_clock::time_point updated;
    };

    struct Family {
        std::string help;
        std::map<MetricLabels, Sample> samples;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Family> families_;
};

} // namespace tracebridge
