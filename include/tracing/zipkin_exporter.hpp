#pragma once

#include "tracing/span_exporter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tracebridge {

/**
 * @brief HTTP POST span exporter speaking the Zipkin v2 JSON API
 *
 * export_span() only enqueues. A dedicated sender thread drains the queue
 * and POSTs JSON arrays of up to batch_size spans to the configured URL
 * (e.g. http://zipkin:9411/api/v2/spans) with the cpp-httplib client:
 *
 *   [Span::end()] --enqueue--> [bounded queue] --sender thread--> [Zipkin]
 *
 * The sender wakes when a batch is full, every flush_interval, on flush()
 * and on shutdown(). A full queue refuses the span with RETRYABLE_ERROR.
 * A batch that still fails after max_retries is dropped and counted; the
 * sender never throws.
 */
class ZipkinExporter : public ISpanExporter {
public:
    struct Config {
        std::string url = "http://localhost:9411/api/v2/spans";
        std::string service_name = "tracebridge";
        std::chrono::milliseconds timeout{5000};
        int max_retries = 3;
        size_t batch_size = 1;
        size_t max_buffered_spans = 10000;
        std::chrono::milliseconds flush_interval{1000};
    };

    /// Starts the sender thread immediately
    explicit ZipkinExporter(const Config& config);
    ~ZipkinExporter() override;

    ZipkinExporter(const ZipkinExporter&) = delete;
    ZipkinExporter& operator=(const ZipkinExporter&) = delete;

    [[nodiscard]] ExportResult export_span(const SpanData& span) override;

    /// Block until every queued span has been sent or dropped
    void flush() override;

    /// Send what is queued, then stop the sender thread. Idempotent.
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] uint64_t send_failures() const { return send_failures_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t batches_sent() const { return batches_sent_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t spans_dropped() const { return spans_dropped_.load(std::memory_order_relaxed); }
    [[nodiscard]] size_t buffered() const;

    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] int port() const { return port_; }
    [[nodiscard]] bool use_ssl() const { return use_ssl_; }

private:
    void sender_thread_func();
    bool send_batch(const std::vector<SpanData>& batch);

    Config config_;

    // Parsed from URL
    std::string host_;
    std::string path_;
    int port_ = 443;
    bool use_ssl_ = true;

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    std::condition_variable idle_cv_;
    std::deque<SpanData> queue_;
    bool running_ = true;
    bool sending_ = false;
    bool flush_requested_ = false;

    std::atomic<uint64_t> send_failures_{0};
    std::atomic<uint64_t> batches_sent_{0};
    std::atomic<uint64_t> spans_dropped_{0};

    std::thread sender_thread_;
};

} // namespace tracebridge
