#include "tracing/zipkin_exporter.hpp"
#include "tracing/span_json.hpp"
#include "server/http_constants.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <algorithm>
#include <cstddef>
#include <format>
#include <iterator>

namespace tracebridge {

// ============================================================================
// Construction / Destruction
// ============================================================================

ZipkinExporter::ZipkinExporter(const Config& config)
    : config_(config) {
    if (config_.batch_size == 0) config_.batch_size = 1;
    config_.max_buffered_spans = std::max(config_.max_buffered_spans, config_.batch_size);

    const auto url = utils::parse_url(config_.url);
    host_ = url.host;
    path_ = url.path;
    port_ = url.port;
    use_ssl_ = url.use_ssl;

    sender_thread_ = std::thread(&ZipkinExporter::sender_thread_func, this);
}

ZipkinExporter::~ZipkinExporter() {
    shutdown();
}

// ============================================================================
// Public Interface
// ============================================================================

ExportResult ZipkinExporter::export_span(const SpanData& span) {
    {
        std::lock_guard lock(mutex_);
        if (!running_) return ExportResult::RETRYABLE_ERROR;
        if (queue_.size() >= config_.max_buffered_spans) {
            spans_dropped_.fetch_add(1, std::memory_order_relaxed);
            return ExportResult::RETRYABLE_ERROR;
        }
        queue_.push_back(span);
        if (queue_.size() < config_.batch_size) {
            return ExportResult::SUCCESS;
        }
    }
    wake_cv_.notify_one();
    return ExportResult::SUCCESS;
}

void ZipkinExporter::flush() {
    std::unique_lock lock(mutex_);
    if (!running_) return;
    flush_requested_ = true;
    wake_cv_.notify_one();
    idle_cv_.wait(lock, [this] {
        return !flush_requested_ || !running_;
    });
}

void ZipkinExporter::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    wake_cv_.notify_one();
    idle_cv_.notify_all();
    if (sender_thread_.joinable()) {
        sender_thread_.join();
    }
}

std::string ZipkinExporter::name() const {
    return "zipkin:" + config_.url;
}

size_t ZipkinExporter::buffered() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

// ============================================================================
// Background Sender Thread
// ============================================================================

void ZipkinExporter::sender_thread_func() {
    std::vector<SpanData> batch;
    batch.reserve(config_.batch_size);

    std::unique_lock lock(mutex_);
    while (true) {
        wake_cv_.wait_for(lock, config_.flush_interval, [this] {
            return !running_ || flush_requested_ || queue_.size() >= config_.batch_size;
        });

        while (!queue_.empty()) {
            const size_t n = std::min(queue_.size(), config_.batch_size);
            batch.assign(std::make_move_iterator(queue_.begin()),
                         std::make_move_iterator(queue_.begin() + static_cast<std::ptrdiff_t>(n)));
            queue_.erase(queue_.begin(), queue_.begin() + static_cast<std::ptrdiff_t>(n));

            sending_ = true;
            lock.unlock();
            const bool sent = send_batch(batch);
            lock.lock();
            sending_ = false;

            if (!sent) {
                spans_dropped_.fetch_add(batch.size(), std::memory_order_relaxed);
            }
        }

        if (flush_requested_) {
            flush_requested_ = false;
            idle_cv_.notify_all();
        }
        if (!running_) break;
    }
}

bool ZipkinExporter::send_batch(const std::vector<SpanData>& batch) {
    if (batch.empty()) return true;

    const std::string payload = to_zipkin_json(batch, config_.service_name).dump();
    const std::string scheme_host = std::format("{}{}:{}",
        use_ssl_ ? "https://" : "http://", host_, port_);

    bool success = false;
    for (int attempt = 0; attempt < config_.max_retries && !success; ++attempt) {
        httplib::Client client(scheme_host);
        client.set_connection_timeout(config_.timeout);
        client.set_read_timeout(config_.timeout);

        auto res = client.Post(path_, payload, http::kJsonContentType);
        if (res && res->status >= 200 && res->status < 300) {
            success = true;
        } else if (!res) {
            utils::log::debug(std::format("Zipkin exporter attempt {} failed: {}",
                attempt + 1, httplib::to_string(res.error())));
        } else {
            utils::log::debug(std::format("Zipkin exporter attempt {} got HTTP {}",
                attempt + 1, res->status));
        }
    }

    if (success) {
        batches_sent_.fetch_add(1, std::memory_order_relaxed);
    } else {
        send_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Zipkin exporter failed after {} retries: {} ({} spans dropped)",
                                     config_.max_retries, config_.url, batch.size()));
    }
    return success;
}

} // namespace tracebridge
