#pragma once

#include "tracing/span_exporter.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>

namespace tracebridge {

/**
 * @brief File-based span exporter
 *
 * Appends one Zipkin v2 JSON object per line (JSONL). When the file reaches
 * max_file_size_bytes it is renamed to "<file>.1" (replacing any previous
 * one) and a fresh file is started.
 */
class FileSpanExporter : public ISpanExporter {
public:
    struct Config {
        std::string output_file = "spans.jsonl";
        std::string service_name = "tracebridge";
        size_t max_file_size_bytes = 100ULL * 1024 * 1024;  // 100MB
    };

    explicit FileSpanExporter(const Config& config);
    ~FileSpanExporter() override;

    [[nodiscard]] ExportResult export_span(const SpanData& span) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }
    [[nodiscard]] uint64_t spans_written() const { return spans_written_; }

private:
    void rotate_file();

    Config config_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    uint64_t spans_written_ = 0;
};

} // namespace tracebridge
