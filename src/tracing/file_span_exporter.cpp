#include "tracing/file_span_exporter.hpp"
#include "tracing/span_json.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <format>
#include <stdexcept>

namespace tracebridge {

FileSpanExporter::FileSpanExporter(const Config& config)
    : config_(config) {
    file_stream_.open(config_.output_file, std::ios::app);
    if (!file_stream_.is_open()) {
        throw std::runtime_error("Failed to open span file: " + config_.output_file);
    }

    std::error_code ec;
    auto file_size = std::filesystem::file_size(config_.output_file, ec);
    if (!ec) {
        current_file_size_ = static_cast<size_t>(file_size);
    }
}

FileSpanExporter::~FileSpanExporter() {
    shutdown();
}

ExportResult FileSpanExporter::export_span(const SpanData& span) {
    if (!file_stream_.is_open()) return ExportResult::RETRYABLE_ERROR;

    if (current_file_size_ >= config_.max_file_size_bytes) {
        rotate_file();
        if (!file_stream_.is_open()) return ExportResult::RETRYABLE_ERROR;
    }

    std::string line = to_zipkin_json(span, config_.service_name).dump();
    line += '\n';
    file_stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    if (!file_stream_.good()) {
        file_stream_.clear();
        return ExportResult::RETRYABLE_ERROR;
    }
    current_file_size_ += line.size();
    ++spans_written_;
    return ExportResult::SUCCESS;
}

void FileSpanExporter::flush() {
    file_stream_.flush();
}

void FileSpanExporter::shutdown() {
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
}

std::string FileSpanExporter::name() const {
    return "file:" + config_.output_file;
}

void FileSpanExporter::rotate_file() {
    file_stream_.flush();
    file_stream_.close();

    std::error_code ec;
    std::filesystem::rename(config_.output_file,
                            std::format("{}.1", config_.output_file), ec);
    if (ec) {
        utils::log::warn(std::format("Span file rotation failed for {}: {}",
                                     config_.output_file, ec.message()));
    }

    file_stream_.open(config_.output_file, std::ios::trunc);
    current_file_size_ = 0;
    if (!file_stream_.is_open()) {
        utils::log::error(std::format("Failed to reopen span file: {}", config_.output_file));
    }
}

} // namespace tracebridge
