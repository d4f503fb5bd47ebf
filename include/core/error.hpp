#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace tracebridge {

/**
 * @brief Error categories for tracebridge operations
 *
 * FORMAT_ERROR:     malformed or unsupported trace header
 * CONNECTION_ERROR: broker unreachable (recovered by the consumer retry loop)
 * PROCESSING_ERROR: downstream processing failed for one message
 * DISPOSAL_ERROR:   teardown failure (logged, never surfaced)
 */
enum class ErrorCategory {
    NONE,
    FORMAT_ERROR,
    CONNECTION_ERROR,
    PROCESSING_ERROR,
    DISPOSAL_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::FORMAT_ERROR:     return "format_error";
        case ErrorCategory::CONNECTION_ERROR: return "connection_error";
        case ErrorCategory::PROCESSING_ERROR: return "processing_error";
        case ErrorCategory::DISPOSAL_ERROR:   return "disposal_error";
        case ErrorCategory::INTERNAL_ERROR:   return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/// Raised by downstream message processing. Recorded on the span, never
/// propagated out of a delivery handler.
class ProcessingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Raised by channel-level broker operations (declare, publish, consume).
class BrokerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace tracebridge
