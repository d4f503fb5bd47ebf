#pragma once

#include <string>

namespace tracebridge::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kTraceParentHeader = "traceparent";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";

} // namespace tracebridge::http
