#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace tracebridge {

/**
 * @brief Payload published by the API role and decoded by the processor
 *
 * Wire form: {"source":"WebSiteA","eventName":"signup","createdAt":"2024-...Z"}
 * Missing keys decode as empty strings.
 */
struct EnqueuedMessage {
    std::string source;
    std::string event_name;
    std::string created_at;
};

inline void to_json(nlohmann::json& j, const EnqueuedMessage& m) {
    j = nlohmann::json{
        {"source", m.source},
        {"eventName", m.event_name},
        {"createdAt", m.created_at}
    };
}

inline void from_json(const nlohmann::json& j, EnqueuedMessage& m) {
    m.source = j.value("source", std::string{});
    m.event_name = j.value("eventName", std::string{});
    m.created_at = j.value("createdAt", std::string{});
}

} // namespace tracebridge
