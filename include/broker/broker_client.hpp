#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tracebridge {

using MessageHeaders = std::unordered_map<std::string, std::string>;

/**
 * @brief One delivered message
 */
struct BrokerMessage {
    std::string queue;
    MessageHeaders headers;
    std::string body;
    uint64_t delivery_tag = 0;
};

/// Invoked on the broker client's delivery thread
using MessageHandler = std::function<void(const BrokerMessage&)>;

/**
 * @brief Channel-level broker operations
 *
 * Failures throw BrokerError. A channel is not safe for unsynchronized
 * concurrent publish; one channel belongs to one owner. Must be closed
 * (or destroyed) before its connection.
 */
class IBrokerChannel {
public:
    virtual ~IBrokerChannel() = default;

    /// Idempotent: an existing queue is not an error
    virtual void declare_queue(const std::string& queue) = 0;

    virtual void publish(const std::string& queue, const MessageHeaders& headers,
                         std::string_view body) = 0;

    /**
     * @brief Start delivering messages of a queue to handler
     * @return Consumer tag for cancel()
     */
    [[nodiscard]] virtual std::string consume(const std::string& queue, MessageHandler handler) = 0;

    /// Stop one consumer; returns once its handler can no longer be invoked
    virtual void cancel(const std::string& consumer_tag) = 0;

    /// Cancel every consumer and release the channel. Idempotent.
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief An open broker connection
 */
class IBrokerConnection {
public:
    virtual ~IBrokerConnection() = default;

    /// @throws BrokerError when the connection cannot open a channel
    [[nodiscard]] virtual std::unique_ptr<IBrokerChannel> create_channel() = 0;

    /// Idempotent
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Broker connection factory
 */
class IBrokerClient {
public:
    virtual ~IBrokerClient() = default;

    /// @return Open connection, or CONNECTION_ERROR when the broker is unreachable
    [[nodiscard]] virtual Result<std::unique_ptr<IBrokerConnection>> connect(const std::string& host) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace tracebridge
