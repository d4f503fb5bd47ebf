#pragma once

#include "diagnostics/diagnostic_event.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tracebridge {

/// Subscription list owned by a registry, shared weakly with its handles
struct SubscriptionTable {
    struct Entry {
        uint64_t id;
        std::string source;
        std::shared_ptr<const EventHandlerTable> handlers;
    };

    mutable std::mutex mutex;
    std::vector<Entry> entries;
    uint64_t next_id = 1;

    void remove(uint64_t id);
};

/**
 * @brief RAII handle for one registry subscription
 *
 * Move-only. Destruction (or reset()) unsubscribes. A handle that outlives
 * its registry becomes inactive and resets as a no-op.
 */
class Subscription {
public:
    Subscription() = default;
    Subscription(std::weak_ptr<SubscriptionTable> table, uint64_t id)
        : table_(std::move(table)), id_(id) {}
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void reset();

    [[nodiscard]] bool active() const { return id_ != 0 && !table_.expired(); }
    [[nodiscard]] uint64_t id() const { return id_; }

private:
    std::weak_ptr<SubscriptionTable> table_;
    uint64_t id_ = 0;
};

/**
 * @brief Explicit registry of diagnostic subscriptions
 *
 * Owned by the composition root and passed by reference to emitters and
 * collectors. Thread-safe: subscribe/unsubscribe/emit may race.
 *
 * emit() snapshots the matching handler tables under the lock and invokes
 * them outside it, so a handler may subscribe or unsubscribe without
 * deadlocking. A handler that throws is logged and skipped; the remaining
 * handlers still run.
 */
class DiagnosticRegistry {
public:
    DiagnosticRegistry() = default;

    DiagnosticRegistry(const DiagnosticRegistry&) = delete;
    DiagnosticRegistry& operator=(const DiagnosticRegistry&) = delete;

    [[nodiscard]] Subscription subscribe(std::string source, EventHandlerTable handlers);

    void emit(const DiagnosticEvent& event) const;

    /// True when at least one subscription exists for this source name
    [[nodiscard]] bool is_enabled(std::string_view source) const;

    [[nodiscard]] uint64_t next_correlation_id();

    [[nodiscard]] size_t subscription_count() const;

private:
    std::shared_ptr<SubscriptionTable> table_ = std::make_shared<SubscriptionTable>();
    std::atomic<uint64_t> next_correlation_id_{1};
};

/**
 * @brief Named emitter handle held by instrumented components
 */
class DiagnosticSource {
public:
    DiagnosticSource(DiagnosticRegistry& registry, std::string name)
        : registry_(registry), name_(std::move(name)) {}

    [[nodiscard]] bool is_enabled() const { return registry_.is_enabled(name_); }

    /// Stamps the source name and dispatches
    void emit(DiagnosticEvent event) const;

    [[nodiscard]] uint64_t next_correlation_id() const {
        return registry_.next_correlation_id();
    }

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    DiagnosticRegistry& registry_;
    std::string name_;
};

} // namespace tracebridge
