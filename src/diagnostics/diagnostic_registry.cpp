#include "diagnostics/diagnostic_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace tracebridge {

// ============================================================================
// Subscription
// ============================================================================

Subscription::~Subscription() {
    reset();
}

Subscription::Subscription(Subscription&& other) noexcept
    : table_(std::move(other.table_)), id_(other.id_) {
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        table_ = std::move(other.table_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void Subscription::reset() {
    if (id_ == 0) return;
    if (auto table = table_.lock()) {
        table->remove(id_);
    }
    table_.reset();
    id_ = 0;
}

void SubscriptionTable::remove(uint64_t id) {
    std::lock_guard lock(mutex);
    std::erase_if(entries, [id](const Entry& e) { return e.id == id; });
}

// ============================================================================
// DiagnosticRegistry
// ============================================================================

Subscription DiagnosticRegistry::subscribe(std::string source, EventHandlerTable handlers) {
    std::lock_guard lock(table_->mutex);
    const uint64_t id = table_->next_id++;
    table_->entries.push_back(SubscriptionTable::Entry{
        id,
        std::move(source),
        std::make_shared<const EventHandlerTable>(std::move(handlers))
    });
    return Subscription(table_, id);
}

void DiagnosticRegistry::emit(const DiagnosticEvent& event) const {
    std::vector<std::shared_ptr<const EventHandlerTable>> matched;
    {
        std::lock_guard lock(table_->mutex);
        for (const auto& entry : table_->entries) {
            if (entry.source == event.source) {
                matched.push_back(entry.handlers);
            }
        }
    }

    for (const auto& table : matched) {
        const auto& handler = table->for_kind(event.kind);
        if (!handler) continue;
        try {
            handler(event);
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Diagnostic handler for {} ({}) threw: {}",
                event.source, event_kind_to_string(event.kind), e.what()));
        }
    }
}

bool DiagnosticRegistry::is_enabled(std::string_view source) const {
    std::lock_guard lock(table_->mutex);
    return std::any_of(table_->entries.begin(), table_->entries.end(),
        [source](const SubscriptionTable::Entry& e) { return e.source == source; });
}

uint64_t DiagnosticRegistry::next_correlation_id() {
    return next_correlation_id_.fetch_add(1, std::memory_order_relaxed);
}

size_t DiagnosticRegistry::subscription_count() const {
    std::lock_guard lock(table_->mutex);
    return table_->entries.size();
}

// ============================================================================
// DiagnosticSource
// ============================================================================

void DiagnosticSource::emit(DiagnosticEvent event) const {
    event.source = name_;
    registry_.emit(event);
}

} // namespace tracebridge
