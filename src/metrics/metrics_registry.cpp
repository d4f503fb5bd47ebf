#include "metrics/metrics_registry.hpp"
#include "core/utils.hpp"

#include <format>

namespace tracebridge {

namespace {

std::string escape_label_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string format_labels(const MetricLabels& labels) {
    if (labels.empty()) return {};
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) out += ',';
        first = false;
        out += std::format("{}=\"{}\"", key, escape_label_value(value));
    }
    out += '}';
    return out;
}

} // namespace

void MetricsRegistry::describe(const std::string& name, std::string help) {
    std::lock_guard lock(mutex_);
    families_[name].help = std::move(help);
}

void MetricsRegistry::increment(const std::string& name, const MetricLabels& labels,
                                uint64_t delta) {
    std::lock_guard lock(mutex_);
    auto& sample = families_[name].samples[labels];
    sample.value += delta;
    sample.updated = utils::now();
}

uint64_t MetricsRegistry::value(const std::string& name, const MetricLabels& labels) const {
    std::lock_guard lock(mutex_);
    const auto family = families_.find(name);
    if (family == families_.end()) return 0;
    const auto sample = family->second.samples.find(labels);
    return sample != family->second.samples.end() ? sample->second.value : 0;
}

std::string MetricsRegistry::render_prometheus() const {
    std::lock_guard lock(mutex_);
    std::string output;
    for (const auto& [name, family] : families_) {
        if (family.samples.empty()) continue;
        if (!family.help.empty()) {
            output += std::format("# HELP {} {}\n", name, family.help);
        }
        output += std::format("# TYPE {} counter\n", name);
        for (const auto& [labels, sample] : family.samples) {
            output += std::format("{}{} {} {}\n", name, format_labels(labels),
                                  sample.value, utils::to_epoch_ms(sample.updated));
        }
    }
    return output;
}

size_t MetricsRegistry::family_count() const {
    std::lock_guard lock(mutex_);
    return families_.size();
}

} // namespace tracebridge
