#include "common/Metrics.hpp"

#include <utility>

namespace mdi::common::metrics {

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey].value += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
    if (value == 0.0) {
        if (!gauge.zeroSince.has_value()) {
            gauge.zeroSince = now;
        }
    }
    else {
        gauge.zeroSince.reset();
    }
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second.value;
}

std::optional<double> Registry::gauge(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = gauges_.find(gaugeKey);
    if (it == gauges_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters.reserve(counters_.size());
    for (const auto& [key, counter] : counters_) {
        snapshot.counters.emplace(key, CounterSnapshot{counter.value});
    }

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(
            key,
            GaugeSnapshot{gauge.value, gauge.updatedAt, gauge.zeroSince});
    }

    return snapshot;
}

}  // namespace mdi::common::metrics
