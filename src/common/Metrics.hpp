#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mdi::common::metrics {

class Registry {
public:
    struct CounterSnapshot {
        std::uint64_t value{0};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, CounterSnapshot> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;
    };

    Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void incrementCounter(const std::string& counterKey,
                          std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);

    std::uint64_t counter(const std::string& counterKey) const;
    std::optional<double> gauge(const std::string& gaugeKey) const;

    Snapshot snapshot() const;

private:
    struct CounterMetrics {
        std::uint64_t value{0};
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
        std::optional<std::chrono::steady_clock::time_point> zeroSince{};
    };

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CounterMetrics> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace mdi::common::metrics
