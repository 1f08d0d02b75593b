#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace app {

enum class HealthState {
    Healthy,
    Degraded,
    FailedOver,
};

std::string_view to_string(HealthState state) noexcept;

struct ComponentHealth {
    std::string name;
    HealthState state{HealthState::Healthy};
    std::uint32_t consecutiveFailures{0};
    std::uint64_t totalFailures{0};
    std::optional<std::chrono::system_clock::time_point> lastFailure;
    std::optional<std::chrono::system_clock::time_point> cooldownUntil;
    std::string lastError;
};

struct HealthOptions {
    std::uint32_t threshold = 5;
    std::chrono::seconds window{60};
    std::chrono::seconds cooldown{60};
};

// Process-wide table of named component states. Failures inside the rolling
// window past the threshold put a component into failover until the cooldown
// expires; it then sits in Degraded until a success clears it.
class HealthRegistry {
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit HealthRegistry(HealthOptions options = {}, NowFn now = {});

    HealthRegistry(const HealthRegistry&) = delete;
    HealthRegistry& operator=(const HealthRegistry&) = delete;

    void register_component(const std::string& name);
    void handle_failure(const std::string& name, std::string_view error);
    void record_success(const std::string& name);

    // False while the component is failed over and its cooldown is running.
    bool allows_work(const std::string& name);
    // Remaining cooldown, zero when work is allowed.
    std::chrono::milliseconds cooldown_remaining(const std::string& name);

    ComponentHealth status(const std::string& name);
    std::map<std::string, ComponentHealth> status_all();

private:
    struct Entry {
        ComponentHealth health;
        std::deque<Clock::time_point> failures;
    };

    Entry& entry_(const std::string& name);
    void expire_cooldown_(Entry& entry, Clock::time_point now);
    Clock::time_point now_() const;

    const HealthOptions options_;
    const NowFn nowFn_;

    std::mutex mutex_;
    std::map<std::string, Entry> components_;
};

}  // namespace app
