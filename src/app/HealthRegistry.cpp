#include "app/HealthRegistry.hpp"

#include <utility>

#include "common/Log.hpp"

namespace app {

std::string_view to_string(HealthState state) noexcept {
    switch (state) {
    case HealthState::Healthy:
        return "healthy";
    case HealthState::Degraded:
        return "degraded";
    case HealthState::FailedOver:
        return "failed_over";
    }
    return "unknown";
}

HealthRegistry::HealthRegistry(HealthOptions options, NowFn now)
    : options_(options), nowFn_(std::move(now)) {}

HealthRegistry::Clock::time_point HealthRegistry::now_() const {
    return nowFn_ ? nowFn_() : Clock::now();
}

HealthRegistry::Entry& HealthRegistry::entry_(const std::string& name) {
    auto it = components_.find(name);
    if (it == components_.end()) {
        Entry entry;
        entry.health.name = name;
        it = components_.emplace(name, std::move(entry)).first;
    }
    return it->second;
}

void HealthRegistry::expire_cooldown_(Entry& entry, Clock::time_point now) {
    auto& health = entry.health;
    if (health.state != HealthState::FailedOver || !health.cooldownUntil) {
        return;
    }
    if (now < *health.cooldownUntil) {
        return;
    }
    health.state = HealthState::Degraded;
    health.cooldownUntil.reset();
    health.consecutiveFailures = 0;
    entry.failures.clear();
    LOG_INFO("Health " << health.name << " cooldown elapsed, now degraded");
}

void HealthRegistry::register_component(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool existed = components_.count(name) != 0;
    entry_(name);
    if (!existed) {
        LOG_DEBUG("Health registered component " << name);
    }
}

void HealthRegistry::handle_failure(const std::string& name, std::string_view error) {
    const auto now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_(name);
    expire_cooldown_(entry, now);

    auto& health = entry.health;
    ++health.consecutiveFailures;
    ++health.totalFailures;
    health.lastFailure = now;
    health.lastError = std::string(error);

    entry.failures.push_back(now);
    const auto horizon = now - options_.window;
    while (!entry.failures.empty() && entry.failures.front() < horizon) {
        entry.failures.pop_front();
    }

    if (health.state == HealthState::FailedOver) {
        return;
    }

    if (entry.failures.size() >= options_.threshold) {
        health.state = HealthState::FailedOver;
        health.cooldownUntil = now + options_.cooldown;
        LOG_WARN("Health " << name << " failed over after " << entry.failures.size() << " failures in "
                           << options_.window.count() << "s; cooldown " << options_.cooldown.count()
                           << "s; last error: " << error);
        return;
    }

    if (health.state == HealthState::Healthy) {
        health.state = HealthState::Degraded;
    }
    LOG_WARN("Health " << name << " failure " << entry.failures.size() << "/" << options_.threshold << ": "
                       << error);
}

void HealthRegistry::record_success(const std::string& name) {
    const auto now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_(name);
    expire_cooldown_(entry, now);

    auto& health = entry.health;
    health.consecutiveFailures = 0;
    if (health.state == HealthState::Degraded) {
        health.state = HealthState::Healthy;
        entry.failures.clear();
        LOG_INFO("Health " << name << " recovered");
    }
}

bool HealthRegistry::allows_work(const std::string& name) {
    const auto now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_(name);
    expire_cooldown_(entry, now);
    return entry.health.state != HealthState::FailedOver;
}

std::chrono::milliseconds HealthRegistry::cooldown_remaining(const std::string& name) {
    const auto now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_(name);
    expire_cooldown_(entry, now);
    if (entry.health.state != HealthState::FailedOver || !entry.health.cooldownUntil) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(*entry.health.cooldownUntil - now);
}

ComponentHealth HealthRegistry::status(const std::string& name) {
    const auto now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entry_(name);
    expire_cooldown_(entry, now);
    return entry.health;
}

std::map<std::string, ComponentHealth> HealthRegistry::status_all() {
    const auto now = now_();

    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, ComponentHealth> all;
    for (auto& [name, entry] : components_) {
        expire_cooldown_(entry, now);
        all.emplace(name, entry.health);
    }
    return all;
}

}  // namespace app
