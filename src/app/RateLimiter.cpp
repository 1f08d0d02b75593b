#include "app/RateLimiter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <utility>

#include "common/Log.hpp"

namespace app {
namespace {

constexpr double kMinimumRps = 0.05;
constexpr auto kMaxSingleWait = std::chrono::milliseconds(1000);

}  // namespace

RateLimiter::RateLimiter(std::string scope, RateLimiterOptions options)
    : scope_(std::move(scope)),
      options_(options),
      currentRps_(options.baseRps),
      tokens_(static_cast<double>(options.maxBurst)),
      lastRefill_(Clock::now()) {
    if (!(options_.baseRps > 0.0)) {
        throw std::invalid_argument("RateLimiter base rps must be > 0 for scope " + scope_);
    }
    if (options_.maxBurst == 0) {
        options_.maxBurst = 1;
        tokens_ = 1.0;
    }
}

double RateLimiter::floor_() const {
    return std::max(kMinimumRps, options_.baseRps * options_.floorFraction);
}

std::size_t RateLimiter::window_budget_() const {
    const auto seconds = static_cast<double>(options_.window.count());
    return std::max<std::size_t>(1, static_cast<std::size_t>(std::ceil(currentRps_ * seconds)));
}

void RateLimiter::refill_(Clock::time_point now) {
    const std::chrono::duration<double> elapsed = now - lastRefill_;
    lastRefill_ = now;
    if (elapsed.count() <= 0.0) {
        return;
    }
    tokens_ = std::min(static_cast<double>(options_.maxBurst), tokens_ + elapsed.count() * currentRps_);
}

void RateLimiter::prune_(Clock::time_point now) {
    const auto horizon = now - options_.window;
    while (!window_.empty() && window_.front() <= horizon) {
        window_.pop_front();
    }
}

RateLimiter::Clock::duration RateLimiter::wait_needed_(Clock::time_point now) const {
    Clock::duration wait = Clock::duration::zero();
    if (tokens_ < 1.0) {
        const double seconds = (1.0 - tokens_) / currentRps_;
        wait = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
    }
    if (window_.size() >= window_budget_() && !window_.empty()) {
        wait = std::max(wait, window_.front() + options_.window - now);
    }
    return wait;
}

bool RateLimiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    refill_(now);
    prune_(now);
    if (wait_needed_(now) > Clock::duration::zero()) {
        return false;
    }
    tokens_ -= 1.0;
    window_.push_back(now);
    return true;
}

bool RateLimiter::acquire(const mdi::common::StopSignal* stop) {
    while (true) {
        if (stop != nullptr && stop->requested()) {
            return false;
        }

        Clock::duration wait;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto now = Clock::now();
            refill_(now);
            prune_(now);
            wait = wait_needed_(now);
            if (wait <= Clock::duration::zero()) {
                tokens_ -= 1.0;
                window_.push_back(now);
                return true;
            }
        }

        // Re-check at least once a second so a rate change is picked up.
        const auto slice = std::min<Clock::duration>(wait, kMaxSingleWait);
        if (stop != nullptr) {
            if (!stop->wait_for(slice)) {
                return false;
            }
        } else {
            std::this_thread::sleep_for(slice);
        }
    }
}

void RateLimiter::report_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++successes_;
    failureRun_ = 0;
    ++successRun_;
    if (successRun_ >= options_.successStreak && currentRps_ < options_.baseRps) {
        const auto previous = currentRps_;
        currentRps_ = std::min(options_.baseRps, currentRps_ + options_.recoveryStep);
        LOG_DEBUG("RateLimiter " << scope_ << " recovering rps " << previous << " -> " << currentRps_);
    }
}

void RateLimiter::report_error(domain::ErrorKind kind, std::string_view message) {
    const bool throttle = kind == domain::ErrorKind::RateLimited || domain::looks_like_throttle(message);

    std::lock_guard<std::mutex> lock(mutex_);
    ++errors_;
    successRun_ = 0;
    ++failureRun_;

    const auto previous = currentRps_;
    if (throttle) {
        ++throttles_;
        currentRps_ = std::max(floor_(), currentRps_ * options_.throttleFactor);
        // Drain the bucket so the cut takes effect immediately.
        tokens_ = std::min(tokens_, 0.0);
        LOG_WARN("RateLimiter " << scope_ << " throttled: rps " << previous << " -> " << currentRps_
                                << " reason=" << (message.empty() ? std::string_view{"rate_limited"} : message));
        return;
    }

    if (failureRun_ > options_.failureRun) {
        const auto failureFloor = std::max(floor_(), options_.baseRps * 0.5);
        currentRps_ = std::max(std::min(currentRps_, failureFloor), currentRps_ * options_.failureFactor);
        if (currentRps_ != previous) {
            LOG_INFO("RateLimiter " << scope_ << " slowing after " << failureRun_
                                    << " consecutive failures: rps " << previous << " -> " << currentRps_);
        }
    }
}

void RateLimiter::report_error(std::string_view message) {
    report_error(domain::ErrorKind::TransientNetwork, message);
}

void RateLimiter::update_base_rps(double rps) {
    if (!(rps > 0.0)) {
        throw std::invalid_argument("RateLimiter base rps must be > 0 for scope " + scope_);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto previousBase = options_.baseRps;
    options_.baseRps = rps;
    if (previousBase > 0.0) {
        currentRps_ = currentRps_ * (rps / previousBase);
    }
    currentRps_ = std::clamp(currentRps_, floor_(), rps);
    LOG_INFO("RateLimiter " << scope_ << " base rps " << previousBase << " -> " << rps);
}

RateLimiterStats RateLimiter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    RateLimiterStats stats;
    stats.scope = scope_;
    stats.baseRps = options_.baseRps;
    stats.currentRps = currentRps_;
    stats.floorRps = floor_();
    const auto horizon = Clock::now() - options_.window;
    stats.windowCount = static_cast<std::size_t>(
        std::count_if(window_.begin(), window_.end(), [&](Clock::time_point tp) { return tp > horizon; }));
    stats.successes = successes_;
    stats.errors = errors_;
    stats.throttles = throttles_;
    return stats;
}

RateLimiter& RateLimiterRegistry::scope(const std::string& name, const RateLimiterOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = limiters_.find(name);
    if (it == limiters_.end()) {
        it = limiters_.emplace(name, std::make_unique<RateLimiter>(name, options)).first;
    }
    return *it->second;
}

RateLimiter* RateLimiterRegistry::find(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = limiters_.find(name);
    return it == limiters_.end() ? nullptr : it->second.get();
}

std::vector<RateLimiterStats> RateLimiterRegistry::stats_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RateLimiterStats> all;
    all.reserve(limiters_.size());
    for (const auto& [name, limiter] : limiters_) {
        (void)name;
        all.push_back(limiter->stats());
    }
    return all;
}

}  // namespace app
