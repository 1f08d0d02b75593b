#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "common/StopSignal.hpp"
#include "domain/Errors.hpp"

namespace app {

struct RateLimiterOptions {
    double baseRps = 8.0;
    double floorFraction = 0.1;             // floor = baseRps * floorFraction
    std::size_t maxBurst = 10;
    std::chrono::seconds window{60};
    double throttleFactor = 0.5;            // multiplicative cut on a throttle signal
    double failureFactor = 1.0 / 1.5;       // milder cut after a run of plain failures
    std::uint32_t failureRun = 5;
    double recoveryStep = 0.5;              // additive rps regained per success once streak is reached
    std::uint32_t successStreak = 20;
};

struct RateLimiterStats {
    std::string scope;
    double baseRps{0.0};
    double currentRps{0.0};
    double floorRps{0.0};
    std::size_t windowCount{0};
    std::uint64_t successes{0};
    std::uint64_t errors{0};
    std::uint64_t throttles{0};
};

// Adaptive token bucket shared by every caller of one scope (a venue's
// websocket control frames, or its REST history calls).
class RateLimiter {
public:
    RateLimiter(std::string scope, RateLimiterOptions options = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    // Blocks until a token is available. Returns false if stop was requested first.
    bool acquire(const mdi::common::StopSignal* stop = nullptr);
    bool try_acquire();

    void report_success();
    void report_error(domain::ErrorKind kind, std::string_view message = {});
    void report_error(std::string_view message);

    void update_base_rps(double rps);

    RateLimiterStats stats() const;
    const std::string& scope() const noexcept { return scope_; }

private:
    using Clock = std::chrono::steady_clock;

    void refill_(Clock::time_point now);
    void prune_(Clock::time_point now);
    std::size_t window_budget_() const;
    double floor_() const;
    // Time until a token can be taken; zero when one is available now.
    Clock::duration wait_needed_(Clock::time_point now) const;

    const std::string scope_;
    RateLimiterOptions options_;

    mutable std::mutex mutex_;
    double currentRps_;
    double tokens_;
    Clock::time_point lastRefill_;
    std::deque<Clock::time_point> window_;
    std::uint32_t successRun_{0};
    std::uint32_t failureRun_{0};
    std::uint64_t successes_{0};
    std::uint64_t errors_{0};
    std::uint64_t throttles_{0};
};

// Named limiter scopes, created once at startup and passed by reference.
class RateLimiterRegistry {
public:
    RateLimiter& scope(const std::string& name, const RateLimiterOptions& options);
    RateLimiter* find(const std::string& name);
    std::vector<RateLimiterStats> stats_all() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<RateLimiter>> limiters_;
};

}  // namespace app
