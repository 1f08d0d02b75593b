#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace mdi::common {

// One-shot cancellation flag shared between an owner and the task it runs.
// Sleeping through wait_for() wakes up as soon as stop is requested, so
// backoff, throttling and ticker delays never hold up shutdown.
class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }

    bool requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopped_;
    }

    // Returns true when the full delay elapsed, false when interrupted by stop.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> delay) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, delay, [this]() { return stopped_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool stopped_ = false;
};

}  // namespace mdi::common
