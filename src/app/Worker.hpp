#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace app {

// A named background thread whose owner can wait for it with a deadline and
// abandon it if it does not finish in time.
class Worker {
public:
    Worker(std::string name, std::function<void()> body);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    void start();

    // True once the body has returned and the thread has been joined.
    bool wait_for(std::chrono::milliseconds timeout);
    void abandon();

    bool started() const noexcept { return thread_.joinable() || joined_; }
    bool finished() const;
    const std::string& name() const noexcept { return name_; }

private:
    struct Completion {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
    };

    const std::string name_;
    std::function<void()> body_;
    std::shared_ptr<Completion> completion_;
    std::thread thread_;
    bool joined_ = false;
};

}  // namespace app
