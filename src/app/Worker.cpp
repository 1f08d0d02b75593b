#include "app/Worker.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"

namespace app {

Worker::Worker(std::string name, std::function<void()> body)
    : name_(std::move(name)), body_(std::move(body)), completion_(std::make_shared<Completion>()) {
    if (!body_) {
        throw std::invalid_argument("Worker " + name_ + " requires a body");
    }
}

Worker::~Worker() {
    if (!thread_.joinable()) {
        return;
    }
    if (finished() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        return;
    }
    if (thread_.get_id() == std::this_thread::get_id()) {
        // Last owner released from inside the body.
        thread_.detach();
        return;
    }
    LOG_WARN("Worker " << name_ << " still running at destruction; detaching");
    thread_.detach();
}

void Worker::start() {
    if (thread_.joinable() || joined_) {
        throw std::logic_error("Worker " + name_ + " already started");
    }
    // The thread owns the body and drops it when done, so captures of the
    // owner do not outlive the run.
    thread_ = std::thread([name = name_, body = std::move(body_), completion = completion_]() mutable {
        try {
            body();
        } catch (const std::exception& ex) {
            LOG_ERR("Worker " << name << " terminated with error: " << ex.what());
        }
        {
            std::lock_guard<std::mutex> lock(completion->mutex);
            completion->done = true;
        }
        completion->cv.notify_all();
        body = nullptr;
    });
}

bool Worker::finished() const {
    std::lock_guard<std::mutex> lock(completion_->mutex);
    return completion_->done;
}

bool Worker::wait_for(std::chrono::milliseconds timeout) {
    if (joined_) {
        return true;
    }
    if (!thread_.joinable()) {
        return false;
    }
    {
        std::unique_lock<std::mutex> lock(completion_->mutex);
        if (!completion_->cv.wait_for(lock, timeout, [this]() { return completion_->done; })) {
            return false;
        }
    }
    thread_.join();
    joined_ = true;
    return true;
}

void Worker::abandon() {
    if (thread_.joinable()) {
        LOG_WARN("Worker " << name_ << " abandoned");
        thread_.detach();
    }
}

}  // namespace app
