#include "relay/transfer/ticker.hpp"

#include <spdlog/spdlog.h>

namespace relay::transfer {

PeriodicEmitter::PeriodicEmitter(std::chrono::milliseconds interval, std::function<void()> task)
    : interval_(interval),
      task_(std::move(task)) {
    worker_ = std::thread([this] { run(); });
}

PeriodicEmitter::~PeriodicEmitter() {
    stop();
}

void PeriodicEmitter::stop() {
    {
        std::lock_guard lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool PeriodicEmitter::running() const {
    std::lock_guard lock(mutex_);
    return !stop_requested_;
}

void PeriodicEmitter::run() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }
        lock.unlock();
        try {
            task_();
        } catch (const std::exception& e) {
            spdlog::warn("Periodic task failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace relay::transfer
