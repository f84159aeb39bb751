#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace relay::transfer {

/**
 * @brief Runs a task at a fixed cadence on its own thread
 *
 * stop() wakes the worker, waits for an in-flight tick to finish and joins.
 * Once stop() returns the task is never invoked again. The destructor calls
 * stop(), so a scoped emitter cannot outlive the phase that owns it.
 */
class PeriodicEmitter {
public:
    PeriodicEmitter(std::chrono::milliseconds interval, std::function<void()> task);
    ~PeriodicEmitter();

    PeriodicEmitter(const PeriodicEmitter&) = delete;
    PeriodicEmitter& operator=(const PeriodicEmitter&) = delete;

    void stop();

    [[nodiscard]] bool running() const;

private:
    void run();

    std::chrono::milliseconds interval_;
    std::function<void()> task_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::thread worker_;
};

} // namespace relay::transfer
