#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace puv {

struct PeriodicTaskStatus {
    bool running{false};
    uint64_t iterations{0};
    uint64_t faults{0};
    std::string last_error;
};

// Runs body every interval_ms on its own thread. A body that throws is logged and
// the next run is delayed by backoff_ms instead.
class PeriodicTask {
public:
    using Body = std::function<void()>;

    PeriodicTask(std::string name, Body body, int interval_ms, int backoff_ms);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    bool start(std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }

    // Wakes the loop for an immediate iteration.
    void triggerNow();

    PeriodicTaskStatus status() const;
    const std::string& name() const { return name_; }

private:
    void runLoop();

    std::string name_;
    Body body_;
    int interval_ms_;
    int backoff_ms_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> iterations_{0};
    std::atomic<uint64_t> faults_{0};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool wake_{false};
    std::string last_error_;
    std::thread thread_;
};

}  // namespace puv
