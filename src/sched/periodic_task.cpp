#include "sched/periodic_task.hpp"

#include <chrono>
#include <iostream>

namespace puv {

PeriodicTask::PeriodicTask(std::string name, Body body, int interval_ms, int backoff_ms)
    : name_(std::move(name)), body_(std::move(body)), interval_ms_(interval_ms), backoff_ms_(backoff_ms) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start(std::string& error) {
    if (!body_) {
        error = name_ + ": no body";
        return false;
    }
    if (interval_ms_ <= 0 || backoff_ms_ < 0) {
        error = name_ + ": interval must be > 0 and backoff >= 0";
        return false;
    }
    if (running_.exchange(true)) {
        error.clear();
        return true;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_ = false;
    }
    thread_ = std::thread(&PeriodicTask::runLoop, this);
    std::cout << "[sched] " << name_ << " started, every " << interval_ms_ << " ms\n";
    error.clear();
    return true;
}

void PeriodicTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
        wake_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    std::cout << "[sched] " << name_ << " stopped\n";
}

void PeriodicTask::triggerNow() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wake_ = true;
    }
    cv_.notify_all();
}

PeriodicTaskStatus PeriodicTask::status() const {
    PeriodicTaskStatus s;
    s.running = running_.load();
    s.iterations = iterations_.load();
    s.faults = faults_.load();
    std::lock_guard<std::mutex> lock(mutex_);
    s.last_error = last_error_;
    return s;
}

void PeriodicTask::runLoop() {
    while (running_.load()) {
        int delay_ms = interval_ms_;
        try {
            body_();
        } catch (const std::exception& e) {
            faults_.fetch_add(1);
            delay_ms = backoff_ms_;
            std::cerr << "[sched] " << name_ << " iteration failed: " << e.what() << '\n';
            std::lock_guard<std::mutex> lock(mutex_);
            last_error_ = e.what();
        }
        iterations_.fetch_add(1);

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this]() { return wake_ || !running_.load(); });
        wake_ = false;
    }
}

}  // namespace puv
