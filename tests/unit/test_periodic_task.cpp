#include "sched/periodic_task.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

template <typename Pred>
bool waitFor(Pred pred, int timeout_ms) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

}  // namespace

int main() {
    std::string err;

    {
        std::atomic<int> runs{0};
        puv::PeriodicTask task("ticker", [&runs]() { runs.fetch_add(1); }, 20, 20);
        if (!task.start(err) || !task.isRunning()) {
            std::cerr << "start failed: " << err << "\n";
            return 1;
        }
        if (!task.start(err)) {
            std::cerr << "second start should be a harmless no-op\n";
            return 1;
        }
        if (!waitFor([&runs]() { return runs.load() >= 3; }, 2000)) {
            std::cerr << "task did not repeat, runs=" << runs.load() << "\n";
            return 1;
        }
        task.stop();
        const int after_stop = runs.load();
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        if (task.isRunning() || runs.load() != after_stop) {
            std::cerr << "task kept running after stop\n";
            return 1;
        }
        task.stop();
    }

    {
        // Long interval: only triggerNow can produce the second iteration quickly.
        std::atomic<int> runs{0};
        puv::PeriodicTask task("sweep", [&runs]() { runs.fetch_add(1); }, 60000, 1000);
        if (!task.start(err)) {
            return 1;
        }
        if (!waitFor([&runs]() { return runs.load() == 1; }, 2000)) {
            std::cerr << "first iteration should run immediately\n";
            return 1;
        }
        task.triggerNow();
        if (!waitFor([&runs]() { return runs.load() == 2; }, 2000)) {
            std::cerr << "triggerNow should wake the loop\n";
            return 1;
        }
        const auto t0 = std::chrono::steady_clock::now();
        task.stop();
        if (std::chrono::steady_clock::now() - t0 > std::chrono::milliseconds(1000)) {
            std::cerr << "stop should not wait out the interval\n";
            return 1;
        }
    }

    {
        // A throwing body is recorded and the loop survives.
        std::atomic<int> runs{0};
        puv::PeriodicTask task("flaky", [&runs]() {
            if (runs.fetch_add(1) == 0) {
                throw std::runtime_error("registry unreachable");
            }
        }, 10, 10);
        if (!task.start(err)) {
            return 1;
        }
        if (!waitFor([&runs]() { return runs.load() >= 3; }, 2000)) {
            std::cerr << "loop should survive a throwing iteration\n";
            return 1;
        }
        task.stop();
        const puv::PeriodicTaskStatus st = task.status();
        if (st.faults != 1 || st.last_error != "registry unreachable" || st.iterations < 3 || st.running) {
            std::cerr << "status should record the fault\n";
            return 1;
        }
    }

    puv::PeriodicTask no_body("empty", puv::PeriodicTask::Body(), 10, 10);
    if (no_body.start(err)) {
        std::cerr << "task without a body must not start\n";
        return 1;
    }
    puv::PeriodicTask zero("zero", []() {}, 0, 10);
    if (zero.start(err)) {
        std::cerr << "zero interval must be rejected\n";
        return 1;
    }

    return 0;
}
