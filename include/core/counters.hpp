#pragma once

#include <atomic>
#include <cstdint>

namespace puv {

struct CountersSnapshot {
    uint64_t telemetry_accepted{0};
    uint64_t telemetry_rejected{0};
    uint64_t corrections{0};
    uint64_t snapped_fixes{0};
    uint64_t tracking_log_failures{0};
    uint64_t notifications_sent{0};
    uint64_t notifications_suppressed{0};
    uint64_t notifications_failed{0};
    uint64_t sweeps{0};
    int live_connections{0};
};

class ServiceCounters {
public:
    void addTelemetryAccepted() { telemetry_accepted_.fetch_add(1); }
    void addTelemetryRejected() { telemetry_rejected_.fetch_add(1); }
    void addCorrection(bool snapped);
    void addTrackingLogFailure() { tracking_log_failures_.fetch_add(1); }
    void addNotificationSent() { notifications_sent_.fetch_add(1); }
    void addNotificationSuppressed() { notifications_suppressed_.fetch_add(1); }
    void addNotificationFailed() { notifications_failed_.fetch_add(1); }
    void addSweep() { sweeps_.fetch_add(1); }
    void connectionOpened() { live_connections_.fetch_add(1); }
    void connectionClosed() { live_connections_.fetch_sub(1); }

    CountersSnapshot snapshot() const;

private:
    std::atomic<uint64_t> telemetry_accepted_{0};
    std::atomic<uint64_t> telemetry_rejected_{0};
    std::atomic<uint64_t> corrections_{0};
    std::atomic<uint64_t> snapped_fixes_{0};
    std::atomic<uint64_t> tracking_log_failures_{0};
    std::atomic<uint64_t> notifications_sent_{0};
    std::atomic<uint64_t> notifications_suppressed_{0};
    std::atomic<uint64_t> notifications_failed_{0};
    std::atomic<uint64_t> sweeps_{0};
    std::atomic<int> live_connections_{0};
};

}  // namespace puv
