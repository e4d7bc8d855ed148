#include "core/counters.hpp"

namespace puv {

void ServiceCounters::addCorrection(bool snapped) {
    corrections_.fetch_add(1);
    if (snapped) {
        snapped_fixes_.fetch_add(1);
    }
}

CountersSnapshot ServiceCounters::snapshot() const {
    CountersSnapshot out;
    out.telemetry_accepted = telemetry_accepted_.load();
    out.telemetry_rejected = telemetry_rejected_.load();
    out.corrections = corrections_.load();
    out.snapped_fixes = snapped_fixes_.load();
    out.tracking_log_failures = tracking_log_failures_.load();
    out.notifications_sent = notifications_sent_.load();
    out.notifications_suppressed = notifications_suppressed_.load();
    out.notifications_failed = notifications_failed_.load();
    out.sweeps = sweeps_.load();
    out.live_connections = live_connections_.load();
    return out;
}

}  // namespace puv
