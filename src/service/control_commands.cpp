#include "service/control_commands.hpp"

#include <sstream>

namespace puv {

std::string ControlCommands::handle(const std::string& request) {
    // Only the first whitespace-separated token selects the command.
    std::istringstream iss(request);
    std::string command;
    iss >> command;
    if (command == "reload-models") {
        if (!loader_.reload()) {
            return "ERR reload-models busy\n";
        }
        return "OK reload-models\n";
    }
    if (command == "sweep-now") {
        if (!sweep_.isRunning()) {
            return "ERR sweep-now not-running\n";
        }
        sweep_.triggerNow();
        return "OK sweep-now\n";
    }
    if (command == "status") {
        const ModelStatus model = loader_.status();
        const PeriodicTaskStatus sweep = sweep_.status();
        std::ostringstream oss;
        oss << "OK status model=" << modelLoadStateName(model.state)
            << " load_attempts=" << loader_.loadAttempts()
            << " sweep_running=" << (sweep.running ? 1 : 0)
            << " sweep_iterations=" << sweep.iterations
            << " sweep_faults=" << sweep.faults
            << " topics=" << hub_.topicCount()
            << " connections=" << hub_.connectionCount()
            << "\n";
        if (!model.error.empty()) {
            oss << "model_error " << model.error << "\n";
        }
        if (!sweep.last_error.empty()) {
            oss << "sweep_error " << sweep.last_error << "\n";
        }
        return oss.str();
    }
    if (command == "stats") {
        const CountersSnapshot s = counters_.snapshot();
        std::ostringstream oss;
        oss << "OK stats telemetry_accepted=" << s.telemetry_accepted
            << " telemetry_rejected=" << s.telemetry_rejected
            << " corrections=" << s.corrections
            << " snapped=" << s.snapped_fixes
            << " tracking_log_failures=" << s.tracking_log_failures
            << " notifications_sent=" << s.notifications_sent
            << " notifications_suppressed=" << s.notifications_suppressed
            << " notifications_failed=" << s.notifications_failed
            << " sweeps=" << s.sweeps
            << " live_connections=" << s.live_connections
            << "\n";
        return oss.str();
    }
    return "ERR unknown-command\n";
}

}  // namespace puv
