#pragma once

#include <string>

#include "core/counters.hpp"
#include "correction/model_loader.hpp"
#include "realtime/broadcast_hub.hpp"
#include "sched/periodic_task.hpp"

namespace puv {

// Text commands served on the control socket: status, reload-models, sweep-now, stats.
class ControlCommands {
public:
    ControlCommands(ModelLoader& loader, PeriodicTask& sweep, ServiceCounters& counters, BroadcastHub& hub)
        : loader_(loader), sweep_(sweep), counters_(counters), hub_(hub) {}

    std::string handle(const std::string& request);

private:
    ModelLoader& loader_;
    PeriodicTask& sweep_;
    ServiceCounters& counters_;
    BroadcastHub& hub_;
};

}  // namespace puv
