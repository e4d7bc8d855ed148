#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/counters.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include "store/stores.hpp"

namespace puv {

struct NotifyOutcome {
    bool success{false};
    bool in_range{false};
    ErrorKind kind{ErrorKind::None}; // PushDispatch on failure, Persistence when sent but not logged
    double distance_m{0.0};
    std::string message;
    std::string vehicle_id;
};

struct SweepSummary {
    std::size_t checks{0};
    std::size_t notifications{0};
    std::size_t riders{0};
    std::size_t fleets{0};
};

// Distance check, cooldown dedup and push dispatch for (rider, vehicle) pairs.
// checkAndNotify reports every outcome as a value; collaborator faults never escape it.
// A (rider, vehicle) pair is reserved from the cooldown lookup until its record is written,
// so concurrent checks of the same pair dispatch at most once.
class ProximityNotifier {
public:
    ProximityNotifier(VehicleRegistry& vehicles, UserDirectory& users, NotificationLogStore& log,
                      PushGateway& push, const ProximityConfig& cfg, ServiceCounters* counters = nullptr,
                      MillisClock wall_clock = nowWallMs);

    NotifyOutcome checkAndNotify(const Rider& rider, const Vehicle& vehicle);

    // After a rider location write: that rider against the available vehicles of their fleet.
    bool checkRider(const std::string& user_id, std::vector<NotifyOutcome>& outcomes, std::string& error);

    // Every notifiable rider, grouped by fleet.
    SweepSummary sweep();

private:
    using PairKey = std::pair<std::string, std::string>;

    std::vector<Vehicle> availableWithLocation(const std::string& fleet_id);
    void release(const PairKey& key);

    VehicleRegistry& vehicles_;
    UserDirectory& users_;
    NotificationLogStore& log_;
    PushGateway& push_;
    ProximityConfig cfg_;
    ServiceCounters* counters_;
    MillisClock wall_clock_;
    std::mutex pending_mutex_;
    std::set<PairKey> pending_; // pairs between cooldown check and record write
};

}  // namespace puv
