#include "notify/proximity_notifier.hpp"

#include <cmath>
#include <iostream>
#include <map>

#include "core/math_utils.hpp"

namespace puv {

ProximityNotifier::ProximityNotifier(VehicleRegistry& vehicles, UserDirectory& users, NotificationLogStore& log,
                                     PushGateway& push, const ProximityConfig& cfg, ServiceCounters* counters,
                                     MillisClock wall_clock)
    : vehicles_(vehicles),
      users_(users),
      log_(log),
      push_(push),
      cfg_(cfg),
      counters_(counters),
      wall_clock_(std::move(wall_clock)) {}

NotifyOutcome ProximityNotifier::checkAndNotify(const Rider& rider, const Vehicle& vehicle) {
    NotifyOutcome out;
    out.vehicle_id = vehicle.id;
    if (!rider.location || !vehicle.location) {
        out.message = "location unavailable";
        return out;
    }

    out.distance_m = haversineMeters(*rider.location, *vehicle.location);
    if (out.distance_m > cfg_.radius_m) {
        out.message = "out of range";
        return out;
    }
    out.in_range = true;

    const int64_t now = wall_clock_();
    const PairKey key{rider.id, vehicle.id};
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        bool recent = pending_.count(key) > 0;
        if (!recent) {
            try {
                recent = log_.findRecent(rider.id, vehicle.id, now - static_cast<int64_t>(cfg_.cooldown_s) * 1000).has_value();
            } catch (const std::exception& e) {
                std::cerr << "[proximity] cooldown lookup failed for " << rider.id << "/" << vehicle.id << ": " << e.what() << '\n';
                out.message = "cooldown lookup failed";
                return out;
            }
        }
        if (recent) {
            out.message = "recent notification exists";
            if (counters_ != nullptr) {
                counters_->addNotificationSuppressed();
            }
            return out;
        }
        pending_.insert(key);
    }
    struct Reservation {
        ProximityNotifier& owner;
        const PairKey& key;
        ~Reservation() { owner.release(key); }
    } reservation{*this, key};

    if (rider.push_token.empty()) {
        out.message = "no push token";
        return out;
    }

    const long rounded = std::lround(out.distance_m);
    PushMessage msg;
    msg.title = cfg_.title;
    msg.body = "A PUV is " + std::to_string(rounded) + "m away from you!";
    msg.data["type"] = "proximity";
    msg.data["vehicle_id"] = vehicle.id;
    msg.data["plate"] = vehicle.plate;
    msg.data["distance_m"] = std::to_string(rounded);

    std::string error;
    bool sent = false;
    try {
        sent = push_.send(PushTarget{rider.id, rider.push_token}, msg, error);
    } catch (const std::exception& e) {
        error = e.what();
    }
    if (!sent) {
        std::cerr << "[proximity] push to " << rider.id << " failed: " << error << '\n';
        out.kind = ErrorKind::PushDispatch;
        out.message = "push dispatch failed: " + error;
        if (counters_ != nullptr) {
            counters_->addNotificationFailed();
        }
        return out;
    }

    NotificationRecord record;
    record.user_id = rider.id;
    record.vehicle_id = vehicle.id;
    record.timestamp_ms = now;
    record.success = true;
    record.distance_m = out.distance_m;
    try {
        if (!log_.append(record, error)) {
            out.kind = ErrorKind::Persistence;
            std::cerr << "[proximity] notification log append failed: " << error << '\n';
        }
    } catch (const std::exception& e) {
        out.kind = ErrorKind::Persistence;
        std::cerr << "[proximity] notification log append threw: " << e.what() << '\n';
    }

    if (counters_ != nullptr) {
        counters_->addNotificationSent();
    }
    out.success = true;
    out.message = "notification sent";
    return out;
}

void ProximityNotifier::release(const PairKey& key) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(key);
}

std::vector<Vehicle> ProximityNotifier::availableWithLocation(const std::string& fleet_id) {
    std::vector<Vehicle> out;
    for (auto& v : vehicles_.listByFleet(fleet_id)) {
        if (v.status == VehicleStatus::Available && v.location) {
            out.push_back(std::move(v));
        }
    }
    return out;
}

bool ProximityNotifier::checkRider(const std::string& user_id, std::vector<NotifyOutcome>& outcomes, std::string& error) {
    outcomes.clear();
    try {
        const auto rider = users_.findById(user_id);
        if (!rider) {
            error = "user not found: " + user_id;
            return false;
        }
        if (!rider->location) {
            error.clear();
            return true;
        }
        for (const auto& v : availableWithLocation(rider->fleet_id)) {
            outcomes.push_back(checkAndNotify(*rider, v));
        }
    } catch (const std::exception& e) {
        error = std::string("proximity check failed: ") + e.what();
        return false;
    }
    error.clear();
    return true;
}

SweepSummary ProximityNotifier::sweep() {
    SweepSummary summary;
    std::map<std::string, std::vector<Rider>> by_fleet;
    for (auto& r : users_.listNotifiable()) {
        if (r.location) {
            by_fleet[r.fleet_id].push_back(std::move(r));
        }
    }

    for (const auto& kv : by_fleet) {
        const auto vehicles = availableWithLocation(kv.first);
        ++summary.fleets;
        summary.riders += kv.second.size();
        for (const auto& rider : kv.second) {
            for (const auto& v : vehicles) {
                ++summary.checks;
                if (checkAndNotify(rider, v).success) {
                    ++summary.notifications;
                }
            }
        }
    }

    if (counters_ != nullptr) {
        counters_->addSweep();
    }
    return summary;
}

}  // namespace puv
