#include "service/tracking_service.hpp"

#include <cmath>
#include <iostream>

#include "core/math_utils.hpp"
#include "service/messages.hpp"

namespace puv {

double groundTruthErrorMeters(const GeoPoint& corrected, const GeoPoint& truth) {
    constexpr double kMetersPerDegree = 111320.0;
    const double lat_m = std::abs(corrected.latitude - truth.latitude) * kMetersPerDegree;
    const double lon_m = std::abs(corrected.longitude - truth.longitude) * kMetersPerDegree *
                         std::cos(degreesToRadians(std::abs(corrected.latitude)));
    return std::sqrt(lat_m * lat_m + lon_m * lon_m);
}

TrackingService::TrackingService(const TelemetryCodec& codec, ModelLoader& loader, RouteSnapper& snapper,
                                 TrackingCollaborators stores, ProximityNotifier& notifier, BroadcastHub& hub,
                                 ServiceCounters& counters, const TelemetryConfig& cfg, MillisClock wall_clock)
    : codec_(codec),
      loader_(loader),
      corrector_(loader),
      snapper_(snapper),
      stores_(stores),
      notifier_(notifier),
      hub_(hub),
      counters_(counters),
      cfg_(cfg),
      wall_clock_(std::move(wall_clock)) {}

IngestResult TrackingService::ingestEnvelope(const std::string& envelope_b64) {
    const DecodeResult decoded = codec_.decode(envelope_b64);
    if (!decoded.ok) {
        counters_.addTelemetryRejected();
        IngestResult result;
        result.kind = decoded.kind;
        result.error = decoded.error;
        return result;
    }
    return ingestReading(decoded.reading);
}

IngestResult TrackingService::ingestReading(const TelemetryReading& reading) {
    IngestResult result;

    if (loader_.status().state == ModelLoadState::NotStarted) {
        loader_.start();
    }
    const CorrectionResult corrected = corrector_.correct(reading);
    if (!corrected.ok) {
        counters_.addTelemetryRejected();
        result.kind = corrected.kind;
        result.error = corrected.error;
        return result;
    }

    std::optional<Vehicle> vehicle;
    if (!reading.device_id.empty()) {
        try {
            vehicle = stores_.vehicles.findByDevice(reading.device_id);
        } catch (const std::exception& e) {
            std::cerr << "[telemetry] vehicle lookup for device " << reading.device_id << " failed: " << e.what() << '\n';
        }
    }

    if (vehicle) {
        ErrorKind snap_note = ErrorKind::None;
        result.corrected = snapper_.snap(vehicle->route_id, corrected.position, &snap_note);
        if (snap_note != ErrorKind::None) {
            result.warnings.push_back(snap_note);
        }
    } else {
        result.corrected = CorrectedPosition{corrected.position, false};
    }

    if (cfg_.ground_truth_comparison && reading.ground_truth) {
        result.testing = GroundTruthReport{*reading.ground_truth,
                                           groundTruthErrorMeters(result.corrected.position, *reading.ground_truth)};
    }

    counters_.addTelemetryAccepted();
    counters_.addCorrection(result.corrected.snapped);

    if (!vehicle) {
        std::cerr << "[telemetry] no vehicle for device '" << reading.device_id << "', location not stored\n";
        result.ok = true;
        return result;
    }

    bool written = false;
    try {
        written = stores_.vehicles.updateLocation(vehicle->id, result.corrected.position);
        if (written && vehicle->status == VehicleStatus::Unavailable && vehicle->status_detail == "inactive") {
            stores_.vehicles.updateStatus(vehicle->id, VehicleStatus::Available, "");
            vehicle->status = VehicleStatus::Available;
            vehicle->status_detail.clear();
        }
    } catch (const std::exception& e) {
        std::cerr << "[telemetry] location write for vehicle " << vehicle->id << " failed: " << e.what() << '\n';
    }

    const int64_t now = wall_clock_();
    if (written) {
        result.vehicle_id = vehicle->id;
        vehicle->location = result.corrected.position;
        hub_.publish(vehicleLocationJson(*vehicle, result.corrected.snapped, now), topics::vehicle(vehicle->id));
        publishFleet(vehicle->fleet_id);
    } else {
        result.warnings.push_back(ErrorKind::Persistence);
        std::cerr << "[telemetry] location for vehicle " << vehicle->id << " not written\n";
    }

    TrackingLogRecord record;
    record.vehicle_id = vehicle->id;
    // Keyed by the registry's device id so readers find it whatever form the device sent.
    record.device_id = vehicle->device_id;
    record.fleet_id = vehicle->fleet_id;
    record.timestamp_ms = now;
    record.speed_mps = corrected.speed_mps;
    record.raw = GeoPoint{corrected.wls.latitude_deg, corrected.wls.longitude_deg};
    record.corrected = result.corrected.position;
    record.snapped = result.corrected.snapped;
    std::string error;
    try {
        if (!stores_.tracking.append(record, error)) {
            counters_.addTrackingLogFailure();
            result.warnings.push_back(ErrorKind::Persistence);
            std::cerr << "[telemetry] tracking log append failed: " << error << '\n';
        }
    } catch (const std::exception& e) {
        counters_.addTrackingLogFailure();
        result.warnings.push_back(ErrorKind::Persistence);
        std::cerr << "[telemetry] tracking log append threw: " << e.what() << '\n';
    }

    result.ok = true;
    return result;
}

bool TrackingService::updateRiderLocation(const std::string& user_id, const GeoPoint& location,
                                          std::vector<NotifyOutcome>& outcomes, std::string& error) {
    try {
        if (!stores_.users.updateLocation(user_id, location)) {
            error = "User " + user_id + " not found";
            return false;
        }
    } catch (const std::exception& e) {
        error = std::string("rider location write failed: ") + e.what();
        return false;
    }
    return notifier_.checkRider(user_id, outcomes, error);
}

int TrackingService::markInactiveVehicles(int threshold_s) {
    const int64_t now = wall_clock_();
    int marked = 0;
    for (const auto& v : stores_.vehicles.listAll()) {
        if (v.device_id.empty() || v.status == VehicleStatus::Unavailable) {
            continue;
        }
        const auto latest = stores_.tracking.latest(v.device_id);
        // Devices that never reported keep their registry status.
        if (!latest || now - latest->timestamp_ms <= static_cast<int64_t>(threshold_s) * 1000) {
            continue;
        }
        if (stores_.vehicles.updateStatus(v.id, VehicleStatus::Unavailable, "inactive")) {
            ++marked;
            std::cout << "[inactivity] vehicle " << v.id << " (device " << v.device_id << ") marked unavailable\n";
            publishFleet(v.fleet_id);
        }
    }
    return marked;
}

void TrackingService::publishCounts() {
    hub_.publish(countsSnapshot(), topics::counts());
}

void TrackingService::publishFleet(const std::string& fleet_id) {
    if (fleet_id.empty()) {
        return;
    }
    try {
        hub_.publish(fleetSnapshot(fleet_id), topics::fleet(fleet_id));
    } catch (const std::exception& e) {
        std::cerr << "[telemetry] fleet list for " << fleet_id << " unavailable: " << e.what() << '\n';
    }
}

std::string TrackingService::vehicleSnapshot(const std::string& vehicle_id) {
    const auto v = stores_.vehicles.findById(vehicle_id);
    if (!v) {
        Vehicle missing;
        missing.id = vehicle_id;
        return vehicleLocationJson(missing, false, wall_clock_());
    }
    return vehicleLocationJson(*v, false, wall_clock_());
}

std::string TrackingService::fleetSnapshot(const std::string& fleet_id) {
    return fleetVehiclesJson(fleet_id, stores_.vehicles.listByFleet(fleet_id));
}

std::string TrackingService::countsSnapshot() {
    return countsJson(stores_.vehicles.listAll(), stores_.users.count());
}

bool TrackingService::riderKnown(const std::string& user_id) {
    return stores_.users.findById(user_id).has_value();
}

}  // namespace puv
