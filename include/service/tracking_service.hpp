#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/counters.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include "correction/model_loader.hpp"
#include "correction/position_corrector.hpp"
#include "ingest/telemetry_codec.hpp"
#include "notify/proximity_notifier.hpp"
#include "realtime/broadcast_hub.hpp"
#include "routing/route_snapper.hpp"
#include "store/stores.hpp"

namespace puv {

struct GroundTruthReport {
    GeoPoint ground_truth;
    double error_m{0.0};
};

struct IngestResult {
    bool ok{false};
    ErrorKind kind{ErrorKind::None};
    std::string error;
    CorrectedPosition corrected;
    std::string vehicle_id; // empty when nothing was written back
    std::optional<GroundTruthReport> testing;
    std::vector<ErrorKind> warnings; // GeometryUnavailable, Persistence; never fail the request
};

// Flat-earth error against a ground-truth fix, 111320 m per degree of latitude.
double groundTruthErrorMeters(const GeoPoint& corrected, const GeoPoint& truth);

struct TrackingCollaborators {
    VehicleRegistry& vehicles;
    UserDirectory& users;
    TrackingLogStore& tracking;
};

// One telemetry request end to end, plus the rider-location path.
class TrackingService {
public:
    TrackingService(const TelemetryCodec& codec, ModelLoader& loader, RouteSnapper& snapper,
                    TrackingCollaborators stores, ProximityNotifier& notifier, BroadcastHub& hub,
                    ServiceCounters& counters, const TelemetryConfig& cfg, MillisClock wall_clock = nowWallMs);

    IngestResult ingestEnvelope(const std::string& envelope_b64);
    IngestResult ingestReading(const TelemetryReading& reading);

    bool updateRiderLocation(const std::string& user_id, const GeoPoint& location,
                             std::vector<NotifyOutcome>& outcomes, std::string& error);

    // Vehicles whose device went silent for longer than threshold_s become unavailable.
    int markInactiveVehicles(int threshold_s);
    void publishCounts();

    std::string vehicleSnapshot(const std::string& vehicle_id);
    std::string fleetSnapshot(const std::string& fleet_id);
    std::string countsSnapshot();
    bool riderKnown(const std::string& user_id);

private:
    void publishFleet(const std::string& fleet_id);

    const TelemetryCodec& codec_;
    ModelLoader& loader_;
    PositionCorrector corrector_;
    RouteSnapper& snapper_;
    TrackingCollaborators stores_;
    ProximityNotifier& notifier_;
    BroadcastHub& hub_;
    ServiceCounters& counters_;
    TelemetryConfig cfg_;
    MillisClock wall_clock_;
};

}  // namespace puv
