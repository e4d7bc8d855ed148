#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include "realtime/broadcast_hub.hpp"
#include "store/stores.hpp"

namespace puv {

enum class Confidence {
    High,
    Medium,
    Low,
};

const char* confidenceName(Confidence c);

struct SpeedDecision {
    double effective_mps{0.0};
    Confidence confidence{Confidence::Low};
    std::string message;
};

enum class EtaError {
    None,
    VehicleNotFound,
    LocationUnavailable,
    LookupFailed,
};

struct EtaResult {
    std::string vehicle_id;
    std::string plate;
    std::string route_id;
    VehicleStatus status{VehicleStatus::Unavailable};
    GeoPoint vehicle_location;
    GeoPoint user_location;
    double distance_m{0.0};
    double current_speed_mps{0.0};
    double average_speed_mps{0.0};
    double effective_speed_mps{0.0};
    double eta_minutes{0.0}; // buffer included
    std::string eta_formatted;
    Confidence confidence{Confidence::Low};
    std::string message;
    bool is_stopped{false};
};

class EtaEstimator {
public:
    EtaEstimator(VehicleRegistry& vehicles, TrackingLogStore& tracking, BroadcastHub& hub,
                 const EtaConfig& cfg, MillisClock wall_clock = nowWallMs);

    bool estimate(const std::string& vehicle_id, const GeoPoint& rider, EtaResult& out, EtaError& failure, std::string& error);

    // Percentile-anchored mean of the moving samples. 0 when nothing is moving.
    static double averageSpeed(const std::vector<double>& speeds, double percentile = 0.7);
    // speeds newest first.
    static bool isStopped(double current_mps, const std::vector<double>& speeds);
    static SpeedDecision selectEffectiveSpeed(double current_mps, double average_mps, bool stopped,
                                              const std::string& status_detail, const EtaConfig& cfg);
    static double etaMinutesWithBuffer(double distance_m, double effective_mps, const EtaConfig& cfg);
    static std::string formatEta(double minutes);

    static std::string toJson(const EtaResult& r);

private:
    VehicleRegistry& vehicles_;
    TrackingLogStore& tracking_;
    BroadcastHub& hub_;
    EtaConfig cfg_;
    MillisClock wall_clock_;
};

}  // namespace puv
