#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <opencv2/core.hpp>

namespace puv {

struct GeoPoint {
    double latitude{0.0};
    double longitude{0.0};
};

using Polyline = std::vector<GeoPoint>;

struct EcefPosition {
    cv::Vec3d xyz{0.0, 0.0, 0.0};
};

struct GeodeticPosition {
    double latitude_deg{0.0};
    double longitude_deg{0.0};
    double altitude_m{0.0};
};

// Exactly one raw fix is carried per reading; resolved when the envelope is decoded.
using RawFix = std::variant<EcefPosition, GeodeticPosition>;

struct TelemetryReading {
    std::string device_id; // empty when the payload carried none
    double cn0_dbhz{0.0};
    int svid{0};
    double sv_elevation_deg{0.0};
    double sv_azimuth_deg{0.0};
    std::string imu_message_type;
    cv::Vec3d measurement{0.0, 0.0, 0.0};
    cv::Vec3d bias{0.0, 0.0, 0.0};
    std::optional<double> speed_mps;
    std::optional<double> speed_kmh;
    RawFix fix{EcefPosition{}};
    std::optional<GeoPoint> ground_truth;
};

struct CorrectedPosition {
    GeoPoint position;
    bool snapped{false};
};

struct SpeedSample {
    int64_t timestamp_ms{0};
    double speed_mps{0.0};
};

enum class VehicleStatus {
    Available,
    Full,
    Unavailable,
};

const char* vehicleStatusName(VehicleStatus status);
bool parseVehicleStatus(const std::string& text, VehicleStatus& out);

struct Vehicle {
    std::string id;
    std::string device_id;
    std::string fleet_id;
    VehicleStatus status{VehicleStatus::Unavailable};
    std::string status_detail;
    std::string route_id;
    std::string plate;
    std::optional<GeoPoint> location;
};

struct Rider {
    std::string id;
    std::string fleet_id;
    std::string push_token;
    bool notify{false};
    std::optional<GeoPoint> location;
};

struct TrackingLogRecord {
    std::string vehicle_id;
    std::string device_id;
    std::string fleet_id;
    int64_t timestamp_ms{0};
    double speed_mps{0.0};
    GeoPoint raw;
    GeoPoint corrected;
    bool snapped{false};
};

struct NotificationRecord {
    std::string user_id;
    std::string vehicle_id;
    int64_t timestamp_ms{0};
    bool success{false};
    double distance_m{0.0};
    std::string type{"proximity"};
};

enum class ErrorKind {
    None,
    Decryption,
    SchemaValidation,
    ModelNotReady,
    ModelUnavailable,
    Inference,
    GeometryUnavailable,
    Persistence,
    PushDispatch,
    Connection,
    Internal,
};

const char* errorKindName(ErrorKind kind);

}  // namespace puv
