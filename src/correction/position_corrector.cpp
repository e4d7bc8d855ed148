#include "correction/position_corrector.hpp"

#include <cmath>

#include "core/math_utils.hpp"

namespace puv {

namespace {

struct FixToEcef {
    cv::Vec3d operator()(const EcefPosition& p) const { return p.xyz; }
    cv::Vec3d operator()(const GeodeticPosition& p) const {
        return geodeticToEcef(p.latitude_deg, p.longitude_deg, p.altitude_m);
    }
};

}  // namespace

cv::Vec3d PositionCorrector::resolveEcef(const RawFix& fix) {
    return std::visit(FixToEcef{}, fix);
}

double PositionCorrector::signalQuality(double cn0_dbhz, double elevation_deg) {
    return cn0_dbhz * std::sin(degreesToRadians(elevation_deg));
}

double PositionCorrector::normalizeSpeedMps(const TelemetryReading& reading) {
    if (reading.speed_mps) {
        return *reading.speed_mps;
    }
    if (reading.speed_kmh) {
        return *reading.speed_kmh / 3.6;
    }
    return 0.0;
}

FeatureInput PositionCorrector::buildFeatures(const TelemetryReading& reading, const cv::Vec3d& ecef, double speed_mps) {
    FeatureInput in;
    in.numeric["Cn0DbHz"] = reading.cn0_dbhz;
    in.numeric["Svid"] = static_cast<double>(reading.svid);
    in.numeric["SvElevationDegrees"] = reading.sv_elevation_deg;
    in.numeric["SvAzimuthDegrees"] = reading.sv_azimuth_deg;
    in.numeric["MeasurementX"] = reading.measurement[0];
    in.numeric["MeasurementY"] = reading.measurement[1];
    in.numeric["MeasurementZ"] = reading.measurement[2];
    in.numeric["BiasX"] = reading.bias[0];
    in.numeric["BiasY"] = reading.bias[1];
    in.numeric["BiasZ"] = reading.bias[2];
    in.numeric["WlsPositionXEcefMeters"] = ecef[0];
    in.numeric["WlsPositionYEcefMeters"] = ecef[1];
    in.numeric["WlsPositionZEcefMeters"] = ecef[2];
    in.numeric["SignalQuality"] = signalQuality(reading.cn0_dbhz, reading.sv_elevation_deg);
    in.numeric["WLS_Distance"] = cv::norm(ecef);
    in.numeric["SpeedMps"] = speed_mps;
    in.categorical["IMU_MessageType"] = reading.imu_message_type;
    return in;
}

const std::vector<std::string>& PositionCorrector::defaultFeatureOrder() {
    static const std::vector<std::string> order = {
        "Cn0DbHz", "Svid", "SvElevationDegrees", "SvAzimuthDegrees", "IMU_MessageType",
        "MeasurementX", "MeasurementY", "MeasurementZ", "BiasX", "BiasY", "BiasZ",
        "WlsPositionXEcefMeters", "WlsPositionYEcefMeters", "WlsPositionZEcefMeters",
        "SignalQuality", "WLS_Distance", "SpeedMps",
    };
    return order;
}

CorrectionResult PositionCorrector::correct(const TelemetryReading& reading) const {
    CorrectionResult result;

    const ModelStatus status = loader_.status();
    if (status.state == ModelLoadState::Error) {
        result.kind = ErrorKind::ModelUnavailable;
        result.error = "model failed to load: " + status.error;
        return result;
    }
    const auto model = loader_.model();
    if (!model) {
        result.kind = ErrorKind::ModelNotReady;
        result.error = std::string("model is ") + modelLoadStateName(status.state) + ", retry later";
        return result;
    }

    const cv::Vec3d ecef = resolveEcef(reading.fix);
    result.speed_mps = normalizeSpeedMps(reading);
    const FeatureInput features = buildFeatures(reading, ecef, result.speed_mps);

    cv::Vec2d offset;
    std::string error;
    try {
        if (!model->predict(features, offset, error)) {
            result.kind = ErrorKind::Inference;
            result.error = error;
            return result;
        }
    } catch (const std::exception& e) {
        result.kind = ErrorKind::Inference;
        result.error = e.what();
        return result;
    }

    result.wls = ecefToGeodetic(ecef);
    result.position.latitude = result.wls.latitude_deg + offset[0];
    result.position.longitude = result.wls.longitude_deg + offset[1];
    result.ok = true;
    return result;
}

}  // namespace puv
