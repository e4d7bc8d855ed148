#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"
#include "correction/model_loader.hpp"
#include "correction/offset_model.hpp"

namespace puv {

struct CorrectionResult {
    bool ok{false};
    ErrorKind kind{ErrorKind::None}; // ModelNotReady | ModelUnavailable | Inference on failure
    std::string error;
    GeoPoint position;
    GeodeticPosition wls; // uncorrected fix
    double speed_mps{0.0};
};

// Raw fix -> ECEF -> model offset -> corrected lat/lon. Stateless per call.
class PositionCorrector {
public:
    explicit PositionCorrector(ModelLoader& loader) : loader_(loader) {}

    CorrectionResult correct(const TelemetryReading& reading) const;

    static cv::Vec3d resolveEcef(const RawFix& fix);
    static double signalQuality(double cn0_dbhz, double elevation_deg);
    static double normalizeSpeedMps(const TelemetryReading& reading);
    static FeatureInput buildFeatures(const TelemetryReading& reading, const cv::Vec3d& ecef, double speed_mps);

    static const std::vector<std::string>& defaultFeatureOrder();

private:
    ModelLoader& loader_;
};

}  // namespace puv
