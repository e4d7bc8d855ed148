#include "core/math_utils.hpp"

#include <algorithm>
#include <cmath>

namespace puv {

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kE2 = kWgs84F * (2.0 - kWgs84F);
constexpr double kWgs84B = kWgs84A * (1.0 - kWgs84F);
}

double degreesToRadians(double degrees) {
    return degrees * (kPi / 180.0);
}

double radiansToDegrees(double radians) {
    return radians * (180.0 / kPi);
}

cv::Vec3d geodeticToEcef(double latitude_deg, double longitude_deg, double altitude_m) {
    const double lat = degreesToRadians(latitude_deg);
    const double lon = degreesToRadians(longitude_deg);
    const double sl = std::sin(lat);
    const double cl = std::cos(lat);
    const double n = kWgs84A / std::sqrt(1.0 - kE2 * sl * sl);

    return cv::Vec3d(
        (n + altitude_m) * cl * std::cos(lon),
        (n + altitude_m) * cl * std::sin(lon),
        (n * (1.0 - kE2) + altitude_m) * sl);
}

GeodeticPosition ecefToGeodetic(const cv::Vec3d& ecef) {
    const double x = ecef[0];
    const double y = ecef[1];
    const double z = ecef[2];
    const double p = std::sqrt(x * x + y * y);

    GeodeticPosition out;
    out.longitude_deg = radiansToDegrees(std::atan2(y, x));

    if (p < 1e-9) {
        out.latitude_deg = (z >= 0.0) ? 90.0 : -90.0;
        out.altitude_m = std::abs(z) - kWgs84B;
        return out;
    }

    // Fixed-point iteration on latitude; converges to sub-millimeter in a few steps near the surface.
    double lat = std::atan2(z, p * (1.0 - kE2));
    double alt = 0.0;
    for (int i = 0; i < 6; ++i) {
        const double sl = std::sin(lat);
        const double n = kWgs84A / std::sqrt(1.0 - kE2 * sl * sl);
        alt = p / std::cos(lat) - n;
        lat = std::atan2(z, p * (1.0 - kE2 * n / (n + alt)));
    }

    out.latitude_deg = radiansToDegrees(lat);
    out.altitude_m = alt;
    return out;
}

double haversineMeters(const GeoPoint& a, const GeoPoint& b) {
    const double lat1 = degreesToRadians(a.latitude);
    const double lat2 = degreesToRadians(b.latitude);
    const double dlat = lat2 - lat1;
    const double dlon = degreesToRadians(b.longitude - a.longitude);

    const double s1 = std::sin(dlat / 2.0);
    const double s2 = std::sin(dlon / 2.0);
    const double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;
    return 2.0 * kEarthRadiusM * std::asin(std::sqrt(std::min(1.0, h)));
}

cv::Point2d toLocalMeters(const GeoPoint& origin, const GeoPoint& p) {
    const double k = std::cos(degreesToRadians(origin.latitude));
    return cv::Point2d(
        degreesToRadians(p.longitude - origin.longitude) * kEarthRadiusM * k,
        degreesToRadians(p.latitude - origin.latitude) * kEarthRadiusM);
}

GeoPoint fromLocalMeters(const GeoPoint& origin, const cv::Point2d& xy) {
    const double k = std::cos(degreesToRadians(origin.latitude));
    GeoPoint out;
    out.latitude = origin.latitude + radiansToDegrees(xy.y / kEarthRadiusM);
    out.longitude = origin.longitude + ((k > 1e-12) ? radiansToDegrees(xy.x / (kEarthRadiusM * k)) : 0.0);
    return out;
}

}  // namespace puv
