#pragma once

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace puv {

constexpr double kEarthRadiusM = 6371000.0;

// WGS84 ellipsoid
constexpr double kWgs84A = 6378137.0;
constexpr double kWgs84F = 1.0 / 298.257223563;

double degreesToRadians(double degrees);
double radiansToDegrees(double radians);

cv::Vec3d geodeticToEcef(double latitude_deg, double longitude_deg, double altitude_m);
GeodeticPosition ecefToGeodetic(const cv::Vec3d& ecef);

// Great-circle distance on a sphere of radius kEarthRadiusM, in meters.
double haversineMeters(const GeoPoint& a, const GeoPoint& b);

// Equirectangular tangent plane around origin; x=east, y=north, meters.
cv::Point2d toLocalMeters(const GeoPoint& origin, const GeoPoint& p);
GeoPoint fromLocalMeters(const GeoPoint& origin, const cv::Point2d& xy);

}  // namespace puv
