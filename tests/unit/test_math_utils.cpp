#include "core/math_utils.hpp"

#include <cmath>
#include <iostream>

int main() {
    const double pi = 3.14159265358979323846;
    if (std::abs(puv::degreesToRadians(180.0) - pi) > 1e-9) {
        std::cerr << "degreesToRadians failed\n";
        return 1;
    }

    const puv::GeoPoint manila{14.5995, 120.9842};
    const puv::GeoPoint quezon{14.6760, 121.0437};
    const puv::GeoPoint makati{14.5547, 121.0244};

    if (puv::haversineMeters(manila, manila) != 0.0) {
        std::cerr << "d(a,a) should be 0\n";
        return 1;
    }
    const double ab = puv::haversineMeters(manila, quezon);
    const double ba = puv::haversineMeters(quezon, manila);
    if (std::abs(ab - ba) > 1e-9) {
        std::cerr << "haversine not symmetric\n";
        return 1;
    }
    const double ac = puv::haversineMeters(manila, makati);
    const double cb = puv::haversineMeters(makati, quezon);
    if (ab > ac + cb + 1e-6) {
        std::cerr << "triangle inequality violated\n";
        return 1;
    }
    // about 10.5 km between Manila and Quezon City centres
    if (ab < 10000.0 || ab > 11000.0) {
        std::cerr << "unexpected Manila-Quezon distance " << ab << "\n";
        return 1;
    }

    const double one_degree = puv::haversineMeters(puv::GeoPoint{0.0, 0.0}, puv::GeoPoint{1.0, 0.0});
    if (std::abs(one_degree - puv::kEarthRadiusM * pi / 180.0) > 1e-6) {
        std::cerr << "one degree of latitude mismatch\n";
        return 1;
    }

    const cv::Vec3d ecef = puv::geodeticToEcef(14.5995, 120.9842, 25.0);
    const puv::GeodeticPosition back = puv::ecefToGeodetic(ecef);
    if (std::abs(back.latitude_deg - 14.5995) > 1e-8 || std::abs(back.longitude_deg - 120.9842) > 1e-8 ||
        std::abs(back.altitude_m - 25.0) > 1e-3) {
        std::cerr << "ECEF round trip drifted: " << back.latitude_deg << ", " << back.longitude_deg
                  << ", " << back.altitude_m << "\n";
        return 1;
    }

    const cv::Vec3d equator = puv::geodeticToEcef(0.0, 0.0, 0.0);
    if (std::abs(equator[0] - puv::kWgs84A) > 1e-6 || std::abs(equator[1]) > 1e-6 || std::abs(equator[2]) > 1e-6) {
        std::cerr << "equator/prime meridian should map to (a, 0, 0)\n";
        return 1;
    }

    const puv::GeodeticPosition pole = puv::ecefToGeodetic(puv::geodeticToEcef(90.0, 0.0, 0.0));
    if (std::abs(pole.latitude_deg - 90.0) > 1e-6) {
        std::cerr << "pole latitude mismatch\n";
        return 1;
    }

    const cv::Point2d local = puv::toLocalMeters(manila, quezon);
    const puv::GeoPoint restored = puv::fromLocalMeters(manila, local);
    if (std::abs(restored.latitude - quezon.latitude) > 1e-9 || std::abs(restored.longitude - quezon.longitude) > 1e-9) {
        std::cerr << "local tangent plane round trip failed\n";
        return 1;
    }

    return 0;
}
