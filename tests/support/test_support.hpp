#pragma once

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/math_utils.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include "correction/offset_model.hpp"
#include "realtime/broadcast_hub.hpp"
#include "store/stores.hpp"

namespace puv::testing {

// Returns a fixed offset; can be switched to fail or throw.
class FakeOffsetModel : public OffsetModel {
public:
    explicit FakeOffsetModel(cv::Vec2d offset = cv::Vec2d(0.0, 0.0)) : offset_(offset) {}

    bool predict(const FeatureInput& input, cv::Vec2d& offset_deg, std::string& error) override {
        calls.fetch_add(1);
        last_input = input;
        if (throw_on_predict) {
            throw std::runtime_error("fake model exploded");
        }
        if (fail_on_predict) {
            error = "fake model refused";
            return false;
        }
        offset_deg = offset_;
        return true;
    }

    std::atomic<int> calls{0};
    FeatureInput last_input;
    bool throw_on_predict{false};
    bool fail_on_predict{false};

private:
    cv::Vec2d offset_;
};

class RecordingSubscriber : public Subscriber {
public:
    bool deliver(const std::string& message) override {
        if (throw_on_deliver) {
            throw std::runtime_error("socket gone");
        }
        if (!accept) {
            return false;
        }
        messages.push_back(message);
        return true;
    }

    std::vector<std::string> messages;
    bool accept{true};
    bool throw_on_deliver{false};
};

class RecordingPushGateway : public PushGateway {
public:
    bool send(const PushTarget& target, const PushMessage& message, std::string& error) override {
        if (throw_on_send) {
            throw std::runtime_error("push backend down");
        }
        if (!succeed) {
            error = "rejected token";
            return false;
        }
        sent.push_back(target);
        bodies.push_back(message.body);
        return true;
    }

    std::vector<PushTarget> sent;
    std::vector<std::string> bodies;
    bool succeed{true};
    bool throw_on_send{false};
};

// Point due north of origin at exactly distance_m along the meridian.
inline GeoPoint northOf(const GeoPoint& origin, double distance_m) {
    return GeoPoint{origin.latitude + radiansToDegrees(distance_m / kEarthRadiusM), origin.longitude};
}

// Plausible Android GNSS row with a raw geodetic fix.
inline TelemetryReading sampleReading(const GeoPoint& at, const std::string& device_id = "dev-001") {
    TelemetryReading r;
    r.device_id = device_id;
    r.cn0_dbhz = 32.5;
    r.svid = 12;
    r.sv_elevation_deg = 45.0;
    r.sv_azimuth_deg = 120.0;
    r.imu_message_type = "UncalAccel";
    r.measurement = cv::Vec3d(0.12, -0.03, 9.79);
    r.bias = cv::Vec3d(0.01, 0.02, -0.01);
    r.speed_mps = 6.0;
    r.fix = GeodeticPosition{at.latitude, at.longitude, 20.0};
    return r;
}

// Controllable millisecond clock.
struct ManualClock {
    std::atomic<int64_t> now_ms{1000000};
    MillisClock fn() {
        return [this]() { return now_ms.load(); };
    }
    void advanceSeconds(int s) { now_ms.fetch_add(static_cast<int64_t>(s) * 1000); }
};

}  // namespace puv::testing
