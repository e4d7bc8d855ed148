#include "eta/eta_estimator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

#include <nlohmann/json.hpp>

#include "core/math_utils.hpp"

namespace puv {

namespace {

constexpr double kStoppedMps = 0.5;
constexpr double kCongestedUpperMps = 3.0;
constexpr double kTrustedAverageMps = 1.0;
constexpr std::size_t kStopWindow = 5;
constexpr std::size_t kStopMinSamples = 3;
constexpr double kStopRatio = 0.6;

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

nlohmann::json etaJson(const EtaResult& r) {
    nlohmann::json j;
    j["vehicle_id"] = r.vehicle_id;
    j["vehicle_plate"] = r.plate;
    j["vehicle_route"] = r.route_id;
    j["status"] = vehicleStatusName(r.status);
    j["distance_meters"] = round2(r.distance_m);
    j["distance_km"] = round2(r.distance_m / 1000.0);
    j["current_speed_mps"] = round2(r.current_speed_mps);
    j["current_speed_kmh"] = round2(r.current_speed_mps * 3.6);
    j["average_speed_mps"] = round2(r.average_speed_mps);
    j["average_speed_kmh"] = round2(r.average_speed_mps * 3.6);
    j["eta_minutes"] = round2(r.eta_minutes);
    j["eta_formatted"] = r.eta_formatted;
    j["confidence"] = confidenceName(r.confidence);
    j["message"] = r.message;
    j["is_stopped"] = r.is_stopped;
    j["vehicle_location"] = {{"latitude", r.vehicle_location.latitude}, {"longitude", r.vehicle_location.longitude}};
    j["user_location"] = {{"latitude", r.user_location.latitude}, {"longitude", r.user_location.longitude}};
    return j;
}

}  // namespace

const char* confidenceName(Confidence c) {
    switch (c) {
        case Confidence::High:
            return "high";
        case Confidence::Medium:
            return "medium";
        case Confidence::Low:
            return "low";
    }
    return "low";
}

EtaEstimator::EtaEstimator(VehicleRegistry& vehicles, TrackingLogStore& tracking, BroadcastHub& hub,
                           const EtaConfig& cfg, MillisClock wall_clock)
    : vehicles_(vehicles), tracking_(tracking), hub_(hub), cfg_(cfg), wall_clock_(std::move(wall_clock)) {}

double EtaEstimator::averageSpeed(const std::vector<double>& speeds, double percentile) {
    std::vector<double> moving;
    for (double s : speeds) {
        if (s > 0.0) {
            moving.push_back(s);
        }
    }
    if (moving.empty()) {
        return 0.0;
    }
    std::sort(moving.begin(), moving.end());
    std::size_t index = static_cast<std::size_t>(static_cast<double>(moving.size()) * percentile);
    index = std::min(index, moving.size() - 1);
    const double anchor = moving[index];

    double sum = 0.0;
    std::size_t n = 0;
    for (double s : moving) {
        if (s >= anchor / 2.0) {
            sum += s;
            ++n;
        }
    }
    return n > 0 ? sum / static_cast<double>(n) : anchor;
}

bool EtaEstimator::isStopped(double current_mps, const std::vector<double>& speeds) {
    if (current_mps >= kStoppedMps) {
        return false;
    }
    const std::size_t window = std::min(kStopWindow, speeds.size());
    if (window < kStopMinSamples) {
        return false;
    }
    const auto slow = std::count_if(speeds.begin(), speeds.begin() + static_cast<std::ptrdiff_t>(window),
                                    [](double s) { return s < kStoppedMps; });
    return static_cast<double>(slow) / static_cast<double>(window) > kStopRatio;
}

SpeedDecision EtaEstimator::selectEffectiveSpeed(double current_mps, double average_mps, bool stopped,
                                                 const std::string& status_detail, const EtaConfig& cfg) {
    SpeedDecision d;
    if (stopped) {
        d.effective_mps = average_mps > kTrustedAverageMps ? average_mps : cfg.urban_speed_mps;
        d.confidence = Confidence::Medium;
        d.message = "Vehicle temporarily stopped. ETA based on average speed.";
    } else if (lower(status_detail) == "standing") {
        d.confidence = Confidence::Low;
        if (average_mps > kTrustedAverageMps) {
            d.effective_mps = average_mps;
            d.message = "Vehicle standing. ETA based on historical speed.";
        } else {
            d.effective_mps = cfg.urban_speed_mps;
            d.message = "Vehicle standing. ETA is estimated.";
        }
    } else if (current_mps >= kStoppedMps && current_mps < kCongestedUpperMps) {
        const double blended = average_mps > current_mps
            ? current_mps * 0.3 + average_mps * 0.7
            : current_mps * 0.7 + average_mps * 0.3;
        d.effective_mps = std::max(blended, cfg.min_congested_speed_mps);
        d.confidence = Confidence::Medium;
        d.message = "Vehicle in traffic. ETA adjusted for congestion.";
    } else if (current_mps >= kCongestedUpperMps) {
        if (average_mps > kTrustedAverageMps) {
            d.effective_mps = current_mps * 0.6 + average_mps * 0.4;
            d.confidence = Confidence::High;
            d.message = "Vehicle moving normally. Real-time ETA.";
        } else {
            d.effective_mps = current_mps;
            d.confidence = Confidence::Medium;
            d.message = "Vehicle moving. ETA based on current speed.";
        }
    } else {
        d.effective_mps = cfg.urban_speed_mps;
        d.confidence = Confidence::Low;
        d.message = "Limited data. ETA is estimated.";
    }
    return d;
}

double EtaEstimator::etaMinutesWithBuffer(double distance_m, double effective_mps, const EtaConfig& cfg) {
    const double minutes = distance_m / effective_mps / 60.0;
    return minutes + std::min(minutes * cfg.buffer_ratio, cfg.max_buffer_min);
}

std::string EtaEstimator::formatEta(double minutes) {
    if (minutes < 1.0) {
        return "Less than 1 minute";
    }
    if (minutes < 60.0) {
        return std::to_string(static_cast<int>(minutes)) + " minutes";
    }
    const int hours = static_cast<int>(minutes / 60.0);
    const int mins = static_cast<int>(std::fmod(minutes, 60.0));
    return std::to_string(hours) + (hours > 1 ? " hours " : " hour ") + std::to_string(mins) + " minutes";
}

bool EtaEstimator::estimate(const std::string& vehicle_id, const GeoPoint& rider, EtaResult& out,
                            EtaError& failure, std::string& error) {
    std::optional<Vehicle> vehicle;
    try {
        vehicle = vehicles_.findById(vehicle_id);
    } catch (const std::exception& e) {
        failure = EtaError::LookupFailed;
        error = std::string("vehicle lookup failed: ") + e.what();
        return false;
    }
    if (!vehicle) {
        failure = EtaError::VehicleNotFound;
        error = "Vehicle not found";
        return false;
    }
    if (!vehicle->location) {
        failure = EtaError::LocationUnavailable;
        error = "Vehicle location not available";
        return false;
    }

    EtaResult r;
    r.vehicle_id = vehicle->id;
    r.plate = vehicle->plate;
    r.route_id = vehicle->route_id;
    r.status = vehicle->status;
    r.vehicle_location = *vehicle->location;
    r.user_location = rider;
    r.distance_m = haversineMeters(rider, *vehicle->location);

    if (!vehicle->device_id.empty()) {
        try {
            const auto latest = tracking_.latest(vehicle->device_id);
            if (latest) {
                r.current_speed_mps = latest->speed_mps;
                const int64_t now = wall_clock_();
                if (now - latest->timestamp_ms <= static_cast<int64_t>(cfg_.fresh_window_s) * 1000) {
                    const auto samples = tracking_.recentSpeeds(
                        vehicle->device_id,
                        now - static_cast<int64_t>(cfg_.history_window_s) * 1000,
                        static_cast<std::size_t>(cfg_.max_samples));
                    std::vector<double> speeds;
                    speeds.reserve(samples.size());
                    for (const auto& s : samples) {
                        speeds.push_back(s.speed_mps);
                    }
                    if (!speeds.empty()) {
                        r.average_speed_mps = averageSpeed(speeds, cfg_.percentile);
                        r.is_stopped = isStopped(r.current_speed_mps, speeds);
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[eta] speed history for " << vehicle->device_id << " unavailable: " << e.what() << '\n';
        }
    }

    const SpeedDecision d = selectEffectiveSpeed(r.current_speed_mps, r.average_speed_mps, r.is_stopped,
                                                 vehicle->status_detail, cfg_);
    r.effective_speed_mps = d.effective_mps;
    r.confidence = d.confidence;
    r.message = d.message;
    r.eta_minutes = etaMinutesWithBuffer(r.distance_m, d.effective_mps, cfg_);
    r.eta_formatted = formatEta(r.eta_minutes);

    nlohmann::json update = etaJson(r);
    update["type"] = "eta_update";
    hub_.publish(update.dump(), topics::eta(r.vehicle_id));

    out = std::move(r);
    failure = EtaError::None;
    error.clear();
    return true;
}

std::string EtaEstimator::toJson(const EtaResult& r) {
    return etaJson(r).dump();
}

}  // namespace puv
