#include "store/memory_store.hpp"

#include <algorithm>
#include <cctype>

#include <opencv2/core.hpp>

namespace puv {

namespace {

std::string readString(const cv::FileNode& parent, const char* key) {
    const cv::FileNode node = parent[key];
    if (node.empty()) {
        return {};
    }
    if (node.isString()) {
        return static_cast<std::string>(node);
    }
    if (node.isInt()) {
        return std::to_string(static_cast<int>(node));
    }
    return {};
}

std::optional<GeoPoint> readLocation(const cv::FileNode& parent) {
    const cv::FileNode lat = parent["latitude"];
    const cv::FileNode lon = parent["longitude"];
    if (lat.empty() || lon.empty()) {
        return std::nullopt;
    }
    return GeoPoint{static_cast<double>(lat), static_cast<double>(lon)};
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string stripLeadingZeros(const std::string& s) {
    const auto first = s.find_first_not_of('0');
    return first == std::string::npos ? std::string("0") : s.substr(first);
}

}  // namespace

bool loadFixtures(const std::string& path, Fixtures& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            error = "failed to open fixtures: " + path;
            return false;
        }

        Fixtures loaded;
        const cv::FileNode vehicles = fs["vehicles"];
        for (cv::FileNodeIterator it = vehicles.begin(); it != vehicles.end(); ++it) {
            const cv::FileNode n = *it;
            Vehicle v;
            v.id = readString(n, "id");
            v.device_id = readString(n, "device_id");
            v.fleet_id = readString(n, "fleet_id");
            v.status_detail = readString(n, "status_detail");
            v.route_id = readString(n, "route_id");
            v.plate = readString(n, "plate");
            const std::string status = readString(n, "status");
            if (!status.empty() && !parseVehicleStatus(status, v.status)) {
                error = "vehicle " + v.id + ": unknown status '" + status + "'";
                return false;
            }
            v.location = readLocation(n);
            if (v.id.empty()) {
                error = "vehicle entry without id";
                return false;
            }
            loaded.vehicles.push_back(v);
        }

        const cv::FileNode users = fs["users"];
        for (cv::FileNodeIterator it = users.begin(); it != users.end(); ++it) {
            const cv::FileNode n = *it;
            Rider r;
            r.id = readString(n, "id");
            r.fleet_id = readString(n, "fleet_id");
            r.push_token = readString(n, "push_token");
            r.notify = !n["notify"].empty() && static_cast<int>(n["notify"]) != 0;
            r.location = readLocation(n);
            if (r.id.empty()) {
                error = "user entry without id";
                return false;
            }
            loaded.riders.push_back(r);
        }

        // points: flat [lat0, lon0, lat1, lon1, ...]
        const cv::FileNode routes = fs["routes"];
        for (cv::FileNodeIterator it = routes.begin(); it != routes.end(); ++it) {
            const cv::FileNode n = *it;
            const std::string id = readString(n, "id");
            std::vector<double> flat;
            n["points"] >> flat;
            if (id.empty() || flat.size() % 2 != 0) {
                error = "route '" + id + "' needs an id and lat/lon pairs";
                return false;
            }
            Polyline line;
            for (std::size_t i = 0; i + 1 < flat.size(); i += 2) {
                line.push_back(GeoPoint{flat[i], flat[i + 1]});
            }
            loaded.routes[id] = line;
        }

        out = std::move(loaded);
    } catch (const cv::Exception& e) {
        error = "fixtures parse failed: " + std::string(e.what());
        return false;
    }
    error.clear();
    return true;
}

bool deviceIdsMatch(const std::string& a, const std::string& b) {
    if (a == b) {
        return !a.empty();
    }
    return allDigits(a) && allDigits(b) && stripLeadingZeros(a) == stripLeadingZeros(b);
}

void MemoryVehicleRegistry::upsert(const Vehicle& vehicle) {
    std::lock_guard<std::mutex> lock(mutex_);
    vehicles_[vehicle.id] = vehicle;
}

std::optional<Vehicle> MemoryVehicleRegistry::findById(const std::string& vehicle_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vehicles_.find(vehicle_id);
    if (it == vehicles_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Vehicle> MemoryVehicleRegistry::findByDevice(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : vehicles_) {
        if (deviceIdsMatch(kv.second.device_id, device_id)) {
            return kv.second;
        }
    }
    return std::nullopt;
}

std::vector<Vehicle> MemoryVehicleRegistry::listByFleet(const std::string& fleet_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Vehicle> out;
    for (const auto& kv : vehicles_) {
        if (kv.second.fleet_id == fleet_id) {
            out.push_back(kv.second);
        }
    }
    return out;
}

std::vector<Vehicle> MemoryVehicleRegistry::listAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Vehicle> out;
    out.reserve(vehicles_.size());
    for (const auto& kv : vehicles_) {
        out.push_back(kv.second);
    }
    return out;
}

bool MemoryVehicleRegistry::updateLocation(const std::string& vehicle_id, const GeoPoint& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vehicles_.find(vehicle_id);
    if (it == vehicles_.end()) {
        return false;
    }
    it->second.location = location;
    return true;
}

bool MemoryVehicleRegistry::updateStatus(const std::string& vehicle_id, VehicleStatus status, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = vehicles_.find(vehicle_id);
    if (it == vehicles_.end()) {
        return false;
    }
    it->second.status = status;
    it->second.status_detail = detail;
    return true;
}

void MemoryUserDirectory::upsert(const Rider& rider) {
    std::lock_guard<std::mutex> lock(mutex_);
    riders_[rider.id] = rider;
}

std::optional<Rider> MemoryUserDirectory::findById(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = riders_.find(user_id);
    if (it == riders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Rider> MemoryUserDirectory::listNotifiable() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Rider> out;
    for (const auto& kv : riders_) {
        if (kv.second.notify && !kv.second.push_token.empty()) {
            out.push_back(kv.second);
        }
    }
    return out;
}

bool MemoryUserDirectory::updateLocation(const std::string& user_id, const GeoPoint& location) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = riders_.find(user_id);
    if (it == riders_.end()) {
        return false;
    }
    it->second.location = location;
    return true;
}

std::size_t MemoryUserDirectory::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return riders_.size();
}

void MemoryRouteStore::put(const std::string& route_id, const Polyline& polyline) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[route_id] = polyline;
}

bool MemoryRouteStore::loadPolyline(const std::string& route_id, Polyline& out, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = routes_.find(route_id);
    if (it == routes_.end()) {
        error.clear();
        return false;
    }
    out = it->second;
    error.clear();
    return true;
}

bool MemoryTrackingLog::append(const TrackingLogRecord& record, std::string& error) {
    if (record.device_id.empty()) {
        error = "tracking record without device id";
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& log = by_device_[record.device_id];
    log.push_back(record);
    while (log.size() > max_per_device_) {
        log.pop_front();
    }
    error.clear();
    return true;
}

std::vector<SpeedSample> MemoryTrackingLog::recentSpeeds(const std::string& device_id, int64_t since_ms, std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SpeedSample> out;
    const auto it = by_device_.find(device_id);
    if (it == by_device_.end()) {
        return out;
    }
    for (auto r = it->second.rbegin(); r != it->second.rend() && out.size() < limit; ++r) {
        if (r->timestamp_ms < since_ms) {
            break;
        }
        out.push_back(SpeedSample{r->timestamp_ms, r->speed_mps});
    }
    return out;
}

std::optional<TrackingLogRecord> MemoryTrackingLog::latest(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = by_device_.find(device_id);
    if (it == by_device_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

std::size_t MemoryTrackingLog::size(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = by_device_.find(device_id);
    return it == by_device_.end() ? 0U : it->second.size();
}

bool MemoryNotificationLog::append(const NotificationRecord& record, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retention_ms_ > 0) {
        const int64_t cutoff = record.timestamp_ms - retention_ms_;
        records_.erase(std::remove_if(records_.begin(), records_.end(),
                                      [cutoff](const NotificationRecord& r) { return r.timestamp_ms < cutoff; }),
                       records_.end());
    }
    records_.push_back(record);
    error.clear();
    return true;
}

std::optional<NotificationRecord> MemoryNotificationLog::findRecent(const std::string& user_id, const std::string& vehicle_id, int64_t since_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
        if (it->user_id == user_id && it->vehicle_id == vehicle_id && it->timestamp_ms >= since_ms) {
            return *it;
        }
    }
    return std::nullopt;
}

std::vector<NotificationRecord> MemoryNotificationLog::all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

}  // namespace puv
