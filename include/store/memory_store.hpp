#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "store/stores.hpp"

namespace puv {

struct Fixtures {
    std::vector<Vehicle> vehicles;
    std::vector<Rider> riders;
    std::map<std::string, Polyline> routes;
};

// YAML read through cv::FileStorage; see config/fixtures.yaml.
bool loadFixtures(const std::string& path, Fixtures& out, std::string& error);

// Device ids arrive as strings or numbers; "42" and "0042" name the same device.
bool deviceIdsMatch(const std::string& a, const std::string& b);

class MemoryVehicleRegistry : public VehicleRegistry {
public:
    void upsert(const Vehicle& vehicle);

    std::optional<Vehicle> findById(const std::string& vehicle_id) override;
    std::optional<Vehicle> findByDevice(const std::string& device_id) override;
    std::vector<Vehicle> listByFleet(const std::string& fleet_id) override;
    std::vector<Vehicle> listAll() override;
    bool updateLocation(const std::string& vehicle_id, const GeoPoint& location) override;
    bool updateStatus(const std::string& vehicle_id, VehicleStatus status, const std::string& detail) override;

private:
    std::mutex mutex_;
    std::map<std::string, Vehicle> vehicles_;
};

class MemoryUserDirectory : public UserDirectory {
public:
    void upsert(const Rider& rider);

    std::optional<Rider> findById(const std::string& user_id) override;
    std::vector<Rider> listNotifiable() override;
    bool updateLocation(const std::string& user_id, const GeoPoint& location) override;
    std::size_t count() override;

private:
    std::mutex mutex_;
    std::map<std::string, Rider> riders_;
};

class MemoryRouteStore : public RouteStore {
public:
    void put(const std::string& route_id, const Polyline& polyline);

    bool loadPolyline(const std::string& route_id, Polyline& out, std::string& error) override;

private:
    std::mutex mutex_;
    std::map<std::string, Polyline> routes_;
};

class MemoryTrackingLog : public TrackingLogStore {
public:
    explicit MemoryTrackingLog(std::size_t max_per_device = 2048) : max_per_device_(max_per_device) {}

    bool append(const TrackingLogRecord& record, std::string& error) override;
    std::vector<SpeedSample> recentSpeeds(const std::string& device_id, int64_t since_ms, std::size_t limit) override;
    std::optional<TrackingLogRecord> latest(const std::string& device_id) override;

    std::size_t size(const std::string& device_id);

private:
    std::size_t max_per_device_;
    std::mutex mutex_;
    std::map<std::string, std::deque<TrackingLogRecord>> by_device_;
};

// Records older than retention_ms behind the newest append are dropped; 0 keeps everything.
class MemoryNotificationLog : public NotificationLogStore {
public:
    explicit MemoryNotificationLog(int64_t retention_ms = 0) : retention_ms_(retention_ms) {}

    bool append(const NotificationRecord& record, std::string& error) override;
    std::optional<NotificationRecord> findRecent(const std::string& user_id, const std::string& vehicle_id, int64_t since_ms) override;

    std::vector<NotificationRecord> all();

private:
    int64_t retention_ms_;
    std::mutex mutex_;
    std::vector<NotificationRecord> records_;
};

}  // namespace puv
