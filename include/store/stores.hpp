#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace puv {

// External collaborators. Implementations may throw; callers catch std::exception.

class VehicleRegistry {
public:
    virtual ~VehicleRegistry() = default;

    virtual std::optional<Vehicle> findById(const std::string& vehicle_id) = 0;
    virtual std::optional<Vehicle> findByDevice(const std::string& device_id) = 0;
    virtual std::vector<Vehicle> listByFleet(const std::string& fleet_id) = 0;
    virtual std::vector<Vehicle> listAll() = 0;
    // Writes only the location field. False when no such vehicle.
    virtual bool updateLocation(const std::string& vehicle_id, const GeoPoint& location) = 0;
    virtual bool updateStatus(const std::string& vehicle_id, VehicleStatus status, const std::string& detail) = 0;
};

class UserDirectory {
public:
    virtual ~UserDirectory() = default;

    virtual std::optional<Rider> findById(const std::string& user_id) = 0;
    // Opted-in riders that have a push token.
    virtual std::vector<Rider> listNotifiable() = 0;
    virtual bool updateLocation(const std::string& user_id, const GeoPoint& location) = 0;
    virtual std::size_t count() = 0;
};

class RouteStore {
public:
    virtual ~RouteStore() = default;

    // False with an empty error when the route simply has no geometry.
    virtual bool loadPolyline(const std::string& route_id, Polyline& out, std::string& error) = 0;
};

class TrackingLogStore {
public:
    virtual ~TrackingLogStore() = default;

    virtual bool append(const TrackingLogRecord& record, std::string& error) = 0;
    // Newest first, timestamp >= since_ms, at most limit entries.
    virtual std::vector<SpeedSample> recentSpeeds(const std::string& device_id, int64_t since_ms, std::size_t limit) = 0;
    virtual std::optional<TrackingLogRecord> latest(const std::string& device_id) = 0;
};

class NotificationLogStore {
public:
    virtual ~NotificationLogStore() = default;

    virtual bool append(const NotificationRecord& record, std::string& error) = 0;
    virtual std::optional<NotificationRecord> findRecent(const std::string& user_id, const std::string& vehicle_id, int64_t since_ms) = 0;
};

struct PushTarget {
    std::string user_id;
    std::string token;
};

struct PushMessage {
    std::string title;
    std::string body;
    std::map<std::string, std::string> data;
};

class PushGateway {
public:
    virtual ~PushGateway() = default;

    virtual bool send(const PushTarget& target, const PushMessage& message, std::string& error) = 0;
};

}  // namespace puv
