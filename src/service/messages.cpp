#include "service/messages.hpp"

#include <map>

#include <nlohmann/json.hpp>

#include "core/time_utils.hpp"

namespace puv {

namespace {

nlohmann::json locationJson(const std::optional<GeoPoint>& p) {
    if (!p) {
        return nullptr;
    }
    return {{"latitude", p->latitude}, {"longitude", p->longitude}};
}

}  // namespace

std::string vehicleLocationJson(const Vehicle& vehicle, bool snapped, int64_t wall_ms) {
    nlohmann::json j;
    j["type"] = "location_update";
    j["vehicle_id"] = vehicle.id;
    j["fleet_id"] = vehicle.fleet_id;
    j["location"] = locationJson(vehicle.location);
    j["snapped"] = snapped;
    j["timestamp"] = formatIsoUtc(wall_ms);
    return j.dump();
}

std::string fleetVehiclesJson(const std::string& fleet_id, const std::vector<Vehicle>& vehicles) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& v : vehicles) {
        if (v.status != VehicleStatus::Available) {
            continue;
        }
        list.push_back({
            {"vehicle_id", v.id},
            {"plate", v.plate},
            {"route_id", v.route_id},
            {"status", vehicleStatusName(v.status)},
            {"status_detail", v.status_detail},
            {"location", locationJson(v.location)},
        });
    }
    nlohmann::json j;
    j["type"] = "vehicle_list";
    j["fleet_id"] = fleet_id;
    j["vehicles"] = list;
    return j.dump();
}

std::string countsJson(const std::vector<Vehicle>& vehicles, std::size_t users) {
    std::map<std::string, int> per_fleet;
    int available = 0;
    for (const auto& v : vehicles) {
        ++per_fleet[v.fleet_id];
        if (v.status == VehicleStatus::Available) {
            ++available;
        }
    }
    nlohmann::json counts = nlohmann::json::array();
    for (const auto& kv : per_fleet) {
        counts.push_back({{"fleet_id", kv.first}, {"count", kv.second}});
    }
    nlohmann::json j;
    j["type"] = "stats_count";
    j["total_vehicles"] = vehicles.size();
    j["available_vehicles"] = available;
    j["users"] = users;
    j["counts"] = counts;
    return j.dump();
}

std::string connectionEstablishedJson(const std::string& type, const std::string& id_field, const std::string& id) {
    nlohmann::json j;
    j["type"] = type;
    if (!id_field.empty()) {
        j[id_field] = id;
    }
    return j.dump();
}

std::string countersJson(const CountersSnapshot& s) {
    nlohmann::json j;
    j["telemetry_accepted"] = s.telemetry_accepted;
    j["telemetry_rejected"] = s.telemetry_rejected;
    j["corrections"] = s.corrections;
    j["snapped_fixes"] = s.snapped_fixes;
    j["tracking_log_failures"] = s.tracking_log_failures;
    j["notifications_sent"] = s.notifications_sent;
    j["notifications_suppressed"] = s.notifications_suppressed;
    j["notifications_failed"] = s.notifications_failed;
    j["sweeps"] = s.sweeps;
    j["live_connections"] = s.live_connections;
    return j.dump();
}

}  // namespace puv
