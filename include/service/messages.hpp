#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/counters.hpp"
#include "core/types.hpp"

namespace puv {

// JSON text frames pushed over the realtime channels.
std::string vehicleLocationJson(const Vehicle& vehicle, bool snapped, int64_t wall_ms);
std::string fleetVehiclesJson(const std::string& fleet_id, const std::vector<Vehicle>& vehicles);
std::string countsJson(const std::vector<Vehicle>& vehicles, std::size_t users);
std::string connectionEstablishedJson(const std::string& type, const std::string& id_field, const std::string& id);
std::string countersJson(const CountersSnapshot& s);

}  // namespace puv
