#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "core/config.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include "store/stores.hpp"

namespace puv {

struct Projection {
    GeoPoint point;
    double distance_m{0.0};
    double arc_length_m{0.0}; // along the polyline from its first vertex
};

// Nearest point on the polyline; false for an empty polyline.
bool projectOntoPolyline(const Polyline& line, const GeoPoint& p, Projection& out);

// Cached route geometry with at most one store read in flight per route.
class RouteSnapper {
public:
    RouteSnapper(RouteStore& store, const RoutingConfig& cfg, MillisClock clock = nowSteadyMs);

    // note, when given, is set to GeometryUnavailable if the route has no usable geometry.
    CorrectedPosition snap(const std::string& route_id, const GeoPoint& position, ErrorKind* note = nullptr);

    // Null when the route has no usable geometry.
    std::shared_ptr<const Polyline> geometry(const std::string& route_id);

    bool enabled() const { return cfg_.snapping_enabled; }
    int storeReads() const { return store_reads_.load(); }

private:
    struct Entry {
        std::mutex refresh_mutex;
        std::shared_ptr<const Polyline> polyline;
        int64_t refreshed_ms{0};
        bool loaded{false};
    };

    bool fresh(const Entry& entry, int64_t now_ms) const;

    RouteStore& store_;
    RoutingConfig cfg_;
    MillisClock clock_;
    std::mutex map_mutex_; // guards entries_ and every Entry's data fields
    std::map<std::string, std::unique_ptr<Entry>> entries_;
    std::atomic<int> store_reads_{0};
};

}  // namespace puv
