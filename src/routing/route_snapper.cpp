#include "routing/route_snapper.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#include "core/math_utils.hpp"

namespace puv {

bool projectOntoPolyline(const Polyline& line, const GeoPoint& p, Projection& out) {
    if (line.empty()) {
        return false;
    }
    const GeoPoint origin = p;
    if (line.size() == 1) {
        out.point = line.front();
        out.distance_m = haversineMeters(p, line.front());
        out.arc_length_m = 0.0;
        return true;
    }

    double best_d2 = std::numeric_limits<double>::max();
    double cumulative = 0.0;
    cv::Point2d best_xy;
    double best_arc = 0.0;
    for (std::size_t i = 0; i + 1 < line.size(); ++i) {
        const cv::Point2d a = toLocalMeters(origin, line[i]);
        const cv::Point2d b = toLocalMeters(origin, line[i + 1]);
        const cv::Point2d ab = b - a;
        const double len2 = ab.dot(ab);
        const double seg_len = std::sqrt(len2);
        double t = 0.0;
        if (len2 > 1e-12) {
            t = std::clamp((-a).dot(ab) / len2, 0.0, 1.0);
        }
        const cv::Point2d q = a + t * ab;
        const double d2 = q.dot(q);
        if (d2 < best_d2) {
            best_d2 = d2;
            best_xy = q;
            best_arc = cumulative + t * seg_len;
        }
        cumulative += seg_len;
    }

    out.point = fromLocalMeters(origin, best_xy);
    out.distance_m = std::sqrt(best_d2);
    out.arc_length_m = best_arc;
    return true;
}

RouteSnapper::RouteSnapper(RouteStore& store, const RoutingConfig& cfg, MillisClock clock)
    : store_(store), cfg_(cfg), clock_(std::move(clock)) {}

bool RouteSnapper::fresh(const Entry& entry, int64_t now_ms) const {
    return entry.loaded && (now_ms - entry.refreshed_ms) < static_cast<int64_t>(cfg_.cache_ttl_s) * 1000;
}

std::shared_ptr<const Polyline> RouteSnapper::geometry(const std::string& route_id) {
    Entry* entry = nullptr;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto& slot = entries_[route_id];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        entry = slot.get();
        if (fresh(*entry, clock_())) {
            return entry->polyline;
        }
    }

    std::lock_guard<std::mutex> refresh(entry->refresh_mutex);
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        if (fresh(*entry, clock_())) {
            return entry->polyline;
        }
    }

    store_reads_.fetch_add(1);
    std::shared_ptr<const Polyline> loaded;
    Polyline line;
    std::string error;
    try {
        if (store_.loadPolyline(route_id, line, error) && !line.empty()) {
            loaded = std::make_shared<const Polyline>(std::move(line));
        } else if (!error.empty()) {
            std::cerr << "[routing] geometry for route " << route_id << " unavailable: " << error << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << "[routing] geometry load for route " << route_id << " threw: " << e.what() << '\n';
    }

    std::lock_guard<std::mutex> lock(map_mutex_);
    entry->polyline = loaded;
    entry->refreshed_ms = clock_();
    entry->loaded = true;
    return loaded;
}

CorrectedPosition RouteSnapper::snap(const std::string& route_id, const GeoPoint& position, ErrorKind* note) {
    CorrectedPosition out{position, false};
    if (!cfg_.snapping_enabled || route_id.empty()) {
        return out;
    }
    const auto line = geometry(route_id);
    if (!line) {
        if (note != nullptr) {
            *note = ErrorKind::GeometryUnavailable;
        }
        return out;
    }
    Projection proj;
    if (!projectOntoPolyline(*line, position, proj)) {
        return out;
    }
    if (cfg_.max_snap_distance_m > 0.0 && proj.distance_m > cfg_.max_snap_distance_m) {
        return out;
    }
    out.position = proj.point;
    out.snapped = true;
    return out;
}

}  // namespace puv
