#include "routing/route_snapper.hpp"
#include "core/math_utils.hpp"
#include "support/test_support.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

// Straight east-west segment along Aurora Boulevard; slow reads widen the race window.
class CountingRouteStore : public puv::RouteStore {
public:
    bool loadPolyline(const std::string& route_id, puv::Polyline& out, std::string& error) override {
        reads.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        if (throw_on_load) {
            throw std::runtime_error("route service timed out");
        }
        if (route_id != "route-1") {
            error.clear();
            return false;
        }
        out = {puv::GeoPoint{14.6200, 121.0000}, puv::GeoPoint{14.6200, 121.0100}};
        return true;
    }

    std::atomic<int> reads{0};
    int delay_ms{0};
    bool throw_on_load{false};
};

}  // namespace

int main() {
    // Projection onto a two-segment L shaped line.
    const puv::Polyline line = {puv::GeoPoint{14.62, 121.00}, puv::GeoPoint{14.62, 121.01}, puv::GeoPoint{14.63, 121.01}};
    puv::Projection proj;
    if (puv::projectOntoPolyline(puv::Polyline{}, puv::GeoPoint{14.62, 121.0}, proj)) {
        std::cerr << "empty polyline must not project\n";
        return 1;
    }
    const puv::GeoPoint off_first = puv::testing::northOf(puv::GeoPoint{14.62, 121.005}, 20.0);
    if (!puv::projectOntoPolyline(line, off_first, proj)) {
        return 1;
    }
    if (std::abs(proj.distance_m - 20.0) > 0.1 || std::abs(proj.point.latitude - 14.62) > 1e-6 ||
        std::abs(proj.point.longitude - 121.005) > 1e-6) {
        std::cerr << "projection onto the first segment is off: " << proj.distance_m << "\n";
        return 1;
    }
    const double half_first = puv::haversineMeters(line[0], line[1]) / 2.0;
    if (std::abs(proj.arc_length_m - half_first) > 1.0) {
        std::cerr << "arc length along the first segment mismatch\n";
        return 1;
    }
    // Beyond the end of the line projects onto the last vertex.
    if (!puv::projectOntoPolyline(line, puv::GeoPoint{14.64, 121.01}, proj) ||
        std::abs(proj.point.latitude - 14.63) > 1e-6) {
        std::cerr << "point past the end should clamp to the last vertex\n";
        return 1;
    }

    CountingRouteStore store;
    puv::testing::ManualClock clock;
    puv::RoutingConfig cfg;
    cfg.snapping_enabled = true;
    cfg.cache_ttl_s = 3600;
    cfg.max_snap_distance_m = 50.0;
    puv::RouteSnapper snapper(store, cfg, clock.fn());

    const puv::GeoPoint near = puv::testing::northOf(puv::GeoPoint{14.62, 121.004}, 15.0);
    puv::CorrectedPosition cp = snapper.snap("route-1", near);
    if (!cp.snapped || std::abs(cp.position.latitude - 14.62) > 1e-6) {
        std::cerr << "point 15 m off the route should snap onto it\n";
        return 1;
    }

    const puv::GeoPoint far = puv::testing::northOf(puv::GeoPoint{14.62, 121.004}, 80.0);
    cp = snapper.snap("route-1", far);
    if (cp.snapped || cp.position.latitude != far.latitude) {
        std::cerr << "point beyond max_snap_distance_m should pass through\n";
        return 1;
    }
    if (store.reads.load() != 1 || snapper.storeReads() != 1) {
        std::cerr << "fresh geometry should be served from cache, reads=" << store.reads.load() << "\n";
        return 1;
    }

    clock.advanceSeconds(3599);
    snapper.snap("route-1", near);
    if (store.reads.load() != 1) {
        std::cerr << "geometry inside the TTL must not be re-read\n";
        return 1;
    }
    clock.advanceSeconds(2);
    snapper.snap("route-1", near);
    if (store.reads.load() != 2) {
        std::cerr << "stale geometry should be re-read once\n";
        return 1;
    }

    // Missing routes pass through and the miss is cached too.
    cp = snapper.snap("route-404", near);
    cp = snapper.snap("route-404", near);
    if (cp.snapped || store.reads.load() != 3) {
        std::cerr << "missing route should pass through and be cached, reads=" << store.reads.load() << "\n";
        return 1;
    }

    if (snapper.snap("", near).snapped) {
        std::cerr << "vehicle without a route must not snap\n";
        return 1;
    }

    // Single flight: many concurrent callers on a stale entry trigger one read.
    clock.advanceSeconds(4000);
    store.delay_ms = 50;
    const int before = store.reads.load();
    std::vector<std::thread> callers;
    std::atomic<int> snapped{0};
    for (int i = 0; i < 16; ++i) {
        callers.emplace_back([&]() {
            if (snapper.snap("route-1", near).snapped) {
                snapped.fetch_add(1);
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }
    if (store.reads.load() - before != 1 || snapped.load() != 16) {
        std::cerr << "concurrent refresh should read once, got " << (store.reads.load() - before) << "\n";
        return 1;
    }

    // A throwing store degrades to pass-through.
    clock.advanceSeconds(4000);
    store.delay_ms = 0;
    store.throw_on_load = true;
    cp = snapper.snap("route-1", near);
    if (cp.snapped) {
        std::cerr << "geometry failure should leave the position unsnapped\n";
        return 1;
    }

    puv::RoutingConfig off;
    off.snapping_enabled = false;
    puv::RouteSnapper disabled(store, off, clock.fn());
    const int reads_before = store.reads.load();
    if (disabled.snap("route-1", near).snapped || store.reads.load() != reads_before || disabled.enabled()) {
        std::cerr << "disabled snapper must not touch the store\n";
        return 1;
    }

    return 0;
}
