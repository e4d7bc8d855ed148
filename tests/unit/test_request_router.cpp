#include "web/request_router.hpp"
#include "store/memory_store.hpp"
#include "support/test_support.hpp"

#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

namespace {

const char* kKey = "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

using nlohmann::json;

bool expectStatus(const puv::HttpReply& reply, int status, const char* what) {
    if (reply.status != status) {
        std::cerr << what << ": expected " << status << ", got " << reply.status << " " << reply.body << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    using puv::testing::northOf;
    std::string err;

    if (puv::httpStatusFor(puv::ErrorKind::Decryption) != 400 || puv::httpStatusFor(puv::ErrorKind::SchemaValidation) != 422 ||
        puv::httpStatusFor(puv::ErrorKind::ModelNotReady) != 202 || puv::httpStatusFor(puv::ErrorKind::ModelUnavailable) != 503 ||
        puv::httpStatusFor(puv::ErrorKind::Inference) != 500) {
        std::cerr << "error kind to HTTP status mapping changed\n";
        return 1;
    }

    puv::TelemetryCodec codec;
    if (!codec.setKeyHex(kKey, err)) {
        return 1;
    }

    // Loader held in Loading until released.
    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool open = false;
    puv::ModelLoader loader([&](std::string&) -> std::shared_ptr<puv::OffsetModel> {
        std::unique_lock<std::mutex> lock(gate_mutex);
        gate_cv.wait(lock, [&open]() { return open; });
        return std::make_shared<puv::testing::FakeOffsetModel>();
    });

    puv::MemoryVehicleRegistry vehicles;
    puv::MemoryUserDirectory users;
    puv::MemoryRouteStore routes;
    puv::MemoryTrackingLog tracking;
    puv::MemoryNotificationLog notifications;
    puv::testing::RecordingPushGateway push;
    puv::BroadcastHub hub;
    puv::ServiceCounters counters;

    const puv::GeoPoint depot{14.6190, 121.0537};
    puv::Vehicle v;
    v.id = "veh-001";
    v.device_id = "dev-001";
    v.fleet_id = "fleet-a";
    v.status = puv::VehicleStatus::Available;
    v.plate = "NYA 1234";
    v.location = depot;
    vehicles.upsert(v);
    puv::Vehicle ghost;
    ghost.id = "veh-ghost";
    ghost.fleet_id = "fleet-a";
    ghost.status = puv::VehicleStatus::Full;
    vehicles.upsert(ghost);
    puv::Rider rider;
    rider.id = "user-001";
    rider.fleet_id = "fleet-a";
    rider.push_token = "tok";
    rider.notify = true;
    users.upsert(rider);

    puv::RoutingConfig routing;
    puv::RouteSnapper snapper(routes, routing);
    puv::ProximityConfig prox;
    puv::ProximityNotifier notifier(vehicles, users, notifications, push, prox, &counters);
    puv::TelemetryConfig telemetry;
    puv::TrackingService service(codec, loader, snapper, puv::TrackingCollaborators{vehicles, users, tracking},
                                 notifier, hub, counters, telemetry);
    puv::EtaConfig eta_cfg;
    puv::EtaEstimator eta(vehicles, tracking, hub, eta_cfg);
    puv::EtaSubscriptions eta_subs(eta, eta_cfg);
    puv::RequestRouter router(service, loader, eta, eta_subs, counters, hub);

    if (!expectStatus(router.route("GET", "/nope", ""), 404, "unknown path") ||
        !expectStatus(router.route("GET", "/predict", ""), 405, "GET /predict") ||
        !expectStatus(router.route("POST", "/predict", "not json"), 422, "non-JSON predict body") ||
        !expectStatus(router.route("POST", "/predict", R"({"data":"x"})"), 422, "predict without encrypted_data")) {
        return 1;
    }

    std::string envelope;
    if (!codec.encryptEnvelope(puv::TelemetryCodec::serializeReading(puv::testing::sampleReading(depot, "dev-001")),
                               envelope, err)) {
        return 1;
    }
    const std::string predict_body = json{{"encrypted_data", envelope}}.dump();

    puv::HttpReply reply = router.route("POST", "/predict", predict_body);
    if (!expectStatus(reply, 202, "predict while loading")) {
        return 1;
    }
    if (json::parse(reply.body)["status"] != "loading") {
        std::cerr << "loading reply should carry status=loading\n";
        return 1;
    }
    reply = router.route("GET", "/predict/status?verbose=1", "");
    if (!expectStatus(reply, 200, "status") || json::parse(reply.body)["status"] != "loading") {
        std::cerr << "status endpoint should report loading without blocking\n";
        return 1;
    }
    if (!expectStatus(router.route("POST", "/admin/reload-models", ""), 409, "reload while loading")) {
        return 1;
    }

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        open = true;
    }
    gate_cv.notify_all();
    if (!loader.waitReady(2000, err)) {
        return 1;
    }

    reply = router.route("POST", "/predict", predict_body);
    if (!expectStatus(reply, 200, "predict when ready")) {
        return 1;
    }
    const json predicted = json::parse(reply.body);
    if (!predicted["latitude"].is_number() || predicted["snapped"] != false || predicted.contains("testing_analysis")) {
        std::cerr << "predict body mismatch: " << reply.body << "\n";
        return 1;
    }
    const std::string tampered = json{{"encrypted_data", "AAAA" + envelope.substr(4)}}.dump();
    // A garbled IV corrupts the first plaintext block; the JSON check rejects it.
    reply = router.route("POST", "/predict", tampered);
    if (reply.status != 400 && reply.status != 422) {
        std::cerr << "tampered envelope should be rejected, got " << reply.status << "\n";
        return 1;
    }

    // ETA
    const json eta_req = {{"vehicle_id", "veh-001"},
                          {"user_location", {{"latitude", northOf(depot, 3000.0).latitude}, {"longitude", depot.longitude}}}};
    reply = router.route("POST", "/vehicles/calculate-eta", eta_req.dump());
    if (!expectStatus(reply, 200, "eta")) {
        return 1;
    }
    const json eta_body = json::parse(reply.body);
    if (eta_body["vehicle_id"] != "veh-001" || eta_body["confidence"] != "high" || !eta_body["eta_formatted"].is_string()) {
        std::cerr << "eta body mismatch: " << reply.body << "\n";
        return 1;
    }
    json missing_vehicle = eta_req;
    missing_vehicle["vehicle_id"] = "veh-404";
    json no_location = eta_req;
    no_location["vehicle_id"] = "veh-ghost";
    json bad_id = eta_req;
    bad_id["vehicle_id"] = json::array();
    json bad_loc = eta_req;
    bad_loc["user_location"] = {{"latitude", 123.0}, {"longitude", 0.0}};
    if (!expectStatus(router.route("POST", "/vehicles/calculate-eta", missing_vehicle.dump()), 404, "eta unknown vehicle") ||
        !expectStatus(router.route("POST", "/vehicles/calculate-eta", no_location.dump()), 400, "eta no location") ||
        !expectStatus(router.route("POST", "/vehicles/calculate-eta", bad_id.dump()), 400, "eta bad id") ||
        !expectStatus(router.route("POST", "/vehicles/calculate-eta", bad_loc.dump()), 400, "eta bad location")) {
        return 1;
    }

    // Live ETA subscriptions
    json sub_req = eta_req;
    sub_req["user_id"] = "user-001";
    reply = router.route("POST", "/eta/subscribe", sub_req.dump());
    if (!expectStatus(reply, 200, "eta subscribe") || json::parse(reply.body)["vehicle_id"] != "veh-001" ||
        eta_subs.size() != 1 || eta_subs.list()[0].user_id != "user-001") {
        std::cerr << "subscribe should answer with the first ETA and register the rider\n";
        return 1;
    }
    if (!expectStatus(router.route("POST", "/eta/subscribe", missing_vehicle.dump()), 404, "subscribe unknown vehicle") ||
        !expectStatus(router.route("GET", "/eta/subscribe", ""), 405, "GET subscribe") || eta_subs.size() != 1) {
        return 1;
    }
    reply = router.route("POST", "/eta/unsubscribe/veh-001", R"({"user_id":"user-002"})");
    if (!expectStatus(reply, 200, "unsubscribe by another user") || json::parse(reply.body)["removed"] != false ||
        eta_subs.size() != 1) {
        std::cerr << "another user must not remove the subscription\n";
        return 1;
    }
    reply = router.route("POST", "/eta/unsubscribe/veh-001", R"({"user_id":"user-001"})");
    if (!expectStatus(reply, 200, "unsubscribe") || json::parse(reply.body)["removed"] != true || eta_subs.size() != 0) {
        std::cerr << "owner should remove the subscription\n";
        return 1;
    }
    if (!expectStatus(router.route("POST", "/eta/unsubscribe/veh-001", "[1]"), 400, "unsubscribe bad body")) {
        return 1;
    }

    // Rider location
    const json user_req = {{"user_id", "user-001"},
                           {"location", {{"latitude", northOf(depot, 120.0).latitude}, {"longitude", depot.longitude}}}};
    reply = router.route("POST", "/users/location", user_req.dump());
    if (!expectStatus(reply, 200, "rider location")) {
        return 1;
    }
    const json user_body = json::parse(reply.body);
    if (user_body["user_id"] != "user-001" || user_body["proximity"].size() != 1 ||
        user_body["proximity"][0]["success"] != true) {
        std::cerr << "rider location body mismatch: " << reply.body << "\n";
        return 1;
    }
    json unknown_user = user_req;
    unknown_user["user_id"] = "user-404";
    if (!expectStatus(router.route("POST", "/users/location", unknown_user.dump()), 404, "unknown rider") ||
        !expectStatus(router.route("POST", "/users/location", R"({"user_id":"user-001"})"), 400, "rider without location")) {
        return 1;
    }

    reply = router.route("GET", "/stats", "");
    if (!expectStatus(reply, 200, "stats") || json::parse(reply.body)["model"] != "ready" ||
        json::parse(reply.body)["notifications_sent"] != 1) {
        std::cerr << "stats body mismatch: " << reply.body << "\n";
        return 1;
    }
    if (!expectStatus(router.route("POST", "/admin/reload-models", ""), 202, "reload when ready") ||
        !loader.waitReady(2000, err)) {
        return 1;
    }

    // Realtime channel resolution
    puv::WsRoute ws;
    if (!router.resolveWebSocket("/ws/vehicles/all/fleet-a", ws, err) || ws.topics != std::vector<std::string>{"fleet:fleet-a"} ||
        json::parse(ws.snapshot)["type"] != "vehicle_list") {
        std::cerr << "fleet channel mismatch\n";
        return 1;
    }
    if (!router.resolveWebSocket("/ws/vehicles/veh-001/location", ws, err) || ws.topics[0] != "vehicle:veh-001" ||
        json::parse(ws.snapshot)["type"] != "location_update") {
        std::cerr << "vehicle channel mismatch\n";
        return 1;
    }
    if (!router.resolveWebSocket("/ws/notifications/user-001", ws, err) || ws.topics[0] != "user:user-001" ||
        json::parse(ws.snapshot)["type"] != "notification_connection_established") {
        std::cerr << "notification channel mismatch\n";
        return 1;
    }
    if (!router.resolveWebSocket("/ws/eta/veh-001", ws, err) || ws.topics[0] != "eta:veh-001" ||
        json::parse(ws.snapshot)["vehicle_id"] != "veh-001") {
        std::cerr << "eta channel mismatch\n";
        return 1;
    }
    if (!router.resolveWebSocket("/ws/count-vehicles", ws, err) || ws.topics[0] != "counts" ||
        json::parse(ws.snapshot)["type"] != "stats_count") {
        std::cerr << "counts channel mismatch\n";
        return 1;
    }
    if (router.resolveWebSocket("/ws/notifications/user-404", ws, err) || router.resolveWebSocket("/ws/bogus", ws, err) ||
        router.resolveWebSocket("/predict", ws, err)) {
        std::cerr << "unknown channels must be rejected\n";
        return 1;
    }

    return 0;
}
