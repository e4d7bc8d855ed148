#include "web/request_router.hpp"

#include <cmath>
#include <iostream>

#include <nlohmann/json.hpp>

#include "service/messages.hpp"

namespace puv {

namespace {

using nlohmann::json;

HttpReply detail(int status, const std::string& message) {
    return HttpReply{status, json{{"detail", message}}.dump()};
}

std::string stripQuery(const std::string& target) {
    const auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : path) {
        if (c == '/') {
            if (!cur.empty()) {
                parts.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) {
        parts.push_back(cur);
    }
    return parts;
}

bool readGeoPoint(const json& node, GeoPoint& out, std::string& error) {
    if (!node.is_object() || !node.contains("latitude") || !node.contains("longitude") ||
        !node["latitude"].is_number() || !node["longitude"].is_number()) {
        error = "location needs numeric latitude and longitude";
        return false;
    }
    out.latitude = node["latitude"].get<double>();
    out.longitude = node["longitude"].get<double>();
    if (!std::isfinite(out.latitude) || !std::isfinite(out.longitude) ||
        std::abs(out.latitude) > 90.0 || std::abs(out.longitude) > 180.0) {
        error = "location out of range";
        return false;
    }
    error.clear();
    return true;
}

bool readId(const json& body, const char* key, std::string& out) {
    if (!body.contains(key)) {
        return false;
    }
    const json& v = body[key];
    if (v.is_string()) {
        out = v.get<std::string>();
    } else if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
    } else {
        return false;
    }
    return !out.empty();
}

}  // namespace

int httpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return 200;
        case ErrorKind::Decryption:
            return 400;
        case ErrorKind::SchemaValidation:
            return 422;
        case ErrorKind::ModelNotReady:
            return 202;
        case ErrorKind::ModelUnavailable:
            return 503;
        default:
            return 500;
    }
}

RequestRouter::RequestRouter(TrackingService& tracking, ModelLoader& loader, EtaEstimator& eta,
                             EtaSubscriptions& eta_subs, ServiceCounters& counters, BroadcastHub& hub)
    : tracking_(tracking), loader_(loader), eta_(eta), eta_subs_(eta_subs), counters_(counters), hub_(hub) {}

HttpReply RequestRouter::route(const std::string& method, const std::string& target, const std::string& body) {
    const std::string path = stripQuery(target);
    try {
        if (path == "/predict") {
            return method == "POST" ? predict(body) : detail(405, "Method Not Allowed");
        }
        if (path == "/predict/status") {
            return method == "GET" ? predictStatus() : detail(405, "Method Not Allowed");
        }
        if (path == "/admin/reload-models") {
            return method == "POST" ? reloadModels() : detail(405, "Method Not Allowed");
        }
        if (path == "/vehicles/calculate-eta") {
            return method == "POST" ? calculateEta(body, false) : detail(405, "Method Not Allowed");
        }
        if (path == "/eta/subscribe") {
            return method == "POST" ? calculateEta(body, true) : detail(405, "Method Not Allowed");
        }
        const auto parts = splitPath(path);
        if (parts.size() == 3 && parts[0] == "eta" && parts[1] == "unsubscribe") {
            return method == "POST" ? unsubscribeEta(parts[2], body) : detail(405, "Method Not Allowed");
        }
        if (path == "/users/location") {
            return method == "POST" ? riderLocation(body) : detail(405, "Method Not Allowed");
        }
        if (path == "/stats") {
            return method == "GET" ? stats() : detail(405, "Method Not Allowed");
        }
    } catch (const std::exception& e) {
        std::cerr << "[web] " << method << ' ' << path << " failed: " << e.what() << '\n';
        return detail(500, std::string("Internal error: ") + e.what());
    }
    return detail(404, "Not Found");
}

HttpReply RequestRouter::predict(const std::string& body) {
    const json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
        return detail(422, "request body is not a JSON object");
    }
    if (!req.contains("encrypted_data") || !req["encrypted_data"].is_string()) {
        return detail(422, "encrypted_data (string) is required");
    }

    const IngestResult result = tracking_.ingestEnvelope(req["encrypted_data"].get<std::string>());
    if (!result.ok) {
        const int status = httpStatusFor(result.kind);
        if (result.kind == ErrorKind::ModelNotReady) {
            return HttpReply{status, json{{"status", "loading"}, {"detail", result.error}}.dump()};
        }
        return detail(status, result.error);
    }

    json out;
    out["latitude"] = result.corrected.position.latitude;
    out["longitude"] = result.corrected.position.longitude;
    out["snapped"] = result.corrected.snapped;
    if (!result.warnings.empty()) {
        json warnings = json::array();
        for (ErrorKind w : result.warnings) {
            warnings.push_back(errorKindName(w));
        }
        out["warnings"] = warnings;
    }
    if (result.testing) {
        out["testing_analysis"] = {
            {"ground_truth_lat", result.testing->ground_truth.latitude},
            {"ground_truth_lng", result.testing->ground_truth.longitude},
            {"error_meters", std::round(result.testing->error_m * 100.0) / 100.0},
        };
    }
    return HttpReply{200, out.dump()};
}

HttpReply RequestRouter::predictStatus() {
    const ModelStatus s = loader_.status();
    json out;
    out["status"] = modelLoadStateName(s.state);
    out["load_attempts"] = loader_.loadAttempts();
    if (!s.error.empty()) {
        out["error"] = s.error;
    }
    return HttpReply{200, out.dump()};
}

HttpReply RequestRouter::reloadModels() {
    if (!loader_.reload()) {
        return detail(409, "model load already in progress");
    }
    return HttpReply{202, json{{"status", modelLoadStateName(loader_.status().state)}}.dump()};
}

HttpReply RequestRouter::calculateEta(const std::string& body, bool subscribe) {
    const json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
        return detail(400, "request body is not a JSON object");
    }
    std::string vehicle_id;
    if (!readId(req, "vehicle_id", vehicle_id)) {
        return detail(400, "Invalid vehicle ID format");
    }
    GeoPoint rider;
    std::string error;
    if (!req.contains("user_location") || !readGeoPoint(req["user_location"], rider, error)) {
        return detail(400, error.empty() ? "user_location is required" : error);
    }

    std::string user_id;
    if (subscribe && req.contains("user_id") && !readId(req, "user_id", user_id)) {
        return detail(400, "Invalid user_id format");
    }

    EtaResult result;
    EtaError failure = EtaError::None;
    if (!eta_.estimate(vehicle_id, rider, result, failure, error)) {
        switch (failure) {
            case EtaError::VehicleNotFound:
                return detail(404, error);
            case EtaError::LocationUnavailable:
                return detail(400, error);
            default:
                return detail(500, error);
        }
    }
    if (subscribe) {
        eta_subs_.subscribe(vehicle_id, user_id, rider);
    }
    return HttpReply{200, EtaEstimator::toJson(result)};
}

HttpReply RequestRouter::unsubscribeEta(const std::string& vehicle_id, const std::string& body) {
    std::string user_id;
    if (!body.empty()) {
        const json req = json::parse(body, nullptr, false);
        if (req.is_discarded() || !req.is_object()) {
            return detail(400, "request body is not a JSON object");
        }
        if (req.contains("user_id") && !readId(req, "user_id", user_id)) {
            return detail(400, "Invalid user_id format");
        }
    }
    const bool removed = eta_subs_.unsubscribe(vehicle_id, user_id);
    return HttpReply{200, json{{"message", "Unsubscribed from ETA updates"}, {"removed", removed}}.dump()};
}

HttpReply RequestRouter::riderLocation(const std::string& body) {
    const json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
        return detail(400, "request body is not a JSON object");
    }
    std::string user_id;
    if (!readId(req, "user_id", user_id)) {
        return detail(400, "Invalid user_id format");
    }
    GeoPoint location;
    std::string error;
    if (!req.contains("location") || !readGeoPoint(req["location"], location, error)) {
        return detail(400, error.empty() ? "Invalid location format" : error);
    }

    std::vector<NotifyOutcome> outcomes;
    if (!tracking_.updateRiderLocation(user_id, location, outcomes, error)) {
        const bool missing = error.find("not found") != std::string::npos;
        return detail(missing ? 404 : 500, error);
    }

    json list = json::array();
    for (const auto& o : outcomes) {
        list.push_back({
            {"vehicle_id", o.vehicle_id},
            {"success", o.success},
            {"in_range", o.in_range},
            {"distance_meters", std::round(o.distance_m * 100.0) / 100.0},
            {"message", o.message},
        });
        if (o.kind != ErrorKind::None) {
            list.back()["error"] = errorKindName(o.kind);
        }
    }
    json out;
    out["message"] = "Location updated for user " + user_id;
    out["user_id"] = user_id;
    out["proximity"] = list;
    return HttpReply{200, out.dump()};
}

HttpReply RequestRouter::stats() {
    json out = json::parse(countersJson(counters_.snapshot()));
    out["topics"] = hub_.topicCount();
    out["subscribed_connections"] = hub_.connectionCount();
    out["dropped_connections"] = hub_.droppedConnections();
    out["model"] = modelLoadStateName(loader_.status().state);
    out["eta_subscriptions"] = eta_subs_.size();
    return HttpReply{200, out.dump()};
}

bool RequestRouter::resolveWebSocket(const std::string& target, WsRoute& out, std::string& error) {
    const auto parts = splitPath(stripQuery(target));
    out = WsRoute{};
    if (parts.empty() || parts[0] != "ws") {
        error = "not a realtime channel";
        return false;
    }

    if (parts.size() == 4 && parts[1] == "vehicles" && parts[2] == "all") {
        out.topics.push_back(topics::fleet(parts[3]));
        out.snapshot = tracking_.fleetSnapshot(parts[3]);
    } else if (parts.size() == 4 && parts[1] == "vehicles" && parts[3] == "location") {
        out.topics.push_back(topics::vehicle(parts[2]));
        out.snapshot = tracking_.vehicleSnapshot(parts[2]);
    } else if (parts.size() == 3 && parts[1] == "notifications") {
        if (!tracking_.riderKnown(parts[2])) {
            error = "User " + parts[2] + " not found";
            return false;
        }
        out.topics.push_back(topics::user(parts[2]));
        out.snapshot = connectionEstablishedJson("notification_connection_established", "user_id", parts[2]);
    } else if (parts.size() == 3 && parts[1] == "eta") {
        out.topics.push_back(topics::eta(parts[2]));
        out.snapshot = connectionEstablishedJson("eta_connection_established", "vehicle_id", parts[2]);
    } else if (parts.size() == 2 && parts[1] == "count-vehicles") {
        out.topics.push_back(topics::counts());
        out.snapshot = tracking_.countsSnapshot();
    } else {
        error = "unknown realtime channel " + target;
        return false;
    }
    error.clear();
    return true;
}

}  // namespace puv
