#pragma once

#include <string>
#include <vector>

#include "core/counters.hpp"
#include "correction/model_loader.hpp"
#include "eta/eta_estimator.hpp"
#include "eta/eta_subscriptions.hpp"
#include "realtime/broadcast_hub.hpp"
#include "service/tracking_service.hpp"

namespace puv {

struct HttpReply {
    int status{200};
    std::string body;
};

struct WsRoute {
    std::vector<std::string> topics;
    std::string snapshot; // sent once right after the handshake
};

int httpStatusFor(ErrorKind kind);

// Maps requests onto the services. No socket code, so every route is testable directly.
class RequestRouter {
public:
    RequestRouter(TrackingService& tracking, ModelLoader& loader, EtaEstimator& eta, EtaSubscriptions& eta_subs,
                  ServiceCounters& counters, BroadcastHub& hub);

    HttpReply route(const std::string& method, const std::string& target, const std::string& body);

    // False with an error for paths that are not realtime channels.
    bool resolveWebSocket(const std::string& target, WsRoute& out, std::string& error);

private:
    HttpReply predict(const std::string& body);
    HttpReply predictStatus();
    HttpReply reloadModels();
    // subscribe keeps the rider's ETA refreshed after a successful estimate.
    HttpReply calculateEta(const std::string& body, bool subscribe);
    HttpReply unsubscribeEta(const std::string& vehicle_id, const std::string& body);
    HttpReply riderLocation(const std::string& body);
    HttpReply stats();

    TrackingService& tracking_;
    ModelLoader& loader_;
    EtaEstimator& eta_;
    EtaSubscriptions& eta_subs_;
    ServiceCounters& counters_;
    BroadcastHub& hub_;
};

}  // namespace puv
