#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/config.hpp"
#include "core/counters.hpp"
#include "realtime/broadcast_hub.hpp"
#include "web/request_router.hpp"

namespace puv {

class WsSession;

// HTTP + WebSocket front end. Socket I/O runs on io_threads; router calls run on
// a separate pool of blocking_threads.
class ApiServer {
public:
    ApiServer(RequestRouter& router, BroadcastHub& hub, ServiceCounters& counters, const ServerConfig& cfg);
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // cfg.port 0 binds an ephemeral port; see port().
    bool start(std::string& error);
    void stop();
    bool isRunning() const { return running_.load(); }
    uint16_t port() const { return bound_port_.load(); }

    void trackSession(const std::shared_ptr<WsSession>& session);
    std::size_t openSessions();

    struct Runtime;

private:
    RequestRouter& router_;
    BroadcastHub& hub_;
    ServiceCounters& counters_;
    ServerConfig cfg_;

    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::unique_ptr<Runtime> rt_;
    std::vector<std::thread> io_threads_;

    std::mutex sessions_mutex_;
    std::vector<std::weak_ptr<WsSession>> sessions_;
};

}  // namespace puv
