#include "core/config.hpp"
#include "core/counters.hpp"
#include "correction/model_loader.hpp"
#include "correction/offset_model.hpp"
#include "eta/eta_estimator.hpp"
#include "eta/eta_subscriptions.hpp"
#include "ingest/telemetry_codec.hpp"
#include "ipc/control_plane.hpp"
#include "notify/proximity_notifier.hpp"
#include "notify/push_gateway.hpp"
#include "realtime/broadcast_hub.hpp"
#include "routing/route_snapper.hpp"
#include "sched/periodic_task.hpp"
#include "service/control_commands.hpp"
#include "service/tracking_service.hpp"
#include "store/memory_store.hpp"
#include "web/api_server.hpp"
#include "web/request_router.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void onSignal(int) {
    g_running.store(false);
}
}

int main(int argc, char** argv) {
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    const std::string config_path = (argc > 1) ? argv[1] : "config/config.yaml";

    puv::AppConfig config;
    std::string error;
    if (!puv::loadConfig(config_path, config, error)) {
        std::cerr << "Config load failed: " << error << '\n';
        return 1;
    }
    puv::TelemetryCodec codec;
    if (!codec.setKeyHex(config.telemetry.aes_key_hex, error)) {
        std::cerr << "Telemetry key rejected: " << error << '\n';
        return 1;
    }

    puv::Fixtures fixtures;
    if (!puv::loadFixtures(config.store.fixtures_path, fixtures, error)) {
        std::cerr << "Fixtures load failed: " << error << '\n';
        return 1;
    }
    puv::MemoryVehicleRegistry vehicles;
    puv::MemoryUserDirectory users;
    puv::MemoryRouteStore routes;
    puv::MemoryTrackingLog tracking_log(static_cast<std::size_t>(config.store.tracking_log_max_per_device));
    puv::MemoryNotificationLog notification_log(static_cast<int64_t>(config.proximity.cooldown_s) * 1000);
    for (const auto& v : fixtures.vehicles) {
        vehicles.upsert(v);
    }
    for (const auto& r : fixtures.riders) {
        users.upsert(r);
    }
    for (const auto& kv : fixtures.routes) {
        routes.put(kv.first, kv.second);
    }
    std::cout << "Loaded " << fixtures.vehicles.size() << " vehicles, " << fixtures.riders.size()
              << " users, " << fixtures.routes.size() << " routes\n";

    puv::BroadcastHub hub;
    puv::ServiceCounters counters;

    const puv::ModelConfig model_cfg = config.model;
    puv::ModelLoader loader([model_cfg](std::string& err) -> std::shared_ptr<puv::OffsetModel> {
        auto model = std::make_shared<puv::DnnOffsetModel>();
        if (!model->load(model_cfg.onnx_path, model_cfg.feature_schema_path, err)) {
            return nullptr;
        }
        return model;
    });
    if (config.model.autoload) {
        loader.start();
    }

    std::unique_ptr<puv::PushGateway> push;
    if (config.proximity.push_gateway == "log") {
        push = std::make_unique<puv::LoggingPushGateway>();
    } else {
        push = std::make_unique<puv::RealtimePushGateway>(hub);
    }

    puv::RouteSnapper snapper(routes, config.routing);
    puv::ProximityNotifier notifier(vehicles, users, notification_log, *push, config.proximity, &counters);
    puv::TrackingService service(codec, loader, snapper, puv::TrackingCollaborators{vehicles, users, tracking_log},
                                 notifier, hub, counters, config.telemetry);
    puv::EtaEstimator eta(vehicles, tracking_log, hub, config.eta);
    puv::EtaSubscriptions eta_subscriptions(eta, config.eta);
    puv::RequestRouter router(service, loader, eta, eta_subscriptions, counters, hub);

    puv::ApiServer server(router, hub, counters, config.server);
    if (!server.start(error)) {
        std::cerr << "API server failed to start: " << error << '\n';
        return 1;
    }

    const auto& sched = config.scheduler;
    puv::PeriodicTask sweep_task("proximity-sweep", [&notifier]() {
        const auto summary = notifier.sweep();
        if (summary.notifications > 0) {
            std::cout << "[proximity] sweep: " << summary.checks << " checks, "
                      << summary.notifications << " notifications\n";
        }
    }, sched.sweep_interval_ms, sched.error_backoff_ms);
    const int inactivity_threshold_s = sched.inactivity_threshold_s;
    puv::PeriodicTask inactivity_task("inactivity-check", [&service, inactivity_threshold_s]() {
        service.markInactiveVehicles(inactivity_threshold_s);
    }, sched.inactivity_check_interval_ms, sched.error_backoff_ms);
    puv::PeriodicTask counts_task("counts-ticker", [&service]() {
        service.publishCounts();
    }, sched.counts_interval_ms, sched.error_backoff_ms);

    puv::PeriodicTask eta_task("eta-refresh", [&eta_subscriptions]() {
        eta_subscriptions.refresh();
    }, sched.eta_refresh_interval_ms, sched.error_backoff_ms);

    for (puv::PeriodicTask* task : {&sweep_task, &inactivity_task, &counts_task, &eta_task}) {
        if (!task->start(error)) {
            std::cerr << "Scheduler failed to start: " << error << '\n';
            server.stop();
            return 1;
        }
    }

    puv::ControlCommands commands(loader, sweep_task, counters, hub);
    puv::ipc::UnixControlServer ctl_server;
    if (!ctl_server.start(config.server.control_socket,
                          [&commands](const std::string& req) { return commands.handle(req); }, error)) {
        std::cerr << "Control socket unavailable, continuing without it: " << error << '\n';
    }

    std::cout << "puvtrack running on port " << server.port() << ", control socket "
              << (ctl_server.isRunning() ? ctl_server.socketPath() : std::string("disabled")) << '\n';
    std::cout << "Press Ctrl+C to stop.\n";

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Shutting down\n";
    ctl_server.stop();
    eta_task.stop();
    counts_task.stop();
    inactivity_task.stop();
    sweep_task.stop();
    server.stop();
    return 0;
}
