#include "notify/proximity_notifier.hpp"
#include "notify/push_gateway.hpp"
#include "store/memory_store.hpp"
#include "support/test_support.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

namespace {

class ThrowingNotificationLog : public puv::MemoryNotificationLog {
public:
    std::optional<puv::NotificationRecord> findRecent(const std::string&, const std::string&, int64_t) override {
        throw std::runtime_error("notification log offline");
    }
};

class RejectingNotificationLog : public puv::MemoryNotificationLog {
public:
    bool append(const puv::NotificationRecord&, std::string& error) override {
        error = "notification log full";
        return false;
    }
};

// Each send takes as long as a round trip to a push backend.
class SlowPushGateway : public puv::PushGateway {
public:
    bool send(const puv::PushTarget&, const puv::PushMessage&, std::string& error) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        sends.fetch_add(1);
        error.clear();
        return true;
    }

    std::atomic<int> sends{0};
};

puv::Vehicle makeVehicle(const std::string& id, const puv::GeoPoint& at) {
    puv::Vehicle v;
    v.id = id;
    v.device_id = "dev-" + id;
    v.fleet_id = "fleet-a";
    v.status = puv::VehicleStatus::Available;
    v.plate = "NYA 1234";
    v.location = at;
    return v;
}

puv::Rider makeRider(const std::string& id, const puv::GeoPoint& at) {
    puv::Rider r;
    r.id = id;
    r.fleet_id = "fleet-a";
    r.push_token = "tok-" + id;
    r.notify = true;
    r.location = at;
    return r;
}

}  // namespace

int main() {
    using puv::testing::northOf;

    const puv::GeoPoint stop{14.6180, 121.0520};
    puv::MemoryVehicleRegistry vehicles;
    puv::MemoryUserDirectory users;
    puv::MemoryNotificationLog log;
    puv::testing::RecordingPushGateway push;
    puv::ServiceCounters counters;
    puv::testing::ManualClock clock;
    puv::ProximityConfig cfg;
    puv::ProximityNotifier notifier(vehicles, users, log, push, cfg, &counters, clock.fn());

    const puv::Rider rider = makeRider("user-1", stop);

    // Just outside the radius.
    puv::NotifyOutcome out = notifier.checkAndNotify(rider, makeVehicle("veh-far", northOf(stop, 500.01)));
    if (out.success || out.in_range || out.message != "out of range" || !push.sent.empty()) {
        std::cerr << "500.01 m must be out of range\n";
        return 1;
    }

    // Just inside.
    const puv::Vehicle inside = makeVehicle("veh-near", northOf(stop, 499.99));
    out = notifier.checkAndNotify(rider, inside);
    if (!out.success || !out.in_range || out.message != "notification sent") {
        std::cerr << "499.99 m should notify, got '" << out.message << "'\n";
        return 1;
    }
    if (push.sent.size() != 1 || push.sent[0].token != "tok-user-1" || push.bodies[0] != "A PUV is 500m away from you!") {
        std::cerr << "push message mismatch: " << (push.bodies.empty() ? "" : push.bodies[0]) << "\n";
        return 1;
    }
    const auto records = log.all();
    if (records.size() != 1 || !records[0].success || records[0].type != "proximity" ||
        records[0].timestamp_ms != clock.now_ms.load()) {
        std::cerr << "successful dispatch should be persisted\n";
        return 1;
    }

    // Cooldown: suppressed inside 300 s, allowed after.
    clock.advanceSeconds(299);
    out = notifier.checkAndNotify(rider, inside);
    if (out.success || out.message != "recent notification exists" || push.sent.size() != 1) {
        std::cerr << "second notification inside the cooldown must be suppressed\n";
        return 1;
    }
    // Another vehicle is a different pair.
    out = notifier.checkAndNotify(rider, makeVehicle("veh-other", northOf(stop, 100.0)));
    if (!out.success) {
        std::cerr << "cooldown is per (rider, vehicle) pair\n";
        return 1;
    }
    clock.advanceSeconds(2);
    out = notifier.checkAndNotify(rider, inside);
    if (!out.success) {
        std::cerr << "notification after the cooldown should be sent\n";
        return 1;
    }

    // Dispatch failure is reported and not persisted.
    const std::size_t persisted = log.all().size();
    push.succeed = false;
    out = notifier.checkAndNotify(makeRider("user-2", stop), inside);
    if (out.success || out.message.rfind("push dispatch failed", 0) != 0 || log.all().size() != persisted) {
        std::cerr << "failed dispatch must not be persisted\n";
        return 1;
    }
    push.succeed = true;
    push.throw_on_send = true;
    out = notifier.checkAndNotify(makeRider("user-3", stop), inside);
    if (out.success || out.message.rfind("push dispatch failed", 0) != 0) {
        std::cerr << "throwing gateway should be reported as a dispatch failure\n";
        return 1;
    }
    push.throw_on_send = false;

    puv::Rider no_token = makeRider("user-4", stop);
    no_token.push_token.clear();
    if (notifier.checkAndNotify(no_token, inside).message != "no push token") {
        std::cerr << "rider without token should be skipped\n";
        return 1;
    }
    puv::Rider nowhere = makeRider("user-5", stop);
    nowhere.location.reset();
    if (notifier.checkAndNotify(nowhere, inside).message != "location unavailable") {
        std::cerr << "rider without location should be skipped\n";
        return 1;
    }

    const auto snap = counters.snapshot();
    if (snap.notifications_sent != 3 || snap.notifications_suppressed != 1 || snap.notifications_failed != 2) {
        std::cerr << "counters mismatch: sent=" << snap.notifications_sent << " suppressed="
                  << snap.notifications_suppressed << " failed=" << snap.notifications_failed << "\n";
        return 1;
    }

    // Failure kinds: dispatch failure and a sent-but-unlogged notification.
    push.succeed = false;
    out = notifier.checkAndNotify(makeRider("user-6", stop), inside);
    push.succeed = true;
    if (out.kind != puv::ErrorKind::PushDispatch) {
        std::cerr << "dispatch failure should carry push_dispatch_failure, got " << puv::errorKindName(out.kind) << "\n";
        return 1;
    }
    {
        RejectingNotificationLog full_log;
        puv::testing::RecordingPushGateway ok_push;
        puv::ProximityNotifier unlogged(vehicles, users, full_log, ok_push, cfg, nullptr, clock.fn());
        out = unlogged.checkAndNotify(rider, inside);
        if (!out.success || out.kind != puv::ErrorKind::Persistence || ok_push.sent.size() != 1) {
            std::cerr << "unlogged notification is still sent, tagged persistence_warning\n";
            return 1;
        }
    }

    // Concurrent checks of one pair: the sweep thread and a rider update racing.
    {
        puv::MemoryNotificationLog shared_log;
        SlowPushGateway slow;
        puv::ProximityNotifier racing(vehicles, users, shared_log, slow, cfg, nullptr, clock.fn());
        const puv::Rider racer = makeRider("user-20", stop);
        puv::NotifyOutcome first;
        puv::NotifyOutcome second;
        std::thread a([&]() { first = racing.checkAndNotify(racer, inside); });
        std::thread b([&]() { second = racing.checkAndNotify(racer, inside); });
        a.join();
        b.join();
        if (slow.sends.load() != 1 || shared_log.all().size() != 1) {
            std::cerr << "one pair must dispatch once: sends=" << slow.sends.load()
                      << " records=" << shared_log.all().size() << "\n";
            return 1;
        }
        if (first.success == second.success) {
            std::cerr << "exactly one of the concurrent checks should succeed\n";
            return 1;
        }
        const puv::NotifyOutcome& loser = first.success ? second : first;
        if (loser.message != "recent notification exists") {
            std::cerr << "the other check should be suppressed, got '" << loser.message << "'\n";
            return 1;
        }
        // The reservation is released once the record is written.
        clock.advanceSeconds(cfg.cooldown_s + 1);
        if (!racing.checkAndNotify(racer, inside).success || slow.sends.load() != 2) {
            std::cerr << "pair should be notifiable again after the cooldown\n";
            return 1;
        }
    }

    ThrowingNotificationLog broken_log;
    puv::ProximityNotifier broken(vehicles, users, broken_log, push, cfg, nullptr, clock.fn());
    if (broken.checkAndNotify(rider, inside).message != "cooldown lookup failed") {
        std::cerr << "cooldown lookup fault should be reported as a value\n";
        return 1;
    }

    // checkRider and sweep over the registry.
    vehicles.upsert(inside);
    puv::Vehicle full = makeVehicle("veh-full", northOf(stop, 50.0));
    full.status = puv::VehicleStatus::Full;
    vehicles.upsert(full);
    puv::Vehicle other_fleet = makeVehicle("veh-b", northOf(stop, 50.0));
    other_fleet.fleet_id = "fleet-b";
    vehicles.upsert(other_fleet);
    users.upsert(makeRider("user-10", stop));
    puv::Rider far_rider = makeRider("user-11", northOf(stop, 5000.0));
    users.upsert(far_rider);
    puv::Rider opted_out = makeRider("user-12", stop);
    opted_out.notify = false;
    users.upsert(opted_out);

    std::vector<puv::NotifyOutcome> outcomes;
    std::string err;
    if (!notifier.checkRider("user-10", outcomes, err) || outcomes.size() != 1 || !outcomes[0].success) {
        std::cerr << "checkRider should test only available vehicles of the rider's fleet\n";
        return 1;
    }
    if (notifier.checkRider("user-nobody", outcomes, err) || err != "user not found: user-nobody") {
        std::cerr << "checkRider on an unknown user should fail\n";
        return 1;
    }

    clock.advanceSeconds(cfg.cooldown_s + 1);
    const puv::SweepSummary summary = notifier.sweep();
    if (summary.fleets != 1 || summary.riders != 2 || summary.checks != 2 || summary.notifications != 1) {
        std::cerr << "sweep summary mismatch: fleets=" << summary.fleets << " riders=" << summary.riders
                  << " checks=" << summary.checks << " notifications=" << summary.notifications << "\n";
        return 1;
    }
    if (counters.snapshot().sweeps != 1) {
        std::cerr << "sweep should be counted\n";
        return 1;
    }

    // Realtime gateway publishes on the rider's notification topic.
    puv::BroadcastHub hub;
    puv::RealtimePushGateway realtime(hub);
    puv::PushMessage msg;
    msg.title = "PUV Nearby!";
    msg.body = "A PUV is 120m away from you!";
    msg.data["vehicle_id"] = "veh-near";
    if (realtime.send(puv::PushTarget{"user-1", "tok"}, msg, err)) {
        std::cerr << "realtime push without a listener should fail\n";
        return 1;
    }
    auto channel = std::make_shared<puv::testing::RecordingSubscriber>();
    hub.subscribe(channel, puv::topics::user("user-1"));
    if (!realtime.send(puv::PushTarget{"user-1", "tok"}, msg, err) || channel->messages.size() != 1) {
        std::cerr << "realtime push should reach the rider channel: " << err << "\n";
        return 1;
    }
    const auto j = nlohmann::json::parse(channel->messages[0]);
    if (j["type"] != "notification" || j["body"] != msg.body || j["data"]["vehicle_id"] != "veh-near") {
        std::cerr << "notification payload mismatch\n";
        return 1;
    }

    puv::LoggingPushGateway logging;
    if (!logging.send(puv::PushTarget{"user-1", "tok"}, msg, err)) {
        return 1;
    }

    return 0;
}
