#include "eta/eta_subscriptions.hpp"

#include <iostream>

namespace puv {

EtaSubscriptions::EtaSubscriptions(EtaEstimator& estimator, const EtaConfig& cfg, MillisClock wall_clock)
    : estimator_(estimator), cfg_(cfg), wall_clock_(std::move(wall_clock)) {}

void EtaSubscriptions::subscribe(const std::string& vehicle_id, const std::string& user_id, const GeoPoint& rider) {
    EtaSubscription sub;
    sub.vehicle_id = vehicle_id;
    sub.user_id = user_id;
    sub.rider = rider;
    sub.subscribed_ms = wall_clock_();
    std::lock_guard<std::mutex> lock(mutex_);
    by_vehicle_[vehicle_id] = std::move(sub);
}

bool EtaSubscriptions::unsubscribe(const std::string& vehicle_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = by_vehicle_.find(vehicle_id);
    if (it == by_vehicle_.end() || it->second.user_id != user_id) {
        return false;
    }
    by_vehicle_.erase(it);
    return true;
}

EtaRefreshSummary EtaSubscriptions::refresh() {
    EtaRefreshSummary summary;
    std::vector<EtaSubscription> live;
    {
        const int64_t cutoff = wall_clock_() - static_cast<int64_t>(cfg_.subscription_ttl_s) * 1000;
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = by_vehicle_.begin(); it != by_vehicle_.end();) {
            if (it->second.subscribed_ms < cutoff) {
                std::cout << "[eta] subscription for vehicle " << it->first << " expired\n";
                it = by_vehicle_.erase(it);
                ++summary.pruned;
            } else {
                live.push_back(it->second);
                ++it;
            }
        }
    }

    for (const auto& sub : live) {
        EtaResult result;
        EtaError failure = EtaError::None;
        std::string error;
        if (estimator_.estimate(sub.vehicle_id, sub.rider, result, failure, error)) {
            ++summary.refreshed;
        } else {
            ++summary.failed;
            std::cerr << "[eta] refresh for vehicle " << sub.vehicle_id << " failed: " << error << '\n';
        }
    }
    return summary;
}

std::size_t EtaSubscriptions::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_vehicle_.size();
}

std::vector<EtaSubscription> EtaSubscriptions::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EtaSubscription> out;
    out.reserve(by_vehicle_.size());
    for (const auto& kv : by_vehicle_) {
        out.push_back(kv.second);
    }
    return out;
}

}  // namespace puv
