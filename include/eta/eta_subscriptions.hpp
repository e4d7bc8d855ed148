#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include "eta/eta_estimator.hpp"

namespace puv {

struct EtaSubscription {
    std::string vehicle_id;
    std::string user_id;
    GeoPoint rider;
    int64_t subscribed_ms{0};
};

struct EtaRefreshSummary {
    std::size_t refreshed{0};
    std::size_t failed{0};
    std::size_t pruned{0};
};

// Riders waiting on a vehicle, one subscription per vehicle; subscribing again replaces it.
// refresh() recomputes each live ETA, which the estimator publishes on the vehicle's ETA topic.
// A subscription expires subscription_ttl_s after it was made.
class EtaSubscriptions {
public:
    EtaSubscriptions(EtaEstimator& estimator, const EtaConfig& cfg, MillisClock wall_clock = nowWallMs);

    void subscribe(const std::string& vehicle_id, const std::string& user_id, const GeoPoint& rider);
    // Only the user who subscribed may remove it. False when nothing was removed.
    bool unsubscribe(const std::string& vehicle_id, const std::string& user_id);

    EtaRefreshSummary refresh();

    std::size_t size() const;
    std::vector<EtaSubscription> list() const;

private:
    EtaEstimator& estimator_;
    EtaConfig cfg_;
    MillisClock wall_clock_;
    mutable std::mutex mutex_;
    std::map<std::string, EtaSubscription> by_vehicle_;
};

}  // namespace puv
