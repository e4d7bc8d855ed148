#include "realtime/broadcast_hub.hpp"

#include <iostream>
#include <vector>

#include "core/types.hpp"

namespace puv {

void BroadcastHub::subscribe(const SubscriberPtr& conn, const std::string& key) {
    if (!conn) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    topics_[key].insert(conn);
}

void BroadcastHub::unsubscribe(const SubscriberPtr& conn, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (key.empty()) {
        removeLocked(conn);
        return;
    }
    const auto it = topics_.find(key);
    if (it == topics_.end()) {
        return;
    }
    it->second.erase(conn);
    if (it->second.empty()) {
        topics_.erase(it);
    }
}

void BroadcastHub::unsubscribeAll(const SubscriberPtr& conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    removeLocked(conn);
}

void BroadcastHub::removeLocked(const SubscriberPtr& conn) {
    for (auto it = topics_.begin(); it != topics_.end();) {
        it->second.erase(conn);
        if (it->second.empty()) {
            it = topics_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t BroadcastHub::publish(const std::string& message, const std::string& key) {
    std::vector<SubscriberPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = topics_.find(key);
        if (it == topics_.end()) {
            return 0;
        }
        targets.assign(it->second.begin(), it->second.end());
    }

    std::size_t delivered = 0;
    std::vector<SubscriberPtr> failed;
    for (const auto& conn : targets) {
        bool ok = false;
        try {
            ok = conn->deliver(message);
        } catch (const std::exception& e) {
            std::cerr << "[realtime] deliver on '" << key << "' threw: " << e.what() << '\n';
        }
        if (ok) {
            ++delivered;
        } else {
            failed.push_back(conn);
        }
    }

    if (!failed.empty()) {
        dropped_.fetch_add(failed.size());
        std::cerr << "[realtime] " << errorKindName(ErrorKind::Connection) << ": dropping " << failed.size()
                  << " subscriber(s) of '" << key << "'\n";
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& conn : failed) {
            removeLocked(conn);
        }
    }
    return delivered;
}

std::size_t BroadcastHub::subscriberCount(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = topics_.find(key);
    return it == topics_.end() ? 0U : it->second.size();
}

std::size_t BroadcastHub::topicCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return topics_.size();
}

std::size_t BroadcastHub::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<SubscriberPtr> unique;
    for (const auto& kv : topics_) {
        unique.insert(kv.second.begin(), kv.second.end());
    }
    return unique.size();
}

namespace topics {

std::string vehicle(const std::string& vehicle_id) { return "vehicle:" + vehicle_id; }
std::string fleet(const std::string& fleet_id) { return "fleet:" + fleet_id; }
std::string user(const std::string& user_id) { return "user:" + user_id; }
std::string eta(const std::string& vehicle_id) { return "eta:" + vehicle_id; }
std::string counts() { return "counts"; }

}  // namespace topics

}  // namespace puv
