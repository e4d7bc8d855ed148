#pragma once

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace puv {

// One long-lived client connection. deliver() must not block on the network.
class Subscriber {
public:
    virtual ~Subscriber() = default;
    virtual bool deliver(const std::string& message) = 0;
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

// Topic-keyed fan-out. The empty key is the global topic.
class BroadcastHub {
public:
    void subscribe(const SubscriberPtr& conn, const std::string& key = "");
    // Without a key the connection leaves every topic.
    void unsubscribe(const SubscriberPtr& conn, const std::string& key = "");
    void unsubscribeAll(const SubscriberPtr& conn);

    // Returns how many subscribers accepted the message. Failed ones are dropped.
    std::size_t publish(const std::string& message, const std::string& key = "");

    std::size_t subscriberCount(const std::string& key = "") const;
    std::size_t topicCount() const;
    std::size_t connectionCount() const;
    // Subscribers removed after a failed or throwing delivery.
    std::size_t droppedConnections() const { return dropped_.load(); }

private:
    void removeLocked(const SubscriberPtr& conn);

    mutable std::mutex mutex_;
    std::map<std::string, std::set<SubscriberPtr>> topics_;
    std::atomic<std::size_t> dropped_{0};
};

namespace topics {

std::string vehicle(const std::string& vehicle_id);
std::string fleet(const std::string& fleet_id);
std::string user(const std::string& user_id);
std::string eta(const std::string& vehicle_id);
std::string counts();

}  // namespace topics

}  // namespace puv
