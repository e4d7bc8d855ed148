#pragma once

#include "realtime/broadcast_hub.hpp"
#include "store/stores.hpp"

namespace puv {

// Delivers over the rider's realtime notification channel (topic user:<id>).
class RealtimePushGateway : public PushGateway {
public:
    explicit RealtimePushGateway(BroadcastHub& hub) : hub_(hub) {}

    bool send(const PushTarget& target, const PushMessage& message, std::string& error) override;

private:
    BroadcastHub& hub_;
};

class LoggingPushGateway : public PushGateway {
public:
    bool send(const PushTarget& target, const PushMessage& message, std::string& error) override;
};

std::string pushMessageJson(const PushTarget& target, const PushMessage& message);

}  // namespace puv
