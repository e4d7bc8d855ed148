#include "notify/push_gateway.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

namespace puv {

std::string pushMessageJson(const PushTarget& target, const PushMessage& message) {
    nlohmann::json j;
    j["type"] = "notification";
    j["user_id"] = target.user_id;
    j["title"] = message.title;
    j["body"] = message.body;
    j["data"] = message.data;
    return j.dump();
}

bool RealtimePushGateway::send(const PushTarget& target, const PushMessage& message, std::string& error) {
    if (target.user_id.empty()) {
        error = "push target has no user id";
        return false;
    }
    const std::size_t delivered = hub_.publish(pushMessageJson(target, message), topics::user(target.user_id));
    if (delivered == 0) {
        error = "no live notification channel for user " + target.user_id;
        return false;
    }
    error.clear();
    return true;
}

bool LoggingPushGateway::send(const PushTarget& target, const PushMessage& message, std::string& error) {
    std::cout << "[push] to=" << target.user_id << " token=" << target.token
              << " title=\"" << message.title << "\" body=\"" << message.body << "\"\n";
    error.clear();
    return true;
}

}  // namespace puv
