#include "domain/Notification.hpp"
#include <nlohmann/json.hpp>

namespace crossover::domain {

std::string Notification::toJson() const {
    nlohmann::json j;
    j["eventType"] = routingKey();
    j["type"] = toString(type);
    j["symbol"] = symbol;
    j["text"] = text;
    j["timestamp"] = timestamp.toString();
    j["payload"] = payload;
    return j.dump();
}

} // namespace crossover::domain
