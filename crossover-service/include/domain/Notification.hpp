#pragma once

#include "enums/NotificationType.hpp"
#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace crossover::domain {

/**
 * @brief Уведомление оператору
 *
 * text - готовая строка для человека, payload - машинные поля события.
 */
struct Notification {
    NotificationType type = NotificationType::SIGNAL_DETECTED;
    std::string symbol;
    std::string text;
    nlohmann::json payload = nlohmann::json::object();
    Timestamp timestamp;

    Notification() = default;

    Notification(NotificationType t, std::string sym, std::string message,
                 nlohmann::json data = nlohmann::json::object())
        : type(t)
        , symbol(std::move(sym))
        , text(std::move(message))
        , payload(std::move(data))
        , timestamp(Timestamp::now())
    {}

    std::string routingKey() const { return routingKeyFor(type); }

    /// JSON-сообщение для шины событий
    std::string toJson() const;
};

} // namespace crossover::domain
