#pragma once

#include <string>

namespace crossover::ports::output {

/**
 * @brief Интерфейс для публикации событий
 *
 * Реализуется RabbitMQEventPublisher.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    /**
     * @brief Опубликовать событие
     * @param routingKey Ключ маршрутизации (например, "order.executed")
     * @param message JSON-сообщение
     */
    virtual void publish(const std::string& routingKey, const std::string& message) = 0;
};

} // namespace crossover::ports::output
