#pragma once

#include "domain/Notification.hpp"

namespace crossover::ports::output {

/**
 * @brief Канал уведомлений оператора
 *
 * Реализации:
 * - ConsoleNotificationSink - вывод в консоль
 * - EventPublisherNotificationSink - JSON в шину событий
 * - CompositeNotificationSink - рассылка в несколько каналов
 */
class INotificationSink {
public:
    virtual ~INotificationSink() = default;

    virtual void notify(const domain::Notification& notification) = 0;
};

} // namespace crossover::ports::output
