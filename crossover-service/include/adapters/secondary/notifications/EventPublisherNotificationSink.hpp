#pragma once

#include "ports/output/INotificationSink.hpp"
#include "ports/output/IEventPublisher.hpp"
#include <memory>

namespace crossover::adapters::secondary {

/**
 * @brief Уведомления в шину событий
 *
 * Публикует Notification::toJson() с ключом по типу:
 * signal.detected, order.executed, order.failed,
 * signal.suppressed, data.quality, symbol.error.
 */
class EventPublisherNotificationSink : public ports::output::INotificationSink {
public:
    explicit EventPublisherNotificationSink(std::shared_ptr<ports::output::IEventPublisher> publisher)
        : publisher_(std::move(publisher))
    {}

    void notify(const domain::Notification& notification) override {
        publisher_->publish(notification.routingKey(), notification.toJson());
    }

private:
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
};

} // namespace crossover::adapters::secondary
