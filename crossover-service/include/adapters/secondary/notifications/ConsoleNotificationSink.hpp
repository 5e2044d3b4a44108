#pragma once

#include "ports/output/INotificationSink.hpp"
#include <iostream>
#include <mutex>

namespace crossover::adapters::secondary {

/**
 * @brief Уведомления в консоль
 *
 * Ошибки исполнения и символов идут в std::cerr, остальное в std::cout.
 */
class ConsoleNotificationSink : public ports::output::INotificationSink {
public:
    void notify(const domain::Notification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        bool isError = notification.type == domain::NotificationType::ORDER_FAILED ||
                       notification.type == domain::NotificationType::SYMBOL_ERROR;
        auto& out = isError ? std::cerr : std::cout;
        out << "[Notification] " << domain::toString(notification.type) << " "
            << notification.symbol << ": " << notification.text << std::endl;
    }

private:
    std::mutex mutex_;
};

} // namespace crossover::adapters::secondary
