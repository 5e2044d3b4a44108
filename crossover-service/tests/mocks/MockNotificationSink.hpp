#pragma once

#include "ports/output/INotificationSink.hpp"
#include <mutex>
#include <stdexcept>
#include <vector>

namespace crossover::tests {

/**
 * @brief Mock реализация INotificationSink для тестов
 */
class MockNotificationSink : public ports::output::INotificationSink {
public:
    // Получение уведомлений
    std::vector<domain::Notification> notifications() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return notifications_;
    }

    std::vector<domain::Notification> ofType(domain::NotificationType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Notification> result;
        for (const auto& n : notifications_) {
            if (n.type == type) {
                result.push_back(n);
            }
        }
        return result;
    }

    int count(domain::NotificationType type) const {
        return static_cast<int>(ofType(type).size());
    }

    int notifyCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(notifications_.size());
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.clear();
    }

    /// Бросать исключение после записи уведомления
    void setThrowOnNotify(bool value) {
        std::lock_guard<std::mutex> lock(mutex_);
        throwOnNotify_ = value;
    }

    // INotificationSink implementation
    void notify(const domain::Notification& notification) override {
        std::lock_guard<std::mutex> lock(mutex_);
        notifications_.push_back(notification);
        if (throwOnNotify_) {
            throw std::runtime_error("notification channel is down");
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<domain::Notification> notifications_;
    bool throwOnNotify_ = false;
};

} // namespace crossover::tests
