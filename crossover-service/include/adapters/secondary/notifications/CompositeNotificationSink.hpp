#pragma once

#include "ports/output/INotificationSink.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

namespace crossover::adapters::secondary {

/**
 * @brief Рассылка уведомления в несколько каналов
 *
 * Ошибка одного канала логируется и не мешает остальным.
 */
class CompositeNotificationSink : public ports::output::INotificationSink {
public:
    CompositeNotificationSink() = default;

    explicit CompositeNotificationSink(std::vector<std::shared_ptr<ports::output::INotificationSink>> sinks)
        : sinks_(std::move(sinks))
    {}

    void add(std::shared_ptr<ports::output::INotificationSink> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(std::move(sink));
    }

    void notify(const domain::Notification& notification) override {
        std::vector<std::shared_ptr<ports::output::INotificationSink>> sinks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sinks = sinks_;
        }
        for (const auto& sink : sinks) {
            try {
                sink->notify(notification);
            } catch (const std::exception& e) {
                std::cerr << "[CompositeNotificationSink] Sink error: " << e.what() << std::endl;
            }
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sinks_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ports::output::INotificationSink>> sinks_;
};

} // namespace crossover::adapters::secondary
