#pragma once

#include "ports/output/IEventPublisher.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace crossover::tests {

/**
 * @brief Шина событий в памяти: запоминает всё опубликованное
 */
class MockEventPublisher : public ports::output::IEventPublisher {
public:
    struct PublishedMessage {
        std::string routingKey;
        std::string message;
    };

    void publish(const std::string& routingKey, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back(PublishedMessage{routingKey, message});
    }

    std::vector<PublishedMessage> getPublishedMessages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    /// Тела сообщений с данным ключом в порядке публикации
    std::vector<std::string> messagesWithKey(const std::string& routingKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> bodies;
        for (const auto& m : published_) {
            if (m.routingKey == routingKey) {
                bodies.push_back(m.message);
            }
        }
        return bodies;
    }

    int publishCallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(published_.size());
    }

private:
    mutable std::mutex mutex_;
    std::vector<PublishedMessage> published_;
};

} // namespace crossover::tests
