#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace crossover::adapters::secondary {

/**
 * @brief Очередь сообщений, ожидающих готовности exchange
 *
 * Ограничена capacity: при переполнении выбрасывается самое старое.
 * После close() новые сообщения не принимаются.
 * Не потокобезопасна, используется только из потока io_context.
 */
class PendingMessageBuffer {
public:
    using Message = std::pair<std::string, std::string>;    ///< routing key, тело

    explicit PendingMessageBuffer(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {}

    /**
     * @return false если буфер закрыт и сообщение отброшено
     */
    bool push(const std::string& routingKey, const std::string& message) {
        if (closed_) {
            ++dropped_;
            return false;
        }
        if (messages_.size() >= capacity_) {
            std::cerr << "[RabbitMQEventPublisher] Pending buffer full (" << capacity_
                      << "), dropping oldest " << messages_.front().first << std::endl;
            messages_.pop_front();
            ++dropped_;
        }
        messages_.emplace_back(routingKey, message);
        return true;
    }

    std::vector<Message> drain() {
        std::vector<Message> result(messages_.begin(), messages_.end());
        messages_.clear();
        return result;
    }

    /// Отбросить накопленное и больше не принимать
    void close() {
        if (closed_) {
            return;
        }
        closed_ = true;
        if (!messages_.empty()) {
            std::cerr << "[RabbitMQEventPublisher] Dropping " << messages_.size()
                      << " pending messages" << std::endl;
            dropped_ += messages_.size();
            messages_.clear();
        }
    }

    bool isClosed() const { return closed_; }
    size_t size() const { return messages_.size(); }
    size_t capacity() const { return capacity_; }
    uint64_t droppedCount() const { return dropped_; }

private:
    const size_t capacity_;
    std::deque<Message> messages_;
    bool closed_ = false;
    uint64_t dropped_ = 0;
};

} // namespace crossover::adapters::secondary
