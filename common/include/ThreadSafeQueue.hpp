#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная FIFO-очередь
 * @details
 * Блокирующий pop() ждёт элемент или закрытие очереди.
 * После shutdown() новые элементы не принимаются, но уже лежащие
 * в очереди ещё можно забрать.
 */
template <typename T>
class ThreadSafeQueue {
private:
    std::deque<T> queue_;                 ///< Внутренняя очередь
    mutable std::mutex mutex_;            ///< Мьютекс для синхронизации
    std::condition_variable condVar_;     ///< Условная переменная для ожидания
    bool shutdown_ = false;               ///< Флаг завершения работы очереди

public:
    ThreadSafeQueue() = default;

    ~ThreadSafeQueue() {
        shutdown();
    }

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить элемент в очередь
     * @return false если очередь уже закрыта
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) return false;
            queue_.push_back(std::move(item));
        }

        condVar_.notify_one();
        return true;
    }

    /**
     * @brief Извлечь элемент (блокирующий вызов)
     * @return элемент, либо nullopt, если очередь закрыта и пуста
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    /**
     * @brief Извлечь элемент, ожидая не дольше timeout
     * @return nullopt по таймауту или если очередь закрыта и пуста
     */
    std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; });

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        condVar_.notify_all();
    }

    /**
     * @brief Выбросить все элементы, не дожидаясь потребителя
     */
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.clear();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    bool isEmpty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};
