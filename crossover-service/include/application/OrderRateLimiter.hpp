#pragma once

#include "domain/RetryPolicy.hpp"
#include "domain/ConfigurationError.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace crossover::application {

/**
 * @brief Глобальный token bucket для исходящих ордеров
 *
 * Общий для всех рабочих потоков. Ёмкость - burst токенов,
 * пополнение - ordersPerSecond токенов в секунду непрерывно.
 *
 * @example
 * ```cpp
 * OrderRateLimiter limiter({5.0, 5});
 * if (limiter.acquire()) {
 *     venue->submitOrder(request);
 * }
 * ```
 */
class OrderRateLimiter {
public:
    explicit OrderRateLimiter(const domain::RateLimitConfig& config)
        : ratePerSecond_(config.ordersPerSecond)
        , capacity_(static_cast<double>(std::max(1, config.burst)))
        , tokens_(capacity_)
        , lastRefill_(std::chrono::steady_clock::now())
    {
        if (ratePerSecond_ <= 0.0) {
            throw domain::ConfigurationError("ordersPerSecond must be positive");
        }
    }

    OrderRateLimiter(const OrderRateLimiter&) = delete;
    OrderRateLimiter& operator=(const OrderRateLimiter&) = delete;

    /**
     * @brief Взять токен без ожидания
     * @return true если токен был
     */
    bool tryAcquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        refill();
        if (shutdown_ || tokens_ < 1.0) {
            return false;
        }
        tokens_ -= 1.0;
        return true;
    }

    /**
     * @brief Дождаться токена
     * @return false если лимитер остановлен
     */
    bool acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        bool waited = false;
        while (!shutdown_) {
            refill();
            if (tokens_ >= 1.0) {
                tokens_ -= 1.0;
                if (waited) {
                    ++waitedCount_;
                }
                return true;
            }
            waited = true;
            auto wait = std::chrono::duration<double>((1.0 - tokens_) / ratePerSecond_);
            cv_.wait_for(lock, std::chrono::duration_cast<std::chrono::microseconds>(wait) +
                               std::chrono::microseconds(1));
        }
        return false;
    }

    /**
     * @brief Разбудить всех ожидающих и больше не выдавать токены
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    /**
     * @brief Снова выдавать токены после shutdown()
     *
     * Корзина заполняется до burst.
     */
    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = false;
        tokens_ = capacity_;
        lastRefill_ = std::chrono::steady_clock::now();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    double tokensAvailable() {
        std::lock_guard<std::mutex> lock(mutex_);
        refill();
        return tokens_;
    }

    /// Сколько раз acquire() пришлось ждать пополнения
    uint64_t waitedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waitedCount_;
    }

private:
    void refill() {
        auto now = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = now - lastRefill_;
        tokens_ = std::min(capacity_, tokens_ + elapsed.count() * ratePerSecond_);
        lastRefill_ = now;
    }

    const double ratePerSecond_;
    const double capacity_;
    double tokens_;
    std::chrono::steady_clock::time_point lastRefill_;
    bool shutdown_ = false;
    uint64_t waitedCount_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace crossover::application
