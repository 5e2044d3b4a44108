#pragma once

#include <chrono>
#include <algorithm>
#include <cmath>

namespace crossover::domain {

/**
 * @brief Политика повторов при временных ошибках биржи
 *
 * Задержка перед попыткой n (n >= 2): initialBackoff * multiplier^(n-2),
 * но не больше maxBackoff.
 */
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds initialBackoff{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds maxBackoff{10000};

    /**
     * @brief Задержка после неудачной попытки
     * @param failedAttempt Номер неудачной попытки, начиная с 1
     */
    std::chrono::milliseconds backoffAfter(int failedAttempt) const {
        double delay = static_cast<double>(initialBackoff.count()) *
                       std::pow(multiplier, std::max(0, failedAttempt - 1));
        double capped = std::min(delay, static_cast<double>(maxBackoff.count()));
        return std::chrono::milliseconds(static_cast<long long>(capped));
    }
};

/**
 * @brief Глобальное ограничение частоты ордеров (token bucket)
 */
struct RateLimitConfig {
    double ordersPerSecond = 5.0;
    int burst = 5;
};

} // namespace crossover::domain
