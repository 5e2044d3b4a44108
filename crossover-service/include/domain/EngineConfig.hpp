#pragma once

#include "SymbolConfig.hpp"
#include "RetryPolicy.hpp"
#include <string>
#include <vector>
#include <chrono>

namespace crossover::domain {

/**
 * @brief Ключи доступа к бирже
 */
struct VenueCredentials {
    std::string apiKey;
    std::string apiSecret;

    bool isComplete() const { return !apiKey.empty() && !apiSecret.empty(); }
};

/**
 * @brief Неизменяемый снимок конфигурации движка
 *
 * Читается один раз при старте. Живой переконфигурации нет.
 */
struct EngineConfig {
    std::vector<SymbolConfig> symbols;
    VenueCredentials credentials;
    RetryPolicy retry;
    RateLimitConfig rateLimit;
    std::chrono::milliseconds reconnectDelay{5000};     ///< Пауза перед переподпиской на цены
    bool notifySuppressed = true;                       ///< Уведомлять о подавленных сигналах
    bool autoTrade = true;                              ///< false - только сигналы, без ордеров
};

} // namespace crossover::domain
