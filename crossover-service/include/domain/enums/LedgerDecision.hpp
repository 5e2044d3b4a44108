#pragma once

#include <string>

namespace crossover::domain {

/**
 * @brief Решение леджера по запросу на исполнение
 */
enum class LedgerDecision {
    ALLOWED,                ///< Можно исполнять
    DUPLICATE_DIRECTION,    ///< Последний ордер был в том же направлении
    WITHIN_MIN_INTERVAL,    ///< Минимальный интервал с прошлого ордера не истёк
    UNKNOWN_SYMBOL          ///< Символ не зарегистрирован в леджере
};

inline std::string toString(LedgerDecision decision) {
    switch (decision) {
        case LedgerDecision::ALLOWED:             return "ALLOWED";
        case LedgerDecision::DUPLICATE_DIRECTION: return "DUPLICATE_DIRECTION";
        case LedgerDecision::WITHIN_MIN_INTERVAL: return "WITHIN_MIN_INTERVAL";
        case LedgerDecision::UNKNOWN_SYMBOL:      return "UNKNOWN_SYMBOL";
    }
    return "UNKNOWN";
}

} // namespace crossover::domain
