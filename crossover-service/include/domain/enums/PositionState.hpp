#pragma once

#include <string>

namespace crossover::domain {

/**
 * @brief Состояние символа с точки зрения исполнения
 *
 * COLD → WARM_NEUTRAL → WARM_LONG / WARM_SHORT.
 * Переход в LONG/SHORT происходит только после подтверждённого ордера.
 */
enum class PositionState {
    COLD,           ///< Длинное окно ещё не прогрето
    WARM_NEUTRAL,   ///< Знак разницы MA известен, позиций не открывали
    WARM_LONG,      ///< Последний исполненный ордер - BUY
    WARM_SHORT      ///< Последний исполненный ордер - SELL
};

inline std::string toString(PositionState state) {
    switch (state) {
        case PositionState::COLD:         return "COLD";
        case PositionState::WARM_NEUTRAL: return "WARM_NEUTRAL";
        case PositionState::WARM_LONG:    return "WARM_LONG";
        case PositionState::WARM_SHORT:   return "WARM_SHORT";
    }
    return "UNKNOWN";
}

} // namespace crossover::domain
