#pragma once

#include <string>

namespace crossover::domain {

/**
 * @brief Итог обработки одного события пересечения
 */
enum class OutcomeStatus {
    EXECUTED,                   ///< Ордер исполнен, леджер обновлён
    SUPPRESSED_DUPLICATE,       ///< То же направление, что и последний ордер
    SUPPRESSED_INTERVAL,        ///< Слишком рано после последнего ордера
    SIGNAL_ONLY,                ///< Автоторговля выключена, только уведомление
    FAILED_PERMANENT,           ///< Биржа отклонила ордер
    FAILED_RETRIES_EXHAUSTED    ///< Временные ошибки, попытки исчерпаны
};

inline std::string toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::EXECUTED:                 return "EXECUTED";
        case OutcomeStatus::SUPPRESSED_DUPLICATE:     return "SUPPRESSED_DUPLICATE";
        case OutcomeStatus::SUPPRESSED_INTERVAL:      return "SUPPRESSED_INTERVAL";
        case OutcomeStatus::SIGNAL_ONLY:              return "SIGNAL_ONLY";
        case OutcomeStatus::FAILED_PERMANENT:         return "FAILED_PERMANENT";
        case OutcomeStatus::FAILED_RETRIES_EXHAUSTED: return "FAILED_RETRIES_EXHAUSTED";
    }
    return "UNKNOWN";
}

inline bool isSuppressed(OutcomeStatus status) {
    return status == OutcomeStatus::SUPPRESSED_DUPLICATE ||
           status == OutcomeStatus::SUPPRESSED_INTERVAL;
}

inline bool isFailure(OutcomeStatus status) {
    return status == OutcomeStatus::FAILED_PERMANENT ||
           status == OutcomeStatus::FAILED_RETRIES_EXHAUSTED;
}

} // namespace crossover::domain
