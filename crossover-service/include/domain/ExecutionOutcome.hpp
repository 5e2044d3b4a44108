#pragma once

#include "enums/OutcomeStatus.hpp"
#include "enums/CrossDirection.hpp"
#include <string>

namespace crossover::domain {

/**
 * @brief Итог обработки CrossoverEvent координатором
 */
struct ExecutionOutcome {
    OutcomeStatus status = OutcomeStatus::SIGNAL_ONLY;
    std::string symbol;
    CrossDirection direction = CrossDirection::GOLDEN;
    int attempts = 0;           ///< Сколько раз ордер отправлялся на биржу
    std::string orderId;        ///< Для EXECUTED
    std::string reason;         ///< Для FAILED_* и SUPPRESSED_*

    bool isExecuted() const { return status == OutcomeStatus::EXECUTED; }
};

} // namespace crossover::domain
