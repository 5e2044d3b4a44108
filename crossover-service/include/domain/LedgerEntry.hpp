#pragma once

#include "enums/CrossDirection.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace crossover::domain {

/**
 * @brief Запись леджера: последнее исполненное направление по символу
 *
 * Меняется только после подтверждённого исполнения ордера.
 */
struct LedgerEntry {
    std::string symbol;
    std::optional<CrossDirection> lastDirection;    ///< nullopt - ордеров ещё не было
    std::optional<Timestamp> executedAt;            ///< Время последнего исполнения
    std::string lastOrderId;

    bool hasExecution() const { return lastDirection.has_value(); }
};

} // namespace crossover::domain
