#pragma once

#include "domain/CrossoverEvent.hpp"
#include "domain/ExecutionOutcome.hpp"

namespace crossover::ports::input {

/**
 * @brief Превращает событие пересечения не более чем в один ордер
 */
class IExecutionCoordinator {
public:
    virtual ~IExecutionCoordinator() = default;

    /**
     * @brief Обработать событие пересечения
     *
     * Уведомляет о сигнале, спрашивает леджер, отправляет ордер с повторами,
     * обновляет леджер только при успехе.
     */
    virtual domain::ExecutionOutcome handle(const domain::CrossoverEvent& event) = 0;
};

} // namespace crossover::ports::input
