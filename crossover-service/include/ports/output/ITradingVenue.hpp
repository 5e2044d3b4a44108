#pragma once

#include "domain/ExecutionRequest.hpp"
#include "domain/ExecutionResult.hpp"

namespace crossover::ports::output {

/**
 * @brief Шлюз к торговой площадке
 *
 * Реализации:
 * - PaperTradingVenue - исполнение в памяти процесса
 *
 * Сетевые ошибки адаптер должен возвращать как TRANSIENT_FAILURE.
 * Исключение, вылетевшее из submitOrder, координатор тоже считает временной ошибкой.
 */
class ITradingVenue {
public:
    virtual ~ITradingVenue() = default;

    /**
     * @brief Отправить рыночный ордер
     * @param request Символ, сторона, количество
     * @return Результат с тегом SUCCESS / TRANSIENT_FAILURE / PERMANENT_FAILURE
     */
    virtual domain::ExecutionResult submitOrder(const domain::ExecutionRequest& request) = 0;
};

} // namespace crossover::ports::output
