#pragma once

#include "enums/CrossDirection.hpp"
#include "Timestamp.hpp"
#include <string>

namespace crossover::domain {

/**
 * @brief Событие пересечения скользящих средних
 *
 * Обрабатывается координатором ровно один раз.
 */
struct CrossoverEvent {
    std::string symbol;
    CrossDirection direction = CrossDirection::GOLDEN;
    Timestamp timestamp;        ///< Время цены, на которой зафиксировано пересечение
    double shortValue = 0.0;    ///< Короткая MA в момент пересечения
    double longValue = 0.0;     ///< Длинная MA в момент пересечения
};

} // namespace crossover::domain
