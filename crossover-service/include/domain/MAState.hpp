#pragma once

#include "Timestamp.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace crossover::domain {

/**
 * @brief Снимок скользящих средних символа после очередной цены
 *
 * Пока warm == false, значения short/long не пригодны для сравнения.
 */
struct MAState {
    std::string symbol;
    double shortValue = 0.0;                ///< Короткая MA
    double longValue = 0.0;                 ///< Длинная MA
    uint64_t count = 0;                     ///< Принятых цен
    bool warm = false;                      ///< Длинное окно заполнено
    std::optional<Timestamp> lastTimestamp; ///< Время последней принятой цены

    double difference() const { return shortValue - longValue; }
};

} // namespace crossover::domain
