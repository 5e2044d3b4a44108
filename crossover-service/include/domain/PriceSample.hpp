#pragma once

#include "Timestamp.hpp"
#include <string>

namespace crossover::domain {

/**
 * @brief Цена инструмента в момент времени
 *
 * Приходит от источника цен и дальше не изменяется.
 */
struct PriceSample {
    std::string symbol;     ///< Тикер, например "BTCUSDT"
    Timestamp timestamp;    ///< Время закрытия бара / тика
    double price = 0.0;     ///< Цена закрытия
};

} // namespace crossover::domain
