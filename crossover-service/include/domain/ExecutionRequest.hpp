#pragma once

#include "enums/OrderSide.hpp"
#include <string>

namespace crossover::domain {

/**
 * @brief Запрос на рыночный ордер
 */
struct ExecutionRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double quantity = 0.0;      ///< Фиксированное количество из конфигурации
    std::string clientOrderId;  ///< Один и тот же для всех повторов одного события
};

} // namespace crossover::domain
