#pragma once

#include "CrossDirection.hpp"
#include <string>
#include <stdexcept>

namespace crossover::domain {

/**
 * @brief Сторона рыночного ордера
 */
enum class OrderSide {
    BUY,    ///< Покупка
    SELL    ///< Продажа
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY:  return "BUY";
        case OrderSide::SELL: return "SELL";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderSide orderSideFromString(const std::string& str) {
    if (str == "BUY")  return OrderSide::BUY;
    if (str == "SELL") return OrderSide::SELL;
    throw std::invalid_argument("Unknown OrderSide: " + str);
}

/**
 * @brief Сторона ордера для пересечения: golden → BUY, death → SELL
 */
inline OrderSide sideFor(CrossDirection direction) {
    return direction == CrossDirection::GOLDEN ? OrderSide::BUY : OrderSide::SELL;
}

} // namespace crossover::domain
