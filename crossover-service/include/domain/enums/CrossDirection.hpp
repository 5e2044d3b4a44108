#pragma once

#include <string>
#include <stdexcept>

namespace crossover::domain {

/**
 * @brief Направление пересечения скользящих средних
 */
enum class CrossDirection {
    GOLDEN,     ///< Короткая MA пересекла длинную снизу вверх
    DEATH       ///< Короткая MA пересекла длинную сверху вниз
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(CrossDirection direction) {
    switch (direction) {
        case CrossDirection::GOLDEN: return "GOLDEN";
        case CrossDirection::DEATH:  return "DEATH";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline CrossDirection crossDirectionFromString(const std::string& str) {
    if (str == "GOLDEN") return CrossDirection::GOLDEN;
    if (str == "DEATH")  return CrossDirection::DEATH;
    throw std::invalid_argument("Unknown CrossDirection: " + str);
}

/**
 * @brief Получить противоположное направление
 */
inline CrossDirection opposite(CrossDirection direction) {
    return direction == CrossDirection::GOLDEN ? CrossDirection::DEATH : CrossDirection::GOLDEN;
}

} // namespace crossover::domain
