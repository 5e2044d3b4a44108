#pragma once

#include <string>
#include <stdexcept>

namespace crossover::domain {

/**
 * @brief Формула скользящей средней
 */
enum class AverageType {
    SMA,    ///< Простая: среднее последних N цен
    EMA     ///< Экспоненциальная: α = 2 / (N + 1), старт от SMA первых N цен
};

inline std::string toString(AverageType type) {
    switch (type) {
        case AverageType::SMA: return "SMA";
        case AverageType::EMA: return "EMA";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline AverageType averageTypeFromString(const std::string& str) {
    if (str == "SMA") return AverageType::SMA;
    if (str == "EMA") return AverageType::EMA;
    throw std::invalid_argument("Unknown AverageType: " + str);
}

} // namespace crossover::domain
