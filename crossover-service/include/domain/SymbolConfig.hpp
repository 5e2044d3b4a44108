#pragma once

#include "enums/AverageType.hpp"
#include "ConfigurationError.hpp"
#include <string>
#include <chrono>
#include <cmath>
#include <optional>

namespace crossover::domain {

/**
 * @brief Округлить значение до заданного числа знаков после запятой
 */
inline double roundToDecimals(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

/**
 * @brief Параметры мониторинга одного символа
 *
 * По умолчанию MA9/MA26 на простых средних.
 */
struct SymbolConfig {
    std::string symbol;
    int shortWindow = 9;
    int longWindow = 26;
    AverageType averageType = AverageType::SMA;
    double quantity = 0.0;                                      ///< Количество в ордере
    std::chrono::milliseconds minReexecutionInterval{0};        ///< 0 - без ограничения
    std::optional<bool> autoTrade;                              ///< Переопределяет глобальный флаг
    int priceDecimals = 2;                                      ///< Точность цены для вывода
    int quantityDecimals = 3;                                   ///< Шаг количества на бирже

    bool effectiveAutoTrade(bool globalAutoTrade) const {
        return autoTrade.value_or(globalAutoTrade);
    }

    /**
     * @brief Проверить параметры символа
     * @throws ConfigurationError если окна или количество некорректны
     */
    void validate() const {
        if (symbol.empty()) {
            throw ConfigurationError("Symbol name is empty");
        }
        if (shortWindow < 1) {
            throw ConfigurationError(symbol, "short window must be >= 1");
        }
        if (longWindow <= shortWindow) {
            throw ConfigurationError(symbol, "long window must be greater than short window");
        }
        if (!std::isfinite(quantity) || quantity <= 0.0) {
            throw ConfigurationError(symbol, "order quantity must be positive");
        }
        if (minReexecutionInterval.count() < 0) {
            throw ConfigurationError(symbol, "minimum re-execution interval must not be negative");
        }
        if (priceDecimals < 0 || quantityDecimals < 0) {
            throw ConfigurationError(symbol, "decimals must not be negative");
        }
    }
};

} // namespace crossover::domain
