#pragma once

#include <stdexcept>
#include <string>

namespace crossover::domain {

/**
 * @brief Ошибка конфигурации
 *
 * Неверные окна или количество выключают один символ,
 * отсутствие ключей биржи не даёт запустить движок.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}

    ConfigurationError(const std::string& symbol, const std::string& message)
        : std::runtime_error(symbol + ": " + message)
        , symbol_(symbol) {}

    /// Пустая строка, если ошибка не относится к конкретному символу
    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

} // namespace crossover::domain
