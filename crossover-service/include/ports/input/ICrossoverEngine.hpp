#pragma once

#include "domain/SymbolStatus.hpp"
#include <string>
#include <vector>

namespace crossover::ports::input {

/**
 * @brief Движок мониторинга пересечений
 *
 * Запускает по рабочему потоку на символ и останавливает их.
 */
class ICrossoverEngine {
public:
    virtual ~ICrossoverEngine() = default;

    /**
     * @brief Запустить мониторинг всех корректно настроенных символов
     * @throws domain::ConfigurationError если нет ключей биржи
     */
    virtual void start() = 0;

    /**
     * @brief Остановить мониторинг
     *
     * Текущие исполнения доводятся до конца, новые цены не обрабатываются.
     */
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    /**
     * @brief Символы, которые сейчас отслеживаются
     */
    virtual std::vector<std::string> monitoredSymbols() const = 0;

    /**
     * @brief Отчёт о состоянии всех настроенных символов
     */
    virtual std::vector<domain::SymbolStatus> statusReport() const = 0;
};

} // namespace crossover::ports::input
