#pragma once

#include "enums/PositionState.hpp"
#include "enums/CrossDirection.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace crossover::domain {

/**
 * @brief Состояние рабочего потока символа
 */
enum class WorkerState {
    IDLE,       ///< Поток ещё не запущен
    RUNNING,    ///< Обрабатывает цены
    STOPPED,    ///< Остановлен штатно
    FAILED,     ///< Остановлен из-за неожиданной ошибки
    DISABLED    ///< Не запущен из-за ошибки конфигурации
};

inline std::string toString(WorkerState state) {
    switch (state) {
        case WorkerState::IDLE:     return "IDLE";
        case WorkerState::RUNNING:  return "RUNNING";
        case WorkerState::STOPPED:  return "STOPPED";
        case WorkerState::FAILED:   return "FAILED";
        case WorkerState::DISABLED: return "DISABLED";
    }
    return "UNKNOWN";
}

/**
 * @brief Счётчики обработки по символу
 */
struct SymbolCounters {
    uint64_t samples = 0;       ///< Принято цен
    uint64_t discarded = 0;     ///< Отброшено цен
    uint64_t events = 0;        ///< Пересечений
    uint64_t executions = 0;    ///< Исполненных ордеров
    uint64_t suppressed = 0;    ///< Подавленных сигналов
    uint64_t failures = 0;      ///< Неисполненных ордеров
};

/**
 * @brief Строка отчёта о состоянии символа
 */
struct SymbolStatus {
    std::string symbol;
    WorkerState worker = WorkerState::IDLE;
    PositionState position = PositionState::COLD;
    bool warm = false;
    double shortValue = 0.0;    ///< Округлено до priceDecimals
    double longValue = 0.0;     ///< Округлено до priceDecimals
    std::optional<CrossDirection> lastDirection;
    SymbolCounters counters;
    std::string error;          ///< Причина FAILED / DISABLED
};

} // namespace crossover::domain
