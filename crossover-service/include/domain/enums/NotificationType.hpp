#pragma once

#include <string>
#include <stdexcept>

namespace crossover::domain {

/**
 * @brief Тип уведомления оператору
 */
enum class NotificationType {
    SIGNAL_DETECTED,    ///< Обнаружено пересечение
    ORDER_EXECUTED,     ///< Ордер исполнен
    ORDER_FAILED,       ///< Ордер не исполнен (отклонён или исчерпаны повторы)
    SIGNAL_SUPPRESSED,  ///< Сигнал подавлен леджером
    DATA_QUALITY,       ///< Отброшена некорректная цена
    SYMBOL_ERROR        ///< Символ выключен из мониторинга
};

inline std::string toString(NotificationType type) {
    switch (type) {
        case NotificationType::SIGNAL_DETECTED:   return "SIGNAL_DETECTED";
        case NotificationType::ORDER_EXECUTED:    return "ORDER_EXECUTED";
        case NotificationType::ORDER_FAILED:      return "ORDER_FAILED";
        case NotificationType::SIGNAL_SUPPRESSED: return "SIGNAL_SUPPRESSED";
        case NotificationType::DATA_QUALITY:      return "DATA_QUALITY";
        case NotificationType::SYMBOL_ERROR:      return "SYMBOL_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Ключ маршрутизации для публикации в шину событий
 */
inline std::string routingKeyFor(NotificationType type) {
    switch (type) {
        case NotificationType::SIGNAL_DETECTED:   return "signal.detected";
        case NotificationType::ORDER_EXECUTED:    return "order.executed";
        case NotificationType::ORDER_FAILED:      return "order.failed";
        case NotificationType::SIGNAL_SUPPRESSED: return "signal.suppressed";
        case NotificationType::DATA_QUALITY:      return "data.quality";
        case NotificationType::SYMBOL_ERROR:      return "symbol.error";
    }
    throw std::invalid_argument("Unknown NotificationType");
}

} // namespace crossover::domain
