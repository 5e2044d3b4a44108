#pragma once

#include <string>

namespace crossover::domain {

/**
 * @brief Тег ответа биржи на ордер
 *
 * Политика повторов зависит только от тега, а не от текста ошибки.
 */
enum class ExecutionStatus {
    SUCCESS,            ///< Ордер принят, есть orderId
    TRANSIENT_FAILURE,  ///< Сеть, таймаут, rate limit - можно повторить
    PERMANENT_FAILURE   ///< Неверные ключи, нет баланса, ордер отклонён - не повторять
};

inline std::string toString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCESS:           return "SUCCESS";
        case ExecutionStatus::TRANSIENT_FAILURE: return "TRANSIENT_FAILURE";
        case ExecutionStatus::PERMANENT_FAILURE: return "PERMANENT_FAILURE";
    }
    return "UNKNOWN";
}

} // namespace crossover::domain
