#pragma once

#include "enums/ExecutionStatus.hpp"
#include <string>

namespace crossover::domain {

/**
 * @brief Ответ биржи на ордер
 *
 * Для SUCCESS заполнен orderId, для ошибок - reason.
 */
struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::PERMANENT_FAILURE;
    std::string orderId;
    std::string reason;

    bool isSuccess() const { return status == ExecutionStatus::SUCCESS; }
    bool isTransient() const { return status == ExecutionStatus::TRANSIENT_FAILURE; }
    bool isPermanent() const { return status == ExecutionStatus::PERMANENT_FAILURE; }

    static ExecutionResult success(const std::string& orderId) {
        return ExecutionResult{ExecutionStatus::SUCCESS, orderId, ""};
    }

    static ExecutionResult transientFailure(const std::string& reason) {
        return ExecutionResult{ExecutionStatus::TRANSIENT_FAILURE, "", reason};
    }

    static ExecutionResult permanentFailure(const std::string& reason) {
        return ExecutionResult{ExecutionStatus::PERMANENT_FAILURE, "", reason};
    }
};

} // namespace crossover::domain
