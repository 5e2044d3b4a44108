#pragma once

#include "ports/output/ITradingVenue.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace crossover::adapters::secondary {

/**
 * @brief Поведение бумажного исполнения
 */
enum class PaperFillBehavior {
    IMMEDIATE,      ///< Мгновенное исполнение
    ALWAYS_REJECT,  ///< Всегда отклонять (PERMANENT_FAILURE)
    FAIL_FIRST_N    ///< Первые N ордеров - TRANSIENT_FAILURE, дальше исполнение
};

inline std::string toString(PaperFillBehavior behavior) {
    switch (behavior) {
        case PaperFillBehavior::IMMEDIATE:     return "IMMEDIATE";
        case PaperFillBehavior::ALWAYS_REJECT: return "ALWAYS_REJECT";
        case PaperFillBehavior::FAIL_FIRST_N:  return "FAIL_FIRST_N";
    }
    return "UNKNOWN";
}

/**
 * @brief Разобрать поведение из строки ("immediate", "reject", "fail_first_n")
 * @throws std::invalid_argument если строка не распознана
 */
inline PaperFillBehavior paperFillBehaviorFromString(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (str == "immediate") return PaperFillBehavior::IMMEDIATE;
    if (str == "reject" || str == "always_reject") return PaperFillBehavior::ALWAYS_REJECT;
    if (str == "fail_first_n") return PaperFillBehavior::FAIL_FIRST_N;
    throw std::invalid_argument("Unknown PaperFillBehavior: " + str);
}

/**
 * @brief Бумажная торговля внутри процесса
 *
 * Исполняет рыночные ордера без внешнего API и считает чистую позицию
 * по символам. Поведение переключается для проверки повторов и отказов.
 *
 * Thread-safe: да
 */
class PaperTradingVenue : public ports::output::ITradingVenue {
public:
    struct Fill {
        std::string orderId;
        domain::ExecutionRequest request;
    };

    explicit PaperTradingVenue(PaperFillBehavior behavior = PaperFillBehavior::IMMEDIATE,
                               int failFirst = 0,
                               std::string rejectReason = "")
        : behavior_(behavior)
        , transientRemaining_(std::max(0, failFirst))
        , rejectReason_(std::move(rejectReason))
    {
        std::cout << "[PaperTradingVenue] Created, behavior=" << toString(behavior_);
        if (behavior_ == PaperFillBehavior::FAIL_FIRST_N) {
            std::cout << " failFirst=" << transientRemaining_;
        }
        std::cout << std::endl;
    }

    domain::ExecutionResult submitOrder(const domain::ExecutionRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++submitted_;

        if (request.symbol.empty()) {
            return domain::ExecutionResult::permanentFailure("symbol is empty");
        }
        if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
            return domain::ExecutionResult::permanentFailure("quantity must be positive");
        }

        switch (behavior_) {
            case PaperFillBehavior::ALWAYS_REJECT:
                std::cout << "[PaperTradingVenue] REJECTED " << request.symbol << std::endl;
                return domain::ExecutionResult::permanentFailure(
                    rejectReason_.empty() ? "Always reject mode" : rejectReason_);

            case PaperFillBehavior::FAIL_FIRST_N:
                if (transientRemaining_ > 0) {
                    --transientRemaining_;
                    std::cout << "[PaperTradingVenue] Simulated timeout for " << request.symbol << std::endl;
                    return domain::ExecutionResult::transientFailure("simulated network timeout");
                }
                break;

            case PaperFillBehavior::IMMEDIATE:
                break;
        }

        return fill(request);
    }

    void setBehavior(PaperFillBehavior behavior, int failFirst = 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        behavior_ = behavior;
        transientRemaining_ = std::max(0, failFirst);
    }

    /**
     * @brief Чистая позиция символа (BUY +, SELL −)
     */
    double position(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(symbol);
        return it != positions_.end() ? it->second : 0.0;
    }

    std::vector<Fill> fills() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fills_;
    }

    uint64_t submittedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submitted_;
    }

private:
    domain::ExecutionResult fill(const domain::ExecutionRequest& request) {
        std::ostringstream id;
        id << "paper-" << std::setw(8) << std::setfill('0') << (fills_.size() + 1);

        double signedQty = request.side == domain::OrderSide::BUY ? request.quantity : -request.quantity;
        positions_[request.symbol] += signedQty;
        fills_.push_back(Fill{id.str(), request});

        std::cout << "[PaperTradingVenue] FILLED " << id.str() << " " << domain::toString(request.side)
                  << " " << request.quantity << " " << request.symbol
                  << " position=" << positions_[request.symbol] << std::endl;

        return domain::ExecutionResult::success(id.str());
    }

    mutable std::mutex mutex_;
    PaperFillBehavior behavior_;
    int transientRemaining_;
    std::string rejectReason_;
    uint64_t submitted_ = 0;
    std::unordered_map<std::string, double> positions_;
    std::vector<Fill> fills_;
};

} // namespace crossover::adapters::secondary
