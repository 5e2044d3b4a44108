#pragma once

#include "domain/MAState.hpp"
#include "domain/CrossoverEvent.hpp"
#include "ThreadSafeMap.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace crossover::application {

/**
 * @brief Детектор пересечений скользящих средних
 *
 * Хранит знак (short − long) с предыдущего прогретого обновления.
 * Первое прогретое обновление только запоминает знак.
 * Равенство (в пределах относительного эпсилона) сохраняет прежний знак.
 * Если знак при запоминании был нулевым, первый ненулевой знак запоминается без события.
 *
 * Событие: отрицательный → положительный - GOLDEN, положительный → отрицательный - DEATH.
 */
class CrossoverDetector {
public:
    static constexpr double RELATIVE_EPSILON = 1e-12;

    void addSymbol(const std::string& symbol) {
        signs_.insertIfAbsent(symbol, std::make_shared<SignState>());
    }

    bool removeSymbol(const std::string& symbol) {
        return signs_.erase(symbol);
    }

    /**
     * @brief Обработать очередное состояние MA
     * @return CrossoverEvent, если знак сменился
     */
    std::optional<domain::CrossoverEvent> observe(const domain::MAState& state) {
        if (!state.warm) {
            return std::nullopt;
        }

        auto signState = signs_.find(state.symbol);
        if (!signState) {
            signState = std::make_shared<SignState>();
            if (!signs_.insertIfAbsent(state.symbol, signState)) {
                signState = signs_.find(state.symbol);
            }
        }

        std::lock_guard<std::mutex> lock(signState->mutex);
        int sign = signOf(state.shortValue, state.longValue);

        if (!signState->seeded) {
            signState->seeded = true;
            signState->sign = sign;
            std::cout << "[CrossoverDetector] " << state.symbol << ": seeded sign " << sign << std::endl;
            return std::nullopt;
        }

        if (sign == 0 || sign == signState->sign) {
            return std::nullopt;
        }

        if (signState->sign == 0) {
            signState->sign = sign;
            std::cout << "[CrossoverDetector] " << state.symbol << ": seeded sign " << sign
                      << " after equality" << std::endl;
            return std::nullopt;
        }

        signState->sign = sign;

        domain::CrossoverEvent event;
        event.symbol = state.symbol;
        event.direction = sign > 0 ? domain::CrossDirection::GOLDEN : domain::CrossDirection::DEATH;
        event.timestamp = state.lastTimestamp.value_or(domain::Timestamp::now());
        event.shortValue = state.shortValue;
        event.longValue = state.longValue;
        return event;
    }

    /**
     * @brief Текущий знак разницы MA (nullopt - ещё не прогрето)
     */
    std::optional<int> currentSign(const std::string& symbol) const {
        auto signState = signs_.find(symbol);
        if (!signState) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(signState->mutex);
        if (!signState->seeded) {
            return std::nullopt;
        }
        return signState->sign;
    }

    /**
     * @brief Знак разницы short − long с учётом относительного эпсилона
     */
    static int signOf(double shortValue, double longValue) {
        double diff = shortValue - longValue;
        double scale = std::max(std::abs(shortValue), std::abs(longValue));
        if (std::abs(diff) <= RELATIVE_EPSILON * scale) {
            return 0;
        }
        return diff > 0.0 ? 1 : -1;
    }

private:
    struct SignState {
        std::mutex mutex;
        bool seeded = false;
        int sign = 0;
    };

    ThreadSafeMap<std::string, SignState> signs_;
};

} // namespace crossover::application
