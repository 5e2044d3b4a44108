#pragma once

#include "application/MovingAverageTracker.hpp"
#include "application/CrossoverDetector.hpp"
#include "application/PositionLedger.hpp"
#include "ports/input/IExecutionCoordinator.hpp"
#include "domain/SymbolConfig.hpp"
#include "domain/SymbolStatus.hpp"
#include "domain/PriceSample.hpp"
#include <memory>
#include <mutex>
#include <optional>

namespace crossover::application {

/**
 * @brief Синхронная цепочка обработки одной цены символа
 *
 * tracker → detector → coordinator. Используется рабочим потоком
 * и детерминированными прогонами в тестах.
 */
class SymbolPipeline {
public:
    SymbolPipeline(
        domain::SymbolConfig config,
        std::shared_ptr<MovingAverageTracker> tracker,
        std::shared_ptr<CrossoverDetector> detector,
        std::shared_ptr<ports::input::IExecutionCoordinator> coordinator,
        std::shared_ptr<PositionLedger> ledger = nullptr
    ) : config_(std::move(config))
      , tracker_(std::move(tracker))
      , detector_(std::move(detector))
      , coordinator_(std::move(coordinator))
      , ledger_(std::move(ledger))
    {}

    const std::string& symbol() const { return config_.symbol; }
    const domain::SymbolConfig& config() const { return config_; }

    /**
     * @brief Обработать цену
     * @return Итог исполнения, если цена дала пересечение
     */
    std::optional<domain::ExecutionOutcome> process(const domain::PriceSample& sample) {
        auto state = tracker_->update(config_.symbol, sample);
        if (!state) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++counters_.discarded;
            return std::nullopt;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++counters_.samples;
        }

        auto event = detector_->observe(*state);
        if (!event) {
            return std::nullopt;
        }

        auto outcome = coordinator_->handle(*event);

        std::lock_guard<std::mutex> lock(mutex_);
        ++counters_.events;
        if (outcome.status == domain::OutcomeStatus::EXECUTED) {
            ++counters_.executions;
        } else if (domain::isSuppressed(outcome.status)) {
            ++counters_.suppressed;
        } else if (domain::isFailure(outcome.status)) {
            ++counters_.failures;
        }
        return outcome;
    }

    domain::SymbolCounters counters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return counters_;
    }

    /**
     * @brief Снимок состояния для отчёта (без состояния потока)
     */
    domain::SymbolStatus status() const {
        domain::SymbolStatus status;
        status.symbol = config_.symbol;
        status.counters = counters();

        auto state = tracker_->getState(config_.symbol);
        if (state) {
            status.warm = state->warm;
            status.shortValue = domain::roundToDecimals(state->shortValue, config_.priceDecimals);
            status.longValue = domain::roundToDecimals(state->longValue, config_.priceDecimals);
        }

        if (ledger_) {
            auto entry = ledger_->entry(config_.symbol);
            if (entry) {
                status.lastDirection = entry->lastDirection;
            }
        }

        if (!status.warm) {
            status.position = domain::PositionState::COLD;
        } else if (ledger_) {
            status.position = ledger_->positionState(config_.symbol);
        } else {
            status.position = domain::PositionState::WARM_NEUTRAL;
        }
        return status;
    }

private:
    domain::SymbolConfig config_;
    std::shared_ptr<MovingAverageTracker> tracker_;
    std::shared_ptr<CrossoverDetector> detector_;
    std::shared_ptr<ports::input::IExecutionCoordinator> coordinator_;
    std::shared_ptr<PositionLedger> ledger_;

    mutable std::mutex mutex_;
    domain::SymbolCounters counters_;
};

} // namespace crossover::application
