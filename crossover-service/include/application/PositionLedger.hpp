#pragma once

#include "domain/LedgerEntry.hpp"
#include "domain/enums/LedgerDecision.hpp"
#include "domain/enums/PositionState.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ThreadSafeMap.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace crossover::application {

/**
 * @brief Леджер исполненных направлений по символам
 *
 * Не даёт отправить два ордера в одном направлении подряд
 * и, если задан минимальный интервал, ордер раньше этого интервала
 * после предыдущего исполнения.
 *
 * Запись меняется только через record(), который вызывается
 * после подтверждённого исполнения. Каждая запись сохраняется в репозиторий,
 * при создании леджер восстанавливает записи из репозитория.
 */
class PositionLedger {
public:
    explicit PositionLedger(std::shared_ptr<ports::output::ILedgerRepository> repository)
        : repository_(std::move(repository))
    {
        if (!repository_) {
            return;
        }
        for (auto& entry : repository_->loadAll()) {
            std::cout << "[PositionLedger] Restored " << entry.symbol << ": "
                      << (entry.lastDirection ? domain::toString(*entry.lastDirection) : "NONE")
                      << std::endl;
            restored_[entry.symbol] = std::move(entry);
        }
    }

    /**
     * @brief Зарегистрировать символ
     *
     * Если для символа есть восстановленная запись, она становится текущей.
     */
    void addSymbol(const std::string& symbol,
                   std::chrono::milliseconds minInterval = std::chrono::milliseconds{0}) {
        auto slot = std::make_shared<Slot>();
        slot->minInterval = minInterval;
        slot->entry.symbol = symbol;

        {
            std::lock_guard<std::mutex> lock(restoredMutex_);
            auto it = restored_.find(symbol);
            if (it != restored_.end()) {
                slot->entry = it->second;
                restored_.erase(it);
            }
        }

        entries_.insertIfAbsent(symbol, slot);
    }

    bool removeSymbol(const std::string& symbol) {
        return entries_.erase(symbol);
    }

    /**
     * @brief Проверить, можно ли исполнять сигнал
     * @param now Время события
     */
    domain::LedgerDecision check(const std::string& symbol,
                                 domain::CrossDirection direction,
                                 const domain::Timestamp& now) const {
        auto slot = entries_.find(symbol);
        if (!slot) {
            return domain::LedgerDecision::UNKNOWN_SYMBOL;
        }

        std::lock_guard<std::mutex> lock(slot->mutex);
        const auto& entry = slot->entry;

        if (entry.lastDirection && *entry.lastDirection == direction) {
            return domain::LedgerDecision::DUPLICATE_DIRECTION;
        }
        if (slot->minInterval.count() > 0 && entry.executedAt) {
            auto elapsed = now.millisSince(*entry.executedAt);
            if (elapsed.count() < 0) {
                std::cerr << "[PositionLedger] " << symbol << ": event at " << now.toString()
                          << " precedes last execution at " << entry.executedAt->toString()
                          << ", interval not applied" << std::endl;
            } else if (elapsed < slot->minInterval) {
                return domain::LedgerDecision::WITHIN_MIN_INTERVAL;
            }
        }
        return domain::LedgerDecision::ALLOWED;
    }

    bool mayExecute(const std::string& symbol,
                    domain::CrossDirection direction,
                    const domain::Timestamp& now) const {
        return check(symbol, direction, now) == domain::LedgerDecision::ALLOWED;
    }

    /**
     * @brief Зафиксировать подтверждённое исполнение
     *
     * Ошибка репозитория не откатывает запись в памяти: ордер уже исполнен.
     */
    void record(const std::string& symbol,
                domain::CrossDirection direction,
                const domain::Timestamp& now,
                const std::string& orderId = "") {
        auto slot = entries_.find(symbol);
        if (!slot) {
            std::cerr << "[PositionLedger] record() for unknown symbol " << symbol << std::endl;
            return;
        }

        domain::LedgerEntry snapshot;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->entry.lastDirection = direction;
            slot->entry.executedAt = now;
            slot->entry.lastOrderId = orderId;
            snapshot = slot->entry;
        }

        std::cout << "[PositionLedger] " << symbol << " -> " << domain::toString(direction)
                  << " at " << now.toString() << std::endl;

        if (!repository_) {
            return;
        }
        try {
            repository_->save(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[PositionLedger] Failed to persist " << symbol << ": " << e.what() << std::endl;
        }
    }

    std::optional<domain::LedgerEntry> entry(const std::string& symbol) const {
        auto slot = entries_.find(symbol);
        if (!slot) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(slot->mutex);
        return slot->entry;
    }

    /**
     * @brief Позиция символа по последнему исполнению (без учёта прогрева MA)
     */
    domain::PositionState positionState(const std::string& symbol) const {
        auto current = entry(symbol);
        if (!current || !current->lastDirection) {
            return domain::PositionState::WARM_NEUTRAL;
        }
        return *current->lastDirection == domain::CrossDirection::GOLDEN
            ? domain::PositionState::WARM_LONG
            : domain::PositionState::WARM_SHORT;
    }

    size_t size() const { return entries_.size(); }

private:
    struct Slot {
        mutable std::mutex mutex;
        domain::LedgerEntry entry;
        std::chrono::milliseconds minInterval{0};
    };

    std::shared_ptr<ports::output::ILedgerRepository> repository_;
    ThreadSafeMap<std::string, Slot> entries_;

    std::mutex restoredMutex_;
    std::unordered_map<std::string, domain::LedgerEntry> restored_;
};

} // namespace crossover::application
