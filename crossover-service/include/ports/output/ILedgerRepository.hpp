#pragma once

#include "domain/LedgerEntry.hpp"
#include <string>
#include <vector>

namespace crossover::ports::output {

/**
 * @brief Хранилище записей леджера
 *
 * Единственное долговременное состояние, которое читается при рестарте.
 *
 * Реализации:
 * - InMemoryLedgerRepository
 * - JsonFileLedgerRepository
 * - PostgresLedgerRepository
 */
class ILedgerRepository {
public:
    virtual ~ILedgerRepository() = default;

    /**
     * @brief Сохранить запись (upsert по symbol)
     */
    virtual void save(const domain::LedgerEntry& entry) = 0;

    /**
     * @brief Загрузить все сохранённые записи
     */
    virtual std::vector<domain::LedgerEntry> loadAll() = 0;

    /**
     * @brief Удалить запись символа
     */
    virtual void remove(const std::string& symbol) = 0;
};

} // namespace crossover::ports::output
