#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace crossover::adapters::secondary
{

    /**
     * @brief Леджер в PostgreSQL
     *
     * Таблица из DbSettings::getLedgerTable() (по умолчанию ledger_entries):
     * symbol PK, last_direction, executed_at_ms, last_order_id.
     * Соединение открывается на каждую операцию.
     */
    class PostgresLedgerRepository : public crossover::ports::output::ILedgerRepository
    {
    public:
        explicit PostgresLedgerRepository(std::shared_ptr<crossover::settings::DbSettings> s) : settings_(std::move(s))
        {
            pqxx::connection c(settings_->getConnectionString());
            table_ = c.quote_name(settings_->getLedgerTable());
            pqxx::work t(c);
            t.exec(
                "CREATE TABLE IF NOT EXISTS " + table_ + " ("
                " symbol TEXT PRIMARY KEY,"
                " last_direction TEXT,"
                " executed_at_ms BIGINT,"
                " last_order_id TEXT NOT NULL DEFAULT '')");
            t.commit();
            std::cout << "[PostgresLedgerRepository] Connected to " << settings_->getName()
                      << ", table " << table_ << std::endl;
        }

        void save(const crossover::domain::LedgerEntry &entry) override
        {
            std::optional<std::string> direction;
            if (entry.lastDirection)
                direction = crossover::domain::toString(*entry.lastDirection);
            std::optional<int64_t> executedAt;
            if (entry.executedAt)
                executedAt = entry.executedAt->toUnixMillis();

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec_params(
                "INSERT INTO " + table_ + " (symbol, last_direction, executed_at_ms, last_order_id) "
                "VALUES ($1, $2, $3, $4) "
                "ON CONFLICT (symbol) DO UPDATE SET last_direction = EXCLUDED.last_direction, "
                "executed_at_ms = EXCLUDED.executed_at_ms, last_order_id = EXCLUDED.last_order_id",
                entry.symbol, direction, executedAt, entry.lastOrderId);
            t.commit();
            std::cout << "[PostgresLedgerRepository] Saved " << entry.symbol << std::endl;
        }

        std::vector<crossover::domain::LedgerEntry> loadAll() override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec(
                "SELECT symbol, last_direction, executed_at_ms, last_order_id FROM " + table_ + " ORDER BY symbol");

            std::vector<crossover::domain::LedgerEntry> entries;
            for (const auto &row : r)
            {
                crossover::domain::LedgerEntry entry;
                entry.symbol = row[0].as<std::string>();
                if (!row[1].is_null())
                    entry.lastDirection = crossover::domain::crossDirectionFromString(row[1].as<std::string>());
                if (!row[2].is_null())
                    entry.executedAt = crossover::domain::Timestamp::fromUnixMillis(row[2].as<int64_t>());
                entry.lastOrderId = row[3].as<std::string>();
                entries.push_back(entry);
            }
            return entries;
        }

        void remove(const std::string &symbol) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec_params("DELETE FROM " + table_ + " WHERE symbol=$1", symbol);
            t.commit();
        }

    private:
        std::shared_ptr<crossover::settings::DbSettings> settings_;
        std::string table_;     ///< Уже экранированное имя
    };

} // namespace crossover::adapters::secondary
