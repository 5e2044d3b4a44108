#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace crossover::adapters::secondary {

/**
 * @brief Леджер в JSON-файле
 *
 * Формат:
 * ```json
 * {"entries": [{"symbol": "BTCUSDT", "lastDirection": "GOLDEN",
 *               "executedAtMs": 1700000000000, "lastOrderId": "paper-00000001"}]}
 * ```
 *
 * Файл перезаписывается целиком через временный файл и rename,
 * поэтому после падения на диске остаётся либо старая, либо новая версия.
 * Отсутствующий файл - пустой леджер. Повреждённый файл - исключение.
 */
class JsonFileLedgerRepository : public ports::output::ILedgerRepository {
public:
    explicit JsonFileLedgerRepository(std::string path)
        : path_(std::move(path))
    {
        entries_ = readFile();
        std::cout << "[JsonFileLedgerRepository] " << path_ << ": " << entries_.size() << " entries" << std::endl;
    }

    void save(const domain::LedgerEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[entry.symbol] = entry;
        writeFile();
    }

    std::vector<domain::LedgerEntry> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::LedgerEntry> result;
        for (const auto& [symbol, entry] : entries_) {
            result.push_back(entry);
        }
        return result;
    }

    void remove(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.erase(symbol) > 0) {
            writeFile();
        }
    }

    const std::string& path() const { return path_; }

private:
    std::map<std::string, domain::LedgerEntry> readFile() const {
        std::map<std::string, domain::LedgerEntry> entries;
        std::ifstream file(path_);
        if (!file.is_open()) {
            return entries;
        }

        try {
            auto j = nlohmann::json::parse(file);
            for (const auto& item : j.value("entries", nlohmann::json::array())) {
                domain::LedgerEntry entry;
                entry.symbol = item.at("symbol").get<std::string>();
                if (item.contains("lastDirection") && !item.at("lastDirection").is_null()) {
                    entry.lastDirection = domain::crossDirectionFromString(item.at("lastDirection").get<std::string>());
                }
                if (item.contains("executedAtMs") && !item.at("executedAtMs").is_null()) {
                    entry.executedAt = domain::Timestamp::fromUnixMillis(item.at("executedAtMs").get<int64_t>());
                }
                entry.lastOrderId = item.value("lastOrderId", "");
                entries[entry.symbol] = entry;
            }
        } catch (const std::exception& e) {
            throw std::runtime_error("Corrupted ledger file " + path_ + ": " + e.what());
        }
        return entries;
    }

    void writeFile() {
        nlohmann::json items = nlohmann::json::array();
        for (const auto& [symbol, entry] : entries_) {
            nlohmann::json item;
            item["symbol"] = entry.symbol;
            item["lastDirection"] = entry.lastDirection
                ? nlohmann::json(domain::toString(*entry.lastDirection))
                : nlohmann::json(nullptr);
            item["executedAtMs"] = entry.executedAt
                ? nlohmann::json(entry.executedAt->toUnixMillis())
                : nlohmann::json(nullptr);
            item["lastOrderId"] = entry.lastOrderId;
            items.push_back(item);
        }
        nlohmann::json j;
        j["entries"] = items;

        std::filesystem::path target(path_);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        std::string tmpPath = path_ + ".tmp";
        {
            std::ofstream out(tmpPath, std::ios::trunc);
            if (!out.is_open()) {
                throw std::runtime_error("Cannot write ledger file " + tmpPath);
            }
            out << j.dump(2);
            out.flush();
            if (!out) {
                throw std::runtime_error("Failed to write ledger file " + tmpPath);
            }
        }
        std::filesystem::rename(tmpPath, target);
    }

    std::string path_;
    std::mutex mutex_;
    std::map<std::string, domain::LedgerEntry> entries_;
};

} // namespace crossover::adapters::secondary
