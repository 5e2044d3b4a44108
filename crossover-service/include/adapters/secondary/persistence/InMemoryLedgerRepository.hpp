#pragma once

#include "ports/output/ILedgerRepository.hpp"
#include <mutex>
#include <unordered_map>

namespace crossover::adapters::secondary {

/**
 * @brief Леджер в памяти (тесты и запуск без диска)
 */
class InMemoryLedgerRepository : public ports::output::ILedgerRepository {
public:
    void save(const domain::LedgerEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[entry.symbol] = entry;
        ++saveCount_;
    }

    std::vector<domain::LedgerEntry> loadAll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::LedgerEntry> result;
        result.reserve(entries_.size());
        for (const auto& [symbol, entry] : entries_) {
            result.push_back(entry);
        }
        return result;
    }

    void remove(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(symbol);
    }

    int saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saveCount_;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, domain::LedgerEntry> entries_;
    int saveCount_ = 0;
};

} // namespace crossover::adapters::secondary
