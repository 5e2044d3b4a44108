#pragma once

#include "ports/output/IPriceSource.hpp"
#include "adapters/secondary/prices/QueuePriceStream.hpp"
#include "domain/PriceSample.hpp"
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace crossover::adapters::secondary {

/**
 * @brief Воспроизведение записанных цен
 *
 * CSV: `symbol,timestamp_ms,price`, первая строка может быть заголовком,
 * строки с '#' пропускаются. Каждая подписка получает цены символа
 * в порядке файла. После последней цены поток остаётся открытым и простаивает,
 * как живой поток без новых данных. С finishAfterReplay = true поток
 * завершается, что имитирует обрыв соединения.
 *
 * @example
 * ```cpp
 * auto source = ReplayPriceSource::fromCsvFile("config/replay.csv");
 * auto stream = source->subscribe("BTCUSDT");
 * while (auto sample = stream->next()) { ... }
 * ```
 */
class ReplayPriceSource : public ports::output::IPriceSource {
public:
    explicit ReplayPriceSource(std::vector<domain::PriceSample> samples, bool finishAfterReplay = false)
        : samples_(std::move(samples))
        , finishAfterReplay_(finishAfterReplay)
    {
        std::cout << "[ReplayPriceSource] Loaded " << samples_.size() << " samples" << std::endl;
    }

    /**
     * @throws std::runtime_error если файл не открывается
     */
    static std::shared_ptr<ReplayPriceSource> fromCsvFile(const std::string& path, bool finishAfterReplay = false) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open replay file: " + path);
        }
        return std::make_shared<ReplayPriceSource>(parseCsv(file), finishAfterReplay);
    }

    /**
     * @brief Разобрать CSV; некорректные строки пропускаются с предупреждением
     */
    static std::vector<domain::PriceSample> parseCsv(std::istream& input) {
        std::vector<domain::PriceSample> samples;
        std::string line;
        size_t lineNumber = 0;

        while (std::getline(input, line)) {
            ++lineNumber;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#') {
                continue;
            }
            if (lineNumber == 1 && line.rfind("symbol", 0) == 0) {
                continue;
            }

            std::stringstream ss(line);
            std::string symbol, timestamp, price;
            if (!std::getline(ss, symbol, ',') || !std::getline(ss, timestamp, ',') || !std::getline(ss, price)) {
                std::cerr << "[ReplayPriceSource] Skipping malformed line " << lineNumber << std::endl;
                continue;
            }

            try {
                domain::PriceSample sample;
                sample.symbol = symbol;
                sample.timestamp = domain::Timestamp::fromUnixMillis(std::stoll(timestamp));
                sample.price = std::stod(price);
                samples.push_back(sample);
            } catch (const std::exception& e) {
                std::cerr << "[ReplayPriceSource] Skipping line " << lineNumber << ": " << e.what() << std::endl;
            }
        }
        return samples;
    }

    std::shared_ptr<ports::output::IPriceStream> subscribe(const std::string& symbol) override {
        auto stream = std::make_shared<QueuePriceStream>();
        size_t count = 0;
        for (const auto& sample : samples_) {
            if (sample.symbol == symbol) {
                stream->push(sample);
                ++count;
            }
        }
        if (finishAfterReplay_) {
            stream->finish();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++subscriptions_;
        }
        std::cout << "[ReplayPriceSource] " << symbol << ": replaying " << count << " samples" << std::endl;
        return stream;
    }

    size_t sampleCount() const { return samples_.size(); }

    int subscriptions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_;
    }

private:
    const std::vector<domain::PriceSample> samples_;
    const bool finishAfterReplay_;

    mutable std::mutex mutex_;
    int subscriptions_ = 0;
};

} // namespace crossover::adapters::secondary
