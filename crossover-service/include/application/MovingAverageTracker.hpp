#pragma once

#include "domain/MAState.hpp"
#include "domain/PriceSample.hpp"
#include "domain/SymbolConfig.hpp"
#include "domain/ConfigurationError.hpp"
#include "domain/Notification.hpp"
#include "ports/output/INotificationSink.hpp"
#include "ThreadSafeMap.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <string>

namespace crossover::application {

/**
 * @brief Скользящие средние по символам
 *
 * Для каждого символа держит короткую и длинную MA.
 * - SMA: среднее последних N цен, пересчитывается из буфера длиной longWindow
 * - EMA: ema += α·(price − ema), α = 2/(N+1), старт от SMA первых N цен
 *
 * Длинное окно прогрето, когда принято не меньше longWindow цен.
 * Цены с неположительным/нечисловым значением и цены не позже последней
 * принятой (дубли баров, перестановки) отбрасываются с предупреждением DATA_QUALITY.
 *
 * Thread-safe: да. Обновления одного символа должны идти из одного потока.
 */
class MovingAverageTracker {
public:
    explicit MovingAverageTracker(std::shared_ptr<ports::output::INotificationSink> sink = nullptr)
        : sink_(std::move(sink))
    {}

    /**
     * @brief Начать отслеживание символа
     * @throws domain::ConfigurationError при некорректных окнах
     */
    void addSymbol(const domain::SymbolConfig& config) {
        if (config.shortWindow < 1 || config.longWindow <= config.shortWindow) {
            throw domain::ConfigurationError(config.symbol, "invalid moving average windows");
        }

        auto averages = std::make_shared<SymbolAverages>();
        averages->shortWindow = static_cast<size_t>(config.shortWindow);
        averages->longWindow = static_cast<size_t>(config.longWindow);
        averages->type = config.averageType;
        averages->state.symbol = config.symbol;

        if (!symbols_.insertIfAbsent(config.symbol, averages)) {
            throw domain::ConfigurationError(config.symbol, "symbol is already tracked");
        }
    }

    bool removeSymbol(const std::string& symbol) {
        return symbols_.erase(symbol);
    }

    bool hasSymbol(const std::string& symbol) const {
        return symbols_.contains(symbol);
    }

    /**
     * @brief Учесть новую цену
     * @return Новое состояние или nullopt, если цена отброшена
     */
    std::optional<domain::MAState> update(const std::string& symbol, const domain::PriceSample& sample) {
        auto averages = symbols_.find(symbol);
        if (!averages) {
            discard(symbol, sample, "symbol is not tracked");
            return std::nullopt;
        }
        if (!sample.symbol.empty() && sample.symbol != symbol) {
            discard(symbol, sample, "sample belongs to " + sample.symbol);
            return std::nullopt;
        }
        if (!std::isfinite(sample.price) || sample.price <= 0.0) {
            discard(symbol, sample, "non-positive or non-finite price");
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(averages->mutex);
        auto& state = averages->state;

        if (state.lastTimestamp && sample.timestamp <= *state.lastTimestamp) {
            std::string reason = sample.timestamp == *state.lastTimestamp
                ? "duplicate bar timestamp"
                : "out-of-order timestamp";
            discard(symbol, sample, reason);
            return std::nullopt;
        }

        ++state.count;
        state.lastTimestamp = sample.timestamp;

        if (averages->type == domain::AverageType::SMA) {
            updateSimple(*averages, sample.price);
        } else {
            updateExponential(*averages, sample.price);
        }

        state.warm = state.count >= averages->longWindow;
        return state;
    }

    /**
     * @brief Текущее состояние символа
     */
    std::optional<domain::MAState> getState(const std::string& symbol) const {
        auto averages = symbols_.find(symbol);
        if (!averages) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(averages->mutex);
        return averages->state;
    }

    size_t size() const { return symbols_.size(); }

private:
    struct SymbolAverages {
        std::mutex mutex;
        size_t shortWindow = 9;
        size_t longWindow = 26;
        domain::AverageType type = domain::AverageType::SMA;
        std::deque<double> window;      ///< SMA: последние longWindow цен
        double shortSeedSum = 0.0;      ///< EMA: сумма первых shortWindow цен
        double longSeedSum = 0.0;       ///< EMA: сумма первых longWindow цен
        domain::MAState state;
    };

    static void updateSimple(SymbolAverages& averages, double price) {
        auto& window = averages.window;
        window.push_back(price);
        if (window.size() > averages.longWindow) {
            window.pop_front();
        }

        size_t shortCount = std::min(averages.shortWindow, window.size());
        double shortSum = std::accumulate(window.end() - static_cast<std::ptrdiff_t>(shortCount), window.end(), 0.0);
        double longSum = std::accumulate(window.begin(), window.end(), 0.0);

        averages.state.shortValue = shortSum / static_cast<double>(shortCount);
        averages.state.longValue = longSum / static_cast<double>(window.size());
    }

    static void updateExponential(SymbolAverages& averages, double price) {
        auto& state = averages.state;
        state.shortValue = nextEma(state.shortValue, averages.shortSeedSum, averages.shortWindow, state.count, price);
        state.longValue = nextEma(state.longValue, averages.longSeedSum, averages.longWindow, state.count, price);
    }

    static double nextEma(double current, double& seedSum, size_t window, uint64_t count, double price) {
        if (count <= window) {
            seedSum += price;
            return seedSum / static_cast<double>(count);
        }
        double alpha = 2.0 / (static_cast<double>(window) + 1.0);
        return current + alpha * (price - current);
    }

    void discard(const std::string& symbol, const domain::PriceSample& sample, const std::string& reason) {
        std::cerr << "[MovingAverageTracker] " << symbol << ": discarded sample at "
                  << sample.timestamp.toString() << " price=" << sample.price
                  << " (" << reason << ")" << std::endl;

        if (!sink_) {
            return;
        }
        try {
            sink_->notify(domain::Notification(
                domain::NotificationType::DATA_QUALITY,
                symbol,
                "Discarded price sample for " + symbol + ": " + reason,
                {{"timestamp", sample.timestamp.toUnixMillis()},
                 {"price", sample.price},
                 {"reason", reason}}
            ));
        } catch (const std::exception& e) {
            std::cerr << "[MovingAverageTracker] Notification error: " << e.what() << std::endl;
        }
    }

    std::shared_ptr<ports::output::INotificationSink> sink_;
    ThreadSafeMap<std::string, SymbolAverages> symbols_;
};

} // namespace crossover::application
