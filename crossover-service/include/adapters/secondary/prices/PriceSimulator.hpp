#pragma once

#include <algorithm>
#include <cmath>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace crossover::adapters::secondary {

/**
 * @brief Симулятор цены закрытия
 *
 * Случайное блуждание по модели geometric Brownian motion:
 * P(t+1) = P(t) * (1 + σ * Z), где Z ~ N(0, 1)
 *
 * @example
 * ```cpp
 * PriceSimulator sim(42);
 * sim.initSymbol("BTCUSDT", 60000.0, 0.002);
 * double price = sim.tick("BTCUSDT");
 * ```
 *
 * Thread-safe: да (внутренняя синхронизация)
 */
class PriceSimulator {
public:
    static constexpr double MIN_PRICE = 0.01;

    /**
     * @param seed Seed для генератора случайных чисел (0 = random_device)
     */
    explicit PriceSimulator(unsigned int seed = 0)
        : rng_(seed == 0 ? std::random_device{}() : seed)
    {}

    /**
     * @param basePrice Начальная цена
     * @param volatility Волатильность за тик в долях (0.002 = 0.2%)
     */
    void initSymbol(const std::string& symbol, double basePrice, double volatility = 0.002) {
        std::lock_guard<std::mutex> lock(mutex_);
        SymbolState state;
        state.price = std::max(MIN_PRICE, basePrice);
        state.volatility = std::max(0.0, volatility);
        symbols_[symbol] = state;
    }

    bool hasSymbol(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return symbols_.find(symbol) != symbols_.end();
    }

    /**
     * @brief Один шаг случайного блуждания
     * @return Новая цена или nullopt если символ не инициализирован
     */
    std::optional<double> tick(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = symbols_.find(symbol);
        if (it == symbols_.end()) {
            return std::nullopt;
        }

        auto& state = it->second;
        if (state.volatility > 0.0) {
            std::normal_distribution<double> dist(0.0, state.volatility);
            state.price = std::max(MIN_PRICE, state.price * (1.0 + dist(rng_)));
        }
        return state.price;
    }

    /**
     * @brief Установить цену (для детерминированных тестов)
     * @return true если символ найден
     */
    bool setPrice(const std::string& symbol, double price) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = symbols_.find(symbol);
        if (it == symbols_.end()) {
            return false;
        }
        it->second.price = std::max(MIN_PRICE, price);
        return true;
    }

    bool setVolatility(const std::string& symbol, double volatility) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = symbols_.find(symbol);
        if (it == symbols_.end()) {
            return false;
        }
        it->second.volatility = std::max(0.0, volatility);
        return true;
    }

    std::optional<double> getPrice(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = symbols_.find(symbol);
        if (it == symbols_.end()) {
            return std::nullopt;
        }
        return it->second.price;
    }

private:
    struct SymbolState {
        double price = 100.0;
        double volatility = 0.002;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SymbolState> symbols_;
    std::mt19937 rng_;
};

} // namespace crossover::adapters::secondary
