#pragma once

#include "ports/output/IPriceSource.hpp"
#include "adapters/secondary/prices/PriceSimulator.hpp"
#include "adapters/secondary/prices/QueuePriceStream.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace crossover::adapters::secondary {

/**
 * @brief Источник цен на основе PriceSimulator
 *
 * Фоновый поток раз в interval делает tick() по всем символам с подписками
 * и кладёт новую цену в каждый открытый поток символа.
 * Символ без начальной цены инициализируется значением defaultBasePrice.
 *
 * @example
 * ```cpp
 * auto simulator = std::make_shared<PriceSimulator>();
 * SimulatedPriceSource source(simulator);
 * auto stream = source.subscribe("BTCUSDT");
 * source.start(1000ms);
 * ```
 */
class SimulatedPriceSource : public ports::output::IPriceSource {
public:
    explicit SimulatedPriceSource(std::shared_ptr<PriceSimulator> simulator, double defaultBasePrice = 100.0)
        : simulator_(std::move(simulator))
        , defaultBasePrice_(defaultBasePrice)
        , running_(false)
        , tickCount_(0)
    {}

    ~SimulatedPriceSource() override {
        stop();
    }

    SimulatedPriceSource(const SimulatedPriceSource&) = delete;
    SimulatedPriceSource& operator=(const SimulatedPriceSource&) = delete;

    std::shared_ptr<ports::output::IPriceStream> subscribe(const std::string& symbol) override {
        if (!simulator_->hasSymbol(symbol)) {
            simulator_->initSymbol(symbol, defaultBasePrice_);
        }
        auto stream = std::make_shared<QueuePriceStream>();
        std::lock_guard<std::mutex> lock(mutex_);
        streams_[symbol].push_back(stream);
        return stream;
    }

    /**
     * @brief Запустить фоновые тики
     */
    void start(std::chrono::milliseconds interval = std::chrono::milliseconds{1000}) {
        if (running_.exchange(true)) {
            return;
        }
        interval_ = interval;
        workerThread_ = std::thread([this]() { runLoop(); });
        std::cout << "[SimulatedPriceSource] Started, interval=" << interval.count() << "ms" << std::endl;
    }

    /**
     * @brief Остановить тики и закрыть все потоки
     */
    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [symbol, streams] : streams_) {
            for (auto& stream : streams) {
                stream->close();
            }
        }
        streams_.clear();
        std::cout << "[SimulatedPriceSource] Stopped" << std::endl;
    }

    bool isRunning() const { return running_.load(); }
    uint64_t tickCount() const { return tickCount_.load(); }

    /**
     * @brief Выполнить один тик вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    void runLoop() {
        while (running_.load()) {
            auto start = std::chrono::steady_clock::now();
            doTick();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            auto sleepTime = interval_ - elapsed;

            // Короткие шаги, чтобы stop() не ждал целый интервал
            auto deadline = std::chrono::steady_clock::now() + sleepTime;
            while (running_.load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::min(sleepTime, std::chrono::milliseconds{20}));
            }
        }
    }

    void doTick() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = domain::Timestamp::now();

        for (auto& [symbol, streams] : streams_) {
            streams.erase(
                std::remove_if(streams.begin(), streams.end(),
                               [](const std::shared_ptr<QueuePriceStream>& s) { return s->isClosed(); }),
                streams.end());
            if (streams.empty()) {
                continue;
            }

            auto price = simulator_->tick(symbol);
            if (!price) {
                continue;
            }

            // Время строго возрастает, даже если тики чаще миллисекунды
            auto& last = lastTimestamps_[symbol];
            int64_t millis = std::max(now.toUnixMillis(), last + 1);
            last = millis;

            domain::PriceSample sample;
            sample.symbol = symbol;
            sample.timestamp = domain::Timestamp::fromUnixMillis(millis);
            sample.price = *price;

            for (auto& stream : streams) {
                stream->push(sample);
            }
        }
        ++tickCount_;
    }

    std::shared_ptr<PriceSimulator> simulator_;
    double defaultBasePrice_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::chrono::milliseconds interval_{1000};
    std::thread workerThread_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::shared_ptr<QueuePriceStream>>> streams_;
    std::unordered_map<std::string, int64_t> lastTimestamps_;
};

} // namespace crossover::adapters::secondary
