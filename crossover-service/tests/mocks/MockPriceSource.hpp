#pragma once

#include "ports/output/IPriceSource.hpp"
#include "adapters/secondary/prices/QueuePriceStream.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace crossover::tests {

/**
 * @brief Поток, который ломается на первом next()
 */
class ThrowingPriceStream : public ports::output::IPriceStream {
public:
    std::optional<domain::PriceSample> next() override {
        throw std::runtime_error("corrupted price frame");
    }
    void close() override { closed_ = true; }
    bool isClosed() const override { return closed_; }

private:
    std::atomic<bool> closed_{false};
};

/**
 * @brief Источник цен, которым управляет тест
 *
 * Каждая подписка создаёт QueuePriceStream; тест кладёт в него цены
 * через push() и может оборвать поток через dropStream().
 */
class MockPriceSource : public ports::output::IPriceSource {
public:
    std::shared_ptr<ports::output::IPriceStream> subscribe(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++subscribeCalls_[symbol];
        if (failing_.count(symbol) > 0) {
            throw std::runtime_error("subscription refused for " + symbol);
        }
        if (broken_.count(symbol) > 0) {
            return std::make_shared<ThrowingPriceStream>();
        }
        auto stream = std::make_shared<adapters::secondary::QueuePriceStream>();
        streams_[symbol] = stream;
        return stream;
    }

    /// Положить цену в текущий поток символа
    bool push(const domain::PriceSample& sample) {
        auto stream = current(sample.symbol);
        return stream && stream->push(sample);
    }

    /// Закрыть текущий поток символа (обрыв соединения)
    void dropStream(const std::string& symbol) {
        auto stream = current(symbol);
        if (stream) {
            stream->close();
        }
    }

    void failSubscriptions(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_[symbol] = true;
    }

    /// Поток символа будет бросать исключение из next()
    void breakStreams(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_[symbol] = true;
    }

    std::shared_ptr<adapters::secondary::QueuePriceStream> current(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(symbol);
        return it != streams_.end() ? it->second : nullptr;
    }

    int subscribeCount(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribeCalls_.find(symbol);
        return it != subscribeCalls_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<adapters::secondary::QueuePriceStream>> streams_;
    std::map<std::string, int> subscribeCalls_;
    std::map<std::string, bool> failing_;
    std::map<std::string, bool> broken_;
};

} // namespace crossover::tests
