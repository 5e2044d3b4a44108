#pragma once

#include "ports/output/IPriceStream.hpp"
#include "ThreadSafeQueue.hpp"
#include <chrono>
#include <optional>

namespace crossover::adapters::secondary {

/**
 * @brief Поток цен поверх блокирующей очереди
 *
 * Производитель кладёт цены через push(), рабочий поток забирает через next().
 * - finish(): конец данных со стороны производителя, оставшиеся цены ещё отдаются
 * - close(): немедленное закрытие, непрочитанные цены выбрасываются
 */
class QueuePriceStream : public ports::output::IPriceStream {
public:
    /**
     * @return false если поток уже закрыт
     */
    bool push(const domain::PriceSample& sample) {
        return queue_.push(sample);
    }

    std::optional<domain::PriceSample> next() override {
        return queue_.pop();
    }

    /**
     * @brief next() с таймаутом
     */
    std::optional<domain::PriceSample> nextFor(std::chrono::milliseconds timeout) {
        return queue_.popFor(timeout);
    }

    void finish() {
        queue_.shutdown();
    }

    void close() override {
        queue_.shutdown();
        queue_.clear();
    }

    bool isClosed() const override {
        return queue_.isShutdown() && queue_.isEmpty();
    }

    size_t pending() const {
        return queue_.size();
    }

private:
    ThreadSafeQueue<domain::PriceSample> queue_;
};

} // namespace crossover::adapters::secondary
