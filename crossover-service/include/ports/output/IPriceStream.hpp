#pragma once

#include "domain/PriceSample.hpp"
#include <optional>

namespace crossover::ports::output {

/**
 * @brief Поток цен одного символа
 *
 * Ленивая бесконечная последовательность. next() блокируется до следующей цены.
 * После close() или обрыва соединения next() возвращает nullopt,
 * повторно открыть закрытый поток нельзя: нужно подписаться заново.
 */
class IPriceStream {
public:
    virtual ~IPriceStream() = default;

    /**
     * @brief Дождаться следующей цены
     * @return PriceSample или nullopt, если поток закрыт
     */
    virtual std::optional<domain::PriceSample> next() = 0;

    /**
     * @brief Закрыть поток и разбудить ожидающий next()
     */
    virtual void close() = 0;

    virtual bool isClosed() const = 0;
};

} // namespace crossover::ports::output
