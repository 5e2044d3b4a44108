#pragma once

#include "IPriceStream.hpp"
#include <string>
#include <memory>

namespace crossover::ports::output {

/**
 * @brief Источник цен
 *
 * Реализации:
 * - ReplayPriceSource - воспроизведение CSV
 * - SimulatedPriceSource - случайное блуждание по таймеру
 */
class IPriceSource {
public:
    virtual ~IPriceSource() = default;

    /**
     * @brief Подписаться на цены символа
     * @param symbol Тикер
     * @return Новый поток цен
     * @throws std::runtime_error если подписка невозможна
     */
    virtual std::shared_ptr<IPriceStream> subscribe(const std::string& symbol) = 0;
};

} // namespace crossover::ports::output
