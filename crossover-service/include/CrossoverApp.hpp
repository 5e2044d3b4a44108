#pragma once

#include "domain/EngineConfig.hpp"
#include "settings/EngineSettings.hpp"
#include "settings/VenueSettings.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>

// Forward declarations
namespace crossover::ports::output {
    class IPriceSource;
    class ITradingVenue;
    class INotificationSink;
    class ILedgerRepository;
}

namespace crossover::application {
    class CrossoverEngine;
}

namespace crossover::adapters::secondary {
    class SimulatedPriceSource;
    class RabbitMQEventPublisher;
}

/**
 * @class CrossoverApp
 * @brief Главное приложение сервиса пересечений скользящих средних
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из ENV и снимок конфигурации из JSON
 * 2. configureInjection() - Boost.DI: адаптеры источника цен, биржи, леджера и уведомлений
 * 3. start() - запуск движка и периодический отчёт о состоянии до stop()
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Secondary Adapters: Replay/Simulated prices, PaperTradingVenue,
 *   JsonFile/Postgres/InMemory ledger, Console/RabbitMQ notifications
 */
class CrossoverApp
{
public:
    CrossoverApp();
    ~CrossoverApp();

    CrossoverApp(const CrossoverApp &) = delete;
    CrossoverApp &operator=(const CrossoverApp &) = delete;

    /**
     * @brief Запустить приложение (блокирует до stop())
     */
    void run(int argc, char *argv[]);

    /**
     * @brief Остановить приложение (из обработчика сигнала)
     */
    void stop();

protected:
    void loadEnvironment(int argc, char *argv[]);
    void configureInjection();
    void start();

private:
    std::shared_ptr<crossover::ports::output::IPriceSource> createPriceSource();
    std::shared_ptr<crossover::ports::output::ITradingVenue> createVenue();
    std::shared_ptr<crossover::ports::output::INotificationSink> createNotificationSink();
    std::shared_ptr<crossover::ports::output::ILedgerRepository> createLedgerRepository();

    void shutdown();

    std::shared_ptr<crossover::settings::EngineSettings> engineSettings_;
    std::shared_ptr<crossover::settings::VenueSettings> venueSettings_;
    crossover::domain::EngineConfig config_;

    std::shared_ptr<crossover::application::CrossoverEngine> engine_;
    std::shared_ptr<crossover::adapters::secondary::SimulatedPriceSource> simulatedSource_;
    std::shared_ptr<crossover::adapters::secondary::RabbitMQEventPublisher> publisher_;

    std::atomic<bool> running_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCv_;
};
