#include "CrossoverApp.hpp"

#include <boost/di.hpp>

// Application
#include "application/ConfigLoader.hpp"
#include "application/CrossoverEngine.hpp"

// Secondary Adapters
#include "adapters/secondary/prices/PriceSimulator.hpp"
#include "adapters/secondary/prices/SimulatedPriceSource.hpp"
#include "adapters/secondary/prices/ReplayPriceSource.hpp"
#include "adapters/secondary/venue/PaperTradingVenue.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/persistence/JsonFileLedgerRepository.hpp"
#include "adapters/secondary/persistence/PostgresLedgerRepository.hpp"
#include "adapters/secondary/notifications/ConsoleNotificationSink.hpp"
#include "adapters/secondary/notifications/CompositeNotificationSink.hpp"
#include "adapters/secondary/notifications/EventPublisherNotificationSink.hpp"
#include "adapters/secondary/events/RabbitMQEventPublisher.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"

#include <chrono>
#include <iostream>
#include <random>
#include <stdexcept>

namespace di = boost::di;

using namespace crossover;

// Sleeper остаётся по умолчанию, инжектор передаёт только конфиг и порты
namespace boost {
namespace di {
template <>
struct ctor_traits<crossover::application::CrossoverEngine> {
    BOOST_DI_INJECT_TRAITS(crossover::domain::EngineConfig,
                           std::shared_ptr<crossover::ports::output::IPriceSource>,
                           std::shared_ptr<crossover::ports::output::ITradingVenue>,
                           std::shared_ptr<crossover::ports::output::INotificationSink>,
                           std::shared_ptr<crossover::ports::output::ILedgerRepository>);
};
} // namespace di
} // namespace boost

// ============================================================================
// CrossoverApp Implementation
// ============================================================================

CrossoverApp::CrossoverApp()
{
    std::cout << "[CrossoverApp] Application created" << std::endl;
}

CrossoverApp::~CrossoverApp()
{
    shutdown();
    std::cout << "[CrossoverApp] Application destroyed" << std::endl;
}

void CrossoverApp::run(int argc, char *argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
}

void CrossoverApp::stop()
{
    running_ = false;
    stopCv_.notify_all();
}

void CrossoverApp::loadEnvironment(int argc, char *argv[])
{
    engineSettings_ = std::make_shared<settings::EngineSettings>();
    venueSettings_ = std::make_shared<settings::VenueSettings>();
    if (argc > 1)
    {
        engineSettings_->setConfigPathFallback(argv[1]);
    }

    std::cout << "[CrossoverApp] Loading configuration from " << engineSettings_->getConfigPath() << std::endl;
    config_ = application::ConfigLoader::loadFile(engineSettings_->getConfigPath());

    // Ключи из окружения перекрывают ключи из файла
    if (!venueSettings_->getApiKey().empty())
    {
        config_.credentials.apiKey = venueSettings_->getApiKey();
    }
    if (!venueSettings_->getApiSecret().empty())
    {
        config_.credentials.apiSecret = venueSettings_->getApiSecret();
    }

    std::cout << "[CrossoverApp] Environment loaded: " << config_.symbols.size() << " symbols"
              << ", prices=" << engineSettings_->getPriceSource()
              << ", ledger=" << engineSettings_->getLedger()
              << ", notifier=" << engineSettings_->getNotifier() << std::endl;
}

void CrossoverApp::configureInjection()
{
    std::cout << "[CrossoverApp] Configuring DI..." << std::endl;

    auto priceSource = createPriceSource();
    auto venue = createVenue();
    auto sink = createNotificationSink();
    auto repository = createLedgerRepository();

    // Порты -> выбранные адаптеры (instance binding), движок собирает инжектор
    auto injector = di::make_injector(
        di::bind<domain::EngineConfig>().to(config_),
        di::bind<ports::output::IPriceSource>().to(priceSource),
        di::bind<ports::output::ITradingVenue>().to(venue),
        di::bind<ports::output::INotificationSink>().to(sink),
        di::bind<ports::output::ILedgerRepository>().to(repository),
        di::bind<application::CrossoverEngine>().in(di::singleton));

    engine_ = injector.create<std::shared_ptr<application::CrossoverEngine>>();

    std::cout << "[CrossoverApp] DI configured" << std::endl;
}

void CrossoverApp::start()
{
    engine_->start();
    running_ = true;

    if (simulatedSource_)
    {
        simulatedSource_->start(std::chrono::milliseconds{engineSettings_->getTickIntervalMs()});
    }

    std::cout << "[CrossoverApp] Monitoring " << engine_->monitoredSymbols().size() << " symbols" << std::endl;

    const int statusInterval = engineSettings_->getStatusIntervalSec();
    std::unique_lock<std::mutex> lock(stopMutex_);
    while (running_)
    {
        if (statusInterval > 0)
        {
            stopCv_.wait_for(lock, std::chrono::seconds{statusInterval}, [this]() { return !running_.load(); });
            if (running_)
            {
                engine_->logStatusReport();
            }
        }
        else
        {
            // stop() из обработчика сигнала не берёт stopMutex_
            stopCv_.wait_for(lock, std::chrono::seconds{1}, [this]() { return !running_.load(); });
        }
    }
    lock.unlock();

    shutdown();
}

void CrossoverApp::shutdown()
{
    if (engine_)
    {
        engine_->stop();
        engine_->logStatusReport();
        engine_.reset();
    }
    if (simulatedSource_)
    {
        simulatedSource_->stop();
        simulatedSource_.reset();
    }
    if (publisher_)
    {
        publisher_->stop();
        publisher_.reset();
    }
}

// ============================================================================
// Выбор адаптеров
// ============================================================================

std::shared_ptr<ports::output::IPriceSource> CrossoverApp::createPriceSource()
{
    const auto kind = engineSettings_->getPriceSource();
    if (kind == "replay")
    {
        return adapters::secondary::ReplayPriceSource::fromCsvFile(engineSettings_->getReplayPath());
    }
    if (kind == "simulated")
    {
        auto simulator = std::make_shared<adapters::secondary::PriceSimulator>(std::random_device{}());
        simulatedSource_ = std::make_shared<adapters::secondary::SimulatedPriceSource>(simulator);
        return simulatedSource_;
    }
    throw std::invalid_argument("Unknown price source: " + kind);
}

std::shared_ptr<ports::output::ITradingVenue> CrossoverApp::createVenue()
{
    return std::make_shared<adapters::secondary::PaperTradingVenue>(
        adapters::secondary::paperFillBehaviorFromString(venueSettings_->getPaperMode()),
        venueSettings_->getPaperFailFirst());
}

std::shared_ptr<ports::output::INotificationSink> CrossoverApp::createNotificationSink()
{
    const auto kind = engineSettings_->getNotifier();
    if (kind != "console" && kind != "rabbitmq" && kind != "both")
    {
        throw std::invalid_argument("Unknown notifier: " + kind);
    }

    auto composite = std::make_shared<adapters::secondary::CompositeNotificationSink>();
    if (kind == "console" || kind == "both")
    {
        composite->add(std::make_shared<adapters::secondary::ConsoleNotificationSink>());
    }
    if (kind == "rabbitmq" || kind == "both")
    {
        auto rabbitInjector = di::make_injector(
            di::bind<settings::RabbitMQSettings>().in(di::singleton));
        publisher_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQEventPublisher>>();
        publisher_->start();
        composite->add(std::make_shared<adapters::secondary::EventPublisherNotificationSink>(publisher_));
    }
    return composite;
}

std::shared_ptr<ports::output::ILedgerRepository> CrossoverApp::createLedgerRepository()
{
    const auto kind = engineSettings_->getLedger();
    if (kind == "memory")
    {
        return std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
    }
    if (kind == "file")
    {
        return std::make_shared<adapters::secondary::JsonFileLedgerRepository>(engineSettings_->getLedgerFile());
    }
    if (kind == "postgres")
    {
        auto dbInjector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton));
        return dbInjector.create<std::shared_ptr<adapters::secondary::PostgresLedgerRepository>>();
    }
    throw std::invalid_argument("Unknown ledger: " + kind);
}
