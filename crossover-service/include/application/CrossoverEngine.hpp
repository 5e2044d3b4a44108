#pragma once

#include "ports/input/ICrossoverEngine.hpp"
#include "ports/output/IPriceSource.hpp"
#include "ports/output/ITradingVenue.hpp"
#include "ports/output/INotificationSink.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "application/MovingAverageTracker.hpp"
#include "application/CrossoverDetector.hpp"
#include "application/PositionLedger.hpp"
#include "application/OrderRateLimiter.hpp"
#include "application/ExecutionCoordinator.hpp"
#include "application/SymbolPipeline.hpp"
#include "application/SymbolWorker.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/ConfigurationError.hpp"
#include <atomic>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace crossover::application {

/**
 * @brief Движок мониторинга пересечений
 *
 * Владеет состоянием символов и их рабочими потоками.
 * Символ с некорректными параметрами не отслеживается (SYMBOL_ERROR),
 * остальные работают. Без ключей биржи движок не запускается.
 */
class CrossoverEngine : public ports::input::ICrossoverEngine {
public:
    CrossoverEngine(
        domain::EngineConfig config,
        std::shared_ptr<ports::output::IPriceSource> priceSource,
        std::shared_ptr<ports::output::ITradingVenue> venue,
        std::shared_ptr<ports::output::INotificationSink> sink,
        std::shared_ptr<ports::output::ILedgerRepository> repository,
        Sleeper sleeper = nullptr
    ) : config_(std::move(config))
      , priceSource_(std::move(priceSource))
      , sink_(std::move(sink))
      , running_(false)
    {
        tracker_ = std::make_shared<MovingAverageTracker>(sink_);
        detector_ = std::make_shared<CrossoverDetector>();
        ledger_ = std::make_shared<PositionLedger>(std::move(repository));
        rateLimiter_ = std::make_shared<OrderRateLimiter>(config_.rateLimit);

        ExecutionCoordinator::Options options;
        options.retry = config_.retry;
        options.notifySuppressed = config_.notifySuppressed;
        options.autoTrade = config_.autoTrade;
        coordinator_ = std::make_shared<ExecutionCoordinator>(
            ledger_, std::move(venue), sink_, rateLimiter_, options, std::move(sleeper));

        for (const auto& symbolConfig : config_.symbols) {
            configureSymbol(symbolConfig);
        }

        std::cout << "[CrossoverEngine] Configured " << pipelines_.size() << " of "
                  << config_.symbols.size() << " symbols" << std::endl;
    }

    ~CrossoverEngine() override {
        stop();
    }

    CrossoverEngine(const CrossoverEngine&) = delete;
    CrossoverEngine& operator=(const CrossoverEngine&) = delete;

    void start() override {
        if (!config_.credentials.isComplete()) {
            throw domain::ConfigurationError("venue credentials are missing");
        }
        if (running_.exchange(true)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        rateLimiter_->reopen();
        for (const auto& symbol : order_) {
            auto it = workers_.find(symbol);
            if (it == workers_.end()) {
                auto worker = std::make_unique<SymbolWorker>(
                    pipelines_.at(symbol), priceSource_, sink_, config_.reconnectDelay);
                it = workers_.emplace(symbol, std::move(worker)).first;
            }
            it->second->start();
        }
        std::cout << "[CrossoverEngine] Started " << workers_.size() << " workers" << std::endl;
    }

    void stop() override {
        if (!running_.exchange(false)) {
            return;
        }
        // ожидающие токена получают отказ, join не ждёт пополнения
        rateLimiter_->shutdown();
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [symbol, worker] : workers_) {
            worker->stop();
        }
        std::cout << "[CrossoverEngine] Stopped" << std::endl;
    }

    bool isRunning() const override {
        return running_.load();
    }

    std::vector<std::string> monitoredSymbols() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& symbol : order_) {
            auto it = workers_.find(symbol);
            if (it == workers_.end() || it->second->state() != domain::WorkerState::FAILED) {
                result.push_back(symbol);
            }
        }
        return result;
    }

    std::vector<domain::SymbolStatus> statusReport() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::SymbolStatus> report;
        std::unordered_set<std::string> reported;

        for (const auto& symbolConfig : config_.symbols) {
            if (!reported.insert(symbolConfig.symbol).second) {
                continue;
            }
            auto pipeline = pipelines_.find(symbolConfig.symbol);
            if (pipeline == pipelines_.end()) {
                domain::SymbolStatus status;
                status.symbol = symbolConfig.symbol;
                status.worker = domain::WorkerState::DISABLED;
                auto error = disabled_.find(symbolConfig.symbol);
                if (error != disabled_.end()) {
                    status.error = error->second;
                }
                report.push_back(status);
                continue;
            }

            auto status = pipeline->second->status();
            auto worker = workers_.find(symbolConfig.symbol);
            if (worker != workers_.end()) {
                status.worker = worker->second->state();
                status.error = worker->second->lastError();
            }
            report.push_back(status);
        }
        return report;
    }

    /**
     * @brief Вывести отчёт о состоянии в лог
     */
    void logStatusReport() const {
        for (const auto& status : statusReport()) {
            std::ostringstream line;
            line << "[CrossoverEngine] " << status.symbol
                 << " worker=" << domain::toString(status.worker)
                 << " position=" << domain::toString(status.position);
            if (status.warm) {
                line << " short=" << status.shortValue << " long=" << status.longValue;
            }
            line << " last=" << (status.lastDirection ? domain::toString(*status.lastDirection) : "NONE")
                 << " samples=" << status.counters.samples
                 << " discarded=" << status.counters.discarded
                 << " events=" << status.counters.events
                 << " executed=" << status.counters.executions
                 << " suppressed=" << status.counters.suppressed
                 << " failed=" << status.counters.failures;
            if (!status.error.empty()) {
                line << " error=\"" << status.error << "\"";
            }
            std::cout << line.str() << std::endl;
        }
    }

    /**
     * @brief Цепочка обработки символа (nullptr, если символ не настроен)
     */
    std::shared_ptr<SymbolPipeline> pipeline(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pipelines_.find(symbol);
        return it != pipelines_.end() ? it->second : nullptr;
    }

    std::shared_ptr<PositionLedger> ledger() const { return ledger_; }
    std::shared_ptr<MovingAverageTracker> tracker() const { return tracker_; }
    const domain::EngineConfig& config() const { return config_; }

private:
    void configureSymbol(const domain::SymbolConfig& symbolConfig) {
        try {
            symbolConfig.validate();
            if (pipelines_.count(symbolConfig.symbol) > 0) {
                throw domain::ConfigurationError(symbolConfig.symbol, "symbol is configured twice");
            }

            tracker_->addSymbol(symbolConfig);
            detector_->addSymbol(symbolConfig.symbol);
            ledger_->addSymbol(symbolConfig.symbol, symbolConfig.minReexecutionInterval);
            coordinator_->registerSymbol(symbolConfig);

            pipelines_[symbolConfig.symbol] = std::make_shared<SymbolPipeline>(
                symbolConfig, tracker_, detector_, coordinator_, ledger_);
            order_.push_back(symbolConfig.symbol);

            std::cout << "[CrossoverEngine] " << symbolConfig.symbol << ": "
                      << domain::toString(symbolConfig.averageType) << symbolConfig.shortWindow
                      << "/" << domain::toString(symbolConfig.averageType) << symbolConfig.longWindow
                      << " qty=" << symbolConfig.quantity
                      << " autoTrade=" << (symbolConfig.effectiveAutoTrade(config_.autoTrade) ? "on" : "off")
                      << std::endl;

        } catch (const domain::ConfigurationError& e) {
            std::cerr << "[CrossoverEngine] Symbol disabled: " << e.what() << std::endl;
            disabled_[symbolConfig.symbol] = e.what();
            notifySymbolError(symbolConfig.symbol, e.what());
        }
    }

    void notifySymbolError(const std::string& symbol, const std::string& reason) {
        if (!sink_) {
            return;
        }
        try {
            sink_->notify(domain::Notification(
                domain::NotificationType::SYMBOL_ERROR,
                symbol,
                "Symbol " + symbol + " is not monitored: " + reason,
                {{"reason", reason}}
            ));
        } catch (const std::exception& e) {
            std::cerr << "[CrossoverEngine] Notification error: " << e.what() << std::endl;
        }
    }

    domain::EngineConfig config_;
    std::shared_ptr<ports::output::IPriceSource> priceSource_;
    std::shared_ptr<ports::output::INotificationSink> sink_;

    std::shared_ptr<MovingAverageTracker> tracker_;
    std::shared_ptr<CrossoverDetector> detector_;
    std::shared_ptr<PositionLedger> ledger_;
    std::shared_ptr<OrderRateLimiter> rateLimiter_;
    std::shared_ptr<ExecutionCoordinator> coordinator_;

    std::atomic<bool> running_;
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::shared_ptr<SymbolPipeline>> pipelines_;
    std::unordered_map<std::string, std::unique_ptr<SymbolWorker>> workers_;
    std::unordered_map<std::string, std::string> disabled_;
};

} // namespace crossover::application
