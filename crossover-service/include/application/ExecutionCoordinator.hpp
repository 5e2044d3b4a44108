#pragma once

#include "ports/input/IExecutionCoordinator.hpp"
#include "ports/output/ITradingVenue.hpp"
#include "ports/output/INotificationSink.hpp"
#include "application/PositionLedger.hpp"
#include "application/OrderRateLimiter.hpp"
#include "domain/SymbolConfig.hpp"
#include "domain/RetryPolicy.hpp"
#include "domain/ExecutionRequest.hpp"
#include "domain/Notification.hpp"
#include "domain/enums/OrderSide.hpp"
#include "ThreadSafeMap.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>

namespace crossover::application {

/**
 * @brief Функция паузы между повторами (подменяется в тестах)
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Координатор исполнения сигналов
 *
 * На каждое событие пересечения:
 * 1. Уведомляет SIGNAL_DETECTED
 * 2. Спрашивает леджер; дубль или ранний повтор подавляется
 * 3. При выключенной автоторговле возвращает SIGNAL_ONLY
 * 4. Берёт токен у лимитера и отправляет ордер (golden → BUY, death → SELL)
 * 5. Временные ошибки повторяет с экспоненциальной паузой
 * 6. Постоянную ошибку сразу отдаёт в ORDER_FAILED
 * 7. При успехе записывает исполнение в леджер и уведомляет ORDER_EXECUTED
 *
 * Ошибки канала уведомлений логируются и не прерывают исполнение.
 */
class ExecutionCoordinator : public ports::input::IExecutionCoordinator {
public:
    struct Options {
        domain::RetryPolicy retry;
        bool notifySuppressed = true;
        bool autoTrade = true;      ///< Глобальный флаг, символ может переопределить
    };

    ExecutionCoordinator(
        std::shared_ptr<PositionLedger> ledger,
        std::shared_ptr<ports::output::ITradingVenue> venue,
        std::shared_ptr<ports::output::INotificationSink> sink,
        std::shared_ptr<OrderRateLimiter> rateLimiter,
        Options options,
        Sleeper sleeper = nullptr
    ) : ledger_(std::move(ledger))
      , venue_(std::move(venue))
      , sink_(std::move(sink))
      , rateLimiter_(std::move(rateLimiter))
      , options_(std::move(options))
      , sleeper_(sleeper ? std::move(sleeper) : Sleeper([](std::chrono::milliseconds d) {
            std::this_thread::sleep_for(d);
        }))
    {
        if (options_.retry.maxAttempts < 1) {
            options_.retry.maxAttempts = 1;
        }
        std::cout << "[ExecutionCoordinator] Created, maxAttempts=" << options_.retry.maxAttempts
                  << " autoTrade=" << (options_.autoTrade ? "on" : "off") << std::endl;
    }

    /**
     * @brief Зарегистрировать параметры исполнения символа
     */
    void registerSymbol(const domain::SymbolConfig& config) {
        symbols_.insert(config.symbol, std::make_shared<domain::SymbolConfig>(config));
    }

    bool unregisterSymbol(const std::string& symbol) {
        return symbols_.erase(symbol);
    }

    domain::ExecutionOutcome handle(const domain::CrossoverEvent& event) override {
        domain::ExecutionOutcome outcome;
        outcome.symbol = event.symbol;
        outcome.direction = event.direction;

        auto config = symbols_.find(event.symbol);
        int decimals = config ? config->priceDecimals : 2;

        std::cout << "[ExecutionCoordinator] " << domain::toString(event.direction) << " cross on "
                  << event.symbol << " at " << event.timestamp.toString() << std::endl;

        notify(domain::NotificationType::SIGNAL_DETECTED, event.symbol,
               domain::toString(event.direction) + " cross on " + event.symbol + ": short " +
                   formatPrice(event.shortValue, decimals) +
                   (event.direction == domain::CrossDirection::GOLDEN ? " > " : " < ") +
                   "long " + formatPrice(event.longValue, decimals),
               eventPayload(event));

        if (!config) {
            std::cerr << "[ExecutionCoordinator] " << event.symbol << " is not registered" << std::endl;
            outcome.status = domain::OutcomeStatus::FAILED_PERMANENT;
            outcome.reason = "symbol is not configured";
            return outcome;
        }

        // 1. Леджер
        auto decision = ledger_->check(event.symbol, event.direction, event.timestamp);
        switch (decision) {
            case domain::LedgerDecision::ALLOWED:
                break;
            case domain::LedgerDecision::DUPLICATE_DIRECTION:
                return suppress(event, outcome, domain::OutcomeStatus::SUPPRESSED_DUPLICATE,
                                "last executed order has the same direction");
            case domain::LedgerDecision::WITHIN_MIN_INTERVAL:
                return suppress(event, outcome, domain::OutcomeStatus::SUPPRESSED_INTERVAL,
                                "minimum re-execution interval has not elapsed");
            case domain::LedgerDecision::UNKNOWN_SYMBOL:
                std::cerr << "[ExecutionCoordinator] Ledger has no entry for " << event.symbol << std::endl;
                outcome.status = domain::OutcomeStatus::FAILED_PERMANENT;
                outcome.reason = "symbol is not registered in ledger";
                return outcome;
        }

        // 2. Режим мониторинга
        if (!config->effectiveAutoTrade(options_.autoTrade)) {
            std::cout << "[ExecutionCoordinator] Auto-trade is off for " << event.symbol
                      << ", signal only" << std::endl;
            outcome.status = domain::OutcomeStatus::SIGNAL_ONLY;
            return outcome;
        }

        // 3. Ордер с повторами
        domain::ExecutionRequest request;
        request.symbol = event.symbol;
        request.side = domain::sideFor(event.direction);
        request.quantity = config->quantity;
        request.clientOrderId = event.symbol + "-" + domain::toString(event.direction) + "-" +
                                std::to_string(event.timestamp.toUnixMillis());

        return execute(event, request, outcome);
    }

private:
    domain::ExecutionOutcome execute(const domain::CrossoverEvent& event,
                                     const domain::ExecutionRequest& request,
                                     domain::ExecutionOutcome& outcome) {
        const auto& retry = options_.retry;
        std::string lastReason;

        for (int attempt = 1; attempt <= retry.maxAttempts; ++attempt) {
            if (rateLimiter_ && !rateLimiter_->acquire()) {
                lastReason = "order rate limiter is shut down";
                break;
            }

            outcome.attempts = attempt;
            domain::ExecutionResult result;
            try {
                result = venue_->submitOrder(request);
            } catch (const std::exception& e) {
                result = domain::ExecutionResult::transientFailure(std::string("venue error: ") + e.what());
            }

            if (result.isSuccess()) {
                ledger_->record(event.symbol, event.direction, event.timestamp, result.orderId);

                std::cout << "[ExecutionCoordinator] Executed " << domain::toString(request.side) << " "
                          << request.quantity << " " << request.symbol << " orderId=" << result.orderId
                          << " attempts=" << attempt << std::endl;

                auto payload = requestPayload(request);
                payload["orderId"] = result.orderId;
                payload["attempts"] = attempt;
                notify(domain::NotificationType::ORDER_EXECUTED, event.symbol,
                       domain::toString(request.side) + " " + formatQuantity(request.quantity) + " " +
                           request.symbol + " executed, order " + result.orderId,
                       payload);

                outcome.status = domain::OutcomeStatus::EXECUTED;
                outcome.orderId = result.orderId;
                return outcome;
            }

            lastReason = result.reason;

            if (result.isPermanent()) {
                std::cerr << "[ExecutionCoordinator] " << request.symbol << " order rejected: "
                          << result.reason << std::endl;
                return fail(request, outcome, domain::OutcomeStatus::FAILED_PERMANENT, result.reason);
            }

            std::cerr << "[ExecutionCoordinator] " << request.symbol << " attempt " << attempt << "/"
                      << retry.maxAttempts << " failed: " << result.reason << std::endl;

            if (attempt < retry.maxAttempts) {
                sleeper_(retry.backoffAfter(attempt));
            }
        }

        return fail(request, outcome, domain::OutcomeStatus::FAILED_RETRIES_EXHAUSTED,
                    "retries exhausted: " + lastReason);
    }

    domain::ExecutionOutcome suppress(const domain::CrossoverEvent& event,
                                      domain::ExecutionOutcome& outcome,
                                      domain::OutcomeStatus status,
                                      const std::string& reason) {
        std::cout << "[ExecutionCoordinator] Suppressed " << domain::toString(event.direction)
                  << " on " << event.symbol << ": " << reason << std::endl;

        outcome.status = status;
        outcome.reason = reason;

        if (options_.notifySuppressed) {
            auto payload = eventPayload(event);
            payload["status"] = domain::toString(status);
            payload["reason"] = reason;
            notify(domain::NotificationType::SIGNAL_SUPPRESSED, event.symbol,
                   domain::toString(event.direction) + " signal on " + event.symbol +
                       " suppressed: " + reason,
                   payload);
        }
        return outcome;
    }

    domain::ExecutionOutcome fail(const domain::ExecutionRequest& request,
                                  domain::ExecutionOutcome& outcome,
                                  domain::OutcomeStatus status,
                                  const std::string& reason) {
        outcome.status = status;
        outcome.reason = reason;

        auto payload = requestPayload(request);
        payload["status"] = domain::toString(status);
        payload["reason"] = reason;
        payload["attempts"] = outcome.attempts;
        notify(domain::NotificationType::ORDER_FAILED, request.symbol,
               domain::toString(request.side) + " " + formatQuantity(request.quantity) + " " +
                   request.symbol + " failed: " + reason,
               payload);
        return outcome;
    }

    void notify(domain::NotificationType type, const std::string& symbol,
                const std::string& text, nlohmann::json payload) {
        if (!sink_) {
            return;
        }
        try {
            sink_->notify(domain::Notification(type, symbol, text, std::move(payload)));
        } catch (const std::exception& e) {
            std::cerr << "[ExecutionCoordinator] Notification error (" << domain::toString(type)
                      << "): " << e.what() << std::endl;
        }
    }

    static nlohmann::json eventPayload(const domain::CrossoverEvent& event) {
        nlohmann::json j;
        j["direction"] = domain::toString(event.direction);
        j["timestamp"] = event.timestamp.toUnixMillis();
        j["shortValue"] = event.shortValue;
        j["longValue"] = event.longValue;
        return j;
    }

    static nlohmann::json requestPayload(const domain::ExecutionRequest& request) {
        nlohmann::json j;
        j["side"] = domain::toString(request.side);
        j["quantity"] = request.quantity;
        j["clientOrderId"] = request.clientOrderId;
        return j;
    }

    static std::string formatPrice(double value, int decimals) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(decimals) << value;
        return ss.str();
    }

    static std::string formatQuantity(double value) {
        std::ostringstream ss;
        ss << value;
        return ss.str();
    }

    std::shared_ptr<PositionLedger> ledger_;
    std::shared_ptr<ports::output::ITradingVenue> venue_;
    std::shared_ptr<ports::output::INotificationSink> sink_;
    std::shared_ptr<OrderRateLimiter> rateLimiter_;
    Options options_;
    Sleeper sleeper_;
    ThreadSafeMap<std::string, domain::SymbolConfig> symbols_;
};

} // namespace crossover::application
