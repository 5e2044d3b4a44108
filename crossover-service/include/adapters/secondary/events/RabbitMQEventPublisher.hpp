#pragma once

#include "ports/output/IEventPublisher.hpp"
#include "adapters/secondary/events/PendingMessageBuffer.hpp"
#include "settings/RabbitMQSettings.hpp"
#include <amqpcpp.h>
#include <amqpcpp/libboostasio.h>
#include <boost/asio.hpp>
#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

namespace crossover::adapters::secondary {

/**
 * @brief Публикация уведомлений в RabbitMQ
 *
 * Архитектура:
 * - Exchange: topic (crossover.events)
 * - Routing keys: signal.detected, order.executed, order.failed, ...
 *
 * Соединение и канал живут в потоке io_context. publish() из рабочих
 * потоков символов передаёт сообщение в этот поток через boost::asio::post.
 * До объявления exchange сообщения ждут в ограниченном буфере.
 * Если объявление не удалось или поток io_context завершился,
 * публикатор считается сломанным и дальнейшие сообщения отбрасываются.
 *
 * @example
 * ```cpp
 * auto settings = std::make_shared<RabbitMQSettings>();
 * auto publisher = std::make_shared<RabbitMQEventPublisher>(settings);
 * publisher->start();
 * publisher->publish("order.executed", R"({"symbol":"BTCUSDT"})");
 * ```
 */
class RabbitMQEventPublisher : public ports::output::IEventPublisher {
public:
    explicit RabbitMQEventPublisher(std::shared_ptr<settings::RabbitMQSettings> settings)
        : settings_(std::move(settings))
        , running_(false)
        , failed_(false)
        , pending_(MAX_PENDING_MESSAGES)
        , ioContext_()
        , handler_(ioContext_)
    {
        exchangeName_ = settings_->getExchange();
        std::cout << "[RabbitMQEventPublisher] Created for "
                  << settings_->getHost() << ":" << settings_->getPort()
                  << " vhost=" << settings_->getVhost()
                  << " exchange=" << exchangeName_ << std::endl;
    }

    ~RabbitMQEventPublisher() override {
        stop();
    }

    RabbitMQEventPublisher(const RabbitMQEventPublisher&) = delete;
    RabbitMQEventPublisher& operator=(const RabbitMQEventPublisher&) = delete;

    // =========================================================================
    // IEventPublisher
    // =========================================================================

    void publish(const std::string& routingKey, const std::string& message) override {
        if (!running_) {
            std::cerr << "[RabbitMQEventPublisher] Cannot publish: not started" << std::endl;
            return;
        }
        if (failed_) {
            std::cerr << "[RabbitMQEventPublisher] Publisher failed, dropping " << routingKey << std::endl;
            return;
        }

        boost::asio::post(ioContext_, [this, routingKey, message]() {
            if (!exchangeReady_) {
                pending_.push(routingKey, message);
                return;
            }
            publishNow(routingKey, message);
        });
    }

    // =========================================================================
    // Жизненный цикл
    // =========================================================================

    void start() {
        if (running_.exchange(true)) {
            return;
        }

        workGuard_.emplace(boost::asio::make_work_guard(ioContext_));
        workerThread_ = std::thread([this]() {
            try {
                connect();
                ioContext_.run();
            } catch (const std::exception& e) {
                std::cerr << "[RabbitMQEventPublisher] Worker error: " << e.what() << std::endl;
                markFailed("worker thread exited");
                return;
            }
            if (running_) {
                markFailed("io_context stopped unexpectedly");
            }
        });

        std::cout << "[RabbitMQEventPublisher] Started" << std::endl;
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }

        workGuard_.reset();
        ioContext_.stop();
        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        channel_.reset();
        connection_.reset();

        std::cout << "[RabbitMQEventPublisher] Stopped" << std::endl;
    }

private:
    void connect() {
        connection_ = std::make_unique<AMQP::TcpConnection>(&handler_, AMQP::Address(settings_->getAddress()));
        channel_ = std::make_unique<AMQP::TcpChannel>(connection_.get());

        channel_->onError([this](const char* msg) {
            std::cerr << "[RabbitMQEventPublisher] Channel error: " << msg << std::endl;
            if (!exchangeReady_) {
                markFailed("channel closed before exchange was declared");
            }
        });

        channel_->declareExchange(exchangeName_, AMQP::topic, AMQP::durable)
            .onSuccess([this]() {
                exchangeReady_ = true;
                std::cout << "[RabbitMQEventPublisher] Exchange declared: " << exchangeName_ << std::endl;
                for (const auto& [routingKey, message] : pending_.drain()) {
                    publishNow(routingKey, message);
                }
            })
            .onError([this](const char* msg) {
                std::cerr << "[RabbitMQEventPublisher] Exchange error: " << msg << std::endl;
                markFailed("exchange declaration failed");
            });
    }

    // Вызывается только из потока io_context
    void markFailed(const std::string& reason) {
        if (failed_.exchange(true)) {
            return;
        }
        std::cerr << "[RabbitMQEventPublisher] Publishing disabled: " << reason << std::endl;
        pending_.close();
    }

    void publishNow(const std::string& routingKey, const std::string& message) {
        try {
            channel_->publish(exchangeName_, routingKey, message);
            std::cout << "[RabbitMQEventPublisher] Published " << routingKey
                      << ": " << message.substr(0, 100) << "..." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[RabbitMQEventPublisher] Publish error: " << e.what() << std::endl;
        }
    }

    std::shared_ptr<settings::RabbitMQSettings> settings_;
    std::string exchangeName_;

    static constexpr size_t MAX_PENDING_MESSAGES = 1000;

    std::atomic<bool> running_;
    std::atomic<bool> failed_;
    bool exchangeReady_ = false;    ///< Меняется только в потоке io_context
    PendingMessageBuffer pending_;  ///< До объявления exchange
    boost::asio::io_context ioContext_;
    AMQP::LibBoostAsioHandler handler_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;

    std::unique_ptr<AMQP::TcpConnection> connection_;
    std::unique_ptr<AMQP::TcpChannel> channel_;

    std::thread workerThread_;
};

} // namespace crossover::adapters::secondary
