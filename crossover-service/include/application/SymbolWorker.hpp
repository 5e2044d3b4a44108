#pragma once

#include "application/SymbolPipeline.hpp"
#include "ports/output/IPriceSource.hpp"
#include "ports/output/INotificationSink.hpp"
#include "domain/SymbolStatus.hpp"
#include "domain/Notification.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace crossover::application {

/**
 * @brief Рабочий поток одного символа
 *
 * Подписывается на цены, по одной передаёт их в SymbolPipeline.
 * Обрыв потока цен восстановимый: после паузы reconnectDelay подписка повторяется.
 * Неожиданное исключение останавливает только этот символ (FAILED + SYMBOL_ERROR).
 *
 * stop() закрывает текущий поток цен, будит паузу переподключения и ждёт поток.
 * Исполнение, начатое до stop(), доводится до конца.
 */
class SymbolWorker {
public:
    SymbolWorker(
        std::shared_ptr<SymbolPipeline> pipeline,
        std::shared_ptr<ports::output::IPriceSource> source,
        std::shared_ptr<ports::output::INotificationSink> sink,
        std::chrono::milliseconds reconnectDelay
    ) : pipeline_(std::move(pipeline))
      , source_(std::move(source))
      , sink_(std::move(sink))
      , reconnectDelay_(reconnectDelay)
      , running_(false)
      , state_(domain::WorkerState::IDLE)
      , reconnects_(0)
    {}

    ~SymbolWorker() {
        stop();
    }

    SymbolWorker(const SymbolWorker&) = delete;
    SymbolWorker& operator=(const SymbolWorker&) = delete;

    void start() {
        if (running_.exchange(true)) {
            return;
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        state_ = domain::WorkerState::RUNNING;
        thread_ = std::thread([this]() { runLoop(); });
        std::cout << "[SymbolWorker] " << symbol() << " started" << std::endl;
    }

    void stop() {
        if (running_.exchange(false)) {
            std::shared_ptr<ports::output::IPriceStream> stream;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stream = stream_;
            }
            if (stream) {
                stream->close();
            }
            cv_.notify_all();
        }

        if (thread_.joinable()) {
            thread_.join();
            if (state_ == domain::WorkerState::RUNNING) {
                state_ = domain::WorkerState::STOPPED;
            }
            std::cout << "[SymbolWorker] " << symbol() << " stopped" << std::endl;
        }
    }

    bool isRunning() const { return running_.load(); }
    domain::WorkerState state() const { return state_.load(); }
    uint64_t reconnects() const { return reconnects_.load(); }
    const std::string& symbol() const { return pipeline_->symbol(); }

    std::string lastError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastError_;
    }

private:
    void runLoop() {
        try {
            while (running_.load()) {
                auto stream = subscribe();
                if (stream) {
                    consume(*stream);
                }
                if (!running_.load()) {
                    break;
                }
                waitBeforeReconnect();
            }
        } catch (const std::exception& e) {
            fail(e.what());
        }
    }

    std::shared_ptr<ports::output::IPriceStream> subscribe() {
        std::shared_ptr<ports::output::IPriceStream> stream;
        try {
            stream = source_->subscribe(symbol());
        } catch (const std::exception& e) {
            std::cerr << "[SymbolWorker] " << symbol() << " subscribe failed: " << e.what() << std::endl;
            return nullptr;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = stream;
        if (!running_.load() && stream_) {
            stream_->close();
        }
        return stream;
    }

    void consume(ports::output::IPriceStream& stream) {
        while (running_.load()) {
            auto sample = stream.next();
            if (!sample) {
                break;
            }
            if (!running_.load()) {
                break;
            }
            pipeline_->process(*sample);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        stream_.reset();
    }

    void waitBeforeReconnect() {
        ++reconnects_;
        std::cerr << "[SymbolWorker] " << symbol() << " price stream closed, reconnecting in "
                  << reconnectDelay_.count() << "ms" << std::endl;

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, reconnectDelay_, [this]() { return !running_.load(); });
    }

    void fail(const std::string& reason) {
        std::cerr << "[SymbolWorker] " << symbol() << " FAILED: " << reason << std::endl;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = reason;
            stream_.reset();
        }
        state_ = domain::WorkerState::FAILED;
        running_ = false;

        if (!sink_) {
            return;
        }
        try {
            sink_->notify(domain::Notification(
                domain::NotificationType::SYMBOL_ERROR,
                symbol(),
                "Monitoring of " + symbol() + " stopped: " + reason,
                {{"reason", reason}}
            ));
        } catch (const std::exception& e) {
            std::cerr << "[SymbolWorker] Notification error: " << e.what() << std::endl;
        }
    }

    std::shared_ptr<SymbolPipeline> pipeline_;
    std::shared_ptr<ports::output::IPriceSource> source_;
    std::shared_ptr<ports::output::INotificationSink> sink_;
    std::chrono::milliseconds reconnectDelay_;

    std::atomic<bool> running_;
    std::atomic<domain::WorkerState> state_;
    std::atomic<uint64_t> reconnects_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::shared_ptr<ports::output::IPriceStream> stream_;
    std::string lastError_;
};

} // namespace crossover::application
