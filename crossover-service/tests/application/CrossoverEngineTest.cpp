/**
 * @file CrossoverEngineTest.cpp
 * @brief Движок с рабочими потоками на управляемом источнике цен
 */

#include <gtest/gtest.h>
#include "application/CrossoverEngine.hpp"
#include "adapters/secondary/persistence/InMemoryLedgerRepository.hpp"
#include "../mocks/MockPriceSource.hpp"
#include "../mocks/MockTradingVenue.hpp"
#include "../mocks/MockNotificationSink.hpp"
#include <algorithm>
#include <functional>
#include <thread>

using namespace crossover;
using namespace crossover::application;
using namespace crossover::tests;

namespace {

const std::vector<double> GOLDEN_ONCE = {10, 10, 10, 10, 10, 9, 8, 12, 13, 14};
const std::vector<double> DEATH_ONCE = {10, 10, 10, 10, 10, 11, 12, 8, 7, 6};

bool waitUntil(const std::function<bool()>& predicate,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

} // namespace

class CrossoverEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<MockPriceSource>();
        venue_ = std::make_shared<MockTradingVenue>();
        sink_ = std::make_shared<MockNotificationSink>();
        repository_ = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();

        config_.credentials = {"key", "secret"};
        config_.reconnectDelay = std::chrono::milliseconds(10);
        config_.rateLimit = {1000.0, 100};
        config_.symbols.push_back(makeSymbol("SOLUSDT"));
        config_.symbols.push_back(makeSymbol("ETHUSDT"));
    }

    void TearDown() override {
        if (engine_) {
            engine_->stop();
        }
    }

    domain::SymbolConfig makeSymbol(const std::string& symbol) {
        domain::SymbolConfig config;
        config.symbol = symbol;
        config.shortWindow = 3;
        config.longWindow = 5;
        config.quantity = 1.0;
        return config;
    }

    void createEngine() {
        engine_ = std::make_shared<CrossoverEngine>(
            config_, source_, venue_, sink_, repository_, [](std::chrono::milliseconds) {});
    }

    void waitSubscribed(const std::string& symbol, int count = 1) {
        ASSERT_TRUE(waitUntil([&]() { return source_->subscribeCount(symbol) >= count; }))
            << symbol << " was not subscribed";
    }

    void pushPrices(const std::string& symbol, const std::vector<double>& prices, int64_t startMillis = 0) {
        for (size_t i = 0; i < prices.size(); ++i) {
            source_->push(domain::PriceSample{
                symbol,
                domain::Timestamp::fromUnixMillis(1700000000000 + startMillis + static_cast<int64_t>(i) * 60000),
                prices[i]});
        }
    }

    std::vector<domain::ExecutionRequest> requestsFor(const std::string& symbol) {
        std::vector<domain::ExecutionRequest> result;
        for (const auto& request : venue_->requests()) {
            if (request.symbol == symbol) {
                result.push_back(request);
            }
        }
        return result;
    }

    domain::SymbolStatus statusOf(const std::string& symbol) {
        for (const auto& status : engine_->statusReport()) {
            if (status.symbol == symbol) {
                return status;
            }
        }
        return domain::SymbolStatus{};
    }

    std::shared_ptr<MockPriceSource> source_;
    std::shared_ptr<MockTradingVenue> venue_;
    std::shared_ptr<MockNotificationSink> sink_;
    std::shared_ptr<adapters::secondary::InMemoryLedgerRepository> repository_;
    domain::EngineConfig config_;
    std::shared_ptr<CrossoverEngine> engine_;
};

// ============================================================================
// CONFIGURATION
// ============================================================================

TEST_F(CrossoverEngineTest, MissingCredentials_RefusesToStart) {
    config_.credentials.apiSecret.clear();
    createEngine();

    EXPECT_THROW(engine_->start(), domain::ConfigurationError);
    EXPECT_FALSE(engine_->isRunning());
    EXPECT_EQ(source_->subscribeCount("SOLUSDT"), 0);
}

TEST_F(CrossoverEngineTest, InvalidSymbol_DisabledOthersMonitored) {
    auto bad = makeSymbol("BADUSDT");
    bad.shortWindow = 10;
    bad.longWindow = 5;
    config_.symbols.insert(config_.symbols.begin() + 1, bad);
    createEngine();

    auto monitored = engine_->monitoredSymbols();
    EXPECT_EQ(monitored, (std::vector<std::string>{"SOLUSDT", "ETHUSDT"}));

    auto report = engine_->statusReport();
    ASSERT_EQ(report.size(), 3u);
    EXPECT_EQ(report[1].symbol, "BADUSDT");
    EXPECT_EQ(report[1].worker, domain::WorkerState::DISABLED);
    EXPECT_NE(report[1].error.find("long window"), std::string::npos);

    auto errors = sink_->ofType(domain::NotificationType::SYMBOL_ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].symbol, "BADUSDT");
}

TEST_F(CrossoverEngineTest, DuplicateSymbol_SecondDisabled) {
    config_.symbols.push_back(makeSymbol("SOLUSDT"));
    createEngine();

    EXPECT_EQ(engine_->monitoredSymbols().size(), 2u);
    EXPECT_EQ(sink_->count(domain::NotificationType::SYMBOL_ERROR), 1);
}

// ============================================================================
// WORKERS
// ============================================================================

TEST_F(CrossoverEngineTest, MultiSymbol_EachSymbolTradesIndependently) {
    createEngine();
    engine_->start();
    waitSubscribed("SOLUSDT");
    waitSubscribed("ETHUSDT");

    pushPrices("SOLUSDT", GOLDEN_ONCE);
    pushPrices("ETHUSDT", DEATH_ONCE);

    ASSERT_TRUE(waitUntil([&]() { return venue_->submitCallCount() == 2; }));

    auto sol = requestsFor("SOLUSDT");
    auto eth = requestsFor("ETHUSDT");
    ASSERT_EQ(sol.size(), 1u);
    ASSERT_EQ(eth.size(), 1u);
    EXPECT_EQ(sol[0].side, domain::OrderSide::BUY);
    EXPECT_EQ(eth[0].side, domain::OrderSide::SELL);

    ASSERT_TRUE(waitUntil([&]() { return statusOf("ETHUSDT").counters.samples == 10; }));
    EXPECT_EQ(statusOf("SOLUSDT").position, domain::PositionState::WARM_LONG);
    EXPECT_EQ(statusOf("ETHUSDT").position, domain::PositionState::WARM_SHORT);
}

TEST_F(CrossoverEngineTest, StreamDrop_ResubscribesAndContinues) {
    createEngine();
    engine_->start();
    waitSubscribed("SOLUSDT");

    pushPrices("SOLUSDT", {10, 10, 10, 10, 10});
    ASSERT_TRUE(waitUntil([&]() { return statusOf("SOLUSDT").counters.samples == 5; }));

    source_->dropStream("SOLUSDT");
    waitSubscribed("SOLUSDT", 2);

    pushPrices("SOLUSDT", {9, 8, 12, 13, 14}, 5 * 60000);

    ASSERT_TRUE(waitUntil([&]() { return venue_->submitCallCount() == 1; }));
    EXPECT_EQ(requestsFor("SOLUSDT")[0].side, domain::OrderSide::BUY);
}

TEST_F(CrossoverEngineTest, SubscribeFailure_RetriedWithoutFailingSymbol) {
    source_->failSubscriptions("ETHUSDT");
    createEngine();
    engine_->start();

    waitSubscribed("ETHUSDT", 3);

    EXPECT_NE(statusOf("ETHUSDT").worker, domain::WorkerState::FAILED);
    EXPECT_EQ(sink_->count(domain::NotificationType::SYMBOL_ERROR), 0);
}

TEST_F(CrossoverEngineTest, WorkerFailure_IsolatedToSymbol) {
    source_->breakStreams("ETHUSDT");
    createEngine();
    engine_->start();

    ASSERT_TRUE(waitUntil([&]() { return statusOf("ETHUSDT").worker == domain::WorkerState::FAILED; }));
    EXPECT_EQ(statusOf("ETHUSDT").error, "corrupted price frame");
    EXPECT_EQ(engine_->monitoredSymbols(), (std::vector<std::string>{"SOLUSDT"}));

    auto errors = sink_->ofType(domain::NotificationType::SYMBOL_ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].symbol, "ETHUSDT");

    waitSubscribed("SOLUSDT");
    pushPrices("SOLUSDT", GOLDEN_ONCE);
    ASSERT_TRUE(waitUntil([&]() { return venue_->submitCallCount() == 1; }));
}

TEST_F(CrossoverEngineTest, Stop_JoinsWorkersAndIgnoresLaterPrices) {
    createEngine();
    engine_->start();
    waitSubscribed("SOLUSDT");
    waitSubscribed("ETHUSDT");

    engine_->stop();

    EXPECT_FALSE(engine_->isRunning());
    for (const auto& status : engine_->statusReport()) {
        EXPECT_EQ(status.worker, domain::WorkerState::STOPPED) << status.symbol;
    }

    EXPECT_FALSE(source_->push(domain::PriceSample{
        "SOLUSDT", domain::Timestamp::fromUnixMillis(1700000000000), 10.0}));
    EXPECT_EQ(statusOf("SOLUSDT").counters.samples, 0u);
}

TEST_F(CrossoverEngineTest, Restart_LedgerSurvivesEngineInstances) {
    createEngine();
    engine_->start();
    waitSubscribed("SOLUSDT");
    pushPrices("SOLUSDT", GOLDEN_ONCE);
    ASSERT_TRUE(waitUntil([&]() { return venue_->submitCallCount() == 1; }));
    engine_->stop();

    source_ = std::make_shared<MockPriceSource>();
    createEngine();
    engine_->start();
    waitSubscribed("SOLUSDT");
    pushPrices("SOLUSDT", GOLDEN_ONCE);

    ASSERT_TRUE(waitUntil([&]() { return statusOf("SOLUSDT").counters.suppressed == 1; }));
    EXPECT_EQ(venue_->submitCallCount(), 1);
}

TEST_F(CrossoverEngineTest, Stop_ReleasesWorkerWaitingForOrderToken) {
    config_.rateLimit = {0.001, 1};
    createEngine();
    engine_->start();
    waitSubscribed("SOLUSDT");
    waitSubscribed("ETHUSDT");

    pushPrices("SOLUSDT", GOLDEN_ONCE);
    ASSERT_TRUE(waitUntil([&]() { return venue_->submitCallCount() == 1; }));
    pushPrices("ETHUSDT", DEATH_ONCE);
    ASSERT_TRUE(waitUntil([&]() { return sink_->count(domain::NotificationType::SIGNAL_DETECTED) == 2; }));

    auto started = std::chrono::steady_clock::now();
    engine_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));

    EXPECT_EQ(venue_->submitCallCount(), 1);
    auto failed = sink_->ofType(domain::NotificationType::ORDER_FAILED);
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].symbol, "ETHUSDT");
    EXPECT_NE(failed[0].payload["reason"].get<std::string>().find("rate limiter"), std::string::npos);
}

TEST_F(CrossoverEngineTest, StopThenStart_OrdersFlowAgain) {
    createEngine();
    engine_->start();
    waitSubscribed("SOLUSDT");
    engine_->stop();

    engine_->start();
    waitSubscribed("SOLUSDT", 2);
    pushPrices("SOLUSDT", GOLDEN_ONCE);

    ASSERT_TRUE(waitUntil([&]() { return venue_->submitCallCount() == 1; }));
    EXPECT_EQ(sink_->count(domain::NotificationType::ORDER_FAILED), 0);
}

TEST_F(CrossoverEngineTest, DefaultSleeper_ConstructsFromPortsOnly) {
    engine_ = std::make_shared<CrossoverEngine>(config_, source_, venue_, sink_, repository_);
    engine_->start();
    waitSubscribed("SOLUSDT");

    pushPrices("SOLUSDT", GOLDEN_ONCE);

    ASSERT_TRUE(waitUntil([&]() { return venue_->submitCallCount() == 1; }));
    EXPECT_EQ(requestsFor("SOLUSDT")[0].side, domain::OrderSide::BUY);
}
