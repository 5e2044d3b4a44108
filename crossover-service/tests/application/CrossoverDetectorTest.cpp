/**
 * @file CrossoverDetectorTest.cpp
 * @brief Unit tests for CrossoverDetector
 */

#include <gtest/gtest.h>
#include "application/CrossoverDetector.hpp"

using namespace crossover;
using namespace crossover::application;

class CrossoverDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        detector_.addSymbol("BTCUSDT");
    }

    domain::MAState warmState(double shortValue, double longValue, int64_t millis = 1000) {
        domain::MAState state;
        state.symbol = "BTCUSDT";
        state.shortValue = shortValue;
        state.longValue = longValue;
        state.count = 26;
        state.warm = true;
        state.lastTimestamp = domain::Timestamp::fromUnixMillis(millis);
        return state;
    }

    CrossoverDetector detector_;
};

TEST_F(CrossoverDetectorTest, ColdState_Ignored) {
    auto state = warmState(10, 9);
    state.warm = false;

    EXPECT_FALSE(detector_.observe(state).has_value());
    EXPECT_FALSE(detector_.currentSign("BTCUSDT").has_value());
}

TEST_F(CrossoverDetectorTest, FirstWarmUpdate_OnlySeeds) {
    EXPECT_FALSE(detector_.observe(warmState(10, 9)).has_value());
    EXPECT_EQ(detector_.currentSign("BTCUSDT"), 1);
}

TEST_F(CrossoverDetectorTest, NegativeToPositive_Golden) {
    detector_.observe(warmState(9, 10, 1000));

    auto event = detector_.observe(warmState(11, 10, 2000));

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->direction, domain::CrossDirection::GOLDEN);
    EXPECT_EQ(event->symbol, "BTCUSDT");
    EXPECT_EQ(event->timestamp.toUnixMillis(), 2000);
    EXPECT_DOUBLE_EQ(event->shortValue, 11.0);
    EXPECT_DOUBLE_EQ(event->longValue, 10.0);
}

TEST_F(CrossoverDetectorTest, PositiveToNegative_Death) {
    detector_.observe(warmState(11, 10));

    auto event = detector_.observe(warmState(9, 10, 2000));

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->direction, domain::CrossDirection::DEATH);
}

TEST_F(CrossoverDetectorTest, SameSign_NoEvent) {
    detector_.observe(warmState(11, 10, 1000));

    EXPECT_FALSE(detector_.observe(warmState(12, 10, 2000)).has_value());
    EXPECT_FALSE(detector_.observe(warmState(10.5, 10, 3000)).has_value());
}

TEST_F(CrossoverDetectorTest, Equality_RetainsPreviousSign) {
    detector_.observe(warmState(9, 10, 1000));

    EXPECT_FALSE(detector_.observe(warmState(10, 10, 2000)).has_value());
    EXPECT_EQ(detector_.currentSign("BTCUSDT"), -1);

    // -1 → 0 → +1 всё равно пересечение
    auto event = detector_.observe(warmState(11, 10, 3000));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->direction, domain::CrossDirection::GOLDEN);
}

TEST_F(CrossoverDetectorTest, EqualitySeed_FirstNonZeroSignSeedsWithoutEvent) {
    detector_.observe(warmState(10, 10, 1000));
    EXPECT_EQ(detector_.currentSign("BTCUSDT"), 0);

    EXPECT_FALSE(detector_.observe(warmState(9, 10, 2000)).has_value());
    EXPECT_EQ(detector_.currentSign("BTCUSDT"), -1);

    auto event = detector_.observe(warmState(11, 10, 3000));
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->direction, domain::CrossDirection::GOLDEN);
}

TEST_F(CrossoverDetectorTest, FloatingPointNoise_TreatedAsEquality) {
    EXPECT_EQ(CrossoverDetector::signOf(0.1 + 0.2, 0.3), 0);
    EXPECT_EQ(CrossoverDetector::signOf(60000.0 + 1e-9, 60000.0), 0);
    EXPECT_EQ(CrossoverDetector::signOf(60000.01, 60000.0), 1);
    EXPECT_EQ(CrossoverDetector::signOf(0.00001, 0.00002), -1);
}

TEST_F(CrossoverDetectorTest, EmitsOnlyOnStrictFlips) {
    std::vector<std::pair<double, double>> sequence = {
        {9, 10}, {11, 10}, {12, 10}, {10, 10}, {8, 10}, {7, 10}, {11, 10}
    };
    std::vector<domain::CrossDirection> events;
    int64_t t = 1000;
    for (const auto& [s, l] : sequence) {
        auto event = detector_.observe(warmState(s, l, t));
        t += 1000;
        if (event) {
            events.push_back(event->direction);
        }
    }

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0], domain::CrossDirection::GOLDEN);
    EXPECT_EQ(events[1], domain::CrossDirection::DEATH);
    EXPECT_EQ(events[2], domain::CrossDirection::GOLDEN);
}

TEST_F(CrossoverDetectorTest, SymbolsTrackedSeparately) {
    detector_.addSymbol("ETHUSDT");
    detector_.observe(warmState(9, 10));

    auto eth = warmState(11, 10);
    eth.symbol = "ETHUSDT";
    EXPECT_FALSE(detector_.observe(eth).has_value());

    EXPECT_EQ(detector_.currentSign("BTCUSDT"), -1);
    EXPECT_EQ(detector_.currentSign("ETHUSDT"), 1);
}
