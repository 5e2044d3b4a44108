/**
 * @file PaperTradingVenueTest.cpp
 * @brief Unit tests for PaperTradingVenue
 */

#include <gtest/gtest.h>
#include "adapters/secondary/venue/PaperTradingVenue.hpp"

using namespace crossover;
using namespace crossover::adapters::secondary;

class PaperTradingVenueTest : public ::testing::Test {
protected:
    domain::ExecutionRequest makeRequest(domain::OrderSide side, double qty = 1.5,
                                         const std::string& symbol = "BTCUSDT") {
        domain::ExecutionRequest request;
        request.symbol = symbol;
        request.side = side;
        request.quantity = qty;
        request.clientOrderId = symbol + "-test";
        return request;
    }
};

// ================================================================
// BEHAVIOR PARSING
// ================================================================

TEST_F(PaperTradingVenueTest, BehaviorFromString) {
    EXPECT_EQ(paperFillBehaviorFromString("immediate"), PaperFillBehavior::IMMEDIATE);
    EXPECT_EQ(paperFillBehaviorFromString("REJECT"), PaperFillBehavior::ALWAYS_REJECT);
    EXPECT_EQ(paperFillBehaviorFromString("always_reject"), PaperFillBehavior::ALWAYS_REJECT);
    EXPECT_EQ(paperFillBehaviorFromString("Fail_First_N"), PaperFillBehavior::FAIL_FIRST_N);
    EXPECT_THROW(paperFillBehaviorFromString("partial"), std::invalid_argument);
}

// ================================================================
// FILLS
// ================================================================

TEST_F(PaperTradingVenueTest, Immediate_FillsWithSequentialIds) {
    PaperTradingVenue venue;

    auto first = venue.submitOrder(makeRequest(domain::OrderSide::BUY));
    auto second = venue.submitOrder(makeRequest(domain::OrderSide::SELL));

    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    EXPECT_EQ(first.orderId, "paper-00000001");
    EXPECT_EQ(second.orderId, "paper-00000002");
    EXPECT_EQ(venue.fills().size(), 2u);
}

TEST_F(PaperTradingVenueTest, TracksNetPosition) {
    PaperTradingVenue venue;

    venue.submitOrder(makeRequest(domain::OrderSide::BUY, 2.0));
    venue.submitOrder(makeRequest(domain::OrderSide::SELL, 0.5));
    venue.submitOrder(makeRequest(domain::OrderSide::SELL, 1.0, "ETHUSDT"));

    EXPECT_DOUBLE_EQ(venue.position("BTCUSDT"), 1.5);
    EXPECT_DOUBLE_EQ(venue.position("ETHUSDT"), -1.0);
    EXPECT_DOUBLE_EQ(venue.position("SOLUSDT"), 0.0);
}

TEST_F(PaperTradingVenueTest, InvalidRequest_PermanentFailure) {
    PaperTradingVenue venue;

    EXPECT_TRUE(venue.submitOrder(makeRequest(domain::OrderSide::BUY, 0.0)).isPermanent());
    EXPECT_TRUE(venue.submitOrder(makeRequest(domain::OrderSide::BUY, 1.0, "")).isPermanent());
    EXPECT_TRUE(venue.fills().empty());
    EXPECT_EQ(venue.submittedCount(), 2u);
}

TEST_F(PaperTradingVenueTest, AlwaysReject_PermanentWithReason) {
    PaperTradingVenue venue(PaperFillBehavior::ALWAYS_REJECT, 0, "account frozen");

    auto result = venue.submitOrder(makeRequest(domain::OrderSide::BUY));

    EXPECT_TRUE(result.isPermanent());
    EXPECT_EQ(result.reason, "account frozen");
    EXPECT_DOUBLE_EQ(venue.position("BTCUSDT"), 0.0);
}

TEST_F(PaperTradingVenueTest, FailFirstN_TransientThenFill) {
    PaperTradingVenue venue(PaperFillBehavior::FAIL_FIRST_N, 2);

    EXPECT_TRUE(venue.submitOrder(makeRequest(domain::OrderSide::BUY)).isTransient());
    EXPECT_TRUE(venue.submitOrder(makeRequest(domain::OrderSide::BUY)).isTransient());
    EXPECT_TRUE(venue.submitOrder(makeRequest(domain::OrderSide::BUY)).isSuccess());
    EXPECT_EQ(venue.submittedCount(), 3u);
}

TEST_F(PaperTradingVenueTest, SetBehavior_SwitchesMode) {
    PaperTradingVenue venue;
    venue.setBehavior(PaperFillBehavior::ALWAYS_REJECT);
    EXPECT_TRUE(venue.submitOrder(makeRequest(domain::OrderSide::BUY)).isPermanent());

    venue.setBehavior(PaperFillBehavior::IMMEDIATE);
    EXPECT_TRUE(venue.submitOrder(makeRequest(domain::OrderSide::BUY)).isSuccess());
}
