#include <gtest/gtest.h>
#include "core/trade_math.hpp"
#include "core/trade_types.hpp"

TEST(TradeMathTest, FloorToStepAbsorbsBinaryNoise) {
    EXPECT_DOUBLE_EQ(TradeMath::floorToStep(0.3, 0.1), 0.30000000000000004);
    EXPECT_NEAR(TradeMath::floorToStep(0.12345, 0.001), 0.123, 1e-12);
    EXPECT_DOUBLE_EQ(TradeMath::floorToStep(0.0009, 0.001), 0.0);
    EXPECT_DOUBLE_EQ(TradeMath::floorToStep(1.5, 0.0), 1.5);
}

TEST(TradeMathTest, RoundToTick) {
    EXPECT_NEAR(TradeMath::roundToTick(98.196, 0.1), 98.2, 1e-9);
    EXPECT_NEAR(TradeMath::roundToTick(98.149, 0.1), 98.1, 1e-9);
    EXPECT_DOUBLE_EQ(TradeMath::roundToTick(12.345, 0.0), 12.345);
}

TEST(TradeMathTest, FormatDecimalStripsTrailingZeros) {
    EXPECT_EQ(TradeMath::formatDecimal(0.5, 3), "0.5");
    EXPECT_EQ(TradeMath::formatDecimal(50000.0, 2), "50000");
    EXPECT_EQ(TradeMath::formatDecimal(0.0012345, 4), "0.0012");
    EXPECT_EQ(TradeMath::formatDecimal(-0.00001, 2), "0");
}

TEST(TradeMathTest, OrderQuantityFromRiskAndLeverage) {
    // 1000 * 2% = 20 margin, x10 = 200 notional, / 50000 = 0.004
    EXPECT_NEAR(TradeMath::computeOrderQuantity(1000.0, 2.0, 10, 50000.0, 0.001), 0.004, 1e-12);
    EXPECT_NEAR(TradeMath::computeOrderQuantity(1000.0, 1.0, 5, 100.1, 0.001), 0.499, 1e-12);
    EXPECT_DOUBLE_EQ(TradeMath::computeOrderQuantity(10.0, 1.0, 1, 50000.0, 0.001), 0.0);
    EXPECT_DOUBLE_EQ(TradeMath::computeOrderQuantity(1000.0, 1.0, 0, 100.0, 0.001), 0.0);
}

TEST(TradeTypesTest, SidesAndParsing) {
    EXPECT_EQ(entrySide(PositionSide::Long), OrderSide::BUY);
    EXPECT_EQ(exitSide(PositionSide::Long), OrderSide::SELL);
    EXPECT_EQ(exitSide(PositionSide::Short), OrderSide::BUY);

    PositionSide side;
    EXPECT_TRUE(parsePositionSide("SHORT", side));
    EXPECT_EQ(side, PositionSide::Short);
    EXPECT_FALSE(parsePositionSide("flat", side));

    OrderType type;
    EXPECT_TRUE(parseOrderType("TAKE_PROFIT_MARKET", type));
    EXPECT_EQ(type, OrderType::TAKE_PROFIT_MARKET);
    EXPECT_FALSE(parseOrderType("TRAILING_STOP_MARKET", type));
}
