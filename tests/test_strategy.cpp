#include <gtest/gtest.h>

#include "engine/book_pressure_strategy.hpp"
#include "core/position_store.hpp"

class BookPressureTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.id = "bp_test";
        config.name = "BookPressure";
        config.symbol = "BTCUSDT";
        config.params = nlohmann::json::object();
        strategy = std::make_unique<BookPressureStrategy>(config);
    }

    static MarketView view(std::vector<OrderBookLevel> bids, std::vector<OrderBookLevel> asks) {
        MarketView v;
        v.symbol = "BTCUSDT";
        v.book.bids = std::move(bids);
        v.book.asks = std::move(asks);
        v.priceTick = 0.01;
        return v;
    }

    static Position longPosition(double stopLoss) {
        Position p;
        p.symbol = "BTCUSDT";
        p.side = PositionSide::Long;
        p.quantity = 1.0;
        p.entryPrice = 100.0;
        p.stopLoss = stopLoss;
        p.initialStopLoss = 98.5;
        p.takeProfit = 103.0;
        p.stopLossOrderId = 1;
        p.takeProfitOrderId = 2;
        p.strategyId = "bp_test";
        return p;
    }

    StrategyConfig config;
    std::unique_ptr<BookPressureStrategy> strategy;
};

TEST_F(BookPressureTest, BidHeavyBookSignalsLong) {
    auto sig = strategy->checkSignal(view({{100.0, 10.0}, {99.99, 10.0}},
                                          {{100.01, 2.0}, {100.02, 2.0}}));
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->side, PositionSide::Long);
    EXPECT_DOUBLE_EQ(sig->referencePrice, 100.0);
}

TEST_F(BookPressureTest, AskHeavyBookSignalsShort) {
    auto sig = strategy->checkSignal(view({{100.0, 1.0}},
                                          {{100.01, 5.0}, {100.02, 5.0}}));
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->side, PositionSide::Short);
    EXPECT_DOUBLE_EQ(sig->referencePrice, 100.01);
}

TEST_F(BookPressureTest, WideSpreadOrBalancedBookGivesNothing) {
    EXPECT_FALSE(strategy->checkSignal(view({{100.0, 10.0}}, {{100.2, 1.0}})).has_value());
    EXPECT_FALSE(strategy->checkSignal(view({{100.0, 2.0}}, {{100.01, 2.0}})).has_value());
    EXPECT_FALSE(strategy->checkSignal(view({}, {{100.01, 2.0}})).has_value());
}

TEST_F(BookPressureTest, TakeProfitTargetsLargestLevelInWindow) {
    MarketView v = view({{99.99, 1.0}},
                        {{100.5, 100.0}, {101.5, 50.0}, {102.0, 10.0}, {104.0, 500.0}});
    auto levels = strategy->calculateStopLossTakeProfit(100.0, PositionSide::Long, v, 0.01);
    ASSERT_TRUE(levels.has_value());
    EXPECT_NEAR(levels->stopLoss, 98.5, 1e-9);
    EXPECT_NEAR(levels->takeProfit, 101.5, 1e-9);
}

TEST_F(BookPressureTest, TakeProfitFallsBackToMaxDistance) {
    MarketView v = view({{99.99, 1.0}}, {{100.01, 1.0}});
    auto levels = strategy->calculateStopLossTakeProfit(100.0, PositionSide::Short, v, 0.01);
    ASSERT_TRUE(levels.has_value());
    EXPECT_NEAR(levels->stopLoss, 101.5, 1e-9);
    EXPECT_NEAR(levels->takeProfit, 97.0, 1e-9);
}

TEST_F(BookPressureTest, MovesStopToBreakEvenAfterOneRisk) {
    auto cmd = strategy->analyzeAndAdjust(longPosition(98.5),
                                          view({{101.6, 1.0}}, {{101.61, 1.0}}));
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->kind, AdjustmentKind::ADJUST);
    EXPECT_EQ(cmd->reason, "break-even");
    EXPECT_NEAR(*cmd->stopLoss, 100.0, 1e-9);
}

TEST_F(BookPressureTest, TrailsOnlyBeyondEntry) {
    auto cmd = strategy->analyzeAndAdjust(longPosition(100.0),
                                          view({{102.0, 1.0}}, {{102.01, 1.0}}));
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->reason, "trailing");
    EXPECT_NEAR(*cmd->stopLoss, 100.98, 1e-9);
    EXPECT_NEAR(*cmd->takeProfit, 105.06, 1e-9);

    // 100.5 * 0.99 is below the entry: keep the break-even stop
    EXPECT_FALSE(strategy->analyzeAndAdjust(longPosition(100.0),
                                            view({{100.5, 1.0}}, {{100.51, 1.0}})).has_value());
}

TEST_F(BookPressureTest, OpposingPressureClosesEarly) {
    auto cmd = strategy->analyzeAndAdjust(longPosition(98.5),
                                          view({{100.0, 5.0}}, {{100.1, 30.0}}));
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->kind, AdjustmentKind::CLOSE);
}

TEST(StrategyRegistryTest, BuiltinsAndUnknownNames) {
    StrategyRegistry registry;
    registerBuiltinStrategies(registry);
    EXPECT_TRUE(registry.contains("BookPressure"));

    StrategyConfig cfg;
    cfg.id = "bp";
    cfg.name = "BookPressure";
    cfg.symbol = "ETHUSDT";
    auto s = registry.create(cfg);
    ASSERT_TRUE(s != nullptr);
    EXPECT_EQ(s->symbol(), "ETHUSDT");

    cfg.name = "Martingale";
    EXPECT_TRUE(registry.create(cfg) == nullptr);

    EXPECT_FALSE(registry.registerFactory("BookPressure", [](const StrategyConfig&) {
        return std::unique_ptr<IStrategy>();
    }));
}

TEST(StrategyParamsTest, ParamsOverrideDefaults) {
    BookPressureParams p = parseBookPressureParams(
        nlohmann::json::parse(R"({"imbalanceLevels": 0, "tpMinSearchPct": 2, "tpMaxSearchPct": 1})"));
    EXPECT_EQ(p.imbalanceLevels, 1);
    EXPECT_DOUBLE_EQ(p.tpMaxSearchPct, 2.0);
    EXPECT_DOUBLE_EQ(p.stopLossPct, 1.5);
}
