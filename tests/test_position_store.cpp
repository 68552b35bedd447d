#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

#include "core/position_store.hpp"
#include "exchange/i_exchange_gateway.hpp"

class PositionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "bt_positions_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json";
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    static Position longBtc() {
        Position p;
        p.symbol = "BTCUSDT";
        p.side = PositionSide::Long;
        p.quantity = 0.01;
        p.entryPrice = 50000.0;
        p.stopLoss = 49000.0;
        p.takeProfit = 52000.0;
        p.initialStopLoss = 49000.0;
        p.stopLossOrderId = 11;
        p.takeProfitOrderId = 12;
        p.strategyId = "bp_btc";
        return p;
    }

    static ExchangePosition remote(const std::string& symbol, PositionSide side, double qty) {
        ExchangePosition ep;
        ep.symbol = symbol;
        ep.side = side;
        ep.quantity = qty;
        return ep;
    }

    std::string path;
};

TEST_F(PositionStoreTest, RefusesPositionWithoutBrackets) {
    PositionStore store(path);
    Position p = longBtc();
    p.takeProfitOrderId = 0;
    EXPECT_FALSE(store.set(p));

    p = longBtc();
    p.quantity = 0.0;
    EXPECT_FALSE(store.set(p));
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(PositionStoreTest, PersistsAcrossInstances) {
    {
        PositionStore store(path);
        ASSERT_TRUE(store.set(longBtc()));
    }
    PositionStore reloaded(path);
    ASSERT_TRUE(reloaded.load());
    auto p = reloaded.get("BTCUSDT");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->side, PositionSide::Long);
    EXPECT_DOUBLE_EQ(p->quantity, 0.01);
    EXPECT_DOUBLE_EQ(p->initialStopLoss, 49000.0);
    EXPECT_EQ(p->stopLossOrderId, 11);
    EXPECT_EQ(p->strategyId, "bp_btc");
}

TEST_F(PositionStoreTest, CloseRemovesAndReturnsRecord) {
    PositionStore store(path);
    store.set(longBtc());
    auto closed = store.close("BTCUSDT");
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->takeProfitOrderId, 12);
    EXPECT_FALSE(store.has("BTCUSDT"));
    EXPECT_FALSE(store.close("BTCUSDT").has_value());
}

TEST_F(PositionStoreTest, UpdateBracketOrdersKeepsUnsetFields) {
    PositionStore store(path);
    store.set(longBtc());
    ASSERT_TRUE(store.updateBracketOrders("BTCUSDT", 21, std::nullopt, 50000.0));
    auto p = store.get("BTCUSDT");
    EXPECT_EQ(p->stopLossOrderId, 21);
    EXPECT_EQ(p->takeProfitOrderId, 12);
    EXPECT_DOUBLE_EQ(p->stopLoss, 50000.0);
    EXPECT_DOUBLE_EQ(p->takeProfit, 52000.0);
    EXPECT_DOUBLE_EQ(p->initialStopLoss, 49000.0);

    EXPECT_FALSE(store.updateBracketOrders("ETHUSDT", 1, 2));
}

TEST_F(PositionStoreTest, LoadSkipsBadRecordsAndAcceptsNullIds) {
    {
        std::ofstream f(path);
        f << R"({
            "BTCUSDT": {"side": "LONG", "quantity": 0.5, "entry_price": 100,
                        "stop_loss": 95, "take_profit": 110,
                        "sl_order_id": null, "tp_order_id": 7},
            "ETHUSDT": {"side": "SIDEWAYS", "quantity": 1},
            "SOLUSDT": {"side": "SHORT", "quantity": 0}
        })";
    }
    PositionStore store(path);
    ASSERT_TRUE(store.load());
    EXPECT_EQ(store.count(), 1u);
    auto p = store.get("BTCUSDT");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->stopLossOrderId, 0);
    EXPECT_EQ(p->takeProfitOrderId, 7);
    EXPECT_DOUBLE_EQ(p->initialStopLoss, 95.0);
}

TEST_F(PositionStoreTest, CorruptFileStartsEmpty) {
    {
        std::ofstream f(path);
        f << "{ not json";
    }
    PositionStore store(path);
    EXPECT_FALSE(store.load());
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(PositionStoreTest, ReconcileAlignsWithExchange) {
    PositionStore store(path);
    store.set(longBtc());

    Position eth = longBtc();
    eth.symbol = "ETHUSDT";
    store.set(eth);

    Position sol = longBtc();
    sol.symbol = "SOLUSDT";
    store.set(sol);

    std::vector<ExchangePosition> remotePositions = {
        remote("BTCUSDT", PositionSide::Long, 0.02),   // quantity drifted
        remote("SOLUSDT", PositionSide::Short, 0.01),  // wrong side
        remote("XRPUSDT", PositionSide::Long, 10.0),   // opened by hand
        remote("ADAUSDT", PositionSide::Long, 0.0)     // flat entries are ignored
    };
    ReconcileReport report = store.reconcile(remotePositions);

    ASSERT_EQ(report.removedStale.size(), 1u);
    EXPECT_EQ(report.removedStale[0], "ETHUSDT");
    ASSERT_EQ(report.sideMismatch.size(), 1u);
    EXPECT_EQ(report.sideMismatch[0], "SOLUSDT");
    ASSERT_EQ(report.untracked.size(), 1u);
    EXPECT_EQ(report.untracked[0], "XRPUSDT");
    ASSERT_EQ(report.quantityCorrected.size(), 1u);

    EXPECT_EQ(store.count(), 1u);
    EXPECT_DOUBLE_EQ(store.get("BTCUSDT")->quantity, 0.02);
    EXPECT_FALSE(store.has("XRPUSDT"));
}

TEST_F(PositionStoreTest, ClearAllEmptiesFileToo) {
    {
        PositionStore store(path);
        store.set(longBtc());
        store.clearAll();
        EXPECT_EQ(store.count(), 0u);
    }
    PositionStore reloaded(path);
    reloaded.load();
    EXPECT_EQ(reloaded.count(), 0u);
}

TEST_F(PositionStoreTest, PositionsNewerThanTheFetchAreLeftAlone) {
    PositionStore store(path);
    Position fresh = longBtc();
    fresh.openedAtMs = 2000;
    store.set(fresh);

    Position old = longBtc();
    old.symbol = "ETHUSDT";
    old.openedAtMs = 500;
    store.set(old);

    // the exchange list was requested at t=1000 and knows neither
    ReconcileReport report = store.reconcile({}, 1000);

    EXPECT_TRUE(store.has("BTCUSDT"));
    EXPECT_FALSE(store.has("ETHUSDT"));
    ASSERT_EQ(report.skippedInFlight.size(), 1u);
    EXPECT_EQ(report.skippedInFlight[0], "BTCUSDT");
}

TEST_F(PositionStoreTest, OpenTimeIsStampedAndPersisted) {
    long long stamped;
    {
        PositionStore store(path);
        store.set(longBtc());
        stamped = store.get("BTCUSDT")->openedAtMs;
        EXPECT_GT(stamped, 0);
    }
    PositionStore reloaded(path);
    reloaded.load();
    EXPECT_EQ(reloaded.get("BTCUSDT")->openedAtMs, stamped);
}
