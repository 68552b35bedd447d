#include <gtest/gtest.h>
#include <cstdio>
#include <thread>
#include <chrono>

#include "engine/trade_monitor.hpp"
#include "engine/lifecycle_coordinator.hpp"
#include "core/orderbook_manager.hpp"
#include "fake_gateway.hpp"
#include "scripted_strategy.hpp"

class TradeMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "bt_monitor_" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json";
        std::remove(path.c_str());
        store = std::make_unique<PositionStore>(path);

        DepthSnapshot s;
        s.lastUpdateId = 10;
        s.bids = {{100.0, 5.0}};
        s.asks = {{100.1, 5.0}};
        gateway.snapshots["BTCUSDT"] = s;

        books = std::make_unique<OrderBookManager>(&gateway, BookFeedSettings{});
        books->addSymbol("BTCUSDT");

        coordinator = std::make_unique<OrderLifecycleCoordinator>(
            &gateway, store.get(), &pending,
            [this](const std::string& sym) { return books->getOrderBook(sym); },
            CoordinatorSettings{});
        SymbolRules rules;
        rules.symbol = "BTCUSDT";
        rules.priceTick = 0.1;
        rules.quantityStep = 0.001;
        coordinator->setSymbolRules(rules);

        strategy = std::make_unique<ScriptedStrategy>("scripted", "BTCUSDT");
        strategy->signal = EntrySignal{PositionSide::Long, 100.0};
        coordinator->registerStrategy(strategy.get());

        monitor = std::make_unique<TradeMonitor>(books.get(), coordinator.get());
        monitor->addStrategy(strategy.get(), 0.1);
    }

    void TearDown() override {
        monitor->stop();
        books->stop();
        std::remove(path.c_str());
    }

    std::string path;
    FakeGateway gateway;
    std::unique_ptr<PositionStore> store;
    PendingSymbolTable pending;
    std::unique_ptr<OrderBookManager> books;
    std::unique_ptr<OrderLifecycleCoordinator> coordinator;
    std::unique_ptr<ScriptedStrategy> strategy;
    std::unique_ptr<TradeMonitor> monitor;
};

TEST_F(TradeMonitorTest, UnsyncedBookIsNotEvaluated) {
    EXPECT_FALSE(monitor->evaluateOnce(*strategy, 0.1));
    EXPECT_EQ(strategy->signalChecks.load(), 0);
}

TEST_F(TradeMonitorTest, SyncedBookReachesTheCoordinator) {
    ASSERT_TRUE(books->resyncNow("BTCUSDT"));
    EXPECT_TRUE(monitor->evaluateOnce(*strategy, 0.1));
    EXPECT_EQ(gateway.createdOfType(OrderType::LIMIT).size(), 1u);
}

TEST_F(TradeMonitorTest, LoopEvaluatesOnBookUpdates) {
    ASSERT_TRUE(books->resyncNow("BTCUSDT"));
    monitor->start();

    DepthUpdate d;
    d.firstId = 11;
    d.lastId = 11;
    d.bidUpdates = {{100.0, 6.0}};
    books->onDepthUpdate("BTCUSDT", d);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (gateway.createdOfType(OrderType::LIMIT).empty() &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    monitor->stop();
    EXPECT_EQ(gateway.createdOfType(OrderType::LIMIT).size(), 1u);
    EXPECT_EQ(monitor->strategyCount(), 1u);
}
