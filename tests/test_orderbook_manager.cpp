#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <atomic>

#include "core/orderbook_manager.hpp"
#include "core/book_update_signal.hpp"
#include "fake_gateway.hpp"

class OrderBookManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        DepthSnapshot s;
        s.lastUpdateId = 100;
        s.bids = {{50.0, 1.0}, {49.9, 2.0}};
        s.asks = {{50.1, 1.5}};
        gateway.snapshots["BTCUSDT"] = s;

        settings.bufferCapacity = 16;
        settings.refreshIntervalSec = 0.2;
        manager = std::make_unique<OrderBookManager>(&gateway, settings);
        manager->addSymbol("BTCUSDT");
    }

    static DepthUpdate diff(long long U, long long u, long long pu, double bidPx, double bidQty) {
        DepthUpdate d;
        d.firstId = U;
        d.lastId = u;
        d.prevLastId = pu;
        d.bidUpdates = {{bidPx, bidQty}};
        return d;
    }

    FakeGateway gateway;
    BookFeedSettings settings;
    std::unique_ptr<OrderBookManager> manager;
};

TEST_F(OrderBookManagerTest, UnknownSymbolIsIgnored) {
    EXPECT_EQ(manager->onDepthUpdate("DOGEUSDT", diff(1, 1, -1, 1.0, 1.0)), DiffResult::Stale);
    EXPECT_EQ(manager->state("DOGEUSDT"), BookState::Uninitialized);
}

TEST_F(OrderBookManagerTest, UnsyncedBookReadsEmpty) {
    EXPECT_EQ(manager->onDepthUpdate("BTCUSDT", diff(99, 101, -1, 50.0, 3.0)),
              DiffResult::ResyncRequired);
    EXPECT_FALSE(manager->isSynced("BTCUSDT"));
    EXPECT_TRUE(manager->getOrderBook("BTCUSDT").bids.empty());
}

TEST_F(OrderBookManagerTest, ResyncNowAppliesSnapshotAndBufferedDiffs) {
    manager->onDepthUpdate("BTCUSDT", diff(99, 101, -1, 50.0, 3.0));
    ASSERT_TRUE(manager->resyncNow("BTCUSDT"));

    EXPECT_TRUE(manager->isSynced("BTCUSDT"));
    OrderBookData book = manager->getOrderBook("BTCUSDT");
    ASSERT_EQ(book.bids.size(), 2u);
    EXPECT_DOUBLE_EQ(book.bids[0].quantity, 3.0);
    EXPECT_EQ(book.lastUpdateId, 101);

    EXPECT_EQ(manager->onDepthUpdate("BTCUSDT", diff(102, 102, 101, 49.9, 0.0)), DiffResult::Applied);
    EXPECT_EQ(manager->getOrderBook("BTCUSDT").bids.size(), 1u);
}

TEST_F(OrderBookManagerTest, SnapshotFailureLeavesBookUnsynced) {
    gateway.snapshotOk = false;
    EXPECT_FALSE(manager->resyncNow("BTCUSDT"));
    EXPECT_FALSE(manager->isSynced("BTCUSDT"));
}

TEST_F(OrderBookManagerTest, ResetSymbolsDropsSyncedBook) {
    ASSERT_TRUE(manager->resyncNow("BTCUSDT"));
    manager->resetSymbols({"BTCUSDT"});
    EXPECT_EQ(manager->state("BTCUSDT"), BookState::Uninitialized);
    EXPECT_TRUE(manager->getOrderBook("BTCUSDT").asks.empty());
}

TEST_F(OrderBookManagerTest, AppliedDiffWakesWaiterAndListener) {
    std::atomic<int> calls{0};
    manager->setUpdateListener([&calls](const std::string& s) {
        if (s == "BTCUSDT") ++calls;
    });
    ASSERT_TRUE(manager->resyncNow("BTCUSDT"));
    uint64_t seen = 0;
    manager->waitForUpdate("BTCUSDT", seen, std::chrono::milliseconds(1)); // consume the resync wake-up

    EXPECT_FALSE(manager->waitForUpdate("BTCUSDT", seen, std::chrono::milliseconds(10)));
    manager->onDepthUpdate("BTCUSDT", diff(101, 101, -1, 50.0, 2.0));
    EXPECT_TRUE(manager->waitForUpdate("BTCUSDT", seen, std::chrono::milliseconds(10)));
    EXPECT_EQ(calls.load(), 1);
    EXPECT_FALSE(manager->isStale("BTCUSDT", 60000.0));
}

TEST_F(OrderBookManagerTest, WorkerResyncsAfterGap) {
    manager->start();
    manager->onDepthUpdate("BTCUSDT", diff(99, 101, -1, 50.0, 3.0));

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!manager->isSynced("BTCUSDT") && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(manager->isSynced("BTCUSDT"));

    // gap: the worker fetches the same snapshot (id 100), which cannot cover u=205
    manager->onDepthUpdate("BTCUSDT", diff(204, 205, 203, 50.0, 1.0));
    EXPECT_FALSE(manager->isSynced("BTCUSDT"));
    manager->stop();
    EXPECT_GE(gateway.snapshotCalls.load(), 1);
}

TEST_F(OrderBookManagerTest, FailingSymbolDoesNotDelayOthers) {
    manager->addSymbol("ETHUSDT"); // no snapshot: every fetch fails
    manager->start();

    manager->requestResync("ETHUSDT");
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (gateway.snapshotCalls.load() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_GE(gateway.snapshotCalls.load(), 1);

    // ETHUSDT now waits out its backoff; BTCUSDT must not queue behind it
    auto requested = std::chrono::steady_clock::now();
    manager->requestResync("BTCUSDT");
    while (!manager->isSynced("BTCUSDT") &&
           std::chrono::steady_clock::now() - requested < std::chrono::seconds(3)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    auto took = std::chrono::steady_clock::now() - requested;
    manager->stop();

    EXPECT_TRUE(manager->isSynced("BTCUSDT"));
    EXPECT_LT(took, std::chrono::milliseconds(500));
    EXPECT_FALSE(manager->isSynced("ETHUSDT"));
}

TEST(BookUpdateSignalTest, NotificationsCoalesce) {
    BookUpdateSignal sig;
    uint64_t seen = 0;
    for (int i = 0; i < 1000; ++i) sig.notify();

    EXPECT_TRUE(sig.waitFor(seen, std::chrono::milliseconds(10)));
    // one wake-up for the whole burst
    EXPECT_FALSE(sig.waitFor(seen, std::chrono::milliseconds(10)));
}

TEST(BookUpdateSignalTest, EveryWaiterSeesTheUpdate) {
    BookUpdateSignal sig;
    std::atomic<int> woken{0};
    std::atomic<int> waiting{0};

    auto waiter = [&] {
        uint64_t seen = sig.generation();
        ++waiting;
        if (sig.waitFor(seen, std::chrono::seconds(5))) ++woken;
    };
    std::thread a(waiter);
    std::thread b(waiter);
    while (waiting.load() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto started = std::chrono::steady_clock::now();
    sig.notify();
    a.join();
    b.join();

    EXPECT_EQ(woken.load(), 2);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
}

TEST(BookUpdateSignalTest, ShutdownReleasesWaiter) {
    BookUpdateSignal sig;
    std::atomic<bool> returned{false};
    bool result = true;

    std::thread waiter([&] {
        uint64_t seen = 0;
        result = sig.waitFor(seen, std::chrono::seconds(10));
        returned = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    sig.shutdown();
    waiter.join();

    EXPECT_TRUE(returned);
    EXPECT_FALSE(result);
    EXPECT_TRUE(sig.isShutdown());
}
