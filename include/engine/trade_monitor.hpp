#ifndef TRADE_MONITOR_HPP
#define TRADE_MONITOR_HPP

#include <string>
#include <vector>
#include <thread>
#include <atomic>

#include "engine/strategy.hpp"

class OrderBookManager;
class OrderLifecycleCoordinator;

/**
 * One monitoring thread per strategy. Each wakes on its symbol's book
 * update (or after a second), hands the coordinator a copy of the book
 * and goes back to sleep.
 */
class TradeMonitor {
public:
    TradeMonitor(OrderBookManager* books, OrderLifecycleCoordinator* coordinator);
    ~TradeMonitor();

    // add before start()
    void addStrategy(IStrategy* strategy, double priceTick);

    void start();
    void stop();

    size_t strategyCount() const { return entries_.size(); }

    // One evaluation pass for `strategy`. False if its book is not synced.
    bool evaluateOnce(IStrategy& strategy, double priceTick);

private:
    struct Entry {
        IStrategy* strategy;
        double priceTick;
    };

    void monitorLoop(Entry entry);

private:
    OrderBookManager* books_;
    OrderLifecycleCoordinator* coordinator_;
    std::vector<Entry> entries_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

#endif // TRADE_MONITOR_HPP
