#include "engine/trade_monitor.hpp"
#include "engine/lifecycle_coordinator.hpp"
#include "core/orderbook_manager.hpp"

#include <iostream>
#include <chrono>

TradeMonitor::TradeMonitor(OrderBookManager* books, OrderLifecycleCoordinator* coordinator)
    : books_(books)
    , coordinator_(coordinator)
{
}

TradeMonitor::~TradeMonitor() {
    stop();
}

void TradeMonitor::addStrategy(IStrategy* strategy, double priceTick) {
    if (!strategy) return;
    entries_.push_back(Entry{strategy, priceTick});
}

void TradeMonitor::start() {
    if (running_.exchange(true)) return;
    for (const auto& e : entries_) {
        threads_.emplace_back([this, e]() { monitorLoop(e); });
    }
    std::cout << "[MONITOR] " << threads_.size() << " monitoring loops started.\n";
}

void TradeMonitor::stop() {
    if (!running_.exchange(false)) return;
    // waitForUpdate times out after a second at most
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

bool TradeMonitor::evaluateOnce(IStrategy& strategy, double priceTick) {
    if (!books_->isSynced(strategy.symbol())) {
        return false;
    }
    MarketView view;
    view.symbol    = strategy.symbol();
    view.book      = books_->getOrderBook(strategy.symbol());
    view.priceTick = priceTick;
    if (view.book.bids.empty() || view.book.asks.empty()) {
        return false;
    }
    coordinator_->evaluate(strategy, view);
    return true;
}

void TradeMonitor::monitorLoop(Entry entry) {
    const std::string symbol = entry.strategy->symbol();
    uint64_t seen = books_->updateGeneration(symbol);
    while (running_) {
        try {
            books_->waitForUpdate(symbol, seen, std::chrono::seconds(1));
            if (!running_) break;
            evaluateOnce(*entry.strategy, entry.priceTick);
        } catch (const std::exception& e) {
            std::cerr << "[MONITOR][" << symbol << "][" << entry.strategy->id()
                      << "] error: " << e.what() << "\n";
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
}
