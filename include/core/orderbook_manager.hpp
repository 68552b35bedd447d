#ifndef ORDERBOOK_MANAGER_HPP
#define ORDERBOOK_MANAGER_HPP

#include <string>
#include <mutex>
#include <memory>
#include <unordered_map>
#include <set>
#include <deque>
#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <cstdint>
#include <condition_variable>

#include "core/orderbook.hpp"
#include "core/book_update_signal.hpp"

class IExchangeGateway;

struct BookFeedSettings {
    int snapshotDepth{1000};
    size_t bufferCapacity{1000};
    bool enforceSequence{true};
    double staleBookSec{30.0};
    double refreshIntervalSec{5.0};
};

/**
 * Owns one OrderBookSynchronizer per traded symbol.
 *
 * - onDepthUpdate() is fed by the depth stream thread
 * - a resync worker fetches REST snapshots whenever a book asks for one
 * - a refresh thread resyncs books that went quiet or never finished syncing
 * - monitoring loops block in waitForUpdate() and read copies via getOrderBook()
 */
class OrderBookManager {
public:
    OrderBookManager(IExchangeGateway* gateway, const BookFeedSettings& settings);
    ~OrderBookManager();

    // register before start(); unknown symbols are ignored by onDepthUpdate
    void addSymbol(const std::string& symbol);
    std::vector<std::string> symbols() const;

    void start();
    void stop();

    // Depth stream entry point.
    DiffResult onDepthUpdate(const std::string& symbol, const DepthUpdate& update);

    // Schedule a snapshot fetch (deduplicated per symbol).
    void requestResync(const std::string& symbol);

    // Stream reconnected: everything received so far is suspect.
    void resetSymbols(const std::vector<std::string>& symbols);
    void resetAll();

    /**
     * Fetch and apply one snapshot synchronously. Used by the worker and
     * by tests.
     */
    bool resyncNow(const std::string& symbol);

    OrderBookData getOrderBook(const std::string& symbol, size_t maxLevels = 0) const;
    bool isSynced(const std::string& symbol) const;
    BookState state(const std::string& symbol) const;

    /**
     * True if no depth message arrived for `symbol` within maxStaleMs
     * (or never).
     */
    bool isStale(const std::string& symbol, double maxStaleMs) const;

    /**
     * Block until `symbol`'s book changed since generation `lastSeen` or the
     * timeout elapsed. Each waiter keeps its own `lastSeen`.
     */
    bool waitForUpdate(const std::string& symbol, uint64_t& lastSeen,
                       std::chrono::milliseconds timeout);
    uint64_t updateGeneration(const std::string& symbol) const;

    // Extra observer called after every applied diff (paper fills).
    void setUpdateListener(std::function<void(const std::string&)> listener);

private:
    struct SymbolBook {
        explicit SymbolBook(const std::string& symbol, size_t cap, bool enforce)
            : sync(symbol, cap, enforce) {}

        mutable std::mutex mutex;
        OrderBookSynchronizer sync;
        BookUpdateSignal signal;
        std::chrono::steady_clock::time_point lastMsgTime{};
        bool everReceived{false};
    };

    SymbolBook* find(const std::string& symbol) const;

    void resyncWorkerLoop();
    // caller holds resyncMutex_
    bool takeReadyResyncLocked(std::string& symbol);
    std::optional<std::chrono::steady_clock::time_point> nextResyncDueLocked() const;
    void refreshLoop();

private:
    IExchangeGateway* gateway_;
    BookFeedSettings settings_;

    std::unordered_map<std::string, std::unique_ptr<SymbolBook>> books_;
    mutable std::mutex booksMutex_;

    // resync queue
    std::deque<std::string> resyncQueue_;
    std::set<std::string> resyncQueued_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> resyncNotBefore_;
    std::mutex resyncMutex_;
    std::condition_variable resyncCv_;

    std::function<void(const std::string&)> updateListener_;

    std::atomic<bool> running_{false};
    std::thread resyncThread_;
    std::thread refreshThread_;
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

#endif // ORDERBOOK_MANAGER_HPP
