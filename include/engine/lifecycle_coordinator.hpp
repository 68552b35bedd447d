#ifndef LIFECYCLE_COORDINATOR_HPP
#define LIFECYCLE_COORDINATOR_HPP

#include <string>
#include <map>
#include <set>
#include <deque>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>
#include <vector>
#include <unordered_map>

#include "core/trade_types.hpp"
#include "core/orderbook.hpp"
#include "core/position_store.hpp"
#include "core/pending_symbols.hpp"
#include "exchange/i_exchange_gateway.hpp"
#include "engine/strategy.hpp"

struct CoordinatorSettings {
    std::string quoteAsset{"USDT"};
    int leverage{5};
    double riskPerTradePct{1.0};
    size_t maxActiveTrades{3};
    double pendingEntryTimeoutSec{300.0};
};

// An entry order sent but not yet filled.
struct PendingEntry {
    std::string clientOrderId;
    long long orderId{0};              // 0 until the exchange acknowledged it
    std::string symbol;
    PositionSide side{PositionSide::Long};
    std::string strategyId;
    double quantity{0.0};
    double referencePrice{0.0};        // price the order was sent at
    std::optional<double> estimatedStopLoss;
    std::optional<double> estimatedTakeProfit;
    std::chrono::steady_clock::time_point createdAt{};
    bool cancelRequested{false};
    bool cancelConfirmed{false};       // exchange accepted the cancel or no longer knows the order
};

enum class SymbolPhase { Idle, PendingEntry, Open };

const char* toString(SymbolPhase phase);

/**
 * Drives every symbol through Idle -> PendingEntry -> Open -> Idle.
 *
 * Entry decisions come from the monitoring loops (evaluate), fills and
 * cancels from the user stream (onOrderUpdate). Both take the symbol's lane
 * mutex, so the events of one symbol are handled strictly one at a time
 * while different symbols proceed in parallel.
 */
class OrderLifecycleCoordinator {
public:
    using BookProvider = std::function<OrderBookData(const std::string&)>;

    OrderLifecycleCoordinator(IExchangeGateway* gateway,
                              PositionStore* store,
                              PendingSymbolTable* pending,
                              BookProvider books,
                              const CoordinatorSettings& settings);

    // Both must be known before a symbol can be traded.
    void setSymbolRules(const SymbolRules& rules);
    bool hasSymbolRules(const std::string& symbol) const;
    void registerStrategy(IStrategy* strategy);

    // Monitoring loop entry point.
    void evaluate(IStrategy& strategy, const MarketView& view);

    bool tryEnter(IStrategy& strategy, const MarketView& view);

    // User stream (or paper dispatcher) entry point.
    void onOrderUpdate(const OrderUpdateEvent& event);

    /**
     * Replace both brackets. The new pair is placed first; the old pair is
     * cancelled only once both new orders are live. If just one of the new
     * orders went through it is cancelled again and the old pair stays.
     */
    bool adjustBrackets(const std::string& symbol, double newStopLoss, double newTakeProfit);

    // Cancel everything, flatten with a reduce-only market order, forget the position.
    bool closePosition(const std::string& symbol, const std::string& reason);

    /**
     * Cancel entries older than the timeout, retrying on later calls until the
     * exchange confirms. Entries are dropped after twice the timeout, and only
     * once their cancel was confirmed.
     */
    size_t expireStalePendingEntries(std::chrono::steady_clock::time_point now);

    /**
     * Reconcile the store symbol by symbol under each symbol's lane. Symbols
     * with an entry in flight are skipped; so are positions opened after
     * `fetchStartedMs`, when the exchange list was requested.
     */
    ReconcileReport reconcilePositions(const std::vector<ExchangePosition>& exchangePositions,
                                       long long fetchStartedMs);

    SymbolPhase phaseOf(const std::string& symbol) const;
    size_t pendingEntryCount() const;
    std::optional<PendingEntry> findPendingEntry(const std::string& clientOrderId) const;
    size_t consistencyViolations() const { return consistencyViolations_; }

    // bt_<strategy>_<SYMBOL>_<ms><seq>, at most 36 characters
    std::string makeClientOrderId(const std::string& strategyId, const std::string& symbol);

private:
    std::mutex& laneFor(const std::string& symbol);

    // *Locked: caller holds the symbol's lane mutex
    bool tryEnterLocked(IStrategy& strategy, const MarketView& view);
    bool adjustBracketsLocked(const std::string& symbol, double newStopLoss, double newTakeProfit);
    bool closePositionLocked(const std::string& symbol, const std::string& reason);

    void handleEntryUpdate(const PendingEntry& entry, const OrderUpdateEvent& event);
    void handleEntryFill(const PendingEntry& entry, double fillPrice, double filledQty);
    void handleBracketUpdate(const Position& position, const OrderUpdateEvent& event);

    // a fill for one of our entry orders that is no longer pending
    bool isUntrackedEntryFill(const OrderUpdateEvent& event) const;
    void handleUntrackedEntryFill(const OrderUpdateEvent& event);

    // Opposite-side reduce-only market order after a failed bracket placement.
    void rollbackEntry(const PendingEntry& entry, double filledQty,
                       const OrderResult& slResult, const OrderResult& tpResult,
                       const std::string& why);

    bool cancelTolerant(const std::string& symbol, long long orderId, const char* what);
    // resolved=false: the entry was given up on, so a later fill is an orphan
    void finishPendingEntry(const std::string& clientOrderId, const std::string& symbol,
                            bool resolved = true);

    std::optional<SymbolRules> rulesFor(const std::string& symbol) const;
    IStrategy* strategyById(const std::string& id) const;
    MarketView viewFor(const std::string& symbol) const;

    OrderRequest bracketRequest(const std::string& symbol, PositionSide side, OrderType type,
                                double quantity, double stopPrice, const std::string& strategyId);

private:
    IExchangeGateway* gateway_;
    PositionStore* store_;
    PendingSymbolTable* pending_;
    BookProvider books_;
    CoordinatorSettings settings_;

    mutable std::mutex lanesMutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> lanes_;

    mutable std::mutex pendingMutex_;
    std::map<std::string, PendingEntry> pendingEntries_; // by clientOrderId
    std::set<std::string> resolvedEntryIds_;
    std::deque<std::string> resolvedEntryOrder_;         // oldest first, bounded

    mutable std::mutex rulesMutex_;
    std::unordered_map<std::string, SymbolRules> rules_;

    mutable std::mutex strategiesMutex_;
    std::unordered_map<std::string, IStrategy*> strategies_;

    std::atomic<size_t> consistencyViolations_{0};
    std::atomic<unsigned> clientSeq_{0};
};

#endif // LIFECYCLE_COORDINATOR_HPP
