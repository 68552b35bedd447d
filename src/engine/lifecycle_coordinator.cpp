#include "engine/lifecycle_coordinator.hpp"
#include "core/trade_math.hpp"

#include <iostream>
#include <future>
#include <vector>
#include <cctype>
#include <iomanip>
#include <sstream>

static const size_t MAX_CLIENT_ORDER_ID = 36;
static const char* CLIENT_ORDER_PREFIX = "bt_";
static const size_t MAX_RESOLVED_ENTRY_IDS = 1024;

static long long nowMs() {
    return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// SL and TP must sit on opposite sides of the reference price
static bool levelsValid(PositionSide side, double reference, double sl, double tp) {
    if (sl <= 0.0 || tp <= 0.0) return false;
    if (side == PositionSide::Long) {
        return sl < reference && reference < tp;
    }
    return tp < reference && reference < sl;
}

const char* toString(SymbolPhase phase) {
    switch (phase) {
        case SymbolPhase::Idle:         return "Idle";
        case SymbolPhase::PendingEntry: return "PendingEntry";
        case SymbolPhase::Open:         return "Open";
    }
    return "Idle";
}

OrderLifecycleCoordinator::OrderLifecycleCoordinator(IExchangeGateway* gateway,
                                                     PositionStore* store,
                                                     PendingSymbolTable* pending,
                                                     BookProvider books,
                                                     const CoordinatorSettings& settings)
    : gateway_(gateway)
    , store_(store)
    , pending_(pending)
    , books_(std::move(books))
    , settings_(settings)
{
}

void OrderLifecycleCoordinator::setSymbolRules(const SymbolRules& rules) {
    std::lock_guard<std::mutex> lk(rulesMutex_);
    rules_[rules.symbol] = rules;
}

bool OrderLifecycleCoordinator::hasSymbolRules(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(rulesMutex_);
    return rules_.count(symbol) > 0;
}

std::optional<SymbolRules> OrderLifecycleCoordinator::rulesFor(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(rulesMutex_);
    auto it = rules_.find(symbol);
    if (it == rules_.end()) return std::nullopt;
    return it->second;
}

void OrderLifecycleCoordinator::registerStrategy(IStrategy* strategy) {
    if (!strategy) return;
    std::lock_guard<std::mutex> lk(strategiesMutex_);
    strategies_[strategy->id()] = strategy;
}

IStrategy* OrderLifecycleCoordinator::strategyById(const std::string& id) const {
    std::lock_guard<std::mutex> lk(strategiesMutex_);
    auto it = strategies_.find(id);
    return it == strategies_.end() ? nullptr : it->second;
}

MarketView OrderLifecycleCoordinator::viewFor(const std::string& symbol) const {
    MarketView view;
    view.symbol = symbol;
    if (books_) {
        view.book = books_(symbol);
    }
    auto rules = rulesFor(symbol);
    view.priceTick = rules ? rules->priceTick : 0.0;
    return view;
}

std::mutex& OrderLifecycleCoordinator::laneFor(const std::string& symbol) {
    std::lock_guard<std::mutex> lk(lanesMutex_);
    auto& slot = lanes_[symbol];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

std::string OrderLifecycleCoordinator::makeClientOrderId(const std::string& strategyId,
                                                         const std::string& symbol)
{
    std::string strat;
    for (char c : strategyId) {
        if (std::isalnum((unsigned char)c)) strat.push_back(c);
        if (strat.size() == 8) break;
    }

    std::ostringstream tail;
    tail << nowMs() << std::setw(3) << std::setfill('0') << (clientSeq_++ % 1000);
    std::string t = tail.str();

    std::string prefix = CLIENT_ORDER_PREFIX + strat + "_" + symbol + "_";
    if (prefix.size() > 24) {
        prefix = prefix.substr(0, 23) + "_";
    }
    size_t room = MAX_CLIENT_ORDER_ID - prefix.size();
    if (t.size() > room) {
        t = t.substr(t.size() - room); // the fast-moving digits
    }
    return prefix + t;
}

//------------------------------------------
// Monitoring loop side
//------------------------------------------
void OrderLifecycleCoordinator::evaluate(IStrategy& strategy, const MarketView& view) {
    const std::string& symbol = strategy.symbol();
    std::lock_guard<std::mutex> lane(laneFor(symbol));

    auto pos = store_->get(symbol);
    if (pos) {
        if (!pos->strategyId.empty() && pos->strategyId != strategy.id()) {
            return; // owned by another strategy on the same symbol
        }
        auto cmd = strategy.analyzeAndAdjust(*pos, view);
        if (!cmd) return;

        if (cmd->kind == AdjustmentKind::CLOSE) {
            closePositionLocked(symbol, cmd->reason.empty() ? "strategy close" : cmd->reason);
            return;
        }
        double sl = cmd->stopLoss.value_or(pos->stopLoss);
        double tp = cmd->takeProfit.value_or(pos->takeProfit);
        if (sl != pos->stopLoss || tp != pos->takeProfit) {
            std::cout << "[COORD][" << symbol << "] adjust (" << cmd->reason << "): SL "
                      << pos->stopLoss << " => " << sl << ", TP " << pos->takeProfit
                      << " => " << tp << "\n";
            adjustBracketsLocked(symbol, sl, tp);
        }
        return;
    }

    if (!pending_->contains(symbol)) {
        tryEnterLocked(strategy, view);
    }
}

bool OrderLifecycleCoordinator::tryEnter(IStrategy& strategy, const MarketView& view) {
    std::lock_guard<std::mutex> lane(laneFor(strategy.symbol()));
    return tryEnterLocked(strategy, view);
}

bool OrderLifecycleCoordinator::tryEnterLocked(IStrategy& strategy, const MarketView& view) {
    const std::string symbol = strategy.symbol();

    if (store_->has(symbol) || pending_->contains(symbol)) {
        return false;
    }
    auto rules = rulesFor(symbol);
    if (!rules) {
        return false;
    }
    if (view.book.bids.empty() || view.book.asks.empty()) {
        return false;
    }

    auto signal = strategy.checkSignal(view);
    if (!signal) {
        return false;
    }

    if (!pending_->tryAcquire(symbol, store_->count(), settings_.maxActiveTrades)) {
        std::cout << "[COORD][" << symbol << "] signal skipped: symbol pending or "
                  << settings_.maxActiveTrades << " trades active\n";
        return false;
    }

    // from here on every exit must release the marker
    const PositionSide side = signal->side;
    const OrderType type = strategy.entryOrderType();
    double tick = rules->priceTick;

    double price;
    if (type == OrderType::MARKET) {
        price = side == PositionSide::Long ? view.book.asks.front().price
                                           : view.book.bids.front().price;
    } else {
        double offset = strategy.entryOffsetTicks() * tick;
        price = side == PositionSide::Long ? signal->referencePrice + offset
                                           : signal->referencePrice - offset;
    }
    price = TradeMath::roundToTick(price, tick);

    double balance = 0.0;
    std::string reason;
    if (!gateway_->getAccountBalance(settings_.quoteAsset, balance, &reason)) {
        std::cerr << "[COORD][" << symbol << "] no balance (" << reason << "), entry aborted\n";
        pending_->release(symbol);
        return false;
    }

    double qty = TradeMath::computeOrderQuantity(balance, settings_.riskPerTradePct,
                                                 settings_.leverage, price, rules->quantityStep);
    if (qty <= 0.0) {
        std::cerr << "[COORD][" << symbol << "] quantity rounds to zero (balance=" << balance
                  << " price=" << price << "), entry aborted\n";
        pending_->release(symbol);
        return false;
    }

    PendingEntry entry;
    entry.clientOrderId  = makeClientOrderId(strategy.id(), symbol);
    entry.symbol         = symbol;
    entry.side           = side;
    entry.strategyId     = strategy.id();
    entry.quantity       = qty;
    entry.referencePrice = price;
    entry.createdAt      = std::chrono::steady_clock::now();
    if (auto est = strategy.calculateStopLossTakeProfit(price, side, view, tick)) {
        entry.estimatedStopLoss   = est->stopLoss;
        entry.estimatedTakeProfit = est->takeProfit;
    }

    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        pendingEntries_[entry.clientOrderId] = entry;
    }

    OrderRequest req;
    req.symbol        = symbol;
    req.side          = entrySide(side);
    req.type          = type;
    req.quantity      = qty;
    req.price         = type == OrderType::LIMIT ? price : 0.0;
    req.clientOrderId = entry.clientOrderId;

    std::cout << "[COORD][" << symbol << "] " << toString(side) << " entry via "
              << toString(type) << " qty=" << qty << " @" << price
              << " (" << entry.clientOrderId << ")\n";

    OrderResult res = gateway_->createOrder(req);
    if (!res.success) {
        std::cerr << "[COORD][" << symbol << "] entry submit failed ("
                  << toString(res.error) << "): " << res.message << "\n";
        // a timed-out submit may still be live: a later fill must not look resolved
        finishPendingEntry(entry.clientOrderId, symbol, /*resolved=*/false);
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        auto it = pendingEntries_.find(entry.clientOrderId);
        if (it != pendingEntries_.end()) {
            it->second.orderId = res.orderId;
        }
    }
    return true;
}

//------------------------------------------
// Order events
//------------------------------------------
void OrderLifecycleCoordinator::onOrderUpdate(const OrderUpdateEvent& event) {
    std::lock_guard<std::mutex> lane(laneFor(event.symbol));

    std::optional<PendingEntry> entry;
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        auto it = pendingEntries_.find(event.clientOrderId);
        if (it != pendingEntries_.end()) {
            entry = it->second;
        }
    }
    if (entry) {
        handleEntryUpdate(*entry, event);
        return;
    }

    auto pos = store_->get(event.symbol);
    if (pos && event.orderId != 0 &&
        (event.orderId == pos->stopLossOrderId || event.orderId == pos->takeProfitOrderId)) {
        handleBracketUpdate(*pos, event);
        return;
    }
    if (isUntrackedEntryFill(event)) {
        handleUntrackedEntryFill(event);
    }
    // anything else: replaced brackets, flatten orders, manual orders
}

bool OrderLifecycleCoordinator::isUntrackedEntryFill(const OrderUpdateEvent& event) const {
    if (event.reduceOnly || event.filledQuantity <= 0.0) return false;
    if (event.clientOrderId.rfind(CLIENT_ORDER_PREFIX, 0) != 0) return false;
    {
        // repeated event for an entry already handled
        std::lock_guard<std::mutex> lk(pendingMutex_);
        if (resolvedEntryIds_.count(event.clientOrderId)) return false;
    }
    switch (event.status) {
        case OrderStatus::FILLED:
        case OrderStatus::CANCELED:
        case OrderStatus::EXPIRED:
        case OrderStatus::REJECTED:
            return true;
        default:
            return false;
    }
}

void OrderLifecycleCoordinator::handleUntrackedEntryFill(const OrderUpdateEvent& event) {
    // one of our entries, already forgotten: nothing protects this quantity
    PendingEntry orphan;
    orphan.clientOrderId = event.clientOrderId;
    orphan.orderId       = event.orderId;
    orphan.symbol        = event.symbol;
    orphan.side          = event.side == OrderSide::BUY ? PositionSide::Long : PositionSide::Short;
    orphan.quantity      = event.filledQuantity;

    OrderResult notPlaced;
    notPlaced.message = "not placed";
    rollbackEntry(orphan, event.filledQuantity, notPlaced, notPlaced,
                  "fill for untracked entry " + event.clientOrderId);
}

void OrderLifecycleCoordinator::handleEntryUpdate(const PendingEntry& entry,
                                                  const OrderUpdateEvent& event)
{
    switch (event.status) {
        case OrderStatus::NEW:
        case OrderStatus::PARTIALLY_FILLED: {
            std::lock_guard<std::mutex> lk(pendingMutex_);
            auto it = pendingEntries_.find(entry.clientOrderId);
            if (it != pendingEntries_.end() && it->second.orderId == 0) {
                it->second.orderId = event.orderId;
            }
            return;
        }

        case OrderStatus::FILLED: {
            double px  = event.avgFillPrice > 0.0 ? event.avgFillPrice : entry.referencePrice;
            double qty = event.filledQuantity > 0.0 ? event.filledQuantity : entry.quantity;
            handleEntryFill(entry, px, qty);
            return;
        }

        case OrderStatus::CANCELED:
        case OrderStatus::EXPIRED:
        case OrderStatus::REJECTED:
            if (event.filledQuantity > 0.0) {
                // cancelled after a partial fill: protect what was filled
                std::cerr << "[COORD][" << entry.symbol << "] entry " << toString(event.status)
                          << " after partial fill of " << event.filledQuantity << "\n";
                double px = event.avgFillPrice > 0.0 ? event.avgFillPrice : entry.referencePrice;
                handleEntryFill(entry, px, event.filledQuantity);
                return;
            }
            std::cout << "[COORD][" << entry.symbol << "] entry " << entry.clientOrderId
                      << " " << toString(event.status) << ", back to idle\n";
            finishPendingEntry(entry.clientOrderId, entry.symbol);
            return;

        case OrderStatus::UNKNOWN:
            return;
    }
}

void OrderLifecycleCoordinator::handleEntryFill(const PendingEntry& entry,
                                                double fillPrice,
                                                double filledQty)
{
    const std::string& symbol = entry.symbol;
    auto rules = rulesFor(symbol);
    double tick = rules ? rules->priceTick : 0.0;

    std::cout << "[COORD][" << symbol << "] entry filled: " << toString(entry.side)
              << " qty=" << filledQty << " @" << fillPrice
              << " (sent @" << entry.referencePrice << ")\n";

    // levels come from the actual fill, never from the pre-fill estimate
    std::optional<BracketLevels> levels;
    IStrategy* strategy = strategyById(entry.strategyId);
    if (strategy) {
        levels = strategy->calculateStopLossTakeProfit(fillPrice, entry.side, viewFor(symbol), tick);
    }

    OrderResult notPlaced;
    notPlaced.message = "not placed";

    if (!levels) {
        rollbackEntry(entry, filledQty, notPlaced, notPlaced,
                      strategy ? "strategy returned no bracket levels" : "strategy not registered");
        finishPendingEntry(entry.clientOrderId, symbol);
        return;
    }

    double sl = TradeMath::roundToTick(levels->stopLoss, tick);
    double tp = TradeMath::roundToTick(levels->takeProfit, tick);
    if (!levelsValid(entry.side, fillPrice, sl, tp)) {
        std::ostringstream why;
        why << "bracket levels on the wrong side of the fill: SL=" << sl << " TP=" << tp;
        rollbackEntry(entry, filledQty, notPlaced, notPlaced, why.str());
        finishPendingEntry(entry.clientOrderId, symbol);
        return;
    }

    OrderRequest slReq = bracketRequest(symbol, entry.side, OrderType::STOP_MARKET,
                                        filledQty, sl, entry.strategyId);
    OrderRequest tpReq = bracketRequest(symbol, entry.side, OrderType::TAKE_PROFIT_MARKET,
                                        filledQty, tp, entry.strategyId);

    auto slFuture = std::async(std::launch::async, [this, slReq]() { return gateway_->createOrder(slReq); });
    auto tpFuture = std::async(std::launch::async, [this, tpReq]() { return gateway_->createOrder(tpReq); });
    OrderResult slRes = slFuture.get();
    OrderResult tpRes = tpFuture.get();

    if (slRes.success && tpRes.success) {
        Position p;
        p.symbol            = symbol;
        p.side              = entry.side;
        p.quantity          = filledQty;
        p.entryPrice        = fillPrice;
        p.stopLoss          = sl;
        p.takeProfit        = tp;
        p.initialStopLoss   = sl;
        p.stopLossOrderId   = slRes.orderId;
        p.takeProfitOrderId = tpRes.orderId;
        p.strategyId        = entry.strategyId;
        store_->set(p);

        std::cout << "[COORD][" << symbol << "] position open, SL=" << sl << " (#" << slRes.orderId
                  << ") TP=" << tp << " (#" << tpRes.orderId << ")\n";
    } else {
        rollbackEntry(entry, filledQty, slRes, tpRes, "bracket placement failed");
    }
    finishPendingEntry(entry.clientOrderId, symbol);
}

void OrderLifecycleCoordinator::rollbackEntry(const PendingEntry& entry,
                                              double filledQty,
                                              const OrderResult& slResult,
                                              const OrderResult& tpResult,
                                              const std::string& why)
{
    const std::string& symbol = entry.symbol;
    ++consistencyViolations_;

    std::cerr << "[CRITICAL][" << symbol << "] " << why << " (SL: "
              << (slResult.success ? "ok" : slResult.message) << ", TP: "
              << (tpResult.success ? "ok" : tpResult.message) << ") => flattening "
              << filledQty << "\n";

    if (slResult.success) cancelTolerant(symbol, slResult.orderId, "rollback SL");
    if (tpResult.success) cancelTolerant(symbol, tpResult.orderId, "rollback TP");

    OrderRequest flat;
    flat.symbol        = symbol;
    flat.side          = exitSide(entry.side);
    flat.type          = OrderType::MARKET;
    flat.quantity      = filledQty;
    flat.reduceOnly    = true;
    flat.clientOrderId = makeClientOrderId(entry.strategyId, symbol);

    OrderResult res = gateway_->createOrder(flat);
    if (res.success || res.error == ExchangeErrorKind::ReduceOnlyRejected) {
        std::cerr << "[CRITICAL][" << symbol << "] rollback complete, position flat\n";
    } else {
        std::cerr << "[CRITICAL][" << symbol << "] ROLLBACK FAILED (" << res.message
                  << "): " << toString(entry.side) << " " << filledQty
                  << " is open WITHOUT protection, manual action required\n";
    }
}

void OrderLifecycleCoordinator::handleBracketUpdate(const Position& position,
                                                    const OrderUpdateEvent& event)
{
    const std::string& symbol = position.symbol;
    bool isStop = event.orderId == position.stopLossOrderId;
    const char* name = isStop ? "stop-loss" : "take-profit";

    switch (event.status) {
        case OrderStatus::FILLED: {
            long long sibling = isStop ? position.takeProfitOrderId : position.stopLossOrderId;
            std::cout << "[COORD][" << symbol << "] " << name << " filled @" << event.avgFillPrice
                      << ", cancelling sibling #" << sibling << "\n";
            cancelTolerant(symbol, sibling, isStop ? "take-profit" : "stop-loss");
            store_->close(symbol);
            return;
        }
        case OrderStatus::CANCELED:
        case OrderStatus::EXPIRED:
        case OrderStatus::REJECTED:
            std::cerr << "[COORD][" << symbol << "] " << name << " #" << event.orderId << " "
                      << toString(event.status)
                      << " while the position is open; reconciliation will settle it\n";
            return;
        default:
            return;
    }
}

//------------------------------------------
// Adjust / close
//------------------------------------------
bool OrderLifecycleCoordinator::adjustBrackets(const std::string& symbol,
                                               double newStopLoss,
                                               double newTakeProfit)
{
    std::lock_guard<std::mutex> lane(laneFor(symbol));
    return adjustBracketsLocked(symbol, newStopLoss, newTakeProfit);
}

bool OrderLifecycleCoordinator::adjustBracketsLocked(const std::string& symbol,
                                                     double newStopLoss,
                                                     double newTakeProfit)
{
    auto pos = store_->get(symbol);
    if (!pos) {
        return false;
    }
    auto rules = rulesFor(symbol);
    double tick = rules ? rules->priceTick : 0.0;
    double sl = TradeMath::roundToTick(newStopLoss, tick);
    double tp = TradeMath::roundToTick(newTakeProfit, tick);

    bool ordered = pos->side == PositionSide::Long ? sl < tp : sl > tp;
    if (sl <= 0.0 || tp <= 0.0 || !ordered) {
        std::cerr << "[COORD][" << symbol << "] adjust rejected: SL=" << sl << " TP=" << tp << "\n";
        return false;
    }
    if (sl == pos->stopLoss && tp == pos->takeProfit) {
        return true;
    }

    OrderRequest slReq = bracketRequest(symbol, pos->side, OrderType::STOP_MARKET,
                                        pos->quantity, sl, pos->strategyId);
    OrderRequest tpReq = bracketRequest(symbol, pos->side, OrderType::TAKE_PROFIT_MARKET,
                                        pos->quantity, tp, pos->strategyId);

    auto slFuture = std::async(std::launch::async, [this, slReq]() { return gateway_->createOrder(slReq); });
    auto tpFuture = std::async(std::launch::async, [this, tpReq]() { return gateway_->createOrder(tpReq); });
    OrderResult slRes = slFuture.get();
    OrderResult tpRes = tpFuture.get();

    if (!slRes.success || !tpRes.success) {
        if (slRes.success) cancelTolerant(symbol, slRes.orderId, "orphan new stop-loss");
        if (tpRes.success) cancelTolerant(symbol, tpRes.orderId, "orphan new take-profit");
        std::cerr << "[COORD][" << symbol << "] adjust failed (SL: "
                  << (slRes.success ? "ok" : slRes.message) << ", TP: "
                  << (tpRes.success ? "ok" : tpRes.message) << "), old brackets kept\n";
        return false;
    }

    // new pair is live: only now retire the old one
    cancelTolerant(symbol, pos->stopLossOrderId, "old stop-loss");
    cancelTolerant(symbol, pos->takeProfitOrderId, "old take-profit");
    store_->updateBracketOrders(symbol, slRes.orderId, tpRes.orderId, sl, tp);

    std::cout << "[COORD][" << symbol << "] brackets moved: SL=" << sl << " (#" << slRes.orderId
              << ") TP=" << tp << " (#" << tpRes.orderId << ")\n";
    return true;
}

bool OrderLifecycleCoordinator::closePosition(const std::string& symbol, const std::string& reason) {
    std::lock_guard<std::mutex> lane(laneFor(symbol));
    return closePositionLocked(symbol, reason);
}

bool OrderLifecycleCoordinator::closePositionLocked(const std::string& symbol,
                                                    const std::string& reason)
{
    auto pos = store_->get(symbol);
    if (!pos) {
        return false;
    }
    std::cout << "[COORD][" << symbol << "] closing " << toString(pos->side) << " "
              << pos->quantity << ": " << reason << "\n";

    OrderResult cancelRes = gateway_->cancelAllOpenOrders(symbol);
    if (!cancelRes.success) {
        std::cerr << "[COORD][" << symbol << "] cancel-all failed: " << cancelRes.message << "\n";
    }

    OrderRequest flat;
    flat.symbol        = symbol;
    flat.side          = exitSide(pos->side);
    flat.type          = OrderType::MARKET;
    flat.quantity      = pos->quantity;
    flat.reduceOnly    = true;
    flat.clientOrderId = makeClientOrderId(pos->strategyId, symbol);

    OrderResult res = gateway_->createOrder(flat);
    if (res.success) {
        store_->close(symbol);
        return true;
    }
    if (res.error == ExchangeErrorKind::ReduceOnlyRejected) {
        // a bracket got there first
        std::cout << "[COORD][" << symbol << "] already flat on the exchange\n";
        store_->close(symbol);
        return true;
    }

    ++consistencyViolations_;
    std::cerr << "[CRITICAL][" << symbol << "] close failed (" << res.message
              << "), brackets were cancelled: position is UNPROTECTED\n";
    return false;
}

//------------------------------------------
// Expiry
//------------------------------------------
size_t OrderLifecycleCoordinator::expireStalePendingEntries(std::chrono::steady_clock::time_point now) {
    auto timeout = std::chrono::duration<double>(settings_.pendingEntryTimeoutSec);
    std::vector<PendingEntry> toCancel;
    std::vector<PendingEntry> toDrop;

    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        for (auto& kv : pendingEntries_) {
            const PendingEntry& e = kv.second;
            auto age = std::chrono::duration<double>(now - e.createdAt);
            if (age < timeout) continue;

            // an unacknowledged entry has no id to cancel by
            bool settled = e.cancelConfirmed || e.orderId == 0;
            if (age >= timeout * 2.0 && settled) {
                toDrop.push_back(e);
            } else if (!e.cancelConfirmed && e.orderId != 0) {
                toCancel.push_back(e);
            }
        }
    }

    for (const auto& e : toCancel) {
        std::lock_guard<std::mutex> lane(laneFor(e.symbol));
        if (e.cancelRequested) {
            std::cerr << "[COORD][" << e.symbol << "] retrying cancel of stale entry "
                      << e.clientOrderId << "\n";
        } else {
            std::cout << "[COORD][" << e.symbol << "] entry " << e.clientOrderId
                      << " unfilled after " << settings_.pendingEntryTimeoutSec << "s, cancelling\n";
        }
        bool confirmed = cancelTolerant(e.symbol, e.orderId, "stale entry");

        std::lock_guard<std::mutex> lk(pendingMutex_);
        auto it = pendingEntries_.find(e.clientOrderId);
        if (it != pendingEntries_.end()) {
            it->second.cancelRequested = true;
            it->second.cancelConfirmed = confirmed;
        }
    }

    for (const auto& e : toDrop) {
        std::lock_guard<std::mutex> lane(laneFor(e.symbol));
        bool present;
        {
            std::lock_guard<std::mutex> lk(pendingMutex_);
            present = pendingEntries_.count(e.clientOrderId) > 0;
        }
        if (!present) continue;
        std::cerr << "[COORD][" << e.symbol << "] entry " << e.clientOrderId
                  << " cancelled but never reported, discarding\n";
        finishPendingEntry(e.clientOrderId, e.symbol, /*resolved=*/false);
    }
    return toCancel.size() + toDrop.size();
}

//------------------------------------------
// Reconciliation
//------------------------------------------
ReconcileReport OrderLifecycleCoordinator::reconcilePositions(
    const std::vector<ExchangePosition>& exchangePositions,
    long long fetchStartedMs)
{
    ReconcileReport report;
    std::map<std::string, const ExchangePosition*> remote;
    for (const auto& ep : exchangePositions) {
        remote[ep.symbol] = &ep;
    }

    std::set<std::string> symbols;
    for (const auto& s : store_->symbols()) symbols.insert(s);
    for (const auto& kv : remote)           symbols.insert(kv.first);

    for (const auto& symbol : symbols) {
        std::lock_guard<std::mutex> lane(laneFor(symbol));
        if (pending_->contains(symbol)) {
            std::cout << "[RECON][" << symbol << "] entry in flight, skipped\n";
            report.skippedInFlight.push_back(symbol);
            continue;
        }
        auto r = remote.find(symbol);
        store_->reconcileSymbol(symbol, r == remote.end() ? nullptr : r->second,
                                fetchStartedMs, report);
    }
    return report;
}

//------------------------------------------
// Helpers
//------------------------------------------
bool OrderLifecycleCoordinator::cancelTolerant(const std::string& symbol,
                                               long long orderId,
                                               const char* what)
{
    if (orderId == 0) return true;
    OrderResult res = gateway_->cancelOrder(symbol, orderId);
    if (res.success || res.error == ExchangeErrorKind::OrderNotFound) {
        return true;
    }
    std::cerr << "[COORD][" << symbol << "] cancel " << what << " #" << orderId
              << " failed: " << res.message << "\n";
    return false;
}

void OrderLifecycleCoordinator::finishPendingEntry(const std::string& clientOrderId,
                                                   const std::string& symbol,
                                                   bool resolved)
{
    {
        std::lock_guard<std::mutex> lk(pendingMutex_);
        pendingEntries_.erase(clientOrderId);
        if (resolved && resolvedEntryIds_.insert(clientOrderId).second) {
            resolvedEntryOrder_.push_back(clientOrderId);
            if (resolvedEntryOrder_.size() > MAX_RESOLVED_ENTRY_IDS) {
                resolvedEntryIds_.erase(resolvedEntryOrder_.front());
                resolvedEntryOrder_.pop_front();
            }
        }
    }
    pending_->release(symbol);
}

OrderRequest OrderLifecycleCoordinator::bracketRequest(const std::string& symbol,
                                                       PositionSide side,
                                                       OrderType type,
                                                       double quantity,
                                                       double stopPrice,
                                                       const std::string& strategyId)
{
    OrderRequest r;
    r.symbol        = symbol;
    r.side          = exitSide(side);
    r.type          = type;
    r.quantity      = quantity;
    r.stopPrice     = stopPrice;
    r.reduceOnly    = true;
    r.clientOrderId = makeClientOrderId(strategyId, symbol);
    return r;
}

SymbolPhase OrderLifecycleCoordinator::phaseOf(const std::string& symbol) const {
    if (store_->has(symbol)) return SymbolPhase::Open;
    if (pending_->contains(symbol)) return SymbolPhase::PendingEntry;
    return SymbolPhase::Idle;
}

size_t OrderLifecycleCoordinator::pendingEntryCount() const {
    std::lock_guard<std::mutex> lk(pendingMutex_);
    return pendingEntries_.size();
}

std::optional<PendingEntry> OrderLifecycleCoordinator::findPendingEntry(const std::string& clientOrderId) const {
    std::lock_guard<std::mutex> lk(pendingMutex_);
    auto it = pendingEntries_.find(clientOrderId);
    if (it == pendingEntries_.end()) return std::nullopt;
    return it->second;
}
