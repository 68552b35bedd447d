#include "exchange/paper_gateway.hpp"
#include <iostream>
#include <chrono>
#include <cmath>
#include <algorithm>

static const double QTY_EPSILON = 1e-12;

static long long nowMs() {
    return (long long)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

static OrderResult paperError(ExchangeErrorKind kind, int code, const std::string& msg) {
    OrderResult res;
    res.success = false;
    res.error   = kind;
    res.code    = code;
    res.message = "Binance error code=" + std::to_string(code) + " msg=" + msg;
    return res;
}

PaperGateway::PaperGateway(IExchangeGateway* marketData,
                           BookProvider books,
                           double startingBalance,
                           const std::string& quoteAsset,
                           int leverage)
    : marketData_(marketData)
    , books_(std::move(books))
    , quoteAsset_(quoteAsset)
    , leverage_(leverage < 1 ? 1 : leverage)
    , balance_(startingBalance)
{
}

PaperGateway::~PaperGateway() {
    stop();
}

void PaperGateway::setOrderUpdateHandler(OrderUpdateHandler handler) {
    std::lock_guard<std::mutex> lk(eventMutex_);
    handler_ = std::move(handler);
}

void PaperGateway::start() {
    if (running_.exchange(true)) return;
    dispatcher_ = std::thread([this]() { dispatchLoop(); });
    std::cout << "[PAPER] Dispatcher started, balance=" << walletBalance() << " " << quoteAsset_ << "\n";
}

void PaperGateway::stop() {
    if (!running_.exchange(false)) return;
    eventCv_.notify_all();
    if (dispatcher_.joinable()) dispatcher_.join();
}

//------------------------------------------
// Delegated market data
//------------------------------------------
bool PaperGateway::getOrderBookSnapshot(const std::string& symbol,
                                        int depth,
                                        DepthSnapshot& out,
                                        std::string* failReason)
{
    if (!marketData_) {
        if (failReason) *failReason = "no market data source";
        return false;
    }
    return marketData_->getOrderBookSnapshot(symbol, depth, out, failReason);
}

bool PaperGateway::getSymbolRules(const std::string& symbol,
                                  SymbolRules& out,
                                  std::string* failReason)
{
    if (!marketData_) {
        if (failReason) *failReason = "no market data source";
        return false;
    }
    return marketData_->getSymbolRules(symbol, out, failReason);
}

//------------------------------------------
// Orders
//------------------------------------------
OrderResult PaperGateway::createOrder(const OrderRequest& request) {
    if (request.quantity <= 0.0) {
        return paperError(ExchangeErrorKind::Rejected, -4003, "Quantity less than or equal to zero.");
    }

    OrderBookData book = books_ ? books_(request.symbol) : OrderBookData{};
    bool haveBook = !book.bids.empty() && !book.asks.empty();

    std::lock_guard<std::mutex> lk(mutex_);

    auto posIt = positions_.find(request.symbol);
    if (request.reduceOnly) {
        bool opposite = posIt != positions_.end() &&
                        exitSide(posIt->second.side) == request.side;
        if (!opposite) {
            return paperError(ExchangeErrorKind::ReduceOnlyRejected, -2022,
                              "ReduceOnly Order is rejected.");
        }
    }

    PaperOrder order;
    order.request = request;
    order.orderId = nextOrderId_++;
    if (order.request.clientOrderId.empty()) {
        order.request.clientOrderId = "paper_" + std::to_string(order.orderId);
    }

    double touch = 0.0;
    if (haveBook) {
        touch = request.side == OrderSide::BUY ? book.asks.front().price : book.bids.front().price;
    }

    if (request.type == OrderType::MARKET && !haveBook) {
        return paperError(ExchangeErrorKind::Rejected, -1, "No market data for " + request.symbol);
    }

    double fillPx = 0.0;
    bool immediate = false;
    if (request.type == OrderType::MARKET) {
        immediate = true;
        fillPx = touch;
    } else if (request.type == OrderType::LIMIT) {
        if (request.price <= 0.0) {
            return paperError(ExchangeErrorKind::Rejected, -4014, "Price not increased by tick size.");
        }
        if (haveBook && ((request.side == OrderSide::BUY  && touch <= request.price) ||
                         (request.side == OrderSide::SELL && touch >= request.price))) {
            immediate = true;
            fillPx = touch;
        }
    } else {
        if (request.stopPrice <= 0.0) {
            return paperError(ExchangeErrorKind::Rejected, -1102, "stopPrice was not sent.");
        }
        double px = 0.0;
        if (haveBook && triggeredLocked(request, book, px)) {
            return paperError(ExchangeErrorKind::Rejected, -2021, "Order would immediately trigger.");
        }
    }

    if (!request.reduceOnly) {
        double refPx = request.type == OrderType::LIMIT ? request.price : touch;
        double required = request.quantity * refPx / leverage_;
        double available = balance_ - usedMarginLocked();
        if (required > available + QTY_EPSILON) {
            return paperError(ExchangeErrorKind::Rejected, -2019, "Margin is insufficient.");
        }
    }

    OrderResult res;
    res.success       = true;
    res.orderId       = order.orderId;
    res.clientOrderId = order.request.clientOrderId;
    res.status        = "NEW";
    res.message       = "Order OK";

    std::cout << "[PAPER][" << request.symbol << "] " << toString(request.type) << " "
              << toString(request.side) << " qty=" << request.quantity
              << (request.reduceOnly ? " reduceOnly" : "")
              << " => orderId=" << order.orderId << "\n";

    emitLocked(order, OrderStatus::NEW, 0.0, 0.0);
    if (immediate) {
        fillLocked(order, fillPx);
    } else {
        openOrders_[order.orderId] = order;
    }
    return res;
}

OrderResult PaperGateway::cancelOrder(const std::string& symbol, long long orderId) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = openOrders_.find(orderId);
    if (it == openOrders_.end() || it->second.request.symbol != symbol) {
        return paperError(ExchangeErrorKind::OrderNotFound, -2011, "Unknown order sent.");
    }

    OrderResult res;
    res.success       = true;
    res.orderId       = orderId;
    res.clientOrderId = it->second.request.clientOrderId;
    res.status        = "CANCELED";
    res.message       = "Order canceled";

    emitLocked(it->second, OrderStatus::CANCELED, 0.0, 0.0);
    openOrders_.erase(it);
    return res;
}

OrderResult PaperGateway::cancelAllOpenOrders(const std::string& symbol) {
    std::lock_guard<std::mutex> lk(mutex_);
    int n = 0;
    for (auto it = openOrders_.begin(); it != openOrders_.end(); ) {
        if (it->second.request.symbol == symbol) {
            emitLocked(it->second, OrderStatus::CANCELED, 0.0, 0.0);
            it = openOrders_.erase(it);
            ++n;
        } else {
            ++it;
        }
    }

    std::cout << "[PAPER][" << symbol << "] canceled " << n << " open orders\n";
    OrderResult res;
    res.success = true;
    res.code    = 200;
    res.message = "The operation of cancel all open order is done.";
    return res;
}

//------------------------------------------
// Account
//------------------------------------------
bool PaperGateway::getAccountBalance(const std::string& asset,
                                     double& out,
                                     std::string* failReason)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (asset != quoteAsset_) {
        out = 0.0;
        return true;
    }
    (void)failReason;
    out = std::max(0.0, balance_ - usedMarginLocked());
    return true;
}

bool PaperGateway::getOpenPositions(std::vector<ExchangePosition>& out,
                                    std::string* failReason)
{
    (void)failReason;
    std::lock_guard<std::mutex> lk(mutex_);
    out.clear();
    for (const auto& kv : positions_) {
        ExchangePosition ep;
        ep.symbol     = kv.first;
        ep.side       = kv.second.side;
        ep.quantity   = kv.second.quantity;
        ep.entryPrice = kv.second.entryPrice;
        ep.leverage   = leverage_;
        out.push_back(ep);
    }
    return true;
}

double PaperGateway::walletBalance() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return balance_;
}

double PaperGateway::realizedPnl() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return realizedPnl_;
}

size_t PaperGateway::openOrderCount(const std::string& symbol) const {
    std::lock_guard<std::mutex> lk(mutex_);
    size_t n = 0;
    for (const auto& kv : openOrders_) {
        if (kv.second.request.symbol == symbol) ++n;
    }
    return n;
}

//------------------------------------------
// Matching
//------------------------------------------
void PaperGateway::onBookUpdate(const std::string& symbol) {
    OrderBookData book = books_ ? books_(symbol) : OrderBookData{};
    if (book.bids.empty() || book.asks.empty()) return;

    std::lock_guard<std::mutex> lk(mutex_);
    for (auto it = openOrders_.begin(); it != openOrders_.end(); ) {
        double px = 0.0;
        if (it->second.request.symbol == symbol && triggeredLocked(it->second.request, book, px)) {
            PaperOrder order = it->second;
            it = openOrders_.erase(it);
            fillLocked(order, px);
        } else {
            ++it;
        }
    }
}

bool PaperGateway::triggeredLocked(const OrderRequest& req,
                                   const OrderBookData& book,
                                   double& fillPx) const
{
    if (book.bids.empty() || book.asks.empty()) return false;
    double bid = book.bids.front().price;
    double ask = book.asks.front().price;

    switch (req.type) {
        case OrderType::LIMIT:
            fillPx = req.price;
            return req.side == OrderSide::BUY ? ask <= req.price : bid >= req.price;
        case OrderType::STOP_MARKET:
            fillPx = req.side == OrderSide::BUY ? ask : bid;
            return req.side == OrderSide::BUY ? ask >= req.stopPrice : bid <= req.stopPrice;
        case OrderType::TAKE_PROFIT_MARKET:
            fillPx = req.side == OrderSide::BUY ? ask : bid;
            return req.side == OrderSide::BUY ? ask <= req.stopPrice : bid >= req.stopPrice;
        case OrderType::MARKET:
            fillPx = req.side == OrderSide::BUY ? ask : bid;
            return true;
    }
    return false;
}

void PaperGateway::fillLocked(PaperOrder& order, double price) {
    const OrderRequest& req = order.request;
    double qty = req.quantity;
    PositionSide dir = req.side == OrderSide::BUY ? PositionSide::Long : PositionSide::Short;

    auto it = positions_.find(req.symbol);
    if (req.reduceOnly) {
        if (it == positions_.end() || it->second.side == dir) {
            // position already gone: a reduce-only order can no longer execute
            emitLocked(order, OrderStatus::EXPIRED, 0.0, 0.0);
            return;
        }
        qty = std::min(qty, it->second.quantity);
    }

    if (it == positions_.end()) {
        positions_[req.symbol] = PaperPosition{dir, qty, price};
    } else if (it->second.side == dir) {
        PaperPosition& p = it->second;
        p.entryPrice = (p.entryPrice * p.quantity + price * qty) / (p.quantity + qty);
        p.quantity  += qty;
    } else {
        PaperPosition& p = it->second;
        double closeQty = std::min(qty, p.quantity);
        double sign = p.side == PositionSide::Long ? 1.0 : -1.0;
        double pnl = (price - p.entryPrice) * closeQty * sign;
        realizedPnl_ += pnl;
        balance_     += pnl;
        p.quantity   -= closeQty;

        double remain = qty - closeQty;
        if (p.quantity <= QTY_EPSILON) {
            positions_.erase(it);
            if (remain > QTY_EPSILON) {
                positions_[req.symbol] = PaperPosition{dir, remain, price};
            }
        }
        std::cout << "[PAPER][" << req.symbol << "] realized pnl=" << pnl
                  << " balance=" << balance_ << "\n";
    }

    std::cout << "[PAPER][" << req.symbol << "] FILLED " << toString(req.type) << " "
              << toString(req.side) << " qty=" << qty << " @" << price << "\n";
    emitLocked(order, OrderStatus::FILLED, price, qty);
}

double PaperGateway::usedMarginLocked() const {
    double used = 0.0;
    for (const auto& kv : positions_) {
        used += kv.second.quantity * kv.second.entryPrice / leverage_;
    }
    return used;
}

//------------------------------------------
// Event delivery
//------------------------------------------
void PaperGateway::emitLocked(const PaperOrder& order, OrderStatus status, double price, double qty) {
    OrderUpdateEvent ev;
    ev.symbol         = order.request.symbol;
    ev.orderId        = order.orderId;
    ev.clientOrderId  = order.request.clientOrderId;
    ev.status         = status;
    ev.orderType      = toString(order.request.type);
    ev.side           = order.request.side;
    ev.avgFillPrice   = price;
    ev.filledQuantity = qty;
    ev.reduceOnly     = order.request.reduceOnly;
    ev.eventTimeMs    = nowMs();

    {
        std::lock_guard<std::mutex> lk(eventMutex_);
        events_.push_back(ev);
    }
    eventCv_.notify_one();
}

size_t PaperGateway::dispatchPending() {
    size_t n = 0;
    while (true) {
        OrderUpdateEvent ev;
        OrderUpdateHandler handler;
        {
            std::lock_guard<std::mutex> lk(eventMutex_);
            if (events_.empty()) break;
            ev = events_.front();
            events_.pop_front();
            handler = handler_;
        }
        if (handler) {
            try {
                handler(ev);
            } catch (const std::exception& e) {
                std::cerr << "[PAPER] order update handler error: " << e.what() << "\n";
            }
        }
        ++n;
    }
    return n;
}

void PaperGateway::dispatchLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lk(eventMutex_);
            eventCv_.wait_for(lk, std::chrono::milliseconds(500),
                              [this] { return !running_ || !events_.empty(); });
        }
        if (!running_) break;
        dispatchPending();
    }
}
