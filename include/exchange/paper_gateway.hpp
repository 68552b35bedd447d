#ifndef PAPER_GATEWAY_HPP
#define PAPER_GATEWAY_HPP

#include "exchange/i_exchange_gateway.hpp"
#include <map>
#include <deque>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <condition_variable>

/**
 * Dry-run exchange. Orders fill against the live local books; resting
 * LIMIT / STOP_MARKET / TAKE_PROFIT_MARKET orders are checked on every book
 * update. Order events are queued and delivered from a dispatcher thread,
 * never from inside a gateway call.
 *
 * Depth snapshots and symbol rules come from `marketData` (a keyless
 * BinanceFuturesGateway in production).
 */
class PaperGateway : public IExchangeGateway {
public:
    using BookProvider = std::function<OrderBookData(const std::string&)>;
    using OrderUpdateHandler = std::function<void(const OrderUpdateEvent&)>;

    PaperGateway(IExchangeGateway* marketData,
                 BookProvider books,
                 double startingBalance,
                 const std::string& quoteAsset = "USDT",
                 int leverage = 1);
    ~PaperGateway() override;

    bool getOrderBookSnapshot(const std::string& symbol,
                              int depth,
                              DepthSnapshot& out,
                              std::string* failReason = nullptr) override;

    OrderResult createOrder(const OrderRequest& request) override;
    OrderResult cancelOrder(const std::string& symbol, long long orderId) override;
    OrderResult cancelAllOpenOrders(const std::string& symbol) override;

    bool getAccountBalance(const std::string& asset,
                           double& out,
                           std::string* failReason = nullptr) override;

    bool getOpenPositions(std::vector<ExchangePosition>& out,
                          std::string* failReason = nullptr) override;

    bool getSymbolRules(const std::string& symbol,
                        SymbolRules& out,
                        std::string* failReason = nullptr) override;

    // Book for `symbol` changed: trigger resting orders.
    void onBookUpdate(const std::string& symbol);

    void setOrderUpdateHandler(OrderUpdateHandler handler);

    void start();
    void stop();

    // Deliver queued events on the calling thread. Returns how many.
    size_t dispatchPending();

    double walletBalance() const;
    double realizedPnl() const;
    size_t openOrderCount(const std::string& symbol) const;

private:
    struct PaperOrder {
        OrderRequest request;
        long long orderId{0};
    };

    struct PaperPosition {
        PositionSide side{PositionSide::Long};
        double quantity{0.0};
        double entryPrice{0.0};
    };

    // all private helpers expect mutex_ held
    void fillLocked(PaperOrder& order, double price);
    void emitLocked(const PaperOrder& order, OrderStatus status, double price, double qty);
    double usedMarginLocked() const;
    bool triggeredLocked(const OrderRequest& req, const OrderBookData& book, double& fillPx) const;

    void dispatchLoop();

private:
    IExchangeGateway* marketData_;
    BookProvider books_;
    std::string quoteAsset_;
    int leverage_;

    mutable std::mutex mutex_;
    double balance_;
    double realizedPnl_{0.0};
    long long nextOrderId_{1000};
    std::map<long long, PaperOrder> openOrders_;
    std::map<std::string, PaperPosition> positions_;

    std::mutex eventMutex_;
    std::condition_variable eventCv_;
    std::deque<OrderUpdateEvent> events_;
    OrderUpdateHandler handler_;

    std::atomic<bool> running_{false};
    std::thread dispatcher_;
};

#endif // PAPER_GATEWAY_HPP
