#ifndef BINANCE_USER_STREAM_HPP
#define BINANCE_USER_STREAM_HPP

#include <string>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>
#include <condition_variable>

#include "exchange/i_exchange_gateway.hpp"
#include "exchange/binance_stream_client.hpp"

class BinanceFuturesGateway;

/**
 * User data stream: listen key lifecycle plus ORDER_TRADE_UPDATE delivery.
 * Events are handed to the handler in arrival order, on the stream thread.
 */
class BinanceUserStream {
public:
    using OrderUpdateHandler = std::function<void(const OrderUpdateEvent&)>;
    using ReconnectHandler   = std::function<void()>;

    BinanceUserStream(BinanceFuturesGateway* rest, const std::string& wsBaseUrl);
    ~BinanceUserStream();

    void setOrderUpdateHandler(OrderUpdateHandler handler) { onOrderUpdate_ = std::move(handler); }

    // called on every reconnect after the first: events may have been missed
    void setReconnectHandler(ReconnectHandler handler) { onReconnect_ = std::move(handler); }

    void start();
    void stop();

private:
    std::string nextUrl();
    void onMessage(const std::string& payload);
    void keepAliveLoop();

private:
    BinanceFuturesGateway* rest_;
    std::string wsBaseUrl_;
    BinanceStreamClient client_;

    OrderUpdateHandler onOrderUpdate_;
    ReconnectHandler onReconnect_;

    std::atomic<bool> running_{false};
    std::thread keepAliveThread_;
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

#endif // BINANCE_USER_STREAM_HPP
