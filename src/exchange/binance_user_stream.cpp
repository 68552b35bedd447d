#include "exchange/binance_user_stream.hpp"
#include "exchange/binance_futures_gateway.hpp"
#include "exchange/binance_parser.hpp"
#include <iostream>
#include <chrono>

// listen keys expire after 60 minutes without a keepalive
static const int KEEPALIVE_INTERVAL_SEC = 30 * 60;

BinanceUserStream::BinanceUserStream(BinanceFuturesGateway* rest, const std::string& wsBaseUrl)
    : rest_(rest)
    , wsBaseUrl_(wsBaseUrl)
    , client_("WS-USER")
{
}

BinanceUserStream::~BinanceUserStream() {
    stop();
}

void BinanceUserStream::start() {
    if (running_.exchange(true)) return;

    client_.setMessageHandler([this](const std::string& payload) { onMessage(payload); });
    client_.setOpenHandler([this](int connectCount) {
        if (connectCount > 1 && onReconnect_) {
            std::cout << "[WS-USER] reconnected, requesting reconciliation\n";
            onReconnect_();
        }
    });
    client_.start([this]() { return nextUrl(); });

    keepAliveThread_ = std::thread([this]() { keepAliveLoop(); });
}

void BinanceUserStream::stop() {
    if (!running_.exchange(false)) return;
    sleepCv_.notify_all();
    if (keepAliveThread_.joinable()) keepAliveThread_.join();
    client_.stop();
}

// POST listenKey returns the active key (and extends it) if there is one.
std::string BinanceUserStream::nextUrl() {
    std::string key;
    std::string reason;
    if (!rest_->createListenKey(key, &reason)) {
        std::cerr << "[WS-USER] could not obtain listen key: " << reason << "\n";
        return "";
    }
    return wsBaseUrl_ + "/ws/" + key;
}

void BinanceUserStream::onMessage(const std::string& payload) {
    OrderUpdateEvent ev;
    std::string eventType;
    if (BinanceParser::parseOrderTradeUpdate(payload, ev, &eventType)) {
        if (onOrderUpdate_) {
            onOrderUpdate_(ev);
        }
        return;
    }
    if (eventType == "listenKeyExpired") {
        std::cerr << "[WS-USER] listen key expired => reconnecting\n";
        client_.reconnectNow();
    }
}

void BinanceUserStream::keepAliveLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lk(sleepMutex_);
            sleepCv_.wait_for(lk, std::chrono::seconds(KEEPALIVE_INTERVAL_SEC),
                              [this] { return !running_; });
        }
        if (!running_) break;

        std::string reason;
        if (!rest_->keepAliveListenKey(&reason)) {
            std::cerr << "[WS-USER] keepalive failed (" << reason << ") => reconnecting\n";
            client_.reconnectNow();
        }
    }
}
